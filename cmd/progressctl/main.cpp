#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "progress/engine/services/v1/progress_service.grpc.pb.h"
#include "progress/engine/services/v1/template_service.grpc.pb.h"
#include "progress/engine/v1.hpp"

using namespace progress::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  progressctl <addr> resolve <item_type> [project_id]\n"
            << "  progressctl <addr> item <item_id>\n"
            << "  progressctl <addr> record <item_id> <milestone> <true|false|value> <actor>\n"
            << "  progressctl <addr> correct <seq> <actor> <reason>\n"
            << "  progressctl <addr> rollup <project_id> <area|system|test_package|welder>\n"
            << "  progressctl <addr> delta <project_id> <dimension> <start> <end>   (RFC 3339 timestamps)\n"
            << "  progressctl <addr> rebuild-rollups <project_id>\n"
            << "  progressctl <addr> replay <item_id> [apply]\n"
            << "  progressctl <addr> overrides <project_id>\n"
            << "  progressctl <addr> templates [item_type]\n";
}

static std::optional<Dimension> ParseDimension(const std::string& value) {
  if (value == "area") return DIMENSION_AREA;
  if (value == "system") return DIMENSION_SYSTEM;
  if (value == "test_package") return DIMENSION_TEST_PACKAGE;
  if (value == "welder") return DIMENSION_WELDER;
  return std::nullopt;
}

static std::optional<MilestoneValue> ParseValue(const std::string& value) {
  MilestoneValue out;
  if (value == "true" || value == "false") {
    out.set_complete(value == "true");
    return out;
  }
  try {
    std::size_t used   = 0;
    const auto  number = std::stod(value, &used);
    if (used != value.size()) return std::nullopt;
    out.set_number(number);
    return out;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<google::protobuf::Timestamp> ParseTime(const std::string& value) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(value, &ts)) return std::nullopt;
  return ts;
}

// Prints the response as JSON; returns the process exit code.
static int Print(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(resp, &json, options).ok()) {
    std::cerr << "failed to encode response\n";
    return 2;
  }
  std::cout << json << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto progress_stub = ProgressService::NewStub(channel);
  auto template_stub = TemplateService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "resolve") {
    if (argc < 4) return 1;

    ResolveTemplateRequest req;
    req.set_item_type(argv[3]);
    if (argc >= 5) req.set_project_id(argv[4]);

    ResolveTemplateResponse resp;
    return Print(progress_stub->ResolveTemplate(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "item") {
    if (argc < 4) return 1;

    ComputeItemProgressRequest req;
    req.set_item_id(argv[3]);

    ComputeItemProgressResponse resp;
    return Print(progress_stub->ComputeItemProgress(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "record") {
    if (argc < 7) return 1;

    auto value = ParseValue(argv[5]);
    if (!value.has_value()) {
      std::cerr << "invalid milestone value: " << argv[5] << "\n";
      return 1;
    }

    RecordMilestoneChangeRequest req;
    req.set_item_id(argv[3]);
    req.set_milestone(argv[4]);
    *req.mutable_value() = *value;
    req.set_actor(argv[6]);

    RecordMilestoneChangeResponse resp;
    return Print(progress_stub->RecordMilestoneChange(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "correct") {
    if (argc < 6) return 1;

    CorrectMilestoneEventRequest req;
    req.set_seq(std::stoull(argv[3]));
    req.set_actor(argv[4]);
    req.set_reason(argv[5]);

    CorrectMilestoneEventResponse resp;
    return Print(progress_stub->CorrectMilestoneEvent(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "rollup") {
    if (argc < 5) return 1;

    auto dimension = ParseDimension(argv[4]);
    if (!dimension.has_value()) {
      std::cerr << "unsupported dimension: " << argv[4] << "\n";
      return 1;
    }

    GetRollupSnapshotRequest req;
    req.set_project_id(argv[3]);
    req.set_dimension(*dimension);

    GetRollupSnapshotResponse resp;
    return Print(progress_stub->GetRollupSnapshot(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "delta") {
    if (argc < 7) return 1;

    auto dimension = ParseDimension(argv[4]);
    if (!dimension.has_value()) {
      std::cerr << "unsupported dimension: " << argv[4] << "\n";
      return 1;
    }
    auto start = ParseTime(argv[5]);
    auto end   = ParseTime(argv[6]);
    if (!start.has_value() || !end.has_value()) {
      std::cerr << "timestamps must be RFC 3339, e.g. 2024-03-01T00:00:00Z\n";
      return 1;
    }

    GetDeltaReportRequest req;
    req.set_project_id(argv[3]);
    req.set_dimension(*dimension);
    *req.mutable_start() = *start;
    *req.mutable_end()   = *end;

    GetDeltaReportResponse resp;
    return Print(progress_stub->GetDeltaReport(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "rebuild-rollups") {
    if (argc < 4) return 1;

    RebuildRollupsRequest req;
    req.set_project_id(argv[3]);

    RebuildRollupsResponse resp;
    return Print(progress_stub->RebuildRollups(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "replay") {
    if (argc < 4) return 1;

    ReplayItemRequest req;
    req.set_item_id(argv[3]);
    req.set_apply(argc >= 5 && std::string(argv[4]) == "apply");

    ReplayItemResponse resp;
    return Print(progress_stub->ReplayItem(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "overrides") {
    if (argc < 4) return 1;

    ListProjectOverridesRequest req;
    req.set_project_id(argv[3]);

    ListProjectOverridesResponse resp;
    return Print(template_stub->ListProjectOverrides(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "templates") {
    if (argc >= 4) {
      GetDefaultScheduleRequest req;
      req.set_item_type(argv[3]);

      GetDefaultScheduleResponse resp;
      return Print(template_stub->GetDefaultSchedule(&ctx, req, &resp), resp);
    }

    ListItemTypesRequest  req;
    ListItemTypesResponse resp;
    return Print(template_stub->ListItemTypes(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
