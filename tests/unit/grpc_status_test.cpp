#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/progress_server.hpp"
#include "internal/grpc/template_server.hpp"
#include "internal/util/errors.hpp"
#include "progress/engine/v1.hpp"

namespace {

using namespace progress::engine::v1;

progress::factory::RuntimeDependencies BuildDeps() {
  progress::runtime::config::RuntimeConfig config;
  config.mutable_engine()->set_seed_default_templates(true);
  return progress::factory::BuildRuntime(config, std::make_shared<progress::db::memory::MemoryRepository>());
}

CreateItemRequest WeldRequest(const std::string& weld_no) {
  CreateItemRequest req;
  req.set_project_id("P-9");
  req.set_item_type("field_weld");
  (*req.mutable_identity())["weld_no"] = weld_no;
  req.set_budgeted_hours(4.0);
  req.set_actor("foreman");
  return req;
}

std::string CreateWeld(progress::grpc::ProgressServer& server, const std::string& weld_no) {
  const auto         req = WeldRequest(weld_no);
  CreateItemResponse resp;
  ::grpc::ServerContext grpc_ctx;
  const auto         status = server.CreateItem(&grpc_ctx, &req, &resp);
  assert(status.ok());
  return resp.item().id();
}

void TestMissingItemReturnsNotFound() {
  auto                           deps = BuildDeps();
  progress::grpc::ProgressServer server(deps.progress_service);

  ComputeItemProgressRequest req;
  req.set_item_id("missing-item");
  ComputeItemProgressResponse resp;
  ::grpc::ServerContext       grpc_ctx;

  const auto status = server.ComputeItemProgress(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestDuplicateItemReturnsAlreadyExists() {
  auto                           deps = BuildDeps();
  progress::grpc::ProgressServer server(deps.progress_service);
  CreateWeld(server, "FW-1");

  const auto            req = WeldRequest("FW-1");
  CreateItemResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.CreateItem(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
}

void TestMalformedRequestsReturnInvalidArgument() {
  auto                           deps = BuildDeps();
  progress::grpc::ProgressServer server(deps.progress_service);
  const auto                     id = CreateWeld(server, "FW-1");

  RecordMilestoneChangeRequest record;
  record.set_item_id(id);
  record.set_milestone("Fit-Up");
  record.mutable_value()->set_number(-5);
  record.set_actor("foreman");
  RecordMilestoneChangeResponse record_resp;
  ::grpc::ServerContext         record_ctx;
  assert(server.RecordMilestoneChange(&record_ctx, &record, &record_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  GetRollupSnapshotRequest snapshot;
  snapshot.set_project_id("P-9");
  GetRollupSnapshotResponse snapshot_resp;
  ::grpc::ServerContext     snapshot_ctx;
  assert(server.GetRollupSnapshot(&snapshot_ctx, &snapshot, &snapshot_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestInvalidOverrideReturnsInvalidArgument() {
  auto                           deps = BuildDeps();
  progress::grpc::TemplateServer server(deps.template_service);

  PutProjectOverridesRequest req;
  req.set_project_id("P-9");
  req.set_item_type("spool");
  req.set_actor("planner");
  auto* entry = req.add_overrides();
  entry->set_name("Receive");
  entry->set_weight(2);

  PutProjectOverridesResponse resp;
  ::grpc::ServerContext       grpc_ctx;

  const auto status = server.PutProjectOverrides(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestConflictsReturnAborted() {
  auto                           deps = BuildDeps();
  progress::grpc::ProgressServer server(deps.progress_service);
  const auto                     id = CreateWeld(server, "FW-1");

  RetireItemRequest retire;
  retire.set_item_id(id);
  retire.set_reason("cut out");
  retire.set_actor("foreman");
  RetireItemResponse    retire_resp;
  ::grpc::ServerContext retire_ctx;
  assert(server.RetireItem(&retire_ctx, &retire, &retire_resp).ok());

  RecordMilestoneChangeRequest record;
  record.set_item_id(id);
  record.set_milestone("Fit-Up");
  record.mutable_value()->set_complete(true);
  record.set_actor("foreman");
  RecordMilestoneChangeResponse record_resp;
  ::grpc::ServerContext         record_ctx;
  assert(server.RecordMilestoneChange(&record_ctx, &record, &record_resp).error_code() == ::grpc::StatusCode::ABORTED);

  progress::grpc::TemplateServer templates(deps.template_service);
  PutProjectOverridesRequest     put;
  put.set_project_id("P-9");
  put.set_item_type("spool");
  put.set_actor("planner");
  put.set_expected_version(3);
  auto* receive = put.add_overrides();
  receive->set_name("Receive");
  receive->set_weight(2);
  auto* erect = put.add_overrides();
  erect->set_name("Erect");
  erect->set_weight(43);

  PutProjectOverridesResponse put_resp;
  ::grpc::ServerContext       put_ctx;
  assert(templates.PutProjectOverrides(&put_ctx, &put, &put_resp).error_code() == ::grpc::StatusCode::ABORTED);
}

void TestInvariantViolationMapsToDataLoss() {
  const auto status = progress::grpc::ToStatus(progress::util::InvariantViolation("category hours do not reconcile"));
  assert(status.error_code() == ::grpc::StatusCode::DATA_LOSS);

  const auto internal = progress::grpc::ToStatus(std::runtime_error("disk full"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestMissingItemReturnsNotFound();
  TestDuplicateItemReturnsAlreadyExists();
  TestMalformedRequestsReturnInvalidArgument();
  TestInvalidOverrideReturnsInvalidArgument();
  TestConflictsReturnAborted();
  TestInvariantViolationMapsToDataLoss();

  std::cout << "progress_engine_unit_grpc_status: pass\n";
  return 0;
}
