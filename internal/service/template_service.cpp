#include "template_service.hpp"

#include <optional>
#include <string>
#include <vector>

#include "internal/core/record_convert.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/templates/template_registry.hpp"
#include "internal/util/errors.hpp"
#include "rpc_observer.hpp"

namespace progress::service {

using namespace progress::engine::v1;

namespace {

void RequireActor(const std::string& actor) {
  if (actor.empty()) throw util::InvalidArgument("actor is required");
}

templates::OverrideEntry OverrideFromProto(const MilestoneEntry& entry) {
  templates::OverrideEntry out;
  out.name     = entry.name();
  out.weight   = entry.weight();
  out.kind     = model::FromProto(entry.kind());
  out.category = model::FromProto(entry.category());
  return out;
}

} // namespace

TemplateService::TemplateService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListItemTypesResponse TemplateService::ListItemTypes(const ListItemTypesRequest&) {
  return ObserveRpc("TemplateService.ListItemTypes", "", "", [&] {
    ListItemTypesResponse resp;
    for (const auto& type : ctx_.registry->ListItemTypes()) resp.add_item_types(type);
    return resp;
  });
}

GetDefaultScheduleResponse TemplateService::GetDefaultSchedule(const GetDefaultScheduleRequest& req) {
  return ObserveRpc("TemplateService.GetDefaultSchedule", "item.type", req.item_type(), [&] {
    GetDefaultScheduleResponse resp;
    *resp.mutable_schedule() = model::ToProto(ctx_.registry->GetDefaultSchedule(req.item_type()));
    return resp;
  });
}

PutDefaultScheduleResponse TemplateService::PutDefaultSchedule(const PutDefaultScheduleRequest& req) {
  return ObserveRpc("TemplateService.PutDefaultSchedule", "item.type", req.item_type(), [&] {
    RequireActor(req.actor());

    std::vector<model::MilestoneEntry> entries;
    entries.reserve(req.entries_size());
    for (const auto& entry : req.entries()) entries.push_back(model::EntryFromProto(entry));

    PutDefaultScheduleResponse resp;
    *resp.mutable_schedule() = model::ToProto(ctx_.registry->PutDefaultSchedule(req.item_type(), entries, req.actor()));
    return resp;
  });
}

PutProjectOverridesResponse TemplateService::PutProjectOverrides(const PutProjectOverridesRequest& req) {
  return ObserveRpc("TemplateService.PutProjectOverrides", "project.id", req.project_id(), [&] {
    RequireActor(req.actor());

    std::vector<templates::OverrideEntry> overrides;
    overrides.reserve(req.overrides_size());
    for (const auto& entry : req.overrides()) overrides.push_back(OverrideFromProto(entry));

    std::optional<uint64_t> expected_version;
    if (req.has_expected_version()) expected_version = req.expected_version();

    const auto result = ctx_.registry->PutProjectOverrides(req.project_id(), req.item_type(), overrides, req.actor(), expected_version,
                                                           req.recalculate_existing());

    PutProjectOverridesResponse resp;
    *resp.mutable_schedule() = model::ToProto(result.schedule);
    resp.set_recalculated_items(result.recalculated_items);
    return resp;
  });
}

ClearProjectOverridesResponse TemplateService::ClearProjectOverrides(const ClearProjectOverridesRequest& req) {
  return ObserveRpc("TemplateService.ClearProjectOverrides", "project.id", req.project_id(), [&] {
    RequireActor(req.actor());

    ClearProjectOverridesResponse resp;
    *resp.mutable_schedule() = model::ToProto(ctx_.registry->ClearProjectOverrides(req.project_id(), req.item_type(), req.actor()));
    return resp;
  });
}

ListProjectOverridesResponse TemplateService::ListProjectOverrides(const ListProjectOverridesRequest& req) {
  return ObserveRpc("TemplateService.ListProjectOverrides", "project.id", req.project_id(), [&] {
    ListProjectOverridesResponse resp;
    for (const auto& set : ctx_.registry->ListProjectOverrides(req.project_id())) {
      auto* out = resp.add_overrides();
      out->set_item_type(set.item_type);
      out->set_version(set.version);
      model::ToProto(set.entries, out->mutable_entries());
    }
    return resp;
  });
}

ListTemplateChangesResponse TemplateService::ListTemplateChanges(const ListTemplateChangesRequest& req) {
  return ObserveRpc("TemplateService.ListTemplateChanges", "project.id", req.project_id(), [&] {
    ListTemplateChangesResponse resp;
    for (const auto& change : ctx_.registry->ListTemplateChanges(req.project_id(), req.item_type())) {
      *resp.add_changes() = core::ToProto(change);
    }
    return resp;
  });
}

} // namespace progress::service
