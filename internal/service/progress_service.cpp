#include "progress_service.hpp"

#include <string>

#include "internal/core/progress_manager.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/report/delta_aggregator.hpp"
#include "internal/templates/template_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "rpc_observer.hpp"

namespace progress::service {

using namespace progress::engine::v1;

ProgressService::ProgressService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ResolveTemplateResponse ProgressService::ResolveTemplate(const ResolveTemplateRequest& req) {
  return ObserveRpc("ProgressService.ResolveTemplate", "item.type", req.item_type(), [&] {
    ResolveTemplateResponse resp;
    *resp.mutable_schedule() = model::ToProto(ctx_.registry->Resolve(req.project_id(), req.item_type()));
    return resp;
  });
}

ComputeItemProgressResponse ProgressService::ComputeItemProgress(const ComputeItemProgressRequest& req) {
  return ObserveRpc("ProgressService.ComputeItemProgress", "item.id", req.item_id(), [&] {
    return ctx_.manager->ComputeItem(req.item_id());
  });
}

GetRollupSnapshotResponse ProgressService::GetRollupSnapshot(const GetRollupSnapshotRequest& req) {
  return ObserveRpc("ProgressService.GetRollupSnapshot", "project.id", req.project_id(), [&] {
    GetRollupSnapshotResponse resp;
    *resp.mutable_snapshot() = ctx_.manager->GetRollupSnapshot(req.project_id(), model::RequireDimension(req.dimension()));
    return resp;
  });
}

GetDeltaReportResponse ProgressService::GetDeltaReport(const GetDeltaReportRequest& req) {
  return ObserveRpc("ProgressService.GetDeltaReport", "project.id", req.project_id(), [&] {
    if (!req.has_start() || !req.has_end()) {
      throw util::InvalidArgument("delta report needs both window start and end");
    }

    report::DeltaQuery query;
    query.project_id = req.project_id();
    query.dimension  = model::RequireDimension(req.dimension());
    query.start_ms   = util::ProtoToMillis(req.start());
    query.end_ms     = util::ProtoToMillis(req.end());

    GetDeltaReportResponse resp;
    *resp.mutable_report() = ctx_.manager->GetDeltaReport(query);
    return resp;
  });
}

RecordMilestoneChangeResponse ProgressService::RecordMilestoneChange(const RecordMilestoneChangeRequest& req) {
  return ObserveRpc("ProgressService.RecordMilestoneChange", "item.id", req.item_id(), [&] {
    return ctx_.manager->RecordMilestoneChange(req);
  });
}

CreateItemResponse ProgressService::CreateItem(const CreateItemRequest& req) {
  return ObserveRpc("ProgressService.CreateItem", "project.id", req.project_id(), [&] {
    return ctx_.manager->CreateItem(req);
  });
}

RetireItemResponse ProgressService::RetireItem(const RetireItemRequest& req) {
  return ObserveRpc("ProgressService.RetireItem", "item.id", req.item_id(), [&] {
    return ctx_.manager->RetireItem(req);
  });
}

CorrectMilestoneEventResponse ProgressService::CorrectMilestoneEvent(const CorrectMilestoneEventRequest& req) {
  return ObserveRpc("ProgressService.CorrectMilestoneEvent", "event.seq", std::to_string(req.seq()), [&] {
    return ctx_.manager->CorrectMilestoneEvent(req);
  });
}

ReplayItemResponse ProgressService::ReplayItem(const ReplayItemRequest& req) {
  return ObserveRpc("ProgressService.ReplayItem", "item.id", req.item_id(), [&] {
    return ctx_.manager->ReplayItem(req.item_id(), req.apply());
  });
}

RebuildRollupsResponse ProgressService::RebuildRollups(const RebuildRollupsRequest& req) {
  return ObserveRpc("ProgressService.RebuildRollups", "project.id", req.project_id(), [&] {
    return ctx_.manager->RebuildRollups(req.project_id());
  });
}

UpsertDimensionResponse ProgressService::UpsertDimension(const UpsertDimensionRequest& req) {
  return ObserveRpc("ProgressService.UpsertDimension", "project.id", req.project_id(), [&] {
    ctx_.manager->UpsertDimension(req.project_id(), model::RequireDimension(req.dimension()), req.id(), req.name());
    return UpsertDimensionResponse{};
  });
}

} // namespace progress::service
