#pragma once

#include "progress/engine/v1.hpp"
#include "service_context.hpp"

namespace progress::service {

class ProgressService {
 public:
  explicit ProgressService(ServiceContext ctx);

  engine::v1::ResolveTemplateResponse     ResolveTemplate(const engine::v1::ResolveTemplateRequest& req);
  engine::v1::ComputeItemProgressResponse ComputeItemProgress(const engine::v1::ComputeItemProgressRequest& req);
  engine::v1::GetRollupSnapshotResponse   GetRollupSnapshot(const engine::v1::GetRollupSnapshotRequest& req);
  engine::v1::GetDeltaReportResponse      GetDeltaReport(const engine::v1::GetDeltaReportRequest& req);

  engine::v1::RecordMilestoneChangeResponse RecordMilestoneChange(const engine::v1::RecordMilestoneChangeRequest& req);
  engine::v1::CreateItemResponse            CreateItem(const engine::v1::CreateItemRequest& req);
  engine::v1::RetireItemResponse            RetireItem(const engine::v1::RetireItemRequest& req);
  engine::v1::CorrectMilestoneEventResponse CorrectMilestoneEvent(const engine::v1::CorrectMilestoneEventRequest& req);

  engine::v1::ReplayItemResponse      ReplayItem(const engine::v1::ReplayItemRequest& req);
  engine::v1::RebuildRollupsResponse  RebuildRollups(const engine::v1::RebuildRollupsRequest& req);
  engine::v1::UpsertDimensionResponse UpsertDimension(const engine::v1::UpsertDimensionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace progress::service
