#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/progress_service.hpp"
#include "progress/engine/services/v1/progress_service.grpc.pb.h"

namespace progress::grpc {

class ProgressServer final : public progress::engine::services::v1::ProgressService::Service {
 public:
  explicit ProgressServer(std::shared_ptr<progress::service::ProgressService> svc);

  ::grpc::Status ResolveTemplate(::grpc::ServerContext*, const progress::engine::v1::ResolveTemplateRequest*,
                                 progress::engine::v1::ResolveTemplateResponse*) override;
  ::grpc::Status ComputeItemProgress(::grpc::ServerContext*, const progress::engine::v1::ComputeItemProgressRequest*,
                                     progress::engine::v1::ComputeItemProgressResponse*) override;
  ::grpc::Status GetRollupSnapshot(::grpc::ServerContext*, const progress::engine::v1::GetRollupSnapshotRequest*,
                                   progress::engine::v1::GetRollupSnapshotResponse*) override;
  ::grpc::Status GetDeltaReport(::grpc::ServerContext*, const progress::engine::v1::GetDeltaReportRequest*,
                                progress::engine::v1::GetDeltaReportResponse*) override;
  ::grpc::Status RecordMilestoneChange(::grpc::ServerContext*, const progress::engine::v1::RecordMilestoneChangeRequest*,
                                       progress::engine::v1::RecordMilestoneChangeResponse*) override;
  ::grpc::Status CreateItem(::grpc::ServerContext*, const progress::engine::v1::CreateItemRequest*,
                            progress::engine::v1::CreateItemResponse*) override;
  ::grpc::Status RetireItem(::grpc::ServerContext*, const progress::engine::v1::RetireItemRequest*,
                            progress::engine::v1::RetireItemResponse*) override;
  ::grpc::Status CorrectMilestoneEvent(::grpc::ServerContext*, const progress::engine::v1::CorrectMilestoneEventRequest*,
                                       progress::engine::v1::CorrectMilestoneEventResponse*) override;
  ::grpc::Status ReplayItem(::grpc::ServerContext*, const progress::engine::v1::ReplayItemRequest*,
                            progress::engine::v1::ReplayItemResponse*) override;
  ::grpc::Status RebuildRollups(::grpc::ServerContext*, const progress::engine::v1::RebuildRollupsRequest*,
                                progress::engine::v1::RebuildRollupsResponse*) override;
  ::grpc::Status UpsertDimension(::grpc::ServerContext*, const progress::engine::v1::UpsertDimensionRequest*,
                                 progress::engine::v1::UpsertDimensionResponse*) override;

 private:
  std::shared_ptr<progress::service::ProgressService> service_;
};

} // namespace progress::grpc
