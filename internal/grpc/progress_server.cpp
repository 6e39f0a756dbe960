#include "progress_server.hpp"

#include "grpc_error.hpp"

namespace progress::grpc {

namespace v1 = progress::engine::v1;

ProgressServer::ProgressServer(std::shared_ptr<progress::service::ProgressService> svc) : service_(std::move(svc)) {
}

::grpc::Status ProgressServer::ResolveTemplate(::grpc::ServerContext*, const v1::ResolveTemplateRequest* req,
                                               v1::ResolveTemplateResponse* resp) {
  try {
    *resp = service_->ResolveTemplate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProgressServer::ComputeItemProgress(::grpc::ServerContext*, const v1::ComputeItemProgressRequest* req,
                                                   v1::ComputeItemProgressResponse* resp) {
  try {
    *resp = service_->ComputeItemProgress(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProgressServer::GetRollupSnapshot(::grpc::ServerContext*, const v1::GetRollupSnapshotRequest* req,
                                                 v1::GetRollupSnapshotResponse* resp) {
  try {
    *resp = service_->GetRollupSnapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProgressServer::GetDeltaReport(::grpc::ServerContext*, const v1::GetDeltaReportRequest* req,
                                              v1::GetDeltaReportResponse* resp) {
  try {
    *resp = service_->GetDeltaReport(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProgressServer::RecordMilestoneChange(::grpc::ServerContext*, const v1::RecordMilestoneChangeRequest* req,
                                                     v1::RecordMilestoneChangeResponse* resp) {
  try {
    *resp = service_->RecordMilestoneChange(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProgressServer::CreateItem(::grpc::ServerContext*, const v1::CreateItemRequest* req, v1::CreateItemResponse* resp) {
  try {
    *resp = service_->CreateItem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProgressServer::RetireItem(::grpc::ServerContext*, const v1::RetireItemRequest* req, v1::RetireItemResponse* resp) {
  try {
    *resp = service_->RetireItem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProgressServer::CorrectMilestoneEvent(::grpc::ServerContext*, const v1::CorrectMilestoneEventRequest* req,
                                                     v1::CorrectMilestoneEventResponse* resp) {
  try {
    *resp = service_->CorrectMilestoneEvent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProgressServer::ReplayItem(::grpc::ServerContext*, const v1::ReplayItemRequest* req, v1::ReplayItemResponse* resp) {
  try {
    *resp = service_->ReplayItem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProgressServer::RebuildRollups(::grpc::ServerContext*, const v1::RebuildRollupsRequest* req,
                                              v1::RebuildRollupsResponse* resp) {
  try {
    *resp = service_->RebuildRollups(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProgressServer::UpsertDimension(::grpc::ServerContext*, const v1::UpsertDimensionRequest* req,
                                               v1::UpsertDimensionResponse* resp) {
  try {
    *resp = service_->UpsertDimension(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace progress::grpc
