#include "template_server.hpp"

#include "grpc_error.hpp"

namespace progress::grpc {

namespace v1 = progress::engine::v1;

TemplateServer::TemplateServer(std::shared_ptr<progress::service::TemplateService> svc) : service_(std::move(svc)) {
}

::grpc::Status TemplateServer::ListItemTypes(::grpc::ServerContext*, const v1::ListItemTypesRequest* req, v1::ListItemTypesResponse* resp) {
  try {
    *resp = service_->ListItemTypes(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TemplateServer::GetDefaultSchedule(::grpc::ServerContext*, const v1::GetDefaultScheduleRequest* req,
                                                  v1::GetDefaultScheduleResponse* resp) {
  try {
    *resp = service_->GetDefaultSchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TemplateServer::PutDefaultSchedule(::grpc::ServerContext*, const v1::PutDefaultScheduleRequest* req,
                                                  v1::PutDefaultScheduleResponse* resp) {
  try {
    *resp = service_->PutDefaultSchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TemplateServer::PutProjectOverrides(::grpc::ServerContext*, const v1::PutProjectOverridesRequest* req,
                                                   v1::PutProjectOverridesResponse* resp) {
  try {
    *resp = service_->PutProjectOverrides(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TemplateServer::ClearProjectOverrides(::grpc::ServerContext*, const v1::ClearProjectOverridesRequest* req,
                                                     v1::ClearProjectOverridesResponse* resp) {
  try {
    *resp = service_->ClearProjectOverrides(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TemplateServer::ListProjectOverrides(::grpc::ServerContext*, const v1::ListProjectOverridesRequest* req,
                                                    v1::ListProjectOverridesResponse* resp) {
  try {
    *resp = service_->ListProjectOverrides(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TemplateServer::ListTemplateChanges(::grpc::ServerContext*, const v1::ListTemplateChangesRequest* req,
                                                   v1::ListTemplateChangesResponse* resp) {
  try {
    *resp = service_->ListTemplateChanges(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace progress::grpc
