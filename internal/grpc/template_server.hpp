#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/template_service.hpp"
#include "progress/engine/services/v1/template_service.grpc.pb.h"

namespace progress::grpc {

class TemplateServer final : public progress::engine::services::v1::TemplateService::Service {
 public:
  explicit TemplateServer(std::shared_ptr<progress::service::TemplateService> svc);

  ::grpc::Status ListItemTypes(::grpc::ServerContext*, const progress::engine::v1::ListItemTypesRequest*,
                               progress::engine::v1::ListItemTypesResponse*) override;
  ::grpc::Status GetDefaultSchedule(::grpc::ServerContext*, const progress::engine::v1::GetDefaultScheduleRequest*,
                                    progress::engine::v1::GetDefaultScheduleResponse*) override;
  ::grpc::Status PutDefaultSchedule(::grpc::ServerContext*, const progress::engine::v1::PutDefaultScheduleRequest*,
                                    progress::engine::v1::PutDefaultScheduleResponse*) override;
  ::grpc::Status PutProjectOverrides(::grpc::ServerContext*, const progress::engine::v1::PutProjectOverridesRequest*,
                                     progress::engine::v1::PutProjectOverridesResponse*) override;
  ::grpc::Status ClearProjectOverrides(::grpc::ServerContext*, const progress::engine::v1::ClearProjectOverridesRequest*,
                                       progress::engine::v1::ClearProjectOverridesResponse*) override;
  ::grpc::Status ListProjectOverrides(::grpc::ServerContext*, const progress::engine::v1::ListProjectOverridesRequest*,
                                      progress::engine::v1::ListProjectOverridesResponse*) override;
  ::grpc::Status ListTemplateChanges(::grpc::ServerContext*, const progress::engine::v1::ListTemplateChangesRequest*,
                                     progress::engine::v1::ListTemplateChangesResponse*) override;

 private:
  std::shared_ptr<progress::service::TemplateService> service_;
};

} // namespace progress::grpc
