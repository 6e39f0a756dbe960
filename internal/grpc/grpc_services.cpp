#include "grpc_services.hpp"

#include "progress_server.hpp"
#include "template_server.hpp"

namespace progress::grpc {

std::vector<std::unique_ptr<::grpc::Service>> BuildGrpcServices(const factory::RuntimeDependencies& deps) {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<ProgressServer>(deps.progress_service));
  services.push_back(std::make_unique<TemplateServer>(deps.template_service));
  return services;
}

} // namespace progress::grpc
