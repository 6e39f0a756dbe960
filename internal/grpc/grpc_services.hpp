#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "internal/factory.hpp"

namespace progress::grpc {

// Transport adapters for every service of the runtime.
std::vector<std::unique_ptr<::grpc::Service>> BuildGrpcServices(const factory::RuntimeDependencies& deps);

} // namespace progress::grpc
