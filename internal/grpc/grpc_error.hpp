#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace progress::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace progress::grpc
