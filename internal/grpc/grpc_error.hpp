#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace handoff::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace handoff::grpc
