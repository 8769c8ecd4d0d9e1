#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace rentledger::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Runs a service call and translates its exception, if any.
template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace rentledger::grpc
