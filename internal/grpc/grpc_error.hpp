#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace lotgate::grpc {

::grpc::StatusCode ToStatusCode(util::ErrorKind kind);

// util::Error keeps its kind; any other exception is INTERNAL.
::grpc::Status ToStatus(const std::exception& e);

// Runs one unary handler body and turns a thrown exception into its status.
template <typename Fn>
::grpc::Status Guarded(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace lotgate::grpc
