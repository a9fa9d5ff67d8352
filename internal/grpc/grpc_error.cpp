#include "grpc_error.hpp"

namespace lotgate::grpc {

::grpc::StatusCode ToStatusCode(util::ErrorKind kind) {
  switch (kind) {
    case util::ErrorKind::NotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case util::ErrorKind::AlreadyExists:
    case util::ErrorKind::SessionConflict:
      return ::grpc::StatusCode::ALREADY_EXISTS;
    case util::ErrorKind::InvalidState:
    case util::ErrorKind::Configuration:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case util::ErrorKind::PaymentFailure:
      return ::grpc::StatusCode::ABORTED;
    case util::ErrorKind::BarrierFault:
      return ::grpc::StatusCode::UNAVAILABLE;
  }
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* error = dynamic_cast<const util::Error*>(&e)) {
    return {ToStatusCode(error->Kind()), e.what()};
  }
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace lotgate::grpc
