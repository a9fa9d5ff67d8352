#pragma once

#include <stdexcept>
#include <string>

namespace lotgate::util {

// What went wrong, independent of the transport that reports it.
enum class ErrorKind {
  NotFound,         // unknown session, transaction, barrier or plate
  AlreadyExists,
  InvalidState,     // operation not allowed from the record's current status
  SessionConflict,  // second open session for a plate
  PaymentFailure,
  BarrierFault,
  Configuration,    // never recovered by guessing
};

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

  ErrorKind Kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

template <ErrorKind K>
class KindedError : public Error {
 public:
  explicit KindedError(const std::string& msg) : Error(K, msg) {}
};

using NotFound           = KindedError<ErrorKind::NotFound>;
using AlreadyExists      = KindedError<ErrorKind::AlreadyExists>;
using InvalidState       = KindedError<ErrorKind::InvalidState>;
using SessionConflict    = KindedError<ErrorKind::SessionConflict>;
using PaymentFailure     = KindedError<ErrorKind::PaymentFailure>;
using BarrierFault       = KindedError<ErrorKind::BarrierFault>;
using ConfigurationError = KindedError<ErrorKind::Configuration>;

} // namespace lotgate::util
