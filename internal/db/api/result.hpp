#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace lotgate::db {

// Outcome of a repository call. Backends fold their native errors into
// these codes so the access and session layers never see sqlite codes.
//
//   NotFound             no authorization, session or payment with that key
//   AlreadyExists        duplicate primary key (session id, transaction id)
//   ConstraintViolation  a second open session for the same plate
//   Busy                 the writer lock could not be taken in time
enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  ConstraintViolation,
  Busy,
  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::IOError: return "io error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() { return {}; }

  static Result Err(ErrorCode c, std::string msg = {}) { return {c, std::move(msg)}; }

  explicit operator bool() const { return code == ErrorCode::OK; }
};

} // namespace lotgate::db
