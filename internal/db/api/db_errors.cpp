#include "internal/db/api/db_errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace lotgate::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::ConstraintViolation:
      throw util::SessionConflict(message);
    default:
      throw std::runtime_error(context + ": " + std::string(ErrorCodeName(result.code)) + " (" + result.message + ")");
  }
}

} // namespace lotgate::db
