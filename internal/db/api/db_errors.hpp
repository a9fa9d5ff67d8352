#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace lotgate::db {

/*
  Result -> typed exception.

  NotFound            -> util::NotFound
  AlreadyExists       -> util::AlreadyExists
  ConstraintViolation -> util::SessionConflict (the only constraint is the
                         one-open-session-per-plate index)
  anything else       -> std::runtime_error
*/
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace lotgate::db
