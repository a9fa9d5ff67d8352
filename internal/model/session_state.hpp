#pragma once

#include "lotgate/v1/types.pb.h"

namespace lotgate::model {

using lotgate::v1::SessionStatus;

constexpr bool IsTerminal(SessionStatus status) {
  return status == lotgate::v1::SESSION_STATUS_PAID || status == lotgate::v1::SESSION_STATUS_CANCELLED;
}

// ACTIVE and PENDING_PAYMENT count against the one-open-session-per-plate rule.
constexpr bool IsOpen(SessionStatus status) {
  return status == lotgate::v1::SESSION_STATUS_ACTIVE || status == lotgate::v1::SESSION_STATUS_PENDING_PAYMENT;
}

constexpr bool CanTransition(SessionStatus from, SessionStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case lotgate::v1::SESSION_STATUS_ACTIVE:
      return to == lotgate::v1::SESSION_STATUS_PENDING_PAYMENT || to == lotgate::v1::SESSION_STATUS_PAID ||
             to == lotgate::v1::SESSION_STATUS_CANCELLED;
    case lotgate::v1::SESSION_STATUS_PENDING_PAYMENT:
      return to == lotgate::v1::SESSION_STATUS_PAID || to == lotgate::v1::SESSION_STATUS_CANCELLED;
    default:
      return false;
  }
}

} // namespace lotgate::model
