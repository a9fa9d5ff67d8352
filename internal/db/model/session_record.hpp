#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "lotgate/v1/types.pb.h"

namespace lotgate::db::model {

/*
  Persistent parking session row.

  IMPORTANT:
  - Status transitions are validated by model::CanTransition before writing.
  - fee_policy is the JSON snapshot of the FeePolicy in force at entry;
    the session is always billed against it.
  - Millisecond timestamps use 0 for "not set".
*/

struct SessionRecord {
  std::string id;
  std::string plate;

  uint64_t entry_time_ms = 0;
  uint64_t exit_time_ms  = 0;

  lotgate::v1::SessionStatus status = lotgate::v1::SESSION_STATUS_UNSPECIFIED;

  std::optional<int64_t> fee_minor;
  std::string            currency;
  std::string            payment_method;

  std::string camera_entry_id;
  std::string camera_exit_id;

  std::string transaction_id;
  uint64_t    payment_requested_at_ms = 0;
  uint64_t    payment_time_ms         = 0;

  std::string fee_policy;
  bool        visitor = false;
  std::string notes;
};

}
