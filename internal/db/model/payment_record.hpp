#pragma once

#include <cstdint>
#include <string>

#include "lotgate/v1/types.pb.h"

namespace lotgate::db::model {

struct PaymentRecord {
  std::string transaction_id;
  std::string session_id;

  int64_t     amount_minor = 0;
  std::string currency;

  lotgate::v1::TransactionState state = lotgate::v1::TRANSACTION_STATE_UNSPECIFIED;

  std::string payment_method;
  std::string message;
  uint64_t    updated_at_ms = 0;
};

}
