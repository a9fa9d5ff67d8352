#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "internal/util/money.hpp"
#include "internal/util/time.hpp"
#include "lotgate/v1/types.pb.h"

namespace lotgate::payment {

using lotgate::v1::TransactionState;

struct TransactionUpdate {
  std::string      transaction_id;
  TransactionState state = lotgate::v1::TRANSACTION_STATE_UNSPECIFIED;
  std::string      payment_method;
  std::string      message;
};

using TransactionListener = std::function<void(const TransactionUpdate&)>;

/*
  Asynchronous payment collaborator.

  Request() places a transaction and returns its id while it is still
  PENDING; the outcome arrives later through the listener. Implementations
  must never invoke the listener from inside Request() or Cancel().
*/
class PaymentProcessor {
 public:
  virtual ~PaymentProcessor() = default;

  // Throws util::PaymentFailure when the request cannot be placed.
  virtual std::string Request(const std::string& session_id, const util::Money& amount) = 0;

  // Throws util::NotFound for unknown ids.
  virtual TransactionState Status(const std::string& transaction_id) = 0;

  // No-op for unknown or finished transactions.
  virtual void Cancel(const std::string& transaction_id) = 0;

  virtual void SetListener(TransactionListener listener) = 0;

  // Drops bookkeeping for transactions finished long enough before `now`.
  // Returns the number dropped.
  virtual std::size_t PruneFinal(util::TimePoint now) = 0;
};

constexpr bool IsFinal(TransactionState state) {
  return state == lotgate::v1::TRANSACTION_STATE_COMPLETED || state == lotgate::v1::TRANSACTION_STATE_FAILED ||
         state == lotgate::v1::TRANSACTION_STATE_CANCELLED;
}

} // namespace lotgate::payment
