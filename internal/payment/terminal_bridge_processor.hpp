#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "payment_processor.hpp"

namespace lotgate::payment {

/*
  Processor for card terminals driven by an external adapter.

  Request() only records the transaction; the adapter polls ListPending(),
  runs it on the terminal and reports the outcome through Report().

  Finished transactions are kept for `retention`, then PruneFinal() drops
  them. The outcome of the most recently pruned ones is remembered so a
  repeated terminal report stays a no-op.
*/
class TerminalBridgeProcessor final : public PaymentProcessor {
 public:
  struct Transaction {
    std::string      transaction_id;
    std::string      session_id;
    util::Money      amount;
    TransactionState state = lotgate::v1::TRANSACTION_STATE_PENDING;
    util::TimePoint  finished_at;
  };

  explicit TerminalBridgeProcessor(std::chrono::milliseconds retention = std::chrono::minutes(10));

  std::string      Request(const std::string& session_id, const util::Money& amount) override;
  TransactionState Status(const std::string& transaction_id) override;
  void             Cancel(const std::string& transaction_id) override;
  void             SetListener(TransactionListener listener) override;
  std::size_t      PruneFinal(util::TimePoint now) override;

  // Adapter side. Throws util::NotFound for unknown ids and
  // util::InvalidState when a finished transaction is reported differently.
  void Report(const TransactionUpdate& update);

  std::vector<Transaction> ListPending() const;

  // Transactions still held, pending or finished.
  std::size_t Size() const;

 private:
  std::optional<TransactionState> Settled(const std::string& transaction_id) const;

  std::chrono::milliseconds retention_;

  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, Transaction> transactions_;
  TransactionListener                          listener_;

  std::unordered_map<std::string, TransactionState> settled_;
  std::deque<std::string>                           settled_order_;
};

} // namespace lotgate::payment
