#include "internal/payment/terminal_bridge_processor.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace lotgate::payment {

using observability::IntField;
using observability::StringField;

namespace {

// Pruned outcomes remembered for repeated reports.
constexpr std::size_t kSettledMemory = 4096;

} // namespace

TerminalBridgeProcessor::TerminalBridgeProcessor(std::chrono::milliseconds retention) : retention_(retention) {
}

std::string TerminalBridgeProcessor::Request(const std::string& session_id, const util::Money& amount) {
  if (amount.minor_units <= 0) {
    throw util::PaymentFailure("payment amount must be positive");
  }

  Transaction transaction{
      .transaction_id = util::NewId(),
      .session_id     = session_id,
      .amount         = amount,
  };
  auto id = transaction.transaction_id;

  {
    std::lock_guard lock(mutex_);
    transactions_.emplace(id, std::move(transaction));
  }
  LOTGATE_LOG_INFO("payment requested",
                   {StringField("transaction", id), StringField("session", session_id), StringField("amount", amount.ToString())});
  return id;
}

TransactionState TerminalBridgeProcessor::Status(const std::string& transaction_id) {
  std::lock_guard lock(mutex_);
  auto            it = transactions_.find(transaction_id);
  if (it != transactions_.end()) {
    return it->second.state;
  }
  if (auto settled = Settled(transaction_id)) {
    return *settled;
  }
  throw util::NotFound("transaction " + transaction_id);
}

void TerminalBridgeProcessor::Cancel(const std::string& transaction_id) {
  std::lock_guard lock(mutex_);
  auto            it = transactions_.find(transaction_id);
  if (it == transactions_.end() || IsFinal(it->second.state)) {
    return;
  }
  it->second.state       = lotgate::v1::TRANSACTION_STATE_CANCELLED;
  it->second.finished_at = util::Now();
}

void TerminalBridgeProcessor::SetListener(TransactionListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

void TerminalBridgeProcessor::Report(const TransactionUpdate& update) {
  TransactionListener listener;
  {
    std::lock_guard lock(mutex_);
    auto            it = transactions_.find(update.transaction_id);
    if (it == transactions_.end()) {
      auto settled = Settled(update.transaction_id);
      if (!settled) {
        throw util::NotFound("transaction " + update.transaction_id);
      }
      if (*settled == update.state) {
        return;
      }
      throw util::InvalidState("transaction " + update.transaction_id + " already " + lotgate::v1::TransactionState_Name(*settled));
    }

    auto& transaction = it->second;
    if (IsFinal(transaction.state)) {
      if (transaction.state == update.state) {
        return;
      }
      throw util::InvalidState("transaction " + update.transaction_id + " already " +
                               lotgate::v1::TransactionState_Name(transaction.state));
    }
    if (update.state == lotgate::v1::TRANSACTION_STATE_PENDING || update.state == lotgate::v1::TRANSACTION_STATE_UNSPECIFIED) {
      throw util::InvalidState("terminal reported state " + lotgate::v1::TransactionState_Name(update.state));
    }

    transaction.state = update.state;
    if (IsFinal(update.state)) {
      transaction.finished_at = util::Now();
    }
    listener = listener_;
  }

  LOTGATE_LOG_INFO("terminal reported transaction", {StringField("transaction", update.transaction_id),
                                                     StringField("state", lotgate::v1::TransactionState_Name(update.state))});
  if (listener) {
    listener(update);
  }
}

std::vector<TerminalBridgeProcessor::Transaction> TerminalBridgeProcessor::ListPending() const {
  std::vector<Transaction> pending;
  std::lock_guard          lock(mutex_);
  for (const auto& [_, transaction] : transactions_) {
    if (!IsFinal(transaction.state)) {
      pending.push_back(transaction);
    }
  }
  std::sort(pending.begin(), pending.end(), [](const auto& a, const auto& b) { return a.transaction_id < b.transaction_id; });
  return pending;
}

std::size_t TerminalBridgeProcessor::Size() const {
  std::lock_guard lock(mutex_);
  return transactions_.size();
}

std::size_t TerminalBridgeProcessor::PruneFinal(util::TimePoint now) {
  std::size_t     pruned = 0;
  std::lock_guard lock(mutex_);
  for (auto it = transactions_.begin(); it != transactions_.end();) {
    const auto& transaction = it->second;
    if (!IsFinal(transaction.state) || now - transaction.finished_at < retention_) {
      ++it;
      continue;
    }

    if (settled_.emplace(it->first, transaction.state).second) {
      settled_order_.push_back(it->first);
    }
    while (settled_order_.size() > kSettledMemory) {
      settled_.erase(settled_order_.front());
      settled_order_.pop_front();
    }
    it = transactions_.erase(it);
    ++pruned;
  }

  if (pruned > 0) {
    LOTGATE_LOG_DEBUG("pruned finished transactions",
                      {IntField("count", static_cast<int64_t>(pruned)), IntField("held", static_cast<int64_t>(transactions_.size()))});
  }
  return pruned;
}

std::optional<TransactionState> TerminalBridgeProcessor::Settled(const std::string& transaction_id) const {
  auto it = settled_.find(transaction_id);
  if (it == settled_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace lotgate::payment
