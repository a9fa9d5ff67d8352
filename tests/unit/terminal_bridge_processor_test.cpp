#include "internal/payment/terminal_bridge_processor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using lotgate::payment::TerminalBridgeProcessor;
using lotgate::payment::TransactionUpdate;
using lotgate::util::Money;
using namespace lotgate::v1;

TransactionUpdate Update(const std::string& id, TransactionState state) {
  TransactionUpdate update;
  update.transaction_id = id;
  update.state          = state;
  update.payment_method = "card";
  return update;
}

void TestRequestIsPendingUntilReported() {
  TerminalBridgeProcessor        processor;
  std::vector<TransactionUpdate> seen;
  processor.SetListener([&](const TransactionUpdate& update) { seen.push_back(update); });

  const auto id = processor.Request("session-1", Money{400, "USD"});
  assert(processor.Status(id) == TRANSACTION_STATE_PENDING);
  assert(seen.empty());

  auto pending = processor.ListPending();
  assert(pending.size() == 1);
  assert(pending[0].session_id == "session-1");
  assert(pending[0].amount.minor_units == 400);

  processor.Report(Update(id, TRANSACTION_STATE_PROCESSING));
  processor.Report(Update(id, TRANSACTION_STATE_COMPLETED));

  assert(seen.size() == 2);
  assert(seen[1].state == TRANSACTION_STATE_COMPLETED);
  assert(processor.Status(id) == TRANSACTION_STATE_COMPLETED);
  assert(processor.ListPending().empty());
}

void TestNonPositiveAmountIsRefused() {
  TerminalBridgeProcessor processor;
  bool                    threw = false;
  try {
    (void)processor.Request("session-1", Money{0, "USD"});
  } catch (const lotgate::util::PaymentFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestFinishedTransactionsAreImmutable() {
  TerminalBridgeProcessor processor;
  int                     calls = 0;
  processor.SetListener([&](const TransactionUpdate&) { ++calls; });

  const auto id = processor.Request("session-1", Money{250, "USD"});
  processor.Report(Update(id, TRANSACTION_STATE_FAILED));

  // duplicate report of the same outcome is absorbed
  processor.Report(Update(id, TRANSACTION_STATE_FAILED));
  assert(calls == 1);

  bool threw = false;
  try {
    processor.Report(Update(id, TRANSACTION_STATE_COMPLETED));
  } catch (const lotgate::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestCancelSilencesTransaction() {
  TerminalBridgeProcessor processor;
  int                     calls = 0;
  processor.SetListener([&](const TransactionUpdate&) { ++calls; });

  const auto id = processor.Request("session-1", Money{250, "USD"});
  processor.Cancel(id);
  processor.Cancel("unknown");

  assert(processor.Status(id) == TRANSACTION_STATE_CANCELLED);
  assert(calls == 0);
  assert(processor.ListPending().empty());
}

void TestPruneForgetsFinishedTransactions() {
  TerminalBridgeProcessor processor(std::chrono::minutes(10));
  int                     calls = 0;
  processor.SetListener([&](const TransactionUpdate&) { ++calls; });

  const auto done = processor.Request("session-1", Money{400, "USD"});
  const auto open = processor.Request("session-2", Money{200, "USD"});
  processor.Report(Update(done, TRANSACTION_STATE_COMPLETED));
  assert(processor.Size() == 2);

  assert(processor.PruneFinal(lotgate::util::Now()) == 0);
  assert(processor.PruneFinal(lotgate::util::Now() + std::chrono::minutes(11)) == 1);
  assert(processor.Size() == 1);
  assert(processor.ListPending().size() == 1);
  assert(processor.ListPending()[0].transaction_id == open);

  // outcome of a pruned transaction is still known
  assert(processor.Status(done) == TRANSACTION_STATE_COMPLETED);
  processor.Report(Update(done, TRANSACTION_STATE_COMPLETED));
  assert(calls == 1);

  bool threw = false;
  try {
    processor.Report(Update(done, TRANSACTION_STATE_FAILED));
  } catch (const lotgate::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownTransactionIsNotFound() {
  TerminalBridgeProcessor processor;
  bool                    threw = false;
  try {
    processor.Report(Update("missing", TRANSACTION_STATE_COMPLETED));
  } catch (const lotgate::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRequestIsPendingUntilReported();
  TestNonPositiveAmountIsRefused();
  TestFinishedTransactionsAreImmutable();
  TestCancelSilencesTransaction();
  TestPruneForgetsFinishedTransactions();
  TestUnknownTransactionIsNotFound();

  std::cout << "lotgate_unit_terminal_bridge: pass\n";
  return 0;
}
