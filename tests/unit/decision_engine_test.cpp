#include "internal/access/decision_engine.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "tests/support/lot_fixture.hpp"

namespace {

using lotgate::testing::DualCameraParking;
using lotgate::testing::LotFixture;
using lotgate::testing::MinutesAgo;
using lotgate::testing::SingleCameraParking;
using namespace lotgate::v1;
using namespace std::chrono_literals;
namespace cfg = lotgate::runtime::config;

void TestVisitorEntryOpensSession() {
  LotFixture lot(SingleCameraParking());

  const auto decision = lot.Detect("ab-123", "cam-entry", MinutesAgo(90));
  assert(decision.grant);
  assert(decision.reason == DECISION_REASON_VISITOR);
  assert(decision.action == SESSION_ACTION_OPEN_SESSION);
  assert(decision.direction == DIRECTION_ENTRY);
  assert(decision.plate == "AB123");
  assert(decision.session.has_value());
  assert(decision.session->status == SESSION_STATUS_ACTIVE);
  assert(decision.session->visitor);

  const auto events = lot.Drain();
  assert(LotFixture::Count(events, DomainEvent::kSessionOpened) == 1);
  assert(LotFixture::Count(events, DomainEvent::kAccessGranted) == 1);

  const auto log = lot.AccessLog("AB123");
  assert(log.size() == 1);
  assert(log[0].granted);
  assert(log[0].session_id == decision.session->id);

  assert(lot.Barrier("entry")->WaitForState(BARRIER_STATE_OPEN, 2000ms));
}

void TestExitWithFeeWaitsForPayment() {
  LotFixture lot(SingleCameraParking());

  const auto entry = lot.Detect("AB123", "cam-entry", MinutesAgo(180));
  const auto exit  = lot.Detect("AB123", "cam-entry", MinutesAgo(180) + 61min);

  assert(!exit.grant);
  assert(exit.reason == DECISION_REASON_PAYMENT_REQUIRED);
  assert(exit.direction == DIRECTION_EXIT);
  assert(exit.action == SESSION_ACTION_NONE);
  assert(exit.session->id == entry.session->id);
  assert(exit.session->status == SESSION_STATUS_PENDING_PAYMENT);
  assert(exit.session->fee_minor == 400);
  assert(!exit.session->transaction_id.empty());
  assert(lot.terminal->ListPending().size() == 1);

  const auto events = lot.Drain();
  assert(LotFixture::Count(events, DomainEvent::kSessionPaymentDue) == 1);
  assert(LotFixture::Count(events, DomainEvent::kAccessDenied) == 1);

  // re-detection while the terminal is busy
  const auto again = lot.Detect("AB123", "cam-entry", MinutesAgo(180) + 62min);
  assert(!again.grant);
  assert(again.reason == DECISION_REASON_PAYMENT_PENDING);
  assert(lot.terminal->ListPending().size() == 1);
}

void TestDuplicateEntryTimestampIsRejected() {
  LotFixture lot(SingleCameraParking());
  const auto at = MinutesAgo(30);

  assert(lot.Detect("AB123", "cam-entry", at).grant);
  const auto duplicate = lot.Detect("AB123", "cam-entry", at);
  assert(!duplicate.grant);
  assert(duplicate.reason == DECISION_REASON_DUPLICATE_EVENT);
  assert(duplicate.session->status == SESSION_STATUS_ACTIVE);
}

void TestProcessDebouncesRepeatedReadings() {
  LotFixture lot(SingleCameraParking());
  const auto at = MinutesAgo(30);

  auto first = lot.engine->Process(LotFixture::Detection("AB123", "cam-entry", at));
  assert(first.has_value() && first->grant);
  assert(!lot.engine->Process(LotFixture::Detection("AB123", "cam-entry", at + 1s)).has_value());
  assert(!lot.engine->Process(LotFixture::Detection("AB123", "cam-entry", at + 10s, 0.3)).has_value());
}

void TestStrongerRereadRefinesEntry() {
  LotFixture lot(SingleCameraParking());
  const auto at = MinutesAgo(30);

  auto weak = lot.engine->Process(LotFixture::Detection("AB123", "cam-entry", at, 0.6));
  assert(weak.has_value() && weak->grant);
  lot.Drain();

  auto strong = lot.engine->Process(LotFixture::Detection("AB123", "cam-entry", at + 1s, 0.9));
  assert(strong.has_value());
  assert(!strong->grant);
  assert(strong->reason == DECISION_REASON_DUPLICATE_EVENT);
  assert(strong->direction == DIRECTION_ENTRY);
  assert(strong->action == SESSION_ACTION_NONE);
  assert(strong->session->id == weak->session->id);

  const auto session = lot.sessions->GetSession(weak->session->id);
  assert(session->status == SESSION_STATUS_ACTIVE);
  assert(session->transaction_id.empty());
  assert(lot.terminal->ListPending().empty());

  const auto events = lot.Drain();
  assert(LotFixture::Count(events, DomainEvent::kAccessGranted) == 0);
  assert(LotFixture::Count(events, DomainEvent::kAccessDenied) == 0);
  assert(LotFixture::Count(events, DomainEvent::kSessionPaymentDue) == 0);
  assert(LotFixture::Count(events, DomainEvent::kSessionOpened) == 0);

  const auto log = lot.AccessLog("AB123");
  assert(log.size() == 2);
}

void TestStrongerRereadRaisesNoConflictOnDualCamera() {
  LotFixture lot(DualCameraParking());
  const auto at = MinutesAgo(30);

  assert(lot.engine->Process(LotFixture::Detection("AB123", "cam-entry", at, 0.6))->grant);
  lot.Drain();

  auto strong = lot.engine->Process(LotFixture::Detection("AB123", "cam-entry", at + 1s, 0.9));
  assert(strong.has_value());
  assert(strong->reason == DECISION_REASON_DUPLICATE_EVENT);
  assert(LotFixture::Count(lot.Drain(), DomainEvent::kOperatorAlert) == 0);
  assert(lot.sessions->FindOpenSession("AB123")->status == SESSION_STATUS_ACTIVE);
}

void TestAuthorizedOnlyPolicy() {
  auto parking = SingleCameraParking();
  parking.set_access_policy(cfg::ACCESS_POLICY_AUTHORIZED_ONLY);
  LotFixture lot(parking);
  lot.Authorize("RES001");
  lot.Authorize("BAN001", false);

  const auto resident = lot.Detect("res 001", "cam-entry", MinutesAgo(10));
  assert(resident.grant);
  assert(resident.reason == DECISION_REASON_AUTHORIZED);
  assert(!resident.session->visitor);

  const auto stranger = lot.Detect("XYZ999", "cam-entry", MinutesAgo(10));
  assert(!stranger.grant);
  assert(stranger.reason == DECISION_REASON_UNAUTHORIZED);
  assert(!lot.sessions->FindOpenSession("XYZ999"));

  const auto banned = lot.Detect("BAN001", "cam-entry", MinutesAgo(10));
  assert(!banned.grant);
  assert(banned.reason == DECISION_REASON_UNAUTHORIZED);
}

void TestAccessControlModeKeepsNoSessions() {
  auto parking = SingleCameraParking();
  parking.set_operating_mode(cfg::OPERATING_MODE_ACCESS_CONTROL);
  LotFixture lot(parking);
  lot.Authorize("RES001");

  const auto resident = lot.Detect("RES001", "cam-exit", MinutesAgo(5));
  assert(resident.grant);
  assert(resident.reason == DECISION_REASON_AUTHORIZED);
  assert(resident.direction == DIRECTION_EXIT);
  assert(resident.action == SESSION_ACTION_NONE);
  assert(!resident.session);
  assert(!lot.sessions->FindOpenSession("RES001"));

  const auto stranger = lot.Detect("XYZ999", "cam-entry", MinutesAgo(5));
  assert(!stranger.grant);
  assert(stranger.reason == DECISION_REASON_UNAUTHORIZED);
}

void TestForwardModeHandsEveryPlateOver() {
  auto parking = SingleCameraParking();
  parking.set_operating_mode(cfg::OPERATING_MODE_FORWARD);
  LotFixture lot(parking);
  lot.Authorize("BAN001", false);

  const auto visitor = lot.Detect("ab 123", "cam-entry", MinutesAgo(10));
  assert(!visitor.grant);
  assert(visitor.reason == DECISION_REASON_FORWARDED);
  assert(visitor.direction == DIRECTION_ENTRY);
  assert(!visitor.session.has_value());

  // no local lookup: a banned plate is forwarded the same way
  const auto banned = lot.Detect("BAN001", "cam-exit", MinutesAgo(9));
  assert(banned.reason == DECISION_REASON_FORWARDED);
  assert(banned.direction == DIRECTION_EXIT);

  assert(lot.forwarder->FramesSent() == 2);
  assert(!lot.sessions->FindOpenSession("AB123"));
  assert(lot.Barrier("entry")->State() == BARRIER_STATE_CLOSED);

  const auto log = lot.AccessLog("AB123");
  assert(log.size() == 1);
  assert(log[0].reason == DECISION_REASON_FORWARDED);
  assert(!log[0].granted);

  const auto events = lot.Drain();
  assert(LotFixture::Count(events, DomainEvent::kAccessDenied) == 0);
  assert(LotFixture::Count(events, DomainEvent::kSessionOpened) == 0);
}

void TestPaymentNeverClosesOnExit() {
  auto parking = SingleCameraParking();
  parking.set_payment_required(cfg::PAYMENT_REQUIRED_NEVER);
  LotFixture lot(parking);

  lot.Detect("AB123", "cam-entry", MinutesAgo(300));
  const auto exit = lot.Detect("AB123", "cam-entry", MinutesAgo(10));
  assert(exit.grant);
  assert(exit.reason == DECISION_REASON_EXIT_FREE);
  assert(exit.action == SESSION_ACTION_CLOSE_SESSION);
  assert(exit.session->status == SESSION_STATUS_PAID);
  assert(exit.session->fee_minor == 0);
  assert(exit.session->exit_time_ms != 0);
  assert(lot.terminal->ListPending().empty());
}

void TestGracePeriodExitIsFree() {
  auto parking = SingleCameraParking();
  parking.set_payment_required(cfg::PAYMENT_REQUIRED_GRACE_PERIOD);
  parking.mutable_fee_policy()->set_grace_period_minutes(15);
  LotFixture lot(parking);

  lot.Detect("AB123", "cam-entry", MinutesAgo(20));
  const auto exit = lot.Detect("AB123", "cam-entry", MinutesAgo(10));
  assert(exit.grant);
  assert(exit.reason == DECISION_REASON_EXIT_FREE);
}

void TestDualCameraAnomalies() {
  LotFixture lot(DualCameraParking());

  const auto ghost = lot.Detect("AB123", "cam-exit", MinutesAgo(60));
  assert(!ghost.grant);
  assert(ghost.reason == DECISION_REASON_EXIT_WITHOUT_SESSION);
  assert(LotFixture::HasAlert(lot.Drain(), ALERT_CODE_EXIT_WITHOUT_SESSION));

  assert(lot.Detect("AB123", "cam-entry", MinutesAgo(50)).grant);
  const auto twice = lot.Detect("AB123", "cam-entry", MinutesAgo(40));
  assert(!twice.grant);
  assert(twice.reason == DECISION_REASON_SESSION_CONFLICT);
  assert(LotFixture::HasAlert(lot.Drain(), ALERT_CODE_SESSION_CONFLICT));

  const auto stray = lot.Detect("AB123", "cam-unknown", MinutesAgo(30));
  assert(!stray.grant);
  assert(stray.reason == DECISION_REASON_UNKNOWN_CAMERA);
  assert(LotFixture::HasAlert(lot.Drain(), ALERT_CODE_UNKNOWN_CAMERA));
}

void TestDenyPolicyRaisesNoAlerts() {
  auto parking = DualCameraParking();
  parking.set_anomaly_policy(cfg::ANOMALY_POLICY_DENY);
  LotFixture lot(parking);

  const auto ghost = lot.Detect("AB123", "cam-exit", MinutesAgo(60));
  assert(ghost.reason == DECISION_REASON_EXIT_WITHOUT_SESSION);
  assert(LotFixture::Count(lot.Drain(), DomainEvent::kOperatorAlert) == 0);
}

void TestFaultedBarrierDeniesWithoutOpeningSession() {
  LotFixture lot(SingleCameraParking());
  lot.FaultBarrier("entry");

  const auto decision = lot.Detect("AB123", "cam-entry", MinutesAgo(5));
  assert(!decision.grant);
  assert(decision.reason == DECISION_REASON_BARRIER_FAULT);
  assert(!lot.sessions->FindOpenSession("AB123"));
}

void TestEmptyPlateIsInvalid() {
  LotFixture lot(SingleCameraParking());

  const auto decision = lot.Detect(" -- ", "cam-entry", MinutesAgo(5));
  assert(!decision.grant);
  assert(decision.reason == DECISION_REASON_INVALID_PLATE);

  const auto log = lot.AccessLog("");
  assert(log.size() == 1);
  assert(log[0].reason == DECISION_REASON_INVALID_PLATE);
}

void TestCancelledSessionNeedsManualReview() {
  LotFixture lot(SingleCameraParking());

  lot.Detect("AB123", "cam-entry", MinutesAgo(180));
  const auto exit = lot.Detect("AB123", "cam-entry", MinutesAgo(100));
  lot.Report(exit.session->id, TRANSACTION_STATE_FAILED);
  assert(lot.sessions->GetSession(exit.session->id)->status == SESSION_STATUS_CANCELLED);
  assert(LotFixture::HasAlert(lot.Drain(), ALERT_CODE_PAYMENT_FAILED));

  // the vehicle is still in the lane: no new session, operator decides
  const auto retry = lot.Detect("AB123", "cam-entry", MinutesAgo(1));
  assert(!retry.grant);
  assert(retry.reason == DECISION_REASON_MANUAL_REVIEW);
  assert(!lot.sessions->FindOpenSession("AB123"));
  assert(LotFixture::HasAlert(lot.Drain(), ALERT_CODE_UNRESOLVED_EXIT));
}

void TestReplayedExitAgainstPaidSession() {
  LotFixture lot(DualCameraParking());

  lot.Detect("AB123", "cam-entry", MinutesAgo(120));
  const auto at   = MinutesAgo(1);
  const auto exit = lot.Detect("AB123", "cam-exit", at);
  assert(exit.reason == DECISION_REASON_PAYMENT_REQUIRED);
  lot.Report(exit.session->id, TRANSACTION_STATE_COMPLETED);
  assert(lot.sessions->GetSession(exit.session->id)->status == SESSION_STATUS_PAID);
  lot.Drain();

  const auto replay = lot.Detect("AB123", "cam-exit", at);
  assert(!replay.grant);
  assert(replay.reason == DECISION_REASON_DUPLICATE_EVENT);
  assert(replay.session->id == exit.session->id);
  assert(lot.terminal->ListPending().empty());

  const auto events = lot.Drain();
  assert(LotFixture::Count(events, DomainEvent::kAccessGranted) == 0);
  assert(LotFixture::Count(events, DomainEvent::kSessionPaymentDue) == 0);
}

void TestConcurrentEntriesOpenOneSession() {
  LotFixture lot(DualCameraParking());
  const auto base = MinutesAgo(10);

  std::atomic<int>         granted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      if (lot.Detect("AB123", "cam-entry", base + std::chrono::seconds(i)).grant) ++granted;
    });
  }
  for (auto& t : threads) t.join();

  assert(granted.load() == 1);
  assert(lot.sessions->ListSessions(SESSION_STATUS_ACTIVE).size() == 1);
}

void TestToProtoCarriesSession() {
  LotFixture lot(SingleCameraParking());
  const auto decision = lot.Detect("AB123", "cam-entry", MinutesAgo(5));

  const auto proto = lotgate::access::ToProto(decision);
  assert(proto.grant());
  assert(proto.reason() == DECISION_REASON_VISITOR);
  assert(proto.session().id() == decision.session->id);
  assert(proto.session().status() == SESSION_STATUS_ACTIVE);
}

} // namespace

int main() {
  TestVisitorEntryOpensSession();
  TestExitWithFeeWaitsForPayment();
  TestDuplicateEntryTimestampIsRejected();
  TestProcessDebouncesRepeatedReadings();
  TestStrongerRereadRefinesEntry();
  TestStrongerRereadRaisesNoConflictOnDualCamera();
  TestAuthorizedOnlyPolicy();
  TestAccessControlModeKeepsNoSessions();
  TestForwardModeHandsEveryPlateOver();
  TestPaymentNeverClosesOnExit();
  TestGracePeriodExitIsFree();
  TestDualCameraAnomalies();
  TestDenyPolicyRaisesNoAlerts();
  TestFaultedBarrierDeniesWithoutOpeningSession();
  TestEmptyPlateIsInvalid();
  TestCancelledSessionNeedsManualReview();
  TestReplayedExitAgainstPaidSession();
  TestConcurrentEntriesOpenOneSession();
  TestToProtoCarriesSession();

  std::cout << "lotgate_unit_decision_engine: pass\n";
  return 0;
}
