#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/access/plate_lock_table.hpp"
#include "internal/barrier/barrier_router.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/parking/parking_options.hpp"
#include "internal/payment/payment_processor.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace lotgate::parking {

using db::model::SessionRecord;
using events::EventBatch;
using lotgate::v1::SessionStatus;

enum class ExitOutcome {
  kClosed,     // ACTIVE -> PAID without payment, barrier may open
  kPaymentDue, // ACTIVE -> PENDING_PAYMENT, RequestPayment() after commit
  kManualFee,  // ACTIVE -> PENDING_PAYMENT without fee, operator settles
};

/*
  Owns the parking session lifecycle.

      (none)          -> ACTIVE            OpenSession
      ACTIVE          -> PAID              exit with nothing to pay
      ACTIVE          -> PENDING_PAYMENT   exit with fee due
      PENDING_PAYMENT -> PAID              COMPLETED / manual settlement
      PENDING_PAYMENT -> CANCELLED         FAILED / CANCELLED / timeout / operator

  Two kinds of entry points:

  - Decision path (OpenSession, BeginExit, CloseWithoutPayment,
    RecordPaidExit): the caller holds the plate lock, owns the transaction
    and publishes `events` after commit.
  - Self-contained operations (notifications, operator actions, timeout
    sweep): take the plate lock and their own transaction.

  Processor calls and barrier requests always happen after commit.
*/
class SessionManager {
 public:
  SessionManager(ParkingOptions options, std::shared_ptr<db::Repository> repository,
                 std::shared_ptr<payment::PaymentProcessor> processor, std::shared_ptr<events::EventBus> bus,
                 std::shared_ptr<barrier::BarrierRouter> barriers, std::shared_ptr<access::PlateLockTable> locks);

  // ---------------------------------------------------------------------
  // Decision path
  // ---------------------------------------------------------------------

  // Throws util::SessionConflict if the plate already has an open session.
  SessionRecord OpenSession(db::Transaction& tx, const std::string& plate, const std::string& camera_id, util::TimePoint at,
                            bool visitor, EventBatch& events);

  // `leaving` is false for pay-station payments made while the vehicle is
  // still parked; exit_time is then left unset.
  ExitOutcome BeginExit(db::Transaction& tx, SessionRecord& session, const std::string& camera_id, util::TimePoint at,
                        bool leaving, EventBatch& events);

  // ACTIVE -> PAID with zero fee.
  void CloseWithoutPayment(db::Transaction& tx, SessionRecord& session, const std::string& camera_id, util::TimePoint at,
                           bool leaving, EventBatch& events);

  // A session paid at the station leaves through the exit.
  void RecordPaidExit(db::Transaction& tx, SessionRecord& session, const std::string& camera_id, util::TimePoint at,
                      EventBatch& events);

  // Fee owed if the session ended at `at`, from the session's policy
  // snapshot. nullopt (with `error` set) when the policy is invalid.
  std::optional<util::Money> QuoteFee(const SessionRecord& session, util::TimePoint at, std::string* error = nullptr) const;

  // After commit, still under the plate lock.
  void RequestPayment(const SessionRecord& session);

  // ---------------------------------------------------------------------
  // Self-contained operations
  // ---------------------------------------------------------------------

  void OnTransactionUpdate(const payment::TransactionUpdate& update);

  SessionRecord PayAtStation(const std::string& plate);
  SessionRecord CancelSession(const std::string& session_id, const std::string& note);
  SessionRecord SettleManually(const std::string& session_id, std::optional<util::Money> amount, const std::string& method);
  SessionRecord ReleaseVehicle(const std::string& session_id, const std::string& barrier_id);

  // Cancels PENDING_PAYMENT sessions whose request is older than the
  // payment timeout. Returns the number cancelled.
  std::size_t ExpireStalePayments(util::TimePoint now);

  // Lets the payment processor forget transactions settled long ago.
  std::size_t PruneSettledPayments(util::TimePoint now);

  std::optional<SessionRecord> GetSession(const std::string& session_id);
  std::optional<SessionRecord> FindOpenSession(const std::string& plate);
  std::vector<SessionRecord>   ListSessions(SessionStatus status);

  // Opens the barrier serving the session's exit lane. False when no
  // barrier resolves or it is faulted.
  bool OpenExitBarrier(const SessionRecord& session);

  const ParkingOptions& Options() const {
    return options_;
  }

 private:
  void          Transition(SessionRecord& session, SessionStatus to);
  void          Save(db::Transaction& tx, const SessionRecord& session);
  SessionRecord Load(db::Transaction& tx, const std::string& session_id);
  std::string   PlateOf(const std::string& session_id);
  void          RecordPayment(db::Transaction& tx, const SessionRecord& session, payment::TransactionState state,
                              const std::string& method, const std::string& message);
  std::string   ExitCamera(const SessionRecord& session) const;

  ParkingOptions                             options_;
  std::string                                fee_policy_snapshot_;
  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<payment::PaymentProcessor> processor_;
  std::shared_ptr<events::EventBus>          bus_;
  std::shared_ptr<barrier::BarrierRouter>    barriers_;
  std::shared_ptr<access::PlateLockTable>    locks_;

  // Held from Request() until the transaction id is stored, so a
  // notification never looks up a transaction id that is not yet saved.
  std::mutex payment_request_mutex_;
};

} // namespace lotgate::parking
