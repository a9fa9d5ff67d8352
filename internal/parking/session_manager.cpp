#include "internal/parking/session_manager.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/db/api/db_errors.hpp"
#include "internal/events/domain_events.hpp"
#include "internal/model/plate.hpp"
#include "internal/model/session_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/parking/fee_calculator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace lotgate::parking {

using namespace lotgate::v1;
using observability::StringField;

namespace {

constexpr const char* kManualMethod = "manual";

std::string ToJson(const FeePolicy& policy) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(policy, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to snapshot fee policy: " + std::string(status.message()));
  }
  return json;
}

util::Money FeeOf(const SessionRecord& session) {
  return util::Money{session.fee_minor.value_or(0), session.currency};
}

void SetFee(SessionRecord& session, const util::Money& fee) {
  session.fee_minor = fee.minor_units;
  session.currency  = fee.currency;
}

} // namespace

SessionManager::SessionManager(ParkingOptions options, std::shared_ptr<db::Repository> repository,
                               std::shared_ptr<payment::PaymentProcessor> processor, std::shared_ptr<events::EventBus> bus,
                               std::shared_ptr<barrier::BarrierRouter> barriers, std::shared_ptr<access::PlateLockTable> locks)
    : options_(std::move(options)),
      fee_policy_snapshot_(ToJson(options_.fee_policy)),
      repository_(std::move(repository)),
      processor_(std::move(processor)),
      bus_(std::move(bus)),
      barriers_(std::move(barriers)),
      locks_(std::move(locks)) {
}

// ------------------------------------------------------------------
// Helpers
// ------------------------------------------------------------------

void SessionManager::Transition(SessionRecord& session, SessionStatus to) {
  if (!model::CanTransition(session.status, to)) {
    throw util::InvalidState("session " + session.id + " cannot move from " + SessionStatus_Name(session.status) + " to " +
                             SessionStatus_Name(to));
  }
  session.status = to;
}

void SessionManager::Save(db::Transaction& tx, const SessionRecord& session) {
  db::ThrowIfDbError(repository_->UpdateSession(tx, session), "update session " + session.id);
}

SessionRecord SessionManager::Load(db::Transaction& tx, const std::string& session_id) {
  auto session = repository_->GetSession(tx, session_id);
  if (!session) {
    throw util::NotFound("session " + session_id);
  }
  return *session;
}

std::string SessionManager::PlateOf(const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto session = Load(*tx, session_id);
  tx->Commit();
  return session.plate;
}

void SessionManager::RecordPayment(db::Transaction& tx, const SessionRecord& session, payment::TransactionState state,
                                   const std::string& method, const std::string& message) {
  if (session.transaction_id.empty()) {
    return;
  }

  auto record = repository_->GetPayment(tx, session.transaction_id).value_or(db::model::PaymentRecord{});
  record.transaction_id = session.transaction_id;
  record.session_id     = session.id;
  record.amount_minor   = session.fee_minor.value_or(0);
  record.currency       = session.currency;
  record.state          = state;
  if (!method.empty()) record.payment_method = method;
  record.message       = message;
  record.updated_at_ms = util::ToUnixMillis(util::Now());
  db::ThrowIfDbError(repository_->UpsertPayment(tx, record), "record payment " + session.transaction_id);
}

std::string SessionManager::ExitCamera(const SessionRecord& session) const {
  if (!session.camera_exit_id.empty()) {
    return session.camera_exit_id;
  }
  // single-camera lanes serve both directions
  if (!options_.DualCamera()) {
    return session.camera_entry_id;
  }
  return {};
}

bool SessionManager::OpenExitBarrier(const SessionRecord& session) {
  const auto camera  = ExitCamera(session);
  auto       barrier = barriers_->ForCamera(camera);
  if (!barrier) {
    LOTGATE_LOG_WARN("no barrier serves session exit", {StringField("session", session.id), StringField("camera", camera)});
    return false;
  }
  return barrier->RequestOpen();
}

// ------------------------------------------------------------------
// Decision path
// ------------------------------------------------------------------

SessionRecord SessionManager::OpenSession(db::Transaction& tx, const std::string& plate, const std::string& camera_id,
                                          util::TimePoint at, bool visitor, EventBatch& events) {
  if (repository_->FindActiveSession(tx, plate)) {
    throw util::SessionConflict("plate " + plate + " already has an open session");
  }

  SessionRecord session;
  session.id              = util::NewId();
  session.plate           = plate;
  session.entry_time_ms   = util::ToUnixMillis(at);
  session.status          = SESSION_STATUS_ACTIVE;
  session.camera_entry_id = camera_id;
  session.currency        = options_.fee_policy.currency();
  session.fee_policy      = fee_policy_snapshot_;
  session.visitor         = visitor;

  db::ThrowIfDbError(repository_->InsertSession(tx, session), "open session for " + plate);

  events.push_back(events::MakeSessionOpened(session.id, plate, at));
  LOTGATE_LOG_INFO("session opened",
                   {StringField("session", session.id), StringField("plate", plate), StringField("camera", camera_id),
                    observability::BoolField("visitor", visitor)});
  return session;
}

std::optional<util::Money> SessionManager::QuoteFee(const SessionRecord& session, util::TimePoint at, std::string* error) const {
  FeePolicy policy;
  if (session.fee_policy.empty()) {
    policy = options_.fee_policy;
  } else {
    auto status = google::protobuf::util::JsonStringToMessage(session.fee_policy, &policy);
    if (!status.ok()) {
      if (error) *error = "unreadable fee policy snapshot: " + std::string(status.message());
      return std::nullopt;
    }
  }

  if (options_.payment_required == cfg::PAYMENT_REQUIRED_NEVER) {
    return util::Money::Zero(policy.currency());
  }

  try {
    return ComputeFee(policy, util::FromUnixMillis(session.entry_time_ms), at);
  } catch (const util::ConfigurationError& e) {
    if (error) *error = e.what();
    return std::nullopt;
  }
}

void SessionManager::CloseWithoutPayment(db::Transaction& tx, SessionRecord& session, const std::string& camera_id,
                                         util::TimePoint at, bool leaving, EventBatch& events) {
  Transition(session, SESSION_STATUS_PAID);
  SetFee(session, util::Money::Zero(session.currency));
  session.payment_method  = "none";
  session.payment_time_ms = util::ToUnixMillis(at);
  if (!camera_id.empty()) session.camera_exit_id = camera_id;
  if (leaving) session.exit_time_ms = util::ToUnixMillis(at);
  Save(tx, session);

  if (leaving) {
    events.push_back(events::MakeSessionClosed(session.id, session.plate, at, FeeOf(session), session.payment_method));
  }
  LOTGATE_LOG_INFO("session closed without payment", {StringField("session", session.id), StringField("plate", session.plate)});
}

ExitOutcome SessionManager::BeginExit(db::Transaction& tx, SessionRecord& session, const std::string& camera_id,
                                      util::TimePoint at, bool leaving, EventBatch& events) {
  std::string error;
  auto        fee = QuoteFee(session, at, &error);

  if (fee && fee->IsZero()) {
    CloseWithoutPayment(tx, session, camera_id, at, leaving, events);
    return ExitOutcome::kClosed;
  }

  Transition(session, SESSION_STATUS_PENDING_PAYMENT);
  if (!camera_id.empty()) session.camera_exit_id = camera_id;
  session.payment_requested_at_ms = util::ToUnixMillis(at);

  if (!fee) {
    session.fee_minor.reset();
    session.notes = "manual fee entry required: " + error;
    Save(tx, session);

    events.push_back(events::MakeOperatorAlert(ALERT_CODE_FEE_POLICY_INVALID, session.plate, session.id, session.notes, at));
    LOTGATE_LOG_ERROR("fee policy rejected", {StringField("session", session.id), StringField("error", error)});
    return ExitOutcome::kManualFee;
  }

  SetFee(session, *fee);
  Save(tx, session);

  events.push_back(events::MakeSessionPaymentDue(session.id, session.plate, *fee));
  LOTGATE_LOG_INFO("payment due", {StringField("session", session.id), StringField("plate", session.plate),
                                   StringField("fee", fee->ToString()), StringField("currency", fee->currency)});
  return ExitOutcome::kPaymentDue;
}

void SessionManager::RecordPaidExit(db::Transaction& tx, SessionRecord& session, const std::string& camera_id,
                                    util::TimePoint at, EventBatch& events) {
  session.exit_time_ms = util::ToUnixMillis(at);
  if (!camera_id.empty()) session.camera_exit_id = camera_id;
  Save(tx, session);

  events.push_back(events::MakeSessionClosed(session.id, session.plate, at, FeeOf(session), session.payment_method));
  LOTGATE_LOG_INFO("paid session exited", {StringField("session", session.id), StringField("plate", session.plate)});
}

void SessionManager::RequestPayment(const SessionRecord& session) {
  std::lock_guard<std::mutex> request_lock(payment_request_mutex_);

  std::string transaction_id;
  try {
    transaction_id = processor_->Request(session.id, FeeOf(session));
  } catch (const std::exception& e) {
    LOTGATE_LOG_ERROR("payment request failed", {StringField("session", session.id), StringField("error", e.what())});
    observability::Metrics::Instance().RecordPayment("request_failed");
    bus_->Publish(events::MakeOperatorAlert(ALERT_CODE_PAYMENT_REQUEST_FAILED, session.plate, session.id,
                                            std::string("payment request failed: ") + e.what(), util::Now()));
    return;
  }

  try {
    auto tx      = repository_->Begin();
    auto current = Load(*tx, session.id);
    current.transaction_id          = transaction_id;
    current.payment_requested_at_ms = util::ToUnixMillis(util::Now());
    Save(*tx, current);
    RecordPayment(*tx, current, TRANSACTION_STATE_PENDING, "", "");
    tx->Commit();
  } catch (const std::exception&) {
    processor_->Cancel(transaction_id);
    throw;
  }
  observability::Metrics::Instance().RecordPayment("requested");
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

void SessionManager::OnTransactionUpdate(const payment::TransactionUpdate& update) {
  std::string plate;
  {
    std::lock_guard<std::mutex> request_lock(payment_request_mutex_);
    auto                        tx      = repository_->Begin();
    auto                        session = repository_->FindSessionByTransaction(*tx, update.transaction_id);
    tx->Commit();
    if (!session) {
      LOTGATE_LOG_WARN("update for unknown transaction ignored", {StringField("transaction", update.transaction_id)});
      return;
    }
    plate = session->plate;
  }

  auto guard = locks_->Lock(plate);

  EventBatch events;
  bool       open_barrier = false;
  const auto now          = util::Now();

  auto tx      = repository_->Begin();
  auto session = repository_->FindSessionByTransaction(*tx, update.transaction_id);
  if (!session) {
    return;
  }

  RecordPayment(*tx, *session, update.state, update.payment_method, update.message);

  if (session->status != SESSION_STATUS_PENDING_PAYMENT) {
    tx->Commit();
    LOTGATE_LOG_WARN("stale transaction update ignored",
                     {StringField("transaction", update.transaction_id), StringField("session", session->id),
                      StringField("status", SessionStatus_Name(session->status))});
    if (update.state == TRANSACTION_STATE_COMPLETED && session->status == SESSION_STATUS_CANCELLED) {
      bus_->Publish(events::MakeOperatorAlert(ALERT_CODE_PAYMENT_FAILED, session->plate, session->id,
                                              "payment completed after the session was cancelled", now));
    }
    return;
  }

  switch (update.state) {
    case TRANSACTION_STATE_COMPLETED:
      Transition(*session, SESSION_STATUS_PAID);
      session->payment_method  = update.payment_method.empty() ? "card" : update.payment_method;
      session->payment_time_ms = util::ToUnixMillis(now);
      if (!options_.PayStation()) {
        session->exit_time_ms = util::ToUnixMillis(now);
        events.push_back(events::MakeSessionClosed(session->id, session->plate, now, FeeOf(*session), session->payment_method));
        events.push_back(events::MakeAccessGranted(session->plate, session->camera_exit_id, now, session->id));
        open_barrier = true;
      }
      break;

    case TRANSACTION_STATE_FAILED:
    case TRANSACTION_STATE_CANCELLED:
      Transition(*session, SESSION_STATUS_CANCELLED);
      session->notes = "payment " + TransactionState_Name(update.state) + (update.message.empty() ? "" : ": " + update.message);
      events.push_back(events::MakeOperatorAlert(ALERT_CODE_PAYMENT_FAILED, session->plate, session->id, session->notes, now));
      break;

    default:
      // PROCESSING: audit row only
      tx->Commit();
      return;
  }

  Save(*tx, *session);
  tx->Commit();

  observability::Metrics::Instance().RecordPayment(TransactionState_Name(update.state));
  LOTGATE_LOG_INFO("payment outcome applied", {StringField("session", session->id), StringField("plate", session->plate),
                                               StringField("state", TransactionState_Name(update.state))});

  bus_->PublishAll(events);
  if (open_barrier) {
    OpenExitBarrier(*session);
  }
}

// ------------------------------------------------------------------
// Operator operations
// ------------------------------------------------------------------

SessionRecord SessionManager::PayAtStation(const std::string& raw_plate) {
  const auto plate = model::NormalizePlate(raw_plate);
  auto       guard = locks_->Lock(plate);

  EventBatch events;
  auto       tx      = repository_->Begin();
  auto       session = repository_->FindActiveSession(*tx, plate);
  if (!session) {
    throw util::NotFound("no open session for plate " + plate);
  }
  if (session->status == SESSION_STATUS_PENDING_PAYMENT) {
    tx->Commit();
    return *session;
  }

  auto outcome = BeginExit(*tx, *session, "", util::Now(), false, events);
  tx->Commit();

  bus_->PublishAll(events);
  if (outcome == ExitOutcome::kPaymentDue) {
    RequestPayment(*session);
    return GetSession(session->id).value_or(*session);
  }
  return *session;
}

SessionRecord SessionManager::CancelSession(const std::string& session_id, const std::string& note) {
  auto guard = locks_->Lock(PlateOf(session_id));

  auto tx      = repository_->Begin();
  auto session = Load(*tx, session_id);
  if (session.status == SESSION_STATUS_CANCELLED) {
    tx->Commit();
    return session;
  }
  if (session.status == SESSION_STATUS_PAID) {
    throw util::InvalidState("session " + session_id + " is already paid");
  }

  const bool payment_outstanding = session.status == SESSION_STATUS_PENDING_PAYMENT && !session.transaction_id.empty();

  Transition(session, SESSION_STATUS_CANCELLED);
  session.notes = note.empty() ? "cancelled by operator" : note;
  Save(*tx, session);
  if (payment_outstanding) {
    RecordPayment(*tx, session, TRANSACTION_STATE_CANCELLED, "", "session cancelled");
  }
  tx->Commit();

  if (payment_outstanding) {
    processor_->Cancel(session.transaction_id);
  }
  LOTGATE_LOG_WARN("session cancelled", {StringField("session", session_id), StringField("note", session.notes)});
  bus_->Publish(events::MakeOperatorAlert(ALERT_CODE_SESSION_CANCELLED, session.plate, session.id, session.notes, util::Now()));
  return session;
}

SessionRecord SessionManager::SettleManually(const std::string& session_id, std::optional<util::Money> amount,
                                             const std::string& method) {
  auto guard = locks_->Lock(PlateOf(session_id));

  const auto now     = util::Now();
  auto       tx      = repository_->Begin();
  auto       session = Load(*tx, session_id);
  if (session.status == SESSION_STATUS_PAID) {
    tx->Commit();
    return session;
  }
  if (session.status == SESSION_STATUS_CANCELLED) {
    throw util::InvalidState("session " + session_id + " is cancelled; release the vehicle instead");
  }

  util::Money fee;
  if (amount) {
    fee = *amount;
    if (fee.currency.empty()) fee.currency = session.currency;
  } else if (session.fee_minor) {
    fee = FeeOf(session);
  } else {
    std::string error;
    auto        quote = QuoteFee(session, now, &error);
    if (!quote) {
      throw util::ConfigurationError("cannot compute fee (" + error + "); settle with an explicit amount");
    }
    fee = *quote;
  }
  if (fee.minor_units < 0) {
    throw util::InvalidState("settlement amount must not be negative");
  }

  const bool payment_outstanding = session.status == SESSION_STATUS_PENDING_PAYMENT && !session.transaction_id.empty();
  if (payment_outstanding) {
    RecordPayment(*tx, session, TRANSACTION_STATE_CANCELLED, "", "superseded by manual settlement");
  }

  Transition(session, SESSION_STATUS_PAID);
  SetFee(session, fee);
  session.payment_method  = method.empty() ? kManualMethod : method;
  session.payment_time_ms = util::ToUnixMillis(now);
  const bool leaving      = !options_.PayStation();
  if (leaving) session.exit_time_ms = util::ToUnixMillis(now);
  Save(*tx, session);
  tx->Commit();

  if (payment_outstanding) {
    processor_->Cancel(session.transaction_id);
  }
  observability::Metrics::Instance().RecordPayment("manual");
  LOTGATE_LOG_INFO("session settled manually", {StringField("session", session_id), StringField("fee", fee.ToString()),
                                                StringField("method", session.payment_method)});

  if (leaving) {
    bus_->Publish(events::MakeSessionClosed(session.id, session.plate, now, fee, session.payment_method));
    if (OpenExitBarrier(session)) {
      bus_->Publish(events::MakeAccessGranted(session.plate, ExitCamera(session), now, session.id));
    }
  }
  return session;
}

SessionRecord SessionManager::ReleaseVehicle(const std::string& session_id, const std::string& barrier_id) {
  auto guard = locks_->Lock(PlateOf(session_id));

  auto tx      = repository_->Begin();
  auto session = Load(*tx, session_id);
  if (session.status != SESSION_STATUS_CANCELLED) {
    throw util::InvalidState("only cancelled sessions can be released; session " + session_id + " is " +
                             SessionStatus_Name(session.status));
  }
  if (session.exit_time_ms != 0) {
    tx->Commit();
    return session;
  }

  std::shared_ptr<barrier::BarrierController> barrier =
      barrier_id.empty() ? barriers_->ForCamera(ExitCamera(session)) : barriers_->Get(barrier_id);
  if (!barrier) {
    throw util::NotFound("no barrier to release session " + session_id + " through");
  }
  if (barrier->State() == BARRIER_STATE_FAULT) {
    throw util::BarrierFault("barrier " + barrier->Id() + " is faulted");
  }

  const auto now       = util::Now();
  session.exit_time_ms = util::ToUnixMillis(now);
  session.notes += session.notes.empty() ? "released by operator" : "; released by operator";
  Save(*tx, session);
  tx->Commit();

  LOTGATE_LOG_WARN("vehicle released without payment", {StringField("session", session_id), StringField("barrier", barrier->Id())});
  if (barrier->RequestOpen()) {
    bus_->Publish(events::MakeAccessGranted(session.plate, session.camera_exit_id, now, session.id));
  }
  return session;
}

std::size_t SessionManager::PruneSettledPayments(util::TimePoint now) {
  return processor_->PruneFinal(now);
}

std::size_t SessionManager::ExpireStalePayments(util::TimePoint now) {
  if (options_.payment_timeout.count() <= 0) {
    return 0;
  }

  std::vector<SessionRecord> pending;
  std::size_t                open = 0;
  {
    auto tx = repository_->Begin();
    pending = repository_->ListSessionsByStatus(*tx, SESSION_STATUS_PENDING_PAYMENT);
    open    = pending.size() + repository_->ListSessionsByStatus(*tx, SESSION_STATUS_ACTIVE).size();
    tx->Commit();
  }
  observability::Metrics::Instance().SetOpenSessions(static_cast<std::int64_t>(open));

  const auto  now_ms     = util::ToUnixMillis(now);
  const auto  timeout_ms = static_cast<uint64_t>(options_.payment_timeout.count());
  std::size_t expired    = 0;

  for (const auto& candidate : pending) {
    // sessions waiting for a manual fee have nothing to time out
    if (candidate.transaction_id.empty() || candidate.payment_requested_at_ms + timeout_ms > now_ms) {
      continue;
    }

    auto guard   = locks_->Lock(candidate.plate);
    auto tx      = repository_->Begin();
    auto session = repository_->GetSession(*tx, candidate.id);
    if (!session || session->status != SESSION_STATUS_PENDING_PAYMENT || session->transaction_id != candidate.transaction_id) {
      tx->Commit();
      continue;
    }

    Transition(*session, SESSION_STATUS_CANCELLED);
    session->notes = "payment timed out";
    Save(*tx, *session);
    RecordPayment(*tx, *session, TRANSACTION_STATE_CANCELLED, "", "timeout");
    tx->Commit();

    processor_->Cancel(session->transaction_id);
    observability::Metrics::Instance().RecordPayment("timeout");
    LOTGATE_LOG_WARN("payment timed out", {StringField("session", session->id), StringField("plate", session->plate)});
    bus_->Publish(events::MakeOperatorAlert(ALERT_CODE_PAYMENT_TIMEOUT, session->plate, session->id, session->notes, now));
    ++expired;
  }
  return expired;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::optional<SessionRecord> SessionManager::GetSession(const std::string& session_id) {
  if (!util::IsCanonicalId(session_id)) return std::nullopt;

  auto tx      = repository_->Begin();
  auto session = repository_->GetSession(*tx, session_id);
  tx->Commit();
  return session;
}

std::optional<SessionRecord> SessionManager::FindOpenSession(const std::string& plate) {
  auto tx      = repository_->Begin();
  auto session = repository_->FindActiveSession(*tx, model::NormalizePlate(plate));
  tx->Commit();
  return session;
}

std::vector<SessionRecord> SessionManager::ListSessions(SessionStatus status) {
  auto tx       = repository_->Begin();
  auto sessions = repository_->ListSessionsByStatus(*tx, status);
  tx->Commit();
  return sessions;
}

} // namespace lotgate::parking
