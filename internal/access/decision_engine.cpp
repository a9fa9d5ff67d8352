#include "decision_engine.hpp"

#include <chrono>

#include "internal/db/api/db_errors.hpp"
#include "internal/events/domain_events.hpp"
#include "internal/model/convert.hpp"
#include "internal/model/plate.hpp"
#include "internal/model/session_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace lotgate::access {

using namespace lotgate::v1;
using observability::BoolField;
using observability::StringField;
using parking::ExitOutcome;

namespace {

// Debounce and lock-table housekeeping cadence, in decisions.
constexpr uint64_t kPruneEvery = 256;

} // namespace

lotgate::v1::Decision ToProto(const Decision& decision) {
  lotgate::v1::Decision out;
  out.set_grant(decision.grant);
  out.set_reason(decision.reason);
  out.set_session_action(decision.action);
  out.set_direction(decision.direction);
  out.set_plate(decision.plate);
  if (decision.session) {
    *out.mutable_session() = model::ToProto(*decision.session);
  }
  return out;
}

DecisionEngine::DecisionEngine(std::shared_ptr<DebounceFilter> debounce, std::shared_ptr<AuthorizationStore> authorizations,
                               std::shared_ptr<PlateLockTable> locks, std::shared_ptr<parking::SessionManager> sessions,
                               std::shared_ptr<barrier::BarrierRouter> barriers, std::shared_ptr<db::Repository> repository,
                               std::shared_ptr<events::EventBus> bus, integration::AccessForwarderPtr forwarder)
    : debounce_(std::move(debounce)),
      authorizations_(std::move(authorizations)),
      locks_(std::move(locks)),
      sessions_(std::move(sessions)),
      barriers_(std::move(barriers)),
      repository_(std::move(repository)),
      bus_(std::move(bus)),
      forwarder_(std::move(forwarder)) {
}

std::optional<Decision> DecisionEngine::Process(const model::PlateDetectionEvent& event) {
  const auto admission = debounce_->Admit(event);
  if (admission == Admission::kRejected) {
    return std::nullopt;
  }

  auto decision = admission == Admission::kRefined ? Refine(event) : Decide(event);

  if (++decisions_ % kPruneEvery == 0) {
    debounce_->Prune(util::Now());
    locks_->Prune();
  }
  return decision;
}

Decision DecisionEngine::Decide(const model::PlateDetectionEvent& event) {
  const auto started = std::chrono::steady_clock::now();
  const auto plate   = model::NormalizePlate(event.plate);
  const auto at      = event.timestamp == util::TimePoint{} ? util::Now() : event.timestamp;

  if (plate.empty()) {
    Context     ctx{event, plate, at, false, nullptr};
    AfterCommit after;
    auto        decision = Verdict(ctx, DECISION_REASON_INVALID_PLATE, DIRECTION_UNSPECIFIED);
    auto        tx       = repository_->Begin();
    WriteAccessLog(*tx, ctx, decision);
    tx->Commit();
    Finish(ctx, decision, after);
    return decision;
  }

  auto guard = locks_->Lock(plate);

  const auto mode       = sessions_->Options().operating_mode;
  const bool authorized = mode != parking::cfg::OPERATING_MODE_FORWARD && IsAuthorized(authorizations_->Lookup(plate), at);
  Context    ctx{event, plate, at, authorized, barriers_->ForCamera(event.camera_id)};

  AfterCommit after;
  Decision    decision;
  try {
    auto tx = repository_->Begin();
    switch (mode) {
      case parking::cfg::OPERATING_MODE_ACCESS_CONTROL:
        decision = DecideAccessControl(ctx, after);
        break;
      case parking::cfg::OPERATING_MODE_FORWARD:
        decision = DecideForward(ctx, after);
        break;
      default:
        decision = DecideParking(*tx, ctx, after);
        break;
    }
    WriteAccessLog(*tx, ctx, decision);
    tx->Commit();
  } catch (const util::SessionConflict& e) {
    // the open-session index caught what the session lookup did not
    LOTGATE_LOG_WARN("session conflict", {StringField("plate", plate), StringField("error", e.what())});
    after    = AfterCommit{};
    decision = Verdict(ctx, DECISION_REASON_SESSION_CONFLICT, DIRECTION_ENTRY);
    auto tx  = repository_->Begin();
    WriteAccessLog(*tx, ctx, decision);
    tx->Commit();
  }

  Finish(ctx, decision, after);

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);
  observability::Metrics::Instance().ObserveDecisionLatencyMs(elapsed.count());
  return decision;
}

Decision DecisionEngine::Refine(const model::PlateDetectionEvent& event) {
  const auto plate = model::NormalizePlate(event.plate);
  const auto at    = event.timestamp == util::TimePoint{} ? util::Now() : event.timestamp;

  auto    guard = locks_->Lock(plate);
  Context ctx{event, plate, at, false, nullptr};

  auto tx      = repository_->Begin();
  auto session = repository_->FindActiveSession(*tx, plate);

  Direction direction = DIRECTION_UNSPECIFIED;
  if (session) {
    direction = session->status == SESSION_STATUS_PENDING_PAYMENT ? DIRECTION_EXIT : DIRECTION_ENTRY;
  } else if ((session = repository_->FindLatestSession(*tx, plate)) && session->exit_time_ms != 0) {
    direction = DIRECTION_EXIT;
  }

  auto decision    = Verdict(ctx, DECISION_REASON_DUPLICATE_EVENT, direction);
  decision.session = session;
  WriteAccessLog(*tx, ctx, decision);
  tx->Commit();

  observability::Metrics::Instance().RecordDecision(Direction_Name(direction), DecisionReason_Name(decision.reason), false);
  LOTGATE_LOG_INFO("stronger reading refines earlier detection",
                   {StringField("plate", plate), StringField("camera", event.camera_id),
                    observability::DoubleField("confidence", event.confidence)});
  return decision;
}

// ------------------------------------------------------------------
// Modes
// ------------------------------------------------------------------

Decision DecisionEngine::DecideAccessControl(const Context& ctx, AfterCommit& after) {
  const auto direction = CameraDirection(ctx);

  if (!ctx.authorized) {
    return Verdict(ctx, DECISION_REASON_UNAUTHORIZED, direction);
  }
  if (BarrierFaulted(ctx)) {
    return Verdict(ctx, DECISION_REASON_BARRIER_FAULT, direction);
  }

  Decision decision  = Verdict(ctx, DECISION_REASON_AUTHORIZED, direction);
  decision.grant     = true;
  after.open_barrier = ctx.barrier;
  return decision;
}

Decision DecisionEngine::DecideForward(const Context& ctx, AfterCommit& after) {
  after.forward = true;
  return Verdict(ctx, DECISION_REASON_FORWARDED, CameraDirection(ctx));
}

Decision DecisionEngine::DecideParking(db::Transaction& tx, const Context& ctx, AfterCommit& after) {
  const auto& options = sessions_->Options();
  const auto  at_ms   = util::ToUnixMillis(ctx.at);
  auto        open    = repository_->FindActiveSession(tx, ctx.plate);

  Direction direction = open ? DIRECTION_EXIT : DIRECTION_ENTRY;
  if (options.DualCamera()) {
    auto camera = barriers_->FindCamera(ctx.event.camera_id);
    switch (camera ? camera->role() : parking::cfg::CAMERA_ROLE_UNSPECIFIED) {
      case parking::cfg::CAMERA_ROLE_ENTRY:
        direction = DIRECTION_ENTRY;
        break;
      case parking::cfg::CAMERA_ROLE_EXIT:
        direction = DIRECTION_EXIT;
        break;
      case parking::cfg::CAMERA_ROLE_BIDIRECTIONAL:
        break;
      default:
        return Anomaly(ctx, DECISION_REASON_UNKNOWN_CAMERA, DIRECTION_UNSPECIFIED, ALERT_CODE_UNKNOWN_CAMERA,
                       "detection from camera '" + ctx.event.camera_id + "' without a configured role", after);
    }
  }

  if (open && at_ms <= open->entry_time_ms) {
    auto decision    = Verdict(ctx, DECISION_REASON_DUPLICATE_EVENT, direction);
    decision.session = open;
    return decision;
  }

  if (!open) {
    auto latest = repository_->FindLatestSession(tx, ctx.plate);
    if (latest && latest->exit_time_ms != 0 && at_ms <= latest->exit_time_ms) {
      auto decision    = Verdict(ctx, DECISION_REASON_DUPLICATE_EVENT, direction);
      decision.session = latest;
      return decision;
    }
    // a single camera cannot tell a returning vehicle from one still inside
    if (latest && latest->exit_time_ms == 0 && model::IsTerminal(latest->status) &&
        (!options.DualCamera() || direction == DIRECTION_EXIT)) {
      return DecideUnexited(tx, ctx, *latest, after);
    }
  }

  if (options.DualCamera()) {
    if (direction == DIRECTION_ENTRY && open) {
      auto decision = Anomaly(ctx, DECISION_REASON_SESSION_CONFLICT, direction, ALERT_CODE_SESSION_CONFLICT,
                              "entry detected while session " + open->id + " is open", after);
      decision.session = open;
      return decision;
    }
    if (direction == DIRECTION_EXIT && !open) {
      return Anomaly(ctx, DECISION_REASON_EXIT_WITHOUT_SESSION, direction, ALERT_CODE_EXIT_WITHOUT_SESSION,
                     "exit detected without an open session", after);
    }
  }

  if (direction == DIRECTION_EXIT) {
    return DecideExit(tx, ctx, *open, after);
  }
  return DecideEntry(tx, ctx, after);
}

// ------------------------------------------------------------------
// Directions
// ------------------------------------------------------------------

Decision DecisionEngine::DecideEntry(db::Transaction& tx, const Context& ctx, AfterCommit& after) {
  if (sessions_->Options().access_policy == parking::cfg::ACCESS_POLICY_AUTHORIZED_ONLY && !ctx.authorized) {
    return Verdict(ctx, DECISION_REASON_UNAUTHORIZED, DIRECTION_ENTRY);
  }
  if (BarrierFaulted(ctx)) {
    return Verdict(ctx, DECISION_REASON_BARRIER_FAULT, DIRECTION_ENTRY);
  }

  auto session =
      sessions_->OpenSession(tx, ctx.plate, ctx.event.camera_id, ctx.at, !ctx.authorized, after.events);

  Decision decision  = Verdict(ctx, ctx.authorized ? DECISION_REASON_AUTHORIZED : DECISION_REASON_VISITOR, DIRECTION_ENTRY);
  decision.grant     = true;
  decision.action    = SESSION_ACTION_OPEN_SESSION;
  decision.session   = std::move(session);
  after.open_barrier = ctx.barrier;
  return decision;
}

Decision DecisionEngine::DecideExit(db::Transaction& tx, const Context& ctx, SessionRecord& session, AfterCommit& after) {
  if (session.status == SESSION_STATUS_PENDING_PAYMENT) {
    auto decision    = Verdict(ctx, DECISION_REASON_PAYMENT_PENDING, DIRECTION_EXIT);
    decision.session = session;
    return decision;
  }
  if (BarrierFaulted(ctx)) {
    auto decision    = Verdict(ctx, DECISION_REASON_BARRIER_FAULT, DIRECTION_EXIT);
    decision.session = session;
    return decision;
  }

  const auto& options = sessions_->Options();
  if (options.PayStation()) {
    auto fee = sessions_->QuoteFee(session, ctx.at);
    if (!fee || !fee->IsZero()) {
      auto decision    = Verdict(ctx, DECISION_REASON_PAYMENT_REQUIRED, DIRECTION_EXIT);
      decision.session = session;
      return decision;
    }
  }

  auto outcome = sessions_->BeginExit(tx, session, ctx.event.camera_id, ctx.at, true, after.events);

  Decision decision = Verdict(ctx, DECISION_REASON_PAYMENT_REQUIRED, DIRECTION_EXIT);
  switch (outcome) {
    case ExitOutcome::kClosed:
      decision.grant     = true;
      decision.reason    = DECISION_REASON_EXIT_FREE;
      decision.action    = SESSION_ACTION_CLOSE_SESSION;
      after.open_barrier = ctx.barrier;
      break;
    case ExitOutcome::kPaymentDue:
      after.request_payment = session;
      break;
    case ExitOutcome::kManualFee:
      break;
  }
  decision.session = session;
  return decision;
}

Decision DecisionEngine::DecideUnexited(db::Transaction& tx, const Context& ctx, SessionRecord& latest, AfterCommit& after) {
  const auto& options = sessions_->Options();
  const auto  at_ms   = util::ToUnixMillis(ctx.at);

  if (latest.status == SESSION_STATUS_PAID && options.PayStation()) {
    const auto window_ms = static_cast<uint64_t>(options.paid_exit_window.count());
    if (at_ms <= latest.payment_time_ms + window_ms) {
      if (BarrierFaulted(ctx)) {
        auto decision    = Verdict(ctx, DECISION_REASON_BARRIER_FAULT, DIRECTION_EXIT);
        decision.session = latest;
        return decision;
      }
      sessions_->RecordPaidExit(tx, latest, ctx.event.camera_id, ctx.at, after.events);

      Decision decision  = Verdict(ctx, DECISION_REASON_EXIT_PAID, DIRECTION_EXIT);
      decision.grant     = true;
      decision.action    = SESSION_ACTION_CLOSE_SESSION;
      decision.session   = latest;
      after.open_barrier = ctx.barrier;
      return decision;
    }
  }

  const std::string message = latest.status == SESSION_STATUS_PAID
                                  ? "paid at station but the exit window has passed"
                                  : "session " + latest.id + " was cancelled and the vehicle never left";
  LOTGATE_LOG_WARN("unresolved exit", {StringField("plate", ctx.plate), StringField("session", latest.id),
                                       StringField("status", SessionStatus_Name(latest.status))});
  after.events.push_back(events::MakeOperatorAlert(ALERT_CODE_UNRESOLVED_EXIT, ctx.plate, latest.id, message, ctx.at));

  auto decision    = Verdict(ctx, DECISION_REASON_MANUAL_REVIEW, DIRECTION_EXIT);
  decision.session = latest;
  return decision;
}

// ------------------------------------------------------------------
// Helpers
// ------------------------------------------------------------------

Decision DecisionEngine::Verdict(const Context& ctx, DecisionReason reason, Direction direction) const {
  Decision decision;
  decision.reason    = reason;
  decision.direction = direction;
  decision.plate     = ctx.plate;
  return decision;
}

Decision DecisionEngine::Anomaly(const Context& ctx, DecisionReason reason, Direction direction, AlertCode code,
                                 const std::string& message, AfterCommit& after) const {
  LOTGATE_LOG_WARN("detection anomaly", {StringField("plate", ctx.plate), StringField("camera", ctx.event.camera_id),
                                         StringField("reason", DecisionReason_Name(reason))});
  if (sessions_->Options().ManualReview()) {
    after.events.push_back(events::MakeOperatorAlert(code, ctx.plate, "", message, ctx.at));
  }
  return Verdict(ctx, reason, direction);
}

bool DecisionEngine::BarrierFaulted(const Context& ctx) const {
  return ctx.barrier && ctx.barrier->State() == BARRIER_STATE_FAULT;
}

Direction DecisionEngine::CameraDirection(const Context& ctx) const {
  if (auto camera = barriers_->FindCamera(ctx.event.camera_id)) {
    if (camera->role() == parking::cfg::CAMERA_ROLE_ENTRY) return DIRECTION_ENTRY;
    if (camera->role() == parking::cfg::CAMERA_ROLE_EXIT) return DIRECTION_EXIT;
  }
  return DIRECTION_UNSPECIFIED;
}

void DecisionEngine::WriteAccessLog(db::Transaction& tx, const Context& ctx, const Decision& decision) {
  db::model::AccessLogRecord record;
  record.plate        = ctx.plate.empty() ? ctx.event.plate : ctx.plate;
  record.camera_id    = ctx.event.camera_id;
  record.timestamp_ms = util::ToUnixMillis(ctx.at);
  record.direction    = decision.direction;
  record.granted      = decision.grant;
  record.reason       = decision.reason;
  record.confidence   = ctx.event.confidence;
  record.image_ref    = ctx.event.image_ref;
  if (decision.session) record.session_id = decision.session->id;

  db::ThrowIfDbError(repository_->InsertAccessLog(tx, record), "access log for " + record.plate);
}

void DecisionEngine::Finish(const Context& ctx, Decision& decision, AfterCommit& after) {
  bus_->PublishAll(after.events);

  const std::string session_id = decision.session ? decision.session->id : "";
  if (decision.grant) {
    bus_->Publish(events::MakeAccessGranted(ctx.plate, ctx.event.camera_id, ctx.at, session_id));
  } else if (!after.forward) {
    bus_->Publish(events::MakeAccessDenied(decision.plate, ctx.event.camera_id, decision.reason, ctx.at));
  }

  if (after.forward) {
    if (!forwarder_) {
      LOTGATE_LOG_ERROR("forward mode without an access forwarder", {StringField("plate", ctx.plate)});
    } else {
      try {
        forwarder_->Forward(ctx.plate);
      } catch (const util::BarrierFault& e) {
        LOTGATE_LOG_ERROR("plate forwarding failed", {StringField("plate", ctx.plate), StringField("error", e.what())});
      }
    }
  }

  if (after.open_barrier && !after.open_barrier->RequestOpen()) {
    LOTGATE_LOG_ERROR("barrier refused open request",
                      {StringField("barrier", after.open_barrier->Id()), StringField("plate", ctx.plate)});
  } else if (decision.grant && !after.open_barrier) {
    LOTGATE_LOG_WARN("no barrier serves camera", {StringField("camera", ctx.event.camera_id)});
  }

  if (after.request_payment) {
    sessions_->RequestPayment(*after.request_payment);
    decision.session = sessions_->GetSession(after.request_payment->id);
  }

  observability::Metrics::Instance().RecordDecision(Direction_Name(decision.direction), DecisionReason_Name(decision.reason), decision.grant);
  LOTGATE_LOG_INFO("access decision",
                   {StringField("plate", decision.plate), StringField("camera", ctx.event.camera_id),
                    StringField("direction", Direction_Name(decision.direction)), BoolField("grant", decision.grant),
                    StringField("reason", DecisionReason_Name(decision.reason))});
}

} // namespace lotgate::access
