#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "authorization_store.hpp"
#include "debounce_filter.hpp"
#include "internal/barrier/barrier_router.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/integration/access_forwarder.hpp"
#include "internal/model/detection.hpp"
#include "internal/parking/session_manager.hpp"
#include "lotgate/v1/types.pb.h"
#include "plate_lock_table.hpp"

namespace lotgate::access {

using db::model::SessionRecord;
using lotgate::v1::DecisionReason;
using lotgate::v1::Direction;
using lotgate::v1::SessionAction;

struct Decision {
  bool           grant     = false;
  DecisionReason reason    = lotgate::v1::DECISION_REASON_UNSPECIFIED;
  SessionAction  action    = lotgate::v1::SESSION_ACTION_NONE;
  Direction      direction = lotgate::v1::DIRECTION_UNSPECIFIED;
  std::string    plate;

  std::optional<SessionRecord> session;
};

lotgate::v1::Decision ToProto(const Decision& decision);

/*
  Turns admitted plate detections into access decisions.

  For one detection, under the plate's lock:

      normalize plate
      authorization lookup
      direction (operating mode, camera role, open session)
      session transition + access log        (one transaction)
      ---- commit ----
      domain events, barrier open, payment request

  In forward mode the plate skips the lookup and sessions; it is logged and
  handed to the external controller after commit.

  Detections for different plates run in parallel.
*/
class DecisionEngine {
 public:
  DecisionEngine(std::shared_ptr<DebounceFilter> debounce, std::shared_ptr<AuthorizationStore> authorizations,
                 std::shared_ptr<PlateLockTable> locks, std::shared_ptr<parking::SessionManager> sessions,
                 std::shared_ptr<barrier::BarrierRouter> barriers, std::shared_ptr<db::Repository> repository,
                 std::shared_ptr<events::EventBus> bus, integration::AccessForwarderPtr forwarder = nullptr);

  // nullopt when the debounce filter drops the detection. A stronger
  // re-read of a plate already decided inside the window is logged
  // against its session and changes nothing else.
  std::optional<Decision> Process(const model::PlateDetectionEvent& event);

  Decision Decide(const model::PlateDetectionEvent& event);

 private:
  // Work deferred until the decision's transaction has committed.
  struct AfterCommit {
    events::EventBatch                          events;
    std::shared_ptr<barrier::BarrierController> open_barrier;
    std::optional<SessionRecord>                request_payment;
    bool                                        forward = false;
  };

  struct Context {
    const model::PlateDetectionEvent&           event;
    const std::string&                          plate;
    util::TimePoint                             at;
    bool                                        authorized;
    std::shared_ptr<barrier::BarrierController> barrier;
  };

  Decision Refine(const model::PlateDetectionEvent& event);
  Decision DecideAccessControl(const Context& ctx, AfterCommit& after);
  Decision DecideForward(const Context& ctx, AfterCommit& after);
  Decision DecideParking(db::Transaction& tx, const Context& ctx, AfterCommit& after);
  Decision DecideEntry(db::Transaction& tx, const Context& ctx, AfterCommit& after);
  Decision DecideExit(db::Transaction& tx, const Context& ctx, SessionRecord& session, AfterCommit& after);
  Decision DecideUnexited(db::Transaction& tx, const Context& ctx, SessionRecord& latest, AfterCommit& after);

  // Denied decision; grants flip `grant` afterwards.
  Decision Verdict(const Context& ctx, DecisionReason reason, Direction direction) const;
  Decision Anomaly(const Context& ctx, DecisionReason reason, Direction direction, lotgate::v1::AlertCode code,
                   const std::string& message, AfterCommit& after) const;
  bool     BarrierFaulted(const Context& ctx) const;
  // From the camera role alone; unspecified for bidirectional cameras.
  Direction CameraDirection(const Context& ctx) const;

  void WriteAccessLog(db::Transaction& tx, const Context& ctx, const Decision& decision);
  void Finish(const Context& ctx, Decision& decision, AfterCommit& after);

  std::shared_ptr<DebounceFilter>          debounce_;
  std::shared_ptr<AuthorizationStore>      authorizations_;
  std::shared_ptr<PlateLockTable>          locks_;
  std::shared_ptr<parking::SessionManager> sessions_;
  std::shared_ptr<barrier::BarrierRouter>  barriers_;
  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<events::EventBus>        bus_;
  integration::AccessForwarderPtr          forwarder_;

  std::atomic<uint64_t> decisions_{0};
};

} // namespace lotgate::access
