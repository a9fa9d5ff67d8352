#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "actuator.hpp"
#include "lotgate/v1/types.pb.h"

namespace lotgate::barrier {

using lotgate::v1::BarrierState;

struct BarrierOptions {
  std::string               id;
  std::chrono::milliseconds open_time{5000};
  bool                      safety_check = true;
  // Requests while OPEN push the close deadline out.
  bool extend_on_request = true;
};

using FaultListener = std::function<void(const std::string& barrier_id, const std::string& reason)>;

/*
  Safety-interlocked barrier state machine.

      CLOSED -> OPENING -> OPEN -> (dwell) -> CLOSING -> CLOSED
      any    -> FAULT   (safety check failure or actuator error)
      FAULT  -> CLOSED  only through Reset()

  The open/dwell/close cycle runs on the controller's worker thread;
  RequestOpen() only records intent and never blocks on the actuator.

  RequestOpen() while OPENING/OPEN is coalesced. While CLOSING it is queued
  (at most one) and the barrier reopens once CLOSED.
*/
class BarrierController {
 public:
  BarrierController(BarrierOptions options, ActuatorPtr actuator, SafetySensorPtr sensor, FaultListener on_fault = {});
  ~BarrierController();

  BarrierController(const BarrierController&)            = delete;
  BarrierController& operator=(const BarrierController&) = delete;

  void Start();
  void Stop();

  // False when the barrier is in FAULT and the request was dropped.
  bool RequestOpen();

  // Operator recovery from FAULT: lowers the arm, then CLOSED.
  // Throws util::BarrierFault if the actuator fails again.
  void Reset();

  BarrierState State() const;
  bool         WaitForState(BarrierState state, std::chrono::milliseconds timeout) const;

  const std::string& Id() const {
    return options_.id;
  }

 private:
  using SteadyClock = std::chrono::steady_clock;

  void Run();
  void SetState(BarrierState state);
  void Fault(const std::string& reason, std::unique_lock<std::mutex>& lock);
  bool SensorClear(std::string& reason, std::unique_lock<std::mutex>& lock);
  bool Actuate(bool raise, std::unique_lock<std::mutex>& lock);

  BarrierOptions  options_;
  ActuatorPtr     actuator_;
  SafetySensorPtr sensor_;
  FaultListener   on_fault_;

  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  BarrierState                    state_          = lotgate::v1::BARRIER_STATE_CLOSED;
  bool                            open_requested_ = false;
  SteadyClock::time_point         close_deadline_{};
  bool                            stopping_ = false;

  std::thread thread_;
};

} // namespace lotgate::barrier
