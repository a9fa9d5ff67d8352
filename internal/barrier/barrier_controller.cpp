#include "barrier_controller.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace lotgate::barrier {

using observability::StringField;
using namespace lotgate::v1;

BarrierController::BarrierController(BarrierOptions options, ActuatorPtr actuator, SafetySensorPtr sensor, FaultListener on_fault)
    : options_(std::move(options)), actuator_(std::move(actuator)), sensor_(std::move(sensor)), on_fault_(std::move(on_fault)) {
}

BarrierController::~BarrierController() {
  Stop();
}

void BarrierController::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_   = std::thread(&BarrierController::Run, this);
}

void BarrierController::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool BarrierController::RequestOpen() {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (state_) {
    case BARRIER_STATE_CLOSED:
    case BARRIER_STATE_CLOSING:
      open_requested_ = true;
      cv_.notify_all();
      return true;
    case BARRIER_STATE_OPEN:
      if (options_.extend_on_request) {
        close_deadline_ = SteadyClock::now() + options_.open_time;
        cv_.notify_all();
      }
      return true;
    case BARRIER_STATE_OPENING:
      return true;
    default:
      LOTGATE_LOG_WARN("barrier open request ignored while faulted", {StringField("barrier", options_.id)});
      return false;
  }
}

void BarrierController::Reset() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (state_ != BARRIER_STATE_FAULT) {
    return;
  }

  lock.unlock();
  actuator_->Lower();
  lock.lock();

  open_requested_ = false;
  SetState(BARRIER_STATE_CLOSED);
  LOTGATE_LOG_INFO("barrier reset", {StringField("barrier", options_.id)});
}

BarrierState BarrierController::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool BarrierController::WaitForState(BarrierState state, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return state_ == state; });
}

void BarrierController::SetState(BarrierState state) {
  state_ = state;
  observability::Metrics::Instance().RecordBarrierState(options_.id, BarrierState_Name(state));
  cv_.notify_all();
}

void BarrierController::Fault(const std::string& reason, std::unique_lock<std::mutex>& lock) {
  open_requested_ = false;
  SetState(BARRIER_STATE_FAULT);

  lock.unlock();
  LOTGATE_LOG_ERROR("barrier fault", {StringField("barrier", options_.id), StringField("reason", reason)});
  if (on_fault_) {
    on_fault_(options_.id, reason);
  }
  lock.lock();
}

bool BarrierController::SensorClear(std::string& reason, std::unique_lock<std::mutex>& lock) {
  if (!options_.safety_check) {
    return true;
  }

  lock.unlock();
  bool clear = false;
  try {
    clear = sensor_->IsClear();
    if (!clear) reason = "safety sensor reports obstruction";
  } catch (const std::exception& e) {
    reason = std::string("safety sensor unreadable: ") + e.what();
  }
  lock.lock();
  return clear;
}

bool BarrierController::Actuate(bool raise, std::unique_lock<std::mutex>& lock) {
  lock.unlock();
  std::string error;
  try {
    raise ? actuator_->Raise() : actuator_->Lower();
  } catch (const std::exception& e) {
    error = e.what();
  }
  lock.lock();

  if (!error.empty()) {
    Fault(std::string(raise ? "actuator raise failed: " : "actuator lower failed: ") + error, lock);
    return false;
  }
  return true;
}

void BarrierController::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [&] { return stopping_ || (state_ == BARRIER_STATE_CLOSED && open_requested_); });
    if (stopping_) {
      return;
    }
    open_requested_ = false;

    // OPENING before the check so concurrent requests coalesce into this cycle
    SetState(BARRIER_STATE_OPENING);
    std::string reason;
    if (!SensorClear(reason, lock)) {
      Fault(reason, lock);
      continue;
    }
    if (!Actuate(true, lock)) {
      continue;
    }
    SetState(BARRIER_STATE_OPEN);
    close_deadline_ = SteadyClock::now() + options_.open_time;

    // dwell; RequestOpen() may move the deadline
    while (!stopping_) {
      auto deadline = close_deadline_;
      if (SteadyClock::now() >= deadline) break;
      cv_.wait_until(lock, deadline);
    }
    if (stopping_) {
      return;
    }

    SetState(BARRIER_STATE_CLOSING);
    if (!SensorClear(reason, lock)) {
      // arm stays raised
      Fault(reason, lock);
      continue;
    }
    if (!Actuate(false, lock)) {
      continue;
    }
    SetState(BARRIER_STATE_CLOSED);
  }
}

} // namespace lotgate::barrier
