#pragma once

#include <atomic>
#include <string>

#include "actuator.hpp"

namespace lotgate::barrier {

// Logs motion commands instead of driving hardware.
class SimulatedActuator final : public Actuator {
 public:
  explicit SimulatedActuator(std::string barrier_id);

  void Raise() override;
  void Lower() override;

  int RaiseCount() const {
    return raises_.load();
  }
  int LowerCount() const {
    return lowers_.load();
  }

  // Next Raise()/Lower() throws.
  void FailNext(bool fail) {
    fail_next_ = fail;
  }

 private:
  std::string       barrier_id_;
  std::atomic<int>  raises_{0};
  std::atomic<int>  lowers_{0};
  std::atomic<bool> fail_next_{false};
};

class AlwaysClearSensor final : public SafetySensor {
 public:
  bool IsClear() override {
    return true;
  }
};

// Sensor whose reading is set by the caller. Used in simulation and tests.
class ManualSafetySensor final : public SafetySensor {
 public:
  bool IsClear() override {
    return clear_.load();
  }

  void SetClear(bool clear) {
    clear_ = clear;
  }

 private:
  std::atomic<bool> clear_{true};
};

} // namespace lotgate::barrier
