#include "simulated_actuator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace lotgate::barrier {

using observability::StringField;

SimulatedActuator::SimulatedActuator(std::string barrier_id) : barrier_id_(std::move(barrier_id)) {
}

void SimulatedActuator::Raise() {
  if (fail_next_.exchange(false)) {
    throw util::BarrierFault("simulated actuator failure on raise");
  }
  ++raises_;
  LOTGATE_LOG_INFO("barrier raise (simulated)", {StringField("barrier", barrier_id_)});
}

void SimulatedActuator::Lower() {
  if (fail_next_.exchange(false)) {
    throw util::BarrierFault("simulated actuator failure on lower");
  }
  ++lowers_;
  LOTGATE_LOG_INFO("barrier lower (simulated)", {StringField("barrier", barrier_id_)});
}

} // namespace lotgate::barrier
