#include "barrier_factory.hpp"

#include "gpio_actuator.hpp"
#include "internal/util/time.hpp"
#include "simulated_actuator.hpp"

namespace lotgate::barrier {

BarrierFactory::BarrierMap BarrierFactory::Build(
    const google::protobuf::RepeatedPtrField<lotgate::runtime::config::BarrierConfig>& configs, const FaultListener& on_fault) {
  BarrierMap barriers;

  for (const auto& cfg : configs) {
    BarrierOptions options{
        .id                = cfg.id(),
        .open_time         = util::ToMillis(cfg.open_time(), std::chrono::milliseconds(5000)),
        .safety_check      = cfg.safety_check(),
        .extend_on_request = cfg.coalesce() != lotgate::runtime::config::COALESCE_MODE_IGNORE,
    };

    const std::string sysfs_root = cfg.gpio().sysfs_root().empty() ? "/sys/class/gpio" : cfg.gpio().sysfs_root();

    ActuatorPtr actuator;
    if (cfg.gpio().output_pin() != 0) {
      actuator = std::make_shared<GpioActuator>(sysfs_root, cfg.gpio().output_pin());
    } else {
      actuator = std::make_shared<SimulatedActuator>(cfg.id());
    }

    SafetySensorPtr sensor;
    if (cfg.gpio().sensor_pin() != 0) {
      sensor = std::make_shared<GpioSafetySensor>(sysfs_root, cfg.gpio().sensor_pin());
    } else {
      sensor = std::make_shared<AlwaysClearSensor>();
    }

    barriers.emplace(cfg.id(), std::make_shared<BarrierController>(std::move(options), std::move(actuator), std::move(sensor), on_fault));
  }

  return barriers;
}

} // namespace lotgate::barrier
