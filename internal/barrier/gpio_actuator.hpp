#pragma once

#include <filesystem>
#include <string>

#include "actuator.hpp"

namespace lotgate::barrier {

/*
  Linux sysfs GPIO.

      <root>/export            pin number written once
      <root>/gpio<N>/direction "out" / "in"
      <root>/gpio<N>/value     "1" / "0"
*/

class GpioActuator final : public Actuator {
 public:
  GpioActuator(std::filesystem::path sysfs_root, unsigned pin);

  void Raise() override;
  void Lower() override;

 private:
  std::filesystem::path pin_dir_;
};

// Obstruction when the input pin reads high.
class GpioSafetySensor final : public SafetySensor {
 public:
  GpioSafetySensor(std::filesystem::path sysfs_root, unsigned pin);

  bool IsClear() override;

 private:
  std::filesystem::path pin_dir_;
};

} // namespace lotgate::barrier
