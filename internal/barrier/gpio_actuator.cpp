#include "gpio_actuator.hpp"

#include <fstream>

#include "internal/util/errors.hpp"

namespace lotgate::barrier {
namespace {

void WriteFile(const std::filesystem::path& path, const std::string& value) {
  std::ofstream out(path);
  if (!out) {
    throw util::BarrierFault("gpio: cannot open " + path.string());
  }
  out << value;
  out.flush();
  if (!out) {
    throw util::BarrierFault("gpio: write failed on " + path.string());
  }
}

std::filesystem::path ExportPin(const std::filesystem::path& root, unsigned pin, const std::string& direction) {
  auto pin_dir = root / ("gpio" + std::to_string(pin));
  if (!std::filesystem::exists(pin_dir)) {
    WriteFile(root / "export", std::to_string(pin));
  }
  WriteFile(pin_dir / "direction", direction);
  return pin_dir;
}

} // namespace

GpioActuator::GpioActuator(std::filesystem::path sysfs_root, unsigned pin) : pin_dir_(ExportPin(sysfs_root, pin, "out")) {
}

void GpioActuator::Raise() {
  WriteFile(pin_dir_ / "value", "1");
}

void GpioActuator::Lower() {
  WriteFile(pin_dir_ / "value", "0");
}

GpioSafetySensor::GpioSafetySensor(std::filesystem::path sysfs_root, unsigned pin) : pin_dir_(ExportPin(sysfs_root, pin, "in")) {
}

bool GpioSafetySensor::IsClear() {
  std::ifstream in(pin_dir_ / "value");
  char          level = 0;
  if (!in || !(in >> level)) {
    throw util::BarrierFault("gpio: cannot read " + (pin_dir_ / "value").string());
  }
  return level == '0';
}

} // namespace lotgate::barrier
