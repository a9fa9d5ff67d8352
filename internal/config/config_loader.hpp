#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"

namespace lotgate::config {

// YAML -> RuntimeConfig through the protobuf JSON mapping, so enum names
// and "90s" style durations follow the proto schema and unknown keys fail.
// Every failure surfaces as util::ConfigurationError.
class ConfigLoader {
 public:
  static lotgate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static lotgate::runtime::config::RuntimeConfig FromYaml(const std::string& text);

  // Cross-field checks: barrier and camera references, camera roles for the
  // entry/exit mode, fee policy completeness when fees can be charged.
  static void Validate(const lotgate::runtime::config::RuntimeConfig& config);

  // recognition.debounce_window, or 10 x processing_interval (0.5s default).
  static std::chrono::milliseconds DebounceWindow(const lotgate::runtime::config::RecognitionConfig& recognition);
};

} // namespace lotgate::config
