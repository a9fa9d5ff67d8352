#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/model/detection.hpp"

namespace lotgate::access {

struct DebounceOptions {
  // Detections below this are noise and never admitted.
  double                    confidence_threshold = 0.0;
  std::chrono::milliseconds window{5000};
  // Keyed by (camera, plate) instead of plate alone.
  bool per_camera = false;
};

/*
  Drops repeated readings of the same plate.

  A detection is admitted when nothing was admitted for its key inside the
  cool-down window, or when its confidence is strictly higher than the one
  admitted inside the window. Backward timestamps are admitted.

  Admitted detections replace the stored entry; rejected ones leave it
  untouched. A higher-confidence reading inside the window is reported as
  kRefined: it corrects the earlier reading and must not act on its own.
*/
enum class Admission {
  kRejected,
  kAdmitted,
  kRefined,
};

class DebounceFilter {
 public:
  explicit DebounceFilter(DebounceOptions options);

  Admission Admit(const model::PlateDetectionEvent& event);

  // Drop entries whose window has passed at `now`.
  void Prune(util::TimePoint now);

  std::size_t Size() const;

 private:
  struct Entry {
    util::TimePoint timestamp;
    double          confidence;
  };

  std::string Key(const model::PlateDetectionEvent& event) const;

  DebounceOptions options_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> last_admitted_;
};

} // namespace lotgate::access
