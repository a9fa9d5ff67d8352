#include "internal/access/debounce_filter.hpp"

#include "internal/model/plate.hpp"
#include "internal/observability/logging.hpp"

namespace lotgate::access {

using observability::StringField;
using observability::DoubleField;

DebounceFilter::DebounceFilter(DebounceOptions options) : options_(options) {
}

std::string DebounceFilter::Key(const model::PlateDetectionEvent& event) const {
  auto plate = model::NormalizePlate(event.plate);
  if (!options_.per_camera) {
    return plate;
  }
  return event.camera_id + "/" + plate;
}

Admission DebounceFilter::Admit(const model::PlateDetectionEvent& event) {
  if (event.confidence < options_.confidence_threshold) {
    LOTGATE_LOG_DEBUG("detection below confidence threshold",
                      {StringField("plate", event.plate), StringField("camera", event.camera_id),
                       DoubleField("confidence", event.confidence)});
    return Admission::kRejected;
  }

  const auto key = Key(event);

  std::lock_guard<std::mutex> lock(mutex_);
  auto admission = Admission::kAdmitted;
  auto it        = last_admitted_.find(key);
  if (it != last_admitted_.end()) {
    const auto& last = it->second;
    const bool  in_window =
        event.timestamp >= last.timestamp && event.timestamp - last.timestamp < options_.window;
    if (in_window && event.confidence <= last.confidence) {
      LOTGATE_LOG_DEBUG("detection debounced", {StringField("plate", event.plate), StringField("camera", event.camera_id)});
      return Admission::kRejected;
    }
    if (in_window) {
      admission = Admission::kRefined;
    }
  }

  last_admitted_[key] = Entry{event.timestamp, event.confidence};
  return admission;
}

void DebounceFilter::Prune(util::TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::erase_if(last_admitted_, [&](const auto& item) { return now - item.second.timestamp >= options_.window; });
}

std::size_t DebounceFilter::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_admitted_.size();
}

} // namespace lotgate::access
