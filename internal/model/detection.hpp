#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace lotgate::model {

/*
  One OCR reading of a plate as delivered by a camera collaborator.
  Ephemeral: consumed by the decision path, never persisted as-is.
*/
struct PlateDetectionEvent {
  std::string     plate;
  double          confidence = 0.0;
  std::string     camera_id;
  util::TimePoint timestamp{};
  std::string     image_ref;
};

} // namespace lotgate::model
