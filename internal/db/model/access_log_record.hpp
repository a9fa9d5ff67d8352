#pragma once

#include <cstdint>
#include <string>

#include "lotgate/v1/types.pb.h"

namespace lotgate::db::model {

/*
  One decision of the access pipeline. Written in the same transaction
  as the session change the decision caused.
*/

struct AccessLogRecord {
  uint64_t    id = 0;
  std::string plate;
  std::string camera_id;
  uint64_t    timestamp_ms = 0;

  lotgate::v1::Direction      direction = lotgate::v1::DIRECTION_UNSPECIFIED;
  bool                        granted   = false;
  lotgate::v1::DecisionReason reason    = lotgate::v1::DECISION_REASON_UNSPECIFIED;

  double      confidence = 0.0;
  std::string image_ref;
  std::string session_id;
};

}
