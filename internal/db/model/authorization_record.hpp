#pragma once

#include <cstdint>
#include <string>

namespace lotgate::db::model {

struct AuthorizationRecord {
  std::string plate;  // normalized
  std::string owner;
  std::string vehicle_type;
  bool        authorized = true;

  // 0 = open-ended
  uint64_t valid_from_ms  = 0;
  uint64_t valid_until_ms = 0;

  uint64_t updated_at_ms = 0;
};

}
