#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace lotgate::util {

// Wall clock used for detections, sessions and the access log. Stored
// timestamps are unix milliseconds.
using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Unset durations read as `fallback`.
std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback = {});

// Instant as seen on the lot's local clock.
struct LocalClock {
  unsigned weekday;       // 0 = Monday .. 6 = Sunday
  int      minute_of_day;
};

LocalClock ToLocalClock(TimePoint tp, int32_t utc_offset_minutes);

// "HH:MM" to minutes since midnight; nullopt when malformed.
std::optional<int> ParseClockTime(const std::string& text);

} // namespace lotgate::util
