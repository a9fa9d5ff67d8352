#include "time.hpp"

namespace lotgate::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  const auto nanos = std::chrono::floor<std::chrono::nanoseconds>(tp.time_since_epoch());
  const auto whole = std::chrono::floor<std::chrono::seconds>(nanos);

  google::protobuf::Timestamp ts;
  ts.set_seconds(whole.count());
  ts.set_nanos(static_cast<int32_t>((nanos - whole).count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  const auto since_epoch = std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos());
  return TimePoint(std::chrono::duration_cast<Clock::duration>(since_epoch));
}

uint64_t ToUnixMillis(TimePoint tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint(std::chrono::milliseconds(static_cast<int64_t>(ms)));
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  if (d.seconds() == 0 && d.nanos() == 0) return fallback;
  return std::chrono::seconds(d.seconds()) + std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(d.nanos()));
}

LocalClock ToLocalClock(TimePoint tp, int32_t utc_offset_minutes) {
  const auto local = std::chrono::floor<std::chrono::minutes>(tp) + std::chrono::minutes(utc_offset_minutes);
  const auto day   = std::chrono::floor<std::chrono::days>(local);
  return LocalClock{
      .weekday       = std::chrono::weekday(day).iso_encoding() - 1,
      .minute_of_day = static_cast<int>((local - day).count()),
  };
}

std::optional<int> ParseClockTime(const std::string& text) {
  if (text.size() != 5 || text[2] != ':') return std::nullopt;
  for (size_t i : {0u, 1u, 3u, 4u}) {
    if (text[i] < '0' || text[i] > '9') return std::nullopt;
  }
  const int hours   = (text[0] - '0') * 10 + (text[1] - '0');
  const int minutes = (text[3] - '0') * 10 + (text[4] - '0');
  if (hours > 23 || minutes > 59) return std::nullopt;
  return hours * 60 + minutes;
}

} // namespace lotgate::util
