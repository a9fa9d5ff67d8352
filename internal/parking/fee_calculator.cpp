#include "internal/parking/fee_calculator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace lotgate::parking {
namespace {

using lotgate::runtime::config::FeeTier;
using lotgate::runtime::config::SpecialRate;

constexpr int64_t kMillisPerHour = 3600LL * 1000LL;
constexpr int32_t kMaxUtcOffset  = 14 * 60;

void RequireNonNegative(double amount, const std::string& what) {
  // rejects NaN as well
  if (!(amount >= 0.0)) {
    throw util::ConfigurationError("fee policy: " + what + " must be non-negative");
  }
}

int64_t Minor(double amount) {
  return static_cast<int64_t>(std::llround(amount * 100.0));
}

bool Matches(const SpecialRate& rate, const util::LocalClock& entry, const util::LocalClock& exit) {
  if (rate.days_size() > 0 &&
      std::find(rate.days().begin(), rate.days().end(), entry.weekday) == rate.days().end()) {
    return false;
  }
  if (!rate.entry_after().empty() && entry.minute_of_day < *util::ParseClockTime(rate.entry_after())) return false;
  if (!rate.entry_before().empty() && entry.minute_of_day >= *util::ParseClockTime(rate.entry_before())) return false;
  if (!rate.exit_after().empty() && exit.minute_of_day < *util::ParseClockTime(rate.exit_after())) return false;
  if (!rate.exit_before().empty() && exit.minute_of_day >= *util::ParseClockTime(rate.exit_before())) return false;
  return true;
}

int64_t HourlyFee(const FeePolicy& policy, int64_t elapsed_ms, const util::LocalClock& entry) {
  const int64_t hours = (elapsed_ms + kMillisPerHour - 1) / kMillisPerHour;

  const bool weekend = entry.weekday >= 5;
  const double rate  = weekend && policy.weekend_hourly_rate() > 0.0 ? policy.weekend_hourly_rate() : policy.hourly_rate();
  const int64_t rate_minor = Minor(rate);

  if (policy.daily_max() <= 0.0) {
    return hours * rate_minor;
  }

  const int64_t cap       = Minor(policy.daily_max());
  const int64_t full_days = hours / 24;
  const int64_t remainder = hours % 24;
  return full_days * std::min(24 * rate_minor, cap) + std::min(remainder * rate_minor, cap);
}

int64_t TieredFee(const FeePolicy& policy, int64_t elapsed_ms) {
  std::vector<FeeTier> tiers(policy.tiers().begin(), policy.tiers().end());
  std::sort(tiers.begin(), tiers.end(),
            [](const FeeTier& a, const FeeTier& b) { return a.hours_threshold() < b.hours_threshold(); });

  const FeeTier* selected = &tiers.front();
  for (const auto& tier : tiers) {
    if (static_cast<int64_t>(tier.hours_threshold()) * kMillisPerHour <= elapsed_ms) {
      selected = &tier;
    }
  }
  return Minor(selected->rate());
}

} // namespace

void ValidateFeePolicy(const FeePolicy& policy) {
  using lotgate::runtime::config::FEE_MODE_FIXED;
  using lotgate::runtime::config::FEE_MODE_FREE;
  using lotgate::runtime::config::FEE_MODE_HOURLY;
  using lotgate::runtime::config::FEE_MODE_TIERED;

  switch (policy.mode()) {
    case FEE_MODE_FREE:
    case FEE_MODE_FIXED:
    case FEE_MODE_HOURLY:
    case FEE_MODE_TIERED:
      break;
    default:
      throw util::ConfigurationError("fee policy: mode is not set");
  }

  if (policy.mode() != FEE_MODE_FREE && policy.currency().empty()) {
    throw util::ConfigurationError("fee policy: currency is required");
  }

  RequireNonNegative(policy.fixed_rate(), "fixed_rate");
  RequireNonNegative(policy.hourly_rate(), "hourly_rate");
  RequireNonNegative(policy.weekend_hourly_rate(), "weekend_hourly_rate");
  RequireNonNegative(policy.daily_max(), "daily_max");

  if (policy.mode() == FEE_MODE_TIERED) {
    if (policy.tiers_size() == 0) {
      throw util::ConfigurationError("fee policy: TIERED mode needs at least one tier");
    }
    std::set<uint32_t> thresholds;
    for (const auto& tier : policy.tiers()) {
      RequireNonNegative(tier.rate(), "tier rate");
      if (!thresholds.insert(tier.hours_threshold()).second) {
        throw util::ConfigurationError("fee policy: duplicate tier threshold " + std::to_string(tier.hours_threshold()));
      }
    }
  }

  if (policy.utc_offset_minutes() < -kMaxUtcOffset || policy.utc_offset_minutes() > kMaxUtcOffset) {
    throw util::ConfigurationError("fee policy: utc_offset_minutes out of range");
  }

  for (const auto& rate : policy.special_rates()) {
    const std::string name = rate.name().empty() ? "special rate" : "special rate '" + rate.name() + "'";
    RequireNonNegative(rate.flat_rate(), name + " flat_rate");
    for (auto day : rate.days()) {
      if (day > 6) {
        throw util::ConfigurationError("fee policy: " + name + " has day " + std::to_string(day) + " (expected 0..6)");
      }
    }
    for (const auto* bound : {&rate.entry_after(), &rate.entry_before(), &rate.exit_after(), &rate.exit_before()}) {
      if (!bound->empty() && !util::ParseClockTime(*bound)) {
        throw util::ConfigurationError("fee policy: " + name + " has malformed time '" + *bound + "' (expected HH:MM)");
      }
    }
  }
}

util::Money ComputeFee(const FeePolicy& policy, util::TimePoint entry_time, util::TimePoint exit_time) {
  ValidateFeePolicy(policy);

  const int64_t elapsed_ms = std::max<int64_t>(
      0, std::chrono::duration_cast<std::chrono::milliseconds>(exit_time - entry_time).count());

  util::Money fee = util::Money::Zero(policy.currency());

  if (policy.mode() == lotgate::runtime::config::FEE_MODE_FREE) {
    return fee;
  }
  if (policy.grace_period_minutes() > 0 &&
      elapsed_ms <= static_cast<int64_t>(policy.grace_period_minutes()) * 60 * 1000) {
    return fee;
  }

  const util::LocalClock entry = util::ToLocalClock(entry_time, policy.utc_offset_minutes());
  const util::LocalClock exit  = util::ToLocalClock(exit_time, policy.utc_offset_minutes());

  for (const auto& rate : policy.special_rates()) {
    if (Matches(rate, entry, exit)) {
      fee.minor_units = Minor(rate.flat_rate());
      return fee;
    }
  }

  switch (policy.mode()) {
    case lotgate::runtime::config::FEE_MODE_FIXED:
      fee.minor_units = Minor(policy.fixed_rate());
      break;
    case lotgate::runtime::config::FEE_MODE_HOURLY:
      fee.minor_units = HourlyFee(policy, elapsed_ms, entry);
      break;
    case lotgate::runtime::config::FEE_MODE_TIERED:
      fee.minor_units = TieredFee(policy, elapsed_ms);
      break;
    default:
      break;
  }
  return fee;
}

} // namespace lotgate::parking
