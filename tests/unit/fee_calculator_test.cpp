#include "internal/parking/fee_calculator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using lotgate::parking::ComputeFee;
using lotgate::parking::FeePolicy;
using lotgate::parking::ValidateFeePolicy;
using namespace lotgate::runtime::config;
using namespace std::chrono;

// 2024-01-01 was a Monday.
lotgate::util::TimePoint Monday(int hour, int minute = 0) {
  return sys_days{year{2024} / January / 1} + hours(hour) + minutes(minute);
}

lotgate::util::TimePoint Saturday(int hour, int minute = 0) {
  return sys_days{year{2024} / January / 6} + hours(hour) + minutes(minute);
}

FeePolicy Hourly(double rate) {
  FeePolicy policy;
  policy.set_mode(FEE_MODE_HOURLY);
  policy.set_currency("USD");
  policy.set_hourly_rate(rate);
  return policy;
}

bool Rejects(const FeePolicy& policy) {
  try {
    ValidateFeePolicy(policy);
  } catch (const lotgate::util::ConfigurationError&) {
    return true;
  }
  return false;
}

void TestFreeAndFixed() {
  FeePolicy free;
  free.set_mode(FEE_MODE_FREE);
  assert(ComputeFee(free, Monday(8), Monday(20)).IsZero());

  FeePolicy fixed;
  fixed.set_mode(FEE_MODE_FIXED);
  fixed.set_currency("USD");
  fixed.set_fixed_rate(5.0);
  const auto fee = ComputeFee(fixed, Monday(8), Monday(9, 30));
  assert(fee.minor_units == 500);
  assert(fee.currency == "USD");
}

void TestHourlyPartialHoursRoundUp() {
  const auto policy = Hourly(2.0);

  assert(ComputeFee(policy, Monday(10), Monday(10, 59)).minor_units == 200);
  assert(ComputeFee(policy, Monday(10), Monday(11)).minor_units == 200);
  assert(ComputeFee(policy, Monday(10), Monday(11, 1)).minor_units == 400);
  assert(ComputeFee(policy, Monday(10), Monday(12, 30)).minor_units == 600);
}

void TestExitBeforeEntryIsFree() {
  assert(ComputeFee(Hourly(2.0), Monday(12), Monday(11)).IsZero());
}

void TestGracePeriodOverridesEveryMode() {
  auto policy = Hourly(2.0);
  policy.set_grace_period_minutes(15);

  assert(ComputeFee(policy, Monday(10), Monday(10, 10)).IsZero());
  assert(ComputeFee(policy, Monday(10), Monday(10, 15)).IsZero());
  assert(ComputeFee(policy, Monday(10), Monday(10, 16)).minor_units == 200);

  FeePolicy fixed;
  fixed.set_mode(FEE_MODE_FIXED);
  fixed.set_currency("USD");
  fixed.set_fixed_rate(7.5);
  fixed.set_grace_period_minutes(5);
  assert(ComputeFee(fixed, Monday(10), Monday(10, 4)).IsZero());
  assert(ComputeFee(fixed, Monday(10), Monday(10, 6)).minor_units == 750);
}

void TestTieredSelectsHighestThresholdReached() {
  FeePolicy policy;
  policy.set_mode(FEE_MODE_TIERED);
  policy.set_currency("USD");
  // deliberately unsorted
  for (auto [threshold, rate] : {std::pair{24u, 10.0}, std::pair{1u, 2.0}, std::pair{3u, 5.0}}) {
    auto* tier = policy.add_tiers();
    tier->set_hours_threshold(threshold);
    tier->set_rate(rate);
  }

  assert(ComputeFee(policy, Monday(0), Monday(0, 30)).minor_units == 200); // below all thresholds
  assert(ComputeFee(policy, Monday(0), Monday(1)).minor_units == 200);
  assert(ComputeFee(policy, Monday(0), Monday(2)).minor_units == 200);
  assert(ComputeFee(policy, Monday(0), Monday(2, 59)).minor_units == 200);
  assert(ComputeFee(policy, Monday(0), Monday(3)).minor_units == 500);
  assert(ComputeFee(policy, Monday(0), Monday(23, 59)).minor_units == 500);
  assert(ComputeFee(policy, Monday(0), Monday(0) + hours(30)).minor_units == 1000);
}

void TestDailyMaxCapsEachDay() {
  auto policy = Hourly(2.0);
  policy.set_daily_max(15.0);

  assert(ComputeFee(policy, Monday(8), Monday(12)).minor_units == 800);
  assert(ComputeFee(policy, Monday(0), Monday(10)).minor_units == 1500);
  // one capped day plus three hours
  assert(ComputeFee(policy, Monday(0), Monday(0) + hours(27)).minor_units == 1500 + 600);
}

void TestWeekendRateFollowsEntryDay() {
  auto policy = Hourly(2.0);
  policy.set_weekend_hourly_rate(1.0);

  assert(ComputeFee(policy, Saturday(10), Saturday(12)).minor_units == 200);
  assert(ComputeFee(policy, Monday(10), Monday(12)).minor_units == 400);
}

void TestSpecialRateReplacesModeResult() {
  auto  policy = Hourly(2.0);
  auto* night  = policy.add_special_rates();
  night->set_name("night");
  night->set_flat_rate(3.0);
  night->set_entry_after("18:00");
  night->set_exit_before("09:00");

  // 18:30 -> 08:00 next day would be 14 hours at the hourly rate
  assert(ComputeFee(policy, Monday(18, 30), Monday(18, 30) + hours(13) + minutes(30)).minor_units == 300);
  // entered too early for the night rate
  assert(ComputeFee(policy, Monday(17), Monday(19)).minor_units == 400);
}

void TestFreeModeIgnoresSpecialRates() {
  FeePolicy free;
  free.set_mode(FEE_MODE_FREE);
  free.set_currency("USD");
  auto* night = free.add_special_rates();
  night->set_name("night");
  night->set_flat_rate(3.0);
  night->set_entry_after("18:00");

  assert(ComputeFee(free, Monday(18, 30), Monday(22)).IsZero());
}

void TestSpecialRateHonoursUtcOffset() {
  auto  policy = Hourly(2.0);
  auto* rate   = policy.add_special_rates();
  rate->set_flat_rate(1.0);
  rate->set_entry_after("08:00");
  rate->set_entry_before("10:00");
  policy.set_utc_offset_minutes(120);

  // 07:00 UTC is 09:00 local
  assert(ComputeFee(policy, Monday(7), Monday(9)).minor_units == 100);
  // 09:00 UTC is 11:00 local
  assert(ComputeFee(policy, Monday(9), Monday(11)).minor_units == 400);
}

void TestSpecialRateDayFilter() {
  auto  policy = Hourly(2.0);
  auto* rate   = policy.add_special_rates();
  rate->set_flat_rate(4.0);
  rate->add_days(5);
  rate->add_days(6);

  assert(ComputeFee(policy, Saturday(10), Saturday(20)).minor_units == 400);
  assert(ComputeFee(policy, Monday(10), Monday(20)).minor_units == 2000);
}

void TestInvalidPoliciesAreRejected() {
  FeePolicy unset;
  assert(Rejects(unset));

  auto no_currency = Hourly(2.0);
  no_currency.clear_currency();
  assert(Rejects(no_currency));

  assert(Rejects(Hourly(-1.0)));

  FeePolicy no_tiers;
  no_tiers.set_mode(FEE_MODE_TIERED);
  no_tiers.set_currency("USD");
  assert(Rejects(no_tiers));

  auto duplicate = no_tiers;
  for (int i = 0; i < 2; ++i) {
    auto* tier = duplicate.add_tiers();
    tier->set_hours_threshold(1);
    tier->set_rate(2.0);
  }
  assert(Rejects(duplicate));

  auto bad_clock = Hourly(2.0);
  bad_clock.add_special_rates()->set_entry_after("25:00");
  assert(Rejects(bad_clock));

  auto bad_day = Hourly(2.0);
  bad_day.add_special_rates()->add_days(7);
  assert(Rejects(bad_day));

  bool threw = false;
  try {
    (void)ComputeFee(Hourly(-1.0), Monday(8), Monday(9));
  } catch (const lotgate::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw && "ComputeFee must refuse an invalid policy.");
}

} // namespace

int main() {
  TestFreeAndFixed();
  TestHourlyPartialHoursRoundUp();
  TestExitBeforeEntryIsFree();
  TestGracePeriodOverridesEveryMode();
  TestTieredSelectsHighestThresholdReached();
  TestDailyMaxCapsEachDay();
  TestWeekendRateFollowsEntryDay();
  TestSpecialRateReplacesModeResult();
  TestFreeModeIgnoresSpecialRates();
  TestSpecialRateHonoursUtcOffset();
  TestSpecialRateDayFilter();
  TestInvalidPoliciesAreRejected();

  std::cout << "lotgate_unit_fee_calculator: pass\n";
  return 0;
}
