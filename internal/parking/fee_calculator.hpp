#pragma once

#include "config/config.pb.h"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace lotgate::parking {

using FeePolicy = lotgate::runtime::config::FeePolicy;

/*
  Parking fee computation.

  Pure functions: the result depends only on the policy snapshot and the
  two timestamps. Both throw util::ConfigurationError for a policy that
  cannot be evaluated.

  Order of evaluation:
    0. FREE mode -> zero, even when a special rate matches
    1. grace period (elapsed <= grace -> zero)
    2. first matching special rate
    3. mode (FIXED / HOURLY / TIERED)
*/

void ValidateFeePolicy(const FeePolicy& policy);

util::Money ComputeFee(const FeePolicy& policy, util::TimePoint entry_time, util::TimePoint exit_time);

} // namespace lotgate::parking
