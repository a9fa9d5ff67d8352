#include "internal/parking/parking_options.hpp"

#include "internal/util/time.hpp"

namespace lotgate::parking {

ParkingOptions ParkingOptions::FromConfig(const cfg::ParkingConfig& config) {
  ParkingOptions options;

  if (config.operating_mode() != cfg::OPERATING_MODE_UNSPECIFIED) options.operating_mode = config.operating_mode();
  if (config.entry_exit_mode() != cfg::ENTRY_EXIT_MODE_UNSPECIFIED) options.entry_exit_mode = config.entry_exit_mode();
  if (config.access_policy() != cfg::ACCESS_POLICY_UNSPECIFIED) options.access_policy = config.access_policy();
  if (config.payment_required() != cfg::PAYMENT_REQUIRED_UNSPECIFIED) options.payment_required = config.payment_required();
  if (config.payment_location() != cfg::PAYMENT_LOCATION_UNSPECIFIED) options.payment_location = config.payment_location();
  if (config.anomaly_policy() != cfg::ANOMALY_POLICY_UNSPECIFIED) options.anomaly_policy = config.anomaly_policy();

  // an explicit zero disables the payment timeout
  if (config.has_payment_timeout()) options.payment_timeout = util::ToMillis(config.payment_timeout());
  options.paid_exit_window = util::ToMillis(config.paid_exit_window(), options.paid_exit_window);
  options.fee_policy       = config.fee_policy();
  return options;
}

} // namespace lotgate::parking
