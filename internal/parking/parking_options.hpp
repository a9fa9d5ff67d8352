#pragma once

#include <chrono>

#include "config/config.pb.h"

namespace lotgate::parking {

namespace cfg = lotgate::runtime::config;

// Typed view of the `parking` config section with defaults applied.
struct ParkingOptions {
  cfg::OperatingMode   operating_mode   = cfg::OPERATING_MODE_PARKING;
  cfg::EntryExitMode   entry_exit_mode  = cfg::ENTRY_EXIT_MODE_SINGLE_CAMERA;
  cfg::AccessPolicy    access_policy    = cfg::ACCESS_POLICY_PUBLIC;
  cfg::PaymentRequired payment_required = cfg::PAYMENT_REQUIRED_ALWAYS;
  cfg::PaymentLocation payment_location = cfg::PAYMENT_LOCATION_EXIT;
  cfg::AnomalyPolicy   anomaly_policy   = cfg::ANOMALY_POLICY_MANUAL_REVIEW;

  std::chrono::milliseconds payment_timeout{120000};
  std::chrono::milliseconds paid_exit_window{900000};

  cfg::FeePolicy fee_policy;

  static ParkingOptions FromConfig(const cfg::ParkingConfig& config);

  bool DualCamera() const {
    return entry_exit_mode == cfg::ENTRY_EXIT_MODE_DUAL_CAMERA;
  }
  bool PayStation() const {
    return payment_location == cfg::PAYMENT_LOCATION_PAY_STATION;
  }
  bool ManualReview() const {
    return anomaly_policy == cfg::ANOMALY_POLICY_MANUAL_REVIEW;
  }
};

} // namespace lotgate::parking
