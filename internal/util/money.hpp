#pragma once

#include <cstdint>
#include <string>

#include "lotgate/v1/types.pb.h"

namespace lotgate::util {

/*
  Fixed-point money in minor units (cents). Fees never pass through
  floating point after configuration load.
*/
struct Money {
  int64_t     minor_units = 0;
  std::string currency;

  static Money Zero(std::string currency) {
    return {0, std::move(currency)};
  }

  // Converts a decimal amount from configuration, rounding half away from zero.
  static Money FromDecimal(double amount, std::string currency);

  bool IsZero() const {
    return minor_units == 0;
  }

  // "4.00", "-0.50"
  std::string ToString() const;

  friend bool operator==(const Money& a, const Money& b) {
    return a.minor_units == b.minor_units && a.currency == b.currency;
  }
  friend bool operator!=(const Money& a, const Money& b) {
    return !(a == b);
  }
};

lotgate::v1::Money ToProto(const Money& money);
Money              FromProto(const lotgate::v1::Money& money);

} // namespace lotgate::util
