#include "money.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace lotgate::util {

Money Money::FromDecimal(double amount, std::string currency) {
  return {static_cast<int64_t>(std::llround(amount * 100.0)), std::move(currency)};
}

std::string Money::ToString() const {
  const int64_t whole = std::llabs(minor_units) / 100;
  const int64_t cents = std::llabs(minor_units) % 100;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s%lld.%02lld", minor_units < 0 ? "-" : "", static_cast<long long>(whole), static_cast<long long>(cents));
  return buf;
}

lotgate::v1::Money ToProto(const Money& money) {
  lotgate::v1::Money out;
  out.set_minor_units(money.minor_units);
  out.set_currency(money.currency);
  return out;
}

Money FromProto(const lotgate::v1::Money& money) {
  return {money.minor_units(), money.currency()};
}

} // namespace lotgate::util
