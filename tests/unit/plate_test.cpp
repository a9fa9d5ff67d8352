#include "internal/model/plate.hpp"

#include <cassert>
#include <iostream>

#include "internal/model/session_state.hpp"
#include "internal/util/money.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace lotgate::v1;

void TestNormalizePlate() {
  using lotgate::model::NormalizePlate;

  assert(NormalizePlate(" ab-12 3") == "AB123");
  assert(NormalizePlate("XYZ.789") == "XYZ789");
  assert(NormalizePlate("  ") == "");
  assert(NormalizePlate("") == "");
}

void TestSessionTransitions() {
  using lotgate::model::CanTransition;

  assert(CanTransition(SESSION_STATUS_ACTIVE, SESSION_STATUS_PENDING_PAYMENT));
  assert(CanTransition(SESSION_STATUS_ACTIVE, SESSION_STATUS_PAID));
  assert(CanTransition(SESSION_STATUS_PENDING_PAYMENT, SESSION_STATUS_PAID));
  assert(CanTransition(SESSION_STATUS_PENDING_PAYMENT, SESSION_STATUS_CANCELLED));

  assert(!CanTransition(SESSION_STATUS_PAID, SESSION_STATUS_ACTIVE));
  assert(!CanTransition(SESSION_STATUS_CANCELLED, SESSION_STATUS_PAID));
  assert(!CanTransition(SESSION_STATUS_PENDING_PAYMENT, SESSION_STATUS_ACTIVE));
}

void TestMoneyFormatting() {
  using lotgate::util::Money;

  assert(Money::FromDecimal(4.0, "USD").minor_units == 400);
  assert(Money::FromDecimal(0.125, "USD").minor_units == 13);
  assert(Money::FromDecimal(4.0, "USD").ToString() == "4.00");
  assert((Money{-50, "USD"}.ToString() == "-0.50"));
}

void TestSessionIdsAreCanonical() {
  const auto id = lotgate::util::NewId();
  assert(lotgate::util::IsCanonicalId(id));
  assert(id[14] == '4');
  assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
  assert(lotgate::util::NewId() != id);

  assert(!lotgate::util::IsCanonicalId("missing-session"));
  assert(!lotgate::util::IsCanonicalId("6F9619FF-8B86-4011-B42D-00C04FC964FF"));
}

} // namespace

int main() {
  TestNormalizePlate();
  TestSessionTransitions();
  TestMoneyFormatting();
  TestSessionIdsAreCanonical();

  std::cout << "lotgate_unit_plate: pass\n";
  return 0;
}
