#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

#include "internal/ledger/payment_splitter.hpp"
#include "unit/test_support.hpp"

namespace {

using namespace rentledger;
using rentledger::ledger::PaymentSplit;
using rentledger::ledger::SplitPayment;

constexpr model::Amount kMax = std::numeric_limits<model::Amount>::max();

void TestTenPercent() {
  assert((SplitPayment(1000, 1000) == PaymentSplit{900, 100}));
}

void TestZeroRateAndZeroGross() {
  assert((SplitPayment(1000, 0) == PaymentSplit{1000, 0}));
  assert((SplitPayment(0, 2500) == PaymentSplit{0, 0}));
}

void TestAgentShareRoundsDown() {
  // 999 * 1.01% = 10.0899
  assert((SplitPayment(999, 101) == PaymentSplit{989, 10}));
  assert((SplitPayment(1, 9999) == PaymentSplit{1, 0}));
}

void TestFullCommission() {
  assert((SplitPayment(1234, 10000) == PaymentSplit{0, 1234}));
  assert((SplitPayment(kMax, 10000) == PaymentSplit{0, kMax}));
}

void TestNoOverflowAtInt64Max() {
  auto half = SplitPayment(kMax, 5000);
  assert(half.agent_amount == 4611686018427387903LL);
  assert(half.landlord_amount + half.agent_amount == kMax);

  auto odd = SplitPayment(kMax, 3333);
  assert(odd.landlord_amount >= 0);
  assert(odd.agent_amount >= 0);
  assert(odd.landlord_amount + odd.agent_amount == kMax);
}

void TestSharesAlwaysSumToGross() {
  for (model::Amount gross : {model::Amount{1}, model::Amount{7}, model::Amount{10001}, model::Amount{123456789}}) {
    for (std::uint32_t rate : {0u, 1u, 101u, 2500u, 9999u, 10000u}) {
      auto split = SplitPayment(gross, rate);
      assert(split.landlord_amount + split.agent_amount == gross);
      assert(split.agent_amount <= gross);
    }
  }
}

void TestRejectsInvalidInput() {
  rentledger::testing::ExpectThrow<util::InvalidAmount>([] { (void)SplitPayment(-1, 1000); });
  rentledger::testing::ExpectThrow<util::InvalidCommissionRate>([] { (void)SplitPayment(1000, 10001); });
}

} // namespace

int main() {
  TestTenPercent();
  TestZeroRateAndZeroGross();
  TestAgentShareRoundsDown();
  TestFullCommission();
  TestNoOverflowAtInt64Max();
  TestSharesAlwaysSumToGross();
  TestRejectsInvalidInput();

  std::cout << "rentledger_unit_payment_splitter: pass\n";
  return 0;
}
