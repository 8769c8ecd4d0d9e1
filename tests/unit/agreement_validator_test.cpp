#include <cassert>
#include <iostream>

#include "internal/ledger/agreement_validator.hpp"
#include "unit/test_support.hpp"

namespace {

using namespace rentledger;
using rentledger::ledger::ValidateAgreementParams;
using rentledger::util::ErrorCode;

void TestAcceptsValidTerms() {
  assert(ValidateAgreementParams(1000, 0, 1, 2, 0));
  assert(ValidateAgreementParams(1000, 5000, 100, 1000, 500));
}

void TestRejectsNonPositiveRent() {
  auto zero = ValidateAgreementParams(0, 0, 1, 2, 0);
  assert(!zero);
  assert(zero.code == ErrorCode::kInvalidAmount);

  auto negative = ValidateAgreementParams(-1, 0, 1, 2, 0);
  assert(negative.code == ErrorCode::kInvalidAmount);
}

void TestRejectsNegativeDeposit() {
  auto r = ValidateAgreementParams(1000, -1, 1, 2, 0);
  assert(!r);
  assert(r.code == ErrorCode::kInvalidAmount);
}

void TestRejectsEmptyOrReversedPeriod() {
  assert(ValidateAgreementParams(1000, 0, 5, 5, 0).code == ErrorCode::kInvalidDate);
  assert(ValidateAgreementParams(1000, 0, 6, 5, 0).code == ErrorCode::kInvalidDate);
}

void TestCommissionRateIsBasisPoints() {
  // 101 bps is 1.01%, not an out of range percentage.
  assert(ValidateAgreementParams(1000, 0, 1, 2, 101));
  assert(ValidateAgreementParams(1000, 0, 1, 2, 10000));

  auto r = ValidateAgreementParams(1000, 0, 1, 2, 10001);
  assert(!r);
  assert(r.code == ErrorCode::kInvalidCommissionRate);
}

void TestChecksRunInOrder() {
  // Bad rent wins over every later check.
  assert(ValidateAgreementParams(0, -1, 9, 1, 20000).code == ErrorCode::kInvalidAmount);
  assert(ValidateAgreementParams(1, 0, 9, 1, 20000).code == ErrorCode::kInvalidDate);
}

void TestThrowIfInvalidRaisesTypedError() {
  ValidateAgreementParams(1000, 0, 1, 2, 0).ThrowIfInvalid();

  rentledger::testing::ExpectThrow<util::InvalidDate>([] { ValidateAgreementParams(1000, 0, 2, 1, 0).ThrowIfInvalid(); });
  auto e = rentledger::testing::ExpectThrow<util::InvalidCommissionRate>(
      [] { ValidateAgreementParams(1000, 0, 1, 2, 10001).ThrowIfInvalid(); });
  assert(e.code() == ErrorCode::kInvalidCommissionRate);
}

} // namespace

int main() {
  TestAcceptsValidTerms();
  TestRejectsNonPositiveRent();
  TestRejectsNegativeDeposit();
  TestRejectsEmptyOrReversedPeriod();
  TestCommissionRateIsBasisPoints();
  TestChecksRunInOrder();
  TestThrowIfInvalidRaisesTypedError();

  std::cout << "rentledger_unit_agreement_validator: pass\n";
  return 0;
}
