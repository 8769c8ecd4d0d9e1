#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "internal/model/types.hpp"
#include "internal/util/errors.hpp"

namespace rentledger::ledger {

inline constexpr std::uint32_t kMaxCommissionRateBps = model::kBasisPointsDenominator;

struct ValidationResult {
  bool            ok   = true;
  util::ErrorCode code = util::ErrorCode::kInvalidAmount;
  std::string     message;

  static ValidationResult Ok() {
    return {};
  }

  static ValidationResult Err(util::ErrorCode c, std::string msg) {
    return {false, c, std::move(msg)};
  }

  explicit operator bool() const {
    return ok;
  }

  void ThrowIfInvalid() const {
    if (!ok) util::ThrowError(code, message);
  }
};

// Checks the terms of a new agreement. Pure.
ValidationResult ValidateAgreementParams(model::Amount monthly_rent, model::Amount security_deposit, model::Timestamp start_date,
                                         model::Timestamp end_date, std::uint32_t commission_rate_bps);

} // namespace rentledger::ledger
