#include "agreement_validator.hpp"

namespace rentledger::ledger {

ValidationResult ValidateAgreementParams(model::Amount monthly_rent, model::Amount security_deposit, model::Timestamp start_date,
                                         model::Timestamp end_date, std::uint32_t commission_rate_bps) {
  if (monthly_rent <= 0) {
    return ValidationResult::Err(util::ErrorCode::kInvalidAmount, "monthly rent must be positive");
  }
  if (security_deposit < 0) {
    return ValidationResult::Err(util::ErrorCode::kInvalidAmount, "security deposit must not be negative");
  }
  if (start_date >= end_date) {
    return ValidationResult::Err(util::ErrorCode::kInvalidDate, "start date must precede end date");
  }
  if (commission_rate_bps > kMaxCommissionRateBps) {
    return ValidationResult::Err(util::ErrorCode::kInvalidCommissionRate,
                                 "commission rate " + std::to_string(commission_rate_bps) + " exceeds 10000 bps");
  }
  return ValidationResult::Ok();
}

} // namespace rentledger::ledger
