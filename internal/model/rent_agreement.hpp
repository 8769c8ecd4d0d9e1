#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/agreement_status.hpp"
#include "internal/model/types.hpp"

namespace rentledger::model {

struct RentAgreement {
  std::string agreement_id;

  PrincipalId                landlord;
  PrincipalId                tenant;
  std::optional<PrincipalId> agent;

  Amount    monthly_rent     = 0;
  Amount    security_deposit = 0;
  Timestamp start_date       = 0;
  Timestamp end_date         = 0;

  std::uint32_t agent_commission_rate = 0;

  AgreementStatus status = AgreementStatus::kDraft;

  Amount        total_rent_paid = 0;
  std::uint32_t payment_count   = 0;

  bool operator==(const RentAgreement&) const = default;
};

// Caller-supplied fields of a new agreement.
struct AgreementTerms {
  std::string                agreement_id;
  PrincipalId                landlord;
  PrincipalId                tenant;
  std::optional<PrincipalId> agent;
  Amount                     monthly_rent          = 0;
  Amount                     security_deposit      = 0;
  Timestamp                  start_date            = 0;
  Timestamp                  end_date              = 0;
  std::uint32_t              agent_commission_rate = 0;
};

}  // namespace rentledger::model
