#pragma once

#include <cstdint>
#include <string>

#include "internal/model/types.hpp"

namespace rentledger::model {

// Immutable once written. amount == landlord_amount + agent_amount.
struct PaymentRecord {
  std::string   agreement_id;
  std::uint32_t payment_number = 0;

  Amount amount          = 0;
  Amount landlord_amount = 0;
  Amount agent_amount    = 0;

  Timestamp   timestamp = 0;
  PrincipalId tenant;

  bool operator==(const PaymentRecord&) const = default;
};

}  // namespace rentledger::model
