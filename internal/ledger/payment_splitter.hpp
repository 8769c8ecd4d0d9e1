#pragma once

#include <cstdint>

#include "internal/model/types.hpp"

namespace rentledger::ledger {

struct PaymentSplit {
  model::Amount landlord_amount = 0;
  model::Amount agent_amount    = 0;

  bool operator==(const PaymentSplit&) const = default;
};

// agent = floor(gross * rate_bps / 10000), landlord gets the rest.
// Throws InvalidAmount on negative gross, InvalidCommissionRate above 10000.
PaymentSplit SplitPayment(model::Amount gross, std::uint32_t rate_bps);

} // namespace rentledger::ledger
