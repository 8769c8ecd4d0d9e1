#include "payment_splitter.hpp"

#include "internal/ledger/agreement_validator.hpp"
#include "internal/util/errors.hpp"

namespace rentledger::ledger {

PaymentSplit SplitPayment(model::Amount gross, std::uint32_t rate_bps) {
  if (gross < 0) {
    throw util::InvalidAmount("gross amount must not be negative");
  }
  if (rate_bps > kMaxCommissionRateBps) {
    throw util::InvalidCommissionRate("commission rate " + std::to_string(rate_bps) + " exceeds 10000 bps");
  }

  // Split gross into whole units of the denominator so no product exceeds int64.
  constexpr model::Amount kDenominator = model::kBasisPointsDenominator;
  const model::Amount     rate         = rate_bps;
  const model::Amount     agent        = (gross / kDenominator) * rate + (gross % kDenominator) * rate / kDenominator;

  return {.landlord_amount = gross - agent, .agent_amount = agent};
}

} // namespace rentledger::ledger
