#include "payment_processor.hpp"

#include <limits>

#include "internal/ledger/payment_splitter.hpp"
#include "internal/util/errors.hpp"

namespace rentledger::ledger {

model::PaymentRecord PayRent(Invocation& inv, token::TokenLedger& tokens, const std::string& agreement_id, const std::string& token,
                             model::Amount amount) {
  const storage::AgreementKey key{agreement_id};
  auto                        agreement = inv.storage.Get<model::RentAgreement>(key);
  if (!agreement) {
    throw util::NotFound(util::ErrorCode::kAgreementNotFound, "agreement " + agreement_id + " not found");
  }
  if (agreement->status != model::AgreementStatus::kActive) {
    throw util::NotActive("agreement " + agreement_id + " is " + std::string(model::ToString(agreement->status)));
  }
  if (amount != agreement->monthly_rent) {
    throw util::InvalidAmount("payment of " + std::to_string(amount) + " does not match monthly rent " +
                              std::to_string(agreement->monthly_rent));
  }
  inv.caller.RequireAuth(agreement->tenant);

  if (agreement->total_rent_paid > std::numeric_limits<model::Amount>::max() - amount) {
    throw util::InvalidAmount("total rent paid would overflow");
  }
  if (agreement->payment_count == std::numeric_limits<std::uint32_t>::max()) {
    throw util::InvalidAmount("payment count would overflow");
  }

  // Without an agent the landlord receives the full gross.
  const auto split = SplitPayment(amount, agreement->agent ? agreement->agent_commission_rate : 0);

  tokens.Transfer(inv.storage, token, agreement->tenant, agreement->landlord, split.landlord_amount);
  if (agreement->agent && split.agent_amount > 0) {
    tokens.Transfer(inv.storage, token, agreement->tenant, *agreement->agent, split.agent_amount);
  }

  agreement->total_rent_paid += amount;
  agreement->payment_count += 1;

  model::PaymentRecord record{
      .agreement_id    = agreement_id,
      .payment_number  = agreement->payment_count,
      .amount          = amount,
      .landlord_amount = split.landlord_amount,
      .agent_amount    = split.agent_amount,
      .timestamp       = inv.Timestamp(),
      .tenant          = agreement->tenant,
  };

  const auto global_index = inv.storage.GetCounter(storage::PaymentCountKey{});

  inv.storage.Set(key, *agreement);
  inv.storage.Set(storage::PaymentRecordKey{agreement_id, record.payment_number}, record);
  inv.storage.Set(storage::PaymentKey{std::to_string(global_index)}, record);
  inv.storage.SetCounter(storage::PaymentCountKey{}, global_index + 1);

  inv.Emit(events::RentPaid{
      .agreement_id    = agreement_id,
      .amount          = amount,
      .landlord_amount = split.landlord_amount,
      .agent_amount    = split.agent_amount,
      .timestamp       = record.timestamp,
  });
  return record;
}

} // namespace rentledger::ledger
