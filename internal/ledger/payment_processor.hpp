#pragma once

#include <string>

#include "internal/ledger/invocation.hpp"
#include "internal/model/payment_record.hpp"
#include "internal/token/token_ledger.hpp"

namespace rentledger::ledger {

/*
  Settles one rent payment of an Active agreement.

  Checks run before any write: agreement exists, is Active, amount equals
  monthly_rent, tenant authorized. The landlord and agent shares are then
  transferred from the tenant and the agreement, its payment record, the
  global payment index entry and PaymentCount are written in the same
  transaction. Any failure leaves no effect.
*/
model::PaymentRecord PayRent(Invocation& inv, token::TokenLedger& tokens, const std::string& agreement_id, const std::string& token,
                             model::Amount amount);

} // namespace rentledger::ledger
