#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/ledger/invocation.hpp"
#include "internal/model/obligation.hpp"

namespace rentledger::obligation {

/*
  Rent obligation registry.

  One transferable obligation per agreement id, minted to the landlord.
  Agreement existence is not checked here.
*/

void InitializeObligations(ledger::Invocation& inv);

model::RentObligation MintObligation(ledger::Invocation& inv, const std::string& agreement_id, const model::PrincipalId& landlord);

model::RentObligation TransferObligation(ledger::Invocation& inv, const model::PrincipalId& from, const model::PrincipalId& to,
                                         const std::string& agreement_id);

std::optional<model::RentObligation> GetObligation(storage::LedgerStorage& storage, const std::string& agreement_id);
std::optional<model::PrincipalId>    GetObligationOwner(storage::LedgerStorage& storage, const std::string& agreement_id);
bool                                 HasObligation(storage::LedgerStorage& storage, const std::string& agreement_id);
std::uint64_t                        GetObligationCount(storage::LedgerStorage& storage);

} // namespace rentledger::obligation
