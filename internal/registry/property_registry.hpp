#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/ledger/invocation.hpp"
#include "internal/model/property.hpp"

namespace rentledger::registry {

/*
  Property registry.

  Landlords register properties once the registry has an admin; only that
  admin verifies them. Verification is one-way.
*/

void InitializeRegistry(ledger::Invocation& inv, const model::PrincipalId& admin);

model::PropertyDetails RegisterProperty(ledger::Invocation& inv, const model::PrincipalId& landlord, const std::string& property_id,
                                        const std::string& metadata_hash);

model::PropertyDetails VerifyProperty(ledger::Invocation& inv, const model::PrincipalId& admin, const std::string& property_id);

std::optional<model::PropertyDetails>       GetProperty(storage::LedgerStorage& storage, const std::string& property_id);
bool                                        HasProperty(storage::LedgerStorage& storage, const std::string& property_id);
std::uint64_t                               GetPropertyCount(storage::LedgerStorage& storage);
std::optional<model::PropertyRegistryState> GetRegistryState(storage::LedgerStorage& storage);

} // namespace rentledger::registry
