#include "property_registry.hpp"

#include "internal/util/errors.hpp"

namespace rentledger::registry {

namespace {

model::PropertyRegistryState RequireInitialized(storage::LedgerStorage& storage) {
  auto state = GetRegistryState(storage);
  if (!state || !state->initialized) {
    throw util::InvalidState(util::ErrorCode::kNotInitialized, "property registry is not initialized");
  }
  return *state;
}

} // namespace

void InitializeRegistry(ledger::Invocation& inv, const model::PrincipalId& admin) {
  if (auto state = GetRegistryState(inv.storage); state && state->initialized) {
    throw util::AlreadyExists(util::ErrorCode::kAlreadyInitialized, "property registry already initialized");
  }
  inv.caller.RequireAuth(admin);

  inv.storage.Set(storage::PropertyRegistryStateKey{}, model::PropertyRegistryState{.admin = admin, .initialized = true});
  inv.Emit(events::RegistryInitialized{admin});
}

model::PropertyDetails RegisterProperty(ledger::Invocation& inv, const model::PrincipalId& landlord, const std::string& property_id,
                                        const std::string& metadata_hash) {
  RequireInitialized(inv.storage);

  if (property_id.empty()) {
    throw util::InvalidArgument(util::ErrorCode::kInvalidPropertyId, "property id must not be empty");
  }
  if (metadata_hash.empty()) {
    throw util::InvalidArgument(util::ErrorCode::kInvalidMetadata, "metadata hash must not be empty");
  }
  inv.caller.RequireAuth(landlord);

  const storage::PropertyKey key{property_id};
  if (inv.storage.Has(key)) {
    throw util::AlreadyExists(util::ErrorCode::kPropertyAlreadyExists, "property " + property_id + " already registered");
  }

  model::PropertyDetails property{
      .property_id   = property_id,
      .landlord      = landlord,
      .metadata_hash = metadata_hash,
      .verified      = false,
      .registered_at = inv.Timestamp(),
  };
  inv.storage.Set(key, property);
  inv.storage.IncrementCounter(storage::PropertyCountKey{});
  inv.Emit(events::PropertyRegistered{property_id, landlord});
  return property;
}

model::PropertyDetails VerifyProperty(ledger::Invocation& inv, const model::PrincipalId& admin, const std::string& property_id) {
  const auto state = RequireInitialized(inv.storage);

  inv.caller.RequireAuth(admin);
  if (admin != state.admin) {
    throw util::Unauthorized(admin + " is not the registry admin");
  }

  const storage::PropertyKey key{property_id};
  auto                       property = inv.storage.Get<model::PropertyDetails>(key);
  if (!property) {
    throw util::NotFound(util::ErrorCode::kPropertyNotFound, "property " + property_id + " not found");
  }
  if (property->verified) {
    throw util::InvalidState(util::ErrorCode::kAlreadyVerified, "property " + property_id + " already verified");
  }

  property->verified    = true;
  property->verified_at = inv.Timestamp();
  inv.storage.Set(key, *property);
  inv.Emit(events::PropertyVerified{property_id, admin});
  return *property;
}

std::optional<model::PropertyDetails> GetProperty(storage::LedgerStorage& storage, const std::string& property_id) {
  return storage.Get<model::PropertyDetails>(storage::PropertyKey{property_id});
}

bool HasProperty(storage::LedgerStorage& storage, const std::string& property_id) {
  return storage.Has(storage::PropertyKey{property_id});
}

std::uint64_t GetPropertyCount(storage::LedgerStorage& storage) {
  return storage.GetCounter(storage::PropertyCountKey{});
}

std::optional<model::PropertyRegistryState> GetRegistryState(storage::LedgerStorage& storage) {
  return storage.Get<model::PropertyRegistryState>(storage::PropertyRegistryStateKey{});
}

} // namespace rentledger::registry
