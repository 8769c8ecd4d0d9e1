#include "obligation_registry.hpp"

#include "internal/util/errors.hpp"

namespace rentledger::obligation {

namespace {

bool IsInitialized(storage::LedgerStorage& storage) {
  auto bytes = storage.Read(storage::ObligationRegistryStateKey{});
  return bytes && storage::DecodeObligationsInitialized(*bytes);
}

void RequireInitialized(storage::LedgerStorage& storage) {
  if (!IsInitialized(storage)) {
    throw util::InvalidState(util::ErrorCode::kNotInitialized, "obligation registry is not initialized");
  }
}

} // namespace

void InitializeObligations(ledger::Invocation& inv) {
  if (IsInitialized(inv.storage)) {
    throw util::AlreadyExists(util::ErrorCode::kAlreadyInitialized, "obligation registry already initialized");
  }
  inv.storage.Write(storage::ObligationRegistryStateKey{}, storage::EncodeObligationsInitialized(true));
}

model::RentObligation MintObligation(ledger::Invocation& inv, const std::string& agreement_id, const model::PrincipalId& landlord) {
  RequireInitialized(inv.storage);
  inv.caller.RequireAuth(landlord);

  const storage::ObligationKey key{agreement_id};
  if (inv.storage.Has(key)) {
    throw util::AlreadyExists(util::ErrorCode::kObligationAlreadyExists, "obligation for " + agreement_id + " already minted");
  }

  model::RentObligation obligation{.agreement_id = agreement_id, .owner = landlord, .minted_at = inv.Timestamp()};
  inv.storage.Set(key, obligation);
  inv.storage.IncrementCounter(storage::ObligationCountKey{});
  inv.Emit(events::ObligationMinted{agreement_id, landlord});
  return obligation;
}

model::RentObligation TransferObligation(ledger::Invocation& inv, const model::PrincipalId& from, const model::PrincipalId& to,
                                         const std::string& agreement_id) {
  RequireInitialized(inv.storage);
  inv.caller.RequireAuth(from);

  const storage::ObligationKey key{agreement_id};
  auto                         obligation = inv.storage.Get<model::RentObligation>(key);
  if (!obligation) {
    throw util::NotFound(util::ErrorCode::kObligationNotFound, "no obligation for " + agreement_id);
  }
  if (obligation->owner != from) {
    throw util::Unauthorized(from + " does not own the obligation for " + agreement_id);
  }

  obligation->owner = to;
  inv.storage.Set(key, *obligation);
  inv.Emit(events::ObligationTransferred{agreement_id, from, to});
  return *obligation;
}

std::optional<model::RentObligation> GetObligation(storage::LedgerStorage& storage, const std::string& agreement_id) {
  return storage.Get<model::RentObligation>(storage::ObligationKey{agreement_id});
}

std::optional<model::PrincipalId> GetObligationOwner(storage::LedgerStorage& storage, const std::string& agreement_id) {
  auto obligation = GetObligation(storage, agreement_id);
  if (!obligation) return std::nullopt;
  return obligation->owner;
}

bool HasObligation(storage::LedgerStorage& storage, const std::string& agreement_id) {
  return storage.Has(storage::ObligationKey{agreement_id});
}

std::uint64_t GetObligationCount(storage::LedgerStorage& storage) {
  return storage.GetCounter(storage::ObligationCountKey{});
}

} // namespace rentledger::obligation
