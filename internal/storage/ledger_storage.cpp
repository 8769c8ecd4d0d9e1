#include "ledger_storage.hpp"

#include <limits>
#include <stdexcept>

namespace rentledger::storage {

namespace {

std::uint64_t SaturatingAdd(std::uint64_t now_s, std::uint64_t seconds) {
  return now_s > kMaxLiveUntil || seconds > kMaxLiveUntil - now_s ? kMaxLiveUntil : now_s + seconds;
}

} // namespace

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) return;
  throw std::runtime_error(context + ": " + result.message);
}

LedgerStorage::LedgerStorage(db::Repository& repository, db::Transaction& tx, TtlPolicy instance_ttl, TtlPolicy persistent_ttl,
                             model::Timestamp now_s)
    : repository_(repository), tx_(tx), instance_ttl_(instance_ttl), persistent_ttl_(persistent_ttl), now_s_(now_s) {
}

bool LedgerStorage::Has(const StorageKey& key) {
  return repository_.Has(tx_, DurabilityOf(key), EncodeSlot(key));
}

std::optional<std::string> LedgerStorage::Read(const StorageKey& key) {
  return repository_.Get(tx_, DurabilityOf(key), EncodeSlot(key));
}

void LedgerStorage::Write(const StorageKey& key, const std::string& bytes) {
  const auto durability = DurabilityOf(key);
  const auto slot       = EncodeSlot(key);
  ThrowIfDbError(repository_.Put(tx_, durability, slot, bytes), "write " + Describe(key));
  ExtendTtl(key, durability, slot);
}

std::uint64_t LedgerStorage::GetCounter(const StorageKey& key) {
  auto bytes = Read(key);
  return bytes ? DecodeCounter(*bytes) : 0;
}

void LedgerStorage::SetCounter(const StorageKey& key, std::uint64_t value) {
  Write(key, EncodeCounter(value));
}

std::uint64_t LedgerStorage::IncrementCounter(const StorageKey& key) {
  const auto current = GetCounter(key);
  if (current == std::numeric_limits<std::uint64_t>::max()) {
    throw std::overflow_error(Describe(key) + " overflow");
  }
  SetCounter(key, current + 1);
  return current + 1;
}

std::optional<std::uint64_t> LedgerStorage::LiveUntil(const StorageKey& key) {
  return repository_.GetLiveUntil(tx_, DurabilityOf(key), EncodeSlot(key));
}

void LedgerStorage::ExtendTtl(const StorageKey& key, db::Durability durability, const std::string& slot) {
  const auto& policy = durability == db::Durability::kInstance ? instance_ttl_ : persistent_ttl_;
  if (policy.extend_to_seconds == 0) return;

  const auto live_until = repository_.GetLiveUntil(tx_, durability, slot).value_or(0);
  if (live_until >= SaturatingAdd(now_s_, policy.threshold_seconds)) return;

  const auto target = SaturatingAdd(now_s_, policy.extend_to_seconds);
  if (target <= live_until) return;
  ThrowIfDbError(repository_.SetLiveUntil(tx_, durability, slot, target), "extend ttl " + Describe(key));
}

} // namespace rentledger::storage
