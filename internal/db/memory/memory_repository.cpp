#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace rentledger::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

bool MemoryRepository::Has(Transaction& t, Durability durability, const std::string& slot) {
  return TX(t).View().For(durability).contains(slot);
}

std::optional<std::string> MemoryRepository::Get(Transaction& t, Durability durability, const std::string& slot) {
  const auto& bucket = TX(t).View().For(durability);
  auto        it     = bucket.find(slot);
  if (it == bucket.end()) return std::nullopt;
  return it->second.value;
}

Result MemoryRepository::Put(Transaction& t, Durability durability, const std::string& slot, const std::string& value) {
  TX(t).Mutable().For(durability)[slot].value = value;
  return Result::Ok();
}

Result MemoryRepository::SetLiveUntil(Transaction& t, Durability durability, const std::string& slot, std::uint64_t live_until) {
  auto& bucket = TX(t).Mutable().For(durability);
  auto  it     = bucket.find(slot);
  if (it == bucket.end()) return Result::Err(ErrorCode::NotFound, "no entry for slot");
  it->second.live_until = live_until;
  return Result::Ok();
}

std::optional<std::uint64_t> MemoryRepository::GetLiveUntil(Transaction& t, Durability durability, const std::string& slot) {
  const auto& bucket = TX(t).View().For(durability);
  auto        it     = bucket.find(slot);
  if (it == bucket.end()) return std::nullopt;
  return it->second.live_until;
}

} // namespace rentledger::db::memory
