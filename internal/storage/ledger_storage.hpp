#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/types.hpp"
#include "internal/storage/record_codec.hpp"
#include "internal/storage/storage_key.hpp"

namespace rentledger::storage {

// When fewer than threshold_seconds of lifetime remain after a write, the
// entry is extended to live until now + extend_to_seconds.
struct TtlPolicy {
  std::uint64_t threshold_seconds = 500'000;
  std::uint64_t extend_to_seconds = 500'000;
};

// Lifetimes saturate here, the largest value every backend column holds.
inline constexpr std::uint64_t kMaxLiveUntil = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

// Converts a failed repository result into an exception.
void ThrowIfDbError(const db::Result& result, const std::string& context);

/*
  LedgerStorage

  Typed view of one repository transaction.

  - Every key is routed to the durability class DurabilityOf() picks
  - Every write extends the entry lifetime with that class's TtlPolicy
  - Nothing is cached; reads always go to the transaction
*/
class LedgerStorage {
 public:
  LedgerStorage(db::Repository& repository, db::Transaction& tx, TtlPolicy instance_ttl, TtlPolicy persistent_ttl, model::Timestamp now_s);

  bool Has(const StorageKey& key);

  template <class Entity>
  std::optional<Entity> Get(const StorageKey& key) {
    auto bytes = Read(key);
    if (!bytes) return std::nullopt;
    return Decode<Entity>(*bytes);
  }

  template <class Entity>
  void Set(const StorageKey& key, const Entity& entity) {
    Write(key, Encode(entity));
  }

  // Missing counters read as zero.
  std::uint64_t GetCounter(const StorageKey& key);
  void          SetCounter(const StorageKey& key, std::uint64_t value);
  std::uint64_t IncrementCounter(const StorageKey& key);

  std::optional<std::string> Read(const StorageKey& key);
  void                       Write(const StorageKey& key, const std::string& bytes);

  std::optional<std::uint64_t> LiveUntil(const StorageKey& key);

  model::Timestamp Now() const {
    return now_s_;
  }

 private:
  void ExtendTtl(const StorageKey& key, db::Durability durability, const std::string& slot);

  db::Repository&  repository_;
  db::Transaction& tx_;
  TtlPolicy        instance_ttl_;
  TtlPolicy        persistent_ttl_;
  model::Timestamp now_s_;
};

} // namespace rentledger::storage
