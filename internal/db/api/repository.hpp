#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"

namespace rentledger::db {

/*
  Key-value repository.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Nothing written in a transaction is visible before Commit()
  - Ledger atomicity (agreement + record + counters + balances)
    depends on this behavior

  Slots are opaque byte strings produced by storage::EncodeSlot. Values are
  serialized records. Every entry carries a live-until marker (unix seconds,
  0 = never extended) maintained by storage::LedgerStorage.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Entries
  // ---------------------------------------------------------------------

  virtual bool Has(Transaction&, Durability, const std::string& slot) = 0;

  virtual std::optional<std::string> Get(Transaction&, Durability, const std::string& slot) = 0;

  // Inserts or replaces the value. An existing live-until marker is kept.
  virtual Result Put(Transaction&, Durability, const std::string& slot, const std::string& value) = 0;

  // ---------------------------------------------------------------------
  // Lifetime
  // ---------------------------------------------------------------------

  // NotFound when the slot holds no entry.
  virtual Result SetLiveUntil(Transaction&, Durability, const std::string& slot, std::uint64_t live_until) = 0;

  virtual std::optional<std::uint64_t> GetLiveUntil(Transaction&, Durability, const std::string& slot) = 0;
};

} // namespace rentledger::db
