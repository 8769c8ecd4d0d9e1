#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace rentledger::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  bool Has(Transaction&, Durability, const std::string&) override;
  std::optional<std::string> Get(Transaction&, Durability, const std::string&) override;
  Result Put(Transaction&, Durability, const std::string&, const std::string&) override;

  Result SetLiveUntil(Transaction&, Durability, const std::string&, std::uint64_t) override;
  std::optional<std::uint64_t> GetLiveUntil(Transaction&, Durability, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct Entry {
    std::string   value;
    std::uint64_t live_until = 0;
  };

  using Bucket = std::unordered_map<std::string, Entry>;

  struct State {
    Bucket instance;
    Bucket persistent;

    Bucket& For(Durability durability) {
      return durability == Durability::kInstance ? instance : persistent;
    }
    const Bucket& For(Durability durability) const {
      return durability == Durability::kInstance ? instance : persistent;
    }
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

}
