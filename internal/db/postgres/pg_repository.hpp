#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace rentledger::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  bool Has(Transaction&, Durability, const std::string&) override;
  std::optional<std::string> Get(Transaction&, Durability, const std::string&) override;
  Result Put(Transaction&, Durability, const std::string&, const std::string&) override;

  Result SetLiveUntil(Transaction&, Durability, const std::string&, std::uint64_t) override;
  std::optional<std::uint64_t> GetLiveUntil(Transaction&, Durability, const std::string&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
