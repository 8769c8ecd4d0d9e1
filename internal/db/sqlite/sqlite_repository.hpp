#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace rentledger::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  bool Has(Transaction&, Durability, const std::string&) override;
  std::optional<std::string> Get(Transaction&, Durability, const std::string&) override;
  Result Put(Transaction&, Durability, const std::string&, const std::string&) override;

  Result SetLiveUntil(Transaction&, Durability, const std::string&, std::uint64_t) override;
  std::optional<std::uint64_t> GetLiveUntil(Transaction&, Durability, const std::string&) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
