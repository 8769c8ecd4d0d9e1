#pragma once

namespace rentledger::db::sql {

/*
  Ledger schema.

  One table holds both durability classes; (durability, slot) is the
  primary key so the classes never alias.
*/

static constexpr const char* kSqliteSchema =
    "CREATE TABLE IF NOT EXISTS ledger_entries ("
    " durability INTEGER NOT NULL,"
    " slot BLOB NOT NULL,"
    " value BLOB NOT NULL,"
    " live_until INTEGER NOT NULL DEFAULT 0,"
    " PRIMARY KEY (durability, slot));";

static constexpr const char* kPostgresSchema =
    "CREATE TABLE IF NOT EXISTS ledger_entries ("
    " durability SMALLINT NOT NULL,"
    " slot BYTEA NOT NULL,"
    " value BYTEA NOT NULL,"
    " live_until BIGINT NOT NULL DEFAULT 0,"
    " PRIMARY KEY (durability, slot));";

} // namespace rentledger::db::sql
