#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace rentledger::db::sqlite {

using rentledger::db::ErrorCode;
using rentledger::db::Result;

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindDurability(sqlite3_stmt* st, int idx, Durability d) {
    sqlite3_bind_int(st, idx, static_cast<int>(d));
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int   size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Reads cannot report a Result; a broken statement must not look like a miss.
static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Entries
// ------------------------------------------------------------------

bool SqliteRepository::Has(Transaction& t, Durability durability, const std::string& slot) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db, "SELECT 1 FROM ledger_entries WHERE durability=? AND slot=?;");
    BindDurability(st, 1, durability);
    BindBlob(st, 2, slot);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite has: ") + sqlite3_errmsg(db));
    }
    return rc == SQLITE_ROW;
}

std::optional<std::string>
SqliteRepository::Get(Transaction& t, Durability durability, const std::string& slot) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db, "SELECT value FROM ledger_entries WHERE durability=? AND slot=?;");
    BindDurability(st, 1, durability);
    BindBlob(st, 2, slot);

    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        throw std::runtime_error(std::string("sqlite get: ") + sqlite3_errmsg(db));
    }

    auto value = ColBlob(st, 0);
    sqlite3_finalize(st);
    return value;
}

Result SqliteRepository::Put(Transaction& t, Durability durability, const std::string& slot, const std::string& value) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO ledger_entries(durability,slot,value,live_until) VALUES(?,?,?,0) "
        "ON CONFLICT(durability,slot) DO UPDATE SET value=excluded.value;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindDurability(st, 1, durability);
    BindBlob(st, 2, slot);
    BindBlob(st, 3, value);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Lifetime
// ------------------------------------------------------------------

Result SqliteRepository::SetLiveUntil(Transaction& t, Durability durability, const std::string& slot, std::uint64_t live_until) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE ledger_entries SET live_until=? WHERE durability=? AND slot=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, live_until);
    BindDurability(st, 2, durability);
    BindBlob(st, 3, slot);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "no entry for slot");
    return result;
}

std::optional<std::uint64_t>
SqliteRepository::GetLiveUntil(Transaction& t, Durability durability, const std::string& slot) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db, "SELECT live_until FROM ledger_entries WHERE durability=? AND slot=?;");
    BindDurability(st, 1, durability);
    BindBlob(st, 2, slot);

    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        throw std::runtime_error(std::string("sqlite live_until: ") + sqlite3_errmsg(db));
    }

    auto live_until = ColU64(st, 0);
    sqlite3_finalize(st);
    return live_until;
}

} // namespace rentledger::db::sqlite
