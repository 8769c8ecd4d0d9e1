#include "pg_repository.hpp"

#include <cstddef>
#include <string_view>

namespace rentledger::db::postgres {

namespace {

std::basic_string_view<std::byte> AsBytes(const std::string& s) {
  return pqxx::binary_cast(s);
}

std::string FromBytes(const std::basic_string<std::byte>& bytes) {
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

bool PgRepository::Has(Transaction& t, Durability durability, const std::string& slot) {
  auto res = TX(t).Work().exec_prepared("has_entry", static_cast<int>(durability), AsBytes(slot));
  return !res.empty();
}

std::optional<std::string> PgRepository::Get(Transaction& t, Durability durability, const std::string& slot) {
  auto res = TX(t).Work().exec_prepared("get_entry", static_cast<int>(durability), AsBytes(slot));
  if (res.empty()) return std::nullopt;
  return FromBytes(res[0][0].as<std::basic_string<std::byte>>());
}

Result PgRepository::Put(Transaction& t, Durability durability, const std::string& slot, const std::string& value) {
  try {
    TX(t).Work().exec_prepared("put_entry", static_cast<int>(durability), AsBytes(slot), AsBytes(value));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetLiveUntil(Transaction& t, Durability durability, const std::string& slot, std::uint64_t live_until) {
  try {
    auto res = TX(t).Work().exec_prepared("set_live_until", static_cast<int>(durability), AsBytes(slot), live_until);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "no entry for slot");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::uint64_t> PgRepository::GetLiveUntil(Transaction& t, Durability durability, const std::string& slot) {
  auto res = TX(t).Work().exec_prepared("get_live_until", static_cast<int>(durability), AsBytes(slot));
  if (res.empty()) return std::nullopt;
  return res[0][0].as<std::uint64_t>();
}

} // namespace rentledger::db::postgres
