#pragma once

#include <cstdint>
#include <string_view>

namespace rentledger::db {

/*
  Durability classes of the key-value substrate.

  Instance entries hold small shared state (counters, registry state).
  Persistent entries hold the ledger entities. Each class is an independent
  key space; the same slot may exist in both without aliasing.
*/
enum class Durability : std::uint8_t {
  kInstance   = 0,
  kPersistent = 1,
};

constexpr std::string_view ToString(Durability durability) {
  return durability == Durability::kInstance ? "instance" : "persistent";
}

} // namespace rentledger::db
