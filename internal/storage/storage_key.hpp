#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

#include "internal/db/api/types.hpp"

namespace rentledger::storage {

/*
  Typed storage addresses.

  Every persisted ledger entry lives under exactly one StorageKey. Keys are
  compared and hashed structurally; EncodeSlot turns a key into the opaque
  byte slot handed to the repository.
*/

struct AgreementKey {
  std::string agreement_id;
  bool operator==(const AgreementKey&) const = default;
};

struct AgreementCountKey {
  bool operator==(const AgreementCountKey&) const = default;
};

// Global payment index. payment_id is the decimal index "0", "1", ...
struct PaymentKey {
  std::string payment_id;
  bool operator==(const PaymentKey&) const = default;
};

struct PaymentRecordKey {
  std::string   agreement_id;
  std::uint32_t payment_number = 0;
  bool operator==(const PaymentRecordKey&) const = default;
};

struct PaymentCountKey {
  bool operator==(const PaymentCountKey&) const = default;
};

struct TokenBalanceKey {
  std::string token;
  std::string principal;
  bool operator==(const TokenBalanceKey&) const = default;
};

struct PropertyKey {
  std::string property_id;
  bool operator==(const PropertyKey&) const = default;
};

struct PropertyCountKey {
  bool operator==(const PropertyCountKey&) const = default;
};

struct PropertyRegistryStateKey {
  bool operator==(const PropertyRegistryStateKey&) const = default;
};

struct ObligationKey {
  std::string agreement_id;
  bool operator==(const ObligationKey&) const = default;
};

struct ObligationCountKey {
  bool operator==(const ObligationCountKey&) const = default;
};

struct ObligationRegistryStateKey {
  bool operator==(const ObligationRegistryStateKey&) const = default;
};

using StorageKey = std::variant<AgreementKey, AgreementCountKey, PaymentKey, PaymentRecordKey, PaymentCountKey, TokenBalanceKey, PropertyKey,
                                PropertyCountKey, PropertyRegistryStateKey, ObligationKey, ObligationCountKey, ObligationRegistryStateKey>;

struct StorageKeyHash {
  std::size_t operator()(const StorageKey& key) const;
};

// Injective: distinct keys never share a slot.
std::string EncodeSlot(const StorageKey& key);

// Counters and registry state are instance entries, entities are persistent.
db::Durability DurabilityOf(const StorageKey& key);

std::string Describe(const StorageKey& key);

} // namespace rentledger::storage
