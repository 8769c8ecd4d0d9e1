#include "storage_key.hpp"

#include <functional>
#include <type_traits>

namespace rentledger::storage {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void AppendU32(std::string& out, std::uint32_t value) {
  out.push_back(static_cast<char>((value >> 24) & 0xFF));
  out.push_back(static_cast<char>((value >> 16) & 0xFF));
  out.push_back(static_cast<char>((value >> 8) & 0xFF));
  out.push_back(static_cast<char>(value & 0xFF));
}

void AppendField(std::string& out, const std::string& field) {
  AppendU32(out, static_cast<std::uint32_t>(field.size()));
  out.append(field);
}

void HashCombine(std::size_t& seed, std::size_t value) {
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace

std::size_t StorageKeyHash::operator()(const StorageKey& key) const {
  std::size_t seed = key.index();
  std::hash<std::string> str_hash;

  std::visit(Overloaded{
                 [&](const AgreementKey& k) { HashCombine(seed, str_hash(k.agreement_id)); },
                 [&](const PaymentKey& k) { HashCombine(seed, str_hash(k.payment_id)); },
                 [&](const PaymentRecordKey& k) {
                   HashCombine(seed, str_hash(k.agreement_id));
                   HashCombine(seed, std::hash<std::uint32_t>{}(k.payment_number));
                 },
                 [&](const TokenBalanceKey& k) {
                   HashCombine(seed, str_hash(k.token));
                   HashCombine(seed, str_hash(k.principal));
                 },
                 [&](const PropertyKey& k) { HashCombine(seed, str_hash(k.property_id)); },
                 [&](const ObligationKey& k) { HashCombine(seed, str_hash(k.agreement_id)); },
                 [](const auto&) {},
             },
             key);
  return seed;
}

std::string EncodeSlot(const StorageKey& key) {
  std::string out;
  out.push_back(static_cast<char>(key.index()));

  std::visit(Overloaded{
                 [&](const AgreementKey& k) { AppendField(out, k.agreement_id); },
                 [&](const PaymentKey& k) { AppendField(out, k.payment_id); },
                 [&](const PaymentRecordKey& k) {
                   AppendField(out, k.agreement_id);
                   AppendU32(out, k.payment_number);
                 },
                 [&](const TokenBalanceKey& k) {
                   AppendField(out, k.token);
                   AppendField(out, k.principal);
                 },
                 [&](const PropertyKey& k) { AppendField(out, k.property_id); },
                 [&](const ObligationKey& k) { AppendField(out, k.agreement_id); },
                 [](const auto&) {},
             },
             key);
  return out;
}

db::Durability DurabilityOf(const StorageKey& key) {
  return std::visit(
      [](const auto& k) {
        using K = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<K, AgreementCountKey> || std::is_same_v<K, PaymentCountKey> || std::is_same_v<K, PropertyCountKey> ||
                      std::is_same_v<K, PropertyRegistryStateKey> || std::is_same_v<K, ObligationCountKey> ||
                      std::is_same_v<K, ObligationRegistryStateKey>) {
          return db::Durability::kInstance;
        } else {
          return db::Durability::kPersistent;
        }
      },
      key);
}

std::string Describe(const StorageKey& key) {
  return std::visit(Overloaded{
                        [](const AgreementKey& k) { return "Agreement(" + k.agreement_id + ")"; },
                        [](const AgreementCountKey&) { return std::string("AgreementCount"); },
                        [](const PaymentKey& k) { return "Payment(" + k.payment_id + ")"; },
                        [](const PaymentRecordKey& k) {
                          return "PaymentRecord(" + k.agreement_id + "," + std::to_string(k.payment_number) + ")";
                        },
                        [](const PaymentCountKey&) { return std::string("PaymentCount"); },
                        [](const TokenBalanceKey& k) { return "TokenBalance(" + k.token + "," + k.principal + ")"; },
                        [](const PropertyKey& k) { return "Property(" + k.property_id + ")"; },
                        [](const PropertyCountKey&) { return std::string("PropertyCount"); },
                        [](const PropertyRegistryStateKey&) { return std::string("PropertyRegistryState"); },
                        [](const ObligationKey& k) { return "Obligation(" + k.agreement_id + ")"; },
                        [](const ObligationCountKey&) { return std::string("ObligationCount"); },
                        [](const ObligationRegistryStateKey&) { return std::string("ObligationRegistryState"); },
                    },
                    key);
}

} // namespace rentledger::storage
