#include "store_token_ledger.hpp"

#include <limits>

#include "internal/storage/ledger_storage.hpp"
#include "internal/util/errors.hpp"

namespace rentledger::token {

model::Amount StoreTokenLedger::BalanceOf(storage::LedgerStorage& storage, const std::string& token,
                                          const model::PrincipalId& principal) const {
  auto bytes = storage.Read(storage::TokenBalanceKey{token, principal});
  return bytes ? storage::DecodeBalance(*bytes) : 0;
}

void StoreTokenLedger::SetBalance(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& principal,
                                  model::Amount amount) {
  storage.Write(storage::TokenBalanceKey{token, principal}, storage::EncodeBalance(amount));
}

void StoreTokenLedger::Transfer(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& from,
                                const model::PrincipalId& to, model::Amount amount) {
  if (amount < 0) {
    throw util::TransferFailed("negative transfer amount");
  }
  if (amount == 0) return;

  const auto from_balance = BalanceOf(storage, token, from);
  if (from_balance < amount) {
    throw util::TransferFailed("insufficient " + token + " balance for " + from);
  }
  if (from == to) return;

  const auto to_balance = BalanceOf(storage, token, to);
  if (to_balance > std::numeric_limits<model::Amount>::max() - amount) {
    throw util::TransferFailed("balance overflow for " + to);
  }

  SetBalance(storage, token, from, from_balance - amount);
  SetBalance(storage, token, to, to_balance + amount);
}

model::Amount StoreTokenLedger::Mint(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& to,
                                     model::Amount amount) {
  if (amount <= 0) {
    throw util::InvalidAmount("mint amount must be positive");
  }
  const auto balance = BalanceOf(storage, token, to);
  if (balance > std::numeric_limits<model::Amount>::max() - amount) {
    throw util::InvalidAmount("mint would overflow balance");
  }
  SetBalance(storage, token, to, balance + amount);
  return balance + amount;
}

} // namespace rentledger::token
