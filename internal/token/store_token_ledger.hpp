#pragma once

#include "internal/token/token_ledger.hpp"

namespace rentledger::token {

// Balances kept in the ledger store under TokenBalance keys.
class StoreTokenLedger final : public TokenLedger {
 public:
  void Transfer(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& from, const model::PrincipalId& to,
                model::Amount amount) override;

  model::Amount Mint(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& to, model::Amount amount) override;

  model::Amount BalanceOf(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& principal) const override;

 private:
  static void SetBalance(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& principal,
                         model::Amount amount);
};

} // namespace rentledger::token
