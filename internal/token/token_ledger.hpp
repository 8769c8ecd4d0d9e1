#pragma once

#include <string>

#include "internal/model/types.hpp"

namespace rentledger::storage {
class LedgerStorage;
}

namespace rentledger::token {

/*
  Token transfer port.

  Transfers run against the invocation's storage so a later failure in the
  same invocation rolls them back. Throws util::TransferFailed.
*/
class TokenLedger {
 public:
  virtual ~TokenLedger() = default;

  virtual void Transfer(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& from,
                        const model::PrincipalId& to, model::Amount amount) = 0;

  // Returns the new balance of `to`. Throws InvalidAmount unless amount > 0.
  virtual model::Amount Mint(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& to,
                             model::Amount amount) = 0;

  virtual model::Amount BalanceOf(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& principal) const = 0;
};

} // namespace rentledger::token
