#pragma once

#include <string>

#include "internal/model/types.hpp"

namespace rentledger::model {

// Transferable right to receive the rent of one agreement.
struct RentObligation {
  std::string agreement_id;
  PrincipalId owner;
  Timestamp   minted_at = 0;

  bool operator==(const RentObligation&) const = default;
};

}  // namespace rentledger::model
