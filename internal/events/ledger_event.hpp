#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "internal/model/agreement_status.hpp"
#include "internal/model/types.hpp"

namespace rentledger::events {

struct AgreementCreated {
  std::string agreement_id;
};

struct AgreementStatusChanged {
  std::string            agreement_id;
  model::AgreementStatus from;
  model::AgreementStatus to;
};

struct RentPaid {
  std::string      agreement_id;
  model::Amount    amount          = 0;
  model::Amount    landlord_amount = 0;
  model::Amount    agent_amount    = 0;
  model::Timestamp timestamp       = 0;
};

struct RegistryInitialized {
  model::PrincipalId admin;
};

struct PropertyRegistered {
  std::string        property_id;
  model::PrincipalId landlord;
};

struct PropertyVerified {
  std::string        property_id;
  model::PrincipalId admin;
};

struct ObligationMinted {
  std::string        agreement_id;
  model::PrincipalId owner;
};

struct ObligationTransferred {
  std::string        agreement_id;
  model::PrincipalId from;
  model::PrincipalId to;
};

using LedgerEvent = std::variant<AgreementCreated, AgreementStatusChanged, RentPaid, RegistryInitialized, PropertyRegistered,
                                 PropertyVerified, ObligationMinted, ObligationTransferred>;

std::string_view Topic(const LedgerEvent& event);

} // namespace rentledger::events
