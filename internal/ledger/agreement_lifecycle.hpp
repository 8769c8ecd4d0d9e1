#pragma once

#include <string>

#include "internal/ledger/invocation.hpp"
#include "internal/model/rent_agreement.hpp"

namespace rentledger::ledger {

/*
  Agreement lifecycle.

  CreateAgreement stores a Draft agreement with zeroed aggregates and bumps
  AgreementCount. TransitionAgreement moves it along the status graph in
  model::CanTransition; only the landlord may activate.
*/

model::RentAgreement CreateAgreement(Invocation& inv, const model::AgreementTerms& terms);

model::RentAgreement TransitionAgreement(Invocation& inv, const std::string& agreement_id, const model::PrincipalId& actor,
                                         model::AgreementStatus target);

} // namespace rentledger::ledger
