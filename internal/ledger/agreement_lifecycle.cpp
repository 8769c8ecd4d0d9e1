#include "agreement_lifecycle.hpp"

#include "internal/ledger/agreement_validator.hpp"
#include "internal/util/errors.hpp"

namespace rentledger::ledger {

model::RentAgreement CreateAgreement(Invocation& inv, const model::AgreementTerms& terms) {
  inv.caller.RequireAuth(terms.tenant);

  ValidateAgreementParams(terms.monthly_rent, terms.security_deposit, terms.start_date, terms.end_date, terms.agent_commission_rate)
      .ThrowIfInvalid();

  // An agent is present exactly when a commission applies.
  if (!terms.agent && terms.agent_commission_rate > 0) {
    throw util::InvalidCommissionRate("commission rate " + std::to_string(terms.agent_commission_rate) + " requires an agent");
  }
  if (terms.agent && terms.agent_commission_rate == 0) {
    throw util::InvalidCommissionRate("agent " + *terms.agent + " requires a non-zero commission rate");
  }

  const storage::AgreementKey key{terms.agreement_id};
  if (inv.storage.Has(key)) {
    throw util::AlreadyExists(util::ErrorCode::kAgreementAlreadyExists, "agreement " + terms.agreement_id + " already exists");
  }

  model::RentAgreement agreement{
      .agreement_id          = terms.agreement_id,
      .landlord              = terms.landlord,
      .tenant                = terms.tenant,
      .agent                 = terms.agent,
      .monthly_rent          = terms.monthly_rent,
      .security_deposit      = terms.security_deposit,
      .start_date            = terms.start_date,
      .end_date              = terms.end_date,
      .agent_commission_rate = terms.agent_commission_rate,
      .status                = model::AgreementStatus::kDraft,
  };

  inv.storage.Set(key, agreement);
  inv.storage.IncrementCounter(storage::AgreementCountKey{});
  inv.Emit(events::AgreementCreated{agreement.agreement_id});
  return agreement;
}

model::RentAgreement TransitionAgreement(Invocation& inv, const std::string& agreement_id, const model::PrincipalId& actor,
                                         model::AgreementStatus target) {
  const storage::AgreementKey key{agreement_id};
  auto                        agreement = inv.storage.Get<model::RentAgreement>(key);
  if (!agreement) {
    throw util::NotFound(util::ErrorCode::kAgreementNotFound, "agreement " + agreement_id + " not found");
  }

  if (actor != agreement->landlord && actor != agreement->tenant) {
    throw util::Unauthorized(actor + " is not a party to agreement " + agreement_id);
  }
  inv.caller.RequireAuth(actor);

  const auto from = agreement->status;
  if (!model::CanTransition(from, target)) {
    throw util::InvalidState(util::ErrorCode::kInvalidTransition,
                             "cannot move agreement from " + std::string(model::ToString(from)) + " to " + std::string(model::ToString(target)));
  }
  if (target == model::AgreementStatus::kActive && actor != agreement->landlord) {
    throw util::Unauthorized("only the landlord may activate agreement " + agreement_id);
  }

  agreement->status = target;
  inv.storage.Set(key, *agreement);
  inv.Emit(events::AgreementStatusChanged{agreement_id, from, target});
  return *agreement;
}

} // namespace rentledger::ledger
