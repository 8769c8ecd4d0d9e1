#include "rent_ledger.hpp"

#include <stdexcept>

#include "internal/ledger/agreement_lifecycle.hpp"
#include "internal/ledger/ledger_queries.hpp"
#include "internal/ledger/payment_processor.hpp"
#include "internal/obligation/obligation_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/property_registry.hpp"
#include "internal/util/errors.hpp"

namespace rentledger::core {

RentLedger::RentLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<token::TokenLedger> tokens,
                       std::shared_ptr<events::EventSink> sink, LedgerOptions options)
    : repository_(std::move(repository)), tokens_(std::move(tokens)), sink_(std::move(sink)), options_(std::move(options)) {
  if (!repository_) throw std::invalid_argument("RentLedger requires a repository");
  if (!tokens_) throw std::invalid_argument("RentLedger requires a token ledger");
  if (!options_.clock) options_.clock = util::Now;
}

storage::LedgerStorage RentLedger::OpenStorage(db::Transaction& tx) const {
  return storage::LedgerStorage(*repository_, tx, options_.instance_ttl, options_.persistent_ttl, util::ToUnixSeconds(options_.clock()));
}

void RentLedger::Publish(const std::vector<events::LedgerEvent>& events) {
  if (!sink_) return;
  for (const auto& event : events) {
    try {
      sink_->Publish(event);
    } catch (const std::exception& e) {
      // The invocation is already committed.
      RENTLEDGER_LOG_ERROR("event publish failed",
                           {observability::StringField("topic", events::Topic(event)), observability::StringField("error", e.what())});
    }
  }
}

// ---------------------------------------------------------------------
// Agreements and payments
// ---------------------------------------------------------------------

model::RentAgreement RentLedger::CreateAgreement(const auth::Authorizer& caller, const model::AgreementTerms& terms) {
  return Mutate(caller, [&](ledger::Invocation& inv) { return ledger::CreateAgreement(inv, terms); });
}

model::RentAgreement RentLedger::TransitionAgreement(const auth::Authorizer& caller, const std::string& agreement_id,
                                                     const model::PrincipalId& actor, model::AgreementStatus target) {
  return Mutate(caller, [&](ledger::Invocation& inv) { return ledger::TransitionAgreement(inv, agreement_id, actor, target); });
}

model::PaymentRecord RentLedger::PayRent(const auth::Authorizer& caller, const std::string& agreement_id, const std::string& token,
                                         model::Amount amount) {
  return Mutate(caller, [&](ledger::Invocation& inv) { return ledger::PayRent(inv, *tokens_, agreement_id, token, amount); });
}

std::optional<model::RentAgreement> RentLedger::GetAgreement(const std::string& agreement_id) {
  return Query([&](storage::LedgerStorage& s) { return ledger::GetAgreement(s, agreement_id); });
}

bool RentLedger::HasAgreement(const std::string& agreement_id) {
  return Query([&](storage::LedgerStorage& s) { return ledger::HasAgreement(s, agreement_id); });
}

std::uint64_t RentLedger::GetAgreementCount() {
  return Query([](storage::LedgerStorage& s) { return ledger::GetAgreementCount(s); });
}

model::PaymentRecord RentLedger::GetPayment(const std::string& payment_id) {
  return Query([&](storage::LedgerStorage& s) { return ledger::GetPayment(s, payment_id); });
}

std::optional<model::PaymentRecord> RentLedger::GetPaymentRecord(const std::string& agreement_id, std::uint32_t payment_number) {
  return Query([&](storage::LedgerStorage& s) { return ledger::GetPaymentRecord(s, agreement_id, payment_number); });
}

std::uint64_t RentLedger::GetPaymentCount() {
  return Query([](storage::LedgerStorage& s) { return ledger::GetPaymentCount(s); });
}

model::Amount RentLedger::GetTotalPaid(const std::string& agreement_id) {
  return Query([&](storage::LedgerStorage& s) { return ledger::GetTotalPaid(s, agreement_id); });
}

// ---------------------------------------------------------------------
// Property registry
// ---------------------------------------------------------------------

void RentLedger::InitializeRegistry(const auth::Authorizer& caller, const model::PrincipalId& admin) {
  Mutate(caller, [&](ledger::Invocation& inv) { registry::InitializeRegistry(inv, admin); });
}

model::PropertyDetails RentLedger::RegisterProperty(const auth::Authorizer& caller, const model::PrincipalId& landlord,
                                                    const std::string& property_id, const std::string& metadata_hash) {
  return Mutate(caller, [&](ledger::Invocation& inv) { return registry::RegisterProperty(inv, landlord, property_id, metadata_hash); });
}

model::PropertyDetails RentLedger::VerifyProperty(const auth::Authorizer& caller, const model::PrincipalId& admin,
                                                  const std::string& property_id) {
  return Mutate(caller, [&](ledger::Invocation& inv) { return registry::VerifyProperty(inv, admin, property_id); });
}

std::optional<model::PropertyDetails> RentLedger::GetProperty(const std::string& property_id) {
  return Query([&](storage::LedgerStorage& s) { return registry::GetProperty(s, property_id); });
}

bool RentLedger::HasProperty(const std::string& property_id) {
  return Query([&](storage::LedgerStorage& s) { return registry::HasProperty(s, property_id); });
}

std::uint64_t RentLedger::GetPropertyCount() {
  return Query([](storage::LedgerStorage& s) { return registry::GetPropertyCount(s); });
}

std::optional<model::PropertyRegistryState> RentLedger::GetRegistryState() {
  return Query([](storage::LedgerStorage& s) { return registry::GetRegistryState(s); });
}

// ---------------------------------------------------------------------
// Rent obligations
// ---------------------------------------------------------------------

void RentLedger::InitializeObligations(const auth::Authorizer& caller) {
  Mutate(caller, [](ledger::Invocation& inv) { obligation::InitializeObligations(inv); });
}

model::RentObligation RentLedger::MintObligation(const auth::Authorizer& caller, const std::string& agreement_id,
                                                 const model::PrincipalId& landlord) {
  return Mutate(caller, [&](ledger::Invocation& inv) { return obligation::MintObligation(inv, agreement_id, landlord); });
}

model::RentObligation RentLedger::TransferObligation(const auth::Authorizer& caller, const model::PrincipalId& from,
                                                     const model::PrincipalId& to, const std::string& agreement_id) {
  return Mutate(caller, [&](ledger::Invocation& inv) { return obligation::TransferObligation(inv, from, to, agreement_id); });
}

std::optional<model::RentObligation> RentLedger::GetObligation(const std::string& agreement_id) {
  return Query([&](storage::LedgerStorage& s) { return obligation::GetObligation(s, agreement_id); });
}

std::optional<model::PrincipalId> RentLedger::GetObligationOwner(const std::string& agreement_id) {
  return Query([&](storage::LedgerStorage& s) { return obligation::GetObligationOwner(s, agreement_id); });
}

bool RentLedger::HasObligation(const std::string& agreement_id) {
  return Query([&](storage::LedgerStorage& s) { return obligation::HasObligation(s, agreement_id); });
}

std::uint64_t RentLedger::GetObligationCount() {
  return Query([](storage::LedgerStorage& s) { return obligation::GetObligationCount(s); });
}

// ---------------------------------------------------------------------
// Tokens
// ---------------------------------------------------------------------

model::Amount RentLedger::MintTokens(const auth::Authorizer& caller, const std::string& token, const model::PrincipalId& to,
                                     model::Amount amount) {
  if (options_.token_admin.empty()) {
    throw util::InvalidState(util::ErrorCode::kNotInitialized, "no token admin configured");
  }
  return Mutate(caller, [&](ledger::Invocation& inv) {
    inv.caller.RequireAuth(options_.token_admin);
    return tokens_->Mint(inv.storage, token, to, amount);
  });
}

model::Amount RentLedger::GetBalance(const std::string& token, const model::PrincipalId& principal) {
  return Query([&](storage::LedgerStorage& s) { return tokens_->BalanceOf(s, token, principal); });
}

} // namespace rentledger::core
