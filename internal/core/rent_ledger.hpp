#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "internal/auth/authorizer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/ledger/invocation.hpp"
#include "internal/model/obligation.hpp"
#include "internal/model/payment_record.hpp"
#include "internal/model/property.hpp"
#include "internal/model/rent_agreement.hpp"
#include "internal/storage/ledger_storage.hpp"
#include "internal/token/token_ledger.hpp"
#include "internal/util/time.hpp"

namespace rentledger::core {

struct LedgerOptions {
  storage::TtlPolicy instance_ttl;
  storage::TtlPolicy persistent_ttl;

  // Principal allowed to mint tokens. Empty disables minting.
  model::PrincipalId token_admin;

  util::ClockFn clock = util::Now;
};

/*
  RentLedger

  Execution host of the ledger. Every operation runs to completion under
  one invocation lock inside one repository transaction:

  - mutating operations commit on success, roll back on any exception
  - buffered events are published only after commit
  - queries roll their transaction back
*/
class RentLedger {
 public:
  RentLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<token::TokenLedger> tokens,
             std::shared_ptr<events::EventSink> sink, LedgerOptions options = {});

  // ------------------------------------------------------------------
  // Agreements and payments
  // ------------------------------------------------------------------

  model::RentAgreement CreateAgreement(const auth::Authorizer& caller, const model::AgreementTerms& terms);
  model::RentAgreement TransitionAgreement(const auth::Authorizer& caller, const std::string& agreement_id, const model::PrincipalId& actor,
                                           model::AgreementStatus target);
  model::PaymentRecord PayRent(const auth::Authorizer& caller, const std::string& agreement_id, const std::string& token,
                               model::Amount amount);

  std::optional<model::RentAgreement> GetAgreement(const std::string& agreement_id);
  bool                                HasAgreement(const std::string& agreement_id);
  std::uint64_t                       GetAgreementCount();
  model::PaymentRecord                GetPayment(const std::string& payment_id);
  std::optional<model::PaymentRecord> GetPaymentRecord(const std::string& agreement_id, std::uint32_t payment_number);
  std::uint64_t                       GetPaymentCount();
  model::Amount                       GetTotalPaid(const std::string& agreement_id);

  // ------------------------------------------------------------------
  // Property registry
  // ------------------------------------------------------------------

  void                   InitializeRegistry(const auth::Authorizer& caller, const model::PrincipalId& admin);
  model::PropertyDetails RegisterProperty(const auth::Authorizer& caller, const model::PrincipalId& landlord, const std::string& property_id,
                                          const std::string& metadata_hash);
  model::PropertyDetails VerifyProperty(const auth::Authorizer& caller, const model::PrincipalId& admin, const std::string& property_id);

  std::optional<model::PropertyDetails>       GetProperty(const std::string& property_id);
  bool                                        HasProperty(const std::string& property_id);
  std::uint64_t                               GetPropertyCount();
  std::optional<model::PropertyRegistryState> GetRegistryState();

  // ------------------------------------------------------------------
  // Rent obligations
  // ------------------------------------------------------------------

  void                  InitializeObligations(const auth::Authorizer& caller);
  model::RentObligation MintObligation(const auth::Authorizer& caller, const std::string& agreement_id, const model::PrincipalId& landlord);
  model::RentObligation TransferObligation(const auth::Authorizer& caller, const model::PrincipalId& from, const model::PrincipalId& to,
                                           const std::string& agreement_id);

  std::optional<model::RentObligation> GetObligation(const std::string& agreement_id);
  std::optional<model::PrincipalId>    GetObligationOwner(const std::string& agreement_id);
  bool                                 HasObligation(const std::string& agreement_id);
  std::uint64_t                        GetObligationCount();

  // ------------------------------------------------------------------
  // Tokens
  // ------------------------------------------------------------------

  model::Amount MintTokens(const auth::Authorizer& caller, const std::string& token, const model::PrincipalId& to, model::Amount amount);
  model::Amount GetBalance(const std::string& token, const model::PrincipalId& principal);

 private:
  storage::LedgerStorage OpenStorage(db::Transaction& tx) const;
  void                   Publish(const std::vector<events::LedgerEvent>& events);

  template <class Fn>
  auto Mutate(const auth::Authorizer& caller, Fn&& fn) {
    std::lock_guard lock(invocation_mutex_);
    auto            tx      = repository_->Begin();
    auto            storage = OpenStorage(*tx);
    ledger::Invocation inv{storage, caller, {}};

    if constexpr (std::is_void_v<std::invoke_result_t<Fn&, ledger::Invocation&>>) {
      fn(inv);
      tx->Commit();
      Publish(inv.events);
    } else {
      auto result = fn(inv);
      tx->Commit();
      Publish(inv.events);
      return result;
    }
  }

  template <class Fn>
  auto Query(Fn&& fn) {
    std::lock_guard lock(invocation_mutex_);
    auto            tx      = repository_->Begin();
    auto            storage = OpenStorage(*tx);
    auto            result  = fn(storage);
    tx->Rollback();
    return result;
  }

  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<token::TokenLedger> tokens_;
  std::shared_ptr<events::EventSink>  sink_;
  LedgerOptions                       options_;

  // Serializes invocations; the repository transaction makes each atomic.
  std::mutex invocation_mutex_;
};

} // namespace rentledger::core
