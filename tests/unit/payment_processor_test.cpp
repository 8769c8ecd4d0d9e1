#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <variant>

#include "internal/core/rent_ledger.hpp"
#include "internal/ledger/agreement_lifecycle.hpp"
#include "internal/ledger/ledger_queries.hpp"
#include "internal/ledger/payment_processor.hpp"
#include "internal/token/store_token_ledger.hpp"
#include "unit/test_support.hpp"

namespace {

using namespace rentledger;
using rentledger::model::AgreementStatus;
using rentledger::testing::AllowAll;
using rentledger::testing::ExpectThrow;
using rentledger::testing::kNow;
using rentledger::testing::StorageFixture;
using rentledger::testing::Terms;

constexpr const char* kToken = "usd";

// Delegates to the store ledger but fails the transfer numbered fail_on (1-based).
// fail_on == 0 never fails.
class FailingTokenLedger final : public token::TokenLedger {
 public:
  explicit FailingTokenLedger(int fail_on) : fail_on_(fail_on) {
  }

  int Transfers() const {
    return transfers_;
  }

  void Transfer(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& from, const model::PrincipalId& to,
                model::Amount amount) override {
    if (++transfers_ == fail_on_) {
      throw util::TransferFailed("injected failure");
    }
    inner_.Transfer(storage, token, from, to, amount);
  }

  model::Amount Mint(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& to, model::Amount amount) override {
    return inner_.Mint(storage, token, to, amount);
  }

  model::Amount BalanceOf(storage::LedgerStorage& storage, const std::string& token, const model::PrincipalId& principal) const override {
    return inner_.BalanceOf(storage, token, principal);
  }

 private:
  token::StoreTokenLedger inner_;
  int                     fail_on_;
  int                     transfers_ = 0;
};

// Active agreement-1 with the tenant funded for `months` payments.
void SeedActive(ledger::Invocation& inv, token::TokenLedger& tokens, int months, const model::AgreementTerms& terms = Terms()) {
  ledger::CreateAgreement(inv, terms);
  ledger::TransitionAgreement(inv, terms.agreement_id, terms.landlord, AgreementStatus::kActive);
  tokens.Mint(inv.storage, kToken, terms.tenant, terms.monthly_rent * months);
}

void TestPayRentSplitsAndRecords() {
  StorageFixture          fx;
  AllowAll                allow;
  token::StoreTokenLedger tokens;
  ledger::Invocation      inv{fx.storage, allow, {}};
  SeedActive(inv, tokens, 3);
  inv.events.clear();

  auto record = ledger::PayRent(inv, tokens, "agreement-1", kToken, 1000);
  assert(record.payment_number == 1);
  assert(record.amount == 1000);
  assert(record.landlord_amount == 900);
  assert(record.agent_amount == 100);
  assert(record.timestamp == kNow);
  assert(record.tenant == "tenant");

  assert(tokens.BalanceOf(fx.storage, kToken, "tenant") == 2000);
  assert(tokens.BalanceOf(fx.storage, kToken, "landlord") == 900);
  assert(tokens.BalanceOf(fx.storage, kToken, "agent") == 100);

  auto agreement = ledger::GetAgreement(fx.storage, "agreement-1");
  assert(agreement->total_rent_paid == 1000);
  assert(agreement->payment_count == 1);

  assert(ledger::GetPaymentRecord(fx.storage, "agreement-1", 1) == record);
  assert(ledger::GetPayment(fx.storage, "0") == record);
  assert(ledger::GetPaymentCount(fx.storage) == 1);

  auto second = ledger::PayRent(inv, tokens, "agreement-1", kToken, 1000);
  assert(second.payment_number == 2);
  assert(ledger::GetPayment(fx.storage, "1") == second);
  assert(ledger::GetPaymentCount(fx.storage) == 2);
  assert(ledger::GetAgreement(fx.storage, "agreement-1")->total_rent_paid == 2000);

  assert(inv.events.size() == 2);
  auto paid = std::get<events::RentPaid>(inv.events[0]);
  assert(paid.agreement_id == "agreement-1");
  assert(paid.amount == 1000);
  assert(paid.landlord_amount == 900);
  assert(paid.agent_amount == 100);
  assert(paid.timestamp == kNow);
}

void TestNoAgentPaysLandlordInFull() {
  StorageFixture     fx;
  AllowAll           allow;
  FailingTokenLedger tokens(0);
  ledger::Invocation inv{fx.storage, allow, {}};

  auto terms                  = Terms();
  terms.agent                 = std::nullopt;
  terms.agent_commission_rate = 0;
  SeedActive(inv, tokens, 1, terms);

  auto record = ledger::PayRent(inv, tokens, "agreement-1", kToken, 1000);
  assert(tokens.Transfers() == 1);
  assert(record.landlord_amount == 1000);
  assert(record.agent_amount == 0);
  assert(tokens.BalanceOf(fx.storage, kToken, "landlord") == 1000);
  assert(tokens.BalanceOf(fx.storage, kToken, "tenant") == 0);
  assert(ledger::GetAgreement(fx.storage, "agreement-1")->total_rent_paid == 1000);
}

void TestFivePercentCommissionUsesTwoTransfers() {
  StorageFixture     fx;
  AllowAll           allow;
  FailingTokenLedger tokens(0);
  ledger::Invocation inv{fx.storage, allow, {}};

  auto terms                  = Terms();
  terms.agent_commission_rate = 500;
  SeedActive(inv, tokens, 1, terms);

  auto record = ledger::PayRent(inv, tokens, "agreement-1", kToken, 1000);
  assert(tokens.Transfers() == 2);
  assert(record.landlord_amount == 950);
  assert(record.agent_amount == 50);
  assert(tokens.BalanceOf(fx.storage, kToken, "landlord") == 950);
  assert(tokens.BalanceOf(fx.storage, kToken, "agent") == 50);
  assert(tokens.BalanceOf(fx.storage, kToken, "tenant") == 0);
}

void TestZeroAgentShareSkipsAgentTransfer() {
  StorageFixture     fx;
  AllowAll           allow;
  FailingTokenLedger tokens(0);
  ledger::Invocation inv{fx.storage, allow, {}};

  // 19 * 500 / 10000 floors to 0.
  auto terms                  = Terms();
  terms.monthly_rent          = 19;
  terms.agent_commission_rate = 500;
  SeedActive(inv, tokens, 1, terms);

  auto record = ledger::PayRent(inv, tokens, "agreement-1", kToken, 19);
  assert(tokens.Transfers() == 1);
  assert(record.landlord_amount == 19);
  assert(record.agent_amount == 0);
  assert(tokens.BalanceOf(fx.storage, kToken, "landlord") == 19);
  assert(tokens.BalanceOf(fx.storage, kToken, "agent") == 0);
}

void TestTenantAsLandlordStillNeedsBalance() {
  StorageFixture          fx;
  AllowAll                allow;
  token::StoreTokenLedger tokens;
  ledger::Invocation      inv{fx.storage, allow, {}};

  auto terms     = Terms();
  terms.landlord = "tenant";
  ledger::CreateAgreement(inv, terms);
  ledger::TransitionAgreement(inv, "agreement-1", "tenant", AgreementStatus::kActive);

  ExpectThrow<util::TransferFailed>([&] { ledger::PayRent(inv, tokens, "agreement-1", kToken, 1000); });
  assert(ledger::GetAgreement(fx.storage, "agreement-1")->payment_count == 0);
  assert(ledger::GetPaymentCount(fx.storage) == 0);
}

void TestPreconditions() {
  StorageFixture          fx;
  AllowAll                allow;
  token::StoreTokenLedger tokens;
  ledger::Invocation      inv{fx.storage, allow, {}};

  auto missing = ExpectThrow<util::NotFound>([&] { ledger::PayRent(inv, tokens, "agreement-1", kToken, 1000); });
  assert(missing.code() == util::ErrorCode::kAgreementNotFound);

  ledger::CreateAgreement(inv, Terms());
  tokens.Mint(fx.storage, kToken, "tenant", 5000);
  ExpectThrow<util::NotActive>([&] { ledger::PayRent(inv, tokens, "agreement-1", kToken, 1000); });

  ledger::TransitionAgreement(inv, "agreement-1", "landlord", AgreementStatus::kActive);
  ExpectThrow<util::InvalidAmount>([&] { ledger::PayRent(inv, tokens, "agreement-1", kToken, 999); });
  ExpectThrow<util::InvalidAmount>([&] { ledger::PayRent(inv, tokens, "agreement-1", kToken, 1001); });

  auth::CallerAuthorizer landlord_only{"landlord"};
  ledger::Invocation     not_tenant{fx.storage, landlord_only, {}};
  ExpectThrow<util::Unauthorized>([&] { ledger::PayRent(not_tenant, tokens, "agreement-1", kToken, 1000); });

  // Nothing was written by the rejected attempts.
  assert(tokens.BalanceOf(fx.storage, kToken, "tenant") == 5000);
  assert(ledger::GetPaymentCount(fx.storage) == 0);
  assert(ledger::GetAgreement(fx.storage, "agreement-1")->payment_count == 0);
}

void TestOverflowIsInvalidAmount() {
  StorageFixture          fx;
  AllowAll                allow;
  token::StoreTokenLedger tokens;
  ledger::Invocation      inv{fx.storage, allow, {}};
  SeedActive(inv, tokens, 1);

  auto agreement            = *ledger::GetAgreement(fx.storage, "agreement-1");
  agreement.total_rent_paid = std::numeric_limits<model::Amount>::max() - 10;
  fx.storage.Set(storage::AgreementKey{"agreement-1"}, agreement);
  ExpectThrow<util::InvalidAmount>([&] { ledger::PayRent(inv, tokens, "agreement-1", kToken, 1000); });

  agreement.total_rent_paid = 0;
  agreement.payment_count   = std::numeric_limits<std::uint32_t>::max();
  fx.storage.Set(storage::AgreementKey{"agreement-1"}, agreement);
  ExpectThrow<util::InvalidAmount>([&] { ledger::PayRent(inv, tokens, "agreement-1", kToken, 1000); });

  assert(tokens.BalanceOf(fx.storage, kToken, "tenant") == 1000);
}

core::RentLedger MakeLedger(std::shared_ptr<db::Repository> repo, std::shared_ptr<token::TokenLedger> tokens,
                            std::shared_ptr<events::EventSink> sink) {
  core::LedgerOptions options;
  options.token_admin = "bank";
  options.clock       = rentledger::testing::FixedClock(kNow);
  return core::RentLedger(std::move(repo), std::move(tokens), std::move(sink), options);
}

void TestFailedAgentTransferRollsBackEverything() {
  auto repo   = std::make_shared<db::memory::MemoryRepository>();
  auto tokens = std::make_shared<FailingTokenLedger>(2);
  auto sink   = std::make_shared<rentledger::testing::RecordingEventSink>();
  auto rent   = MakeLedger(repo, tokens, sink);

  AllowAll allow;
  rent.CreateAgreement(allow, Terms());
  rent.TransitionAgreement(allow, "agreement-1", "landlord", AgreementStatus::kActive);
  rent.MintTokens(allow, kToken, "tenant", 3000);
  const auto events_before = sink->Events().size();

  // Transfer 1 (landlord share) succeeds, transfer 2 (agent share) fails.
  ExpectThrow<util::TransferFailed>([&] { rent.PayRent(allow, "agreement-1", kToken, 1000); });

  assert(rent.GetBalance(kToken, "tenant") == 3000);
  assert(rent.GetBalance(kToken, "landlord") == 0);
  assert(rent.GetBalance(kToken, "agent") == 0);
  assert(rent.GetPaymentCount() == 0);
  assert(!rent.GetPaymentRecord("agreement-1", 1).has_value());
  assert(rent.GetAgreement("agreement-1")->total_rent_paid == 0);
  assert(rent.GetAgreement("agreement-1")->payment_count == 0);
  assert(sink->Events().size() == events_before);

  // Next attempt goes through (transfers 3 and 4).
  auto record = rent.PayRent(allow, "agreement-1", kToken, 1000);
  assert(record.payment_number == 1);
  assert(rent.GetBalance(kToken, "landlord") == 900);
  assert(rent.GetBalance(kToken, "agent") == 100);
  assert(std::holds_alternative<events::RentPaid>(sink->Events().back()));
}

void TestInsufficientBalanceFailsWithoutEffect() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  auto sink = std::make_shared<rentledger::testing::RecordingEventSink>();
  auto rent = MakeLedger(repo, std::make_shared<token::StoreTokenLedger>(), sink);

  AllowAll allow;
  rent.CreateAgreement(allow, Terms());
  rent.TransitionAgreement(allow, "agreement-1", "landlord", AgreementStatus::kActive);
  rent.MintTokens(allow, kToken, "tenant", 500);

  ExpectThrow<util::TransferFailed>([&] { rent.PayRent(allow, "agreement-1", kToken, 1000); });
  assert(rent.GetBalance(kToken, "tenant") == 500);
  assert(rent.GetPaymentCount() == 0);
}

} // namespace

int main() {
  TestPayRentSplitsAndRecords();
  TestNoAgentPaysLandlordInFull();
  TestFivePercentCommissionUsesTwoTransfers();
  TestZeroAgentShareSkipsAgentTransfer();
  TestTenantAsLandlordStillNeedsBalance();
  TestPreconditions();
  TestOverflowIsInvalidAmount();
  TestFailedAgentTransferRollsBackEverything();
  TestInsufficientBalanceFailsWithoutEffect();

  std::cout << "rentledger_unit_payment_processor: pass\n";
  return 0;
}
