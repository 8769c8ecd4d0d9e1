#include <cassert>
#include <iostream>
#include <variant>

#include "internal/obligation/obligation_registry.hpp"
#include "unit/test_support.hpp"

namespace {

using namespace rentledger;
using rentledger::testing::AllowAll;
using rentledger::testing::ExpectThrow;
using rentledger::testing::kNow;
using rentledger::testing::StorageFixture;

void TestInitializeOnce() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation inv{fx.storage, allow, {}};

  obligation::InitializeObligations(inv);
  auto e = ExpectThrow<util::AlreadyExists>([&] { obligation::InitializeObligations(inv); });
  assert(e.code() == util::ErrorCode::kAlreadyInitialized);
  assert(inv.events.empty());
}

void TestMintRequiresInitialization() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation inv{fx.storage, allow, {}};

  auto e = ExpectThrow<util::InvalidState>([&] { obligation::MintObligation(inv, "agreement-1", "landlord"); });
  assert(e.code() == util::ErrorCode::kNotInitialized);
  assert(obligation::GetObligationCount(fx.storage) == 0);
}

void TestMintToLandlord() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation inv{fx.storage, allow, {}};
  obligation::InitializeObligations(inv);

  auto minted = obligation::MintObligation(inv, "agreement-1", "landlord");
  assert(minted.owner == "landlord");
  assert(minted.minted_at == kNow);
  assert(obligation::GetObligation(fx.storage, "agreement-1") == minted);
  assert(obligation::GetObligationOwner(fx.storage, "agreement-1") == std::optional<model::PrincipalId>("landlord"));
  assert(obligation::HasObligation(fx.storage, "agreement-1"));
  assert(obligation::GetObligationCount(fx.storage) == 1);

  auto dup = ExpectThrow<util::AlreadyExists>([&] { obligation::MintObligation(inv, "agreement-1", "landlord"); });
  assert(dup.code() == util::ErrorCode::kObligationAlreadyExists);
  assert(obligation::GetObligationCount(fx.storage) == 1);

  auto event = std::get<events::ObligationMinted>(inv.events.at(0));
  assert(event.agreement_id == "agreement-1");
  assert(event.owner == "landlord");
}

void TestMintRequiresLandlordAuth() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation setup{fx.storage, allow, {}};
  obligation::InitializeObligations(setup);

  auth::CallerAuthorizer tenant_only{"tenant"};
  ledger::Invocation     inv{fx.storage, tenant_only, {}};
  ExpectThrow<util::Unauthorized>([&] { obligation::MintObligation(inv, "agreement-1", "landlord"); });
  assert(!obligation::HasObligation(fx.storage, "agreement-1"));
}

void TestTransfer() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation inv{fx.storage, allow, {}};
  obligation::InitializeObligations(inv);
  obligation::MintObligation(inv, "agreement-1", "landlord");

  auto moved = obligation::TransferObligation(inv, "landlord", "investor", "agreement-1");
  assert(moved.owner == "investor");
  assert(moved.minted_at == kNow);
  assert(obligation::GetObligationOwner(fx.storage, "agreement-1") == std::optional<model::PrincipalId>("investor"));

  // Old owner no longer holds it.
  ExpectThrow<util::Unauthorized>([&] { obligation::TransferObligation(inv, "landlord", "x", "agreement-1"); });

  auto missing = ExpectThrow<util::NotFound>([&] { obligation::TransferObligation(inv, "investor", "x", "agreement-9"); });
  assert(missing.code() == util::ErrorCode::kObligationNotFound);

  auto event = std::get<events::ObligationTransferred>(inv.events.back());
  assert(event.from == "landlord");
  assert(event.to == "investor");
  assert(obligation::GetObligationCount(fx.storage) == 1);
}

void TestTransferRequiresSenderAuth() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation setup{fx.storage, allow, {}};
  obligation::InitializeObligations(setup);
  obligation::MintObligation(setup, "agreement-1", "landlord");

  auth::CallerAuthorizer investor_only{"investor"};
  ledger::Invocation     inv{fx.storage, investor_only, {}};
  ExpectThrow<util::Unauthorized>([&] { obligation::TransferObligation(inv, "landlord", "investor", "agreement-1"); });
  assert(obligation::GetObligationOwner(fx.storage, "agreement-1") == std::optional<model::PrincipalId>("landlord"));
}

void TestMissingObligationQueries() {
  StorageFixture fx;
  assert(!obligation::GetObligation(fx.storage, "agreement-1").has_value());
  assert(!obligation::GetObligationOwner(fx.storage, "agreement-1").has_value());
  assert(!obligation::HasObligation(fx.storage, "agreement-1"));
}

} // namespace

int main() {
  TestInitializeOnce();
  TestMintRequiresInitialization();
  TestMintToLandlord();
  TestMintRequiresLandlordAuth();
  TestTransfer();
  TestTransferRequiresSenderAuth();
  TestMissingObligationQueries();

  std::cout << "rentledger_unit_obligation_registry: pass\n";
  return 0;
}
