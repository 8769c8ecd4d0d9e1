#include <cassert>
#include <iostream>
#include <variant>

#include "internal/registry/property_registry.hpp"
#include "unit/test_support.hpp"

namespace {

using namespace rentledger;
using rentledger::testing::AllowAll;
using rentledger::testing::ExpectThrow;
using rentledger::testing::kNow;
using rentledger::testing::RejectAll;
using rentledger::testing::StorageFixture;

void TestInitializeOnce() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation inv{fx.storage, allow, {}};

  assert(!registry::GetRegistryState(fx.storage).has_value());
  registry::InitializeRegistry(inv, "admin");

  auto state = registry::GetRegistryState(fx.storage);
  assert(state.has_value());
  assert(state->initialized);
  assert(state->admin == "admin");
  assert(std::get<events::RegistryInitialized>(inv.events.at(0)).admin == "admin");

  auto e = ExpectThrow<util::AlreadyExists>([&] { registry::InitializeRegistry(inv, "someone-else"); });
  assert(e.code() == util::ErrorCode::kAlreadyInitialized);
  assert(registry::GetRegistryState(fx.storage)->admin == "admin");
}

void TestInitializeRequiresAdminAuth() {
  StorageFixture     fx;
  RejectAll          reject;
  ledger::Invocation inv{fx.storage, reject, {}};

  ExpectThrow<util::Unauthorized>([&] { registry::InitializeRegistry(inv, "admin"); });
  assert(!registry::GetRegistryState(fx.storage).has_value());
}

void TestRegisterProperty() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation inv{fx.storage, allow, {}};

  auto before = ExpectThrow<util::InvalidState>([&] { registry::RegisterProperty(inv, "landlord", "p-1", "hash"); });
  assert(before.code() == util::ErrorCode::kNotInitialized);

  registry::InitializeRegistry(inv, "admin");

  auto property = registry::RegisterProperty(inv, "landlord", "p-1", "hash");
  assert(property.landlord == "landlord");
  assert(!property.verified);
  assert(property.registered_at == kNow);
  assert(!property.verified_at.has_value());
  assert(registry::GetProperty(fx.storage, "p-1") == property);
  assert(registry::HasProperty(fx.storage, "p-1"));
  assert(registry::GetPropertyCount(fx.storage) == 1);

  auto dup = ExpectThrow<util::AlreadyExists>([&] { registry::RegisterProperty(inv, "other", "p-1", "hash-2"); });
  assert(dup.code() == util::ErrorCode::kPropertyAlreadyExists);

  auto no_id = ExpectThrow<util::InvalidArgument>([&] { registry::RegisterProperty(inv, "landlord", "", "hash"); });
  assert(no_id.code() == util::ErrorCode::kInvalidPropertyId);
  auto no_hash = ExpectThrow<util::InvalidArgument>([&] { registry::RegisterProperty(inv, "landlord", "p-2", ""); });
  assert(no_hash.code() == util::ErrorCode::kInvalidMetadata);

  assert(registry::GetPropertyCount(fx.storage) == 1);
}

void TestRegisterRequiresLandlordAuth() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation setup{fx.storage, allow, {}};
  registry::InitializeRegistry(setup, "admin");

  auth::CallerAuthorizer admin_only{"admin"};
  ledger::Invocation     inv{fx.storage, admin_only, {}};
  ExpectThrow<util::Unauthorized>([&] { registry::RegisterProperty(inv, "landlord", "p-1", "hash"); });
  assert(!registry::HasProperty(fx.storage, "p-1"));
}

void TestVerifyProperty() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation inv{fx.storage, allow, {}};

  ExpectThrow<util::InvalidState>([&] { registry::VerifyProperty(inv, "admin", "p-1"); });

  registry::InitializeRegistry(inv, "admin");
  registry::RegisterProperty(inv, "landlord", "p-1", "hash");

  ExpectThrow<util::Unauthorized>([&] { registry::VerifyProperty(inv, "landlord", "p-1"); });
  auto missing = ExpectThrow<util::NotFound>([&] { registry::VerifyProperty(inv, "admin", "p-9"); });
  assert(missing.code() == util::ErrorCode::kPropertyNotFound);

  auto verified = registry::VerifyProperty(inv, "admin", "p-1");
  assert(verified.verified);
  assert(verified.verified_at == kNow);
  assert(registry::GetProperty(fx.storage, "p-1")->verified);

  auto twice = ExpectThrow<util::InvalidState>([&] { registry::VerifyProperty(inv, "admin", "p-1"); });
  assert(twice.code() == util::ErrorCode::kAlreadyVerified);

  auto event = std::get<events::PropertyVerified>(inv.events.back());
  assert(event.property_id == "p-1");
  assert(event.admin == "admin");
}

void TestVerifyRequiresAdminAuth() {
  StorageFixture     fx;
  AllowAll           allow;
  ledger::Invocation setup{fx.storage, allow, {}};
  registry::InitializeRegistry(setup, "admin");
  registry::RegisterProperty(setup, "landlord", "p-1", "hash");

  auth::CallerAuthorizer landlord_only{"landlord"};
  ledger::Invocation     inv{fx.storage, landlord_only, {}};
  ExpectThrow<util::Unauthorized>([&] { registry::VerifyProperty(inv, "admin", "p-1"); });
  assert(!registry::GetProperty(fx.storage, "p-1")->verified);
}

} // namespace

int main() {
  TestInitializeOnce();
  TestInitializeRequiresAdminAuth();
  TestRegisterProperty();
  TestRegisterRequiresLandlordAuth();
  TestVerifyProperty();
  TestVerifyRequiresAdminAuth();

  std::cout << "rentledger_unit_property_registry: pass\n";
  return 0;
}
