#include <cassert>
#include <iostream>
#include <limits>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/ledger_storage.hpp"
#include "unit/test_support.hpp"

namespace {

using namespace rentledger;
using rentledger::testing::kNow;

model::RentAgreement SampleAgreement() {
  model::RentAgreement agreement;
  agreement.agreement_id          = "agreement-1";
  agreement.landlord              = "landlord";
  agreement.tenant                = "tenant";
  agreement.monthly_rent          = 1000;
  agreement.start_date            = 1;
  agreement.end_date              = 2;
  agreement.agent_commission_rate = 250;
  agreement.status                = model::AgreementStatus::kActive;
  agreement.total_rent_paid       = 3000;
  agreement.payment_count         = 3;
  return agreement;
}

void TestEntityRoundTripKeepsOptionalAgent() {
  rentledger::testing::StorageFixture fx;

  auto without_agent = SampleAgreement();
  fx.storage.Set(storage::AgreementKey{"agreement-1"}, without_agent);
  auto loaded = fx.storage.Get<model::RentAgreement>(storage::AgreementKey{"agreement-1"});
  assert(loaded.has_value());
  assert(*loaded == without_agent);
  assert(!loaded->agent.has_value());

  auto with_agent         = SampleAgreement();
  with_agent.agreement_id = "agreement-2";
  with_agent.agent        = "";
  fx.storage.Set(storage::AgreementKey{"agreement-2"}, with_agent);
  loaded = fx.storage.Get<model::RentAgreement>(storage::AgreementKey{"agreement-2"});
  assert(loaded->agent.has_value());
  assert(loaded->agent->empty());

  assert(!fx.storage.Get<model::RentAgreement>(storage::AgreementKey{"missing"}).has_value());
}

void TestCountersDefaultToZero() {
  rentledger::testing::StorageFixture fx;

  assert(fx.storage.GetCounter(storage::PaymentCountKey{}) == 0);
  assert(!fx.storage.Has(storage::PaymentCountKey{}));
  assert(fx.storage.IncrementCounter(storage::PaymentCountKey{}) == 1);
  assert(fx.storage.IncrementCounter(storage::PaymentCountKey{}) == 2);
  assert(fx.storage.GetCounter(storage::PaymentCountKey{}) == 2);
  assert(fx.storage.GetCounter(storage::AgreementCountKey{}) == 0);
}

void TestWritesExtendLifetimePerDurabilityClass() {
  db::memory::MemoryRepository repo;
  auto                         tx = repo.Begin();

  const storage::TtlPolicy instance{.threshold_seconds = 100, .extend_to_seconds = 1000};
  const storage::TtlPolicy persistent{.threshold_seconds = 500, .extend_to_seconds = 5000};

  storage::LedgerStorage first(repo, *tx, instance, persistent, kNow);
  first.SetCounter(storage::AgreementCountKey{}, 1);
  first.Set(storage::AgreementKey{"a"}, SampleAgreement());

  assert(first.LiveUntil(storage::AgreementCountKey{}) == kNow + 1000);
  assert(first.LiveUntil(storage::AgreementKey{"a"}) == kNow + 5000);
  assert(!first.LiveUntil(storage::AgreementKey{"missing"}).has_value());

  // Plenty of lifetime left: unchanged.
  storage::LedgerStorage later(repo, *tx, instance, persistent, kNow + 800);
  later.SetCounter(storage::AgreementCountKey{}, 2);
  assert(later.LiveUntil(storage::AgreementCountKey{}) == kNow + 1000);

  // Inside the threshold: extended from the new now.
  storage::LedgerStorage near_expiry(repo, *tx, instance, persistent, kNow + 950);
  near_expiry.SetCounter(storage::AgreementCountKey{}, 3);
  assert(near_expiry.LiveUntil(storage::AgreementCountKey{}) == kNow + 950 + 1000);
}

void TestHugeTtlPolicySaturates() {
  db::memory::MemoryRepository repo;
  auto                         tx = repo.Begin();

  constexpr auto           kMax = std::numeric_limits<std::uint64_t>::max();
  const storage::TtlPolicy forever{.threshold_seconds = kMax, .extend_to_seconds = kMax};
  const storage::TtlPolicy short_extend{.threshold_seconds = kMax, .extend_to_seconds = 10};

  storage::LedgerStorage s(repo, *tx, forever, short_extend, kNow);
  s.SetCounter(storage::AgreementCountKey{}, 1);
  assert(s.LiveUntil(storage::AgreementCountKey{}) == storage::kMaxLiveUntil);
  s.SetCounter(storage::AgreementCountKey{}, 2);
  assert(s.LiveUntil(storage::AgreementCountKey{}) == storage::kMaxLiveUntil);

  s.Set(storage::AgreementKey{"a"}, SampleAgreement());
  assert(s.LiveUntil(storage::AgreementKey{"a"}) == kNow + 10);

  storage::LedgerStorage late(repo, *tx, forever, short_extend, kMax - 5);
  late.Set(storage::AgreementKey{"a"}, SampleAgreement());
  assert(late.LiveUntil(storage::AgreementKey{"a"}) == storage::kMaxLiveUntil);
}

void TestRolledBackWritesAreInvisible() {
  db::memory::MemoryRepository repo;
  {
    auto                   tx = repo.Begin();
    storage::LedgerStorage s(repo, *tx, {}, {}, kNow);
    s.Set(storage::AgreementKey{"a"}, SampleAgreement());
    tx->Rollback();
  }
  {
    auto                   tx = repo.Begin();
    storage::LedgerStorage s(repo, *tx, {}, {}, kNow);
    assert(!s.Has(storage::AgreementKey{"a"}));
    s.Set(storage::AgreementKey{"b"}, SampleAgreement());
    tx->Commit();
  }
  auto                   tx = repo.Begin();
  storage::LedgerStorage s(repo, *tx, {}, {}, kNow);
  assert(s.Has(storage::AgreementKey{"b"}));
}

void TestCorruptRecordThrows() {
  rentledger::testing::StorageFixture fx;
  fx.storage.Write(storage::AgreementKey{"bad"}, std::string("\xff\xff\xff", 3));

  bool threw = false;
  try {
    (void)fx.storage.Get<model::RentAgreement>(storage::AgreementKey{"bad"});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEntityRoundTripKeepsOptionalAgent();
  TestCountersDefaultToZero();
  TestWritesExtendLifetimePerDurabilityClass();
  TestHugeTtlPolicySaturates();
  TestRolledBackWritesAreInvisible();
  TestCorruptRecordThrows();

  std::cout << "rentledger_unit_ledger_storage: pass\n";
  return 0;
}
