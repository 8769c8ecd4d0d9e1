#include <cassert>
#include <iostream>
#include <limits>

#include "internal/token/store_token_ledger.hpp"
#include "unit/test_support.hpp"

namespace {

using namespace rentledger;
using rentledger::testing::ExpectThrow;
using rentledger::testing::StorageFixture;

constexpr const char* kToken = "usd";

void TestTransferMovesBalance() {
  StorageFixture          fx;
  token::StoreTokenLedger tokens;

  assert(tokens.Mint(fx.storage, kToken, "alice", 500) == 500);
  tokens.Transfer(fx.storage, kToken, "alice", "bob", 200);
  assert(tokens.BalanceOf(fx.storage, kToken, "alice") == 300);
  assert(tokens.BalanceOf(fx.storage, kToken, "bob") == 200);
  assert(tokens.BalanceOf(fx.storage, "eur", "alice") == 0);
}

void TestTransferRejectsShortfall() {
  StorageFixture          fx;
  token::StoreTokenLedger tokens;

  tokens.Mint(fx.storage, kToken, "alice", 100);
  ExpectThrow<util::TransferFailed>([&] { tokens.Transfer(fx.storage, kToken, "alice", "bob", 101); });
  ExpectThrow<util::TransferFailed>([&] { tokens.Transfer(fx.storage, kToken, "alice", "bob", -1); });
  assert(tokens.BalanceOf(fx.storage, kToken, "alice") == 100);
  assert(tokens.BalanceOf(fx.storage, kToken, "bob") == 0);
}

void TestSelfTransferChecksBalance() {
  StorageFixture          fx;
  token::StoreTokenLedger tokens;

  ExpectThrow<util::TransferFailed>([&] { tokens.Transfer(fx.storage, kToken, "alice", "alice", 1); });

  tokens.Mint(fx.storage, kToken, "alice", 50);
  tokens.Transfer(fx.storage, kToken, "alice", "alice", 50);
  assert(tokens.BalanceOf(fx.storage, kToken, "alice") == 50);
  ExpectThrow<util::TransferFailed>([&] { tokens.Transfer(fx.storage, kToken, "alice", "alice", 51); });
}

void TestZeroTransferIsNoop() {
  StorageFixture          fx;
  token::StoreTokenLedger tokens;

  tokens.Transfer(fx.storage, kToken, "alice", "bob", 0);
  assert(!fx.storage.Has(storage::TokenBalanceKey{kToken, "alice"}));
  assert(!fx.storage.Has(storage::TokenBalanceKey{kToken, "bob"}));
}

void TestMintBounds() {
  StorageFixture          fx;
  token::StoreTokenLedger tokens;

  ExpectThrow<util::InvalidAmount>([&] { tokens.Mint(fx.storage, kToken, "alice", 0); });
  tokens.Mint(fx.storage, kToken, "alice", std::numeric_limits<model::Amount>::max());
  ExpectThrow<util::InvalidAmount>([&] { tokens.Mint(fx.storage, kToken, "alice", 1); });
  ExpectThrow<util::TransferFailed>([&] {
    tokens.Mint(fx.storage, kToken, "bob", 1);
    tokens.Transfer(fx.storage, kToken, "alice", "bob", std::numeric_limits<model::Amount>::max());
  });
}

} // namespace

int main() {
  TestTransferMovesBalance();
  TestTransferRejectsShortfall();
  TestSelfTransferChecksBalance();
  TestZeroTransferIsNoop();
  TestMintBounds();

  std::cout << "rentledger_unit_store_token_ledger: pass\n";
  return 0;
}
