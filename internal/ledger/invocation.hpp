#pragma once

#include <utility>
#include <vector>

#include "internal/auth/authorizer.hpp"
#include "internal/events/ledger_event.hpp"
#include "internal/storage/ledger_storage.hpp"

namespace rentledger::ledger {

/*
  Per-call context of a mutating ledger operation.

  Events are buffered here and published by the host after commit, so a
  failed invocation emits nothing.
*/
struct Invocation {
  storage::LedgerStorage&          storage;
  const auth::Authorizer&          caller;
  std::vector<events::LedgerEvent> events;

  model::Timestamp Timestamp() const {
    return storage.Now();
  }

  void Emit(events::LedgerEvent event) {
    events.push_back(std::move(event));
  }
};

} // namespace rentledger::ledger
