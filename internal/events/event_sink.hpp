#pragma once

#include "internal/events/ledger_event.hpp"

namespace rentledger::events {

// Receives events of committed invocations only.
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const LedgerEvent& event) = 0;
};

class LogEventSink final : public EventSink {
 public:
  void Publish(const LedgerEvent& event) override;
};

} // namespace rentledger::events
