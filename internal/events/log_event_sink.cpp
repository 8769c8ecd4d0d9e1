#include "internal/events/event_sink.hpp"
#include "internal/observability/logging.hpp"

namespace rentledger::events {

namespace {

using observability::IntField;
using observability::StringField;

void LogEvent(std::string_view topic, std::initializer_list<observability::LogField> fields) {
  RENTLEDGER_LOG_INFO("ledger event " + std::string(topic), fields);
}

struct LogVisitor {
  std::string_view topic;

  void operator()(const AgreementCreated& e) const {
    LogEvent(topic, {StringField("agreement_id", e.agreement_id)});
  }
  void operator()(const AgreementStatusChanged& e) const {
    LogEvent(topic, {StringField("agreement_id", e.agreement_id), StringField("from", model::ToString(e.from)),
                     StringField("to", model::ToString(e.to))});
  }
  void operator()(const RentPaid& e) const {
    LogEvent(topic, {StringField("agreement_id", e.agreement_id), IntField("amount", e.amount), IntField("landlord_amount", e.landlord_amount),
                     IntField("agent_amount", e.agent_amount), observability::UintField("timestamp", e.timestamp)});
  }
  void operator()(const RegistryInitialized& e) const {
    LogEvent(topic, {StringField("admin", e.admin)});
  }
  void operator()(const PropertyRegistered& e) const {
    LogEvent(topic, {StringField("property_id", e.property_id), StringField("landlord", e.landlord)});
  }
  void operator()(const PropertyVerified& e) const {
    LogEvent(topic, {StringField("property_id", e.property_id), StringField("admin", e.admin)});
  }
  void operator()(const ObligationMinted& e) const {
    LogEvent(topic, {StringField("agreement_id", e.agreement_id), StringField("owner", e.owner)});
  }
  void operator()(const ObligationTransferred& e) const {
    LogEvent(topic, {StringField("agreement_id", e.agreement_id), StringField("from", e.from), StringField("to", e.to)});
  }
};

} // namespace

void LogEventSink::Publish(const LedgerEvent& event) {
  std::visit(LogVisitor{Topic(event)}, event);
}

} // namespace rentledger::events
