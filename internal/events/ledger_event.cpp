#include "ledger_event.hpp"

namespace rentledger::events {

namespace {

struct TopicVisitor {
  std::string_view operator()(const AgreementCreated&) const { return "agreement_created"; }
  std::string_view operator()(const AgreementStatusChanged&) const { return "agreement_status_changed"; }
  std::string_view operator()(const RentPaid&) const { return "rent_paid"; }
  std::string_view operator()(const RegistryInitialized&) const { return "registry_initialized"; }
  std::string_view operator()(const PropertyRegistered&) const { return "property_registered"; }
  std::string_view operator()(const PropertyVerified&) const { return "property_verified"; }
  std::string_view operator()(const ObligationMinted&) const { return "obligation_minted"; }
  std::string_view operator()(const ObligationTransferred&) const { return "obligation_transferred"; }
};

} // namespace

std::string_view Topic(const LedgerEvent& event) {
  return std::visit(TopicVisitor{}, event);
}

} // namespace rentledger::events
