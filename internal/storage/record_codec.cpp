#include "record_codec.hpp"

#include <stdexcept>

namespace rentledger::storage {

namespace v1 = rentledger::ledger::v1;

namespace {

template <class Message>
Message ParseOrThrow(const std::string& bytes, const char* what) {
  Message msg;
  if (!msg.ParseFromString(bytes)) {
    throw std::runtime_error(std::string("corrupt stored ") + what);
  }
  return msg;
}

} // namespace

v1::AgreementStatus ToProto(model::AgreementStatus status) {
  switch (status) {
    case model::AgreementStatus::kDraft:
      return v1::AGREEMENT_STATUS_DRAFT;
    case model::AgreementStatus::kPending:
      return v1::AGREEMENT_STATUS_PENDING;
    case model::AgreementStatus::kActive:
      return v1::AGREEMENT_STATUS_ACTIVE;
    case model::AgreementStatus::kCompleted:
      return v1::AGREEMENT_STATUS_COMPLETED;
    case model::AgreementStatus::kCancelled:
      return v1::AGREEMENT_STATUS_CANCELLED;
    case model::AgreementStatus::kTerminated:
      return v1::AGREEMENT_STATUS_TERMINATED;
    case model::AgreementStatus::kDisputed:
      return v1::AGREEMENT_STATUS_DISPUTED;
  }
  return v1::AGREEMENT_STATUS_UNSPECIFIED;
}

model::AgreementStatus FromProto(v1::AgreementStatus status) {
  switch (status) {
    case v1::AGREEMENT_STATUS_DRAFT:
      return model::AgreementStatus::kDraft;
    case v1::AGREEMENT_STATUS_PENDING:
      return model::AgreementStatus::kPending;
    case v1::AGREEMENT_STATUS_ACTIVE:
      return model::AgreementStatus::kActive;
    case v1::AGREEMENT_STATUS_COMPLETED:
      return model::AgreementStatus::kCompleted;
    case v1::AGREEMENT_STATUS_CANCELLED:
      return model::AgreementStatus::kCancelled;
    case v1::AGREEMENT_STATUS_TERMINATED:
      return model::AgreementStatus::kTerminated;
    case v1::AGREEMENT_STATUS_DISPUTED:
      return model::AgreementStatus::kDisputed;
    default:
      throw std::invalid_argument("unknown agreement status " + std::to_string(static_cast<int>(status)));
  }
}

v1::RentAgreement ToProto(const model::RentAgreement& agreement) {
  v1::RentAgreement msg;
  msg.set_agreement_id(agreement.agreement_id);
  msg.set_landlord(agreement.landlord);
  msg.set_tenant(agreement.tenant);
  if (agreement.agent) {
    msg.set_agent(*agreement.agent);
  }
  msg.set_monthly_rent(agreement.monthly_rent);
  msg.set_security_deposit(agreement.security_deposit);
  msg.set_start_date(agreement.start_date);
  msg.set_end_date(agreement.end_date);
  msg.set_agent_commission_rate(agreement.agent_commission_rate);
  msg.set_status(ToProto(agreement.status));
  msg.set_total_rent_paid(agreement.total_rent_paid);
  msg.set_payment_count(agreement.payment_count);
  return msg;
}

v1::PaymentRecord ToProto(const model::PaymentRecord& record) {
  v1::PaymentRecord msg;
  msg.set_agreement_id(record.agreement_id);
  msg.set_payment_number(record.payment_number);
  msg.set_amount(record.amount);
  msg.set_landlord_amount(record.landlord_amount);
  msg.set_agent_amount(record.agent_amount);
  msg.set_timestamp(record.timestamp);
  msg.set_tenant(record.tenant);
  return msg;
}

v1::PropertyDetails ToProto(const model::PropertyDetails& property) {
  v1::PropertyDetails msg;
  msg.set_property_id(property.property_id);
  msg.set_landlord(property.landlord);
  msg.set_metadata_hash(property.metadata_hash);
  msg.set_verified(property.verified);
  msg.set_registered_at(property.registered_at);
  if (property.verified_at) {
    msg.set_verified_at(*property.verified_at);
  }
  return msg;
}

v1::PropertyRegistryState ToProto(const model::PropertyRegistryState& state) {
  v1::PropertyRegistryState msg;
  msg.set_admin(state.admin);
  msg.set_initialized(state.initialized);
  return msg;
}

v1::RentObligation ToProto(const model::RentObligation& obligation) {
  v1::RentObligation msg;
  msg.set_agreement_id(obligation.agreement_id);
  msg.set_owner(obligation.owner);
  msg.set_minted_at(obligation.minted_at);
  return msg;
}

model::RentAgreement FromProto(const v1::RentAgreement& msg) {
  model::RentAgreement agreement;
  agreement.agreement_id = msg.agreement_id();
  agreement.landlord     = msg.landlord();
  agreement.tenant       = msg.tenant();
  if (msg.has_agent()) {
    agreement.agent = msg.agent();
  }
  agreement.monthly_rent          = msg.monthly_rent();
  agreement.security_deposit      = msg.security_deposit();
  agreement.start_date            = msg.start_date();
  agreement.end_date              = msg.end_date();
  agreement.agent_commission_rate = msg.agent_commission_rate();
  agreement.status                = FromProto(msg.status());
  agreement.total_rent_paid       = msg.total_rent_paid();
  agreement.payment_count         = msg.payment_count();
  return agreement;
}

model::PaymentRecord FromProto(const v1::PaymentRecord& msg) {
  return model::PaymentRecord{
      .agreement_id    = msg.agreement_id(),
      .payment_number  = msg.payment_number(),
      .amount          = msg.amount(),
      .landlord_amount = msg.landlord_amount(),
      .agent_amount    = msg.agent_amount(),
      .timestamp       = msg.timestamp(),
      .tenant          = msg.tenant(),
  };
}

model::PropertyDetails FromProto(const v1::PropertyDetails& msg) {
  model::PropertyDetails property{
      .property_id   = msg.property_id(),
      .landlord      = msg.landlord(),
      .metadata_hash = msg.metadata_hash(),
      .verified      = msg.verified(),
      .registered_at = msg.registered_at(),
  };
  if (msg.has_verified_at()) {
    property.verified_at = msg.verified_at();
  }
  return property;
}

model::PropertyRegistryState FromProto(const v1::PropertyRegistryState& msg) {
  return {.admin = msg.admin(), .initialized = msg.initialized()};
}

model::RentObligation FromProto(const v1::RentObligation& msg) {
  return {.agreement_id = msg.agreement_id(), .owner = msg.owner(), .minted_at = msg.minted_at()};
}

template <>
model::RentAgreement Decode<model::RentAgreement>(const std::string& bytes) {
  return FromProto(ParseOrThrow<v1::RentAgreement>(bytes, "agreement"));
}

template <>
model::PaymentRecord Decode<model::PaymentRecord>(const std::string& bytes) {
  return FromProto(ParseOrThrow<v1::PaymentRecord>(bytes, "payment record"));
}

template <>
model::PropertyDetails Decode<model::PropertyDetails>(const std::string& bytes) {
  return FromProto(ParseOrThrow<v1::PropertyDetails>(bytes, "property"));
}

template <>
model::PropertyRegistryState Decode<model::PropertyRegistryState>(const std::string& bytes) {
  return FromProto(ParseOrThrow<v1::PropertyRegistryState>(bytes, "registry state"));
}

template <>
model::RentObligation Decode<model::RentObligation>(const std::string& bytes) {
  return FromProto(ParseOrThrow<v1::RentObligation>(bytes, "obligation"));
}

std::string EncodeCounter(std::uint64_t value) {
  v1::Counter msg;
  msg.set_value(value);
  return msg.SerializeAsString();
}

std::uint64_t DecodeCounter(const std::string& bytes) {
  return ParseOrThrow<v1::Counter>(bytes, "counter").value();
}

std::string EncodeBalance(std::int64_t amount) {
  v1::TokenBalance msg;
  msg.set_amount(amount);
  return msg.SerializeAsString();
}

std::int64_t DecodeBalance(const std::string& bytes) {
  return ParseOrThrow<v1::TokenBalance>(bytes, "token balance").amount();
}

std::string EncodeObligationsInitialized(bool initialized) {
  v1::ObligationRegistryState msg;
  msg.set_initialized(initialized);
  return msg.SerializeAsString();
}

bool DecodeObligationsInitialized(const std::string& bytes) {
  return ParseOrThrow<v1::ObligationRegistryState>(bytes, "obligation registry state").initialized();
}

} // namespace rentledger::storage
