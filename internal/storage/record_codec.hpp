#pragma once

#include <cstdint>
#include <string>

#include "internal/model/obligation.hpp"
#include "internal/model/payment_record.hpp"
#include "internal/model/property.hpp"
#include "internal/model/rent_agreement.hpp"
#include "rentledger/ledger/v1/types.pb.h"

namespace rentledger::storage {

/*
  Record codec.

  Ledger entities are stored as serialized rentledger.ledger.v1 messages.
  The same conversions back the service layer responses.
*/

rentledger::ledger::v1::AgreementStatus ToProto(model::AgreementStatus status);
model::AgreementStatus                  FromProto(rentledger::ledger::v1::AgreementStatus status);

rentledger::ledger::v1::RentAgreement           ToProto(const model::RentAgreement& agreement);
rentledger::ledger::v1::PaymentRecord           ToProto(const model::PaymentRecord& record);
rentledger::ledger::v1::PropertyDetails         ToProto(const model::PropertyDetails& property);
rentledger::ledger::v1::PropertyRegistryState   ToProto(const model::PropertyRegistryState& state);
rentledger::ledger::v1::RentObligation          ToProto(const model::RentObligation& obligation);

model::RentAgreement         FromProto(const rentledger::ledger::v1::RentAgreement& msg);
model::PaymentRecord         FromProto(const rentledger::ledger::v1::PaymentRecord& msg);
model::PropertyDetails       FromProto(const rentledger::ledger::v1::PropertyDetails& msg);
model::PropertyRegistryState FromProto(const rentledger::ledger::v1::PropertyRegistryState& msg);
model::RentObligation        FromProto(const rentledger::ledger::v1::RentObligation& msg);

// Serialized form of an entity.
template <class Entity>
std::string Encode(const Entity& entity) {
  return ToProto(entity).SerializeAsString();
}

// Throws std::runtime_error when bytes do not parse.
template <class Entity>
Entity Decode(const std::string& bytes);

template <>
model::RentAgreement Decode<model::RentAgreement>(const std::string& bytes);
template <>
model::PaymentRecord Decode<model::PaymentRecord>(const std::string& bytes);
template <>
model::PropertyDetails Decode<model::PropertyDetails>(const std::string& bytes);
template <>
model::PropertyRegistryState Decode<model::PropertyRegistryState>(const std::string& bytes);
template <>
model::RentObligation Decode<model::RentObligation>(const std::string& bytes);

std::string   EncodeCounter(std::uint64_t value);
std::uint64_t DecodeCounter(const std::string& bytes);

std::string  EncodeBalance(std::int64_t amount);
std::int64_t DecodeBalance(const std::string& bytes);

bool DecodeObligationsInitialized(const std::string& bytes);
std::string EncodeObligationsInitialized(bool initialized);

} // namespace rentledger::storage
