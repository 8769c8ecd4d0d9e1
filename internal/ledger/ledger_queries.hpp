#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/payment_record.hpp"
#include "internal/model/rent_agreement.hpp"
#include "internal/storage/ledger_storage.hpp"

namespace rentledger::ledger {

// Read-only views over the ledger. None of these write.

std::optional<model::RentAgreement> GetAgreement(storage::LedgerStorage& storage, const std::string& agreement_id);
bool                                HasAgreement(storage::LedgerStorage& storage, const std::string& agreement_id);
std::uint64_t                       GetAgreementCount(storage::LedgerStorage& storage);

// payment_id is the decimal global payment index. Throws PaymentNotFound.
model::PaymentRecord GetPayment(storage::LedgerStorage& storage, const std::string& payment_id);

std::optional<model::PaymentRecord> GetPaymentRecord(storage::LedgerStorage& storage, const std::string& agreement_id,
                                                     std::uint32_t payment_number);

std::uint64_t GetPaymentCount(storage::LedgerStorage& storage);

// Sum of every indexed payment for the agreement; linear in PaymentCount.
model::Amount GetTotalPaid(storage::LedgerStorage& storage, const std::string& agreement_id);

} // namespace rentledger::ledger
