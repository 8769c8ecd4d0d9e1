#include "ledger_queries.hpp"

#include "internal/util/errors.hpp"

namespace rentledger::ledger {

std::optional<model::RentAgreement> GetAgreement(storage::LedgerStorage& storage, const std::string& agreement_id) {
  return storage.Get<model::RentAgreement>(storage::AgreementKey{agreement_id});
}

bool HasAgreement(storage::LedgerStorage& storage, const std::string& agreement_id) {
  return storage.Has(storage::AgreementKey{agreement_id});
}

std::uint64_t GetAgreementCount(storage::LedgerStorage& storage) {
  return storage.GetCounter(storage::AgreementCountKey{});
}

model::PaymentRecord GetPayment(storage::LedgerStorage& storage, const std::string& payment_id) {
  auto record = storage.Get<model::PaymentRecord>(storage::PaymentKey{payment_id});
  if (!record) {
    throw util::NotFound(util::ErrorCode::kPaymentNotFound, "payment " + payment_id + " not found");
  }
  return *record;
}

std::optional<model::PaymentRecord> GetPaymentRecord(storage::LedgerStorage& storage, const std::string& agreement_id,
                                                     std::uint32_t payment_number) {
  return storage.Get<model::PaymentRecord>(storage::PaymentRecordKey{agreement_id, payment_number});
}

std::uint64_t GetPaymentCount(storage::LedgerStorage& storage) {
  return storage.GetCounter(storage::PaymentCountKey{});
}

model::Amount GetTotalPaid(storage::LedgerStorage& storage, const std::string& agreement_id) {
  const auto    count = GetPaymentCount(storage);
  model::Amount total = 0;
  for (std::uint64_t i = 0; i < count; ++i) {
    auto record = storage.Get<model::PaymentRecord>(storage::PaymentKey{std::to_string(i)});
    if (record && record->agreement_id == agreement_id) {
      total += record->amount;
    }
  }
  return total;
}

} // namespace rentledger::ledger
