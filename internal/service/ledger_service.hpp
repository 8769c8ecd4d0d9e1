#pragma once

#include "internal/auth/authorizer.hpp"
#include "rentledger/ledger/v1/ledger_service.pb.h"
#include "service_context.hpp"

namespace rentledger::service {

class LedgerService {
public:
  explicit LedgerService(ServiceContext ctx);

  rentledger::ledger::v1::CreateAgreementResponse
  CreateAgreement(const rentledger::ledger::v1::CreateAgreementRequest& req, const auth::Authorizer& caller);

  rentledger::ledger::v1::TransitionAgreementResponse
  TransitionAgreement(const rentledger::ledger::v1::TransitionAgreementRequest& req, const auth::Authorizer& caller);

  rentledger::ledger::v1::PayRentResponse
  PayRent(const rentledger::ledger::v1::PayRentRequest& req, const auth::Authorizer& caller);

  rentledger::ledger::v1::GetAgreementResponse
  GetAgreement(const rentledger::ledger::v1::GetAgreementRequest& req);

  rentledger::ledger::v1::HasAgreementResponse
  HasAgreement(const rentledger::ledger::v1::HasAgreementRequest& req);

  rentledger::ledger::v1::GetAgreementCountResponse
  GetAgreementCount(const rentledger::ledger::v1::GetAgreementCountRequest& req);

  rentledger::ledger::v1::GetPaymentResponse
  GetPayment(const rentledger::ledger::v1::GetPaymentRequest& req);

  rentledger::ledger::v1::GetPaymentRecordResponse
  GetPaymentRecord(const rentledger::ledger::v1::GetPaymentRecordRequest& req);

  rentledger::ledger::v1::GetPaymentCountResponse
  GetPaymentCount(const rentledger::ledger::v1::GetPaymentCountRequest& req);

  rentledger::ledger::v1::GetTotalPaidResponse
  GetTotalPaid(const rentledger::ledger::v1::GetTotalPaidRequest& req);

private:
  ServiceContext ctx_;
};

}
