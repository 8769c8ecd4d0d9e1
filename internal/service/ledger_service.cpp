#include "ledger_service.hpp"

#include "internal/core/rent_ledger.hpp"
#include "internal/storage/record_codec.hpp"
#include "observe_call.hpp"

namespace rentledger::service {

using namespace rentledger::ledger::v1;

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateAgreementResponse LedgerService::CreateAgreement(const CreateAgreementRequest& req, const auth::Authorizer& caller) {
  return ObserveCall("LedgerService.CreateAgreement", [&] {
    model::AgreementTerms terms{
        .agreement_id          = req.agreement_id(),
        .landlord              = req.landlord(),
        .tenant                = req.tenant(),
        .monthly_rent          = req.monthly_rent(),
        .security_deposit      = req.security_deposit(),
        .start_date            = req.start_date(),
        .end_date              = req.end_date(),
        .agent_commission_rate = req.agent_commission_rate(),
    };
    if (req.has_agent()) {
      terms.agent = req.agent();
    }

    CreateAgreementResponse resp;
    *resp.mutable_agreement() = storage::ToProto(ctx_.ledger->CreateAgreement(caller, terms));
    return resp;
  });
}

TransitionAgreementResponse LedgerService::TransitionAgreement(const TransitionAgreementRequest& req, const auth::Authorizer& caller) {
  return ObserveCall("LedgerService.TransitionAgreement", [&] {
    if (req.target() == AGREEMENT_STATUS_UNSPECIFIED || !AgreementStatus_IsValid(req.target())) {
      throw util::InvalidState(util::ErrorCode::kInvalidTransition, "a known target status is required");
    }
    TransitionAgreementResponse resp;
    *resp.mutable_agreement() =
        storage::ToProto(ctx_.ledger->TransitionAgreement(caller, req.agreement_id(), req.actor(), storage::FromProto(req.target())));
    return resp;
  });
}

PayRentResponse LedgerService::PayRent(const PayRentRequest& req, const auth::Authorizer& caller) {
  return ObserveCall("LedgerService.PayRent", [&] {
    PayRentResponse resp;
    *resp.mutable_payment() = storage::ToProto(ctx_.ledger->PayRent(caller, req.agreement_id(), req.token(), req.amount()));
    return resp;
  });
}

GetAgreementResponse LedgerService::GetAgreement(const GetAgreementRequest& req) {
  return ObserveCall("LedgerService.GetAgreement", [&] {
    GetAgreementResponse resp;
    if (auto agreement = ctx_.ledger->GetAgreement(req.agreement_id())) {
      resp.set_found(true);
      *resp.mutable_agreement() = storage::ToProto(*agreement);
    }
    return resp;
  });
}

HasAgreementResponse LedgerService::HasAgreement(const HasAgreementRequest& req) {
  return ObserveCall("LedgerService.HasAgreement", [&] {
    HasAgreementResponse resp;
    resp.set_exists(ctx_.ledger->HasAgreement(req.agreement_id()));
    return resp;
  });
}

GetAgreementCountResponse LedgerService::GetAgreementCount(const GetAgreementCountRequest&) {
  return ObserveCall("LedgerService.GetAgreementCount", [&] {
    GetAgreementCountResponse resp;
    resp.set_count(ctx_.ledger->GetAgreementCount());
    return resp;
  });
}

GetPaymentResponse LedgerService::GetPayment(const GetPaymentRequest& req) {
  return ObserveCall("LedgerService.GetPayment", [&] {
    GetPaymentResponse resp;
    *resp.mutable_payment() = storage::ToProto(ctx_.ledger->GetPayment(req.payment_id()));
    return resp;
  });
}

GetPaymentRecordResponse LedgerService::GetPaymentRecord(const GetPaymentRecordRequest& req) {
  return ObserveCall("LedgerService.GetPaymentRecord", [&] {
    GetPaymentRecordResponse resp;
    if (auto record = ctx_.ledger->GetPaymentRecord(req.agreement_id(), req.payment_number())) {
      resp.set_found(true);
      *resp.mutable_payment() = storage::ToProto(*record);
    }
    return resp;
  });
}

GetPaymentCountResponse LedgerService::GetPaymentCount(const GetPaymentCountRequest&) {
  return ObserveCall("LedgerService.GetPaymentCount", [&] {
    GetPaymentCountResponse resp;
    resp.set_count(ctx_.ledger->GetPaymentCount());
    return resp;
  });
}

GetTotalPaidResponse LedgerService::GetTotalPaid(const GetTotalPaidRequest& req) {
  return ObserveCall("LedgerService.GetTotalPaid", [&] {
    GetTotalPaidResponse resp;
    resp.set_total(ctx_.ledger->GetTotalPaid(req.agreement_id()));
    return resp;
  });
}

} // namespace rentledger::service
