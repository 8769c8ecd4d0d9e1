#include "ledger_server.hpp"

#include "caller_identity.hpp"
#include "grpc_error.hpp"

namespace rentledger::grpc {

using namespace rentledger::ledger::v1;

LedgerServer::LedgerServer(std::shared_ptr<rentledger::service::LedgerService> svc, IdentityPolicy policy)
    : service_(std::move(svc)), policy_(policy) {
}

::grpc::Status LedgerServer::CreateAgreement(::grpc::ServerContext* ctx, const CreateAgreementRequest* req, CreateAgreementResponse* resp) {
  return Invoke([&] { *resp = service_->CreateAgreement(*req, CallerFrom(ctx, policy_)); });
}

::grpc::Status LedgerServer::TransitionAgreement(::grpc::ServerContext* ctx, const TransitionAgreementRequest* req,
                                                 TransitionAgreementResponse* resp) {
  return Invoke([&] { *resp = service_->TransitionAgreement(*req, CallerFrom(ctx, policy_)); });
}

::grpc::Status LedgerServer::GetAgreement(::grpc::ServerContext*, const GetAgreementRequest* req, GetAgreementResponse* resp) {
  return Invoke([&] { *resp = service_->GetAgreement(*req); });
}

::grpc::Status LedgerServer::HasAgreement(::grpc::ServerContext*, const HasAgreementRequest* req, HasAgreementResponse* resp) {
  return Invoke([&] { *resp = service_->HasAgreement(*req); });
}

::grpc::Status LedgerServer::GetAgreementCount(::grpc::ServerContext*, const GetAgreementCountRequest* req, GetAgreementCountResponse* resp) {
  return Invoke([&] { *resp = service_->GetAgreementCount(*req); });
}

::grpc::Status LedgerServer::PayRent(::grpc::ServerContext* ctx, const PayRentRequest* req, PayRentResponse* resp) {
  return Invoke([&] { *resp = service_->PayRent(*req, CallerFrom(ctx, policy_)); });
}

::grpc::Status LedgerServer::GetPayment(::grpc::ServerContext*, const GetPaymentRequest* req, GetPaymentResponse* resp) {
  return Invoke([&] { *resp = service_->GetPayment(*req); });
}

::grpc::Status LedgerServer::GetPaymentRecord(::grpc::ServerContext*, const GetPaymentRecordRequest* req, GetPaymentRecordResponse* resp) {
  return Invoke([&] { *resp = service_->GetPaymentRecord(*req); });
}

::grpc::Status LedgerServer::GetPaymentCount(::grpc::ServerContext*, const GetPaymentCountRequest* req, GetPaymentCountResponse* resp) {
  return Invoke([&] { *resp = service_->GetPaymentCount(*req); });
}

::grpc::Status LedgerServer::GetTotalPaid(::grpc::ServerContext*, const GetTotalPaidRequest* req, GetTotalPaidResponse* resp) {
  return Invoke([&] { *resp = service_->GetTotalPaid(*req); });
}

} // namespace rentledger::grpc
