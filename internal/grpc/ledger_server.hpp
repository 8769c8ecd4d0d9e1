#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "rentledger/ledger/v1/ledger_service.grpc.pb.h"
#include "internal/grpc/caller_identity.hpp"
#include "internal/service/ledger_service.hpp"

namespace rentledger::grpc {

class LedgerServer final : public rentledger::ledger::v1::RentLedgerService::Service {
public:
  explicit LedgerServer(std::shared_ptr<rentledger::service::LedgerService> svc, IdentityPolicy policy = {});

  ::grpc::Status CreateAgreement(::grpc::ServerContext*, const rentledger::ledger::v1::CreateAgreementRequest*,
                                 rentledger::ledger::v1::CreateAgreementResponse*) override;
  ::grpc::Status TransitionAgreement(::grpc::ServerContext*, const rentledger::ledger::v1::TransitionAgreementRequest*,
                                     rentledger::ledger::v1::TransitionAgreementResponse*) override;
  ::grpc::Status GetAgreement(::grpc::ServerContext*, const rentledger::ledger::v1::GetAgreementRequest*,
                              rentledger::ledger::v1::GetAgreementResponse*) override;
  ::grpc::Status HasAgreement(::grpc::ServerContext*, const rentledger::ledger::v1::HasAgreementRequest*,
                              rentledger::ledger::v1::HasAgreementResponse*) override;
  ::grpc::Status GetAgreementCount(::grpc::ServerContext*, const rentledger::ledger::v1::GetAgreementCountRequest*,
                                   rentledger::ledger::v1::GetAgreementCountResponse*) override;
  ::grpc::Status PayRent(::grpc::ServerContext*, const rentledger::ledger::v1::PayRentRequest*,
                         rentledger::ledger::v1::PayRentResponse*) override;
  ::grpc::Status GetPayment(::grpc::ServerContext*, const rentledger::ledger::v1::GetPaymentRequest*,
                            rentledger::ledger::v1::GetPaymentResponse*) override;
  ::grpc::Status GetPaymentRecord(::grpc::ServerContext*, const rentledger::ledger::v1::GetPaymentRecordRequest*,
                                  rentledger::ledger::v1::GetPaymentRecordResponse*) override;
  ::grpc::Status GetPaymentCount(::grpc::ServerContext*, const rentledger::ledger::v1::GetPaymentCountRequest*,
                                 rentledger::ledger::v1::GetPaymentCountResponse*) override;
  ::grpc::Status GetTotalPaid(::grpc::ServerContext*, const rentledger::ledger::v1::GetTotalPaidRequest*,
                              rentledger::ledger::v1::GetTotalPaidResponse*) override;

private:
  std::shared_ptr<rentledger::service::LedgerService> service_;
  IdentityPolicy policy_;
};

}
