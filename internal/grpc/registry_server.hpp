#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "rentledger/ledger/v1/registry_service.grpc.pb.h"
#include "internal/grpc/caller_identity.hpp"
#include "internal/service/registry_service.hpp"

namespace rentledger::grpc {

class RegistryServer final : public rentledger::ledger::v1::PropertyRegistryService::Service {
public:
  explicit RegistryServer(std::shared_ptr<rentledger::service::RegistryService> svc, IdentityPolicy policy = {});

  ::grpc::Status InitializeRegistry(::grpc::ServerContext*, const rentledger::ledger::v1::InitializeRegistryRequest*,
                                    rentledger::ledger::v1::InitializeRegistryResponse*) override;
  ::grpc::Status RegisterProperty(::grpc::ServerContext*, const rentledger::ledger::v1::RegisterPropertyRequest*,
                                  rentledger::ledger::v1::RegisterPropertyResponse*) override;
  ::grpc::Status VerifyProperty(::grpc::ServerContext*, const rentledger::ledger::v1::VerifyPropertyRequest*,
                                rentledger::ledger::v1::VerifyPropertyResponse*) override;
  ::grpc::Status GetProperty(::grpc::ServerContext*, const rentledger::ledger::v1::GetPropertyRequest*,
                             rentledger::ledger::v1::GetPropertyResponse*) override;
  ::grpc::Status GetPropertyCount(::grpc::ServerContext*, const rentledger::ledger::v1::GetPropertyCountRequest*,
                                  rentledger::ledger::v1::GetPropertyCountResponse*) override;
  ::grpc::Status GetRegistryState(::grpc::ServerContext*, const rentledger::ledger::v1::GetRegistryStateRequest*,
                                  rentledger::ledger::v1::GetRegistryStateResponse*) override;

private:
  std::shared_ptr<rentledger::service::RegistryService> service_;
  IdentityPolicy policy_;
};

class ObligationServer final : public rentledger::ledger::v1::ObligationService::Service {
public:
  explicit ObligationServer(std::shared_ptr<rentledger::service::RegistryService> svc, IdentityPolicy policy = {});

  ::grpc::Status InitializeObligations(::grpc::ServerContext*, const rentledger::ledger::v1::InitializeObligationsRequest*,
                                       rentledger::ledger::v1::InitializeObligationsResponse*) override;
  ::grpc::Status MintObligation(::grpc::ServerContext*, const rentledger::ledger::v1::MintObligationRequest*,
                                rentledger::ledger::v1::MintObligationResponse*) override;
  ::grpc::Status TransferObligation(::grpc::ServerContext*, const rentledger::ledger::v1::TransferObligationRequest*,
                                    rentledger::ledger::v1::TransferObligationResponse*) override;
  ::grpc::Status GetObligation(::grpc::ServerContext*, const rentledger::ledger::v1::GetObligationRequest*,
                               rentledger::ledger::v1::GetObligationResponse*) override;
  ::grpc::Status GetObligationCount(::grpc::ServerContext*, const rentledger::ledger::v1::GetObligationCountRequest*,
                                    rentledger::ledger::v1::GetObligationCountResponse*) override;

private:
  std::shared_ptr<rentledger::service::RegistryService> service_;
  IdentityPolicy policy_;
};

}
