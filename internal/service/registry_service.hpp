#pragma once

#include "internal/auth/authorizer.hpp"
#include "rentledger/ledger/v1/registry_service.pb.h"
#include "service_context.hpp"

namespace rentledger::service {

// Property registry and rent obligation operations.
class RegistryService {
public:
  explicit RegistryService(ServiceContext ctx);

  rentledger::ledger::v1::InitializeRegistryResponse
  InitializeRegistry(const rentledger::ledger::v1::InitializeRegistryRequest& req, const auth::Authorizer& caller);

  rentledger::ledger::v1::RegisterPropertyResponse
  RegisterProperty(const rentledger::ledger::v1::RegisterPropertyRequest& req, const auth::Authorizer& caller);

  rentledger::ledger::v1::VerifyPropertyResponse
  VerifyProperty(const rentledger::ledger::v1::VerifyPropertyRequest& req, const auth::Authorizer& caller);

  rentledger::ledger::v1::GetPropertyResponse
  GetProperty(const rentledger::ledger::v1::GetPropertyRequest& req);

  rentledger::ledger::v1::GetPropertyCountResponse
  GetPropertyCount(const rentledger::ledger::v1::GetPropertyCountRequest& req);

  rentledger::ledger::v1::GetRegistryStateResponse
  GetRegistryState(const rentledger::ledger::v1::GetRegistryStateRequest& req);

  rentledger::ledger::v1::InitializeObligationsResponse
  InitializeObligations(const rentledger::ledger::v1::InitializeObligationsRequest& req, const auth::Authorizer& caller);

  rentledger::ledger::v1::MintObligationResponse
  MintObligation(const rentledger::ledger::v1::MintObligationRequest& req, const auth::Authorizer& caller);

  rentledger::ledger::v1::TransferObligationResponse
  TransferObligation(const rentledger::ledger::v1::TransferObligationRequest& req, const auth::Authorizer& caller);

  rentledger::ledger::v1::GetObligationResponse
  GetObligation(const rentledger::ledger::v1::GetObligationRequest& req);

  rentledger::ledger::v1::GetObligationCountResponse
  GetObligationCount(const rentledger::ledger::v1::GetObligationCountRequest& req);

private:
  ServiceContext ctx_;
};

}
