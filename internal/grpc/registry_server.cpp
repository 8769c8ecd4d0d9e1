#include "registry_server.hpp"

#include "caller_identity.hpp"
#include "grpc_error.hpp"

namespace rentledger::grpc {

using namespace rentledger::ledger::v1;

RegistryServer::RegistryServer(std::shared_ptr<rentledger::service::RegistryService> svc, IdentityPolicy policy)
    : service_(std::move(svc)), policy_(policy) {
}

::grpc::Status RegistryServer::InitializeRegistry(::grpc::ServerContext* ctx, const InitializeRegistryRequest* req,
                                                  InitializeRegistryResponse* resp) {
  return Invoke([&] { *resp = service_->InitializeRegistry(*req, CallerFrom(ctx, policy_)); });
}

::grpc::Status RegistryServer::RegisterProperty(::grpc::ServerContext* ctx, const RegisterPropertyRequest* req, RegisterPropertyResponse* resp) {
  return Invoke([&] { *resp = service_->RegisterProperty(*req, CallerFrom(ctx, policy_)); });
}

::grpc::Status RegistryServer::VerifyProperty(::grpc::ServerContext* ctx, const VerifyPropertyRequest* req, VerifyPropertyResponse* resp) {
  return Invoke([&] { *resp = service_->VerifyProperty(*req, CallerFrom(ctx, policy_)); });
}

::grpc::Status RegistryServer::GetProperty(::grpc::ServerContext*, const GetPropertyRequest* req, GetPropertyResponse* resp) {
  return Invoke([&] { *resp = service_->GetProperty(*req); });
}

::grpc::Status RegistryServer::GetPropertyCount(::grpc::ServerContext*, const GetPropertyCountRequest* req, GetPropertyCountResponse* resp) {
  return Invoke([&] { *resp = service_->GetPropertyCount(*req); });
}

::grpc::Status RegistryServer::GetRegistryState(::grpc::ServerContext*, const GetRegistryStateRequest* req, GetRegistryStateResponse* resp) {
  return Invoke([&] { *resp = service_->GetRegistryState(*req); });
}

ObligationServer::ObligationServer(std::shared_ptr<rentledger::service::RegistryService> svc, IdentityPolicy policy)
    : service_(std::move(svc)), policy_(policy) {
}

::grpc::Status ObligationServer::InitializeObligations(::grpc::ServerContext* ctx, const InitializeObligationsRequest* req,
                                                       InitializeObligationsResponse* resp) {
  return Invoke([&] { *resp = service_->InitializeObligations(*req, CallerFrom(ctx, policy_)); });
}

::grpc::Status ObligationServer::MintObligation(::grpc::ServerContext* ctx, const MintObligationRequest* req, MintObligationResponse* resp) {
  return Invoke([&] { *resp = service_->MintObligation(*req, CallerFrom(ctx, policy_)); });
}

::grpc::Status ObligationServer::TransferObligation(::grpc::ServerContext* ctx, const TransferObligationRequest* req,
                                                    TransferObligationResponse* resp) {
  return Invoke([&] { *resp = service_->TransferObligation(*req, CallerFrom(ctx, policy_)); });
}

::grpc::Status ObligationServer::GetObligation(::grpc::ServerContext*, const GetObligationRequest* req, GetObligationResponse* resp) {
  return Invoke([&] { *resp = service_->GetObligation(*req); });
}

::grpc::Status ObligationServer::GetObligationCount(::grpc::ServerContext*, const GetObligationCountRequest* req,
                                                    GetObligationCountResponse* resp) {
  return Invoke([&] { *resp = service_->GetObligationCount(*req); });
}

} // namespace rentledger::grpc
