#include "admin_server.hpp"

#include "caller_identity.hpp"
#include "grpc_error.hpp"

namespace rentledger::grpc {

using namespace rentledger::ledger::v1;

AdminServer::AdminServer(std::shared_ptr<rentledger::service::AdminService> svc, IdentityPolicy policy)
    : service_(std::move(svc)), policy_(policy) {
}

::grpc::Status AdminServer::MintTokens(::grpc::ServerContext* ctx, const MintTokensRequest* req, MintTokensResponse* resp) {
  return Invoke([&] { *resp = service_->MintTokens(*req, CallerFrom(ctx, policy_)); });
}

::grpc::Status AdminServer::GetBalance(::grpc::ServerContext*, const GetBalanceRequest* req, GetBalanceResponse* resp) {
  return Invoke([&] { *resp = service_->GetBalance(*req); });
}

} // namespace rentledger::grpc
