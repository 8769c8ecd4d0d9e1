#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "rentledger/ledger/v1/admin_service.grpc.pb.h"
#include "internal/grpc/caller_identity.hpp"
#include "internal/service/admin_service.hpp"

namespace rentledger::grpc {

class AdminServer final : public rentledger::ledger::v1::LedgerAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<rentledger::service::AdminService> svc, IdentityPolicy policy = {});

  ::grpc::Status MintTokens(::grpc::ServerContext*,
                            const rentledger::ledger::v1::MintTokensRequest*,
                            rentledger::ledger::v1::MintTokensResponse*) override;

  ::grpc::Status GetBalance(::grpc::ServerContext*,
                            const rentledger::ledger::v1::GetBalanceRequest*,
                            rentledger::ledger::v1::GetBalanceResponse*) override;

private:
  std::shared_ptr<rentledger::service::AdminService> service_;
  IdentityPolicy policy_;
};

}
