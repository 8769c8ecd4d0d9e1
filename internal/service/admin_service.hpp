#pragma once

#include "internal/auth/authorizer.hpp"
#include "rentledger/ledger/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace rentledger::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  rentledger::ledger::v1::MintTokensResponse
  MintTokens(const rentledger::ledger::v1::MintTokensRequest& req, const auth::Authorizer& caller);

  rentledger::ledger::v1::GetBalanceResponse
  GetBalance(const rentledger::ledger::v1::GetBalanceRequest& req);

private:
  ServiceContext ctx_;
};

}
