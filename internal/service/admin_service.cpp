#include "admin_service.hpp"

#include "internal/core/rent_ledger.hpp"
#include "observe_call.hpp"

namespace rentledger::service {

using namespace rentledger::ledger::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

MintTokensResponse AdminService::MintTokens(const MintTokensRequest& req, const auth::Authorizer& caller) {
  return ObserveCall("AdminService.MintTokens", [&] {
    MintTokensResponse resp;
    resp.set_balance(ctx_.ledger->MintTokens(caller, req.token(), req.to(), req.amount()));
    RENTLEDGER_LOG_INFO("tokens minted", {observability::StringField("token", req.token()), observability::StringField("to", req.to()),
                                          observability::IntField("amount", req.amount())});
    return resp;
  });
}

GetBalanceResponse AdminService::GetBalance(const GetBalanceRequest& req) {
  return ObserveCall("AdminService.GetBalance", [&] {
    GetBalanceResponse resp;
    resp.set_balance(ctx_.ledger->GetBalance(req.token(), req.principal()));
    return resp;
  });
}

} // namespace rentledger::service
