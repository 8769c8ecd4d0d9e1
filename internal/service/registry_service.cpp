#include "registry_service.hpp"

#include "internal/core/rent_ledger.hpp"
#include "internal/storage/record_codec.hpp"
#include "observe_call.hpp"

namespace rentledger::service {

using namespace rentledger::ledger::v1;

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

InitializeRegistryResponse RegistryService::InitializeRegistry(const InitializeRegistryRequest& req, const auth::Authorizer& caller) {
  return ObserveCall("RegistryService.InitializeRegistry", [&] {
    ctx_.ledger->InitializeRegistry(caller, req.admin());
    return InitializeRegistryResponse{};
  });
}

RegisterPropertyResponse RegistryService::RegisterProperty(const RegisterPropertyRequest& req, const auth::Authorizer& caller) {
  return ObserveCall("RegistryService.RegisterProperty", [&] {
    RegisterPropertyResponse resp;
    *resp.mutable_property() =
        storage::ToProto(ctx_.ledger->RegisterProperty(caller, req.landlord(), req.property_id(), req.metadata_hash()));
    return resp;
  });
}

VerifyPropertyResponse RegistryService::VerifyProperty(const VerifyPropertyRequest& req, const auth::Authorizer& caller) {
  return ObserveCall("RegistryService.VerifyProperty", [&] {
    VerifyPropertyResponse resp;
    *resp.mutable_property() = storage::ToProto(ctx_.ledger->VerifyProperty(caller, req.admin(), req.property_id()));
    return resp;
  });
}

GetPropertyResponse RegistryService::GetProperty(const GetPropertyRequest& req) {
  return ObserveCall("RegistryService.GetProperty", [&] {
    GetPropertyResponse resp;
    if (auto property = ctx_.ledger->GetProperty(req.property_id())) {
      resp.set_found(true);
      *resp.mutable_property() = storage::ToProto(*property);
    }
    return resp;
  });
}

GetPropertyCountResponse RegistryService::GetPropertyCount(const GetPropertyCountRequest&) {
  return ObserveCall("RegistryService.GetPropertyCount", [&] {
    GetPropertyCountResponse resp;
    resp.set_count(ctx_.ledger->GetPropertyCount());
    return resp;
  });
}

GetRegistryStateResponse RegistryService::GetRegistryState(const GetRegistryStateRequest&) {
  return ObserveCall("RegistryService.GetRegistryState", [&] {
    GetRegistryStateResponse resp;
    if (auto state = ctx_.ledger->GetRegistryState()) {
      resp.set_found(true);
      *resp.mutable_state() = storage::ToProto(*state);
    }
    return resp;
  });
}

InitializeObligationsResponse RegistryService::InitializeObligations(const InitializeObligationsRequest&, const auth::Authorizer& caller) {
  return ObserveCall("RegistryService.InitializeObligations", [&] {
    ctx_.ledger->InitializeObligations(caller);
    return InitializeObligationsResponse{};
  });
}

MintObligationResponse RegistryService::MintObligation(const MintObligationRequest& req, const auth::Authorizer& caller) {
  return ObserveCall("RegistryService.MintObligation", [&] {
    MintObligationResponse resp;
    *resp.mutable_obligation() = storage::ToProto(ctx_.ledger->MintObligation(caller, req.agreement_id(), req.landlord()));
    return resp;
  });
}

TransferObligationResponse RegistryService::TransferObligation(const TransferObligationRequest& req, const auth::Authorizer& caller) {
  return ObserveCall("RegistryService.TransferObligation", [&] {
    TransferObligationResponse resp;
    *resp.mutable_obligation() = storage::ToProto(ctx_.ledger->TransferObligation(caller, req.from(), req.to(), req.agreement_id()));
    return resp;
  });
}

GetObligationResponse RegistryService::GetObligation(const GetObligationRequest& req) {
  return ObserveCall("RegistryService.GetObligation", [&] {
    GetObligationResponse resp;
    if (auto obligation = ctx_.ledger->GetObligation(req.agreement_id())) {
      resp.set_found(true);
      *resp.mutable_obligation() = storage::ToProto(*obligation);
    }
    return resp;
  });
}

GetObligationCountResponse RegistryService::GetObligationCount(const GetObligationCountRequest&) {
  return ObserveCall("RegistryService.GetObligationCount", [&] {
    GetObligationCountResponse resp;
    resp.set_count(ctx_.ledger->GetObligationCount());
    return resp;
  });
}

} // namespace rentledger::service
