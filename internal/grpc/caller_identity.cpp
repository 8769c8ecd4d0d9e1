#include "caller_identity.hpp"

namespace rentledger::grpc {

namespace {

std::vector<std::string> PeerIdentities(const ::grpc::ServerContext& context) {
  std::vector<std::string> identities;
  auto                     auth = context.auth_context();
  if (!auth || !auth->IsPeerAuthenticated()) return identities;

  for (const auto& identity : auth->GetPeerIdentity()) {
    identities.emplace_back(identity.data(), identity.size());
  }
  return identities;
}

} // namespace

auth::CallerAuthorizer CallerFrom(const std::vector<std::string>& peer_identities, const ClientMetadata& metadata,
                                  const IdentityPolicy& policy) {
  auth::CallerAuthorizer caller;
  for (const auto& identity : peer_identities) {
    caller.Prove(identity);
  }

  if (policy.trust_principal_metadata) {
    auto range = metadata.equal_range(kPrincipalMetadataKey);
    for (auto it = range.first; it != range.second; ++it) {
      caller.Prove(std::string(it->second.data(), it->second.size()));
    }
  }
  return caller;
}

auth::CallerAuthorizer CallerFrom(const ::grpc::ServerContext* context, const IdentityPolicy& policy) {
  if (!context) return auth::CallerAuthorizer{};
  return CallerFrom(PeerIdentities(*context), context->client_metadata(), policy);
}

} // namespace rentledger::grpc
