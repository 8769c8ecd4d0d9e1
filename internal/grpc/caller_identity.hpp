#pragma once

#include <map>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/auth/authorizer.hpp"

namespace rentledger::grpc {

inline constexpr const char* kPrincipalMetadataKey = "x-rentledger-principal";

struct IdentityPolicy {
  // When false, metadata principals are ignored and only the authenticated
  // TLS peer identity counts.
  bool trust_principal_metadata = false;
};

using ClientMetadata = std::multimap<::grpc::string_ref, ::grpc::string_ref>;

// Principals the caller proved for this call.
auth::CallerAuthorizer CallerFrom(const ::grpc::ServerContext* context, const IdentityPolicy& policy);

auth::CallerAuthorizer CallerFrom(const std::vector<std::string>& peer_identities, const ClientMetadata& metadata,
                                  const IdentityPolicy& policy);

} // namespace rentledger::grpc
