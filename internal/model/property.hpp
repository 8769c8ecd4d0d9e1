#pragma once

#include <optional>
#include <string>

#include "internal/model/types.hpp"

namespace rentledger::model {

struct PropertyDetails {
  std::string property_id;
  PrincipalId landlord;
  std::string metadata_hash;

  bool                     verified      = false;
  Timestamp                registered_at = 0;
  std::optional<Timestamp> verified_at;

  bool operator==(const PropertyDetails&) const = default;
};

struct PropertyRegistryState {
  PrincipalId admin;
  bool        initialized = false;
};

}  // namespace rentledger::model
