#pragma once

#include <cstdint>
#include <string>

namespace rentledger::model {

// Principals (tenant, landlord, agent, admin) are referenced by identifier only.
using PrincipalId = std::string;

using Amount    = std::int64_t;
using Timestamp = std::uint64_t;

// Commission rates are basis points: 10000 == 100%.
inline constexpr std::uint32_t kBasisPointsDenominator = 10'000;

}  // namespace rentledger::model
