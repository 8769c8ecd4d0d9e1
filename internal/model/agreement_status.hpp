#pragma once

#include <cstdint>
#include <string_view>

namespace rentledger::model {

enum class AgreementStatus : std::uint8_t {
  kDraft      = 0,
  kPending    = 1,
  kActive     = 2,
  kCompleted  = 3,
  kCancelled  = 4,
  kTerminated = 5,
  kDisputed   = 6,
};

constexpr bool IsTerminal(AgreementStatus status) {
  return status == AgreementStatus::kCompleted || status == AgreementStatus::kCancelled || status == AgreementStatus::kTerminated;
}

constexpr bool CanTransition(AgreementStatus from, AgreementStatus to) {
  if (from == to || IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case AgreementStatus::kDraft:
      return to == AgreementStatus::kPending || to == AgreementStatus::kActive || to == AgreementStatus::kCancelled;
    case AgreementStatus::kPending:
      return to == AgreementStatus::kActive || to == AgreementStatus::kCancelled;
    case AgreementStatus::kActive:
      return to == AgreementStatus::kCompleted || to == AgreementStatus::kTerminated || to == AgreementStatus::kDisputed;
    case AgreementStatus::kDisputed:
      return to == AgreementStatus::kActive || to == AgreementStatus::kTerminated;
    default:
      return false;
  }
}

constexpr std::string_view ToString(AgreementStatus status) {
  switch (status) {
    case AgreementStatus::kDraft:
      return "draft";
    case AgreementStatus::kPending:
      return "pending";
    case AgreementStatus::kActive:
      return "active";
    case AgreementStatus::kCompleted:
      return "completed";
    case AgreementStatus::kCancelled:
      return "cancelled";
    case AgreementStatus::kTerminated:
      return "terminated";
    case AgreementStatus::kDisputed:
      return "disputed";
  }
  return "unknown";
}

}  // namespace rentledger::model
