#include "errors.hpp"

namespace rentledger::util {

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kAlreadyInitialized:
      return "AlreadyInitialized";
    case ErrorCode::kNotInitialized:
      return "NotInitialized";
    case ErrorCode::kAgreementAlreadyExists:
      return "AgreementAlreadyExists";
    case ErrorCode::kInvalidAmount:
      return "InvalidAmount";
    case ErrorCode::kInvalidDate:
      return "InvalidDate";
    case ErrorCode::kInvalidCommissionRate:
      return "InvalidCommissionRate";
    case ErrorCode::kAgreementNotActive:
      return "AgreementNotActive";
    case ErrorCode::kPaymentNotFound:
      return "PaymentNotFound";
    case ErrorCode::kPaymentFailed:
      return "PaymentFailed";
    case ErrorCode::kAgreementNotFound:
      return "AgreementNotFound";
    case ErrorCode::kUnauthorized:
      return "Unauthorized";
    case ErrorCode::kInvalidTransition:
      return "InvalidTransition";
    case ErrorCode::kPropertyAlreadyExists:
      return "PropertyAlreadyExists";
    case ErrorCode::kPropertyNotFound:
      return "PropertyNotFound";
    case ErrorCode::kAlreadyVerified:
      return "AlreadyVerified";
    case ErrorCode::kInvalidPropertyId:
      return "InvalidPropertyId";
    case ErrorCode::kInvalidMetadata:
      return "InvalidMetadata";
    case ErrorCode::kObligationAlreadyExists:
      return "ObligationAlreadyExists";
    case ErrorCode::kObligationNotFound:
      return "ObligationNotFound";
  }
  return "Unknown";
}

void ThrowError(ErrorCode code, const std::string& msg) {
  switch (code) {
    case ErrorCode::kAgreementAlreadyExists:
    case ErrorCode::kPropertyAlreadyExists:
    case ErrorCode::kObligationAlreadyExists:
    case ErrorCode::kAlreadyInitialized:
      throw AlreadyExists(code, msg);
    case ErrorCode::kAgreementNotFound:
    case ErrorCode::kPaymentNotFound:
    case ErrorCode::kPropertyNotFound:
    case ErrorCode::kObligationNotFound:
      throw NotFound(code, msg);
    case ErrorCode::kInvalidAmount:
      throw InvalidAmount(msg);
    case ErrorCode::kInvalidDate:
      throw InvalidDate(msg);
    case ErrorCode::kInvalidCommissionRate:
      throw InvalidCommissionRate(msg);
    case ErrorCode::kAgreementNotActive:
      throw NotActive(msg);
    case ErrorCode::kInvalidTransition:
    case ErrorCode::kNotInitialized:
    case ErrorCode::kAlreadyVerified:
      throw InvalidState(code, msg);
    case ErrorCode::kInvalidPropertyId:
    case ErrorCode::kInvalidMetadata:
      throw InvalidArgument(code, msg);
    case ErrorCode::kUnauthorized:
      throw Unauthorized(msg);
    case ErrorCode::kPaymentFailed:
      throw TransferFailed(msg);
  }
  throw LedgerError(code, msg);
}

} // namespace rentledger::util
