#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rentledger::util {

/*
  Central error types.

  Every rejected ledger operation throws one of these. The ErrorCode keeps
  the precise reason; the exception class is the coarse kind that the
  transport layer translates into gRPC status codes.
*/

enum class ErrorCode : std::uint32_t {
  kAlreadyInitialized      = 1,
  kNotInitialized          = 2,
  kAgreementAlreadyExists  = 4,
  kInvalidAmount           = 5,
  kInvalidDate             = 6,
  kInvalidCommissionRate   = 7,
  kAgreementNotActive      = 10,
  kPaymentNotFound         = 11,
  kPaymentFailed           = 12,
  kAgreementNotFound       = 13,
  kUnauthorized            = 14,
  kInvalidTransition       = 15,
  kPropertyAlreadyExists   = 20,
  kPropertyNotFound        = 21,
  kAlreadyVerified         = 22,
  kInvalidPropertyId       = 23,
  kInvalidMetadata         = 24,
  kObligationAlreadyExists = 30,
  kObligationNotFound      = 31,
};

std::string_view ToString(ErrorCode code);

class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const noexcept {
    return code_;
  }

 private:
  ErrorCode code_;
};

class NotFound : public LedgerError {
 public:
  NotFound(ErrorCode code, const std::string& msg) : LedgerError(code, msg) {
  }
};

class AlreadyExists : public LedgerError {
 public:
  AlreadyExists(ErrorCode code, const std::string& msg) : LedgerError(code, msg) {
  }
};

class InvalidAmount : public LedgerError {
 public:
  explicit InvalidAmount(const std::string& msg) : LedgerError(ErrorCode::kInvalidAmount, msg) {
  }
};

class InvalidDate : public LedgerError {
 public:
  explicit InvalidDate(const std::string& msg) : LedgerError(ErrorCode::kInvalidDate, msg) {
  }
};

class InvalidCommissionRate : public LedgerError {
 public:
  explicit InvalidCommissionRate(const std::string& msg) : LedgerError(ErrorCode::kInvalidCommissionRate, msg) {
  }
};

class NotActive : public LedgerError {
 public:
  explicit NotActive(const std::string& msg) : LedgerError(ErrorCode::kAgreementNotActive, msg) {
  }
};

class InvalidState : public LedgerError {
 public:
  InvalidState(ErrorCode code, const std::string& msg) : LedgerError(code, msg) {
  }
};

class InvalidArgument : public LedgerError {
 public:
  InvalidArgument(ErrorCode code, const std::string& msg) : LedgerError(code, msg) {
  }
};

class Unauthorized : public LedgerError {
 public:
  explicit Unauthorized(const std::string& msg) : LedgerError(ErrorCode::kUnauthorized, msg) {
  }
};

class TransferFailed : public LedgerError {
 public:
  explicit TransferFailed(const std::string& msg) : LedgerError(ErrorCode::kPaymentFailed, msg) {
  }
};

// Throws the exception kind that owns `code`.
[[noreturn]] void ThrowError(ErrorCode code, const std::string& msg);

} // namespace rentledger::util
