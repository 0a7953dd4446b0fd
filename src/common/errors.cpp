#include "common/errors.hpp"

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidKink: return "InvalidKink";
    case ErrorKind::kInvalidBaseRate: return "InvalidBaseRate";
    case ErrorKind::kInvalidTierBonus: return "InvalidTierBonus";
    case ErrorKind::kInvalidLockMultiplier: return "InvalidLockMultiplier";
    case ErrorKind::kInvalidLockDuration: return "InvalidLockDuration";
    case ErrorKind::kInvalidFeeRate: return "InvalidFeeRate";
    case ErrorKind::kInvalidRecipient: return "InvalidRecipient";
    case ErrorKind::kLockAlreadyExists: return "LockAlreadyExists";
    case ErrorKind::kNoLockFound: return "NoLockFound";
    case ErrorKind::kStillLocked: return "StillLocked";
    case ErrorKind::kInsufficientBalance: return "InsufficientBalance";
    case ErrorKind::kWithdrawalLocked: return "WithdrawalLocked";
    case ErrorKind::kTransferFailed: return "TransferFailed";
    case ErrorKind::kUnauthorized: return "Unauthorized";
    case ErrorKind::kInvalidConfig: return "InvalidConfig";
  }
  return "Unknown";
}

ErrorCategory CategoryOf(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidKink:
    case ErrorKind::kInvalidBaseRate:
    case ErrorKind::kInvalidTierBonus:
    case ErrorKind::kInvalidLockMultiplier:
    case ErrorKind::kInvalidLockDuration:
    case ErrorKind::kInvalidFeeRate:
    case ErrorKind::kInvalidRecipient:
    case ErrorKind::kInvalidConfig:
      return ErrorCategory::kConfigValidation;
    case ErrorKind::kLockAlreadyExists:
    case ErrorKind::kNoLockFound:
    case ErrorKind::kStillLocked:
    case ErrorKind::kInsufficientBalance:
    case ErrorKind::kWithdrawalLocked:
      return ErrorCategory::kStatePrecondition;
    case ErrorKind::kUnauthorized:
      return ErrorCategory::kAuthorization;
    case ErrorKind::kTransferFailed:
      return ErrorCategory::kCollaborator;
  }
  return ErrorCategory::kStatePrecondition;
}

StrategyError::StrategyError(ErrorKind kind, const std::string& message)
  : std::runtime_error(std::string(ErrorKindName(kind)) + ": " + message), kind_(kind) {}
