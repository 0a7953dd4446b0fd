#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  kInvalidKink,
  kInvalidBaseRate,
  kInvalidTierBonus,
  kInvalidLockMultiplier,
  kInvalidLockDuration,
  kInvalidFeeRate,
  kInvalidRecipient,
  kLockAlreadyExists,
  kNoLockFound,
  kStillLocked,
  kInsufficientBalance,
  kWithdrawalLocked,
  kTransferFailed,
  kUnauthorized,
  kInvalidConfig
};

enum class ErrorCategory { kConfigValidation, kStatePrecondition, kAuthorization, kCollaborator };

const char* ErrorKindName(ErrorKind kind);
ErrorCategory CategoryOf(ErrorKind kind);

// Thrown by every strategy operation that aborts. The operation leaves no state behind.
class StrategyError : public std::runtime_error {
public:
  StrategyError(ErrorKind kind, const std::string& message);
  ErrorKind Kind() const { return kind_; }
  ErrorCategory Category() const { return CategoryOf(kind_); }
private:
  ErrorKind kind_;
};
