#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCode {
  DepositBlocked,
  WithdrawBlocked,
  InsufficientFunds,
  PauserNotAuthorized,
  CooldownNotAuthorized,
  NotOwner,
  InvalidConfiguration,
  TransferFailed,
  ReentrantCall
};

const char* ErrorCodeName(ErrorCode code);

// Raised by the strategy itself. Every throw aborts the whole operation.
class StrategyError : public std::runtime_error {
public:
  StrategyError(ErrorCode code, const std::string& detail);
  ErrorCode Code() const { return code_; }
private:
  ErrorCode code_;
};

// Raised by external collaborators (staking vault, wrap adapter, token ledgers).
class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};
