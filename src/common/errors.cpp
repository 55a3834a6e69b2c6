#include "common/errors.hpp"

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::DepositBlocked: return "DepositBlocked";
    case ErrorCode::WithdrawBlocked: return "WithdrawBlocked";
    case ErrorCode::InsufficientFunds: return "InsufficientFunds";
    case ErrorCode::PauserNotAuthorized: return "PauserNotAuthorized";
    case ErrorCode::CooldownNotAuthorized: return "CooldownNotAuthorized";
    case ErrorCode::NotOwner: return "NotOwner";
    case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
    case ErrorCode::TransferFailed: return "TransferFailed";
    case ErrorCode::ReentrantCall: return "ReentrantCall";
  }
  return "Unknown";
}

static std::string FormatWhat(ErrorCode code, const std::string& detail) {
  if (detail.empty()) return ErrorCodeName(code);
  return std::string(ErrorCodeName(code)) + ": " + detail;
}

StrategyError::StrategyError(ErrorCode code, const std::string& detail)
  : std::runtime_error(FormatWhat(code, detail)), code_(code) {}
