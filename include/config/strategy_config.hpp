#pragma once
#include <string>
#include "common/logger.hpp"
#include "common/types.hpp"

struct StrategyConfig {
  std::string name = "cooldown-staking";
  std::string description = "Threshold-batched deposits into a cooldown staking vault";
  Amount deposit_threshold = 0;
  std::string log_file = "strategy.log";
  LogLevel log_level = LogLevel::INFO;
  bool log_stderr = false;
  std::string events_file = "events.jsonl";
};

// Reads STRATEGY_NAME, STRATEGY_DESCRIPTION, DEPOSIT_THRESHOLD, LOG_FILE, LOG_LEVEL,
// LOG_STDERR and EVENTS_FILE; absent keys keep the defaults above.
StrategyConfig LoadStrategyConfig();
