#include "config/strategy_config.hpp"
#include "common/config_manager.hpp"

StrategyConfig LoadStrategyConfig() {
  StrategyConfig cfg;
  cfg.name = ConfigManager::Get("STRATEGY_NAME").value_or(cfg.name);
  cfg.description = ConfigManager::Get("STRATEGY_DESCRIPTION").value_or(cfg.description);
  cfg.deposit_threshold = ConfigManager::GetUint64Or("DEPOSIT_THRESHOLD", cfg.deposit_threshold);
  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or(cfg.log_file);
  if (auto level = ConfigManager::Get("LOG_LEVEL")) cfg.log_level = ParseLogLevel(*level);
  cfg.log_stderr = ConfigManager::GetBoolOr("LOG_STDERR", cfg.log_stderr);
  cfg.events_file = ConfigManager::Get("EVENTS_FILE").value_or(cfg.events_file);
  return cfg;
}
