#pragma once
#include <string>
#include <unordered_map>
#include <optional>

// KEY=VALUE settings from a .env file. Process environment variables take precedence.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  // Replaces the file-backed cache (no file I/O). Environment overrides still apply.
  static void LoadFromMap(const std::unordered_map<std::string, std::string>& values);
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  // Numeric getters throw std::invalid_argument when a value is present but malformed.
  static int GetIntOr(const std::string& key, int default_value);
  static unsigned long long GetUint64Or(const std::string& key, unsigned long long default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
