#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

std::unordered_map<std::string, std::string> ConfigManager::cache_;

static inline std::string TrimWhitespace(const std::string& input) {
  size_t start = 0, end = input.size();
  while (start < end && std::isspace(static_cast<unsigned char>(input[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
  return input.substr(start, end - start);
}

static inline std::string StripQuotes(const std::string& v) {
  if (v.size() >= 2 && ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\''))) {
    return v.substr(1, v.size() - 2);
  }
  return v;
}

void ConfigManager::Initialize(const std::string& env_path) {
  cache_.clear();
  LoadEnvFile(env_path);
}

void ConfigManager::LoadFromMap(const std::unordered_map<std::string, std::string>& values) {
  cache_ = values;
}

void ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) {
    Logger::Warning(".env file not found: " + env_path);
    return;
  }
  std::string line;
  while (std::getline(file, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = TrimWhitespace(line.substr(7));
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = TrimWhitespace(line.substr(0, pos));
    std::string value = StripQuotes(TrimWhitespace(line.substr(pos + 1)));
    if (!key.empty()) cache_[key] = value;
  }
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  if (const char* env = std::getenv(key.c_str())) return std::string(env);
  auto it = cache_.find(key);
  if (it == cache_.end()) return std::nullopt;
  return it->second;
}

std::string ConfigManager::GetOrThrow(const std::string& key) {
  auto v = Get(key);
  if (!v || v->empty()) throw std::runtime_error("Missing required config: " + key);
  return *v;
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  auto v = Get(key);
  if (!v || v->empty()) return default_value;
  size_t used = 0;
  int out = 0;
  try { out = std::stoi(*v, &used); } catch (const std::exception&) { used = 0; }
  if (used == 0 || used != v->size()) throw std::invalid_argument("config " + key + " is not an integer: " + *v);
  return out;
}

unsigned long long ConfigManager::GetUint64Or(const std::string& key, unsigned long long default_value) {
  auto v = Get(key);
  if (!v || v->empty()) return default_value;
  if ((*v)[0] == '-') throw std::invalid_argument("config " + key + " must be unsigned: " + *v);
  size_t used = 0;
  unsigned long long out = 0;
  int base = (v->rfind("0x", 0) == 0 || v->rfind("0X", 0) == 0) ? 16 : 10;
  try { out = std::stoull(*v, &used, base); } catch (const std::exception&) { used = 0; }
  if (used == 0 || used != v->size()) throw std::invalid_argument("config " + key + " is not an unsigned integer: " + *v);
  return out;
}

bool ConfigManager::GetBoolOr(const std::string& key, bool default_value) {
  auto v = Get(key);
  if (!v || v->empty()) return default_value;
  std::string s = *v;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "1" || s == "true" || s == "yes") return true;
  if (s == "0" || s == "false" || s == "no") return false;
  throw std::invalid_argument("config " + key + " is not a boolean: " + *v);
}
