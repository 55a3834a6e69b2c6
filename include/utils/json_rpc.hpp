#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // {"jsonrpc":"2.0","method":...,"params":[...],"id":id}
  std::string BuildRequest(const std::string& method, const nlohmann::json& params, int id = 1);
  // Returns the "result" field as string (raw dump for non-strings), throws on error or missing result
  std::string ExtractResult(const std::string& json_body);
  // Extract error message if present, empty otherwise
  std::string ExtractError(const std::string& json_body);
}
