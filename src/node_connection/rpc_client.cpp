#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"
#include <cctype>
#include <stdexcept>

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "Name: value" sets that header; a bare token becomes the Authorization header.
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header,
                     int default_timeout_ms)
  : http_(http), endpoint_(endpoint_url), default_timeout_ms_(default_timeout_ms) {
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

std::string RpcClient::Send(const std::string& json_payload, int timeout_ms) {
  auto resp = http_.Post(endpoint_, json_payload, default_headers_, timeout_ms);
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error("HTTP POST failed status=" + std::to_string(resp.status));
    throw std::runtime_error("HTTP POST failed status=" + std::to_string(resp.status));
  }
  return resp.body;
}

std::string RpcClient::EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block) {
  nlohmann::json call = {{"to", to}, {"data", data}};
  nlohmann::json params = nlohmann::json::array({call, block.value_or("latest")});
  auto payload = JsonRpcUtil::BuildRequest("eth_call", params, next_id_++);
  return JsonRpcUtil::ExtractResult(Send(payload, default_timeout_ms_));
}

std::string RpcClient::EthBlockNumber() {
  auto payload = JsonRpcUtil::BuildRequest("eth_blockNumber", nlohmann::json::array(), next_id_++);
  return JsonRpcUtil::ExtractResult(Send(payload, default_timeout_ms_));
}

std::string RpcClient::EthGetBalance(const std::string& address, const std::string& block_tag) {
  auto payload = JsonRpcUtil::BuildRequest("eth_getBalance", nlohmann::json::array({address, block_tag}), next_id_++);
  return JsonRpcUtil::ExtractResult(Send(payload, default_timeout_ms_));
}
