#pragma once
#include <string>
#include <optional>
#include <unordered_map>

class HttpClient;

class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt,
            int default_timeout_ms = 3000);
  // Sends a raw JSON-RPC payload; throws on non-2xx status.
  std::string Send(const std::string& json_payload, int timeout_ms);

  // eth_call against `block` (default "latest"); returns 0x-prefixed return data.
  std::string EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block = std::nullopt);
  // Hex quantity strings as returned by the node.
  std::string EthBlockNumber();
  std::string EthGetBalance(const std::string& address, const std::string& block_tag = "latest");

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  int default_timeout_ms_;
  std::unordered_map<std::string, std::string> default_headers_;
  int next_id_ = 1;
};
