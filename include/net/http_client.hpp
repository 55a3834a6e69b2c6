#pragma once
#include <memory>
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;
  std::string body;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  // Transport failures throw std::runtime_error; HTTP status is reported, not checked.
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

struct HttpClientTuning {
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  bool verify_tls = true;
};

std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning());
