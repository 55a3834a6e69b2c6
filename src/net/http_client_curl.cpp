#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace {
size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* s = static_cast<std::string*>(userdata);
  s->append(ptr, size * nmemb);
  return size * nmemb;
}

struct CurlHandleDeleter {
  void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct HeaderListDeleter {
  void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) throw std::runtime_error("curl_global_init failed");
  }
  ~CurlHttpClient() override { curl_global_cleanup(); }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) throw std::runtime_error("curl_easy_init failed");
    std::string response_string;
    curl_slist* raw_list = nullptr;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      curl_slist* next = curl_slist_append(raw_list, line.c_str());
      if (!next) { curl_slist_free_all(raw_list); throw std::runtime_error("curl_slist_append failed"); }
      raw_list = next;
    }
    std::unique_ptr<curl_slist, HeaderListDeleter> header_list(raw_list);
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, tuning_.enable_tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
    curl_easy_setopt(h, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, tuning_.verify_tls ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, tuning_.verify_tls ? 2L : 0L);
    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
      Logger::Error(std::string("curl_easy_perform failed: ") + curl_easy_strerror(rc));
      throw std::runtime_error(std::string("HTTP POST failed: ") + curl_easy_strerror(rc));
    }
    HttpResponse resp;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(response_string);
    return resp;
  }
private:
  HttpClientTuning tuning_;
};

std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning) {
  return std::unique_ptr<HttpClient>(new CurlHttpClient(tuning));
}
