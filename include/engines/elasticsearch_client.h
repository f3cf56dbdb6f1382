#ifndef ELASTICSEARCH_CLIENT_H
#define ELASTICSEARCH_CLIENT_H

#include "core/Config.h"
#include <curl/curl.h>
#include <string>

struct HTTPResponse {
  // 0 when the request never got an HTTP answer.
  int status_code = 0;
  std::string body;
  std::string error_message;

  bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Thin REST client over one curl easy handle. Not thread-safe: every reader
// and writer owns its own client.
class ElasticsearchClient {
  std::string baseUrl_;
  std::string username_;
  std::string password_;
  bool verifyTls_;
  int timeoutSeconds_;
  int maxRetries_;
  CURL *curl_;

  static size_t WriteCallback(void *contents, size_t size, size_t nmemb,
                              void *userp);

public:
  explicit ElasticsearchClient(const EndpointConfig &endpoint);
  ~ElasticsearchClient();

  ElasticsearchClient(const ElasticsearchClient &) = delete;
  ElasticsearchClient &operator=(const ElasticsearchClient &) = delete;

  void setTimeout(int seconds) { timeoutSeconds_ = seconds; }
  // Retries after 429 and 5xx/transport failures; 0 sends exactly once.
  void setMaxRetries(int retries) { maxRetries_ = retries; }
  const std::string &baseUrl() const { return baseUrl_; }

  HTTPResponse request(const std::string &method, const std::string &path,
                       const std::string &body = "",
                       const std::string &contentType = "application/json");

  static std::string urlEncode(const std::string &value);
  // Process-wide libcurl setup; safe to call repeatedly.
  static void globalInit();

private:
  void initializeCurl();
  HTTPResponse executeRequest(const std::string &url, const std::string &method,
                              const std::string &body,
                              const std::string &contentType);
  bool handleRateLimit(int statusCode, int &retryCount);
};

#endif
