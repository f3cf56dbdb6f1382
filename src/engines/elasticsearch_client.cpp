#include "engines/elasticsearch_client.h"
#include "core/logger.h"
#include <cctype>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

void ElasticsearchClient::globalInit() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

ElasticsearchClient::ElasticsearchClient(const EndpointConfig &endpoint)
    : username_(endpoint.user), password_(endpoint.password),
      verifyTls_(endpoint.verifyTls),
      timeoutSeconds_(DatabaseDefaults::HTTP_TIMEOUT_SECONDS), maxRetries_(3),
      curl_(nullptr) {
  baseUrl_ = endpoint.scheme + "://" + endpoint.host + ":" +
             std::to_string(endpoint.resolvedPort());
  globalInit();
  initializeCurl();
}

ElasticsearchClient::~ElasticsearchClient() {
  if (curl_) {
    curl_easy_cleanup(curl_);
  }
}

void ElasticsearchClient::initializeCurl() {
  if (curl_) {
    curl_easy_cleanup(curl_);
  }
  curl_ = curl_easy_init();
  if (!curl_) {
    Logger::error(LogCategory::SEARCH, "ElasticsearchClient",
                  "Failed to initialize CURL");
  }
}

size_t ElasticsearchClient::WriteCallback(void *contents, size_t size,
                                          size_t nmemb, void *userp) {
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            size * nmemb);
  return size * nmemb;
}

std::string ElasticsearchClient::urlEncode(const std::string &value) {
  std::ostringstream encoded;
  encoded.fill('0');
  encoded << std::hex << std::uppercase;

  for (char c : value) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded << c;
    } else {
      encoded << '%' << std::setw(2) << int(uc);
    }
  }

  return encoded.str();
}

bool ElasticsearchClient::handleRateLimit(int statusCode, int &retryCount) {
  if (statusCode == 429 && retryCount < maxRetries_) {
    int backoffSeconds = (1 << retryCount);
    Logger::warning(LogCategory::SEARCH, "ElasticsearchClient",
                    "Rate limit detected (429), backing off for " +
                        std::to_string(backoffSeconds) + " seconds");
    std::this_thread::sleep_for(std::chrono::seconds(backoffSeconds));
    retryCount++;
    return true;
  }
  return false;
}

HTTPResponse ElasticsearchClient::executeRequest(const std::string &url,
                                                 const std::string &method,
                                                 const std::string &body,
                                                 const std::string &contentType) {
  HTTPResponse response;

  if (!curl_) {
    initializeCurl();
    if (!curl_) {
      response.error_message = "CURL not initialized";
      return response;
    }
  }

  curl_easy_reset(curl_);

  std::string responseBody;
  struct curl_slist *headerList = nullptr;

  curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &responseBody);
  curl_easy_setopt(curl_, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds_));
  curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(DatabaseDefaults::CONNECT_TIMEOUT_SECONDS));
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, verifyTls_ ? 1L : 0L);
  curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, verifyTls_ ? 2L : 0L);

  if (method == "GET") {
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    if (!body.empty()) {
      curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "GET");
      curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
      curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(body.length()));
    }
  } else if (method == "HEAD") {
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
  } else if (method == "POST") {
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.length()));
  } else {
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (!body.empty()) {
      curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
      curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(body.length()));
    }
  }

  if (!body.empty()) {
    std::string header = "Content-Type: " + contentType;
    headerList = curl_slist_append(headerList, header.c_str());
  }

  std::string userpwd;
  if (!username_.empty()) {
    userpwd = username_ + ":" + password_;
    curl_easy_setopt(curl_, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl_, CURLOPT_USERPWD, userpwd.c_str());
  }

  if (headerList) {
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headerList);
  }

  CURLcode res = curl_easy_perform(curl_);

  if (headerList) {
    curl_slist_free_all(headerList);
  }

  if (res != CURLE_OK) {
    response.error_message = curl_easy_strerror(res);
    return response;
  }

  long httpCode = 0;
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &httpCode);
  response.status_code = static_cast<int>(httpCode);
  response.body = std::move(responseBody);

  return response;
}

// Sends the request once, then retries up to maxRetries_ times on 429
// (exponential backoff) and on transport failures or 5xx (linear backoff).
// Other 4xx answers are returned immediately.
HTTPResponse ElasticsearchClient::request(const std::string &method,
                                          const std::string &path,
                                          const std::string &body,
                                          const std::string &contentType) {
  std::string url = baseUrl_;
  if (path.empty() || path.front() != '/')
    url += "/";
  url += path;

  HTTPResponse response;
  int retryCount = 0;
  while (true) {
    response = executeRequest(url, method, body, contentType);

    if (response.ok()) {
      break;
    }

    if (response.status_code == 429) {
      if (handleRateLimit(response.status_code, retryCount)) {
        continue;
      }
      break;
    }

    if ((response.status_code >= 500 || response.status_code == 0) &&
        retryCount < maxRetries_) {
      retryCount++;
      int backoffSeconds = retryCount;
      Logger::warning(LogCategory::SEARCH, "ElasticsearchClient",
                      method + " " + path + " failed with status " +
                          std::to_string(response.status_code) +
                          ", retrying in " + std::to_string(backoffSeconds) +
                          " seconds");
      std::this_thread::sleep_for(std::chrono::seconds(backoffSeconds));
      continue;
    }
    break;
  }

  if (!response.ok() && response.error_message.empty()) {
    std::string errorBody = response.body.length() > 200
                                ? response.body.substr(0, 200)
                                : response.body;
    response.error_message =
        "HTTP " + std::to_string(response.status_code) + ": " + errorBody;
  }

  return response;
}
