#include "http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

#include "internal/util/errors.hpp"

namespace trackmatch::provider {

namespace {

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw util::ProviderError("curl_global_init failed");
    }
  });
}

size_t WriteBody(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(data, size * nmemb);
  return size * nmemb;
}

struct EasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

std::string JoinUrl(const std::string& base, const std::string& path) {
  if (!base.empty() && base.back() == '/' && !path.empty() && path.front() == '/') {
    return base + path.substr(1);
  }
  return base + path;
}

} // namespace

HttpClient::HttpClient(HttpClientOptions options) : options_(std::move(options)) {
  EnsureCurlInitialized();
}

HttpResponse HttpClient::Get(const std::string& path) {
  return Perform("GET", path, nullptr);
}

HttpResponse HttpClient::Post(const std::string& path, const std::string& json) {
  return Perform("POST", path, &json);
}

HttpResponse HttpClient::Put(const std::string& path, const std::string& json) {
  return Perform("PUT", path, &json);
}

HttpResponse HttpClient::Delete(const std::string& path) {
  return Perform("DELETE", path, nullptr);
}

HttpResponse HttpClient::Perform(const char* method, const std::string& path, const std::string* body) {
  EasyHandle curl(curl_easy_init());
  if (!curl) {
    throw util::ProviderError("curl_easy_init failed");
  }

  const auto url = JoinUrl(options_.base_url, path);

  HttpResponse response;

  curl_slist* raw_headers = nullptr;
  raw_headers             = curl_slist_append(raw_headers, "Accept: application/json");
  if (body) {
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
  }
  if (!options_.api_key.empty()) {
    raw_headers = curl_slist_append(raw_headers, ("X-API-Key: " + options_.api_key).c_str());
  }
  HeaderList headers(raw_headers);

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.request_timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));

  if (body) {
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    throw util::ProviderError(std::string(method) + " " + url + ": " + curl_easy_strerror(rc));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

} // namespace trackmatch::provider
