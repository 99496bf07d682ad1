#pragma once

#include <chrono>
#include <string>

namespace trackmatch::provider {

struct HttpResponse {
  long        status{0};
  std::string body;
};

struct HttpClientOptions {
  std::string               base_url;
  std::string               api_key;
  std::chrono::milliseconds request_timeout{10000};
  std::chrono::milliseconds connect_timeout{3000};
};

/*
  Blocking JSON-over-HTTP client on libcurl.

  One easy handle per request, so a single instance may be shared between
  threads. Transport failures throw util::ProviderError; non-2xx replies
  are returned to the caller untouched.
*/
class HttpClient {
 public:
  explicit HttpClient(HttpClientOptions options);

  HttpResponse Get(const std::string& path);
  HttpResponse Post(const std::string& path, const std::string& json);
  HttpResponse Put(const std::string& path, const std::string& json);
  HttpResponse Delete(const std::string& path);

  const HttpClientOptions& Options() const {
    return options_;
  }

 private:
  HttpResponse Perform(const char* method, const std::string& path, const std::string* body);

  HttpClientOptions options_;
};

} // namespace trackmatch::provider
