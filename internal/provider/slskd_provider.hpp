#pragma once

#include <memory>

#include "internal/provider/http_client.hpp"
#include "internal/provider/search_provider.hpp"

namespace trackmatch::provider {

/*
  SearchProvider backed by the slskd REST API (/api/v0/searches).
*/
class SlskdProvider : public SearchProvider {
 public:
  explicit SlskdProvider(std::shared_ptr<HttpClient> http);

  std::string Submit(const std::string& query, std::chrono::milliseconds search_timeout) override;

  SearchStatus Status(const std::string& session_id) override;

  void Stop(const std::string& session_id) override;

  void Delete(const std::string& session_id) override;

  std::vector<trackmatch::core::v1::CandidateResult> Results(const std::string& session_id) override;

  std::vector<std::string> List() override;

 private:
  std::shared_ptr<HttpClient> http_;
};

} // namespace trackmatch::provider
