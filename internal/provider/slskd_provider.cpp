#include "slskd_provider.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/provider/slskd_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace trackmatch::provider {

namespace {

constexpr char kSearchesPath[] = "/api/v0/searches";

std::string SearchPath(const std::string& id) {
  return std::string(kSearchesPath) + "/" + id;
}

void CheckStatus(const HttpResponse& response, const char* op, const std::string& id) {
  if (response.status == 404) {
    throw util::NotFound(std::string("slskd ") + op + ": search not found: " + id);
  }
  if (response.status < 200 || response.status >= 300) {
    throw util::ProviderError(std::string("slskd ") + op + " returned HTTP " + std::to_string(response.status), response.status);
  }
}

} // namespace

SlskdProvider::SlskdProvider(std::shared_ptr<HttpClient> http) : http_(std::move(http)) {
  if (!http_) {
    throw std::invalid_argument("SlskdProvider: http client is required");
  }
}

std::string SlskdProvider::Submit(const std::string& query, std::chrono::milliseconds search_timeout) {
  const auto id       = util::GenerateUUIDString();
  auto       response = http_->Post(kSearchesPath, slskd::EncodeSearchRequest(id, query, search_timeout));
  CheckStatus(response, "submit", id);

  TRACKMATCH_LOG_DEBUG("slskd search submitted", {observability::StringField("session_id", id), observability::StringField("query", query)});
  return id;
}

SearchStatus SlskdProvider::Status(const std::string& session_id) {
  auto response = http_->Get(SearchPath(session_id) + "?includeResponses=false");
  CheckStatus(response, "status", session_id);
  return slskd::ToSearchStatus(slskd::DecodeSearchState(response.body));
}

void SlskdProvider::Stop(const std::string& session_id) {
  CheckStatus(http_->Put(SearchPath(session_id), ""), "stop", session_id);
}

void SlskdProvider::Delete(const std::string& session_id) {
  CheckStatus(http_->Delete(SearchPath(session_id)), "delete", session_id);
}

std::vector<trackmatch::core::v1::CandidateResult> SlskdProvider::Results(const std::string& session_id) {
  auto response = http_->Get(SearchPath(session_id) + "?includeResponses=true");
  CheckStatus(response, "results", session_id);
  return slskd::ToCandidates(slskd::DecodeSearchState(response.body));
}

std::vector<std::string> SlskdProvider::List() {
  auto response = http_->Get(kSearchesPath);
  CheckStatus(response, "list", "*");

  std::vector<std::string> ids;
  for (const auto& search : slskd::DecodeSearchList(response.body)) {
    ids.push_back(search.id());
  }
  return ids;
}

} // namespace trackmatch::provider
