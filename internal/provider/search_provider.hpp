#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "trackmatch/core/v1/types.pb.h"

namespace trackmatch::provider {

struct SearchStatus {
  std::string state;
  bool        complete{false};
  uint32_t    file_count{0};
  uint32_t    response_count{0};
};

/*
  Keyword file-search backend.

  Failures surface as util::ProviderError; Delete of an unknown session
  raises util::NotFound.
*/
class SearchProvider {
 public:
  virtual ~SearchProvider() = default;

  // Opens a search and returns its session id. `search_timeout` is passed
  // on so the backend stops by itself at roughly the same time.
  virtual std::string Submit(const std::string& query, std::chrono::milliseconds search_timeout) = 0;

  virtual SearchStatus Status(const std::string& session_id) = 0;

  virtual void Stop(const std::string& session_id) = 0;

  virtual void Delete(const std::string& session_id) = 0;

  virtual std::vector<trackmatch::core::v1::CandidateResult> Results(const std::string& session_id) = 0;

  virtual std::vector<std::string> List() = 0;
};

} // namespace trackmatch::provider
