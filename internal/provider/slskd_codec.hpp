#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/provider/search_provider.hpp"
#include "trackmatch/core/v1/types.pb.h"
#include "trackmatch/provider/v1/slskd.pb.h"

namespace trackmatch::provider::slskd {

/*
  JSON <-> protobuf mapping for the slskd search API.

  Unknown keys are ignored; slskd adds fields between releases.
*/

std::string EncodeSearchRequest(const std::string& id, const std::string& query, std::chrono::milliseconds search_timeout);

trackmatch::provider::v1::SlskdSearchState DecodeSearchState(const std::string& json);

// GET /searches returns a bare JSON array.
std::vector<trackmatch::provider::v1::SlskdSearchState> DecodeSearchList(const std::string& json);

SearchStatus ToSearchStatus(const trackmatch::provider::v1::SlskdSearchState& state);

// Flattens responses into one candidate per file, copying peer facts.
std::vector<trackmatch::core::v1::CandidateResult> ToCandidates(const trackmatch::provider::v1::SlskdSearchState& state);

} // namespace trackmatch::provider::slskd
