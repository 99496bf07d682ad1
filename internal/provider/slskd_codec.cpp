#include "slskd_codec.hpp"

#include <algorithm>

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace trackmatch::provider::slskd {

using trackmatch::core::v1::CandidateResult;
using trackmatch::provider::v1::SlskdSearchList;
using trackmatch::provider::v1::SlskdSearchRequest;
using trackmatch::provider::v1::SlskdSearchState;

namespace {

template <typename Message>
Message ParseJson(const std::string& json, const char* what) {
  Message message;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw util::ProviderError(std::string("slskd: malformed ") + what + ": " + std::string(status.message()));
  }
  return message;
}

} // namespace

std::string EncodeSearchRequest(const std::string& id, const std::string& query, std::chrono::milliseconds search_timeout) {
  SlskdSearchRequest request;
  request.set_id(id);
  request.set_search_text(query);
  request.set_search_timeout(static_cast<int32_t>(search_timeout.count()));

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(request, &json);
  if (!status.ok()) {
    throw util::ProviderError("slskd: failed to encode search request: " + std::string(status.message()));
  }
  return json;
}

SlskdSearchState DecodeSearchState(const std::string& json) {
  return ParseJson<SlskdSearchState>(json, "search state");
}

std::vector<SlskdSearchState> DecodeSearchList(const std::string& json) {
  auto list = ParseJson<SlskdSearchList>("{\"searches\":" + json + "}", "search list");
  return {list.searches().begin(), list.searches().end()};
}

SearchStatus ToSearchStatus(const SlskdSearchState& state) {
  SearchStatus status;
  status.state          = state.state();
  status.complete       = state.is_complete() || util::ContainsIgnoreCase(state.state(), "completed");
  status.file_count     = static_cast<uint32_t>(std::max(0, state.file_count()));
  status.response_count = static_cast<uint32_t>(std::max(0, state.response_count()));
  return status;
}

std::vector<CandidateResult> ToCandidates(const SlskdSearchState& state) {
  std::vector<CandidateResult> candidates;

  for (const auto& response : state.responses()) {
    for (const auto& file : response.files()) {
      CandidateResult candidate;
      candidate.set_username(response.username());
      candidate.set_filename(file.filename());
      candidate.set_size_bytes(static_cast<uint64_t>(std::max<int64_t>(0, file.size())));
      candidate.set_has_free_slot(response.has_free_upload_slot());
      candidate.set_upload_speed(static_cast<uint64_t>(std::max<int64_t>(0, response.upload_speed())));
      candidate.set_queue_length(static_cast<uint32_t>(std::max(0, response.queue_length())));
      candidate.set_extension(util::Extension(file.filename()));

      if (file.has_bit_depth() && file.bit_depth() > 0) candidate.set_bit_depth(static_cast<uint32_t>(file.bit_depth()));
      if (file.has_sample_rate() && file.sample_rate() > 0) candidate.set_sample_rate(static_cast<uint32_t>(file.sample_rate()));
      if (file.has_bit_rate() && file.bit_rate() > 0) candidate.set_bit_rate(static_cast<uint32_t>(file.bit_rate()));
      if (file.has_length() && file.length() > 0) candidate.set_length_secs(file.length());

      candidates.push_back(std::move(candidate));
    }
  }
  return candidates;
}

} // namespace trackmatch::provider::slskd
