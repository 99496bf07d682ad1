#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "trackmatch/core/v1/types.pb.h"

namespace trackmatch::search {

// A candidate that survived filtering, with the facts the scorer needs.
struct FilteredCandidate {
  trackmatch::core::v1::CandidateResult candidate;
  trackmatch::core::v1::DurationMatch   duration_match{trackmatch::core::v1::DURATION_MATCH_UNKNOWN};
  bool                                  fallback_format{false};
};

/*
  ResultFilter

  Pure gates applied to raw provider results:

    extension  preferred lossless format first; when nothing in that
               format survives, the first fallback format (in priority
               order) with survivors is used instead
    keyword    basename contains an exclude keyword the reference title
               does not contain
    duration   |candidate - reference| beyond the exclusion bound

  Candidates without a declared length pass with DURATION_MATCH_UNKNOWN.

  FilterNarrowed is the artist-catalog variant: within each format, files
  whose path names one of the keywords are tried before the whole set, and
  only then does the next format get a turn.
*/
class ResultFilter {
 public:
  explicit ResultFilter(trackmatch::runtime::config::FilterConfig config);

  std::vector<FilteredCandidate> Filter(const std::vector<trackmatch::core::v1::CandidateResult>& candidates,
                                        const trackmatch::core::v1::TrackReference&               reference) const;

  std::vector<FilteredCandidate> FilterNarrowed(const std::vector<trackmatch::core::v1::CandidateResult>& candidates,
                                                const trackmatch::core::v1::TrackReference&               reference,
                                                const std::vector<std::string>&                           keywords) const;

  bool IsExcludedByKeyword(const trackmatch::core::v1::CandidateResult& candidate,
                           const trackmatch::core::v1::TrackReference&  reference) const;

  // nullopt when the candidate is outside the exclusion bound.
  std::optional<trackmatch::core::v1::DurationMatch> ClassifyDuration(const trackmatch::core::v1::CandidateResult& candidate,
                                                                      const trackmatch::core::v1::TrackReference&  reference) const;

  const trackmatch::runtime::config::FilterConfig& Config() const {
    return config_;
  }

 private:
  std::vector<FilteredCandidate> PassGates(const std::vector<trackmatch::core::v1::CandidateResult>& candidates,
                                           const trackmatch::core::v1::TrackReference&               reference,
                                           const std::string&                                        extension,
                                           bool                                                      fallback) const;

  // Preferred extension first, then fallbacks in priority order.
  std::vector<std::string> FormatOrder() const;

  trackmatch::runtime::config::FilterConfig config_;
  std::vector<std::string>                  exclude_keywords_;
};

// Declared extension, or the one parsed from the filename when the provider
// left it blank. Lowercase, no dot.
std::string CandidateExtension(const trackmatch::core::v1::CandidateResult& candidate);

} // namespace trackmatch::search
