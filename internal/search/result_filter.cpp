#include "result_filter.hpp"

#include <cmath>

#include "internal/util/text.hpp"

namespace trackmatch::search {

using namespace trackmatch::core::v1;

std::string CandidateExtension(const CandidateResult& candidate) {
  if (!candidate.extension().empty()) {
    auto ext = util::ToLower(candidate.extension());
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    return ext;
  }
  return util::Extension(candidate.filename());
}

ResultFilter::ResultFilter(trackmatch::runtime::config::FilterConfig config) : config_(std::move(config)) {
  for (const auto& keyword : config_.exclude_keywords()) {
    exclude_keywords_.push_back(util::ToLower(keyword));
  }
}

bool ResultFilter::IsExcludedByKeyword(const CandidateResult& candidate, const TrackReference& reference) const {
  const auto basename = util::ToLower(util::Basename(candidate.filename()));
  const auto title    = util::ToLower(reference.title());

  for (const auto& keyword : exclude_keywords_) {
    if (basename.find(keyword) != std::string::npos && title.find(keyword) == std::string::npos) {
      return true;
    }
  }
  return false;
}

std::optional<DurationMatch> ResultFilter::ClassifyDuration(const CandidateResult& candidate, const TrackReference& reference) const {
  if (!candidate.has_length_secs() || candidate.length_secs() <= 0 || reference.duration_secs() <= 0) {
    return DURATION_MATCH_UNKNOWN;
  }

  const double delta = std::fabs(candidate.length_secs() - reference.duration_secs());
  if (delta > config_.exclusion_bound_secs()) {
    return std::nullopt;
  }
  if (delta <= config_.tight_tolerance_secs()) {
    return DURATION_MATCH_PERFECT;
  }
  if (delta <= config_.acceptable_tolerance_secs()) {
    return DURATION_MATCH_ACCEPTABLE;
  }
  return DURATION_MATCH_MARGINAL;
}

std::vector<FilteredCandidate> ResultFilter::PassGates(const std::vector<CandidateResult>& candidates,
                                                       const TrackReference&               reference,
                                                       const std::string&                  extension,
                                                       bool                                fallback) const {
  std::vector<FilteredCandidate> passing;
  for (const auto& candidate : candidates) {
    if (CandidateExtension(candidate) != extension) continue;
    if (IsExcludedByKeyword(candidate, reference)) continue;

    auto match = ClassifyDuration(candidate, reference);
    if (!match) continue;

    passing.push_back({candidate, *match, fallback});
  }
  return passing;
}

std::vector<std::string> ResultFilter::FormatOrder() const {
  std::vector<std::string> order{util::ToLower(config_.preferred_extension())};
  for (const auto& extension : config_.fallback_extensions()) {
    order.push_back(util::ToLower(extension));
  }
  return order;
}

std::vector<FilteredCandidate> ResultFilter::Filter(const std::vector<CandidateResult>& candidates, const TrackReference& reference) const {
  const auto order = FormatOrder();
  for (size_t i = 0; i < order.size(); ++i) {
    auto passing = PassGates(candidates, reference, order[i], i > 0);
    if (!passing.empty()) {
      return passing;
    }
  }
  return {};
}

std::vector<FilteredCandidate> ResultFilter::FilterNarrowed(const std::vector<CandidateResult>& candidates,
                                                            const TrackReference&               reference,
                                                            const std::vector<std::string>&     keywords) const {
  std::vector<CandidateResult> narrowed;
  for (const auto& candidate : candidates) {
    const auto path = util::ToLower(candidate.filename());
    for (const auto& keyword : keywords) {
      if (path.find(util::ToLower(keyword)) != std::string::npos) {
        narrowed.push_back(candidate);
        break;
      }
    }
  }

  const auto order = FormatOrder();
  for (size_t i = 0; i < order.size(); ++i) {
    if (!narrowed.empty()) {
      auto passing = PassGates(narrowed, reference, order[i], i > 0);
      if (!passing.empty()) return passing;
    }
    auto passing = PassGates(candidates, reference, order[i], i > 0);
    if (!passing.empty()) return passing;
  }
  return {};
}

} // namespace trackmatch::search
