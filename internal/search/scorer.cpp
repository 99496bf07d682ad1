#include "scorer.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "internal/search/query_builder.hpp"
#include "internal/util/text.hpp"

namespace trackmatch::search {

using namespace trackmatch::core::v1;
using trackmatch::runtime::config::TIE_BREAK_FILENAME_THEN_RELIABILITY;

namespace {

constexpr double kUnknownDuration   = 15.0;
constexpr double kToleranceEdge     = 30.0;
constexpr double kAcceptableFloor   = 25.0;
constexpr double kNearBound         = 0.5;
constexpr double kFreeSlotPoints    = 8.0;
constexpr double kSpeedPoints       = 7.0;
constexpr double kQueuePoints       = 5.0;

double Round2(double value) {
  return std::round(value * 100.0) / 100.0;
}

double Lerp(double from, double to, double t) {
  return from + (to - from) * std::clamp(t, 0.0, 1.0);
}

} // namespace

Scorer::Scorer(trackmatch::runtime::config::ScoringConfig scoring, trackmatch::runtime::config::FilterConfig filter)
    : scoring_(std::move(scoring)), filter_(std::move(filter)) {
}

double Scorer::DurationScore(const CandidateResult& candidate, const TrackReference& reference) const {
  if (!candidate.has_length_secs() || candidate.length_secs() <= 0 || reference.duration_secs() <= 0) {
    return kUnknownDuration;
  }

  const double delta      = std::fabs(candidate.length_secs() - reference.duration_secs());
  const double tight      = filter_.tight_tolerance_secs();
  const double acceptable = filter_.acceptable_tolerance_secs();
  const double bound      = filter_.exclusion_bound_secs();

  if (delta <= tight) {
    return Lerp(kMaxDuration, kToleranceEdge, delta / tight);
  }
  if (delta <= acceptable) {
    return Lerp(kToleranceEdge, kAcceptableFloor, (delta - tight) / (acceptable - tight));
  }
  if (delta <= bound && bound > acceptable) {
    return Lerp(kAcceptableFloor, kNearBound, (delta - acceptable) / (bound - acceptable));
  }
  return 0.0;
}

double Scorer::QualityScore(const CandidateResult& candidate) const {
  double score = 0.0;

  switch (candidate.bit_depth()) {
    case 0:
      score += 1.0;
      break;
    case 16:
      score += 15.0;
      break;
    case 24:
      score += 12.0;
      break;
    default:
      score += 5.0;
      break;
  }

  switch (candidate.sample_rate()) {
    case 0:
      score += 1.0;
      break;
    case 44100:
      score += 10.0;
      break;
    case 48000:
    case 88200:
    case 96000:
      score += 7.0;
      break;
    default:
      score += 3.0;
      break;
  }

  return score;
}

double Scorer::ReliabilityScore(const CandidateResult& candidate) const {
  double score = candidate.has_free_slot() ? kFreeSlotPoints : 0.0;

  const double saturation = scoring_.speed_saturation_bytes_per_sec();
  if (candidate.upload_speed() > 0 && saturation > 0) {
    score += kSpeedPoints * std::min(1.0, static_cast<double>(candidate.upload_speed()) / saturation);
  }

  score += kQueuePoints / (1.0 + static_cast<double>(candidate.queue_length()) / 4.0);
  return score;
}

double Scorer::FilenameScore(const CandidateResult& candidate, const TrackReference& reference) const {
  std::unordered_set<std::string> tokens;
  for (auto& token : util::Tokenize(reference.artist())) tokens.insert(std::move(token));
  for (auto& token : util::Tokenize(QueryBuilder::CleanTitle(reference.title()))) tokens.insert(std::move(token));
  if (tokens.empty()) {
    return 0.0;
  }

  const auto filename = util::ToLower(candidate.filename());
  size_t     found    = 0;
  for (const auto& token : tokens) {
    if (filename.find(token) != std::string::npos) ++found;
  }
  return kMaxFilename * static_cast<double>(found) / static_cast<double>(tokens.size());
}

ScoredCandidate Scorer::Score(const FilteredCandidate& filtered, const TrackReference& reference) const {
  const auto& candidate = filtered.candidate;

  ScoredCandidate scored;
  *scored.mutable_candidate() = candidate;
  scored.set_duration_match(filtered.duration_match);
  scored.set_fallback_format(filtered.fallback_format);

  auto* score = scored.mutable_score();
  score->set_duration_score(Round2(DurationScore(candidate, reference)));
  score->set_quality_score(Round2(QualityScore(candidate)));
  score->set_reliability_score(Round2(ReliabilityScore(candidate)));
  score->set_filename_score(Round2(FilenameScore(candidate, reference)));

  const double total = score->duration_score() + score->quality_score() + score->reliability_score() + score->filename_score();
  score->set_total(Round2(std::min(100.0, total)));
  return scored;
}

bool Scorer::RanksBefore(const ScoredCandidate& a, const ScoredCandidate& b) const {
  if (a.score().total() != b.score().total()) {
    return a.score().total() > b.score().total();
  }

  const auto reliability_cmp = [&]() -> int {
    if (a.score().reliability_score() == b.score().reliability_score()) return 0;
    return a.score().reliability_score() > b.score().reliability_score() ? -1 : 1;
  };
  const auto filename_cmp = [&]() -> int {
    const auto la = a.candidate().filename().size();
    const auto lb = b.candidate().filename().size();
    if (la == lb) return 0;
    return la < lb ? -1 : 1;
  };

  int first  = reliability_cmp();
  int second = filename_cmp();
  if (scoring_.tie_break() == TIE_BREAK_FILENAME_THEN_RELIABILITY) {
    std::swap(first, second);
  }
  if (first != 0) return first < 0;
  if (second != 0) return second < 0;

  if (a.candidate().filename() != b.candidate().filename()) {
    return a.candidate().filename() < b.candidate().filename();
  }
  return a.candidate().username() < b.candidate().username();
}

std::vector<ScoredCandidate> Scorer::Rank(const std::vector<FilteredCandidate>& candidates, const TrackReference& reference) const {
  std::vector<ScoredCandidate> scored;
  scored.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    scored.push_back(Score(candidate, reference));
  }

  std::sort(scored.begin(), scored.end(), [this](const ScoredCandidate& a, const ScoredCandidate& b) { return RanksBefore(a, b); });

  std::unordered_set<std::string> seen;
  std::vector<ScoredCandidate>    ranked;
  for (auto& candidate : scored) {
    if (!seen.insert(util::ToLower(util::Basename(candidate.candidate().filename()))).second) continue;
    candidate.set_rank(static_cast<uint32_t>(ranked.size() + 1));
    ranked.push_back(std::move(candidate));
  }
  return ranked;
}

} // namespace trackmatch::search
