#pragma once

#include <vector>

#include "config/config.pb.h"
#include "internal/search/result_filter.hpp"
#include "trackmatch/core/v1/types.pb.h"

namespace trackmatch::search {

/*
  Scorer

  Deterministic 0-100 rank made of four additive parts:

    duration     40   closeness to the reference length
    quality      25   declared bit depth / sample rate, CD quality first
    reliability  20   free slot 8, upload speed 7, short queue 5
    filename     15   share of artist/title words found in the path
*/
class Scorer {
 public:
  static constexpr double kMaxDuration    = 40.0;
  static constexpr double kMaxQuality     = 25.0;
  static constexpr double kMaxReliability = 20.0;
  static constexpr double kMaxFilename    = 15.0;

  Scorer(trackmatch::runtime::config::ScoringConfig scoring, trackmatch::runtime::config::FilterConfig filter);

  trackmatch::core::v1::ScoredCandidate Score(const FilteredCandidate& candidate, const trackmatch::core::v1::TrackReference& reference) const;

  // Scores, sorts, drops duplicate basenames (best copy wins) and assigns
  // 1-based ranks.
  std::vector<trackmatch::core::v1::ScoredCandidate> Rank(const std::vector<FilteredCandidate>&       candidates,
                                                          const trackmatch::core::v1::TrackReference& reference) const;

  double DurationScore(const trackmatch::core::v1::CandidateResult& candidate, const trackmatch::core::v1::TrackReference& reference) const;
  double QualityScore(const trackmatch::core::v1::CandidateResult& candidate) const;
  double ReliabilityScore(const trackmatch::core::v1::CandidateResult& candidate) const;
  double FilenameScore(const trackmatch::core::v1::CandidateResult& candidate, const trackmatch::core::v1::TrackReference& reference) const;

  // Strict weak ordering used by Rank: true when a ranks before b.
  bool RanksBefore(const trackmatch::core::v1::ScoredCandidate& a, const trackmatch::core::v1::ScoredCandidate& b) const;

 private:
  trackmatch::runtime::config::ScoringConfig scoring_;
  trackmatch::runtime::config::FilterConfig  filter_;
};

} // namespace trackmatch::search
