#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "internal/analysis/authenticity_analyzer.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/search/scorer.hpp"
#include "internal/search/search_orchestrator.hpp"
#include "internal/session/requester_registry.hpp"
#include "trackmatch/core/v1/types.pb.h"

namespace trackmatch::core {

struct MatchResult {
  std::vector<trackmatch::core::v1::ScoredCandidate> candidates;
  trackmatch::core::v1::SearchSummary                summary;
};

/*
  MatchPipeline

  Sequences the core stages and holds no per-request state:

    FindCandidates  orchestrated search -> filter -> score/rank -> top N
    Verify          decode + spectral analysis on the worker pool

  The Start* variants return futures so callers can wait with their own
  cancellation checks.
*/
class MatchPipeline {
 public:
  MatchPipeline(std::shared_ptr<search::SearchOrchestrator>     orchestrator,
                search::Scorer                                  scorer,
                std::shared_ptr<analysis::AuthenticityAnalyzer> analyzer,
                std::shared_ptr<runtime::WorkerPool>            pool,
                uint32_t                                        max_results);

  std::future<search::SearchRun> StartSearch(const std::string&                          requester,
                                             session::CancelFlag                         cancel,
                                             const trackmatch::core::v1::TrackReference& reference);

  MatchResult Rank(search::SearchRun run, const trackmatch::core::v1::TrackReference& reference) const;

  MatchResult FindCandidates(const std::string&                          requester,
                             session::CancelFlag                         cancel,
                             const trackmatch::core::v1::TrackReference& reference);

  std::future<trackmatch::core::v1::AuthenticityVerdict> StartVerify(std::string path);
  std::future<trackmatch::core::v1::AuthenticityVerdict> StartVerify(std::vector<float> samples, uint32_t sample_rate, uint32_t bit_depth);

  trackmatch::core::v1::AuthenticityVerdict Verify(const std::string& path);

 private:
  std::shared_ptr<search::SearchOrchestrator>     orchestrator_;
  search::Scorer                                  scorer_;
  std::shared_ptr<analysis::AuthenticityAnalyzer> analyzer_;
  std::shared_ptr<runtime::WorkerPool>            pool_;
  uint32_t                                        max_results_;
};

} // namespace trackmatch::core
