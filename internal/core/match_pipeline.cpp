#include "match_pipeline.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace trackmatch::core {

using trackmatch::core::v1::AuthenticityVerdict;
using trackmatch::core::v1::TrackReference;

namespace {

AuthenticityVerdict Record(AuthenticityVerdict verdict) {
  observability::Metrics::Instance().RecordVerdict(analysis::ToString(verdict.verdict()));
  return verdict;
}

} // namespace

MatchPipeline::MatchPipeline(std::shared_ptr<search::SearchOrchestrator>     orchestrator,
                             search::Scorer                                  scorer,
                             std::shared_ptr<analysis::AuthenticityAnalyzer> analyzer,
                             std::shared_ptr<runtime::WorkerPool>            pool,
                             uint32_t                                        max_results)
    : orchestrator_(std::move(orchestrator)),
      scorer_(std::move(scorer)),
      analyzer_(std::move(analyzer)),
      pool_(std::move(pool)),
      max_results_(max_results) {
  if (!orchestrator_ || !analyzer_ || !pool_) {
    throw std::invalid_argument("MatchPipeline: orchestrator, analyzer and pool are required");
  }
}

std::future<search::SearchRun> MatchPipeline::StartSearch(const std::string& requester, session::CancelFlag cancel, const TrackReference& reference) {
  return orchestrator_->Start(requester, std::move(cancel), reference, orchestrator_->OverallTimeout());
}

MatchResult MatchPipeline::Rank(search::SearchRun run, const TrackReference& reference) const {
  MatchResult result;
  result.summary    = std::move(run.summary);
  result.candidates = scorer_.Rank(run.candidates, reference);

  if (max_results_ > 0 && result.candidates.size() > max_results_) {
    result.candidates.resize(max_results_);
  }

  if (!result.candidates.empty()) {
    const auto& best = result.candidates.front();
    TRACKMATCH_LOG_INFO("Best candidate",
                        {observability::StringField("username", best.candidate().username()),
                         observability::StringField("filename", best.candidate().filename()),
                         observability::DoubleField("score", best.score().total())});
  }
  return result;
}

MatchResult MatchPipeline::FindCandidates(const std::string& requester, session::CancelFlag cancel, const TrackReference& reference) {
  return Rank(StartSearch(requester, std::move(cancel), reference).get(), reference);
}

std::future<AuthenticityVerdict> MatchPipeline::StartVerify(std::string path) {
  auto analyzer = analyzer_;
  return pool_->Submit([analyzer, path = std::move(path)] { return Record(analyzer->AnalyzeFile(path)); });
}

std::future<AuthenticityVerdict> MatchPipeline::StartVerify(std::vector<float> samples, uint32_t sample_rate, uint32_t bit_depth) {
  auto analyzer = analyzer_;
  return pool_->Submit([analyzer, samples = std::move(samples), sample_rate, bit_depth] {
    return Record(analyzer->Analyze(samples, sample_rate, bit_depth));
  });
}

AuthenticityVerdict MatchPipeline::Verify(const std::string& path) {
  return StartVerify(path).get();
}

} // namespace trackmatch::core
