#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/provider/search_provider.hpp"
#include "internal/runtime/scheduler.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/search/query_builder.hpp"
#include "internal/search/result_filter.hpp"
#include "internal/search/search_session.hpp"
#include "internal/session/requester_registry.hpp"
#include "trackmatch/core/v1/types.pb.h"

namespace trackmatch::search {

struct SearchRun {
  std::vector<FilteredCandidate>      candidates;
  trackmatch::core::v1::SearchSummary summary;
};

/*
  SearchOrchestrator

  Drives tiered provider searches for one reference track:

    - clears provider sessions a previous run of the requester left behind
    - submits tier queries in order until one yields filtered candidates
    - polls each session on the scheduler until complete, stable, or its
      share of the overall deadline runs out
    - stops a timed-out session before harvesting partial results
    - deletes every session it opened, whatever happened before

  Steps make blocking provider calls, so they run on the provider pool.
  Waiting between polls is a scheduler timer whose task only hands the
  next step back to the pool; a slow provider call for one requester
  never delays another requester's timers. A run has at most one step
  queued or running at a time. The caller blocks on the returned future
  (or Run), never on the loop.
*/
class SearchOrchestrator {
 public:
  SearchOrchestrator(std::shared_ptr<runtime::Scheduler>          scheduler,
                     std::shared_ptr<runtime::WorkerPool>         provider_pool,
                     std::shared_ptr<provider::SearchProvider>    provider,
                     std::shared_ptr<session::RequesterRegistry>  registry,
                     ResultFilter                                 filter,
                     trackmatch::runtime::config::SearchConfig    config);

  std::future<SearchRun> Start(const std::string&                          requester,
                               session::CancelFlag                         cancel,
                               const trackmatch::core::v1::TrackReference& reference,
                               std::chrono::milliseconds                   overall_timeout);

  SearchRun Run(const std::string&                          requester,
                session::CancelFlag                         cancel,
                const trackmatch::core::v1::TrackReference& reference,
                std::chrono::milliseconds                   overall_timeout);

  std::chrono::milliseconds OverallTimeout() const {
    return overall_timeout_;
  }

  // Deletes provider sessions recorded for `requester`. Failures stay
  // recorded for the next attempt.
  void ClearStaleSessions(const std::string& requester);

 private:
  struct RunContext;
  using Step = void (SearchOrchestrator::*)(const std::shared_ptr<RunContext>&);

  void Dispatch(const std::shared_ptr<RunContext>& ctx, Step step);
  void DispatchAt(const std::shared_ptr<RunContext>& ctx, runtime::Scheduler::TimePoint when, Step step);
  void Execute(const std::shared_ptr<RunContext>& ctx, Step step);

  void Begin(const std::shared_ptr<RunContext>& ctx);
  void NextTier(const std::shared_ptr<RunContext>& ctx);
  void Poll(const std::shared_ptr<RunContext>& ctx);
  void Harvest(const std::shared_ptr<RunContext>& ctx);
  void Conclude(const std::shared_ptr<RunContext>& ctx);

  void TimeOut(RunContext& ctx);
  void Cleanup(RunContext& ctx);
  void PurgeProvider();
  bool Cancelled(const RunContext& ctx) const;
  void Finish(RunContext& ctx, trackmatch::core::v1::SearchOutcome outcome);
  void Fail(RunContext& ctx, std::exception_ptr error);

  std::chrono::milliseconds TierBudget(const RunContext& ctx) const;
  std::vector<FilteredCandidate> FilterHarvest(const RunContext& ctx) const;

  std::shared_ptr<runtime::Scheduler>         scheduler_;
  std::shared_ptr<runtime::WorkerPool>        provider_pool_;
  std::shared_ptr<provider::SearchProvider>   provider_;
  std::shared_ptr<session::RequesterRegistry> registry_;
  ResultFilter                                filter_;
  QueryBuilder                                builder_;

  std::chrono::milliseconds overall_timeout_;
  std::chrono::milliseconds poll_interval_;
  std::chrono::milliseconds stable_after_;
  std::chrono::milliseconds min_tier_timeout_;
  bool                      purge_provider_sessions_;
};

} // namespace trackmatch::search
