#include "search_orchestrator.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/model/search_tier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

namespace trackmatch::search {

using trackmatch::core::v1::SearchOutcome;
using trackmatch::core::v1::TrackReference;
using Clock = std::chrono::steady_clock;

namespace {

std::string_view OutcomeName(SearchOutcome outcome) {
  switch (outcome) {
    case trackmatch::core::v1::SEARCH_OUTCOME_MATCHED:
      return "matched";
    case trackmatch::core::v1::SEARCH_OUTCOME_EXHAUSTED:
      return "exhausted";
    case trackmatch::core::v1::SEARCH_OUTCOME_TIMED_OUT:
      return "timed_out";
    case trackmatch::core::v1::SEARCH_OUTCOME_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

} // namespace

struct SearchOrchestrator::RunContext {
  std::string                    requester;
  session::CancelFlag            cancel;
  TrackReference                 reference;
  std::vector<QueryPlan>         plans;
  size_t                         next_plan{0};
  Clock::time_point              started{};
  Clock::time_point              deadline{};
  std::unique_ptr<SearchSession> session;
  std::vector<FilteredCandidate> candidates;
  core::v1::SearchSummary        summary;
  std::promise<SearchRun>        promise;
  bool                           done{false};
};

SearchOrchestrator::SearchOrchestrator(std::shared_ptr<runtime::Scheduler>         scheduler,
                                       std::shared_ptr<runtime::WorkerPool>        provider_pool,
                                       std::shared_ptr<provider::SearchProvider>   provider,
                                       std::shared_ptr<session::RequesterRegistry> registry,
                                       ResultFilter                                filter,
                                       trackmatch::runtime::config::SearchConfig   config)
    : scheduler_(std::move(scheduler)),
      provider_pool_(std::move(provider_pool)),
      provider_(std::move(provider)),
      registry_(std::move(registry)),
      filter_(std::move(filter)),
      builder_(!config.disable_artist_catalog_tier()),
      overall_timeout_(util::ToMillis(config.overall_timeout())),
      poll_interval_(util::ToMillis(config.poll_interval())),
      stable_after_(util::ToMillis(config.stable_after())),
      min_tier_timeout_(util::ToMillis(config.min_tier_timeout())),
      purge_provider_sessions_(config.purge_provider_sessions()) {
  if (!scheduler_ || !provider_pool_ || !provider_ || !registry_) {
    throw std::invalid_argument("SearchOrchestrator: scheduler, provider pool, provider and registry are required");
  }
}

std::future<SearchRun> SearchOrchestrator::Start(const std::string&        requester,
                                                 session::CancelFlag       cancel,
                                                 const TrackReference&     reference,
                                                 std::chrono::milliseconds overall_timeout) {
  auto ctx       = std::make_shared<RunContext>();
  ctx->requester = requester;
  ctx->cancel    = std::move(cancel);
  ctx->reference = reference;
  ctx->plans     = builder_.Build(reference);
  ctx->started   = Clock::now();
  ctx->deadline  = ctx->started + overall_timeout;
  *ctx->summary.mutable_started_at() = util::ToProto(util::Now());

  auto future = ctx->promise.get_future();
  Dispatch(ctx, &SearchOrchestrator::Begin);
  return future;
}

SearchRun SearchOrchestrator::Run(const std::string&        requester,
                                  session::CancelFlag       cancel,
                                  const TrackReference&     reference,
                                  std::chrono::milliseconds overall_timeout) {
  return Start(requester, std::move(cancel), reference, overall_timeout).get();
}

void SearchOrchestrator::ClearStaleSessions(const std::string& requester) {
  for (const auto& id : registry_->ProviderSessions(requester)) {
    try {
      provider_->Delete(id);
      registry_->ForgetProviderSession(requester, id);
      TRACKMATCH_LOG_INFO("Cleared stale provider session", {observability::StringField("requester", requester), observability::StringField("session_id", id)});
    } catch (const util::NotFound&) {
      registry_->ForgetProviderSession(requester, id);
    } catch (const std::exception& e) {
      TRACKMATCH_LOG_WARN("Stale provider session not cleared",
                          {observability::StringField("requester", requester), observability::StringField("session_id", id),
                           observability::StringField("error", e.what())});
    }
  }
}

// ------------------------------------------------------------
// scheduling
// ------------------------------------------------------------

// A dropped task (pool or loop stopped) releases the context, which breaks
// the run's promise instead of leaving the caller waiting.
void SearchOrchestrator::Dispatch(const std::shared_ptr<RunContext>& ctx, Step step) {
  provider_pool_->Post([this, ctx, step] { Execute(ctx, step); });
}

void SearchOrchestrator::DispatchAt(const std::shared_ptr<RunContext>& ctx, runtime::Scheduler::TimePoint when, Step step) {
  scheduler_->ScheduleAt(when, [this, ctx, step] { Dispatch(ctx, step); });
}

void SearchOrchestrator::Execute(const std::shared_ptr<RunContext>& ctx, Step step) {
  if (ctx->done) return;

  try {
    (this->*step)(ctx);
  } catch (const std::exception& e) {
    TRACKMATCH_LOG_ERROR("Search run failed", {observability::StringField("requester", ctx->requester), observability::StringField("error", e.what())});
    Fail(*ctx, std::current_exception());
  }
}

// ------------------------------------------------------------
// steps
// ------------------------------------------------------------

void SearchOrchestrator::Begin(const std::shared_ptr<RunContext>& ctx) {
  ClearStaleSessions(ctx->requester);
  if (purge_provider_sessions_) {
    PurgeProvider();
  }
  NextTier(ctx);
}

void SearchOrchestrator::NextTier(const std::shared_ptr<RunContext>& ctx) {
  if (Cancelled(*ctx)) {
    Finish(*ctx, trackmatch::core::v1::SEARCH_OUTCOME_CANCELLED);
    return;
  }
  if (ctx->next_plan >= ctx->plans.size()) {
    Finish(*ctx, trackmatch::core::v1::SEARCH_OUTCOME_EXHAUSTED);
    return;
  }

  const auto now = Clock::now();
  if (now >= ctx->deadline) {
    Finish(*ctx, trackmatch::core::v1::SEARCH_OUTCOME_TIMED_OUT);
    return;
  }

  const auto budget = TierBudget(*ctx);
  const auto& plan  = ctx->plans[ctx->next_plan++];

  ctx->session             = std::make_unique<SearchSession>();
  ctx->session->requester  = ctx->requester;
  ctx->session->plan       = plan;
  ctx->session->started_at = now;
  ctx->session->deadline   = now + budget;

  ctx->summary.set_tier(plan.tier);
  ctx->summary.set_query(plan.query);

  auto& s = *ctx->session;
  try {
    s.provider_id = provider_->Submit(plan.query, budget);
  } catch (const std::exception& e) {
    TRACKMATCH_LOG_WARN("Search submit failed, escalating",
                        {observability::StringField("tier", model::ToString(plan.tier)), observability::StringField("query", plan.query),
                         observability::StringField("error", e.what())});
    Cleanup(*ctx);
    observability::Metrics::Instance().RecordTierOutcome(model::ToString(plan.tier), "provider_error");
    Dispatch(ctx, &SearchOrchestrator::NextTier);
    return;
  }

  registry_->RecordProviderSession(ctx->requester, s.provider_id);
  ctx->summary.set_sessions_opened(ctx->summary.sessions_opened() + 1);
  s.Transition(model::SessionState::kSubmitted);

  TRACKMATCH_LOG_INFO("Search submitted",
                      {observability::StringField("requester", ctx->requester), observability::StringField("session_id", s.provider_id),
                       observability::StringField("tier", model::ToString(plan.tier)), observability::StringField("query", plan.query),
                       observability::IntField("budget_ms", budget.count())});

  s.Transition(model::SessionState::kPolling);
  DispatchAt(ctx, std::min(now + poll_interval_, s.deadline), &SearchOrchestrator::Poll);
}

void SearchOrchestrator::Poll(const std::shared_ptr<RunContext>& ctx) {
  auto& s = *ctx->session;

  if (Cancelled(*ctx)) {
    TimeOut(*ctx);
    Cleanup(*ctx);
    Finish(*ctx, trackmatch::core::v1::SEARCH_OUTCOME_CANCELLED);
    return;
  }

  provider::SearchStatus status;
  try {
    status = provider_->Status(s.provider_id);
  } catch (const std::exception& e) {
    TRACKMATCH_LOG_WARN("Search status failed, abandoning tier",
                        {observability::StringField("session_id", s.provider_id), observability::StringField("error", e.what())});
    TimeOut(*ctx);
    Cleanup(*ctx);
    Conclude(ctx);
    return;
  }

  const auto now = Clock::now();
  if (status.file_count != s.last_file_count) {
    s.last_file_count = status.file_count;
    s.stable_tracking = true;
    s.stable_since    = now;
    TRACKMATCH_LOG_DEBUG("Search progress", {observability::StringField("session_id", s.provider_id), observability::IntField("files", status.file_count)});
  }
  const bool stable = s.stable_tracking && now - s.stable_since >= stable_after_;

  if (status.complete || stable) {
    TRACKMATCH_LOG_INFO("Search completed",
                        {observability::StringField("session_id", s.provider_id), observability::IntField("files", status.file_count),
                         observability::BoolField("stabilized", !status.complete)});
    s.Transition(model::SessionState::kCompleted);
    Harvest(ctx);
    return;
  }

  if (now >= s.deadline) {
    TimeOut(*ctx);
    Harvest(ctx);
    return;
  }

  DispatchAt(ctx, std::min(now + poll_interval_, s.deadline), &SearchOrchestrator::Poll);
}

void SearchOrchestrator::Harvest(const std::shared_ptr<RunContext>& ctx) {
  auto& s = *ctx->session;

  try {
    s.raw_results = provider_->Results(s.provider_id);
    s.Transition(model::SessionState::kCollected);
  } catch (const util::InvalidState&) {
    throw;
  } catch (const std::exception& e) {
    TRACKMATCH_LOG_WARN("Search harvest failed", {observability::StringField("session_id", s.provider_id), observability::StringField("error", e.what())});
    s.raw_results.clear();
  }

  Cleanup(*ctx);
  Conclude(ctx);
}

void SearchOrchestrator::Conclude(const std::shared_ptr<RunContext>& ctx) {
  const auto& s    = *ctx->session;
  const auto  tier = model::ToString(s.plan.tier);

  ctx->summary.set_raw_result_count(static_cast<uint32_t>(s.raw_results.size()));

  if (Cancelled(*ctx)) {
    Finish(*ctx, trackmatch::core::v1::SEARCH_OUTCOME_CANCELLED);
    return;
  }

  ctx->candidates = FilterHarvest(*ctx);
  observability::Metrics::Instance().RecordTierOutcome(tier, ctx->candidates.empty() ? "empty" : "matched");

  TRACKMATCH_LOG_INFO("Search tier finished",
                      {observability::StringField("requester", ctx->requester), observability::StringField("tier", tier),
                       observability::IntField("raw", static_cast<std::int64_t>(s.raw_results.size())),
                       observability::IntField("passing", static_cast<std::int64_t>(ctx->candidates.size()))});

  if (!ctx->candidates.empty()) {
    Finish(*ctx, trackmatch::core::v1::SEARCH_OUTCOME_MATCHED);
    return;
  }

  if (Clock::now() >= ctx->deadline) {
    Finish(*ctx, trackmatch::core::v1::SEARCH_OUTCOME_TIMED_OUT);
    return;
  }

  Dispatch(ctx, &SearchOrchestrator::NextTier);
}

// ------------------------------------------------------------
// helpers
// ------------------------------------------------------------

void SearchOrchestrator::TimeOut(RunContext& ctx) {
  auto& s = *ctx.session;
  s.Transition(model::SessionState::kTimedOut);

  try {
    provider_->Stop(s.provider_id);
    s.Transition(model::SessionState::kStopped);
  } catch (const util::InvalidState&) {
    throw;
  } catch (const std::exception& e) {
    TRACKMATCH_LOG_WARN("Search stop failed", {observability::StringField("session_id", s.provider_id), observability::StringField("error", e.what())});
  }
}

void SearchOrchestrator::Cleanup(RunContext& ctx) {
  auto& s = *ctx.session;
  if (s.Finished()) return;

  if (s.Opened()) {
    try {
      provider_->Delete(s.provider_id);
      registry_->ForgetProviderSession(ctx.requester, s.provider_id);
    } catch (const util::NotFound&) {
      registry_->ForgetProviderSession(ctx.requester, s.provider_id);
    } catch (const std::exception& e) {
      TRACKMATCH_LOG_WARN("Search delete failed, will retry before next submit",
                          {observability::StringField("requester", ctx.requester), observability::StringField("session_id", s.provider_id),
                           observability::StringField("error", e.what())});
    }
  }

  s.Transition(model::SessionState::kCleanedUp);

  const double elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - s.started_at).count();
  observability::Metrics::Instance().ObserveTierDuration(model::ToString(s.plan.tier), elapsed_ms);
}

void SearchOrchestrator::PurgeProvider() {
  std::vector<std::string> ids;
  try {
    ids = provider_->List();
  } catch (const std::exception& e) {
    TRACKMATCH_LOG_WARN("Provider session listing failed", {observability::StringField("error", e.what())});
    return;
  }

  if (!ids.empty()) {
    TRACKMATCH_LOG_DEBUG("Purging provider sessions", {observability::IntField("count", static_cast<std::int64_t>(ids.size()))});
  }
  for (const auto& id : ids) {
    try {
      provider_->Delete(id);
    } catch (const util::NotFound&) {
      // already gone
    } catch (const std::exception& e) {
      TRACKMATCH_LOG_WARN("Provider session purge failed", {observability::StringField("session_id", id), observability::StringField("error", e.what())});
    }
  }
}

bool SearchOrchestrator::Cancelled(const RunContext& ctx) const {
  return ctx.cancel && ctx.cancel->load();
}

void SearchOrchestrator::Finish(RunContext& ctx, SearchOutcome outcome) {
  if (ctx.done) return;
  ctx.done = true;

  ctx.summary.set_outcome(outcome);
  ctx.summary.set_elapsed_ms(std::chrono::duration<double, std::milli>(Clock::now() - ctx.started).count());

  TRACKMATCH_LOG_INFO("Search run finished",
                      {observability::StringField("requester", ctx.requester), observability::StringField("outcome", OutcomeName(outcome)),
                       observability::IntField("sessions", ctx.summary.sessions_opened()),
                       observability::IntField("candidates", static_cast<std::int64_t>(ctx.candidates.size()))});

  SearchRun run;
  if (outcome == trackmatch::core::v1::SEARCH_OUTCOME_MATCHED) {
    run.candidates = std::move(ctx.candidates);
  }
  run.summary = ctx.summary;
  ctx.promise.set_value(std::move(run));
}

void SearchOrchestrator::Fail(RunContext& ctx, std::exception_ptr error) {
  if (ctx.done) return;
  ctx.done = true;

  if (ctx.session && !ctx.session->Finished() && ctx.session->Opened()) {
    try {
      provider_->Delete(ctx.session->provider_id);
      registry_->ForgetProviderSession(ctx.requester, ctx.session->provider_id);
    } catch (const std::exception& e) {
      TRACKMATCH_LOG_WARN("Search delete failed after error",
                          {observability::StringField("session_id", ctx.session->provider_id), observability::StringField("error", e.what())});
    }
  }
  ctx.promise.set_exception(std::move(error));
}

std::chrono::milliseconds SearchOrchestrator::TierBudget(const RunContext& ctx) const {
  const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(ctx.deadline - Clock::now());
  const auto queries   = static_cast<std::int64_t>(ctx.plans.size() - ctx.next_plan);
  const auto share     = std::chrono::milliseconds(remaining.count() / std::max<std::int64_t>(1, queries));
  return std::min(std::max(share, min_tier_timeout_), remaining);
}

std::vector<FilteredCandidate> SearchOrchestrator::FilterHarvest(const RunContext& ctx) const {
  const auto& s = *ctx.session;
  if (!s.plan.required_keywords.empty()) {
    return filter_.FilterNarrowed(s.raw_results, ctx.reference, s.plan.required_keywords);
  }
  return filter_.Filter(s.raw_results, ctx.reference);
}

} // namespace trackmatch::search
