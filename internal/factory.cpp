#include "factory.hpp"

#include <memory>

#include "internal/analysis/authenticity_analyzer.hpp"
#include "internal/core/match_pipeline.hpp"
#include "internal/grpc/match_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/provider/http_client.hpp"
#include "internal/provider/slskd_provider.hpp"
#include "internal/runtime/scheduler.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/search/result_filter.hpp"
#include "internal/search/scorer.hpp"
#include "internal/search/search_orchestrator.hpp"
#include "internal/service/match_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/session/requester_registry.hpp"
#include "internal/util/time.hpp"

namespace trackmatch::factory {

using namespace trackmatch;

void Application::CancelAll() {
  if (match_service) {
    match_service->Shutdown();
  }
}

void Application::Stop() {
  if (scheduler) {
    scheduler->Stop();
  }
  if (provider_pool) {
    provider_pool->Stop();
  }
  if (analysis_pool) {
    analysis_pool->Stop();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const trackmatch::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Search provider
  // ------------------------------------------------------------------
  provider::HttpClientOptions http_options;
  http_options.base_url        = config.provider().base_url();
  http_options.api_key         = config.provider().api_key();
  http_options.request_timeout = util::ToMillis(config.provider().request_timeout());
  http_options.connect_timeout = util::ToMillis(config.provider().connect_timeout());

  auto http          = std::make_shared<provider::HttpClient>(std::move(http_options));
  auto search_source = std::make_shared<provider::SlskdProvider>(http);

  // ------------------------------------------------------------------
  // Runtime
  // ------------------------------------------------------------------
  app.scheduler     = std::make_shared<runtime::Scheduler>();
  app.provider_pool = std::make_shared<runtime::WorkerPool>("provider", config.workers().provider_threads());
  app.analysis_pool = std::make_shared<runtime::WorkerPool>("analysis", config.workers().analysis_threads());
  app.scheduler->Start();
  app.provider_pool->Start();
  app.analysis_pool->Start();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto registry = std::make_shared<session::RequesterRegistry>();

  app.orchestrator = std::make_shared<search::SearchOrchestrator>(app.scheduler, app.provider_pool, search_source, registry,
                                                                  search::ResultFilter(config.filter()), config.search());

  auto analyzer = std::make_shared<analysis::AuthenticityAnalyzer>(config.analysis());
  auto pipeline = std::make_shared<core::MatchPipeline>(app.orchestrator, search::Scorer(config.scoring(), config.filter()), analyzer,
                                                        app.analysis_pool, config.search().max_results());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.pipeline = pipeline;
  ctx.registry = registry;

  app.match_service = std::make_shared<service::MatchService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::MatchServer>(app.match_service));

  TRACKMATCH_LOG_INFO("Application built", {observability::StringField("provider", config.provider().base_url()),
                                            observability::IntField("provider_threads", config.workers().provider_threads()),
                                            observability::IntField("analysis_threads", config.workers().analysis_threads())});
  return app;
}

} // namespace trackmatch::factory
