#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace trackmatch::runtime { class Scheduler; class WorkerPool; }
namespace trackmatch::search { class SearchOrchestrator; }
namespace trackmatch::service { class MatchService; }

namespace trackmatch::factory {

/*
  Application

  Owns the long-lived pieces built from one RuntimeConfig. gRPC services
  are handed to runtime::Server; the rest stays here until Stop.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<runtime::Scheduler> scheduler;
  std::shared_ptr<runtime::WorkerPool> provider_pool;
  std::shared_ptr<runtime::WorkerPool> analysis_pool;
  std::shared_ptr<search::SearchOrchestrator> orchestrator;
  std::shared_ptr<service::MatchService> match_service;

  // Rejects new calls and cancels running searches so their provider
  // sessions get cleaned up while the loop still runs.
  void CancelAll();

  // Stops the loop and the worker pools. Call after the server stopped.
  void Stop();
};

/*
  Build

  Composition root: the only place that knows concrete provider types.
*/
Application Build(const trackmatch::runtime::config::RuntimeConfig& config);

} // namespace trackmatch::factory
