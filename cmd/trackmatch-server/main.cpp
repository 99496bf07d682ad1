#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/runtime/server.hpp"

using trackmatch::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: trackmatch-server <config.yaml> OR trackmatch-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = trackmatch::config::ConfigLoader::LoadFromYaml(config_path);

    trackmatch::observability::InitializeTracing(config);
    trackmatch::observability::InitializeMetrics(config);
    trackmatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = trackmatch::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TRACKMATCH_LOG_INFO("trackmatch started", {trackmatch::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TRACKMATCH_LOG_INFO("Shutting down trackmatch");

    app.CancelAll();
    server.Stop();
    app.Stop();
    trackmatch::observability::ShutdownLogging();
    trackmatch::observability::ShutdownMetrics();
    trackmatch::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    TRACKMATCH_LOG_ERROR("Fatal error", {trackmatch::observability::StringField("error", e.what())});
    trackmatch::observability::ShutdownLogging();
    trackmatch::observability::ShutdownMetrics();
    trackmatch::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
