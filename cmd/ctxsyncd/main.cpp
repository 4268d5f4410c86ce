#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

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
    std::cerr << "Usage: ctxsyncd <config.yaml> OR ctxsyncd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ctxsync::config::ConfigLoader::LoadFromYaml(config_path);

    ctxsync::observability::InitializeTracing(config);
    ctxsync::observability::InitializeMetrics(config);
    ctxsync::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = ctxsync::factory::Build(config);

    const auto pruned = app.versions->PruneAll();
    const auto warmed = app.manager->WarmCache();

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    CTXSYNC_LOG_INFO("ctxsync engine started", {ctxsync::observability::UintField("warmed", warmed), ctxsync::observability::UintField("pruned", pruned),
                                                ctxsync::observability::UintField("tracked", app.sync ? app.sync->Tracked().size() : 0)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CTXSYNC_LOG_INFO("Shutting down ctxsync engine");

    app.Stop();
    ctxsync::observability::ShutdownLogging();
    ctxsync::observability::ShutdownMetrics();
    ctxsync::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    CTXSYNC_LOG_ERROR("Fatal error", {ctxsync::observability::ErrorField(e.what())});
    ctxsync::observability::ShutdownLogging();
    ctxsync::observability::ShutdownMetrics();
    ctxsync::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
