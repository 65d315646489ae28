#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using osforge::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  osforge::observability::ShutdownLogging();
  osforge::observability::ShutdownMetrics();
  osforge::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: osforge-server <config.yaml> OR osforge-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = osforge::config::ConfigLoader::LoadFromYaml(config_path);
    if (config.server().bind_address().empty()) {
      config.mutable_server()->set_bind_address("0.0.0.0:50051");
    }

    osforge::observability::InitializeTracing(config);
    osforge::observability::InitializeMetrics(config);
    osforge::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = osforge::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    OSFORGE_LOG_INFO("osforge started", {osforge::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    OSFORGE_LOG_INFO("Shutting down osforge",
                     {osforge::observability::IntField("builds_in_flight", static_cast<std::int64_t>(app.scheduler->InFlight()))});

    server.Stop();
    app.scheduler->Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    OSFORGE_LOG_ERROR("Fatal error", {osforge::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
