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

using entitlement::runtime::Server;

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
    std::cerr << "Usage: entitlement-manager <config.yaml> OR entitlement-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = entitlement::config::ConfigLoader::LoadFromYaml(config_path);

    entitlement::observability::InitializeTracing(config);
    entitlement::observability::InitializeMetrics(config);
    entitlement::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = entitlement::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ENTITLEMENT_LOG_INFO("Entitlement manager started", {entitlement::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ENTITLEMENT_LOG_INFO("Shutting down entitlement manager");

    server.Stop();
    entitlement::observability::ShutdownLogging();
    entitlement::observability::ShutdownMetrics();
    entitlement::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    ENTITLEMENT_LOG_ERROR("Fatal error", {entitlement::observability::StringField("error", e.what())});
    entitlement::observability::ShutdownLogging();
    entitlement::observability::ShutdownMetrics();
    entitlement::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
