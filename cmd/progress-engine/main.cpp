#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/grpc_services.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using progress::runtime::Server;

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
    std::cerr << "Usage: progress-engine <config.yaml> OR progress-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = progress::config::ConfigLoader::LoadFromYaml(config_path);

    progress::observability::InitializeTracing(config);
    progress::observability::InitializeMetrics(config);
    progress::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto deps = progress::factory::BuildRuntime(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), progress::grpc::BuildGrpcServices(deps));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PROGRESS_LOG_INFO("progress engine started", {progress::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PROGRESS_LOG_INFO("shutting down progress engine");

    server.Stop();
    progress::observability::ShutdownLogging();
    progress::observability::ShutdownMetrics();
    progress::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    PROGRESS_LOG_ERROR("fatal error", {progress::observability::StringField("error", e.what())});
    progress::observability::ShutdownLogging();
    progress::observability::ShutdownMetrics();
    progress::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
