#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/runtime_options.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using docflow::factory::Build;
using docflow::runtime::Server;

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
    std::cerr << "Usage: docflow-server <config.yaml> OR docflow-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = docflow::config::ConfigLoader::LoadFromYaml(config_path);

    docflow::observability::InitializeTracing(config);
    docflow::observability::InitializeMetrics(config);
    docflow::observability::InitializeLogging(config);

    docflow::runtime::ServerOptions server_options;
    server_options.bind_address = config.server().bind_address().empty() ? std::string(docflow::config::kDefaultBindAddress)
                                                                          : config.server().bind_address();

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(server_options, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    DOCFLOW_LOG_INFO("docflow server started", {docflow::observability::StringField("bind_address", server_options.bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    DOCFLOW_LOG_INFO("Shutting down docflow server");

    server.Stop();
    app.lock_reaper->Stop();
    docflow::observability::ShutdownLogging();
    docflow::observability::ShutdownMetrics();
    docflow::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    DOCFLOW_LOG_ERROR("Fatal error", {docflow::observability::StringField("error", e.what())});
    docflow::observability::ShutdownLogging();
    docflow::observability::ShutdownMetrics();
    docflow::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
