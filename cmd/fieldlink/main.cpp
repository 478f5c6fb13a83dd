#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/core/lookup_pool.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using fieldlink::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path = "config.yaml";
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: fieldlink [config.yaml] OR fieldlink --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fieldlink::config::ConfigLoader::Load(config_path);

    fieldlink::observability::InitializeLogging(config);
    FIELDLINK_LOG_DEBUG("debug log is enabled");

    // ------------------------------------------------------------
    // Build application (connects every relation)
    // ------------------------------------------------------------
    auto app = fieldlink::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.listen(), app.handler);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    FIELDLINK_LOG_INFO("Shutting down fieldlink");

    server.Stop();
    app.lookup_pool->Stop();
    fieldlink::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FIELDLINK_LOG_ERROR("Fatal error", {fieldlink::observability::StringField("error", e.what())});
    fieldlink::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
