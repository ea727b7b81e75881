#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

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
    std::cerr << "Usage: quotecast <config.yaml> OR quotecast --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = quotecast::config::ConfigLoader::LoadFromYaml(config_path);

    quotecast::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = quotecast::factory::Build(config);

    auto ensured = app.store->EnsureDefaultSchedule();
    if (!ensured.ok()) {
      QUOTECAST_LOG_WARN("default schedule unavailable", {quotecast::observability::StringField("status", ensured.status().ToString())});
    }

    // Register signal handlers before starting the trigger to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.trigger->Start();
    QUOTECAST_LOG_INFO("quotecast started", {quotecast::observability::StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    QUOTECAST_LOG_INFO("Shutting down quotecast");

    app.trigger->Stop();
    quotecast::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    QUOTECAST_LOG_ERROR("Fatal error", {quotecast::observability::StringField("error", e.what())});
    quotecast::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
