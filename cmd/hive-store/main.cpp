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
    std::cerr << "Usage: hive-store <config.yaml> OR hive-store --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = hive::config::ConfigLoader::LoadFromYaml(config_path);

    hive::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = hive::factory::BuildRuntime(config);

    auto health = app.coordinator->HealthCheck();
    if (!health.healthy) {
      HIVE_LOG_ERROR("Store unhealthy", {hive::observability::StringField("reason", health.message)});
      hive::observability::ShutdownLogging();
      return 3;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (app.sweep_worker) {
      app.sweep_worker->Start();
    }
    HIVE_LOG_INFO("Hive store started", {hive::observability::StringField("database", app.database->Options().path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    HIVE_LOG_INFO("Shutting down hive store");

    if (app.sweep_worker) {
      app.sweep_worker->Stop();
    }
    hive::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    HIVE_LOG_ERROR("Fatal error", {hive::observability::StringField("error", e.what())});
    hive::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
