#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/cache/registry.hpp"
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
    std::cerr << "Usage: relcached <config.yaml> OR relcached --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = relcache::config::ConfigLoader::LoadFromYaml(config_path);

    relcache::observability::InitializeLogging(config);

    // Register signal handlers before starting the reaper thread.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Build application (store, client, reaper)
    // ------------------------------------------------------------
    auto app = relcache::factory::Build(config);

    RELCACHE_LOG_INFO("relcached started", {relcache::observability::StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RELCACHE_LOG_INFO("Shutting down relcached");

    // stops the reaper and unregisters the client
    relcache::cache::Close();
    relcache::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    RELCACHE_LOG_ERROR("Fatal error", {relcache::observability::StringField("error", e.what())});
    relcache::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
