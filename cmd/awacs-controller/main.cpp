#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#if AWACS_WITH_GRPC
#include "internal/runtime/server.hpp"
#endif

using awacs::observability::StringField;
using awacs::observability::UintField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  awacs::observability::ShutdownLogging();
  awacs::observability::ShutdownMetrics();
  awacs::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: awacs-controller <config.yaml> OR awacs-controller --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load and validate configuration
    // ------------------------------------------------------------
    auto config   = awacs::config::ConfigLoader::LoadFromYaml(config_path);
    auto settings = awacs::config::ToSettings(config);

    awacs::observability::InitializeTracing(config);
    awacs::observability::InitializeMetrics(config);
    awacs::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = awacs::factory::Build(settings);

#if AWACS_WITH_GRPC
    std::unique_ptr<awacs::runtime::Server> admin;
    if (!settings.admin_bind_address.empty()) {
      admin = std::make_unique<awacs::runtime::Server>(settings.admin_bind_address, app.grpc_services);
    }
#endif

    // Register signal handlers before starting threads to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
#if AWACS_WITH_GRPC
    if (admin) {
      admin->Start();
    }
#endif

    AWACS_LOG_INFO("AWACS controller started", {StringField("callsign", settings.controller.callsign),
                                                StringField("coalition", awacs::model::ToString(settings.controller.coalition)),
                                                UintField("frequencies", settings.radio.frequencies.size())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    AWACS_LOG_INFO("Shutting down AWACS controller");

    app.Stop();
#if AWACS_WITH_GRPC
    if (admin) {
      admin->Shutdown();
    }
#endif
    ShutdownObservability();
  } catch (const std::exception& e) {
    AWACS_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    std::cerr << "awacs-controller: " << e.what() << std::endl;
    ShutdownObservability();
    return 2;
  }

  return 0;
}
