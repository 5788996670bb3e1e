#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sanitize.hpp"

using fleet::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

std::string ReadProviderToken(const fleet::runtime::config::RuntimeConfig& config) {
  const auto& env_name = config.provider().token_env();
  const char* value    = std::getenv(env_name.c_str());
  if (value == nullptr || *value == '\0') {
    throw fleet::util::InvalidArgument("environment variable " + env_name + " is not set");
  }
  std::string token(value);
  fleet::util::RegisterSecret(token);
  return token;
}

void ShutdownObservability() {
  fleet::observability::ShutdownMetrics();
  fleet::observability::ShutdownTracing();
  fleet::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: fleet-autoscaler <config.yaml> OR fleet-autoscaler --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fleet::config::ConfigLoader::LoadFromYaml(config_path);

    fleet::observability::InitializeTracing(config);
    fleet::observability::InitializeMetrics(config);
    fleet::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = fleet::factory::Build(config, ReadProviderToken(config));

    const auto restored = app.manager->Restore();
    FLEET_LOG_INFO("Restored fleets", {fleet::observability::IntField("count", static_cast<int64_t>(restored))});

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FLEET_LOG_INFO("Fleet autoscaler started", {fleet::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLEET_LOG_INFO("Shutting down fleet autoscaler");

    server.Stop();
    app.Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Fatal error", {fleet::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
