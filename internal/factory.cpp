#include "factory.hpp"

#include "internal/compute/hook_compute_provisioner.hpp"
#include "internal/controller/fleet_controller.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/github/github_client.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/http/curl_http_client.hpp"
#include "internal/lifecycle/fleet_lifecycle_manager.hpp"
#include "internal/queue/github_queue_observer.hpp"
#include "internal/registry/github_worker_registry.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

#if FLEET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace fleet::factory {

using util::DurationOr;

std::shared_ptr<db::Repository> BuildRepository(const fleet::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLEET_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw util::InvalidArgument("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidArgument("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

void Application::Shutdown() {
  if (manager) manager->Shutdown();
  if (executor) executor->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config, std::string provider_token) {
  if (provider_token.empty()) {
    throw util::InvalidArgument("provider token is empty; set " + config.provider().token_env());
  }

  Application app;
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Provider transport
  // ------------------------------------------------------------------
  const auto& provider = config.provider();

  github::GitHubClientOptions client_options;
  client_options.api_base_url           = provider.api_base_url();
  client_options.timeout                = DurationOr(provider.api_timeout(), client_options.timeout);
  client_options.max_rate_limit_retries = static_cast<int>(provider.max_rate_limit_retries());
  client_options.initial_backoff        = DurationOr(provider.initial_backoff(), client_options.initial_backoff);
  client_options.max_backoff            = DurationOr(provider.max_backoff(), client_options.max_backoff);
  client_options.user_agent             = provider.user_agent();

  auto github = std::make_shared<github::GitHubClient>(std::make_shared<http::CurlHttpClient>(), std::move(provider_token), client_options);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  compute::HookOptions hooks;
  hooks.create_command  = config.compute().create_command();
  hooks.destroy_command = config.compute().destroy_command();
  hooks.exec_command    = config.compute().exec_command();
  hooks.command_timeout = DurationOr(config.compute().command_timeout(), hooks.command_timeout);
  hooks.scrub_env       = {provider.token_env()};
  auto compute          = std::make_shared<compute::HookComputeProvisioner>(hooks);

  registry::GitHubRegistryOptions registry_options;
  registry_options.script.web_base_url   = provider.web_base_url();
  registry_options.script.runner_version = config.registration().runner_version();
  registry_options.script.runner_arch    = config.registration().runner_arch();
  registry_options.register_timeout      = DurationOr(config.registration().register_timeout(), registry_options.register_timeout);
  auto registry                          = std::make_shared<registry::GitHubWorkerRegistry>(github, compute, registry_options);

  const auto& dispatch = config.dispatch();
  auto        observer =
      std::make_shared<queue::GitHubQueueObserver>(github, DurationOr(dispatch.observation_timeout(), std::chrono::seconds(30)));

  lifecycle::LifecycleOptions lifecycle_options;
  lifecycle_options.online_timeout       = DurationOr(dispatch.online_timeout(), lifecycle_options.online_timeout);
  lifecycle_options.online_poll_interval = DurationOr(dispatch.online_poll_interval(), lifecycle_options.online_poll_interval);
  auto lifecycle                         = std::make_shared<lifecycle::FleetLifecycleManager>(compute, registry, lifecycle_options);

  // ------------------------------------------------------------------
  // Dispatch + fleets
  // ------------------------------------------------------------------
  app.executor = std::make_shared<dispatch::OperationExecutor>(dispatch.max_concurrent_operations());
  app.executor->Start();

  controller::ControllerOptions controller_options;
  controller_options.tick_interval                 = DurationOr(dispatch.tick_interval(), controller_options.tick_interval);
  controller_options.degraded_after_failed_batches = static_cast<int>(dispatch.degraded_after_failed_batches());

  auto factory = [observer, lifecycle, executor = app.executor, repository = app.repository,
                  controller_options](const model::FleetDefinition& definition) {
    return std::make_unique<controller::FleetController>(definition, observer, lifecycle, executor, repository, controller_options);
  };

  core::FleetManagerOptions manager_options;
  manager_options.command_timeout = DurationOr(dispatch.operation_wait_timeout(), manager_options.command_timeout);
  app.manager                     = std::make_shared<core::FleetManager>(app.repository, factory, manager_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;

  auto admin_service = std::make_shared<service::AdminService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::FleetAdminServer>(admin_service));

  return app;
}

} // namespace fleet::factory
