#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/fleet_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/operation_executor.hpp"

namespace fleet::factory {

/*
  Application

  Owns every long-lived component of the daemon. Destruction order matters:
  the manager (and its controllers) goes before the executor they submit to.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<dispatch::OperationExecutor>  executor;
  std::shared_ptr<core::FleetManager>           manager;

  // Stops every fleet (no drain), then the executor.
  void Shutdown();
};

/*
  Build

  Composition root: the ONLY place that knows concrete backends (SQLite,
  libcurl, hook provisioner, GitHub). The provider token is passed in by the
  caller and only held in memory.
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config, std::string provider_token);

std::shared_ptr<db::Repository> BuildRepository(const fleet::runtime::config::RuntimeConfig& config);

} // namespace fleet::factory
