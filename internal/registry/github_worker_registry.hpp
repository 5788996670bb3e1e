#pragma once

#include <chrono>
#include <memory>

#include "internal/compute/compute_provisioner.hpp"
#include "internal/github/github_client.hpp"
#include "internal/registry/registration_script.hpp"
#include "internal/registry/worker_registry.hpp"

namespace fleet::registry {

struct GitHubRegistryOptions {
  RegistrationScriptOptions script;
  // Upper bound for the remote install + configure command.
  std::chrono::milliseconds register_timeout{300'000};
};

/*
  Repository scoped self-hosted runners (actions/runners endpoints). Register
  runs the installation script on the target through the compute provisioner.
*/
class GitHubWorkerRegistry final : public WorkerRegistry {
 public:
  GitHubWorkerRegistry(std::shared_ptr<github::GitHubClient> client, std::shared_ptr<compute::ComputeProvisioner> compute,
                       GitHubRegistryOptions options = {});

  model::RegistrationToken GetRegistrationToken(const model::FleetConfig& fleet) override;
  int64_t           Register(const model::ComputeHandle& target, const model::FleetConfig& fleet, model::RegistrationToken token) override;
  void              Deregister(const model::FleetConfig& fleet, int64_t worker_id) override;
  model::WorkerInfo Status(const model::FleetConfig& fleet, int64_t worker_id) override;

 private:
  std::shared_ptr<github::GitHubClient>        client_;
  std::shared_ptr<compute::ComputeProvisioner> compute_;
  GitHubRegistryOptions                        options_;
};

} // namespace fleet::registry
