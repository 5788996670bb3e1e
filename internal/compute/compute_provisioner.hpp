#pragma once

#include <chrono>
#include <string>

#include "internal/model/worker.hpp"

namespace fleet::compute {

/*
  External collaborator that owns compute instances.

  Provision and Destroy throw util::ComputeProvisioningError. RunCommand
  reports the remote command's own failure through CommandResult and throws
  util::ComputeProvisioningError only when the target cannot be reached.
*/
class ComputeProvisioner {
 public:
  virtual ~ComputeProvisioner() = default;

  virtual model::ComputeHandle Provision(const model::ComputeSpec& spec) = 0;

  virtual void Destroy(const model::ComputeHandle& handle) = 0;

  virtual model::CommandResult RunCommand(const model::ComputeHandle& handle, const std::string& script, std::chrono::milliseconds timeout) = 0;
};

} // namespace fleet::compute
