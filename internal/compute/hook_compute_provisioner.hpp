#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/compute/compute_provisioner.hpp"

namespace fleet::compute {

struct HookOptions {
  // <create_command> <name> <size> <region> <image>
  //   first stdout line: "<instance_id> [address]"
  std::string create_command;
  // <destroy_command> <instance_id>
  std::string destroy_command;
  // <exec_command> <instance_id> <address>; script on stdin
  std::string exec_command;

  std::chrono::milliseconds command_timeout{600'000};

  // Environment variables the hooks must not inherit (the provider token).
  std::vector<std::string> scrub_env;
};

/*
  ComputeProvisioner backed by operator supplied executables, so any cloud or
  hypervisor CLI can be wired in without linking its SDK.
*/
class HookComputeProvisioner final : public ComputeProvisioner {
 public:
  explicit HookComputeProvisioner(HookOptions options);

  model::ComputeHandle Provision(const model::ComputeSpec& spec) override;
  void                 Destroy(const model::ComputeHandle& handle) override;
  model::CommandResult RunCommand(const model::ComputeHandle& handle, const std::string& script, std::chrono::milliseconds timeout) override;

 private:
  HookOptions options_;
};

} // namespace fleet::compute
