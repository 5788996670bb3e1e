#include "hook_compute_provisioner.hpp"

#include <sstream>
#include <system_error>

#include "internal/compute/process.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::compute {
namespace {

std::string Tail(const std::string& text, std::size_t max = 512) {
  return text.size() <= max ? text : text.substr(text.size() - max);
}

std::string DescribeFailure(const std::string& what, const ProcessResult& result) {
  if (result.timed_out) {
    return what + " timed out";
  }
  auto out = what + " exited with " + std::to_string(result.exit_code);
  if (!result.stderr_text.empty()) {
    out += ": " + Tail(result.stderr_text);
  }
  return out;
}

} // namespace

HookComputeProvisioner::HookComputeProvisioner(HookOptions options) : options_(std::move(options)) {
  if (options_.create_command.empty() || options_.destroy_command.empty() || options_.exec_command.empty()) {
    throw util::InvalidArgument("compute hooks require create_command, destroy_command and exec_command");
  }
}

model::ComputeHandle HookComputeProvisioner::Provision(const model::ComputeSpec& spec) {
  ProcessSpec process;
  process.command   = options_.create_command;
  process.args      = {spec.name, spec.size, spec.region, spec.image};
  process.timeout   = options_.command_timeout;
  process.scrub_env = options_.scrub_env;

  ProcessResult result;
  try {
    result = RunProcess(process);
  } catch (const std::system_error& e) {
    throw util::ComputeProvisioningError("create hook for " + spec.name + " could not start: " + e.what());
  }
  if (result.timed_out || result.exit_code != 0) {
    throw util::ComputeProvisioningError(DescribeFailure("create hook for " + spec.name, result));
  }

  std::istringstream lines(result.stdout_text);
  std::string        first_line;
  std::getline(lines, first_line);

  model::ComputeHandle handle;
  std::istringstream   fields(first_line);
  fields >> handle.instance_id >> handle.address;
  if (handle.instance_id.empty()) {
    throw util::ComputeProvisioningError("create hook for " + spec.name + " printed no instance id");
  }
  handle.name   = spec.name;
  handle.region = spec.region;

  FLEET_LOG_DEBUG("Create hook finished",
                  {observability::StringField("name", handle.name), observability::StringField("instance_id", handle.instance_id)});
  return handle;
}

void HookComputeProvisioner::Destroy(const model::ComputeHandle& handle) {
  ProcessSpec process;
  process.command   = options_.destroy_command;
  process.args      = {handle.instance_id};
  process.timeout   = options_.command_timeout;
  process.scrub_env = options_.scrub_env;

  ProcessResult result;
  try {
    result = RunProcess(process);
  } catch (const std::system_error& e) {
    throw util::ComputeProvisioningError("destroy hook for " + handle.instance_id + " could not start: " + e.what());
  }
  if (result.timed_out || result.exit_code != 0) {
    throw util::ComputeProvisioningError(DescribeFailure("destroy hook for " + handle.instance_id, result));
  }
}

model::CommandResult HookComputeProvisioner::RunCommand(const model::ComputeHandle& handle, const std::string& script,
                                                        std::chrono::milliseconds timeout) {
  ProcessSpec process;
  process.command    = options_.exec_command;
  process.args       = {handle.instance_id, handle.address};
  process.stdin_data = script;
  process.timeout    = timeout;
  process.scrub_env  = options_.scrub_env;

  ProcessResult result;
  try {
    result = RunProcess(process);
  } catch (const std::system_error& e) {
    throw util::ComputeProvisioningError("exec hook for " + handle.instance_id + " could not start: " + e.what());
  }
  // 127: hook not executable, 255: ssh style transport failure.
  if (!result.timed_out && (result.exit_code == 127 || result.exit_code == 255)) {
    throw util::ComputeProvisioningError(DescribeFailure("exec hook for " + handle.instance_id, result));
  }

  model::CommandResult out;
  out.exit_code   = result.exit_code;
  out.stdout_text = std::move(result.stdout_text);
  out.stderr_text = std::move(result.stderr_text);
  out.timed_out   = result.timed_out;
  return out;
}

} // namespace fleet::compute
