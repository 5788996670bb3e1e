#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/fleet_config.hpp"
#include "internal/model/registration_token.hpp"

namespace fleet::registry {

struct RegistrationScriptOptions {
  std::string web_base_url   = "https://github.com";
  std::string runner_version = "2.311.0";
  std::string runner_arch    = "linux-x64";
};

// POSIX single-quote escaping.
std::string ShellQuote(std::string_view value);

/*
  bash script that downloads the pinned runner release, configures it as an
  ephemeral worker for the fleet's repository, starts it detached and prints
  the runner's identity file.

  The result embeds the registration token: never log it.
*/
std::string BuildRegistrationScript(const model::FleetConfig& fleet, const std::string& worker_name, const model::RegistrationToken& token,
                                    const RegistrationScriptOptions& options);

// Provider id from "... with ID: 42" or a "runnerId"/"agentId" JSON field.
std::optional<int64_t> ExtractWorkerId(std::string_view output);

} // namespace fleet::registry
