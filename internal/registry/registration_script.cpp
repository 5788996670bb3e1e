#include "registration_script.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>

namespace fleet::registry {

std::string ShellQuote(std::string_view value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

std::string BuildRegistrationScript(const model::FleetConfig& fleet, const std::string& worker_name, const model::RegistrationToken& token,
                                    const RegistrationScriptOptions& options) {
  const auto& version = options.runner_version;
  const auto  archive = "actions-runner-" + options.runner_arch + "-" + version + ".tar.gz";
  const auto  release = "https://github.com/actions/runner/releases/download/v" + version + "/" + archive;

  std::string web = options.web_base_url;
  while (!web.empty() && web.back() == '/') {
    web.pop_back();
  }

  std::ostringstream s;
  s << "#!/bin/bash\n"
    << "set -euo pipefail\n"
    << "RUNNER_DIR=\"$HOME/actions-runner\"\n"
    << "mkdir -p \"$RUNNER_DIR\"\n"
    << "cd \"$RUNNER_DIR\"\n"
    << "if [ ! -x ./config.sh ]; then\n"
    << "  curl -fsSL -o " << ShellQuote(archive) << " " << ShellQuote(release) << "\n"
    << "  tar xzf " << ShellQuote(archive) << "\n"
    << "  rm -f " << ShellQuote(archive) << "\n"
    << "fi\n"
    << "./config.sh --url " << ShellQuote(web + "/" + fleet.repo_owner + "/" + fleet.repo_name)
    << " --token " << ShellQuote(token.Value())
    << " --name " << ShellQuote(worker_name)
    << " --labels " << ShellQuote(model::JoinLabels(fleet.labels))
    << " --ephemeral --unattended";
  if (fleet.worker_group) {
    s << " --runnergroup " << ShellQuote(*fleet.worker_group);
  }
  s << "\n"
    << "nohup ./run.sh > runner.log 2>&1 < /dev/null &\n"
    << "cat .runner\n";
  return s.str();
}

std::optional<int64_t> ExtractWorkerId(std::string_view output) {
  static const std::regex kPatterns[] = {
      std::regex(R"re(with ID:\s*(\d+))re"),
      std::regex(R"re("(?:runnerId|agentId)"\s*:\s*(\d+))re"),
  };

  const std::string text(output);
  for (const auto& pattern : kPatterns) {
    std::smatch match;
    if (std::regex_search(text, match, pattern)) {
      try {
        return std::stoll(match[1].str());
      } catch (const std::out_of_range&) {
        return std::nullopt;
      }
    }
  }
  return std::nullopt;
}

} // namespace fleet::registry
