#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/registry/registration_script.hpp"
#include "test_doubles.hpp"

namespace {

using fleet::registry::BuildRegistrationScript;
using fleet::registry::ExtractWorkerId;
using fleet::registry::ShellQuote;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestShellQuoteEscapesSingleQuotes() {
  assert(ShellQuote("plain") == "'plain'");
  assert(ShellQuote("it's") == "'it'\\''s'");
  assert(ShellQuote("$(rm -rf /)") == "'$(rm -rf /)'");
}

void TestScriptConfiguresEphemeralWorker() {
  auto def               = fleet::testing::MakeDefinition();
  def.fleet.worker_group = "gpu";
  fleet::model::RegistrationToken token("AAREGTOKEN123", fleet::util::Now() + std::chrono::hours(1));

  fleet::registry::RegistrationScriptOptions options;
  options.web_base_url   = "https://github.example.com/";
  options.runner_version = "2.320.0";
  options.runner_arch    = "linux-arm64";

  const auto script = BuildRegistrationScript(def.fleet, "ci-abc123", token, options);
  assert(Contains(script, "set -euo pipefail"));
  assert(Contains(script, "actions-runner-linux-arm64-2.320.0.tar.gz"));
  assert(Contains(script, "releases/download/v2.320.0/"));
  assert(Contains(script, "--url 'https://github.example.com/acme/widgets'"));
  assert(Contains(script, "--token 'AAREGTOKEN123'"));
  assert(Contains(script, "--name 'ci-abc123'"));
  assert(Contains(script, "--labels 'self-hosted,linux'"));
  assert(Contains(script, "--ephemeral"));
  assert(Contains(script, "--unattended"));
  assert(Contains(script, "--runnergroup 'gpu'"));
  assert(Contains(script, "cat .runner"));
}

void TestScriptOmitsGroupWhenUnset() {
  const auto                      def = fleet::testing::MakeDefinition();
  fleet::model::RegistrationToken token("AAREGTOKEN123", fleet::util::Now() + std::chrono::hours(1));
  const auto script = BuildRegistrationScript(def.fleet, "ci-abc123", token, {});
  assert(!Contains(script, "--runnergroup"));
  assert(Contains(script, "--url 'https://github.com/acme/widgets'"));
}

void TestExtractWorkerId() {
  assert(ExtractWorkerId("√ Runner successfully added with ID: 1234\n").value() == 1234);
  assert(ExtractWorkerId(R"({"agentId": 77, "agentName": "ci-1"})").value() == 77);
  assert(ExtractWorkerId(R"({"runnerId":9})").value() == 9);
  assert(!ExtractWorkerId("Runner successfully added").has_value());
  assert(!ExtractWorkerId("with ID: 99999999999999999999999").has_value());
}

} // namespace

int main() {
  TestShellQuoteEscapesSingleQuotes();
  TestScriptConfiguresEphemeralWorker();
  TestScriptOmitsGroupWhenUnset();
  TestExtractWorkerId();

  std::cout << "runner_fleet_unit_registration_script: pass\n";
  return 0;
}
