#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using fleet::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "runner_fleet_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool RejectsYaml(const std::string& text) {
  try {
    (void)ConfigLoader::LoadFromYamlString(text);
  } catch (const fleet::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_memory());
  assert(config.provider().api_base_url() == "https://api.github.com");
  assert(config.provider().web_base_url() == "https://github.com");
  assert(config.provider().token_env() == "GITHUB_TOKEN");
  assert(config.provider().max_rate_limit_retries() == 3);
  assert(fleet::util::DurationOr(config.provider().api_timeout(), {}) == std::chrono::seconds(30));
  assert(config.dispatch().max_concurrent_operations() == 10);
  assert(config.dispatch().degraded_after_failed_batches() == 3);
  assert(fleet::util::DurationOr(config.dispatch().tick_interval(), {}) == std::chrono::seconds(60));
  assert(fleet::util::DurationOr(config.dispatch().online_timeout(), {}) == std::chrono::minutes(5));
  assert(fleet::util::DurationOr(config.compute().command_timeout(), {}) == std::chrono::minutes(10));
  assert(config.registration().runner_arch() == "linux-x64");
}

void TestFullFileFromDisk() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "/var/lib/runner-fleet/fleet.db"
provider:
  api_base_url: "https://ghe.example.com/api/v3"
  token_env: FLEET_TOKEN
  api_timeout: 5s
  max_rate_limit_retries: 1
compute:
  create_command: /opt/hooks/create
  destroy_command: /opt/hooks/destroy
  exec_command: /opt/hooks/exec
  command_timeout: 90s
dispatch:
  max_concurrent_operations: 4
  tick_interval: 15s
  online_timeout: 0.5s
logging:
  level: debug
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/runner-fleet/fleet.db");
  assert(config.provider().api_base_url() == "https://ghe.example.com/api/v3");
  assert(config.provider().token_env() == "FLEET_TOKEN");
  assert(config.provider().max_rate_limit_retries() == 1);
  assert(fleet::util::DurationOr(config.provider().api_timeout(), {}) == std::chrono::seconds(5));
  assert(config.compute().exec_command() == "/opt/hooks/exec");
  assert(fleet::util::DurationOr(config.compute().command_timeout(), {}) == std::chrono::seconds(90));
  assert(config.dispatch().max_concurrent_operations() == 4);
  assert(fleet::util::DurationOr(config.dispatch().tick_interval(), {}) == std::chrono::seconds(15));
  assert(fleet::util::DurationOr(config.dispatch().online_timeout(), {}) == std::chrono::milliseconds(500));
  assert(config.logging().level() == "debug");

  // untouched sections still defaulted
  assert(config.provider().web_base_url() == "https://github.com");
  assert(fleet::util::DurationOr(config.dispatch().observation_timeout(), {}) == std::chrono::seconds(30));
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(provider:
  user_agent: "1234"
server:
  bind_address: "line1\nline2☃"
)");
  assert(config.provider().user_agent() == "1234");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  assert(RejectsYaml(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)"));
  assert(RejectsYaml(R"(provider:
  token: ghp_should_never_be_in_config
)"));
}

void TestMalformedValuesAreRejected() {
  assert(RejectsYaml("dispatch:\n  tick_interval: soon\n"));
  assert(RejectsYaml("dispatch:\n  max_concurrent_operations: many\n"));
  assert(RejectsYaml("server: [unterminated\n"));
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/runner-fleet.yaml");
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentGetsDefaults();
  TestFullFileFromDisk();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMalformedValuesAreRejected();
  TestMissingFileIsRejected();

  std::cout << "runner_fleet_unit_config_loader: pass\n";
  return 0;
}
