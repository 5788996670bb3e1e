#include "github_worker_registry.hpp"

#include <google/protobuf/util/time_util.h>

#include <chrono>

#include "fleet/github/v1/github.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::registry {

using observability::IntField;
using observability::StringField;

namespace {

// Registration tokens live for an hour; assume the worst when unparsable.
constexpr auto kFallbackTokenLifetime = std::chrono::minutes(5);

std::string Tail(const std::string& text, std::size_t max = 512) {
  return text.size() <= max ? text : text.substr(text.size() - max);
}

} // namespace

GitHubWorkerRegistry::GitHubWorkerRegistry(std::shared_ptr<github::GitHubClient> client, std::shared_ptr<compute::ComputeProvisioner> compute,
                                           GitHubRegistryOptions options)
    : client_(std::move(client)), compute_(std::move(compute)), options_(std::move(options)) {
}

model::RegistrationToken GitHubWorkerRegistry::GetRegistrationToken(const model::FleetConfig& fleet) {
  const auto path = github::GitHubClient::RepoPath(fleet) + "/actions/runners/registration-token";

  http::HttpResponse response;
  try {
    response = client_->Post(path, {});
  } catch (const util::Error& e) {
    throw util::RegistrationTokenError("registration token request for " + fleet.Repository() + " failed: " + e.what());
  }

  if (response.status != 201 && response.status != 200) {
    throw util::RegistrationTokenError("registration token request for " + fleet.Repository() + " rejected: " +
                                       github::GitHubClient::Describe(response));
  }

  fleet::github::v1::RegistrationToken parsed;
  try {
    github::GitHubClient::ParseJson(response.body, &parsed);
  } catch (const util::TransportError& e) {
    throw util::RegistrationTokenError(e.what());
  }
  if (parsed.token().empty()) {
    throw util::RegistrationTokenError("registration token response for " + fleet.Repository() + " carried no token");
  }

  auto                        expires_at = util::Now() + kFallbackTokenLifetime;
  google::protobuf::Timestamp ts;
  if (!parsed.expires_at().empty() && google::protobuf::util::TimeUtil::FromString(parsed.expires_at(), &ts)) {
    expires_at = util::FromProto(ts);
  }

  response.body.assign(response.body.size(), '\0');
  return model::RegistrationToken(std::move(*parsed.mutable_token()), expires_at);
}

int64_t GitHubWorkerRegistry::Register(const model::ComputeHandle& target, const model::FleetConfig& fleet, model::RegistrationToken token) {
  if (token.Empty() || token.ExpiredAt(util::Now())) {
    throw util::WorkerRegistrationError("registration token for " + target.name + " is expired or empty");
  }

  model::CommandResult result;
  {
    std::string script = BuildRegistrationScript(fleet, target.name, token, options_.script);
    try {
      result = compute_->RunCommand(target, script, options_.register_timeout);
    } catch (const util::Error& e) {
      script.assign(script.size(), '\0');
      throw util::WorkerRegistrationError("worker " + target.name + " unreachable: " + e.what());
    }
    script.assign(script.size(), '\0');
  }

  if (result.timed_out) {
    throw util::WorkerRegistrationError("registering worker " + target.name + " timed out");
  }
  if (result.exit_code != 0) {
    throw util::WorkerRegistrationError("registering worker " + target.name + " failed with exit code " + std::to_string(result.exit_code) +
                                        ": " + Tail(result.stderr_text));
  }

  auto worker_id = ExtractWorkerId(result.stdout_text);
  if (!worker_id) {
    throw util::WorkerRegistrationError("could not determine worker id for " + target.name + " from registration output");
  }

  FLEET_LOG_INFO("Worker registered",
                 {StringField("fleet", fleet.name), StringField("worker", target.name), IntField("worker_id", *worker_id)});
  return *worker_id;
}

void GitHubWorkerRegistry::Deregister(const model::FleetConfig& fleet, int64_t worker_id) {
  const auto path = github::GitHubClient::RepoPath(fleet) + "/actions/runners/" + std::to_string(worker_id);

  http::HttpResponse response;
  try {
    response = client_->Delete(path);
  } catch (const util::Error& e) {
    throw util::WorkerDeregistrationError("deregistering worker " + std::to_string(worker_id) + " failed: " + e.what());
  }

  if (response.status == 404) {
    FLEET_LOG_INFO("Worker already deregistered", {StringField("fleet", fleet.name), IntField("worker_id", worker_id)});
    return;
  }
  if (!response.Ok()) {
    throw util::WorkerDeregistrationError("deregistering worker " + std::to_string(worker_id) + " rejected: " +
                                          github::GitHubClient::Describe(response));
  }
}

model::WorkerInfo GitHubWorkerRegistry::Status(const model::FleetConfig& fleet, int64_t worker_id) {
  const auto path     = github::GitHubClient::RepoPath(fleet) + "/actions/runners/" + std::to_string(worker_id);
  auto       response = client_->Get(path);

  if (response.status == 404) {
    throw util::WorkerNotFound("worker " + std::to_string(worker_id) + " not found in " + fleet.Repository());
  }
  if (!response.Ok()) {
    throw util::TransportError("worker " + std::to_string(worker_id) + " status: " + github::GitHubClient::Describe(response));
  }

  fleet::github::v1::Runner runner;
  github::GitHubClient::ParseJson(response.body, &runner);

  model::WorkerInfo info;
  info.id     = runner.id();
  info.name   = runner.name();
  info.online = runner.status() == "online";
  info.busy   = runner.busy();
  for (const auto& label : runner.labels()) {
    info.labels.push_back(label.name());
  }
  return info;
}

} // namespace fleet::registry
