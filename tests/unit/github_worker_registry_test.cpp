#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/github/github_client.hpp"
#include "internal/registry/github_worker_registry.hpp"
#include "internal/util/errors.hpp"
#include "test_doubles.hpp"

namespace {

using fleet::registry::GitHubWorkerRegistry;
using fleet::testing::FakeCompute;
using fleet::testing::FakeHttpClient;

const std::string kRunners  = "https://api.github.com/repos/acme/widgets/actions/runners";
const std::string kTokenUrl = kRunners + "/registration-token";

struct Harness {
  std::shared_ptr<FakeHttpClient>       http    = std::make_shared<FakeHttpClient>();
  std::shared_ptr<FakeCompute>          compute = std::make_shared<FakeCompute>();
  std::shared_ptr<GitHubWorkerRegistry> registry;
  fleet::model::FleetDefinition         def = fleet::testing::MakeDefinition();

  Harness() {
    auto client = std::make_shared<fleet::github::GitHubClient>(http, "ghp_testtoken0001", fleet::github::GitHubClientOptions{},
                                                               [](std::chrono::milliseconds) {});
    fleet::registry::GitHubRegistryOptions options;
    options.register_timeout = std::chrono::seconds(120);
    registry                 = std::make_shared<GitHubWorkerRegistry>(client, compute, options);
  }

  fleet::model::ComputeHandle Target() {
    fleet::model::ComputeHandle handle;
    handle.instance_id = "i-9";
    handle.name        = "ci-abc123";
    handle.address     = "10.0.0.9";
    return handle;
  }
};

template <class E, class Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestRegistrationTokenParsed() {
  Harness h;
  h.http->Respond("POST", kTokenUrl, 201, R"({"token": "AABBCCREGTOKEN", "expires_at": "2099-01-01T00:00:00Z"})");

  const auto token = h.registry->GetRegistrationToken(h.def.fleet);
  assert(token.Value() == "AABBCCREGTOKEN");
  assert(token.ExpiresAt() == fleet::util::FromUnixMillis(4070908800000ULL));
}

void TestRegistrationTokenWithoutExpiryIsShortLived() {
  Harness h;
  h.http->Respond("POST", kTokenUrl, 201, R"({"token": "AABBCCREGTOKEN"})");

  const auto token = h.registry->GetRegistrationToken(h.def.fleet);
  assert(!token.ExpiredAt(fleet::util::Now()));
  assert(token.ExpiredAt(fleet::util::Now() + std::chrono::minutes(6)));
}

void TestRegistrationTokenFailures() {
  Harness h;
  h.http->Respond("POST", kTokenUrl, 403, R"({"message": "Must have admin rights to Repository."})");
  assert(Throws<fleet::util::RegistrationTokenError>([&] { h.registry->GetRegistrationToken(h.def.fleet); }));

  Harness empty;
  empty.http->Respond("POST", kTokenUrl, 201, R"({"expires_at": "2099-01-01T00:00:00Z"})");
  assert(Throws<fleet::util::RegistrationTokenError>([&] { empty.registry->GetRegistrationToken(empty.def.fleet); }));

  Harness down;
  down.http->FailWith("POST", kTokenUrl, "could not resolve host");
  assert(Throws<fleet::util::RegistrationTokenError>([&] { down.registry->GetRegistrationToken(down.def.fleet); }));
}

void TestRegisterRunsScriptOnTarget() {
  Harness h;
  fleet::model::RegistrationToken token("AABBCCREGTOKEN", fleet::util::Now() + std::chrono::hours(1));

  const auto id = h.registry->Register(h.Target(), h.def.fleet, std::move(token));
  assert(id == 4242);
  assert(h.compute->command_calls == 1);
  assert(h.compute->last_target == "i-9");
  assert(h.compute->last_timeout == std::chrono::seconds(120));
  assert(h.compute->last_script.find("--ephemeral") != std::string::npos);
}

void TestRegisterRejectsExpiredToken() {
  Harness h;
  fleet::model::RegistrationToken token("AABBCCREGTOKEN", fleet::util::Now() - std::chrono::seconds(1));
  assert(Throws<fleet::util::WorkerRegistrationError>([&] { h.registry->Register(h.Target(), h.def.fleet, std::move(token)); }));
  assert(h.compute->command_calls == 0);
}

void TestRegisterFailures() {
  Harness h;
  h.compute->command_result = {1, "", "Http response code: NotFound from 'POST https://api.github.com/actions/runner-registration'", false};
  fleet::model::RegistrationToken token("AABBCCREGTOKEN", fleet::util::Now() + std::chrono::hours(1));
  bool                            failed = false;
  try {
    h.registry->Register(h.Target(), h.def.fleet, std::move(token));
  } catch (const fleet::util::WorkerRegistrationError& e) {
    failed = std::string(e.what()).find("exit code 1") != std::string::npos;
  }
  assert(failed);

  Harness unreachable;
  unreachable.compute->unreachable = true;
  fleet::model::RegistrationToken token2("AABBCCREGTOKEN", fleet::util::Now() + std::chrono::hours(1));
  assert(Throws<fleet::util::WorkerRegistrationError>(
      [&] { unreachable.registry->Register(unreachable.Target(), unreachable.def.fleet, std::move(token2)); }));

  Harness no_id;
  no_id.compute->command_result = {0, "configured", "", false};
  fleet::model::RegistrationToken token3("AABBCCREGTOKEN", fleet::util::Now() + std::chrono::hours(1));
  assert(Throws<fleet::util::WorkerRegistrationError>([&] { no_id.registry->Register(no_id.Target(), no_id.def.fleet, std::move(token3)); }));

  Harness timed_out;
  timed_out.compute->command_result = {-1, "", "", true};
  fleet::model::RegistrationToken token4("AABBCCREGTOKEN", fleet::util::Now() + std::chrono::hours(1));
  assert(Throws<fleet::util::WorkerRegistrationError>(
      [&] { timed_out.registry->Register(timed_out.Target(), timed_out.def.fleet, std::move(token4)); }));
}

void TestDeregisterIsIdempotent() {
  Harness h;
  h.http->Respond("DELETE", kRunners + "/42", 204);
  h.registry->Deregister(h.def.fleet, 42);

  h.http->Respond("DELETE", kRunners + "/43", 404, R"({"message": "Not Found"})");
  h.registry->Deregister(h.def.fleet, 43);

  h.http->Respond("DELETE", kRunners + "/44", 422, R"({"message": "Runner is busy"})");
  assert(Throws<fleet::util::WorkerDeregistrationError>([&] { h.registry->Deregister(h.def.fleet, 44); }));

  h.http->FailWith("DELETE", kRunners + "/45", "timeout");
  assert(Throws<fleet::util::WorkerDeregistrationError>([&] { h.registry->Deregister(h.def.fleet, 45); }));
}

void TestStatus() {
  Harness h;
  h.http->Respond("GET", kRunners + "/42", 200,
                  R"({"id": 42, "name": "ci-abc123", "os": "linux", "status": "online", "busy": true,
                      "labels": [{"id": 1, "name": "self-hosted"}, {"id": 2, "name": "linux"}]})");
  const auto info = h.registry->Status(h.def.fleet, 42);
  assert(info.id == 42);
  assert(info.online);
  assert(info.busy);
  assert(info.labels.size() == 2);

  h.http->Respond("GET", kRunners + "/43", 200, R"({"id": 43, "status": "offline", "busy": false})");
  assert(!h.registry->Status(h.def.fleet, 43).online);

  assert(Throws<fleet::util::WorkerNotFound>([&] { h.registry->Status(h.def.fleet, 99); }));

  h.http->Respond("GET", kRunners + "/50", 502, "");
  assert(Throws<fleet::util::TransportError>([&] { h.registry->Status(h.def.fleet, 50); }));
}

} // namespace

int main() {
  TestRegistrationTokenParsed();
  TestRegistrationTokenWithoutExpiryIsShortLived();
  TestRegistrationTokenFailures();
  TestRegisterRunsScriptOnTarget();
  TestRegisterRejectsExpiredToken();
  TestRegisterFailures();
  TestDeregisterIsIdempotent();
  TestStatus();

  std::cout << "runner_fleet_unit_github_worker_registry: pass\n";
  return 0;
}
