#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "fleet/github/v1/github.pb.h"
#include "internal/github/github_client.hpp"
#include "internal/util/errors.hpp"
#include "test_doubles.hpp"

namespace {

using fleet::github::GitHubClient;
using fleet::github::GitHubClientOptions;
using fleet::testing::FakeHttpClient;

constexpr const char* kRunsUrl = "https://api.github.com/repos/acme/widgets/actions/runs";

struct Harness {
  std::shared_ptr<FakeHttpClient>        http = std::make_shared<FakeHttpClient>();
  std::vector<std::chrono::milliseconds> sleeps;
  std::unique_ptr<GitHubClient>          client;

  explicit Harness(GitHubClientOptions options = {}) {
    client = std::make_unique<GitHubClient>(http, "ghp_testtoken0001", options,
                                            [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
  }
};

std::string HeaderValue(const fleet::http::HttpRequest& request, const std::string& name) {
  for (const auto& [key, value] : request.headers) {
    if (key == name) return value;
  }
  return {};
}

void TestRequestsCarryProviderHeaders() {
  Harness h;
  h.http->Respond("GET", kRunsUrl, 200, "{}");

  const auto response = h.client->Get("/repos/acme/widgets/actions/runs");
  assert(response.status == 200);

  const auto requests = h.http->Requests();
  assert(requests.size() == 1);
  assert(HeaderValue(requests[0], "Authorization") == "Bearer ghp_testtoken0001");
  assert(HeaderValue(requests[0], "Accept") == "application/vnd.github+json");
  assert(HeaderValue(requests[0], "X-GitHub-Api-Version") == "2022-11-28");
  assert(HeaderValue(requests[0], "User-Agent") == "runner-fleet");
  assert(HeaderValue(requests[0], "Content-Type").empty());
  assert(requests[0].timeout.count() > 0);
  assert(requests[0].timeout <= std::chrono::milliseconds(30'000));
}

void TestPostSetsJsonContentType() {
  Harness h;
  const std::string url = "https://api.github.com/repos/acme/widgets/actions/runners/registration-token";
  h.http->Respond("POST", url, 201, R"({"token":"x"})");

  h.client->Post("/repos/acme/widgets/actions/runners/registration-token", "{}");
  const auto requests = h.http->Requests();
  assert(requests[0].method == "POST");
  assert(requests[0].body == "{}");
  assert(HeaderValue(requests[0], "Content-Type") == "application/json");
}

void TestRateLimitHonoursRetryAfter() {
  Harness h;
  h.http->Respond("GET", kRunsUrl, 429, "{}", {{"retry-after", "2"}});
  h.http->Respond("GET", kRunsUrl, 200, "{}");

  const auto response = h.client->Get("/repos/acme/widgets/actions/runs");
  assert(response.status == 200);
  assert(h.sleeps.size() == 1);
  assert(h.sleeps[0] == std::chrono::seconds(2));
  assert(h.http->CountRequests("GET", kRunsUrl) == 2);
}

void TestSecondaryRateLimitBacksOffExponentially() {
  Harness h;
  h.http->Respond("GET", kRunsUrl, 403, "{}", {{"x-ratelimit-remaining", "0"}});
  h.http->Respond("GET", kRunsUrl, 403, "{}", {{"x-ratelimit-remaining", "0"}});
  h.http->Respond("GET", kRunsUrl, 200, "{}");

  const auto response = h.client->Get("/repos/acme/widgets/actions/runs");
  assert(response.status == 200);
  assert(h.sleeps.size() == 2);
  assert(h.sleeps[0] == std::chrono::milliseconds(1'000));
  assert(h.sleeps[1] == std::chrono::milliseconds(2'000));
}

void TestPlainForbiddenIsNotRetried() {
  Harness h;
  h.http->Respond("GET", kRunsUrl, 403, R"({"message":"Resource not accessible by integration"})");

  const auto response = h.client->Get("/repos/acme/widgets/actions/runs");
  assert(response.status == 403);
  assert(h.sleeps.empty());
  assert(GitHubClient::Describe(response) == "HTTP 403: Resource not accessible by integration");
}

void TestRetryBudgetReturnsLastResponse() {
  GitHubClientOptions options;
  options.max_rate_limit_retries = 2;
  Harness h(options);
  h.http->Respond("GET", kRunsUrl, 429, "{}");

  const auto response = h.client->Get("/repos/acme/widgets/actions/runs");
  assert(response.status == 429);
  assert(h.http->CountRequests("GET", kRunsUrl) == 3);
  assert(h.sleeps.size() == 2);
}

void TestBackoffPastDeadlineGivesUp() {
  Harness h;
  h.http->Respond("GET", kRunsUrl, 429, "{}", {{"retry-after", "10"}});

  const auto response = h.client->Get("/repos/acme/widgets/actions/runs", std::chrono::milliseconds(500));
  assert(response.status == 429);
  assert(h.sleeps.empty());
  assert(h.http->CountRequests("GET", kRunsUrl) == 1);
}

void TestTransportErrorsPropagate() {
  Harness h;
  h.http->FailWith("GET", kRunsUrl, "connection reset");
  bool threw = false;
  try {
    h.client->Get("/repos/acme/widgets/actions/runs");
  } catch (const fleet::util::TransportError& e) {
    threw = std::string(e.what()).find("connection reset") != std::string::npos;
  }
  assert(threw);
}

void TestBaseUrlMustBeHttps() {
  GitHubClientOptions options;
  options.api_base_url = "http://api.github.com";
  bool threw           = false;
  try {
    GitHubClient client(std::make_shared<FakeHttpClient>(), "t", options);
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  options.api_base_url = "https://ghe.example.com/api/v3/";
  Harness h(options);
  assert(h.client->Options().api_base_url == "https://ghe.example.com/api/v3");
}

void TestParseJson() {
  fleet::github::v1::Runner runner;
  GitHubClient::ParseJson(R"({"id": 7, "name": "ci-1", "status": "online", "busy": true, "extra": {"a": 1},
                              "labels": [{"id": 1, "name": "self-hosted", "type": "read-only"}]})",
                          &runner);
  assert(runner.id() == 7);
  assert(runner.busy());
  assert(runner.labels_size() == 1);

  bool threw = false;
  try {
    GitHubClient::ParseJson("<html>bad gateway</html>", &runner);
  } catch (const fleet::util::TransportError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRequestsCarryProviderHeaders();
  TestPostSetsJsonContentType();
  TestRateLimitHonoursRetryAfter();
  TestSecondaryRateLimitBacksOffExponentially();
  TestPlainForbiddenIsNotRetried();
  TestRetryBudgetReturnsLastResponse();
  TestBackoffPastDeadlineGivesUp();
  TestTransportErrorsPropagate();
  TestBaseUrlMustBeHttps();
  TestParseJson();

  std::cout << "runner_fleet_unit_github_client: pass\n";
  return 0;
}
