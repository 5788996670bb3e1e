#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/github/github_client.hpp"
#include "internal/queue/github_queue_observer.hpp"
#include "internal/util/errors.hpp"
#include "test_doubles.hpp"

namespace {

using fleet::queue::GitHubQueueObserver;
using fleet::testing::FakeHttpClient;

const std::string kBase   = "https://api.github.com/repos/acme/widgets/actions/runs";
const std::string kQueued = kBase + "?status=queued&per_page=100&page=1";
const std::string kActive = kBase + "?status=in_progress&per_page=100&page=1";

std::string JobsUrl(int64_t run_id, int page = 1) {
  return kBase + "/" + std::to_string(run_id) + "/jobs?per_page=100&page=" + std::to_string(page);
}

// Runs first..last inclusive, as a workflow_runs listing.
std::string RunsBody(int64_t total, int64_t first, int64_t last) {
  std::string body = R"({"total_count": )" + std::to_string(total) + R"(, "workflow_runs": [)";
  for (int64_t id = first; id <= last; ++id) {
    if (id != first) body += ", ";
    body += R"({"id": )" + std::to_string(id) + R"(, "status": "queued"})";
  }
  return body + "]}";
}

std::string QueuedJobsBody(int64_t total, int64_t first, int64_t last) {
  std::string body = R"({"total_count": )" + std::to_string(total) + R"(, "jobs": [)";
  for (int64_t id = first; id <= last; ++id) {
    if (id != first) body += ", ";
    body += R"({"id": )" + std::to_string(id) + R"(, "status": "queued", "labels": ["self-hosted", "linux"]})";
  }
  return body + "]}";
}

struct Harness {
  std::shared_ptr<FakeHttpClient>      http = std::make_shared<FakeHttpClient>();
  std::shared_ptr<GitHubQueueObserver> observer;

  Harness() {
    auto client = std::make_shared<fleet::github::GitHubClient>(http, "ghp_testtoken0001", fleet::github::GitHubClientOptions{},
                                                               [](std::chrono::milliseconds) {});
    observer    = std::make_shared<GitHubQueueObserver>(client, std::chrono::seconds(5));
  }
};

void TestCountsOnlyJobsRequiringEveryFleetLabel() {
  Harness h;
  h.http->Respond("GET", kQueued, 200, R"({"total_count": 2, "workflow_runs": [{"id": 11, "status": "queued"}, {"id": 12, "status": "queued"}]})");
  h.http->Respond("GET", kActive, 200, R"({"total_count": 1, "workflow_runs": [{"id": 12, "status": "in_progress"}, {"id": 13}]})");
  h.http->Respond("GET", JobsUrl(11), 200, R"({"jobs": [
      {"id": 1, "status": "queued", "labels": ["self-hosted", "Linux", "x64"]},
      {"id": 2, "status": "queued", "labels": ["self-hosted"]},
      {"id": 3, "status": "waiting", "labels": ["linux", "self-hosted"]}]})");
  h.http->Respond("GET", JobsUrl(12), 200, R"({"jobs": [
      {"id": 4, "status": "in_progress", "labels": ["self-hosted", "linux"]},
      {"id": 5, "status": "completed", "labels": ["self-hosted", "linux"]},
      {"id": 6, "status": "queued", "labels": ["ubuntu-latest"]}]})");
  // run 13 finished and was pruned between the two listings
  h.http->Respond("GET", JobsUrl(13), 404, R"({"message": "Not Found"})");

  const auto def     = fleet::testing::MakeDefinition();
  const auto metrics = h.observer->Metrics(def.fleet);

  assert(metrics.queued == 1);
  assert(metrics.pending == 2);
  assert(metrics.in_progress == 1);
  assert(metrics.total == 3);
  assert(metrics.NeedsScaling());

  // run 12 appears in both listings but is read once
  assert(h.http->CountRequests("GET", JobsUrl(12)) == 1);
}

void TestFollowsEveryPage() {
  Harness h;
  h.http->Respond("GET", kQueued, 200, RunsBody(101, 1, 100));
  h.http->Respond("GET", kBase + "?status=queued&per_page=100&page=2", 200, RunsBody(101, 101, 101));
  h.http->Respond("GET", kActive, 200, R"({"total_count": 0, "workflow_runs": []})");
  // runs 1..99 have no jobs listing left; run 100 has one job, run 101 spans two pages
  h.http->Respond("GET", JobsUrl(100), 200, QueuedJobsBody(1, 1, 1));
  h.http->Respond("GET", JobsUrl(101), 200, QueuedJobsBody(101, 1, 100));
  h.http->Respond("GET", JobsUrl(101, 2), 200, QueuedJobsBody(101, 101, 101));

  const auto metrics = h.observer->Metrics(fleet::testing::MakeDefinition().fleet);
  assert(metrics.queued == 102);
  assert(metrics.pending == 102);

  assert(h.http->CountRequests("GET", kBase + "?status=queued&per_page=100&page=2") == 1);
  assert(h.http->CountRequests("GET", kBase + "?status=queued&per_page=100&page=3") == 0);
  assert(h.http->CountRequests("GET", kBase + "?status=in_progress&per_page=100&page=2") == 0);
  assert(h.http->CountRequests("GET", JobsUrl(100, 2)) == 0);
  assert(h.http->CountRequests("GET", JobsUrl(101, 3)) == 0);
}

void TestEmptyQueue() {
  Harness h;
  h.http->Respond("GET", kQueued, 200, R"({"total_count": 0, "workflow_runs": []})");
  h.http->Respond("GET", kActive, 200, R"({"total_count": 0, "workflow_runs": []})");

  const auto metrics = h.observer->Metrics(fleet::testing::MakeDefinition().fleet);
  assert(metrics.pending == 0);
  assert(metrics.total == 0);
  assert(!metrics.NeedsScaling());
}

void TestProviderErrorIsObservationError() {
  Harness h;
  h.http->Respond("GET", kQueued, 500, R"({"message": "Server Error"})");

  bool threw = false;
  try {
    h.observer->Metrics(fleet::testing::MakeDefinition().fleet);
  } catch (const fleet::util::QueueObservationError& e) {
    threw = std::string(e.what()).find("HTTP 500") != std::string::npos;
  }
  assert(threw);
}

void TestTransportFailureIsObservationError() {
  Harness h;
  h.http->Respond("GET", kQueued, 200, R"({"workflow_runs": [{"id": 11}]})");
  h.http->Respond("GET", kActive, 200, R"({"workflow_runs": []})");
  h.http->FailWith("GET", JobsUrl(11), "connection reset by peer");

  bool threw = false;
  try {
    h.observer->Metrics(fleet::testing::MakeDefinition().fleet);
  } catch (const fleet::util::QueueObservationError&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedBodyIsObservationError() {
  Harness h;
  h.http->Respond("GET", kQueued, 200, "<html>unicorn</html>");

  bool threw = false;
  try {
    h.observer->Metrics(fleet::testing::MakeDefinition().fleet);
  } catch (const fleet::util::QueueObservationError&) {
    threw = true;
  }
  assert(threw);
}

void TestLabelMatchIsSubsetAndCaseInsensitive() {
  assert(GitHubQueueObserver::LabelsSatisfied({"self-hosted", "Linux", "GPU"}, {"linux", "gpu"}));
  assert(!GitHubQueueObserver::LabelsSatisfied({"self-hosted"}, {"self-hosted", "linux"}));
  assert(GitHubQueueObserver::LabelsSatisfied({"anything"}, {}));
}

} // namespace

int main() {
  TestCountsOnlyJobsRequiringEveryFleetLabel();
  TestFollowsEveryPage();
  TestEmptyQueue();
  TestProviderErrorIsObservationError();
  TestTransportFailureIsObservationError();
  TestMalformedBodyIsObservationError();
  TestLabelMatchIsSubsetAndCaseInsensitive();

  std::cout << "runner_fleet_unit_github_queue_observer: pass\n";
  return 0;
}
