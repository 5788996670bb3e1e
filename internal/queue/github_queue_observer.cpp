#include "github_queue_observer.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <string>

#include "fleet/github/v1/github.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::queue {

using observability::IntField;
using observability::StringField;

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr int kPageSize = 100;

std::string PageQuery(int page) {
  return "per_page=" + std::to_string(kPageSize) + "&page=" + std::to_string(page);
}

// A short page, or the advertised total reached, ends a listing.
bool LastPage(int entries, int64_t collected, int64_t total_count) {
  return entries < kPageSize || (total_count > 0 && collected >= total_count);
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::chrono::milliseconds Remaining(SteadyClock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
  if (left.count() <= 0) {
    throw util::DeadlineExceeded("queue observation deadline exceeded");
  }
  return left;
}

} // namespace

GitHubQueueObserver::GitHubQueueObserver(std::shared_ptr<github::GitHubClient> client, std::chrono::milliseconds timeout)
    : client_(std::move(client)), timeout_(timeout) {
}

bool GitHubQueueObserver::LabelsSatisfied(const std::vector<std::string>& job_labels, const std::vector<std::string>& fleet_labels) {
  std::set<std::string> offered;
  for (const auto& label : job_labels) {
    offered.insert(Lower(label));
  }
  return std::all_of(fleet_labels.begin(), fleet_labels.end(), [&](const std::string& label) { return offered.count(Lower(label)) > 0; });
}

model::QueueMetrics GitHubQueueObserver::Metrics(const model::FleetConfig& fleet) {
  try {
    return Observe(fleet);
  } catch (const util::QueueObservationError&) {
    throw;
  } catch (const util::Error& e) {
    throw util::QueueObservationError("observing queue for " + fleet.Repository() + " failed: " + e.what());
  }
}

model::QueueMetrics GitHubQueueObserver::Observe(const model::FleetConfig& fleet) {
  const auto deadline = SteadyClock::now() + timeout_;
  const auto repo     = github::GitHubClient::RepoPath(fleet);

  std::vector<int64_t> run_ids;
  std::set<int64_t>    seen;
  for (const char* status : {"queued", "in_progress"}) {
    int64_t collected = 0;
    for (int page = 1;; ++page) {
      auto response = client_->Get(repo + "/actions/runs?status=" + status + "&" + PageQuery(page), Remaining(deadline));
      if (!response.Ok()) {
        throw util::QueueObservationError("listing " + std::string(status) + " runs for " + fleet.Repository() + ": " +
                                          github::GitHubClient::Describe(response));
      }

      fleet::github::v1::WorkflowRunList runs;
      github::GitHubClient::ParseJson(response.body, &runs);
      for (const auto& run : runs.workflow_runs()) {
        if (seen.insert(run.id()).second) {
          run_ids.push_back(run.id());
        }
      }
      collected += runs.workflow_runs_size();
      if (LastPage(runs.workflow_runs_size(), collected, runs.total_count())) break;
    }
  }

  model::QueueMetrics metrics;
  for (int64_t run_id : run_ids) {
    int64_t collected = 0;
    for (int page = 1;; ++page) {
      auto response = client_->Get(repo + "/actions/runs/" + std::to_string(run_id) + "/jobs?" + PageQuery(page), Remaining(deadline));
      if (response.status == 404) {
        // Run finished and was pruned between the listings.
        break;
      }
      if (!response.Ok()) {
        throw util::QueueObservationError("listing jobs of run " + std::to_string(run_id) + ": " + github::GitHubClient::Describe(response));
      }

      fleet::github::v1::WorkflowJobList jobs;
      github::GitHubClient::ParseJson(response.body, &jobs);
      for (const auto& job : jobs.jobs()) {
        std::vector<std::string> labels(job.labels().begin(), job.labels().end());
        if (!LabelsSatisfied(labels, fleet.labels)) {
          continue;
        }

        const auto& status = job.status();
        if (status == "queued") {
          ++metrics.queued;
          ++metrics.pending;
        } else if (status == "waiting" || status == "pending" || status == "requested") {
          ++metrics.pending;
        } else if (status == "in_progress") {
          ++metrics.in_progress;
        }
      }
      collected += jobs.jobs_size();
      if (LastPage(jobs.jobs_size(), collected, jobs.total_count())) break;
    }
  }

  metrics.total       = metrics.pending + metrics.in_progress;
  metrics.observed_at = util::Now();

  FLEET_LOG_DEBUG("Queue observed", {StringField("fleet", fleet.name), IntField("runs", static_cast<int64_t>(run_ids.size())),
                                     IntField("pending", metrics.pending), IntField("in_progress", metrics.in_progress)});
  return metrics;
}

} // namespace fleet::queue
