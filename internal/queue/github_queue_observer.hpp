#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/github/github_client.hpp"
#include "internal/queue/queue_observer.hpp"

namespace fleet::queue {

/*
  Job queue depth from the GitHub Actions runs API.

  Lists workflow runs that are queued or in progress, then the jobs of each
  run. A job counts for the fleet only when it requires every label the fleet
  advertises. Every listing is read page by page (100 entries each) within
  the one observation deadline.
*/
class GitHubQueueObserver final : public QueueObserver {
 public:
  explicit GitHubQueueObserver(std::shared_ptr<github::GitHubClient> client,
                               std::chrono::milliseconds             timeout = std::chrono::seconds(30));

  model::QueueMetrics Metrics(const model::FleetConfig& fleet) override;

  // Case-insensitive: every fleet label must appear among the job labels.
  static bool LabelsSatisfied(const std::vector<std::string>& job_labels, const std::vector<std::string>& fleet_labels);

 private:
  model::QueueMetrics Observe(const model::FleetConfig& fleet);

  std::shared_ptr<github::GitHubClient> client_;
  std::chrono::milliseconds             timeout_;
};

} // namespace fleet::queue
