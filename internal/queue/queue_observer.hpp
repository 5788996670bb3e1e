#pragma once

#include "internal/model/fleet_config.hpp"
#include "internal/model/queue_metrics.hpp"

namespace fleet::queue {

/*
  Read-only view of the CI job queue for one fleet.
  Metrics throws util::QueueObservationError when the provider cannot be
  observed within the observation deadline; callers must treat that as "no
  data", never as an empty queue.
*/
class QueueObserver {
 public:
  virtual ~QueueObserver() = default;

  virtual model::QueueMetrics Metrics(const model::FleetConfig& fleet) = 0;
};

} // namespace fleet::queue
