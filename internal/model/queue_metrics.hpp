#pragma once

#include "internal/util/time.hpp"

namespace fleet::model {

/*
  Jobs waiting for or running on workers with the fleet's labels, as observed
  at observed_at. Created fresh every tick.
*/
struct QueueMetrics {
  int pending     = 0;
  int in_progress = 0;
  int queued      = 0;
  int total       = 0;

  util::TimePoint observed_at{};

  bool NeedsScaling() const {
    return pending > 0 || queued > 0;
  }
};

} // namespace fleet::model
