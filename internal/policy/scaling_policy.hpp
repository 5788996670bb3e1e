#pragma once

#include <optional>

#include "internal/model/fleet_config.hpp"
#include "internal/model/queue_metrics.hpp"
#include "internal/model/scaling_decision.hpp"
#include "internal/util/time.hpp"

namespace fleet::policy {

/*
  Pure scaling decision: no I/O, no clock reads, no state.

  Decide:
    cooldown active                          -> maintain
    target = clamp(ceil(pending / jpr), min, max)
    target > current + scale_up_threshold    -> scale_up
    target < current - scale_down_threshold  -> scale_down
    otherwise                                -> maintain

  DecideManual clamps an operator request and skips the dead band.
  Both throw util::InvalidArgument for negative counts or jobs_per_runner <= 0.
*/
class ScalingPolicy {
 public:
  static model::ScalingDecision Decide(const model::QueueMetrics& metrics, int current_count, const model::ScalingConfig& config,
                                       std::optional<util::TimePoint> last_action_time, util::TimePoint now);

  static model::ScalingDecision DecideManual(int requested, int current_count, const model::ScalingConfig& config,
                                             std::optional<util::TimePoint> last_action_time, util::TimePoint now);

  static int TargetFor(int pending, const model::ScalingConfig& config);
  static int Clamp(int count, const model::ScalingConfig& config);
};

} // namespace fleet::policy
