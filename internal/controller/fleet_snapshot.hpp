#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/fleet_config.hpp"
#include "internal/model/queue_metrics.hpp"
#include "internal/model/scaling_decision.hpp"
#include "internal/model/worker.hpp"
#include "internal/util/time.hpp"

namespace fleet::controller {

struct ScalingEvent {
  util::TimePoint      at{};
  model::ScalingAction action = model::ScalingAction::kMaintain;
  int                  current = 0;
  int                  target  = 0;
  std::string          reason;
  std::string          source; // policy | manual
};

/*
  Immutable copy of a controller's state, published after every change.
  Readers never touch the live state.
*/
struct FleetSnapshot {
  model::FleetDefinition              definition;
  bool                                running                    = false;
  bool                                degraded                   = false;
  int                                 consecutive_failed_batches = 0;
  std::vector<model::EphemeralWorker> workers;

  int provisioning = 0;
  int registered   = 0;
  int active       = 0;
  int draining     = 0;

  std::optional<model::ScalingDecision> last_decision;
  std::optional<util::TimePoint>        last_scaling_action_time;
  std::optional<model::QueueMetrics>    previous_metrics;
  std::string                           last_observation_error;

  // newest first
  std::vector<ScalingEvent> recent_events;
};

} // namespace fleet::controller
