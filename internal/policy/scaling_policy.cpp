#include "scaling_policy.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace fleet::policy {

namespace {

void CheckInputs(int current_count, const model::ScalingConfig& config) {
  if (current_count < 0) {
    throw util::InvalidArgument("current runner count must be >= 0, got " + std::to_string(current_count));
  }
  if (config.jobs_per_runner <= 0) {
    throw util::InvalidArgument("jobs_per_runner must be > 0, got " + std::to_string(config.jobs_per_runner));
  }
}

std::optional<model::ScalingDecision> Cooldown(int current_count, const model::ScalingConfig& config,
                                               std::optional<util::TimePoint> last_action_time, util::TimePoint now) {
  if (!last_action_time) {
    return std::nullopt;
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - *last_action_time);
  if (elapsed >= config.cooldown) {
    return std::nullopt;
  }

  model::ScalingDecision decision;
  decision.action               = model::ScalingAction::kMaintain;
  decision.target_runner_count  = current_count;
  decision.current_runner_count = current_count;
  decision.reason = "cooldown active (" + std::to_string((config.cooldown - elapsed).count()) + "s remaining)";
  return decision;
}

} // namespace

int ScalingPolicy::Clamp(int count, const model::ScalingConfig& config) {
  return std::max(config.min_runners, std::min(config.max_runners, count));
}

int ScalingPolicy::TargetFor(int pending, const model::ScalingConfig& config) {
  const int wanted = (pending + config.jobs_per_runner - 1) / config.jobs_per_runner;
  return Clamp(wanted, config);
}

model::ScalingDecision ScalingPolicy::Decide(const model::QueueMetrics& metrics, int current_count, const model::ScalingConfig& config,
                                             std::optional<util::TimePoint> last_action_time, util::TimePoint now) {
  CheckInputs(current_count, config);
  if (metrics.pending < 0) {
    throw util::InvalidArgument("pending job count must be >= 0, got " + std::to_string(metrics.pending));
  }
  if (auto cooling = Cooldown(current_count, config, last_action_time, now)) {
    return *cooling;
  }

  model::ScalingDecision decision;
  decision.current_runner_count = current_count;
  decision.target_runner_count  = TargetFor(metrics.pending, config);

  const auto pending = std::to_string(metrics.pending);
  const auto target  = std::to_string(decision.target_runner_count);
  const auto current = std::to_string(current_count);

  if (decision.target_runner_count > current_count + config.scale_up_threshold) {
    decision.action = model::ScalingAction::kScaleUp;
    decision.reason = "scale up: " + pending + " pending jobs need " + target + " runners, have " + current;
  } else if (decision.target_runner_count < current_count - config.scale_down_threshold) {
    decision.action = model::ScalingAction::kScaleDown;
    decision.reason = "scale down: " + pending + " pending jobs need " + target + " runners, have " + current;
  } else {
    decision.action = model::ScalingAction::kMaintain;
    decision.reason = "within thresholds: " + pending + " pending jobs, target " + target + ", have " + current;
  }
  return decision;
}

model::ScalingDecision ScalingPolicy::DecideManual(int requested, int current_count, const model::ScalingConfig& config,
                                                   std::optional<util::TimePoint> last_action_time, util::TimePoint now) {
  CheckInputs(current_count, config);
  if (requested < 0) {
    throw util::InvalidArgument("requested runner count must be >= 0, got " + std::to_string(requested));
  }
  if (auto cooling = Cooldown(current_count, config, last_action_time, now)) {
    return *cooling;
  }

  model::ScalingDecision decision;
  decision.current_runner_count = current_count;
  decision.target_runner_count  = Clamp(requested, config);

  const auto detail = "requested " + std::to_string(requested) + ", target " + std::to_string(decision.target_runner_count) + ", have " +
                      std::to_string(current_count);
  if (decision.target_runner_count > current_count) {
    decision.action = model::ScalingAction::kScaleUp;
    decision.reason = "manual scale up: " + detail;
  } else if (decision.target_runner_count < current_count) {
    decision.action = model::ScalingAction::kScaleDown;
    decision.reason = "manual scale down: " + detail;
  } else {
    decision.action = model::ScalingAction::kMaintain;
    decision.reason = "manual scale: already at " + std::to_string(current_count);
  }
  return decision;
}

} // namespace fleet::policy
