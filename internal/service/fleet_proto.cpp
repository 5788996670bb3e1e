#include "fleet_proto.hpp"

#include "internal/util/time.hpp"

namespace fleet::service {

fleet::v1::ScalingAction ToProto(model::ScalingAction action) {
  switch (action) {
    case model::ScalingAction::kScaleUp:
      return fleet::v1::SCALING_ACTION_SCALE_UP;
    case model::ScalingAction::kScaleDown:
      return fleet::v1::SCALING_ACTION_SCALE_DOWN;
    case model::ScalingAction::kMaintain:
      return fleet::v1::SCALING_ACTION_MAINTAIN;
  }
  return fleet::v1::SCALING_ACTION_UNSPECIFIED;
}

fleet::v1::WorkerState ToProto(model::WorkerState state) {
  // wire values mirror the domain enum
  return static_cast<fleet::v1::WorkerState>(static_cast<int>(state));
}

model::ScalingConfig FromProto(const fleet::v1::ScalingSpec& spec, const model::ScalingConfig& base) {
  model::ScalingConfig scaling = base;
  if (spec.has_min_runners()) scaling.min_runners = spec.min_runners();
  if (spec.has_max_runners()) scaling.max_runners = spec.max_runners();
  if (spec.has_jobs_per_runner()) scaling.jobs_per_runner = spec.jobs_per_runner();
  if (spec.has_scale_up_threshold()) scaling.scale_up_threshold = spec.scale_up_threshold();
  if (spec.has_scale_down_threshold()) scaling.scale_down_threshold = spec.scale_down_threshold();
  if (spec.has_cooldown_seconds()) scaling.cooldown = std::chrono::seconds(spec.cooldown_seconds());
  return scaling;
}

model::FleetDefinition FromProto(const fleet::v1::FleetSpec& spec) {
  model::FleetDefinition definition;
  definition.fleet.name       = spec.name();
  definition.fleet.repo_owner = spec.repo_owner();
  definition.fleet.repo_name  = spec.repo_name();
  definition.fleet.labels.assign(spec.labels().begin(), spec.labels().end());
  if (!spec.worker_group().empty()) {
    definition.fleet.worker_group = spec.worker_group();
  }

  definition.scaling = FromProto(spec.scaling());

  const auto& rotation               = spec.rotation();
  definition.rotation.max_worker_age = std::chrono::seconds(rotation.max_worker_age_seconds());
  if (rotation.has_max_rotations_per_tick()) definition.rotation.max_rotations_per_tick = rotation.max_rotations_per_tick();
  if (rotation.has_replace_unhealthy()) definition.rotation.replace_unhealthy = rotation.replace_unhealthy();
  definition.rotation.scale_down_order = rotation.scale_down_order() == fleet::v1::SCALE_DOWN_ORDER_NEWEST_FIRST
                                             ? model::ScaleDownOrder::kNewestFirst
                                             : model::ScaleDownOrder::kOldestFirst;

  definition.compute.size   = spec.compute().size();
  definition.compute.region = spec.compute().region();
  definition.compute.image  = spec.compute().image();
  return definition;
}

void ToProto(const model::ScalingConfig& scaling, fleet::v1::ScalingSpec* out) {
  out->set_min_runners(scaling.min_runners);
  out->set_max_runners(scaling.max_runners);
  out->set_jobs_per_runner(scaling.jobs_per_runner);
  out->set_scale_up_threshold(scaling.scale_up_threshold);
  out->set_scale_down_threshold(scaling.scale_down_threshold);
  out->set_cooldown_seconds(scaling.cooldown.count());
}

void ToProto(const model::FleetDefinition& definition, fleet::v1::FleetSpec* out) {
  out->set_name(definition.fleet.name);
  out->set_repo_owner(definition.fleet.repo_owner);
  out->set_repo_name(definition.fleet.repo_name);
  for (const auto& label : definition.fleet.labels) {
    out->add_labels(label);
  }
  out->set_worker_group(definition.fleet.worker_group.value_or(""));

  ToProto(definition.scaling, out->mutable_scaling());

  auto* rotation = out->mutable_rotation();
  rotation->set_max_worker_age_seconds(definition.rotation.max_worker_age.count());
  rotation->set_max_rotations_per_tick(definition.rotation.max_rotations_per_tick);
  rotation->set_replace_unhealthy(definition.rotation.replace_unhealthy);
  rotation->set_scale_down_order(definition.rotation.scale_down_order == model::ScaleDownOrder::kNewestFirst
                                     ? fleet::v1::SCALE_DOWN_ORDER_NEWEST_FIRST
                                     : fleet::v1::SCALE_DOWN_ORDER_OLDEST_FIRST);

  auto* compute = out->mutable_compute();
  compute->set_size(definition.compute.size);
  compute->set_region(definition.compute.region);
  compute->set_image(definition.compute.image);
}

void ToProto(const model::ScalingDecision& decision, fleet::v1::ScalingDecision* out) {
  out->set_action(ToProto(decision.action));
  out->set_target_runner_count(decision.target_runner_count);
  out->set_current_runner_count(decision.current_runner_count);
  out->set_reason(decision.reason);
}

void ToProto(const controller::ScalingEvent& event, fleet::v1::ScalingEvent* out) {
  *out->mutable_at() = util::ToProto(event.at);
  out->set_action(ToProto(event.action));
  out->set_current(event.current);
  out->set_target(event.target);
  out->set_reason(event.reason);
  out->set_source(event.source);
}

void ToProto(const controller::FleetSnapshot& snapshot, fleet::v1::FleetStatus* out) {
  ToProto(snapshot.definition, out->mutable_spec());
  out->set_running(snapshot.running);
  out->set_degraded(snapshot.degraded);
  out->set_consecutive_failed_batches(snapshot.consecutive_failed_batches);

  for (const auto& worker : snapshot.workers) {
    auto* w = out->add_workers();
    w->set_name(worker.name);
    w->set_instance_id(worker.compute.instance_id);
    w->set_worker_id(worker.worker_id.value_or(0));
    w->set_state(ToProto(worker.state));
    w->set_busy(worker.busy);
    w->set_jobs_completed(worker.jobs_completed);
    *w->mutable_created_at() = util::ToProto(worker.created_at);
    w->set_address(worker.compute.address);
  }

  out->set_provisioning_count(snapshot.provisioning);
  out->set_registered_count(snapshot.registered);
  out->set_active_count(snapshot.active);
  out->set_draining_count(snapshot.draining);

  if (snapshot.last_decision) {
    ToProto(*snapshot.last_decision, out->mutable_last_decision());
  }
  if (snapshot.last_scaling_action_time) {
    *out->mutable_last_scaling_action_time() = util::ToProto(*snapshot.last_scaling_action_time);
  }
  if (snapshot.previous_metrics) {
    auto* metrics = out->mutable_previous_metrics();
    metrics->set_pending(snapshot.previous_metrics->pending);
    metrics->set_in_progress(snapshot.previous_metrics->in_progress);
    metrics->set_queued(snapshot.previous_metrics->queued);
    metrics->set_total(snapshot.previous_metrics->total);
    *metrics->mutable_observed_at() = util::ToProto(snapshot.previous_metrics->observed_at);
  }
  out->set_last_observation_error(snapshot.last_observation_error);

  for (const auto& event : snapshot.recent_events) {
    ToProto(event, out->add_recent_events());
  }
}

} // namespace fleet::service
