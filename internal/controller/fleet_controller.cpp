#include "fleet_controller.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/policy/scaling_policy.hpp"
#include "internal/util/errors.hpp"

namespace fleet::controller {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

FleetController::FleetController(model::FleetDefinition definition, std::shared_ptr<queue::QueueObserver> observer,
                                 std::shared_ptr<lifecycle::FleetLifecycleManager> lifecycle,
                                 std::shared_ptr<dispatch::OperationExecutor> executor, std::shared_ptr<db::Repository> repository,
                                 ControllerOptions options, Clock clock)
    : name_(definition.fleet.name),
      definition_(std::move(definition)),
      observer_(std::move(observer)),
      lifecycle_(std::move(lifecycle)),
      executor_(std::move(executor)),
      repository_(std::move(repository)),
      options_(options),
      clock_(std::move(clock)) {
  if (!observer_ || !lifecycle_ || !executor_) {
    throw util::InvalidArgument("fleet controller requires a queue observer, lifecycle manager and executor");
  }
  if (!clock_) {
    clock_ = [] { return util::Now(); };
  }
  model::Validate(definition_);
  Publish();
}

FleetController::~FleetController() {
  if (!stopped_) {
    Stop(false);
  }
}

// ------------------------------------------------------------------
// Loop
// ------------------------------------------------------------------

void FleetController::Start() {
  if (started_ || stopped_) return;
  started_ = true;
  loop_    = std::thread(&FleetController::Loop, this);
  FLEET_LOG_INFO("Fleet started", {StringField("fleet", name_), StringField("repository", definition_.fleet.Repository())});
}

void FleetController::Loop() {
  auto next_tick = std::chrono::steady_clock::now();
  for (;;) {
    {
      std::unique_lock lock(inbox_mutex_);
      inbox_cv_.wait_until(lock, next_tick, [&] { return stop_requested_ || !inbox_.empty(); });
      if (stop_requested_) break;
    }

    ProcessInbox();

    if (std::chrono::steady_clock::now() >= next_tick) {
      try {
        RunTick();
      } catch (const std::exception& e) {
        FLEET_LOG_ERROR("Fleet tick failed", {StringField("fleet", name_), StringField("error", e.what())});
      }
      next_tick = std::chrono::steady_clock::now() + options_.tick_interval;
    }
  }
}

int FleetController::Stop(bool drain_all) {
  if (stopped_) return 0;

  {
    std::lock_guard lock(inbox_mutex_);
    stop_requested_ = true;
  }
  inbox_cv_.notify_all();
  if (loop_.joinable()) loop_.join();

  // From here on the calling thread is the writer.
  stopping_ = true;

  const auto cancelled = executor_->CancelPending(name_);
  if (cancelled > 0) {
    FLEET_LOG_INFO("Cancelled queued operations", {StringField("fleet", name_), IntField("count", static_cast<int64_t>(cancelled))});
  }
  WaitForOutstanding();

  int drained = 0;
  if (drain_all) {
    std::vector<std::string> names;
    for (const auto& [name, tracked] : tracked_) {
      names.push_back(name);
    }
    for (const auto& name : names) {
      if (DispatchDestroy(name)) {
        ++drained;
        continue;
      }
      // executor already stopped
      auto it = tracked_.find(name);
      if (it == tracked_.end()) continue;
      lifecycle_->Destroy(it->second.worker, definition_.fleet);
      tracked_.erase(it);
      ++drained;
    }
    WaitForOutstanding();
  }

  stopped_ = true;
  Publish();
  FLEET_LOG_INFO("Fleet stopped", {StringField("fleet", name_), BoolField("drained", drain_all), IntField("workers_drained", drained),
                                   IntField("workers_remaining", static_cast<int64_t>(tracked_.size()))});
  return drained;
}

void FleetController::WaitForOutstanding() {
  while (outstanding_ > 0) {
    {
      std::unique_lock lock(inbox_mutex_);
      inbox_cv_.wait(lock, [&] { return !inbox_.empty(); });
    }
    ProcessInbox();
  }
  ProcessInbox();
}

bool FleetController::Pump(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    ProcessInbox();
    if (outstanding_ == 0) return true;

    std::unique_lock lock(inbox_mutex_);
    if (!inbox_cv_.wait_until(lock, deadline, [&] { return !inbox_.empty(); })) {
      return false;
    }
  }
}

void FleetController::Post(Message message) {
  {
    std::lock_guard lock(inbox_mutex_);
    inbox_.push_back(std::move(message));
  }
  inbox_cv_.notify_all();
}

std::size_t FleetController::ProcessInbox() {
  std::deque<Message> pending;
  {
    std::lock_guard lock(inbox_mutex_);
    pending.swap(inbox_);
  }
  for (auto& message : pending) {
    Apply(message);
  }
  if (!pending.empty()) {
    Publish();
  }
  return pending.size();
}

void FleetController::Apply(Message& message) {
  std::visit([this](auto& m) { Apply(m); }, message);
}

// ------------------------------------------------------------------
// Tick
// ------------------------------------------------------------------

void FleetController::RunTick() {
  observability::SpanScope span("FleetController.Tick");
  span.SetAttribute("fleet", name_);

  ProcessInbox();
  HealthPass();
  RotationPass();

  model::QueueMetrics metrics;
  try {
    metrics = observer_->Metrics(definition_.fleet);
    last_observation_error_.clear();
  } catch (const util::Error& e) {
    span.RecordException(e.what());
    last_observation_error_ = e.what();
    FLEET_LOG_WARN("Queue observation failed, skipping decision", {StringField("fleet", name_), StringField("error", e.what())});
    Publish();
    return;
  }
  previous_metrics_ = metrics;

  const auto decision = policy::ScalingPolicy::Decide(metrics, ActiveCount(), definition_.scaling, last_action_time_, clock_());
  Act(decision, "policy");
  Publish();
}

bool FleetController::Eligible(const TrackedWorker& tracked) const {
  return tracked.purpose == Purpose::kFleet && !tracked.op_in_flight && tracked.worker.state == model::WorkerState::kActive;
}

void FleetController::HealthPass() {
  std::vector<std::string> vanished;
  std::vector<std::string> unhealthy;

  for (auto& [name, tracked] : tracked_) {
    if (!Eligible(tracked)) continue;

    const auto probe = lifecycle_->Probe(tracked.worker, definition_.fleet);
    if (!probe.reachable) {
      FLEET_LOG_DEBUG("Worker status unavailable", {StringField("fleet", name_), StringField("worker", name), StringField("error", probe.error)});
      continue;
    }
    if (!probe.found) {
      // Ephemeral workers deregister themselves after their job.
      if (tracked.worker.busy) {
        ++tracked.worker.jobs_completed;
      }
      vanished.push_back(name);
      continue;
    }
    if (!probe.online) {
      unhealthy.push_back(name);
      continue;
    }
    tracked.worker.busy = probe.busy;
  }

  for (const auto& name : vanished) {
    FLEET_LOG_INFO("Worker gone from registry, cleaning up", {StringField("fleet", name_), StringField("worker", name)});
    DispatchDestroy(name);
  }
  for (const auto& name : unhealthy) {
    FLEET_LOG_WARN("Worker offline", {StringField("fleet", name_), StringField("worker", name),
                                      BoolField("replace", definition_.rotation.replace_unhealthy)});
    if (definition_.rotation.replace_unhealthy) {
      DispatchRotate(name);
    } else {
      DispatchDestroy(name);
    }
  }
}

void FleetController::RotationPass() {
  const auto max_age = definition_.rotation.max_worker_age;
  if (max_age.count() <= 0 || definition_.rotation.max_rotations_per_tick <= 0) return;

  const auto                                now = clock_();
  std::vector<const TrackedWorker*>         expired;
  for (const auto& [name, tracked] : tracked_) {
    if (Eligible(tracked) && !tracked.worker.busy && now - tracked.worker.created_at >= max_age) {
      expired.push_back(&tracked);
    }
  }
  std::sort(expired.begin(), expired.end(),
            [](const TrackedWorker* a, const TrackedWorker* b) { return a->worker.created_at < b->worker.created_at; });

  const auto limit = std::min<std::size_t>(expired.size(), static_cast<std::size_t>(definition_.rotation.max_rotations_per_tick));
  std::vector<std::string> names;
  for (std::size_t i = 0; i < limit; ++i) {
    names.push_back(expired[i]->worker.name);
  }
  for (const auto& name : names) {
    FLEET_LOG_INFO("Rotating worker past max age", {StringField("fleet", name_), StringField("worker", name)});
    DispatchRotate(name);
  }
}

void FleetController::Act(const model::ScalingDecision& decision, const std::string& source) {
  last_decision_ = decision;
  observability::Metrics::Instance().RecordScalingDecision(name_, model::ToString(decision.action));

  int dispatched = 0;
  switch (decision.action) {
    case model::ScalingAction::kScaleUp: {
      const int count = std::max(0, decision.target_runner_count - decision.current_runner_count - InFlightScaleUps());
      if (count > 0) {
        const auto batch = next_batch_++;
        batches_[batch]  = ScaleUpBatch{count, 0, false};
        for (int i = 0; i < count; ++i) {
          DispatchProvision(Purpose::kScaleUp, batch);
        }
      }
      dispatched = count;
      break;
    }
    case model::ScalingAction::kScaleDown:
      for (const auto& name : ChooseForScaleDown(decision.current_runner_count - decision.target_runner_count)) {
        if (DispatchDestroy(name)) ++dispatched;
      }
      break;
    case model::ScalingAction::kMaintain:
      FLEET_LOG_DEBUG("Maintaining fleet size", {StringField("fleet", name_), StringField("reason", decision.reason)});
      return;
  }

  // Covered by operations already in flight; the cooldown is not restarted.
  if (dispatched == 0) {
    FLEET_LOG_DEBUG("Scaling decision needs no new operations",
                    {StringField("fleet", name_), StringField("action", model::ToString(decision.action)),
                     IntField("target", decision.target_runner_count)});
    return;
  }

  last_action_time_ = clock_();
  FLEET_LOG_INFO("Scaling decision", {StringField("fleet", name_), StringField("action", model::ToString(decision.action)),
                                      IntField("current", decision.current_runner_count), IntField("target", decision.target_runner_count),
                                      StringField("reason", decision.reason), StringField("source", source)});
  RecordEvent(decision, source);
}

void FleetController::RecordEvent(const model::ScalingDecision& decision, const std::string& source) {
  ScalingEvent event{*last_action_time_, decision.action, decision.current_runner_count, decision.target_runner_count, decision.reason,
                     source};
  recent_events_.push_front(event);
  while (recent_events_.size() > options_.event_history) {
    recent_events_.pop_back();
  }

  if (!repository_) return;
  try {
    db::model::ScalingEventRecord record;
    record.fleet   = name_;
    record.at_ms   = util::ToUnixMillis(event.at);
    record.action  = std::string(model::ToString(event.action));
    record.current = event.current;
    record.target  = event.target;
    record.reason  = event.reason;
    record.source  = event.source;

    auto tx     = repository_->Begin();
    auto result = repository_->InsertScalingEvent(*tx, record);
    if (!result) {
      FLEET_LOG_WARN("Persisting scaling event failed", {StringField("fleet", name_), StringField("error", result.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    FLEET_LOG_WARN("Persisting scaling event failed", {StringField("fleet", name_), StringField("error", e.what())});
  }
}

int FleetController::ActiveCount() const {
  return static_cast<int>(std::count_if(tracked_.begin(), tracked_.end(), [](const auto& entry) {
    const auto& tracked = entry.second;
    return tracked.purpose == Purpose::kFleet && (tracked.worker.state == model::WorkerState::kActive || tracked.rotating);
  }));
}

int FleetController::InFlightScaleUps() const {
  return static_cast<int>(
      std::count_if(tracked_.begin(), tracked_.end(), [](const auto& entry) { return entry.second.purpose == Purpose::kScaleUp; }));
}

std::vector<std::string> FleetController::ChooseForScaleDown(int count) const {
  std::vector<const TrackedWorker*> candidates;
  for (const auto& [name, tracked] : tracked_) {
    if (Eligible(tracked)) candidates.push_back(&tracked);
  }

  const bool oldest_first = definition_.rotation.scale_down_order == model::ScaleDownOrder::kOldestFirst;
  std::sort(candidates.begin(), candidates.end(), [oldest_first](const TrackedWorker* a, const TrackedWorker* b) {
    if (a->worker.busy != b->worker.busy) return !a->worker.busy;
    if (a->worker.created_at != b->worker.created_at) {
      return oldest_first ? a->worker.created_at < b->worker.created_at : a->worker.created_at > b->worker.created_at;
    }
    return a->worker.name < b->worker.name;
  });

  std::vector<std::string> chosen;
  for (const auto* tracked : candidates) {
    if (static_cast<int>(chosen.size()) >= count) break;
    chosen.push_back(tracked->worker.name);
  }
  return chosen;
}

// ------------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------------

lifecycle::FleetLifecycleManager::TransitionObserver FleetController::TransitionSink() {
  return [this](const model::EphemeralWorker& worker) { Post(WorkerTransition{worker}); };
}

bool FleetController::Submit(dispatch::Operation op) {
  try {
    executor_->Submit(std::move(op));
    ++outstanding_;
    return true;
  } catch (const util::InvalidState& e) {
    FLEET_LOG_WARN("Operation not dispatched", {StringField("fleet", name_), StringField("error", e.what())});
    return false;
  }
}

void FleetController::DispatchProvision(Purpose purpose, std::optional<uint64_t> batch) {
  TrackedWorker placeholder;
  placeholder.worker.name       = lifecycle::FleetLifecycleManager::GenerateWorkerName(definition_.fleet);
  placeholder.worker.created_at = clock_();
  placeholder.worker.state      = model::WorkerState::kProvisioning;
  placeholder.purpose           = purpose;
  placeholder.op_in_flight      = true;
  placeholder.batch             = batch;

  const auto name = placeholder.worker.name;
  tracked_[name]  = std::move(placeholder);

  dispatch::Operation op;
  op.fleet = name_;
  op.kind  = dispatch::OperationKind::kProvision;
  op.run   = [this, name, definition = definition_, sink = TransitionSink()] {
    try {
      Post(ProvisionCompleted{name, lifecycle_->Provision(definition, name, sink), {}, false});
    } catch (const std::exception& e) {
      Post(ProvisionCompleted{name, std::nullopt, e.what(), false});
    }
  };
  op.cancel = [this, name] { Post(ProvisionCompleted{name, std::nullopt, "cancelled", true}); };

  if (!Submit(std::move(op))) {
    tracked_.erase(name);
    if (batch) {
      auto it = batches_.find(*batch);
      if (it != batches_.end() && --it->second.remaining == 0) batches_.erase(it);
    }
  }
}

bool FleetController::DispatchDestroy(const std::string& name) {
  auto it = tracked_.find(name);
  if (it == tracked_.end() || it->second.op_in_flight) return false;
  it->second.op_in_flight = true;

  dispatch::Operation op;
  op.fleet = name_;
  op.kind  = dispatch::OperationKind::kDestroy;
  op.run   = [this, name, worker = it->second.worker, fleet = definition_.fleet, sink = TransitionSink()]() mutable {
    try {
      Post(DestroyCompleted{name, lifecycle_->Destroy(worker, fleet, sink), false});
    } catch (const std::exception& e) {
      lifecycle::DestroyOutcome outcome;
      outcome.errors.emplace_back(e.what());
      Post(DestroyCompleted{name, std::move(outcome), false});
    }
  };
  const auto prior = it->second.worker.state;
  op.cancel        = [this, name, prior] { Post(DestroyCompleted{name, {}, true, prior}); };

  if (!Submit(std::move(op))) {
    it->second.op_in_flight = false;
    return false;
  }
  // No longer capacity, even before the executor picks it up.
  if (!model::IsTerminal(prior)) it->second.worker.state = model::WorkerState::kDraining;
  return true;
}

void FleetController::DispatchRotate(const std::string& old_name) {
  auto it = tracked_.find(old_name);
  if (it == tracked_.end() || it->second.op_in_flight) return;
  it->second.op_in_flight = true;
  it->second.rotating     = true;

  TrackedWorker placeholder;
  placeholder.worker.name       = lifecycle::FleetLifecycleManager::GenerateWorkerName(definition_.fleet);
  placeholder.worker.created_at = clock_();
  placeholder.purpose           = Purpose::kReplacement;
  placeholder.op_in_flight      = true;
  const auto new_name           = placeholder.worker.name;

  dispatch::Operation op;
  op.fleet = name_;
  op.kind  = dispatch::OperationKind::kRotate;
  op.run   = [this, old_name, new_name, old = it->second.worker, definition = definition_, sink = TransitionSink()]() mutable {
    try {
      lifecycle::DestroyOutcome outcome;
      auto                      replacement = lifecycle_->Rotate(old, definition, new_name, &outcome, sink);
      Post(RotationCompleted{old_name, new_name, std::move(replacement), std::move(outcome), {}, false});
    } catch (const std::exception& e) {
      Post(RotationCompleted{old_name, new_name, std::nullopt, {}, e.what(), false});
    }
  };
  op.cancel = [this, old_name, new_name] { Post(RotationCompleted{old_name, new_name, std::nullopt, {}, "cancelled", true}); };

  tracked_[new_name] = std::move(placeholder);
  if (!Submit(std::move(op))) {
    tracked_.erase(new_name);
    tracked_[old_name].op_in_flight = false;
    tracked_[old_name].rotating     = false;
  }
}

// ------------------------------------------------------------------
// Results
// ------------------------------------------------------------------

void FleetController::Apply(ProvisionCompleted& done) {
  --outstanding_;

  auto it = tracked_.find(done.name);
  if (it == tracked_.end()) return;
  const auto batch = it->second.batch;

  if (done.worker) {
    TrackedWorker active;
    active.worker  = std::move(*done.worker);
    it->second     = std::move(active);
    consecutive_failed_batches_ = 0;
    if (degraded_) {
      degraded_ = false;
      FLEET_LOG_INFO("Fleet recovered from degraded state", {StringField("fleet", name_)});
    }
  } else {
    tracked_.erase(it);
    if (!done.cancelled) {
      FLEET_LOG_WARN("Provisioning failed", {StringField("fleet", name_), StringField("worker", done.name), StringField("error", done.error)});
    }
  }

  if (!batch) return;
  auto batch_it = batches_.find(*batch);
  if (batch_it == batches_.end()) return;

  auto& accounting = batch_it->second;
  if (done.worker) {
    accounting.succeeded = true;
  } else if (!done.cancelled) {
    ++accounting.failed;
  }
  if (--accounting.remaining > 0) return;

  if (!accounting.succeeded && accounting.failed > 0) {
    ++consecutive_failed_batches_;
    if (consecutive_failed_batches_ >= options_.degraded_after_failed_batches && !degraded_) {
      degraded_ = true;
      FLEET_LOG_WARN("Fleet degraded: consecutive scale-up batches failed",
                     {StringField("fleet", name_), IntField("failed_batches", consecutive_failed_batches_)});
    }
  }
  batches_.erase(batch_it);
}

void FleetController::Apply(DestroyCompleted& done) {
  --outstanding_;

  auto it = tracked_.find(done.name);
  if (it == tracked_.end()) return;
  if (done.cancelled) {
    it->second.op_in_flight = false;
    it->second.worker.state = done.prior_state;
    return;
  }

  if (!done.outcome.Clean()) {
    FLEET_LOG_WARN("Worker teardown incomplete", {StringField("fleet", name_), StringField("worker", done.name),
                                                  BoolField("deregistered", done.outcome.deregistered),
                                                  BoolField("compute_destroyed", done.outcome.compute_destroyed)});
  }
  tracked_.erase(it);
}

void FleetController::Apply(RotationCompleted& done) {
  --outstanding_;

  if (done.replacement) {
    TrackedWorker active;
    active.worker        = std::move(*done.replacement);
    tracked_[done.new_name] = std::move(active);
    tracked_.erase(done.old_name);
    if (!done.old_outcome.Clean()) {
      FLEET_LOG_WARN("Rotated worker teardown incomplete", {StringField("fleet", name_), StringField("worker", done.old_name)});
    }
    return;
  }

  tracked_.erase(done.new_name);
  auto old = tracked_.find(done.old_name);
  if (old != tracked_.end()) {
    old->second.op_in_flight = false;
    old->second.rotating     = false;
  }
  if (!done.cancelled) {
    FLEET_LOG_WARN("Rotation failed, keeping existing worker",
                   {StringField("fleet", name_), StringField("worker", done.old_name), StringField("error", done.error)});
  }
}

void FleetController::Apply(WorkerTransition& transition) {
  // Removal belongs to the completion message that follows.
  if (transition.worker.state == model::WorkerState::kDestroyed) return;

  auto it = tracked_.find(transition.worker.name);
  if (it == tracked_.end()) return;

  auto& worker = it->second.worker;
  worker.state = transition.worker.state;
  if (transition.worker.worker_id) worker.worker_id = transition.worker.worker_id;
  if (!transition.worker.compute.instance_id.empty()) worker.compute = transition.worker.compute;
}

void FleetController::Apply(ScaleCommand& command) {
  if (stopping_) {
    command.reply.set_exception(std::make_exception_ptr(util::InvalidState("fleet " + name_ + " is stopping")));
    return;
  }
  try {
    const auto decision = policy::ScalingPolicy::DecideManual(command.requested, ActiveCount(), definition_.scaling, last_action_time_,
                                                              clock_());
    Act(decision, "manual");
    Publish();
    command.reply.set_value(decision);
  } catch (const std::exception&) {
    command.reply.set_exception(std::current_exception());
  }
}

void FleetController::Apply(UpdateScalingCommand& command) {
  if (stopping_) {
    command.reply.set_exception(std::make_exception_ptr(util::InvalidState("fleet " + name_ + " is stopping")));
    return;
  }
  try {
    model::Validate(command.scaling);
    definition_.scaling = command.scaling;
    Publish();
    FLEET_LOG_INFO("Scaling configuration updated",
                   {StringField("fleet", name_), IntField("min_runners", command.scaling.min_runners),
                    IntField("max_runners", command.scaling.max_runners), IntField("jobs_per_runner", command.scaling.jobs_per_runner)});
    command.reply.set_value();
  } catch (const std::exception&) {
    command.reply.set_exception(std::current_exception());
  }
}

// ------------------------------------------------------------------
// Commands / snapshot
// ------------------------------------------------------------------

std::future<model::ScalingDecision> FleetController::RequestScale(int requested) {
  ScaleCommand command;
  command.requested = requested;
  auto future       = command.reply.get_future();
  Post(std::move(command));
  return future;
}

std::future<void> FleetController::RequestUpdateScaling(model::ScalingConfig scaling) {
  UpdateScalingCommand command;
  command.scaling = scaling;
  auto future     = command.reply.get_future();
  Post(std::move(command));
  return future;
}

void FleetController::Publish() {
  auto snapshot                        = std::make_shared<FleetSnapshot>();
  snapshot->definition                 = definition_;
  snapshot->running                    = !stopped_;
  snapshot->degraded                   = degraded_;
  snapshot->consecutive_failed_batches = consecutive_failed_batches_;
  snapshot->last_decision              = last_decision_;
  snapshot->last_scaling_action_time   = last_action_time_;
  snapshot->previous_metrics           = previous_metrics_;
  snapshot->last_observation_error     = last_observation_error_;
  snapshot->recent_events.assign(recent_events_.begin(), recent_events_.end());

  for (const auto& [name, tracked] : tracked_) {
    snapshot->workers.push_back(tracked.worker);
    switch (tracked.worker.state) {
      case model::WorkerState::kProvisioning:
        ++snapshot->provisioning;
        break;
      case model::WorkerState::kRegistered:
        ++snapshot->registered;
        break;
      case model::WorkerState::kActive:
        ++snapshot->active;
        break;
      case model::WorkerState::kDraining:
        ++snapshot->draining;
        break;
      case model::WorkerState::kDestroyed:
        break;
    }
  }

  observability::Metrics::Instance().SetTrackedWorkers(name_, static_cast<int64_t>(tracked_.size()));

  std::lock_guard lock(snapshot_mutex_);
  snapshot_ = std::move(snapshot);
}

FleetSnapshot FleetController::Snapshot() const {
  std::lock_guard lock(snapshot_mutex_);
  return *snapshot_;
}

} // namespace fleet::controller
