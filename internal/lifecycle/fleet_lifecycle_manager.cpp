#include "fleet_lifecycle_manager.hpp"

#include <algorithm>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace fleet::lifecycle {

using observability::IntField;
using observability::StringField;

namespace {

void Transition(model::EphemeralWorker& worker, model::WorkerState to, const FleetLifecycleManager::TransitionObserver& observer) {
  if (!model::CanTransition(worker.state, to)) {
    throw util::InvalidState("worker " + worker.name + ": illegal transition " + std::string(model::ToString(worker.state)) + " -> " +
                             std::string(model::ToString(to)));
  }
  worker.state = to;
  if (observer) {
    observer(worker);
  }
}

// Span plus duration metric for one lifecycle operation.
class OperationTimer {
 public:
  OperationTimer(std::string_view op, const model::EphemeralWorker& worker)
      : op_(op), span_("FleetLifecycleManager." + std::string(op)), started_at_(std::chrono::steady_clock::now()) {
    span_.SetAttribute("worker", worker.name);
  }

  void Succeeded() {
    Finish("success");
  }

  void Failed(std::string_view error) {
    span_.RecordException(error);
    Finish("failure");
  }

 private:
  void Finish(std::string_view outcome) {
    observability::Metrics::Instance().ObserveLifecycleDurationMs(
        op_, outcome, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at_).count());
  }

  std::string                           op_;
  observability::SpanScope              span_;
  std::chrono::steady_clock::time_point started_at_;
};

} // namespace

FleetLifecycleManager::FleetLifecycleManager(std::shared_ptr<compute::ComputeProvisioner> compute,
                                             std::shared_ptr<registry::WorkerRegistry> registry, LifecycleOptions options, Sleeper sleeper)
    : compute_(std::move(compute)), registry_(std::move(registry)), options_(options), sleeper_(std::move(sleeper)) {
  if (!compute_ || !registry_) {
    throw util::InvalidArgument("lifecycle manager requires a compute provisioner and a worker registry");
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

std::string FleetLifecycleManager::GenerateWorkerName(const model::FleetConfig& fleet) {
  return fleet.name + "-" + util::ShortId();
}

model::EphemeralWorker FleetLifecycleManager::Provision(const model::FleetDefinition& definition, std::string name,
                                                        const TransitionObserver& observer) {
  model::EphemeralWorker worker;
  worker.name       = name.empty() ? GenerateWorkerName(definition.fleet) : std::move(name);
  worker.created_at = util::Now();
  worker.state      = model::WorkerState::kProvisioning;

  OperationTimer timer("provision", worker);
  if (observer) {
    observer(worker);
  }

  const model::ComputeSpec spec{worker.name, definition.compute.size, definition.compute.region, definition.compute.image};
  try {
    worker.compute = compute_->Provision(spec);
  } catch (const util::ComputeProvisioningError& e) {
    timer.Failed(e.what());
    throw;
  } catch (const std::exception& e) {
    timer.Failed(e.what());
    throw util::ComputeProvisioningError("creating instance for " + worker.name + " failed: " + e.what());
  }

  FLEET_LOG_INFO("Compute instance created", {StringField("fleet", definition.fleet.name), StringField("worker", worker.name),
                                              StringField("instance_id", worker.compute.instance_id)});

  try {
    auto token       = registry_->GetRegistrationToken(definition.fleet);
    worker.worker_id = registry_->Register(worker.compute, definition.fleet, std::move(token));
    Transition(worker, model::WorkerState::kRegistered, observer);

    const auto info = WaitUntilOnline(worker, definition.fleet);
    worker.busy     = info.busy;
    Transition(worker, model::WorkerState::kActive, observer);
  } catch (const util::ProvisioningError& e) {
    timer.Failed(e.what());
    Compensate(worker, definition.fleet);
    throw;
  } catch (const std::exception& e) {
    timer.Failed(e.what());
    Compensate(worker, definition.fleet);
    throw util::WorkerRegistrationError("provisioning worker " + worker.name + " failed: " + e.what());
  }

  timer.Succeeded();
  FLEET_LOG_INFO("Worker active", {StringField("fleet", definition.fleet.name), StringField("worker", worker.name),
                                   IntField("worker_id", worker.worker_id.value_or(0))});
  return worker;
}

model::WorkerInfo FleetLifecycleManager::WaitUntilOnline(const model::EphemeralWorker& worker, const model::FleetConfig& fleet) {
  const auto                deadline = std::chrono::steady_clock::now() + options_.online_timeout;
  std::chrono::milliseconds waited{0};
  std::string               last_error = "not yet visible";

  for (;;) {
    try {
      auto info = registry_->Status(fleet, *worker.worker_id);
      if (info.online) {
        return info;
      }
      last_error = "offline";
    } catch (const util::WorkerNotFound& e) {
      last_error = e.what();
    } catch (const util::Error& e) {
      last_error = e.what();
      FLEET_LOG_DEBUG("Worker status poll failed", {StringField("worker", worker.name), StringField("error", e.what())});
    }

    if (waited >= options_.online_timeout || std::chrono::steady_clock::now() >= deadline) {
      throw util::WorkerRegistrationError("worker " + worker.name + " did not come online within " +
                                          std::to_string(options_.online_timeout.count()) + "ms: " + last_error);
    }
    const auto step = std::max(std::chrono::milliseconds(1), std::min(options_.online_poll_interval, options_.online_timeout - waited));
    sleeper_(step);
    waited += step;
  }
}

void FleetLifecycleManager::Compensate(model::EphemeralWorker& worker, const model::FleetConfig& fleet) {
  if (worker.worker_id) {
    try {
      registry_->Deregister(fleet, *worker.worker_id);
    } catch (const std::exception& e) {
      FLEET_LOG_WARN("Compensating deregistration failed",
                     {StringField("fleet", fleet.name), StringField("worker", worker.name), StringField("error", e.what())});
    }
  }

  try {
    compute_->Destroy(worker.compute);
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Compensating instance destroy failed, instance may be orphaned",
                    {StringField("fleet", fleet.name), StringField("worker", worker.name),
                     StringField("instance_id", worker.compute.instance_id), StringField("error", e.what())});
  }
  worker.state = model::WorkerState::kDestroyed;
}

DestroyOutcome FleetLifecycleManager::Destroy(model::EphemeralWorker& worker, const model::FleetConfig& fleet,
                                              const TransitionObserver& observer) {
  DestroyOutcome outcome;
  if (model::IsTerminal(worker.state)) {
    outcome.deregistered      = true;
    outcome.compute_destroyed = true;
    return outcome;
  }

  OperationTimer timer("destroy", worker);
  Transition(worker, model::WorkerState::kDraining, observer);

  if (worker.worker_id) {
    try {
      registry_->Deregister(fleet, *worker.worker_id);
      outcome.deregistered = true;
    } catch (const std::exception& e) {
      outcome.errors.emplace_back(e.what());
      FLEET_LOG_WARN("Worker deregistration failed",
                     {StringField("fleet", fleet.name), StringField("worker", worker.name), StringField("error", e.what())});
    }
  } else {
    outcome.deregistered = true;
  }

  if (!worker.compute.instance_id.empty()) {
    try {
      compute_->Destroy(worker.compute);
      outcome.compute_destroyed = true;
    } catch (const std::exception& e) {
      outcome.errors.emplace_back(e.what());
      FLEET_LOG_ERROR("Instance destroy failed",
                      {StringField("fleet", fleet.name), StringField("worker", worker.name),
                       StringField("instance_id", worker.compute.instance_id), StringField("error", e.what())});
    }
  } else {
    outcome.compute_destroyed = true;
  }

  Transition(worker, model::WorkerState::kDestroyed, observer);
  if (outcome.Clean()) {
    timer.Succeeded();
  } else {
    timer.Failed(outcome.errors.front());
  }
  FLEET_LOG_INFO("Worker destroyed", {StringField("fleet", fleet.name), StringField("worker", worker.name),
                                      IntField("jobs_completed", worker.jobs_completed)});
  return outcome;
}

model::EphemeralWorker FleetLifecycleManager::Rotate(model::EphemeralWorker& old_worker, const model::FleetDefinition& definition,
                                                     std::string new_name, DestroyOutcome* old_outcome, const TransitionObserver& observer) {
  FLEET_LOG_INFO("Rotating worker", {StringField("fleet", definition.fleet.name), StringField("worker", old_worker.name)});

  auto replacement = Provision(definition, std::move(new_name), observer);
  auto outcome     = Destroy(old_worker, definition.fleet, observer);
  if (old_outcome) {
    *old_outcome = std::move(outcome);
  }
  return replacement;
}

WorkerProbe FleetLifecycleManager::Probe(const model::EphemeralWorker& worker, const model::FleetConfig& fleet) {
  WorkerProbe probe;
  if (!worker.worker_id) {
    probe.reachable = true;
    probe.error     = "worker " + worker.name + " has no registration";
    return probe;
  }

  try {
    const auto info = registry_->Status(fleet, *worker.worker_id);
    probe.reachable = true;
    probe.found     = true;
    probe.online    = info.online;
    probe.busy      = info.busy;
  } catch (const util::WorkerNotFound& e) {
    probe.reachable = true;
    probe.error     = e.what();
  } catch (const std::exception& e) {
    probe.error = e.what();
  }
  return probe;
}

bool FleetLifecycleManager::CheckHealth(const model::EphemeralWorker& worker, const model::FleetConfig& fleet) {
  return Probe(worker, fleet).Healthy();
}

} // namespace fleet::lifecycle
