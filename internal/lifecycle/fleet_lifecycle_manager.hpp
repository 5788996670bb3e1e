#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/compute/compute_provisioner.hpp"
#include "internal/model/fleet_config.hpp"
#include "internal/model/worker.hpp"
#include "internal/registry/worker_registry.hpp"

namespace fleet::lifecycle {

struct LifecycleOptions {
  std::chrono::milliseconds online_timeout{300'000};
  std::chrono::milliseconds online_poll_interval{5'000};
};

struct DestroyOutcome {
  bool                     deregistered      = false;
  bool                     compute_destroyed = false;
  std::vector<std::string> errors;

  bool Clean() const {
    return errors.empty();
  }
};

// One registry observation of a worker. Reachable is false on API errors.
struct WorkerProbe {
  bool        reachable = false;
  bool        found     = false;
  bool        online    = false;
  bool        busy      = false;
  std::string error;

  bool Healthy() const {
    return reachable && found && online;
  }
};

/*
  Ephemeral worker state machine:

    provisioning -> registered -> active -> draining -> destroyed

  Provision is a saga. Once the compute instance exists any later failure
  undoes exactly the steps that completed (deregister when registered, then
  destroy the instance once) before the error propagates. A failure to create
  the instance propagates as util::ComputeProvisioningError with nothing to
  undo.

  Destroy never throws: both teardown steps are always attempted and their
  failures are reported in DestroyOutcome.

  Every state change is reported to the per-call observer, if any.
*/
class FleetLifecycleManager {
 public:
  using TransitionObserver = std::function<void(const model::EphemeralWorker&)>;
  using Sleeper            = std::function<void(std::chrono::milliseconds)>;

  FleetLifecycleManager(std::shared_ptr<compute::ComputeProvisioner> compute, std::shared_ptr<registry::WorkerRegistry> registry,
                        LifecycleOptions options = {}, Sleeper sleeper = {});

  // Throws util::ProvisioningError (or a subclass).
  model::EphemeralWorker Provision(const model::FleetDefinition& definition, std::string name = {},
                                   const TransitionObserver& observer = {});

  DestroyOutcome Destroy(model::EphemeralWorker& worker, const model::FleetConfig& fleet, const TransitionObserver& observer = {});

  // The replacement is active before the old worker is touched. A failed
  // replacement leaves the old worker as it was.
  model::EphemeralWorker Rotate(model::EphemeralWorker& old_worker, const model::FleetDefinition& definition, std::string new_name = {},
                                DestroyOutcome* old_outcome = nullptr, const TransitionObserver& observer = {});

  WorkerProbe Probe(const model::EphemeralWorker& worker, const model::FleetConfig& fleet);
  bool        CheckHealth(const model::EphemeralWorker& worker, const model::FleetConfig& fleet);

  static std::string GenerateWorkerName(const model::FleetConfig& fleet);

 private:
  model::WorkerInfo WaitUntilOnline(const model::EphemeralWorker& worker, const model::FleetConfig& fleet);
  void              Compensate(model::EphemeralWorker& worker, const model::FleetConfig& fleet);

  std::shared_ptr<compute::ComputeProvisioner> compute_;
  std::shared_ptr<registry::WorkerRegistry>    registry_;
  LifecycleOptions                             options_;
  Sleeper                                      sleeper_;
};

} // namespace fleet::lifecycle
