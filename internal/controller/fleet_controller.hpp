#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "internal/controller/fleet_snapshot.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/operation_executor.hpp"
#include "internal/lifecycle/fleet_lifecycle_manager.hpp"
#include "internal/queue/queue_observer.hpp"

namespace fleet::controller {

struct ControllerOptions {
  std::chrono::milliseconds tick_interval{60'000};
  int                       degraded_after_failed_batches = 3;
  std::size_t               event_history                 = 50;
};

/*
  Per-fleet control loop.

  Each tick: apply finished operations, health pass, age rotation pass,
  observe the queue, decide, dispatch provision / destroy / rotate operations
  to the shared executor.

  Single writer: the tracked worker set, the last action time and every other
  piece of fleet state are only touched by the thread running the loop (or,
  when the loop is not started, by the caller of RunTick / ProcessInbox).
  Executor threads report back through the inbox; operator commands go
  through the inbox too and are answered with futures.
*/
class FleetController {
 public:
  using Clock = std::function<util::TimePoint()>;

  FleetController(model::FleetDefinition definition, std::shared_ptr<queue::QueueObserver> observer,
                  std::shared_ptr<lifecycle::FleetLifecycleManager> lifecycle, std::shared_ptr<dispatch::OperationExecutor> executor,
                  std::shared_ptr<db::Repository> repository, ControllerOptions options = {}, Clock clock = {});
  ~FleetController();

  FleetController(const FleetController&)            = delete;
  FleetController& operator=(const FleetController&) = delete;

  const std::string& Name() const {
    return name_;
  }

  // Runs the loop on a dedicated thread; the first tick is immediate.
  void Start();

  /*
    Stops the loop, cancels operations that have not started, waits for the
    in-flight ones and applies their results. With drain_all every remaining
    worker is destroyed. Returns the number of workers drained.
  */
  int Stop(bool drain_all);

  // One full tick on the calling thread.
  void RunTick();

  // Applies queued results and commands; returns how many were applied.
  std::size_t ProcessInbox();

  // Processes the inbox until no operation is outstanding or timeout passes.
  bool Pump(std::chrono::milliseconds timeout);

  // Operator scale-to-N, applied by the loop between ticks.
  std::future<model::ScalingDecision> RequestScale(int requested);
  std::future<void>                   RequestUpdateScaling(model::ScalingConfig scaling);

  FleetSnapshot Snapshot() const;

 private:
  enum class Purpose {
    kFleet,
    kScaleUp,
    kReplacement,
  };

  struct TrackedWorker {
    model::EphemeralWorker  worker;
    Purpose                 purpose      = Purpose::kFleet;
    bool                    op_in_flight = false;
    // Still counts as capacity until its replacement is applied.
    bool                    rotating = false;
    std::optional<uint64_t> batch;
  };

  struct ScaleUpBatch {
    int  remaining = 0;
    int  failed    = 0;
    bool succeeded = false;
  };

  // --- inbox messages --------------------------------------------------
  struct ProvisionCompleted {
    std::string                           name;
    std::optional<model::EphemeralWorker> worker;
    std::string                           error;
    bool                                  cancelled = false;
  };
  struct DestroyCompleted {
    std::string               name;
    lifecycle::DestroyOutcome outcome;
    bool                      cancelled = false;
    // State to restore when the destroy never ran.
    model::WorkerState prior_state = model::WorkerState::kActive;
  };
  struct RotationCompleted {
    std::string                           old_name;
    std::string                           new_name;
    std::optional<model::EphemeralWorker> replacement;
    lifecycle::DestroyOutcome             old_outcome;
    std::string                           error;
    bool                                  cancelled = false;
  };
  struct WorkerTransition {
    model::EphemeralWorker worker;
  };
  struct ScaleCommand {
    int                                  requested = 0;
    std::promise<model::ScalingDecision> reply;
  };
  struct UpdateScalingCommand {
    model::ScalingConfig scaling;
    std::promise<void>   reply;
  };

  using Message =
      std::variant<ProvisionCompleted, DestroyCompleted, RotationCompleted, WorkerTransition, ScaleCommand, UpdateScalingCommand>;

  void Loop();
  void Post(Message message);
  void Apply(Message& message);
  void Apply(ProvisionCompleted& done);
  void Apply(DestroyCompleted& done);
  void Apply(RotationCompleted& done);
  void Apply(WorkerTransition& transition);
  void Apply(ScaleCommand& command);
  void Apply(UpdateScalingCommand& command);
  void WaitForOutstanding();

  void HealthPass();
  void RotationPass();
  void Act(const model::ScalingDecision& decision, const std::string& source);
  void RecordEvent(const model::ScalingDecision& decision, const std::string& source);

  void DispatchProvision(Purpose purpose, std::optional<uint64_t> batch);
  bool DispatchDestroy(const std::string& name);
  void DispatchRotate(const std::string& name);
  bool Submit(dispatch::Operation op);

  int                      ActiveCount() const;
  int                      InFlightScaleUps() const;
  std::vector<std::string> ChooseForScaleDown(int count) const;
  bool                     Eligible(const TrackedWorker& tracked) const;

  lifecycle::FleetLifecycleManager::TransitionObserver TransitionSink();
  void                                                 Publish();

  const std::string name_;
  model::FleetDefinition                            definition_;
  std::shared_ptr<queue::QueueObserver>             observer_;
  std::shared_ptr<lifecycle::FleetLifecycleManager> lifecycle_;
  std::shared_ptr<dispatch::OperationExecutor>      executor_;
  std::shared_ptr<db::Repository>                   repository_;
  ControllerOptions                                 options_;
  Clock                                             clock_;

  // --- owned by the writer ---------------------------------------------
  std::map<std::string, TrackedWorker>  tracked_;
  std::map<uint64_t, ScaleUpBatch>      batches_;
  uint64_t                              next_batch_ = 1;
  int                                   outstanding_ = 0;
  int                                   consecutive_failed_batches_ = 0;
  bool                                  degraded_                   = false;
  bool                                  stopping_                   = false;
  std::optional<model::ScalingDecision> last_decision_;
  std::optional<util::TimePoint>        last_action_time_;
  std::optional<model::QueueMetrics>    previous_metrics_;
  std::string                           last_observation_error_;
  std::deque<ScalingEvent>              recent_events_;

  // --- inbox -------------------------------------------------------------
  std::mutex              inbox_mutex_;
  std::condition_variable inbox_cv_;
  std::deque<Message>     inbox_;
  bool                    stop_requested_ = false;

  std::thread loop_;
  bool        started_ = false;
  bool        stopped_ = false;

  mutable std::mutex                   snapshot_mutex_;
  std::shared_ptr<const FleetSnapshot> snapshot_;
};

} // namespace fleet::controller
