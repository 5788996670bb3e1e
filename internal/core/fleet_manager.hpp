#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/controller/fleet_controller.hpp"
#include "internal/db/api/repository.hpp"

namespace fleet::core {

struct FleetManagerOptions {
  // Upper bound for an operator command to be applied by a fleet loop.
  std::chrono::milliseconds command_timeout{30'000};
  // Start each controller's loop thread on enable / restore.
  bool start_loops = true;
};

/*
  Owner of every enabled fleet.

  Enable validates and persists the definition and starts its controller;
  Disable stops it (optionally draining every worker) and marks the record
  disabled. Status reads published snapshots only. Scale and UpdateScaling
  are handed to the fleet's own loop and awaited.
*/
class FleetManager {
 public:
  using ControllerFactory = std::function<std::unique_ptr<controller::FleetController>(const model::FleetDefinition&)>;

  FleetManager(std::shared_ptr<db::Repository> repository, ControllerFactory factory, FleetManagerOptions options = {});
  ~FleetManager();

  FleetManager(const FleetManager&)            = delete;
  FleetManager& operator=(const FleetManager&) = delete;

  // Throws util::InvalidArgument, util::AlreadyExists.
  controller::FleetSnapshot Enable(model::FleetDefinition definition);
  // Returns the number of workers drained. Throws util::NotFound.
  int Disable(const std::string& name, bool drain);

  controller::FleetSnapshot              Status(const std::string& name) const;
  std::vector<controller::FleetSnapshot> List() const;
  // Newest first. Persisted history when a repository is configured.
  std::vector<controller::ScalingEvent> RecentEvents(const std::string& name, std::size_t limit) const;

  // Throws util::NotFound, util::DeadlineExceeded, util::InvalidState.
  model::ScalingDecision    Scale(const std::string& name, int count);
  controller::FleetSnapshot UpdateScaling(const std::string& name, const model::ScalingConfig& scaling);

  // Starts a controller for every enabled persisted fleet. Returns how many.
  std::size_t Restore();
  // Stops every fleet without draining.
  void Shutdown();

  static db::model::FleetRecord ToRecord(const model::FleetDefinition& definition);
  static model::FleetDefinition FromRecord(const db::model::FleetRecord& record);

 private:
  std::shared_ptr<controller::FleetController> Find(const std::string& name) const;
  void                                         Persist(const model::FleetDefinition& definition, bool enabled);

  std::shared_ptr<db::Repository> repository_;
  ControllerFactory               factory_;
  FleetManagerOptions             options_;

  mutable std::shared_mutex                                           mutex_;
  std::map<std::string, std::shared_ptr<controller::FleetController>> controllers_;
};

} // namespace fleet::core
