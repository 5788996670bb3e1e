#include "fleet_manager.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::core {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfFailed(const db::Result& result, const std::string& what) {
  if (result) return;
  const auto message = what + ": " + result.Describe();
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    default:
      throw util::Error(message);
  }
}

template <class T>
T Await(std::future<T>& future, std::chrono::milliseconds timeout, const std::string& what) {
  if (future.wait_for(timeout) != std::future_status::ready) {
    throw util::DeadlineExceeded(what + " not applied within " + std::to_string(timeout.count()) + "ms");
  }
  return future.get();
}

} // namespace

FleetManager::FleetManager(std::shared_ptr<db::Repository> repository, ControllerFactory factory, FleetManagerOptions options)
    : repository_(std::move(repository)), factory_(std::move(factory)), options_(options) {
  if (!factory_) {
    throw util::InvalidArgument("fleet manager requires a controller factory");
  }
}

FleetManager::~FleetManager() {
  Shutdown();
}

// ------------------------------------------------------------------
// Record mapping
// ------------------------------------------------------------------

db::model::FleetRecord FleetManager::ToRecord(const model::FleetDefinition& definition) {
  db::model::FleetRecord record;
  record.name                   = definition.fleet.name;
  record.repo_owner             = definition.fleet.repo_owner;
  record.repo_name              = definition.fleet.repo_name;
  record.labels                 = definition.fleet.labels;
  record.worker_group           = definition.fleet.worker_group.value_or("");
  record.min_runners            = definition.scaling.min_runners;
  record.max_runners            = definition.scaling.max_runners;
  record.jobs_per_runner        = definition.scaling.jobs_per_runner;
  record.scale_up_threshold     = definition.scaling.scale_up_threshold;
  record.scale_down_threshold   = definition.scaling.scale_down_threshold;
  record.cooldown_seconds       = definition.scaling.cooldown.count();
  record.max_worker_age_seconds = definition.rotation.max_worker_age.count();
  record.max_rotations_per_tick = definition.rotation.max_rotations_per_tick;
  record.replace_unhealthy      = definition.rotation.replace_unhealthy;
  record.scale_down_order       = definition.rotation.scale_down_order == model::ScaleDownOrder::kNewestFirst ? 1 : 0;
  record.compute_size           = definition.compute.size;
  record.compute_region         = definition.compute.region;
  record.compute_image          = definition.compute.image;
  return record;
}

model::FleetDefinition FleetManager::FromRecord(const db::model::FleetRecord& record) {
  model::FleetDefinition definition;
  definition.fleet.name       = record.name;
  definition.fleet.repo_owner = record.repo_owner;
  definition.fleet.repo_name  = record.repo_name;
  definition.fleet.labels     = record.labels;
  if (!record.worker_group.empty()) {
    definition.fleet.worker_group = record.worker_group;
  }
  definition.scaling.min_runners             = record.min_runners;
  definition.scaling.max_runners             = record.max_runners;
  definition.scaling.jobs_per_runner         = record.jobs_per_runner;
  definition.scaling.scale_up_threshold      = record.scale_up_threshold;
  definition.scaling.scale_down_threshold    = record.scale_down_threshold;
  definition.scaling.cooldown                = std::chrono::seconds(record.cooldown_seconds);
  definition.rotation.max_worker_age         = std::chrono::seconds(record.max_worker_age_seconds);
  definition.rotation.max_rotations_per_tick = record.max_rotations_per_tick;
  definition.rotation.replace_unhealthy      = record.replace_unhealthy;
  definition.rotation.scale_down_order = record.scale_down_order == 1 ? model::ScaleDownOrder::kNewestFirst : model::ScaleDownOrder::kOldestFirst;
  definition.compute.size              = record.compute_size;
  definition.compute.region            = record.compute_region;
  definition.compute.image             = record.compute_image;
  return definition;
}

void FleetManager::Persist(const model::FleetDefinition& definition, bool enabled) {
  if (!repository_) return;

  auto       record = ToRecord(definition);
  const auto now    = util::ToUnixMillis(util::Now());
  record.enabled    = enabled;
  record.updated_at_ms = now;

  auto tx       = repository_->Begin();
  auto existing = repository_->GetFleet(*tx, definition.fleet.name);
  if (existing) {
    record.created_at_ms = existing->created_at_ms;
    ThrowIfFailed(repository_->UpdateFleet(*tx, record), "updating fleet " + record.name);
  } else {
    record.created_at_ms = now;
    ThrowIfFailed(repository_->InsertFleet(*tx, record), "inserting fleet " + record.name);
  }
  tx->Commit();
}

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

std::shared_ptr<controller::FleetController> FleetManager::Find(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = controllers_.find(name);
  if (it == controllers_.end()) {
    throw util::NotFound("fleet " + name + " is not enabled");
  }
  return it->second;
}

controller::FleetSnapshot FleetManager::Enable(model::FleetDefinition definition) {
  model::Validate(definition);

  std::unique_lock lock(mutex_);
  if (controllers_.contains(definition.fleet.name)) {
    throw util::AlreadyExists("fleet " + definition.fleet.name + " is already enabled");
  }

  std::shared_ptr<controller::FleetController> controller = factory_(definition);
  Persist(definition, true);

  if (options_.start_loops) {
    controller->Start();
  }
  controllers_[definition.fleet.name] = controller;
  lock.unlock();

  FLEET_LOG_INFO("Fleet enabled", {StringField("fleet", definition.fleet.name), StringField("repository", definition.fleet.Repository()),
                                   StringField("labels", model::JoinLabels(definition.fleet.labels))});
  return controller->Snapshot();
}

int FleetManager::Disable(const std::string& name, bool drain) {
  std::shared_ptr<controller::FleetController> controller;
  {
    std::unique_lock lock(mutex_);
    auto             it = controllers_.find(name);
    if (it == controllers_.end()) {
      throw util::NotFound("fleet " + name + " is not enabled");
    }
    controller = std::move(it->second);
    controllers_.erase(it);
  }

  const int  drained    = controller->Stop(drain);
  const auto definition = controller->Snapshot().definition;
  Persist(definition, false);

  FLEET_LOG_INFO("Fleet disabled", {StringField("fleet", name), BoolField("drain", drain), IntField("drained_workers", drained)});
  return drained;
}

controller::FleetSnapshot FleetManager::Status(const std::string& name) const {
  return Find(name)->Snapshot();
}

std::vector<controller::FleetSnapshot> FleetManager::List() const {
  std::vector<controller::FleetSnapshot> out;
  std::shared_lock                       lock(mutex_);
  out.reserve(controllers_.size());
  for (const auto& [_, controller] : controllers_) {
    out.push_back(controller->Snapshot());
  }
  return out;
}

std::vector<controller::ScalingEvent> FleetManager::RecentEvents(const std::string& name, std::size_t limit) const {
  auto controller = Find(name);
  if (!repository_) {
    auto events = controller->Snapshot().recent_events;
    if (events.size() > limit) events.resize(limit);
    return events;
  }

  auto tx      = repository_->Begin();
  auto records = repository_->ListScalingEvents(*tx, name, limit);
  tx->Commit();

  std::vector<controller::ScalingEvent> events;
  events.reserve(records.size());
  for (const auto& record : records) {
    controller::ScalingEvent event;
    event.at      = util::FromUnixMillis(record.at_ms);
    event.action  = record.action == "scale_up" ? model::ScalingAction::kScaleUp
                    : record.action == "scale_down" ? model::ScalingAction::kScaleDown
                                                    : model::ScalingAction::kMaintain;
    event.current = record.current;
    event.target  = record.target;
    event.reason  = record.reason;
    event.source  = record.source;
    events.push_back(std::move(event));
  }
  return events;
}

model::ScalingDecision FleetManager::Scale(const std::string& name, int count) {
  if (count < 0) {
    throw util::InvalidArgument("runner count must be >= 0");
  }
  auto future = Find(name)->RequestScale(count);
  return Await(future, options_.command_timeout, "scale request for " + name);
}

controller::FleetSnapshot FleetManager::UpdateScaling(const std::string& name, const model::ScalingConfig& scaling) {
  model::Validate(scaling);

  auto controller = Find(name);
  auto future     = controller->RequestUpdateScaling(scaling);
  Await(future, options_.command_timeout, "scaling update for " + name);

  auto snapshot = controller->Snapshot();
  Persist(snapshot.definition, true);
  return snapshot;
}

std::size_t FleetManager::Restore() {
  if (!repository_) return 0;

  std::vector<db::model::FleetRecord> records;
  {
    auto tx = repository_->Begin();
    records = repository_->ListFleets(*tx);
    tx->Commit();
  }

  std::size_t restored = 0;
  for (const auto& record : records) {
    if (!record.enabled) continue;
    try {
      auto definition = FromRecord(record);
      model::Validate(definition);

      std::shared_ptr<controller::FleetController> controller = factory_(definition);
      {
        std::unique_lock lock(mutex_);
        if (controllers_.contains(record.name)) continue;
        if (options_.start_loops) controller->Start();
        controllers_[record.name] = std::move(controller);
      }
      ++restored;
      FLEET_LOG_INFO("Fleet restored", {StringField("fleet", record.name)});
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("Fleet restore failed", {StringField("fleet", record.name), StringField("error", e.what())});
    }
  }
  return restored;
}

void FleetManager::Shutdown() {
  std::map<std::string, std::shared_ptr<controller::FleetController>> controllers;
  {
    std::unique_lock lock(mutex_);
    controllers.swap(controllers_);
  }
  for (auto& [name, controller] : controllers) {
    controller->Stop(false);
  }
}

} // namespace fleet::core
