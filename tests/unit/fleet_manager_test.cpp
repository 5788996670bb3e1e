#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/core/fleet_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "test_doubles.hpp"

namespace {

using fleet::core::FleetManager;
using fleet::core::FleetManagerOptions;
using fleet::model::ScalingAction;
using fleet::testing::FakeCompute;
using fleet::testing::FakeQueueObserver;
using fleet::testing::FakeRegistry;
using fleet::testing::MakeDefinition;

struct Harness {
  std::shared_ptr<FakeCompute>                             compute    = std::make_shared<FakeCompute>();
  std::shared_ptr<FakeRegistry>                            registry   = std::make_shared<FakeRegistry>();
  std::shared_ptr<FakeQueueObserver>                       observer   = std::make_shared<FakeQueueObserver>();
  std::shared_ptr<fleet::db::Repository>                   repository = std::make_shared<fleet::db::memory::MemoryRepository>();
  std::shared_ptr<fleet::dispatch::OperationExecutor>      executor   = std::make_shared<fleet::dispatch::OperationExecutor>(4);
  std::shared_ptr<fleet::lifecycle::FleetLifecycleManager> lifecycle;

  Harness() {
    fleet::lifecycle::LifecycleOptions lifecycle_options;
    lifecycle_options.online_timeout = std::chrono::seconds(1);
    lifecycle = std::make_shared<fleet::lifecycle::FleetLifecycleManager>(compute, registry, lifecycle_options,
                                                                          [](std::chrono::milliseconds) {});
    executor->Start();
  }

  ~Harness() {
    executor->Stop();
  }

  FleetManager::ControllerFactory Factory() {
    return [this](const fleet::model::FleetDefinition& definition) {
      fleet::controller::ControllerOptions options;
      options.tick_interval = std::chrono::hours(1);
      return std::make_unique<fleet::controller::FleetController>(definition, observer, lifecycle, executor, repository, options);
    };
  }

  std::unique_ptr<FleetManager> Make(bool start_loops) {
    FleetManagerOptions options;
    options.start_loops     = start_loops;
    options.command_timeout = std::chrono::seconds(10);
    return std::make_unique<FleetManager>(repository, Factory(), options);
  }

  std::optional<fleet::db::model::FleetRecord> Record(const std::string& name) {
    auto tx     = repository->Begin();
    auto record = repository->GetFleet(*tx, name);
    tx->Commit();
    return record;
  }
};

template <class Fn>
bool Eventually(Fn&& fn) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (std::chrono::steady_clock::now() < deadline) {
    if (fn()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return fn();
}

template <class E, class Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestEnablePersistsDefinition() {
  Harness h;
  auto    manager = h.Make(false);

  auto def                   = MakeDefinition("ci");
  def.fleet.worker_group     = "linux-pool";
  def.scaling.max_runners    = 7;
  def.rotation.scale_down_order = fleet::model::ScaleDownOrder::kNewestFirst;
  const auto snapshot        = manager->Enable(def);
  assert(snapshot.definition.fleet.name == "ci");
  assert(snapshot.active == 0);

  const auto record = h.Record("ci");
  assert(record.has_value());
  assert(record->enabled);
  assert(record->repo_owner == "acme");
  assert(record->worker_group == "linux-pool");
  assert(record->max_runners == 7);
  assert(record->scale_down_order == 1);
  assert(record->created_at_ms > 0);

  const auto back = FleetManager::FromRecord(*record);
  assert(back.fleet.worker_group.value() == "linux-pool");
  assert(back.rotation.scale_down_order == fleet::model::ScaleDownOrder::kNewestFirst);
  assert(back.scaling.cooldown == def.scaling.cooldown);
  assert(back.compute.image == "ubuntu-22-04");
}

void TestEnableRejectsDuplicatesAndInvalid() {
  Harness h;
  auto    manager = h.Make(false);
  manager->Enable(MakeDefinition("ci"));

  assert(Throws<fleet::util::AlreadyExists>([&] { manager->Enable(MakeDefinition("ci")); }));

  auto bad                = MakeDefinition("bad");
  bad.scaling.min_runners = 5;
  bad.scaling.max_runners = 2;
  assert(Throws<fleet::util::InvalidArgument>([&] { manager->Enable(bad); }));
  assert(!h.Record("bad").has_value());

  auto unlabeled         = MakeDefinition("unlabeled");
  unlabeled.fleet.labels = {};
  assert(Throws<fleet::util::InvalidArgument>([&] { manager->Enable(unlabeled); }));
}

void TestStatusAndList() {
  Harness h;
  auto    manager = h.Make(false);
  manager->Enable(MakeDefinition("a"));
  manager->Enable(MakeDefinition("b"));

  assert(manager->Status("a").definition.fleet.name == "a");
  assert(Throws<fleet::util::NotFound>([&] { manager->Status("missing"); }));

  const auto all = manager->List();
  assert(all.size() == 2);
  assert(all[0].definition.fleet.name == "a");
  assert(all[1].definition.fleet.name == "b");
}

void TestDisableMarksRecordDisabled() {
  Harness h;
  auto    manager = h.Make(false);
  manager->Enable(MakeDefinition("ci"));

  assert(manager->Disable("ci", false) == 0);
  assert(manager->List().empty());
  assert(!h.Record("ci")->enabled);
  assert(Throws<fleet::util::NotFound>([&] { manager->Disable("ci", false); }));

  // re-enable reuses the record
  const auto created = h.Record("ci")->created_at_ms;
  manager->Enable(MakeDefinition("ci"));
  assert(h.Record("ci")->enabled);
  assert(h.Record("ci")->created_at_ms == created);
}

void TestScaleAndDrain() {
  Harness h;
  auto    manager = h.Make(true);
  manager->Enable(MakeDefinition("ci"));

  assert(Throws<fleet::util::InvalidArgument>([&] { manager->Scale("ci", -1); }));
  assert(Throws<fleet::util::NotFound>([&] { manager->Scale("missing", 1); }));

  const auto decision = manager->Scale("ci", 2);
  assert(decision.action == ScalingAction::kScaleUp);
  assert(decision.target_runner_count == 2);
  assert(Eventually([&] { return manager->Status("ci").active == 2; }));

  const auto events = manager->RecentEvents("ci", 10);
  assert(!events.empty());
  assert(events.front().source == "manual");
  assert(events.front().action == ScalingAction::kScaleUp);
  assert(events.front().target == 2);

  assert(manager->Disable("ci", true) == 2);
  assert(h.compute->Live() == 0);
  assert(h.registry->Registered() == 0);
}

void TestUpdateScalingPersists() {
  Harness h;
  auto    manager = h.Make(true);
  manager->Enable(MakeDefinition("ci"));

  auto scaling            = MakeDefinition().scaling;
  scaling.max_runners     = 4;
  scaling.jobs_per_runner = 3;
  const auto snapshot     = manager->UpdateScaling("ci", scaling);
  assert(snapshot.definition.scaling.max_runners == 4);
  assert(h.Record("ci")->max_runners == 4);
  assert(h.Record("ci")->jobs_per_runner == 3);

  auto bad        = scaling;
  bad.min_runners = -1;
  assert(Throws<fleet::util::InvalidArgument>([&] { manager->UpdateScaling("ci", bad); }));
  assert(h.Record("ci")->min_runners == 0);
}

void TestRestoreStartsEnabledFleetsOnly() {
  Harness h;
  {
    auto manager = h.Make(false);
    manager->Enable(MakeDefinition("kept"));
    manager->Enable(MakeDefinition("dropped"));
    manager->Disable("dropped", false);
  }

  auto manager = h.Make(false);
  assert(manager->List().empty());
  assert(manager->Restore() == 1);
  const auto all = manager->List();
  assert(all.size() == 1);
  assert(all[0].definition.fleet.name == "kept");
  assert(all[0].definition.fleet.Repository() == "acme/widgets");

  // already running
  assert(manager->Restore() == 0);
}

void TestWithoutRepository() {
  Harness h;
  FleetManagerOptions options;
  options.start_loops = false;
  FleetManager manager(nullptr, h.Factory(), options);
  manager.Enable(MakeDefinition("ci"));
  assert(manager.RecentEvents("ci", 5).empty());
  assert(manager.Restore() == 0);
}

} // namespace

int main() {
  TestEnablePersistsDefinition();
  TestEnableRejectsDuplicatesAndInvalid();
  TestStatusAndList();
  TestDisableMarksRecordDisabled();
  TestScaleAndDrain();
  TestUpdateScalingPersists();
  TestRestoreStartsEnabledFleetsOnly();
  TestWithoutRepository();
  std::cout << "runner_fleet_unit_fleet_manager: pass\n";
  return 0;
}
