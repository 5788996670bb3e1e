#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "api/fleet/v1.hpp"

using namespace fleet::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fleetctl <addr> enable <name> <owner> <repo> [key=value ...]\n"
            << "      keys: labels=a,b group=<worker_group> min= max= jobs_per_runner= up= down= cooldown=\n"
            << "            max_age= rotations= replace_unhealthy=true|false order=oldest|newest\n"
            << "            size= region= image=\n"
            << "  fleetctl <addr> disable <name> [--drain]\n"
            << "  fleetctl <addr> status <name> [event_limit]\n"
            << "  fleetctl <addr> list\n"
            << "  fleetctl <addr> scale <name> <count>\n"
            << "  fleetctl <addr> update-scaling <name> [min= max= jobs_per_runner= up= down= cooldown=]\n";
}

static std::map<std::string, std::string> ParseOptions(int argc, char** argv, int first) {
  std::map<std::string, std::string> options;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    auto        eq  = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "expected key=value, got '" << arg << "'\n";
      std::exit(1);
    }
    options[arg.substr(0, eq)] = arg.substr(eq + 1);
  }
  return options;
}

static int64_t ParseInt(const std::string& key, const std::string& value) {
  try {
    std::size_t used   = 0;
    auto        parsed = std::stoll(value, &used);
    if (used == value.size()) return parsed;
  } catch (const std::exception&) {
  }
  std::cerr << "invalid integer for " << key << ": '" << value << "'\n";
  std::exit(1);
}

// Consumes the scaling keys, leaving the rest in options.
static ScalingSpec TakeScaling(std::map<std::string, std::string>& options) {
  ScalingSpec spec;
  auto        take = [&](const char* key) -> std::optional<int64_t> {
    auto it = options.find(key);
    if (it == options.end()) return std::nullopt;
    auto value = ParseInt(key, it->second);
    options.erase(it);
    return value;
  };
  if (auto v = take("min")) spec.set_min_runners(static_cast<int32_t>(*v));
  if (auto v = take("max")) spec.set_max_runners(static_cast<int32_t>(*v));
  if (auto v = take("jobs_per_runner")) spec.set_jobs_per_runner(static_cast<int32_t>(*v));
  if (auto v = take("up")) spec.set_scale_up_threshold(static_cast<int32_t>(*v));
  if (auto v = take("down")) spec.set_scale_down_threshold(static_cast<int32_t>(*v));
  if (auto v = take("cooldown")) spec.set_cooldown_seconds(*v);
  return spec;
}

static const char* ActionName(ScalingAction action) {
  switch (action) {
    case SCALING_ACTION_SCALE_UP:
      return "scale_up";
    case SCALING_ACTION_SCALE_DOWN:
      return "scale_down";
    case SCALING_ACTION_MAINTAIN:
      return "maintain";
    default:
      return "unspecified";
  }
}

static const char* StateName(WorkerState state) {
  switch (state) {
    case WORKER_STATE_PROVISIONING:
      return "provisioning";
    case WORKER_STATE_REGISTERED:
      return "registered";
    case WORKER_STATE_ACTIVE:
      return "active";
    case WORKER_STATE_DRAINING:
      return "draining";
    case WORKER_STATE_DESTROYED:
      return "destroyed";
    default:
      return "unspecified";
  }
}

static void PrintDecision(const ScalingDecision& d) {
  std::cout << "decision=" << ActionName(d.action()) << " current=" << d.current_runner_count() << " target=" << d.target_runner_count()
            << " reason=\"" << d.reason() << "\"\n";
}

static void PrintStatus(const FleetStatus& s, bool verbose) {
  const auto& spec = s.spec();
  std::cout << "fleet=" << spec.name() << " repo=" << spec.repo_owner() << "/" << spec.repo_name() << " running=" << s.running()
            << " degraded=" << s.degraded() << " workers=" << s.workers_size() << " provisioning=" << s.provisioning_count()
            << " registered=" << s.registered_count() << " active=" << s.active_count() << " draining=" << s.draining_count() << "\n";
  if (!verbose) return;

  std::cout << "scaling min=" << spec.scaling().min_runners() << " max=" << spec.scaling().max_runners()
            << " jobs_per_runner=" << spec.scaling().jobs_per_runner() << " up=" << spec.scaling().scale_up_threshold()
            << " down=" << spec.scaling().scale_down_threshold() << " cooldown=" << spec.scaling().cooldown_seconds() << "s\n";
  if (s.has_previous_metrics()) {
    const auto& m = s.previous_metrics();
    std::cout << "queue pending=" << m.pending() << " in_progress=" << m.in_progress() << " total=" << m.total() << "\n";
  }
  if (!s.last_observation_error().empty()) std::cout << "last_observation_error=\"" << s.last_observation_error() << "\"\n";
  if (s.has_last_decision()) PrintDecision(s.last_decision());
  for (const auto& w : s.workers()) {
    std::cout << "  worker " << w.name() << " state=" << StateName(w.state()) << " id=" << w.worker_id() << " instance=" << w.instance_id()
              << " busy=" << w.busy() << " jobs=" << w.jobs_completed() << "\n";
  }
  for (const auto& e : s.recent_events()) {
    std::cout << "  event " << e.at().seconds() << " " << ActionName(e.action()) << " " << e.current() << "->" << e.target()
              << " source=" << e.source() << " \"" << e.reason() << "\"\n";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = FleetAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "enable") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    EnableFleetRequest req;
    auto*              spec = req.mutable_spec();
    spec->set_name(argv[3]);
    spec->set_repo_owner(argv[4]);
    spec->set_repo_name(argv[5]);

    auto options           = ParseOptions(argc, argv, 6);
    *spec->mutable_scaling() = TakeScaling(options);

    for (const auto& [key, value] : options) {
      if (key == "labels") {
        std::stringstream ss(value);
        std::string       label;
        while (std::getline(ss, label, ',')) {
          if (!label.empty()) spec->add_labels(label);
        }
      } else if (key == "group") {
        spec->set_worker_group(value);
      } else if (key == "max_age") {
        spec->mutable_rotation()->set_max_worker_age_seconds(ParseInt(key, value));
      } else if (key == "rotations") {
        spec->mutable_rotation()->set_max_rotations_per_tick(static_cast<int32_t>(ParseInt(key, value)));
      } else if (key == "replace_unhealthy") {
        spec->mutable_rotation()->set_replace_unhealthy(value == "true");
      } else if (key == "order") {
        if (value == "oldest") {
          spec->mutable_rotation()->set_scale_down_order(SCALE_DOWN_ORDER_OLDEST_FIRST);
        } else if (value == "newest") {
          spec->mutable_rotation()->set_scale_down_order(SCALE_DOWN_ORDER_NEWEST_FIRST);
        } else {
          std::cerr << "unsupported order: " << value << "\n";
          return 1;
        }
      } else if (key == "size") {
        spec->mutable_compute()->set_size(value);
      } else if (key == "region") {
        spec->mutable_compute()->set_region(value);
      } else if (key == "image") {
        spec->mutable_compute()->set_image(value);
      } else {
        std::cerr << "unknown option: " << key << "\n";
        return 1;
      }
    }

    EnableFleetResponse resp;
    auto                status = stub->EnableFleet(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintStatus(resp.status(), false);
  }

  // ------------------------------------------------------------

  else if (cmd == "disable") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    DisableFleetRequest req;
    req.set_name(argv[3]);
    req.set_drain(argc >= 5 && std::string(argv[4]) == "--drain");

    DisableFleetResponse resp;
    auto                 status = stub->DisableFleet(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "disabled drained_workers=" << resp.drained_workers() << "\n";
  }

  // ------------------------------------------------------------

  else if (cmd == "status") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetFleetStatusRequest req;
    req.set_name(argv[3]);
    if (argc >= 5) req.set_event_limit(static_cast<uint32_t>(ParseInt("event_limit", argv[4])));

    GetFleetStatusResponse resp;
    auto                   status = stub->GetFleetStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintStatus(resp.status(), true);
  }

  // ------------------------------------------------------------

  else if (cmd == "list") {
    ListFleetsRequest  req;
    ListFleetsResponse resp;
    auto               status = stub->ListFleets(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "fleets=" << resp.fleets_size() << "\n";
    for (const auto& fleet : resp.fleets()) PrintStatus(fleet, false);
  }

  // ------------------------------------------------------------

  else if (cmd == "scale") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    ScaleFleetRequest req;
    req.set_name(argv[3]);
    req.set_count(static_cast<int32_t>(ParseInt("count", argv[4])));

    ScaleFleetResponse resp;
    auto               status = stub->ScaleFleet(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintDecision(resp.decision());
  }

  // ------------------------------------------------------------

  else if (cmd == "update-scaling") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    UpdateScalingRequest req;
    req.set_name(argv[3]);
    auto options            = ParseOptions(argc, argv, 4);
    *req.mutable_scaling()  = TakeScaling(options);
    if (!options.empty()) {
      std::cerr << "unknown option: " << options.begin()->first << "\n";
      return 1;
    }

    UpdateScalingResponse resp;
    auto                  status = stub->UpdateScaling(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintStatus(resp.status(), true);
  }

  else {
    Usage();
    return 1;
  }

  return 0;
}
