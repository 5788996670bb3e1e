#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/worker_state.hpp"
#include "internal/util/time.hpp"

namespace fleet::model {

struct ComputeSpec {
  std::string name;
  std::string size;
  std::string region;
  std::string image;
};

// Opaque reference to a compute instance returned by the provisioner.
struct ComputeHandle {
  std::string instance_id;
  std::string name;
  std::string address;
  std::string region;
};

struct CommandResult {
  int         exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool        timed_out = false;

  bool Succeeded() const {
    return !timed_out && exit_code == 0;
  }
};

// Provider view of a registered worker. Informational only.
struct WorkerInfo {
  int64_t                  id = 0;
  std::string              name;
  bool                     online = false;
  bool                     busy   = false;
  std::vector<std::string> labels;
};

/*
  One compute instance plus its provider registration. Both are created and
  destroyed together; jobs_completed only ever grows.
*/
struct EphemeralWorker {
  std::string            name;
  ComputeHandle          compute;
  std::optional<int64_t> worker_id;
  util::TimePoint        created_at{};
  int64_t                jobs_completed = 0;
  bool                   busy           = false;
  WorkerState            state          = WorkerState::kProvisioning;
};

} // namespace fleet::model
