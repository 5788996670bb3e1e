#pragma once

#include <cstdint>
#include <string_view>

namespace fleet::model {

/*
  Ephemeral worker lifecycle.

    provisioning -> registered -> active -> draining -> destroyed

  A worker that fails before becoming active is torn down from whatever state
  it reached; destroyed is terminal.
*/
enum class WorkerState : std::uint8_t {
  kProvisioning = 1,
  kRegistered   = 2,
  kActive       = 3,
  kDraining     = 4,
  kDestroyed    = 5,
};

constexpr bool IsTerminal(WorkerState state) {
  return state == WorkerState::kDestroyed;
}

constexpr bool CanTransition(WorkerState from, WorkerState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == WorkerState::kDestroyed || to == WorkerState::kDraining) {
    return true;
  }

  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(WorkerState state) {
  switch (state) {
    case WorkerState::kProvisioning:
      return "provisioning";
    case WorkerState::kRegistered:
      return "registered";
    case WorkerState::kActive:
      return "active";
    case WorkerState::kDraining:
      return "draining";
    case WorkerState::kDestroyed:
      return "destroyed";
  }
  return "unknown";
}

static_assert(CanTransition(WorkerState::kProvisioning, WorkerState::kRegistered));
static_assert(CanTransition(WorkerState::kActive, WorkerState::kDraining));
static_assert(!CanTransition(WorkerState::kProvisioning, WorkerState::kActive));
static_assert(!CanTransition(WorkerState::kDraining, WorkerState::kActive));
static_assert(!CanTransition(WorkerState::kDestroyed, WorkerState::kDraining));

} // namespace fleet::model
