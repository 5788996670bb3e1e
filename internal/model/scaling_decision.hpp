#pragma once

#include <string>
#include <string_view>

namespace fleet::model {

enum class ScalingAction {
  kScaleUp,
  kScaleDown,
  kMaintain,
};

constexpr std::string_view ToString(ScalingAction action) {
  switch (action) {
    case ScalingAction::kScaleUp:
      return "scale_up";
    case ScalingAction::kScaleDown:
      return "scale_down";
    case ScalingAction::kMaintain:
      return "maintain";
  }
  return "unknown";
}

struct ScalingDecision {
  ScalingAction action               = ScalingAction::kMaintain;
  int           target_runner_count  = 0;
  int           current_runner_count = 0;
  std::string   reason;
};

} // namespace fleet::model
