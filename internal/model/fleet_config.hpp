#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace fleet::model {

/*
  Identity of a fleet: which repository its workers register against and the
  capability labels every worker advertises. Immutable once the fleet is
  enabled.
*/
struct FleetConfig {
  std::string                name;
  std::string                repo_owner;
  std::string                repo_name;
  std::vector<std::string>   labels;
  std::optional<std::string> worker_group;

  std::string Repository() const {
    return repo_owner + "/" + repo_name;
  }
};

struct ScalingConfig {
  int                  min_runners          = 0;
  int                  max_runners          = 10;
  int                  jobs_per_runner      = 2;
  int                  scale_up_threshold   = 2;
  int                  scale_down_threshold = 0;
  std::chrono::seconds cooldown{300};
};

enum class ScaleDownOrder {
  kOldestFirst,
  kNewestFirst,
};

struct RotationConfig {
  // Zero disables age based rotation.
  std::chrono::seconds max_worker_age{0};
  int                  max_rotations_per_tick = 1;
  bool                 replace_unhealthy      = true;
  ScaleDownOrder       scale_down_order       = ScaleDownOrder::kOldestFirst;
};

// Instance shape handed to the compute provisioner for every worker.
struct ComputeTemplate {
  std::string size;
  std::string region;
  std::string image;
};

struct FleetDefinition {
  FleetConfig     fleet;
  ScalingConfig   scaling;
  RotationConfig  rotation;
  ComputeTemplate compute;
};

// All validators throw util::InvalidArgument naming the offending field.
void Validate(const FleetConfig& config);
void Validate(const ScalingConfig& config);
void Validate(const RotationConfig& config);
void Validate(const FleetDefinition& definition);

// Comma separated, trimmed, empty entries dropped.
std::vector<std::string> ParseLabels(const std::string& csv);
std::string              JoinLabels(const std::vector<std::string>& labels);

} // namespace fleet::model
