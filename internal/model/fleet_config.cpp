#include "fleet_config.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "internal/util/errors.hpp"

namespace fleet::model {
namespace {

bool IsWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool Matches(const std::string& value, bool allow_dot) {
  if (value.empty()) {
    return false;
  }
  return std::all_of(value.begin(), value.end(), [&](char c) { return IsWordChar(c) || (allow_dot && c == '.'); });
}

std::string Trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

} // namespace

void Validate(const FleetConfig& config) {
  if (!Matches(config.name, true)) {
    throw util::InvalidArgument("invalid fleet name '" + config.name + "': expected [A-Za-z0-9._-]+");
  }
  if (!Matches(config.repo_owner, false)) {
    throw util::InvalidArgument("invalid repository owner '" + config.repo_owner + "': expected [A-Za-z0-9_-]+");
  }
  if (!Matches(config.repo_name, true)) {
    throw util::InvalidArgument("invalid repository name '" + config.repo_name + "': expected [A-Za-z0-9._-]+");
  }
  if (config.labels.empty()) {
    throw util::InvalidArgument("fleet '" + config.name + "' must advertise at least one label");
  }
  for (const auto& label : config.labels) {
    if (!Matches(label, true)) {
      throw util::InvalidArgument("invalid label '" + label + "': expected [A-Za-z0-9._-]+");
    }
  }
  if (config.worker_group && !Matches(*config.worker_group, true)) {
    throw util::InvalidArgument("invalid worker group '" + *config.worker_group + "'");
  }
}

void Validate(const ScalingConfig& config) {
  if (config.jobs_per_runner <= 0) {
    throw util::InvalidArgument("jobs_per_runner must be positive, got " + std::to_string(config.jobs_per_runner));
  }
  if (config.min_runners < 0 || config.max_runners < 0) {
    throw util::InvalidArgument("min_runners and max_runners must be non-negative");
  }
  if (config.min_runners > config.max_runners) {
    throw util::InvalidArgument("min_runners (" + std::to_string(config.min_runners) + ") cannot exceed max_runners (" +
                                std::to_string(config.max_runners) + ")");
  }
  if (config.scale_up_threshold < 0 || config.scale_down_threshold < 0) {
    throw util::InvalidArgument("scaling thresholds must be non-negative");
  }
  if (config.cooldown.count() < 0) {
    throw util::InvalidArgument("cooldown must be non-negative");
  }
}

void Validate(const RotationConfig& config) {
  if (config.max_worker_age.count() < 0) {
    throw util::InvalidArgument("max_worker_age must be non-negative");
  }
  if (config.max_rotations_per_tick < 0) {
    throw util::InvalidArgument("max_rotations_per_tick must be non-negative");
  }
}

void Validate(const FleetDefinition& definition) {
  Validate(definition.fleet);
  Validate(definition.scaling);
  Validate(definition.rotation);
}

std::vector<std::string> ParseLabels(const std::string& csv) {
  std::vector<std::string> labels;
  std::stringstream        in(csv);
  std::string              item;
  while (std::getline(in, item, ',')) {
    auto label = Trim(item);
    if (!label.empty()) {
      labels.push_back(std::move(label));
    }
  }
  return labels;
}

std::string JoinLabels(const std::vector<std::string>& labels) {
  std::string out;
  for (const auto& label : labels) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += label;
  }
  return out;
}

} // namespace fleet::model
