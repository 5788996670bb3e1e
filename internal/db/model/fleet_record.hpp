#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fleet::db::model {

/*
  Persistent fleet definition row.
  Holds no credentials. Labels are stored comma separated by the SQL backend.
*/
struct FleetRecord {
  std::string              name;
  std::string              repo_owner;
  std::string              repo_name;
  std::vector<std::string> labels;
  std::string              worker_group; // empty = default group

  int32_t min_runners          = 0;
  int32_t max_runners          = 0;
  int32_t jobs_per_runner      = 0;
  int32_t scale_up_threshold   = 0;
  int32_t scale_down_threshold = 0;
  int64_t cooldown_seconds     = 0;

  int64_t max_worker_age_seconds = 0;
  int32_t max_rotations_per_tick = 0;
  bool    replace_unhealthy      = true;
  int32_t scale_down_order       = 0; // 0 oldest first, 1 newest first

  std::string compute_size;
  std::string compute_region;
  std::string compute_image;

  bool     enabled       = true;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace fleet::db::model
