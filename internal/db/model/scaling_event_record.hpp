#pragma once

#include <cstdint>
#include <string>

namespace fleet::db::model {

// Append-only history of non-maintain scaling decisions.
struct ScalingEventRecord {
  uint64_t    id = 0; // assigned on insert
  std::string fleet;
  uint64_t    at_ms = 0;
  std::string action; // scale_up | scale_down
  int32_t     current = 0;
  int32_t     target  = 0;
  std::string reason;
  std::string source; // policy | manual
};

} // namespace fleet::db::model
