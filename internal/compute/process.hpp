#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace fleet::compute {

struct ProcessSpec {
  std::string              command;
  std::vector<std::string> args;
  std::string              stdin_data;
  std::chrono::milliseconds timeout{60'000};
  std::size_t               max_output_bytes = 1 << 20;
  // Variables removed from the inherited environment before exec.
  std::vector<std::string> scrub_env;
};

struct ProcessResult {
  int         exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool        timed_out = false;
};

// Runs command (PATH lookup) in its own session and kills the whole process
// group at the deadline. Throws std::system_error if the process cannot be
// spawned; exit code 127 means exec failed in the child.
ProcessResult RunProcess(const ProcessSpec& spec);

} // namespace fleet::compute
