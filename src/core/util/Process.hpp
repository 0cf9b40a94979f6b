#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace psm {

struct ProcessResult {
  int         exit_code = -1;
  bool        timed_out = false;
  std::string stdout_str;
  std::string stderr_str;
};

// Runs args[0] (PATH lookup) with the remaining arguments and collects both
// output streams. A child still running at the deadline is killed with
// SIGKILL and reported with timed_out=true.
// Throws std::runtime_error if the pipes or the child cannot be created, or
// if waiting on the child's output fails (the child is killed first).
ProcessResult run_process(const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout);

} // namespace psm
