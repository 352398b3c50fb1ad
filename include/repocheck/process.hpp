#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace repocheck {

struct ProcessResult {
  int exit_code{-1};        // valid when the child exited normally
  int term_signal{0};       // non-zero when the child was killed by a signal
  std::string out;          // captured stdout
  std::string err;          // captured stderr
  bool timed_out{false};    // deadline passed; the process group was killed
  bool exec_failed{false};  // argv[0] could not be started
  int exec_errno{0};

  [[nodiscard]] auto ok() const -> bool {
    return !timed_out && !exec_failed && term_signal == 0 && exit_code == 0;
  }
};

// Change to the inherited environment; an empty value unsets the variable.
struct EnvOverride {
  std::string name;
  std::optional<std::string> value;
};

// Run argv[0] (searched on PATH) with stdin from /dev/null and both output
// streams captured. The child gets its own process group so a timeout kills
// everything it spawned. Throws std::system_error if pipe/fork/poll fail and
// std::invalid_argument on an empty argv. Timeouts above kMaxTimeout are
// clamped to it.
auto run_process(const std::vector<std::string> &argv, std::chrono::milliseconds timeout,
                 const std::vector<EnvOverride> &env = {}) -> ProcessResult;

} // namespace repocheck
