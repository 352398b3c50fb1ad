#pragma once
#include "repocheck/inspector.hpp"
#include "repocheck/outcome.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <vector>

namespace repocheck {

// Run-level cancellation flag. request() is async-signal-safe.
class CancelToken {
public:
  void request() noexcept { flag_.store(true, std::memory_order_relaxed); }
  [[nodiscard]] auto requested() const noexcept -> bool {
    return flag_.load(std::memory_order_relaxed);
  }

private:
  std::atomic<bool> flag_{false};
};

struct SchedulerOptions {
  std::size_t max_workers{0}; // 0 = available processing units
  std::chrono::milliseconds poll_interval{50}; // how often the gate checks for cancellation
};

struct RunResult {
  std::vector<ResultRecord> records; // candidate order
  bool complete{false};              // false only after cancellation
};

// Called on the worker thread right after a record is written.
using progress_fn = std::function<void(const ResultRecord &record)>;

class Scheduler {
public:
  Scheduler(SchedulerOptions options, inspect_fn inspect);

  // Inspect every candidate on a pool of at most max_workers threads. Blocks
  // until all outcomes are recorded or `cancel` is requested; the pool is
  // drained and joined before returning.
  auto run(const std::vector<Candidate> &candidates, const CancelToken &cancel,
           const progress_fn &on_progress = {}) const -> RunResult;

  auto run(const std::vector<Candidate> &candidates) const -> RunResult;

  [[nodiscard]] auto worker_count(std::size_t candidates) const -> std::size_t;

private:
  SchedulerOptions options_;
  inspect_fn inspect_;
};

} // namespace repocheck
