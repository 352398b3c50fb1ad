#include "repocheck/scheduler.hpp"

#include "repocheck/aggregator.hpp"
#include "repocheck/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace repocheck {

Scheduler::Scheduler(SchedulerOptions options, inspect_fn inspect)
    : options_{options}, inspect_{std::move(inspect)} {
  if (!inspect_)
    throw std::invalid_argument("Scheduler: no inspect function");
}

auto Scheduler::worker_count(std::size_t candidates) const -> std::size_t {
  const std::size_t bound =
      options_.max_workers == 0 ? WorkerPool::default_size() : options_.max_workers;
  return std::max<std::size_t>(1, std::min(bound, candidates));
}

auto Scheduler::run(const std::vector<Candidate> &candidates) const -> RunResult {
  const CancelToken never;
  return run(candidates, never);
}

auto Scheduler::run(const std::vector<Candidate> &candidates, const CancelToken &cancel,
                    const progress_fn &on_progress) const -> RunResult {
  ResultAggregator results{candidates};
  if (candidates.empty())
    return RunResult{.records = {}, .complete = true};

  auto task = [this, &results, &cancel, &on_progress](const Candidate &c) {
    if (cancel.requested())
      return; // dispatched before the cancel, never started
    Outcome outcome;
    try {
      outcome = inspect_(c);
    } catch (const std::exception &e) {
      outcome = Failed{.reason = e.what()};
    }
    if (on_progress) {
      results.record(c.index, outcome);
      on_progress(ResultRecord{.candidate = c, .outcome = std::move(outcome)});
    } else {
      results.record(c.index, std::move(outcome));
    }
  };

  // Declared after `task` so it is joined before the task goes away.
  WorkerPool pool{worker_count(candidates.size())};

  // Dispatch in candidate order; the queue holds what the workers cannot take yet.
  for (const auto &c : results.candidates()) {
    if (cancel.requested())
      break;
    pool.submit([&task, &c] { task(c); });
  }

  // The single completion gate.
  while (!results.wait_for(options_.poll_interval)) {
    if (cancel.requested()) {
      pool.cancel();
      break;
    }
  }
  pool.join(); // in-flight inspections finish; each is bounded by its timeout
  return RunResult{.records = results.snapshot(), .complete = results.complete()};
}

} // namespace repocheck
