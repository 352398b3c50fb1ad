#include "repocheck/render.hpp"
#include "repocheck/scheduler.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using repocheck::Candidate;
using repocheck::Failed;
using repocheck::NotARepo;
using repocheck::Outcome;
using repocheck::RepoStatus;
using repocheck::Scheduler;
using repocheck::SchedulerOptions;

static std::vector<Candidate> make_candidates(std::size_t n) {
  std::vector<Candidate> out;
  for (std::size_t i = 0; i < n; ++i)
    out.push_back(Candidate{.index = i, .name = "dir" + std::to_string(i), .path = "/scan/dir" + std::to_string(i)});
  return out;
}

// Deterministic classification from the index alone.
static Outcome fake_outcome(const Candidate &c) {
  switch (c.index % 3) {
  case 0:
    return RepoStatus{.branch = "main", .dirty = false};
  case 1:
    return RepoStatus{.branch = "dev", .dirty = true};
  default:
    return NotARepo{};
  }
}

static bool in_order(const std::vector<repocheck::ResultRecord> &recs, std::size_t n) {
  if (recs.size() != n)
    return false;
  for (std::size_t i = 0; i < n; ++i)
    if (recs[i].candidate.index != i || recs[i].candidate.name != "dir" + std::to_string(i))
      return false;
  return true;
}

int main() {
  try {
    // 1) Coverage: each candidate inspected exactly once, N records
    {
      constexpr std::size_t n = 50;
      std::array<std::atomic<int>, n> calls{};
      Scheduler sched{SchedulerOptions{.max_workers = 4}, [&](const Candidate &c) {
                        ++calls[c.index];
                        return fake_outcome(c);
                      }};
      const auto res = sched.run(make_candidates(n));
      if (!res.complete || !in_order(res.records, n)) {
        std::cerr << "coverage: incomplete or misordered result\n";
        return 1;
      }
      for (std::size_t i = 0; i < n; ++i) {
        if (calls[i] != 1) {
          std::cerr << "candidate " << i << " inspected " << calls[i] << " times\n";
          return 1;
        }
        if (!res.records[i].outcome) {
          std::cerr << "candidate " << i << " has no outcome\n";
          return 1;
        }
      }
    }

    // 2) Ordering: earlier candidates finish last, output is still input order
    {
      constexpr std::size_t n = 8;
      std::mutex mu;
      std::vector<std::size_t> completion;
      Scheduler sched{SchedulerOptions{.max_workers = n}, [](const Candidate &c) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (n - c.index)));
                        return fake_outcome(c);
                      }};
      const repocheck::CancelToken never;
      const auto res = sched.run(make_candidates(n), never, [&](const repocheck::ResultRecord &r) {
        std::lock_guard lock(mu);
        completion.push_back(r.candidate.index);
      });
      if (!res.complete || !in_order(res.records, n)) {
        std::cerr << "ordering: records not in input order\n";
        return 1;
      }
      if (completion.size() != n) {
        std::cerr << "progress called " << completion.size() << " times\n";
        return 1;
      }
      for (std::size_t i = 0; i < n; ++i) {
        if (repocheck::outcome_label(res.records[i].outcome) !=
            repocheck::outcome_label(fake_outcome(res.records[i].candidate))) {
          std::cerr << "ordering: outcome attached to the wrong candidate at " << i << "\n";
          return 1;
        }
      }
    }

    // 3) Concurrency bound
    {
      std::atomic<int> in_flight{0}, peak{0};
      Scheduler sched{SchedulerOptions{.max_workers = 3}, [&](const Candidate &c) {
                        const int now = ++in_flight;
                        int prev = peak.load();
                        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                        }
                        std::this_thread::sleep_for(5ms);
                        --in_flight;
                        return fake_outcome(c);
                      }};
      const auto res = sched.run(make_candidates(30));
      if (!res.complete || peak > 3) {
        std::cerr << "bound: peak " << peak << " with max_workers 3\n";
        return 1;
      }
      if (sched.worker_count(2) != 2 || sched.worker_count(100) != 3) {
        std::cerr << "worker_count not clamped\n";
        return 1;
      }
    }

    // 4) Isolation: a throwing inspection becomes Failed for that candidate only
    {
      Scheduler sched{SchedulerOptions{.max_workers = 2}, [](const Candidate &c) -> Outcome {
                        if (c.index == 2)
                          throw std::runtime_error("simulated crash");
                        return fake_outcome(c);
                      }};
      const auto res = sched.run(make_candidates(6));
      if (!res.complete || !in_order(res.records, 6)) {
        std::cerr << "isolation: incomplete result\n";
        return 1;
      }
      const auto *f = std::get_if<Failed>(&*res.records[2].outcome);
      if (!f || f->reason != "simulated crash") {
        std::cerr << "isolation: candidate 2 not Failed\n";
        return 1;
      }
      for (std::size_t i : {0u, 1u, 3u, 4u, 5u}) {
        if (std::holds_alternative<Failed>(*res.records[i].outcome)) {
          std::cerr << "isolation: sibling " << i << " failed too\n";
          return 1;
        }
      }
    }

    // 5) max_workers 1 serializes: wall time is at least the sum
    {
      Scheduler sched{SchedulerOptions{.max_workers = 1}, [](const Candidate &c) {
                        std::this_thread::sleep_for(40ms);
                        return fake_outcome(c);
                      }};
      const auto t0 = std::chrono::steady_clock::now();
      const auto res = sched.run(make_candidates(5));
      const auto elapsed = std::chrono::steady_clock::now() - t0;
      if (!res.complete || elapsed < 200ms) {
        std::cerr << "serialized run took "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()
                  << "ms, expected >= 200ms\n";
        return 1;
      }
    }

    // 6) Cancellation: dispatch stops, partial result is returned
    {
      repocheck::CancelToken cancel;
      Scheduler sched{SchedulerOptions{.max_workers = 1, .poll_interval = 5ms},
                      [&](const Candidate &c) {
                        if (c.index == 1)
                          cancel.request();
                        std::this_thread::sleep_for(20ms);
                        return fake_outcome(c);
                      }};
      const auto res = sched.run(make_candidates(10), cancel);
      if (res.complete) {
        std::cerr << "cancel: run reported complete\n";
        return 1;
      }
      if (!in_order(res.records, 10) || !res.records[0].outcome || !res.records[1].outcome) {
        std::cerr << "cancel: finished candidates missing from partial result\n";
        return 1;
      }
      for (std::size_t i = 2; i < 10; ++i) {
        if (res.records[i].outcome) {
          std::cerr << "cancel: candidate " << i << " ran after cancellation\n";
          return 1;
        }
      }
      if (repocheck::outcome_label(res.records[9].outcome) != "pending") {
        std::cerr << "cancel: unfinished candidate not pending\n";
        return 1;
      }
    }

    // 7) Idempotence: two runs give identical labels
    {
      Scheduler sched{SchedulerOptions{}, fake_outcome};
      const auto a = sched.run(make_candidates(12));
      const auto b = sched.run(make_candidates(12));
      for (std::size_t i = 0; i < 12; ++i) {
        if (repocheck::outcome_label(a.records[i].outcome) !=
            repocheck::outcome_label(b.records[i].outcome)) {
          std::cerr << "idempotence: label differs at " << i << "\n";
          return 1;
        }
      }
    }

    // 8) Nothing to do
    {
      Scheduler sched{SchedulerOptions{}, fake_outcome};
      const auto res = sched.run({});
      if (!res.complete || !res.records.empty()) {
        std::cerr << "empty run not complete\n";
        return 1;
      }
    }

    std::cout << "scheduler OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
