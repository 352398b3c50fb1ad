#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace repocheck {

// Fixed set of threads draining one FIFO queue. Threads start in the
// constructor and are joined by join() or the destructor.
class WorkerPool {
public:
  using task = std::function<void()>;

  // 0 picks std::thread::hardware_concurrency()
  explicit WorkerPool(std::size_t threads = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  auto operator=(const WorkerPool &) -> WorkerPool & = delete;

  void submit(task t);

  // Drop every queued task; returns how many were dropped.
  auto cancel() -> std::size_t;

  // Finish queued and running tasks, then stop the threads. Idempotent.
  void join();

  [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }
  [[nodiscard]] auto failed_tasks() const -> std::size_t { return failed_.load(); }

  static auto default_size() -> std::size_t;

private:
  void worker_loop();

  std::mutex mu_;
  std::condition_variable work_available_;
  std::deque<task> queue_;
  bool stopping_{false};
  std::atomic<std::size_t> failed_{0};
  std::vector<std::thread> workers_;
};

} // namespace repocheck
