#include "repocheck/worker_pool.hpp"

#include "repocheck/consts.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace repocheck {

auto WorkerPool::default_size() -> std::size_t {
  const unsigned n = std::thread::hardware_concurrency();
  return n == 0 ? consts::kFallbackWorkers : n;
}

WorkerPool::WorkerPool(std::size_t threads) {
  if (threads == 0)
    threads = default_size();
  workers_.reserve(threads);
  try {
    for (std::size_t i = 0; i < threads; ++i)
      workers_.emplace_back(&WorkerPool::worker_loop, this);
  } catch (const std::system_error &) {
    // the destructor does not run for a partly built pool
    join();
    throw;
  }
}

WorkerPool::~WorkerPool() { join(); }

void WorkerPool::submit(task t) {
  {
    std::lock_guard lock(mu_);
    if (stopping_)
      throw std::logic_error("WorkerPool::submit after join");
    queue_.push_back(std::move(t));
  }
  work_available_.notify_one();
}

auto WorkerPool::cancel() -> std::size_t {
  std::lock_guard lock(mu_);
  const std::size_t dropped = queue_.size();
  queue_.clear();
  return dropped;
}

void WorkerPool::join() {
  {
    std::lock_guard lock(mu_);
    stopping_ = true;
  }
  work_available_.notify_all();
  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }
}

void WorkerPool::worker_loop() {
  while (true) {
    task t;
    {
      std::unique_lock lock(mu_);
      work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty())
        return; // stopping and drained
      t = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      t();
    } catch (const std::exception &e) {
      ++failed_;
      std::cerr << "worker: task failed: " << e.what() << "\n";
    }
  }
}

} // namespace repocheck
