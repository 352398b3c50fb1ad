#pragma once
#include "repocheck/outcome.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace repocheck {

// Index-keyed, write-once result sink. Candidate i must carry index i. Workers write disjoint slots without
// locking; only the completion counter is guarded.
class ResultAggregator {
public:
  explicit ResultAggregator(std::vector<Candidate> candidates);

  ResultAggregator(const ResultAggregator &) = delete;
  auto operator=(const ResultAggregator &) -> ResultAggregator & = delete;

  // Throws std::out_of_range on a bad index, std::logic_error on a second
  // write to the same index.
  void record(std::size_t index, Outcome outcome);

  [[nodiscard]] auto expected() const -> std::size_t { return candidates_.size(); }
  [[nodiscard]] auto count() const -> std::size_t;
  [[nodiscard]] auto complete() const -> bool { return count() == expected(); }
  [[nodiscard]] auto is_recorded(std::size_t index) const -> bool;

  // The completion gate.
  void wait() const;
  [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const -> bool;

  // Ordered records; throws std::logic_error unless complete().
  [[nodiscard]] auto records() const -> std::vector<ResultRecord>;
  // Ordered records of whatever is recorded so far; others have no outcome.
  [[nodiscard]] auto snapshot() const -> std::vector<ResultRecord>;

  [[nodiscard]] auto candidates() const -> const std::vector<Candidate> & { return candidates_; }

private:
  enum slot_state : std::uint8_t { kEmpty, kWriting, kReady };

  struct Slot {
    std::atomic<std::uint8_t> state{kEmpty};
    std::optional<Outcome> outcome;
  };

  std::vector<Candidate> candidates_;
  std::unique_ptr<Slot[]> slots_;

  mutable std::mutex mu_;
  mutable std::condition_variable done_;
  std::size_t recorded_{0};
};

} // namespace repocheck
