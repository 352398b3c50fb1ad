#include "repocheck/aggregator.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace repocheck {

ResultAggregator::ResultAggregator(std::vector<Candidate> candidates)
    : candidates_{std::move(candidates)},
      slots_{std::make_unique<Slot[]>(candidates_.size())} {
  for (std::size_t i = 0; i < candidates_.size(); ++i) {
    if (candidates_[i].index != i)
      throw std::invalid_argument("ResultAggregator: candidate " + candidates_[i].name +
                                  " has index " + std::to_string(candidates_[i].index) +
                                  ", expected " + std::to_string(i));
  }
}

void ResultAggregator::record(std::size_t index, Outcome outcome) {
  if (index >= candidates_.size())
    throw std::out_of_range("record: index " + std::to_string(index) + " out of range");

  Slot &slot = slots_[index];
  std::uint8_t expected_state = kEmpty;
  if (!slot.state.compare_exchange_strong(expected_state, kWriting, std::memory_order_acq_rel))
    throw std::logic_error("record: index " + std::to_string(index) + " written twice");
  slot.outcome = std::move(outcome);
  slot.state.store(kReady, std::memory_order_release);

  bool now_complete = false;
  {
    std::lock_guard lock(mu_);
    now_complete = ++recorded_ == candidates_.size();
  }
  if (now_complete)
    done_.notify_all();
}

auto ResultAggregator::count() const -> std::size_t {
  std::lock_guard lock(mu_);
  return recorded_;
}

auto ResultAggregator::is_recorded(std::size_t index) const -> bool {
  return index < candidates_.size() &&
         slots_[index].state.load(std::memory_order_acquire) == kReady;
}

void ResultAggregator::wait() const {
  std::unique_lock lock(mu_);
  done_.wait(lock, [this] { return recorded_ == candidates_.size(); });
}

auto ResultAggregator::wait_for(std::chrono::milliseconds timeout) const -> bool {
  std::unique_lock lock(mu_);
  return done_.wait_for(lock, timeout, [this] { return recorded_ == candidates_.size(); });
}

auto ResultAggregator::records() const -> std::vector<ResultRecord> {
  if (!complete())
    throw std::logic_error("records: " + std::to_string(count()) + " of " +
                           std::to_string(expected()) + " outcomes recorded");
  return snapshot();
}

auto ResultAggregator::snapshot() const -> std::vector<ResultRecord> {
  std::vector<ResultRecord> out;
  out.reserve(candidates_.size());
  for (std::size_t i = 0; i < candidates_.size(); ++i) {
    ResultRecord rec{.candidate = candidates_[i], .outcome = std::nullopt};
    if (is_recorded(i))
      rec.outcome = slots_[i].outcome;
    out.push_back(std::move(rec));
  }
  return out;
}

} // namespace repocheck
