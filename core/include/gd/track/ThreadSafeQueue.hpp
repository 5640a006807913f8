#pragma once
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace gd {

// Bounded FIFO shared between a producer thread and the host thread.
// When full, the oldest item is discarded and counted.
template <typename T>
class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(std::size_t maxCapacity = 64)
      : maxCap_(maxCapacity > 0 ? maxCapacity : 1) {}

  void push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.size() >= maxCap_) {
      queue_.pop_front();
      dropped_++;
    }
    queue_.push_back(std::move(item));
  }

  // Takes everything queued so far in one lock.
  std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<T> out(std::make_move_iterator(queue_.begin()),
                       std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
  }

  std::size_t dropped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.clear();
  }

private:
  mutable std::mutex mtx_;
  std::deque<T> queue_;
  std::size_t maxCap_;
  std::size_t dropped_{0};
};

} // namespace gd
