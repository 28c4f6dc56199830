#pragma once
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>
#include <vector>

namespace sc {

// Bounded multi-producer queue. push() refuses new items when full and leaves
// the refused item with the caller; queued items are never dropped.
template <typename T>
class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(std::size_t maxCapacity = 16)
      : maxCap_(maxCapacity) {}

  bool push(T&& item) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.size() >= maxCap_) return false;
    queue_.push(std::move(item));
    return true;
  }

  // Take everything queued so far in FIFO order.
  std::vector<T> popAll() {
    std::vector<T> out;
    std::lock_guard<std::mutex> lock(mtx_);
    out.reserve(queue_.size());
    while (!queue_.empty()) {
      out.push_back(std::move(queue_.front()));
      queue_.pop();
    }
    return out;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

private:
  mutable std::mutex mtx_;
  std::queue<T> queue_;
  std::size_t maxCap_;
};

} // namespace sc
