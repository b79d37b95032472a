#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace eclear {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// FIFO hand-off between threads. The clearing engine uses two of them:
//   - clearing runs (any caller thread) -> publication loop
//   - publication loop -> IpcServer telemetry
//
// Consumers either block (pop), wait with a bound (pop_for), or take
// everything queued at once (drain). Multiple producers and consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      items_.push_back(std::move(value));
    }
    not_empty_.notify_one();
  }

  // Waits without limit.
  T pop() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return !items_.empty(); });
    return takeFront();
  }

  // Waits at most `timeout`; std::nullopt if nothing arrived.
  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout,
                             [this] { return !items_.empty(); })) {
      return std::nullopt;
    }
    return takeFront();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    return takeFront();
  }

  // Removes every queued item in FIFO order under a single lock.
  std::vector<T> drain() {
    std::vector<T> out;
    std::lock_guard lock(mutex_);
    out.reserve(items_.size());
    while (!items_.empty()) {
      out.push_back(takeFront());
    }
    return out;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return items_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

 private:
  // Requires mutex_ held and items_ non-empty.
  T takeFront() {
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::deque<T> items_;
};

}  // namespace eclear
