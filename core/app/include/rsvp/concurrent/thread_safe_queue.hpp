#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace rsvp {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO that multiple threads push to and pop from
// without data races. Blocking pop() waits until an item is available;
// try_pop() returns immediately.
//
// Usage: The IPC server's telemetry path. Service threads publish ledger
// events on the bus; the IpcServer subscriber pushes them here, and the IPC
// thread drains the queue onto the PUB socket. The service thread never
// touches a ZeroMQ socket.
//
// Thread model: Safe for multiple producers and multiple consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable, non-movable: owns a mutex and a condition_variable. Share
  // by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one thread blocked in pop(), if any.
  // T is taken by value so callers can std::move into the queue.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer does not immediately
    // block on the same mutex.
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // Removes and returns the front item, waiting while the queue is empty.
  // The predicate form of wait() handles spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  // Returns the front item, or std::nullopt if the queue is empty.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may push or pop right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;  // Signalled on push ("not empty").
  std::deque<T> queue_;
};

}  // namespace rsvp
