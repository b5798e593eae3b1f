#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace turf {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A closable FIFO shared by a producer and a pool of
// consumers. The evaluator pushes fold indices into it and its worker
// threads pop until the queue is closed and drained.
//
// Closing: after close(), push() is ignored, and pop() keeps returning the
// remaining items, then std::nullopt to every waiter. This is how a worker
// pool learns there is no more work without sentinel values.
//
// Thread model: Safe for multiple producers and multiple consumers. pop()
// blocks the calling thread; try_pop() never blocks.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // The mutex and condition variable pin the queue in place: share it by
  // reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends to the back and wakes one waiting consumer. Returns false (and
  // drops the value) once the queue has been closed.
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // Waits until an item is available or the queue is closed. Returns the
  // front item, or std::nullopt when the queue is closed and empty.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Non-blocking pop; std::nullopt when nothing is queued right now.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Rejects further pushes and releases every consumer blocked in pop().
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  // Snapshot only; another thread may change the queue immediately after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;          // Guards queue_ and closed_
  std::condition_variable condition_; // "item available or closed"
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace turf
