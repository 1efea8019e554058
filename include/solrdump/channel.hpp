// ============================================================================
// channel.hpp -- Blocking, closable FIFO between threads
//
// Channel<T> is a mutex/condvar queue with an optional capacity. push()
// blocks while the channel is full, pop() blocks while it is empty, and
// close() wakes everyone: pushes after close are refused and pop() keeps
// returning queued items until the queue is empty, then returns false.
//
// ResultChannel adapts a Channel<Result> to the ResultStream interface so
// the consumer can drain it.
// ============================================================================
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

#include "solrdump/result.hpp"

namespace solrdump {

template <class T>
class Channel {
public:
  /// @param capacity Max queued items; 0 = unbounded.
  explicit Channel(std::size_t capacity = 0) : cap_(capacity) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  /// Push an item, waiting for room if the channel is bounded.
  /// @return False if the channel was closed.
  bool push(T item) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_push_.wait(lk, [&]{ return cap_ == 0 || q_.size() < cap_ || closed_; });
    if (closed_) return false;
    q_.push_back(std::move(item));
    cv_pop_.notify_one();
    return true;
  }

  /// Pop the oldest item, waiting while the channel is open and empty.
  /// @return False once closed and empty.
  bool pop(T& out) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_pop_.wait(lk, [&]{ return !q_.empty() || closed_; });
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    cv_push_.notify_one();
    return true;
  }

  void close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    cv_pop_.notify_all();
    cv_push_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

private:
  mutable std::mutex      mu_;
  std::condition_variable cv_push_, cv_pop_;
  std::deque<T>           q_;
  std::size_t             cap_;
  bool                    closed_ = false;
};

// ============================================================================
// `ResultChannel` -- Channel<Result> exposed as a ResultStream
// ============================================================================
class ResultChannel : public ResultStream {
public:
  explicit ResultChannel(std::size_t capacity = 0) : ch_(capacity) {}

  bool push(Result r) { return ch_.push(std::move(r)); }
  void close() { ch_.close(); }
  bool closed() const { return ch_.closed(); }

  bool next(Result& out) override { return ch_.pop(out); }

private:
  Channel<Result> ch_;
};

} // namespace solrdump
