// result_channel.hpp
#pragma once
#include <condition_variable>
#include <mutex>
#include <queue>

// Unbounded multi-producer / single-consumer channel used to hand results
// from pool workers back to the driving thread.
template <typename T> class ResultChannel {
public:
  void push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return;
      queue_.push(std::move(value));
    }
    cond_.notify_one();
  }

  // Blocks until a value is available. Returns false once the channel is
  // closed and drained.
  bool pop(T &out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
    if (queue_.empty())
      return false;
    out = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cond_.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  std::queue<T> queue_;
  mutable std::mutex mutex_;
  std::condition_variable cond_;
  bool closed_ = false;
};
