#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace ferry {

// Unbounded multi-producer, single-consumer queue.
//
// Messages from one producer are received in send order. Once closed, sends
// fail and anything still queued is dropped by the closer.
template <typename T>
class Channel {
 public:
  enum class RecvStatus { Ok, Empty, Closed };

  // Returns false if the channel is closed; the message is handed back
  bool send(T& value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  bool send(T&& value) {
    T tmp = std::move(value);
    return send(tmp);
  }

  RecvStatus try_recv(T& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty()) {
      out = std::move(queue_.front());
      queue_.pop_front();
      return RecvStatus::Ok;
    }
    return closed_ ? RecvStatus::Closed : RecvStatus::Empty;
  }

  // Block until a message arrives or the channel closes
  std::optional<T> recv() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Close the channel and return whatever was still queued so the caller can
  // dispose of it outside the lock
  std::deque<T> close() {
    std::deque<T> remaining;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      remaining.swap(queue_);
    }
    cv_.notify_all();
    return remaining;
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool closed_ = false;
};

}  // namespace ferry
