#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace ferry {

// A handle that, when invoked, schedules a suspended consumer to make progress.
//
// Copies share the same underlying callback. Wakers may be invoked from any
// thread, any number of times.
class Waker {
 public:
  Waker() = default;

  explicit Waker(std::function<void()> fn) : fn_(std::make_shared<const std::function<void()>>(std::move(fn))) {}

  // A waker that does nothing
  static Waker noop() {
    return Waker();
  }

  void wake() const {
    if (fn_ && *fn_) {
      (*fn_)();
    }
  }

  // Create a new waker that calls `fn` with this waker as its argument.
  // Used to run a side effect (e.g. queueing a message) before waking the
  // inner waker.
  Waker chain(std::function<void(const Waker&)> fn) const;

  explicit operator bool() const {
    return fn_ != nullptr;
  }

 private:
  std::shared_ptr<const std::function<void()>> fn_;
};

// Parks the calling thread until its waker fires. Backs the blocking
// convenience calls on futures and bodies.
class ThreadParker {
 public:
  ThreadParker();

  const Waker& waker() const {
    return waker_;
  }

  // Block until woken; a wake that happened before park() is not lost
  void park();

  template <typename Rep, typename Period>
  bool park_for(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    bool woken = state_->cv.wait_for(lock, timeout, [this] { return state_->notified; });
    state_->notified = false;
    return woken;
  }

 private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool notified = false;
  };

  std::shared_ptr<State> state_;
  Waker waker_;
};

}  // namespace ferry
