#include "ferry/core/waker.hpp"

namespace ferry {

Waker Waker::chain(std::function<void(const Waker&)> fn) const {
  Waker inner = *this;
  return Waker([inner, fn = std::move(fn)]() { fn(inner); });
}

ThreadParker::ThreadParker() : state_(std::make_shared<State>()) {
  std::weak_ptr<State> weak = state_;
  waker_ = Waker([weak]() {
    if (auto state = weak.lock()) {
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->notified = true;
      }
      state->cv.notify_one();
    }
  });
}

void ThreadParker::park() {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->cv.wait(lock, [this] { return state_->notified; });
  state_->notified = false;
}

}  // namespace ferry
