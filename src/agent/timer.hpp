#pragma once

#include <chrono>
#include <optional>

namespace ferry {

// Single-shot deadline requested by the engine. Starting it again replaces
// the previous deadline.
class Timer {
 public:
  using Clock = std::chrono::steady_clock;

  void start(Clock::duration duration, Clock::time_point now = Clock::now()) {
    deadline_ = now + duration;
  }

  void stop() {
    deadline_.reset();
  }

  bool is_armed() const {
    return deadline_.has_value();
  }

  bool is_expired(Clock::time_point now = Clock::now()) const {
    return deadline_ && now >= *deadline_;
  }

  // Time left until the deadline, zero once it has passed; nullopt when
  // the timer is not running
  std::optional<Clock::duration> get_remaining(Clock::time_point now = Clock::now()) const {
    if (!deadline_) {
      return std::nullopt;
    }
    if (now >= *deadline_) {
      return Clock::duration::zero();
    }
    return *deadline_ - now;
  }

 private:
  std::optional<Clock::time_point> deadline_;
};

}  // namespace ferry
