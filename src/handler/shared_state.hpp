#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <system_error>

#include "ferry/core/types.hpp"
#include "ferry/core/waker.hpp"
#include "ferry/net/response.hpp"

namespace ferry::detail {

// State shared between a RequestHandler (agent side) and the future and body
// it produced (caller side). Lives until both sides drop it.
struct SharedState {
  // Token assigned by the agent; unset until the transfer is initialized
  std::optional<TransferToken> token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
  }

  void set_token(TransferToken token) {
    std::lock_guard<std::mutex> lock(mutex_);
    token_ = token;
  }

  // --- Transfer outcome ---

  // Record the final result of the transfer. Only the first call wins.
  bool set_outcome(std::optional<Error> error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed_) {
      return false;
    }
    completed_ = true;
    error_ = std::move(error);
    return true;
  }

  bool is_completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
  }

  std::optional<Error> outcome_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
  }

  // Error a body reader should see on EOF; empty for a clean finish
  std::error_code eof_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!completed_) {
      return std::make_error_code(std::errc::connection_aborted);
    }
    return error_ ? error_->to_error_code() : std::error_code{};
  }

  // --- Response future slot ---

  // Deliver the response head. Returns false if the future is gone.
  bool send_response(Result<ResponseParts> result) {
    std::optional<Waker> to_wake;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (future_dropped_.load()) {
        return false;
      }
      response_ = std::move(result);
      to_wake = std::move(future_waker_);
      future_waker_.reset();
    }
    if (to_wake) {
      to_wake->wake();
    }
    return true;
  }

  // Take the response if it arrived, otherwise remember the waker
  std::optional<Result<ResponseParts>> poll_response(const Waker& waker) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (response_) {
      auto result = std::move(response_);
      response_.reset();
      response_taken_ = true;
      return result;
    }
    future_waker_ = waker;
    return std::nullopt;
  }

  // True if the response arrived; otherwise remember the waker without
  // taking anything
  bool watch_response(const Waker& waker) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (response_) {
      return true;
    }
    future_waker_ = waker;
    return false;
  }

  bool has_response() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return response_.has_value();
  }

  bool response_taken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return response_taken_;
  }

  void drop_future() {
    std::lock_guard<std::mutex> lock(mutex_);
    future_dropped_.store(true);
    future_waker_.reset();
    response_.reset();
  }

  bool is_future_dropped() const {
    return future_dropped_.load();
  }

 private:
  mutable std::mutex mutex_;
  std::optional<TransferToken> token_;

  bool completed_ = false;
  std::optional<Error> error_;

  std::optional<Result<ResponseParts>> response_;
  bool response_taken_ = false;
  std::atomic<bool> future_dropped_{false};
  std::optional<Waker> future_waker_;
};

}  // namespace ferry::detail
