#include "ferry/net/response.hpp"

#include <condition_variable>
#include <mutex>

#include "handler/shared_state.hpp"

namespace ferry {

// --- Trailer ---

struct Trailer::State {
  mutable std::mutex mutex;
  mutable std::condition_variable cv;
  std::optional<Headers> headers;
};

Trailer::Trailer() : state_(std::make_shared<State>()) {}

bool Trailer::is_ready() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->headers.has_value();
}

std::optional<Headers> Trailer::try_get() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->headers;
}

Headers Trailer::wait() const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->cv.wait(lock, [this] { return state_->headers.has_value(); });
  return *state_->headers;
}

std::optional<Headers> Trailer::wait_until(std::chrono::steady_clock::time_point deadline) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->cv.wait_until(lock, deadline, [this] { return state_->headers.has_value(); });
  return state_->headers;
}

void Trailer::publish(Headers headers) {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->headers) {
      return;
    }
    state_->headers = std::move(headers);
  }
  state_->cv.notify_all();
}

// --- ResponseFuture ---

ResponseFuture::ResponseFuture(std::shared_ptr<detail::SharedState> shared, PipeReader body)
    : shared_(std::move(shared)), body_(std::move(body)) {}

ResponseFuture::~ResponseFuture() {
  cancel();
}

ResponseFuture& ResponseFuture::operator=(ResponseFuture&& other) noexcept {
  if (this != &other) {
    cancel();
    shared_ = std::move(other.shared_);
    body_ = std::move(other.body_);
  }
  return *this;
}

void ResponseFuture::cancel() {
  if (shared_ && !shared_->response_taken()) {
    shared_->drop_future();
  }
  shared_.reset();
  body_.close();
}

std::optional<Result<Response>> ResponseFuture::poll(const Waker& waker) {
  if (!shared_) {
    return Result<Response>::failure(Error(ErrorKind::Aborted, "response future already consumed"));
  }

  auto parts = shared_->poll_response(waker);
  if (!parts) {
    return std::nullopt;
  }

  auto shared = std::move(shared_);
  shared_.reset();

  if (parts->failed()) {
    body_.close();
    return Result<Response>::failure(std::move(*parts->error));
  }

  return Result<Response>::success(Response(std::move(*parts->value), ResponseBody(std::move(body_), std::move(shared))));
}

bool ResponseFuture::is_ready() const {
  return shared_ && shared_->has_response();
}

bool ResponseFuture::wait_for(std::chrono::milliseconds timeout) const {
  if (!shared_) {
    return false;
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  ThreadParker parker;

  while (!shared_->watch_response(parker.waker())) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    parker.park_for(deadline - now);
  }
  return true;
}

Result<Response> ResponseFuture::get() {
  ThreadParker parker;
  for (;;) {
    if (auto result = poll(parker.waker())) {
      return std::move(*result);
    }
    parker.park();
  }
}

}  // namespace ferry
