#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "ferry/core/types.hpp"
#include "ferry/core/waker.hpp"
#include "ferry/net/body.hpp"
#include "ferry/net/headers.hpp"
#include "ferry/net/metrics.hpp"

namespace ferry {

// Trailer headers of a response. They are only known once the body has been
// fully received, so the handle is available up front and fills in later.
class Trailer {
 public:
  Trailer();

  bool is_ready() const;

  // Trailer headers, or nullopt if the transfer hasn't ended yet
  std::optional<Headers> try_get() const;

  // Block until the transfer ends
  Headers wait() const;

  template <typename Rep, typename Period>
  std::optional<Headers> wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
    return wait_until(std::chrono::steady_clock::now() + timeout);
  }

  // Publish the trailer; later calls are ignored
  void publish(Headers headers);

 private:
  std::optional<Headers> wait_until(std::chrono::steady_clock::time_point deadline) const;

  struct State;
  std::shared_ptr<State> state_;
};

// Everything about a response except its body
struct ResponseParts {
  int status = 0;
  HttpVersion version = HttpVersion::Unknown;
  Headers headers;
  std::optional<std::string> local_addr;
  std::optional<std::string> remote_addr;
  std::optional<Metrics> metrics;
  Trailer trailer;
};

class Response {
 public:
  Response(ResponseParts parts, ResponseBody body) : parts_(std::move(parts)), body_(std::move(body)) {}

  int status() const {
    return parts_.status;
  }

  bool ok() const {
    return parts_.status >= 200 && parts_.status < 300;
  }

  HttpVersion version() const {
    return parts_.version;
  }

  const Headers& headers() const {
    return parts_.headers;
  }

  const std::optional<std::string>& local_addr() const {
    return parts_.local_addr;
  }

  const std::optional<std::string>& remote_addr() const {
    return parts_.remote_addr;
  }

  // Present only when metrics were enabled for the request
  const std::optional<Metrics>& metrics() const {
    return parts_.metrics;
  }

  const Trailer& trailer() const {
    return parts_.trailer;
  }

  ResponseBody& body() {
    return body_;
  }

  // Read the whole body as a string
  std::string text() {
    return body_.text();
  }

 private:
  ResponseParts parts_;
  ResponseBody body_;
};

// Resolves once with the response head (or an error) of a submitted transfer.
//
// Destroying the future before it resolves cancels the transfer: the next
// engine callback for it requests an abort.
class ResponseFuture {
 public:
  ResponseFuture() = default;
  ResponseFuture(std::shared_ptr<detail::SharedState> shared, PipeReader body);
  ~ResponseFuture();

  ResponseFuture(ResponseFuture&& other) noexcept = default;
  ResponseFuture& operator=(ResponseFuture&& other) noexcept;
  ResponseFuture(const ResponseFuture&) = delete;
  ResponseFuture& operator=(const ResponseFuture&) = delete;

  // Take the result if it is available; otherwise `waker` is invoked once it
  // is. Must not be called again after it returned a value.
  std::optional<Result<Response>> poll(const Waker& waker);

  bool is_ready() const;

  // Wait up to `timeout` for the result; true if it is ready
  bool wait_for(std::chrono::milliseconds timeout) const;

  // Block until the result is available and take it
  Result<Response> get();

  bool valid() const {
    return shared_ != nullptr;
  }

 private:
  void cancel();

  std::shared_ptr<detail::SharedState> shared_;
  PipeReader body_;
};

}  // namespace ferry
