#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/core/types.hpp"
#include "ferry/core/waker.hpp"
#include "ferry/net/body.hpp"
#include "ferry/net/headers.hpp"
#include "ferry/net/metrics.hpp"
#include "ferry/net/pipe.hpp"
#include "ferry/net/response.hpp"
#include "handler/shared_state.hpp"

namespace ferry {

// Connection details the engine can report about a running transfer
class TransferInfo {
 public:
  virtual ~TransferInfo() = default;

  virtual std::optional<std::string> local_addr() const = 0;

  virtual std::optional<std::string> remote_addr() const = 0;
};

// What a body callback tells the engine
struct CallbackIo {
  enum class Action { Continue, Pause, Abort };

  Action action = Action::Continue;
  std::size_t bytes = 0;

  static CallbackIo ok(std::size_t n) {
    return CallbackIo{Action::Continue, n};
  }

  static CallbackIo pause() {
    return CallbackIo{Action::Pause, 0};
  }

  static CallbackIo abort() {
    return CallbackIo{Action::Abort, 0};
  }
};

enum class SeekResult { Ok, Fail, CantSeek };

// Manages the state of a single request/response life cycle.
//
// The engine invokes the on_* callbacks on the agent thread while the
// transfer runs; the handler incrementally builds the response and resolves
// the associated ResponseFuture once the final response head is known (the
// first body byte, or completion, whichever comes first). Body bytes are
// streamed to the caller through a bounded pipe, with backpressure mapped to
// the engine's pause mechanism.
//
// If destroyed before the response is finished, the future resolves with an
// Aborted error and a body reader sees `connection_aborted`.
class RequestHandler {
 public:
  // Create a handler plus the future that observes it
  static std::pair<std::unique_ptr<RequestHandler>, ResponseFuture> create(RequestBody body,
                                                                           std::size_t response_buffer_size = 64 * 1024);

  ~RequestHandler();

  RequestHandler(const RequestHandler&) = delete;
  RequestHandler& operator=(const RequestHandler&) = delete;

  // Called once by the agent when the transfer is registered with the engine.
  // The wakers resume paused request-body reads and response-body writes.
  void init(TransferToken token, Waker request_waker, Waker response_waker, const TransferInfo* info = nullptr);

  bool is_initialized() const {
    return request_body_waker_.has_value();
  }

  std::optional<TransferToken> token() const {
    return token_;
  }

  // --- Engine callbacks ---

  // One line of the response head: status line, header, or the blank
  // terminator. Returns false to abort the transfer.
  bool on_header(std::string_view line);

  // Engine wants request body bytes
  CallbackIo on_read(char* buf, std::size_t len);

  // Engine wants to rewind the request body (e.g. to replay it after a
  // redirect). `origin` takes SEEK_SET/SEEK_CUR/SEEK_END.
  SeekResult on_seek(int64_t offset, int origin);

  // Engine delivered response body bytes
  CallbackIo on_write(const char* data, std::size_t len);

  bool on_progress(const TransferProgress& progress);

  // Final result of the transfer
  void on_result(std::optional<Error> error);

  // True if the caller dropped the future before it resolved
  bool is_future_canceled() const {
    return !response_sent_ && shared_->is_future_dropped();
  }

  const RequestBody& request_body() const {
    return request_body_;
  }

 private:
  RequestHandler(std::shared_ptr<detail::SharedState> shared, RequestBody body, PipeWriter writer);

  // Resolve the future with the response head received so far, unless
  // already done
  void complete_response_future();

  ResponseParts build_response();

  std::shared_ptr<detail::SharedState> shared_;
  std::optional<TransferToken> token_;

  // Set once the future has been resolved (or resolution was attempted)
  bool response_sent_ = false;

  RequestBody request_body_;
  std::optional<Waker> request_body_waker_;

  std::optional<int> response_status_;
  HttpVersion response_version_ = HttpVersion::Unknown;
  Headers response_headers_;

  PipeWriter response_body_writer_;
  std::optional<Waker> response_body_waker_;

  Trailer trailer_;
  Headers trailer_headers_;

  // Created on the first progress update
  std::optional<Metrics> metrics_;

  const TransferInfo* info_ = nullptr;

};

}  // namespace ferry
