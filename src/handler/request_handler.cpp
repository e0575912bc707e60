#include "handler/request_handler.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>

#include "handler/parsing.hpp"

namespace ferry {

std::pair<std::unique_ptr<RequestHandler>, ResponseFuture> RequestHandler::create(RequestBody body,
                                                                                  std::size_t response_buffer_size) {
  auto shared = std::make_shared<detail::SharedState>();
  auto [reader, writer] = make_pipe(response_buffer_size);

  std::unique_ptr<RequestHandler> handler(new RequestHandler(shared, std::move(body), std::move(writer)));
  ResponseFuture future(std::move(shared), std::move(reader));

  return {std::move(handler), std::move(future)};
}

RequestHandler::RequestHandler(std::shared_ptr<detail::SharedState> shared, RequestBody body, PipeWriter writer)
    : shared_(std::move(shared)), request_body_(std::move(body)), response_body_writer_(std::move(writer)) {}

RequestHandler::~RequestHandler() {
  // Dropped before the transfer finished (agent shutting down, or the
  // transfer never started). Resolve the future so nobody waits forever.
  if (!response_sent_) {
    response_sent_ = true;
    if (!shared_->send_response(Result<ResponseParts>::failure(Error::aborted("transfer dropped before completion")))) {
      spdlog::trace("[{}] handler dropped after the future was canceled", token_ ? std::to_string(*token_) : "-");
    }
  }

  trailer_.publish(std::move(trailer_headers_));
}

void RequestHandler::init(TransferToken token, Waker request_waker, Waker response_waker, const TransferInfo* info) {
  if (is_initialized()) {
    spdlog::warn("[{}] request handler initialized more than once", token);
  }

  token_ = token;
  shared_->set_token(token);
  request_body_waker_ = std::move(request_waker);
  response_body_waker_ = std::move(response_waker);
  info_ = info;
}

bool RequestHandler::on_header(std::string_view line) {
  // Abort the request if it has been canceled
  if (is_future_canceled()) {
    return false;
  }

  // If we already returned the response head, this header is from the
  // trailer
  if (response_sent_) {
    if (auto header = parse_header(line)) {
      trailer_headers_.append(std::move(header->first), std::move(header->second));
      return true;
    }
  }

  // The engine hands us every line of the response head without saying what
  // it is, so classify it just as if we were reading from the socket.
  if (auto status = parse_status_line(line)) {
    response_version_ = status->first;
    response_status_ = status->second;

    // Drop headers left over from an intermediate response
    response_headers_.clear();
    return true;
  }

  if (auto header = parse_header(line)) {
    response_headers_.append(std::move(header->first), std::move(header->second));
    return true;
  }

  if (is_header_terminator(line)) {
    // End of this header block. The future can't be completed yet: if the
    // engine follows a redirect, this response is not the final one. It is
    // completed on the first body byte or when the transfer finishes.
    return true;
  }

  spdlog::debug("[{}] unparseable response header line", token_ ? std::to_string(*token_) : "-");
  return false;
}

CallbackIo RequestHandler::on_read(char* buf, std::size_t len) {
  // Abort the request if it has been canceled
  if (is_future_canceled()) {
    return CallbackIo::abort();
  }

  if (!request_body_waker_) {
    // The transfer should never be started without calling init first
    spdlog::error("request has not been initialized!");
    return CallbackIo::abort();
  }

  IoPoll poll = request_body_.poll_read(buf, len, *request_body_waker_);

  if (poll.is_pending()) {
    return CallbackIo::pause();
  }

  if (poll.is_error()) {
    spdlog::error("[{}] error reading request body: {}", *token_, poll.error.message());

    // Record the precise cause now; otherwise the caller only sees the
    // engine's generic read error
    if (!shared_->set_outcome(Error(ErrorKind::RequestBodyError, poll.error.message()))) {
      spdlog::debug("[{}] attempted to set result multiple times", *token_);
    }
    return CallbackIo::abort();
  }

  return CallbackIo::ok(poll.bytes);
}

SeekResult RequestHandler::on_seek(int64_t offset, int origin) {
  // Only rewinding to the very start is supported; anything else would need
  // an asynchronous seek, which this callback can't wait for
  if (offset == 0 && origin == SEEK_SET && request_body_.reset()) {
    spdlog::debug("[{}] request body rewound", token_ ? std::to_string(*token_) : "-");
    return SeekResult::Ok;
  }

  spdlog::warn("seek requested for request body, but it is not supported");
  return SeekResult::CantSeek;
}

CallbackIo RequestHandler::on_write(const char* data, std::size_t len) {
  spdlog::trace("[{}] received {} bytes of data", token_ ? std::to_string(*token_) : "-", len);

  // Receiving the body means no more redirects can happen, so the future can
  // be completed safely
  complete_response_future();

  if (!response_body_waker_) {
    spdlog::error("request has not been initialized!");
    return CallbackIo::ok(0);
  }

  IoPoll poll = response_body_writer_.poll_write(data, len, *response_body_waker_);

  if (poll.is_pending()) {
    return CallbackIo::pause();
  }

  if (poll.is_error()) {
    if (poll.error == std::errc::broken_pipe) {
      // Only HTTP/1.x loses the connection here
      if (response_version_ < HttpVersion::Http2) {
        spdlog::info(
            "response dropped without fully consuming the response body, connection won't be reused. "
            "Aborting a response without fully consuming the response body can result in sub-optimal performance.");
      }
    } else {
      spdlog::error("error writing response body to buffer: {}", poll.error.message());
    }

    // Zero bytes consumed tells the engine to stop
    return CallbackIo::ok(0);
  }

  return CallbackIo::ok(poll.bytes);
}

bool RequestHandler::on_progress(const TransferProgress& progress) {
  if (!metrics_) {
    metrics_.emplace();
  }
  metrics_->record(progress);
  return true;
}

void RequestHandler::on_result(std::optional<Error> error) {
  if (error) {
    if (info_) {
      if (auto addr = info_->local_addr()) {
        error->with_local_addr(*addr);
      }
      if (auto addr = info_->remote_addr()) {
        error->with_remote_addr(*addr);
      }
    }
  }

  if (!shared_->set_outcome(std::move(error))) {
    spdlog::debug("[{}] attempted to set result multiple times", token_ ? std::to_string(*token_) : "-");
  }

  // Flush the trailer, if we haven't already
  trailer_.publish(std::move(trailer_headers_));
  trailer_headers_.clear();

  complete_response_future();
}

void RequestHandler::complete_response_future() {
  if (response_sent_) {
    return;
  }
  response_sent_ = true;

  // If the transfer already failed early, report that instead
  Result<ResponseParts> result = [&] {
    if (shared_->is_completed()) {
      if (auto error = shared_->outcome_error()) {
        spdlog::warn("request completed with error: {}", error->message());
        return Result<ResponseParts>::failure(std::move(*error));
      }
    }
    return Result<ResponseParts>::success(build_response());
  }();

  if (!shared_->send_response(std::move(result))) {
    spdlog::debug("request canceled by user");
  }
}

ResponseParts RequestHandler::build_response() {
  ResponseParts parts;

  parts.status = response_status_.value_or(0);
  parts.version = response_version_;
  parts.headers = std::move(response_headers_);
  response_headers_.clear();

  if (info_) {
    parts.local_addr = info_->local_addr();
    parts.remote_addr = info_->remote_addr();
  }

  // Include metrics only if they were collected
  parts.metrics = metrics_;
  parts.trailer = trailer_;

  return parts;
}

}  // namespace ferry
