#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "ferry/core/waker.hpp"
#include "ferry/net/pipe.hpp"

namespace ferry {

namespace detail {
struct SharedState;
}

// Body of an outgoing request: empty, an in-memory buffer, or a stream fed
// through a pipe
class RequestBody {
 public:
  RequestBody() = default;

  RequestBody(std::string bytes) : inner_(Bytes{std::move(bytes), 0}) {}

  RequestBody(const char* bytes) : RequestBody(std::string(bytes)) {}

  // Stream the body from a pipe. The engine is paused whenever the pipe has
  // no data and resumed when the writer supplies more.
  static RequestBody from_reader(PipeReader reader, std::optional<uint64_t> length = std::nullopt);

  bool is_empty() const {
    return length() == std::optional<uint64_t>(0);
  }

  // Size of the body, if known
  std::optional<uint64_t> length() const;

  // Whether reset() can rewind the body to its start
  bool is_rewindable() const {
    return !std::holds_alternative<Stream>(inner_);
  }

  IoPoll poll_read(char* buf, std::size_t len, const Waker& waker);

  // Rewind to the start so the body can be sent again. Returns false for
  // streams.
  bool reset();

 private:
  struct Bytes {
    std::string data;
    std::size_t pos = 0;
  };

  struct Stream {
    PipeReader reader;
    std::optional<uint64_t> length;
  };

  std::variant<std::monostate, Bytes, Stream> inner_;
};

// Streamed body of a response.
//
// Reaching the end of the stream without the transfer having finished
// cleanly is reported as `connection_aborted` rather than a silent EOF.
// Destroying the body before the end cancels the rest of the transfer.
class ResponseBody {
 public:
  ResponseBody() = default;

  ResponseBody(PipeReader reader, std::shared_ptr<detail::SharedState> shared);

  IoPoll poll_read(char* buf, std::size_t len, const Waker& waker);

  // Blocking read; 0 at a clean end of stream. Throws std::system_error on
  // abnormal termination.
  std::size_t read(char* buf, std::size_t len);

  // Read the remainder of the body into a string
  std::string text();

  // Read and discard the remainder of the body, returning the byte count
  uint64_t consume();

  // Stop reading; the engine is told to abort at its next write
  void close();

 private:
  PipeReader reader_;
  std::shared_ptr<detail::SharedState> shared_;
};

}  // namespace ferry
