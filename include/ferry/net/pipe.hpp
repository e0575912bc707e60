#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <system_error>
#include <utility>

#include "ferry/core/waker.hpp"

namespace ferry {

// Outcome of a non-blocking read or write attempt
struct IoPoll {
  enum class Status { Ready, Pending };

  Status status = Status::Ready;
  std::size_t bytes = 0;
  std::error_code error;

  static IoPoll ready(std::size_t n) {
    return IoPoll{Status::Ready, n, {}};
  }

  static IoPoll pending() {
    return IoPoll{Status::Pending, 0, {}};
  }

  static IoPoll failed(std::error_code ec) {
    return IoPoll{Status::Ready, 0, ec};
  }

  bool is_pending() const {
    return status == Status::Pending;
  }

  bool is_error() const {
    return static_cast<bool>(error);
  }
};

namespace detail {
struct PipeState;
}

class PipeReader;
class PipeWriter;

// Create a bounded in-memory byte pipe. `capacity` is a soft limit: a write
// is accepted whole as long as the buffer is below capacity.
std::pair<PipeReader, PipeWriter> make_pipe(std::size_t capacity = 64 * 1024);

// Reading end of a pipe. Closing or destroying it makes further writes fail
// with `broken_pipe`.
class PipeReader {
 public:
  PipeReader() = default;
  ~PipeReader();

  PipeReader(PipeReader&& other) noexcept = default;
  PipeReader& operator=(PipeReader&& other) noexcept;
  PipeReader(const PipeReader&) = delete;
  PipeReader& operator=(const PipeReader&) = delete;

  // Copy buffered bytes into `buf`. Returns 0 bytes at end of stream (writer
  // closed, buffer drained); pending if no data yet, in which case `waker` is
  // invoked once data arrives or the writer closes.
  IoPoll poll_read(char* buf, std::size_t len, const Waker& waker);

  // Blocking read; 0 at end of stream
  std::size_t read(char* buf, std::size_t len);

  void close();

  bool valid() const {
    return state_ != nullptr;
  }

 private:
  friend std::pair<PipeReader, PipeWriter> make_pipe(std::size_t);

  explicit PipeReader(std::shared_ptr<detail::PipeState> state) : state_(std::move(state)) {}

  std::shared_ptr<detail::PipeState> state_;
};

// Writing end of a pipe. Closing or destroying it signals end of stream.
class PipeWriter {
 public:
  PipeWriter() = default;
  ~PipeWriter();

  PipeWriter(PipeWriter&& other) noexcept = default;
  PipeWriter& operator=(PipeWriter&& other) noexcept;
  PipeWriter(const PipeWriter&) = delete;
  PipeWriter& operator=(const PipeWriter&) = delete;

  // Append `data` if the buffer is below capacity. Pending otherwise, in
  // which case `waker` is invoked once the reader frees space or goes away.
  // Fails with `broken_pipe` once the reader is closed.
  IoPoll poll_write(const char* data, std::size_t len, const Waker& waker);

  // Blocking write of the whole buffer; throws std::system_error on a
  // broken pipe
  void write(std::string_view data);

  void close();

  bool is_reader_closed() const;

  bool valid() const {
    return state_ != nullptr;
  }

 private:
  friend std::pair<PipeReader, PipeWriter> make_pipe(std::size_t);

  explicit PipeWriter(std::shared_ptr<detail::PipeState> state) : state_(std::move(state)) {}

  std::shared_ptr<detail::PipeState> state_;
};

}  // namespace ferry
