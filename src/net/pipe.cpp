#include "ferry/net/pipe.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>

namespace ferry {

namespace detail {

struct PipeState {
  explicit PipeState(std::size_t cap) : capacity(std::max<std::size_t>(cap, 1)) {}

  std::mutex mutex;
  std::string buffer;
  std::size_t offset = 0;  // Read position inside buffer
  std::size_t capacity;
  bool reader_closed = false;
  bool writer_closed = false;
  std::optional<Waker> reader_waker;
  std::optional<Waker> writer_waker;

  std::size_t buffered() const {
    return buffer.size() - offset;
  }
};

}  // namespace detail

std::pair<PipeReader, PipeWriter> make_pipe(std::size_t capacity) {
  auto state = std::make_shared<detail::PipeState>(capacity);
  return {PipeReader(state), PipeWriter(state)};
}

// --- PipeReader ---

PipeReader::~PipeReader() {
  close();
}

PipeReader& PipeReader::operator=(PipeReader&& other) noexcept {
  if (this != &other) {
    close();
    state_ = std::move(other.state_);
  }
  return *this;
}

IoPoll PipeReader::poll_read(char* buf, std::size_t len, const Waker& waker) {
  if (!state_) {
    return IoPoll::ready(0);
  }

  std::optional<Waker> to_wake;
  IoPoll result;

  {
    std::lock_guard<std::mutex> lock(state_->mutex);

    if (state_->buffered() > 0) {
      std::size_t n = std::min(len, state_->buffered());
      std::memcpy(buf, state_->buffer.data() + state_->offset, n);
      state_->offset += n;

      if (state_->offset == state_->buffer.size()) {
        state_->buffer.clear();
        state_->offset = 0;
      }

      // Space freed up, resume a writer parked on a full buffer
      if (state_->buffered() < state_->capacity && state_->writer_waker) {
        to_wake = std::move(state_->writer_waker);
        state_->writer_waker.reset();
      }
      result = IoPoll::ready(n);
    } else if (state_->writer_closed) {
      result = IoPoll::ready(0);
    } else {
      state_->reader_waker = waker;
      result = IoPoll::pending();
    }
  }

  if (to_wake) {
    to_wake->wake();
  }
  return result;
}

std::size_t PipeReader::read(char* buf, std::size_t len) {
  ThreadParker parker;
  for (;;) {
    IoPoll poll = poll_read(buf, len, parker.waker());
    if (!poll.is_pending()) {
      return poll.bytes;
    }
    parker.park();
  }
}

void PipeReader::close() {
  if (!state_) {
    return;
  }

  std::optional<Waker> to_wake;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->reader_closed = true;
    state_->buffer.clear();
    state_->offset = 0;
    to_wake = std::move(state_->writer_waker);
    state_->writer_waker.reset();
  }
  state_.reset();

  if (to_wake) {
    to_wake->wake();
  }
}

// --- PipeWriter ---

PipeWriter::~PipeWriter() {
  close();
}

PipeWriter& PipeWriter::operator=(PipeWriter&& other) noexcept {
  if (this != &other) {
    close();
    state_ = std::move(other.state_);
  }
  return *this;
}

IoPoll PipeWriter::poll_write(const char* data, std::size_t len, const Waker& waker) {
  if (!state_) {
    return IoPoll::failed(std::make_error_code(std::errc::broken_pipe));
  }

  std::optional<Waker> to_wake;
  IoPoll result;

  {
    std::lock_guard<std::mutex> lock(state_->mutex);

    if (state_->reader_closed) {
      result = IoPoll::failed(std::make_error_code(std::errc::broken_pipe));
    } else if (state_->buffered() >= state_->capacity) {
      state_->writer_waker = waker;
      result = IoPoll::pending();
    } else {
      state_->buffer.append(data, len);
      if (len > 0) {
        to_wake = std::move(state_->reader_waker);
        state_->reader_waker.reset();
      }
      result = IoPoll::ready(len);
    }
  }

  if (to_wake) {
    to_wake->wake();
  }
  return result;
}

void PipeWriter::write(std::string_view data) {
  ThreadParker parker;
  while (true) {
    IoPoll poll = poll_write(data.data(), data.size(), parker.waker());
    if (poll.is_error()) {
      throw std::system_error(poll.error, "pipe write");
    }
    if (!poll.is_pending()) {
      return;
    }
    parker.park();
  }
}

void PipeWriter::close() {
  if (!state_) {
    return;
  }

  std::optional<Waker> to_wake;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->writer_closed = true;
    to_wake = std::move(state_->reader_waker);
    state_->reader_waker.reset();
  }
  state_.reset();

  if (to_wake) {
    to_wake->wake();
  }
}

bool PipeWriter::is_reader_closed() const {
  if (!state_) {
    return true;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->reader_closed;
}

}  // namespace ferry
