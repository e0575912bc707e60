#include "ferry/net/body.hpp"

#include <algorithm>
#include <cstring>

#include "handler/shared_state.hpp"

namespace ferry {

// --- RequestBody ---

RequestBody RequestBody::from_reader(PipeReader reader, std::optional<uint64_t> length) {
  RequestBody body;
  body.inner_ = Stream{std::move(reader), length};
  return body;
}

std::optional<uint64_t> RequestBody::length() const {
  if (std::holds_alternative<std::monostate>(inner_)) {
    return 0;
  }
  if (auto bytes = std::get_if<Bytes>(&inner_)) {
    return bytes->data.size();
  }
  return std::get<Stream>(inner_).length;
}

IoPoll RequestBody::poll_read(char* buf, std::size_t len, const Waker& waker) {
  if (auto bytes = std::get_if<Bytes>(&inner_)) {
    std::size_t n = std::min(len, bytes->data.size() - bytes->pos);
    std::memcpy(buf, bytes->data.data() + bytes->pos, n);
    bytes->pos += n;
    return IoPoll::ready(n);
  }
  if (auto stream = std::get_if<Stream>(&inner_)) {
    return stream->reader.poll_read(buf, len, waker);
  }
  return IoPoll::ready(0);
}

bool RequestBody::reset() {
  if (auto bytes = std::get_if<Bytes>(&inner_)) {
    bytes->pos = 0;
    return true;
  }
  return std::holds_alternative<std::monostate>(inner_);
}

// --- ResponseBody ---

ResponseBody::ResponseBody(PipeReader reader, std::shared_ptr<detail::SharedState> shared)
    : reader_(std::move(reader)), shared_(std::move(shared)) {}

IoPoll ResponseBody::poll_read(char* buf, std::size_t len, const Waker& waker) {
  IoPoll poll = reader_.poll_read(buf, len, waker);

  // On EOF, check whether the transfer actually finished
  if (!poll.is_pending() && poll.bytes == 0 && len > 0 && shared_) {
    if (auto ec = shared_->eof_error()) {
      return IoPoll::failed(ec);
    }
  }
  return poll;
}

std::size_t ResponseBody::read(char* buf, std::size_t len) {
  ThreadParker parker;
  for (;;) {
    IoPoll poll = poll_read(buf, len, parker.waker());
    if (poll.is_error()) {
      throw std::system_error(poll.error, "response body");
    }
    if (!poll.is_pending()) {
      return poll.bytes;
    }
    parker.park();
  }
}

std::string ResponseBody::text() {
  std::string out;
  char buf[16 * 1024];
  while (std::size_t n = read(buf, sizeof(buf))) {
    out.append(buf, n);
  }
  return out;
}

uint64_t ResponseBody::consume() {
  uint64_t total = 0;
  char buf[16 * 1024];
  while (std::size_t n = read(buf, sizeof(buf))) {
    total += n;
  }
  return total;
}

void ResponseBody::close() {
  reader_.close();
}

}  // namespace ferry
