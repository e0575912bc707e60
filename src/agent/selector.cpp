#include "agent/selector.hpp"

#include <errno.h>
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <system_error>

namespace ferry {

namespace {

constexpr int kMaxEvents = 1024;

bool is_transient(int err) {
  return err == EBADF || err == ENOENT;
}

}  // namespace

// eventfd shared between the selector and its wakers
struct Selector::Notifier {
  int fd = -1;

  Notifier() {
    fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
      throw std::system_error(errno, std::generic_category(), "eventfd");
    }
  }

  ~Notifier() {
    ::close(fd);
  }

  void notify() const {
    uint64_t one = 1;
    if (::write(fd, &one, sizeof(one)) < 0 && errno != EAGAIN) {
      spdlog::warn("failed to notify selector: {}", std::system_category().message(errno));
    }
  }

  void drain() const {
    uint64_t value = 0;
    while (::read(fd, &value, sizeof(value)) > 0) {
    }
  }
};

Selector::Selector() {
  epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
  if (epoll_fd_ < 0) {
    throw std::system_error(errno, std::generic_category(), "epoll_create1");
  }

  try {
    notifier_ = std::make_shared<Notifier>();
  } catch (...) {
    ::close(epoll_fd_);
    throw;
  }

  // The notifier stays level-triggered and is never re-armed
  epoll_event e{};
  e.events = EPOLLIN;
  e.data.fd = notifier_->fd;
  if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, notifier_->fd, &e) != 0) {
    int err = errno;
    ::close(epoll_fd_);
    throw std::system_error(err, std::generic_category(), "epoll_ctl(eventfd)");
  }
}

Selector::~Selector() {
  ::close(epoll_fd_);
}

Waker Selector::waker() const {
  std::shared_ptr<Notifier> notifier = notifier_;
  return Waker([notifier] { notifier->notify(); });
}

bool Selector::is_registered(Socket socket) const {
  auto it = sockets_.find(socket);
  return it != sockets_.end() && it->second.in_poller;
}

void Selector::register_socket(Socket socket, bool readable, bool writable) {
  Registration& registration = sockets_[socket];
  registration.readable = readable;
  registration.writable = writable;
  registration.tick = tick_;

  if (apply(socket, registration)) {
    retries_.erase(socket);
  } else {
    spdlog::debug("failed to register socket {}, will retry on next poll", socket);
    retries_.insert(socket);
  }
}

void Selector::deregister(Socket socket) {
  auto it = sockets_.find(socket);
  if (it == sockets_.end()) {
    return;
  }

  bool in_poller = it->second.in_poller;
  sockets_.erase(it);
  retries_.erase(socket);

  if (in_poller && ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, socket, nullptr) != 0) {
    int err = errno;

    // Already closed by the engine
    if (is_transient(err)) {
      spdlog::debug("socket {} was already gone when removing it from the poller", socket);
      return;
    }
    throw std::system_error(err, std::generic_category(), "epoll_ctl(DEL)");
  }
}

bool Selector::apply(Socket socket, Registration& registration) {
  epoll_event e{};
  e.events = EPOLLONESHOT;
  if (registration.readable) {
    e.events |= EPOLLIN;
  }
  if (registration.writable) {
    e.events |= EPOLLOUT;
  }
  e.data.fd = socket;

  int op = registration.in_poller ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
  if (::epoll_ctl(epoll_fd_, op, socket, &e) == 0) {
    registration.in_poller = true;
    return true;
  }

  int err = errno;
  int fallback = -1;
  if (op == EPOLL_CTL_ADD && err == EEXIST) {
    spdlog::debug("failed to add interest for socket {}, retrying as a modify", socket);
    fallback = EPOLL_CTL_MOD;
  } else if (op == EPOLL_CTL_MOD && err == ENOENT) {
    spdlog::debug("failed to modify interest for socket {}, retrying as an add", socket);
    fallback = EPOLL_CTL_ADD;
  }

  if (fallback >= 0) {
    if (::epoll_ctl(epoll_fd_, fallback, socket, &e) == 0) {
      registration.in_poller = true;
      return true;
    }
    err = errno;
  }

  if (is_transient(err)) {
    registration.in_poller = false;
    return false;
  }
  throw std::system_error(err, std::generic_category(), "epoll_ctl");
}

bool Selector::poll(std::optional<std::chrono::milliseconds> timeout) {
  // Retry registrations that failed earlier
  for (auto it = retries_.begin(); it != retries_.end();) {
    auto registration = sockets_.find(*it);
    if (registration == sockets_.end()) {
      it = retries_.erase(it);
    } else if (apply(*it, registration->second)) {
      spdlog::debug("registered socket {} after an earlier failure", *it);
      it = retries_.erase(it);
    } else {
      ++it;
    }
  }

  // Re-arm the sockets that fired last time, unless the engine already
  // registered them again during this cycle
  for (const auto& event : events_) {
    auto registration = sockets_.find(event.socket);
    if (registration == sockets_.end() || registration->second.tick == tick_ || !registration->second.in_poller) {
      continue;
    }
    if (!apply(event.socket, registration->second)) {
      retries_.insert(event.socket);
    }
  }

  events_.clear();
  ++tick_;

  int timeout_ms = -1;
  if (timeout) {
    timeout_ms = static_cast<int>(std::max<std::chrono::milliseconds::rep>(0, timeout->count()));
  }

  epoll_event ready[kMaxEvents];
  int n = ::epoll_wait(epoll_fd_, ready, kMaxEvents, timeout_ms);
  if (n < 0) {
    if (errno == EINTR) {
      return false;
    }
    throw std::system_error(errno, std::generic_category(), "epoll_wait");
  }

  bool woken = false;
  for (int i = 0; i < n; ++i) {
    if (ready[i].data.fd == notifier_->fd) {
      notifier_->drain();
      woken = true;
      continue;
    }

    uint32_t flags = ready[i].events;

    // Let the engine discover errors through a read or write
    bool failed = (flags & (EPOLLERR | EPOLLHUP)) != 0;

    events_.push_back(SocketEvent{ready[i].data.fd, failed || (flags & (EPOLLIN | EPOLLPRI)) != 0,
                                  failed || (flags & EPOLLOUT) != 0});
  }

  return woken || !events_.empty();
}

}  // namespace ferry
