#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

#include "ferry/core/types.hpp"
#include "ferry/core/waker.hpp"

namespace ferry {

struct SocketEvent {
  Socket socket;
  bool readable;
  bool writable;
};

// Readiness poller for the engine's sockets, built on epoll.
//
// Sockets are registered one-shot, so a socket that fired is disarmed until
// it is re-registered. The engine expects level-triggered behavior, so every
// socket that fired is re-armed at the start of the following poll, unless
// the engine already re-registered it in between. Registration failures
// caused by descriptor reuse races (EBADF, ENOENT) are not reported; the
// socket is queued and retried at the start of the next poll instead.
//
// Only waker() may be used from other threads.
class Selector {
 public:
  // Throws std::system_error if epoll or the eventfd can't be created
  Selector();
  ~Selector();

  Selector(const Selector&) = delete;
  Selector& operator=(const Selector&) = delete;

  // Begin or update watching a socket
  void register_socket(Socket socket, bool readable, bool writable);

  // Stop watching a socket. Unknown or already closed sockets are fine.
  void deregister(Socket socket);

  // Block until a socket is ready, the timeout elapses, or a waker fires.
  // Returns true if any of the first or last happened.
  bool poll(std::optional<std::chrono::milliseconds> timeout);

  // Socket events seen by the most recent poll
  const std::vector<SocketEvent>& events() const {
    return events_;
  }

  // Thread-safe handle that interrupts a blocked poll
  Waker waker() const;

  bool is_registered(Socket socket) const;

  std::size_t pending_retries() const {
    return retries_.size();
  }

  uint64_t cycle() const {
    return tick_;
  }

 private:
  struct Registration {
    bool readable = false;
    bool writable = false;

    // Whether epoll currently knows the descriptor
    bool in_poller = false;

    // Poll cycle of the last explicit registration
    uint64_t tick = 0;
  };

  struct Notifier;

  // Push the registration into epoll. Returns false on a transient failure;
  // throws for anything else.
  bool apply(Socket socket, Registration& registration);

  int epoll_fd_ = -1;
  std::shared_ptr<Notifier> notifier_;

  std::unordered_map<Socket, Registration> sockets_;
  std::set<Socket> retries_;

  std::vector<SocketEvent> events_;
  uint64_t tick_ = 0;
};

}  // namespace ferry
