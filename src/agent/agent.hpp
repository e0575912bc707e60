#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "agent/message.hpp"
#include "agent/selector.hpp"
#include "agent/timer.hpp"
#include "core/channel.hpp"
#include "core/slab.hpp"
#include "engine/engine.hpp"
#include "ferry/core/config.hpp"

namespace ferry {

// Counters updated by the agent thread, readable from anywhere
struct AgentStats {
  std::atomic<uint64_t> polls{0};
  std::atomic<uint64_t> messages{0};
  std::atomic<uint64_t> started{0};
  std::atomic<uint64_t> completed{0};
  std::atomic<uint64_t> rejected{0};
};

// Event loop that drives all transfers of one client.
//
// Lives on its own thread and is the only code that touches the engine, the
// selector, the timer and the transfer table. The outside world talks to it
// through the message channel and the selector's waker.
class Agent {
 public:
  Agent(AgentConfig config, std::unique_ptr<Engine> engine, std::unique_ptr<Selector> selector,
        std::shared_ptr<Channel<Message>> channel, std::shared_ptr<AgentStats> stats);

  // Drops every remaining transfer; their futures resolve as aborted
  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Run until a Close message arrives or every Handle is gone. Engine and
  // selector failures propagate as exceptions.
  void run();

  std::size_t transfer_count() const {
    return transfers_.size();
  }

 private:
  // Handle queued messages. Blocks for the next message when no transfer is
  // active. Returns false once the agent should stop.
  bool poll_messages();

  bool handle_message(Message message);

  void begin_transfer(Transfer transfer);

  void unpause(TransferToken token, bool read);

  // Wait for socket activity or the engine timer, then pump the engine
  void poll();

  void complete_transfer(Completion completion);

  void apply_socket_updates();

  void shutdown();

  AgentConfig config_;
  std::shared_ptr<Channel<Message>> channel_;
  std::shared_ptr<AgentStats> stats_;

  std::unique_ptr<Selector> selector_;
  Waker waker_;
  Timer timer_;

  Slab<Transfer> transfers_;

  // Interest changes requested by the engine, applied between pump steps
  std::vector<std::pair<Socket, SocketInterest>> socket_updates_;

  bool closed_ = false;

  // Declared last: its hooks reference the members above
  std::unique_ptr<Engine> engine_;
};

}  // namespace ferry
