#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <thread>

#include "agent/agent.hpp"
#include "engine/engine.hpp"
#include "ferry/core/config.hpp"

namespace ferry {

// Thread-safe handle to a running agent thread.
//
// Shared through std::shared_ptr; the agent stops once the last owner lets
// go. Any transfer still running at that point has its future resolved.
class Handle {
 public:
  // Start a new agent thread and wait until it is running. The engine is
  // created on the agent thread. Startup failures are rethrown here.
  static std::shared_ptr<Handle> spawn(const AgentConfig& config, EngineFactory engine_factory);

  ~Handle();

  Handle(const Handle&) = delete;
  Handle& operator=(const Handle&) = delete;

  // Hand a transfer to the agent. Throws AgentError if the agent thread is
  // gone; the transfer's future then resolves as aborted.
  void submit(Transfer transfer);

  const AgentStats& stats() const {
    return *stats_;
  }

 private:
  Handle() = default;

  void send(Message message);

  // Join the agent thread and describe why it stopped
  AgentError join_error();

  std::shared_ptr<Channel<Message>> channel_;
  std::shared_ptr<AgentStats> stats_;
  Waker waker_;

  std::thread thread_;
  std::mutex join_mutex_;

  // Set by the agent thread before it exits, read after join
  std::exception_ptr error_;
};

}  // namespace ferry
