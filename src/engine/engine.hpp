#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "ferry/core/config.hpp"
#include "ferry/core/types.hpp"
#include "ferry/net/request.hpp"
#include "handler/request_handler.hpp"

namespace ferry {

// A request ready for execution together with the handler that receives its
// callbacks. The agent owns it in the transfer table for the lifetime of the
// transfer.
struct Transfer {
  Request request;
  std::unique_ptr<RequestHandler> handler;
};

// Socket interest as requested by the engine
enum class SocketInterest { Remove, Read, Write, ReadWrite };

// A transfer the engine reported as finished
struct Completion {
  TransferToken token;
  std::optional<Error> error;
};

// Non-blocking transfer engine driven by the agent.
//
// All methods are called on the agent thread only. The engine tells the agent
// what to watch through the socket hook and when it next needs a timeout pump
// through the timer hook; both may fire synchronously from inside add(),
// socket_action(), timeout() and the unpause calls.
class Engine {
 public:
  // Interest change for one socket
  using SocketFunction = std::function<void(Socket, SocketInterest)>;

  // nullopt cancels the timer; zero means "pump as soon as possible"
  using TimerFunction = std::function<void(std::optional<std::chrono::milliseconds>)>;

  virtual ~Engine() = default;

  virtual void set_socket_function(SocketFunction fn) = 0;

  virtual void set_timer_function(TimerFunction fn) = 0;

  // Apply connection limits; called once before any transfer is added
  virtual void configure(const AgentConfig& config) {
    (void)config;
  }

  // Start a transfer. The handler must stay alive until remove() is called
  // for the same token.
  //
  // Returns an error if this transfer can't be started (e.g. an option the
  // engine doesn't support); nothing is left registered for the token and
  // other transfers are unaffected. Throws std::runtime_error if the engine
  // itself has failed.
  virtual std::optional<Error> add(TransferToken token, Transfer& transfer) = 0;

  // Detach a transfer, finished or not
  virtual void remove(TransferToken token) = 0;

  // Connection details for a running transfer, if the engine has any
  virtual const TransferInfo* transfer_info(TransferToken token) const {
    (void)token;
    return nullptr;
  }

  // Pump the engine for readiness on one socket
  virtual void socket_action(Socket socket, bool readable, bool writable) = 0;

  // Pump the engine after its timer expired
  virtual void timeout() = 0;

  // Transfers that finished since the last call
  virtual std::vector<Completion> take_completions() = 0;

  // Resume reading the request body of a paused transfer
  virtual std::optional<Error> unpause_read(TransferToken token) = 0;

  // Resume writing the response body of a paused transfer
  virtual std::optional<Error> unpause_write(TransferToken token) = 0;
};

// Creates the engine on the agent thread
using EngineFactory = std::function<std::unique_ptr<Engine>()>;

}  // namespace ferry
