#include "agent/agent.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ferry {

Agent::Agent(AgentConfig config, std::unique_ptr<Engine> engine, std::unique_ptr<Selector> selector,
             std::shared_ptr<Channel<Message>> channel, std::shared_ptr<AgentStats> stats)
    : config_(std::move(config)),
      channel_(std::move(channel)),
      stats_(std::move(stats)),
      selector_(std::move(selector)),
      engine_(std::move(engine)) {
  waker_ = selector_->waker();

  engine_->set_socket_function([this](Socket socket, SocketInterest interest) {
    // Applied later; the selector must not change while its events are
    // being dispatched
    socket_updates_.emplace_back(socket, interest);
  });

  engine_->set_timer_function([this](std::optional<std::chrono::milliseconds> timeout) {
    if (timeout) {
      timer_.start(*timeout);
    } else {
      timer_.stop();
    }
  });

  engine_->configure(config_);
}

Agent::~Agent() {
  shutdown();
}

void Agent::run() {
  spdlog::debug("agent started");

  while (!closed_) {
    if (!poll_messages()) {
      break;
    }
    poll();
  }

  spdlog::debug("agent shutting down");
  shutdown();
}

void Agent::shutdown() {
  if (!engine_) {
    return;
  }

  // Detach everything from the engine before the handlers go away
  std::vector<TransferToken> tokens;
  transfers_.for_each([&](TransferToken token, Transfer&) { tokens.push_back(token); });
  for (TransferToken token : tokens) {
    try {
      engine_->remove(token);
    } catch (const std::exception& e) {
      spdlog::error("[{}] failed to remove transfer during shutdown: {}", token, e.what());
    }
  }

  transfers_.clear();
  engine_.reset();
  socket_updates_.clear();
}

bool Agent::poll_messages() {
  for (;;) {
    Message message;

    if (transfers_.empty()) {
      // Nothing else to do, so wait for the next message
      auto received = channel_->recv();
      if (!received) {
        spdlog::warn("agent handle disconnected without sending a close message");
        return false;
      }
      message = std::move(*received);
    } else {
      auto status = channel_->try_recv(message);
      if (status == Channel<Message>::RecvStatus::Empty) {
        break;
      }
      if (status == Channel<Message>::RecvStatus::Closed) {
        spdlog::warn("agent handle disconnected without sending a close message");
        return false;
      }
    }

    stats_->messages.fetch_add(1);
    if (!handle_message(std::move(message))) {
      return false;
    }
  }

  // Unpausing can change socket interest
  apply_socket_updates();
  return true;
}

bool Agent::handle_message(Message message) {
  spdlog::trace("received message from agent handle");

  switch (message.kind) {
    case Message::Kind::Close:
      closed_ = true;
      return false;
    case Message::Kind::Execute:
      if (message.transfer) {
        begin_transfer(std::move(*message.transfer));
      }
      return true;
    case Message::Kind::UnpauseRead:
      unpause(message.token, true);
      return true;
    case Message::Kind::UnpauseWrite:
      unpause(message.token, false);
      return true;
  }
  return true;
}

void Agent::begin_transfer(Transfer transfer) {
  TransferToken token = transfers_.insert(std::move(transfer));
  Transfer& entry = *transfers_.get(token);

  // Resuming a paused direction goes through the channel so the engine is
  // only touched on this thread
  std::weak_ptr<Channel<Message>> channel = channel_;
  Waker request_waker = waker_.chain([channel, token](const Waker& inner) {
    if (auto ch = channel.lock(); ch && ch->send(Message::unpause_read(token))) {
      inner.wake();
    }
  });
  Waker response_waker = waker_.chain([channel, token](const Waker& inner) {
    if (auto ch = channel.lock(); ch && ch->send(Message::unpause_write(token))) {
      inner.wake();
    }
  });

  // A transfer the engine can't start fails on its own. Only an exception
  // (the engine itself is broken) stops the agent.
  if (std::optional<Error> error = engine_->add(token, entry)) {
    spdlog::warn("[{}] transfer rejected by engine: {}", token, error->message());
    stats_->rejected.fetch_add(1);
    entry.handler->on_result(std::move(error));
    transfers_.remove(token);
    return;
  }

  entry.handler->init(token, std::move(request_waker), std::move(response_waker), engine_->transfer_info(token));

  stats_->started.fetch_add(1);
  spdlog::debug("[{}] transfer started", token);
}

void Agent::unpause(TransferToken token, bool read) {
  if (!transfers_.contains(token)) {
    spdlog::warn("received unpause request for unknown request token: {}", token);
    return;
  }

  std::optional<Error> error = read ? engine_->unpause_read(token) : engine_->unpause_write(token);
  if (error) {
    spdlog::debug("[{}] error unpausing {}: {}", token, read ? "read" : "write", error->message());
  }
}

void Agent::poll() {
  stats_->polls.fetch_add(1);

  auto timeout = config_.poll_ceiling;
  if (auto remaining = timer_.get_remaining()) {
    timeout = std::min(timeout, std::chrono::ceil<std::chrono::milliseconds>(*remaining));
  }

  if (selector_->poll(timeout)) {
    for (const SocketEvent& event : selector_->events()) {
      engine_->socket_action(event.socket, event.readable, event.writable);
    }
  }

  if (timer_.is_expired()) {
    timer_.stop();
    engine_->timeout();
  }

  apply_socket_updates();

  for (Completion& completion : engine_->take_completions()) {
    complete_transfer(std::move(completion));
  }
}

void Agent::complete_transfer(Completion completion) {
  Transfer* transfer = transfers_.get(completion.token);
  if (!transfer) {
    spdlog::warn("engine reported completion for unknown token {}", completion.token);
    return;
  }

  spdlog::debug("[{}] transfer completed{}", completion.token, completion.error ? " with error" : "");

  // Deliver the result while the engine can still answer address queries
  transfer->handler->on_result(std::move(completion.error));

  engine_->remove(completion.token);
  transfers_.remove(completion.token);
  stats_->completed.fetch_add(1);

  // Removing the transfer may have changed socket interest
  apply_socket_updates();
}

void Agent::apply_socket_updates() {
  std::vector<std::pair<Socket, SocketInterest>> updates;
  updates.swap(socket_updates_);

  for (const auto &[socket, interest] : updates) {
    switch (interest) {
      case SocketInterest::Remove:
        selector_->deregister(socket);
        break;
      case SocketInterest::Read:
        selector_->register_socket(socket, true, false);
        break;
      case SocketInterest::Write:
        selector_->register_socket(socket, false, true);
        break;
      case SocketInterest::ReadWrite:
        selector_->register_socket(socket, true, true);
        break;
    }
  }
}

}  // namespace ferry
