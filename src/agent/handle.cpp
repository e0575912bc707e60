#include "agent/handle.hpp"

#include <pthread.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <future>
#include <string>

namespace ferry {

namespace {

std::atomic<uint64_t> next_agent_id{0};

void set_thread_name(const std::string& name) {
  // Linux limits thread names to 15 characters
  pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
}

std::string describe(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return std::string("agent thread terminated with error: ") + e.what();
  } catch (...) {
    return "agent thread panicked";
  }
}

}  // namespace

std::shared_ptr<Handle> Handle::spawn(const AgentConfig& config, EngineFactory engine_factory) {
  std::shared_ptr<Handle> handle(new Handle());
  handle->channel_ = std::make_shared<Channel<Message>>();
  handle->stats_ = std::make_shared<AgentStats>();

  auto selector = std::make_unique<Selector>();
  handle->waker_ = selector->waker();

  std::promise<void> started;
  std::future<void> started_future = started.get_future();
  std::string name = "ferry-agent-" + std::to_string(next_agent_id.fetch_add(1));

  Handle* self = handle.get();
  handle->thread_ = std::thread([self, config, name, factory = std::move(engine_factory),
                                 selector = std::move(selector), started = std::move(started)]() mutable {
    set_thread_name(name);
    bool running = false;

    try {
      std::unique_ptr<Engine> engine = factory();
      Agent agent(config, std::move(engine), std::move(selector), self->channel_, self->stats_);

      running = true;
      started.set_value();

      agent.run();
    } catch (...) {
      if (running) {
        self->error_ = std::current_exception();
      } else {
        started.set_exception(std::current_exception());
      }
    }

    // Nobody can reach us anymore. Whatever is still queued is dropped here,
    // which resolves those futures as aborted.
    auto remaining = self->channel_->close();
    remaining.clear();

    spdlog::debug("{} exited", name);
  });

  try {
    started_future.get();
  } catch (...) {
    handle->thread_.join();
    throw;
  }

  spdlog::debug("agent thread {} started", name);
  return handle;
}

Handle::~Handle() {
  if (channel_) {
    channel_->send(Message::close());
  }
  waker_.wake();

  std::lock_guard<std::mutex> lock(join_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }

  if (error_) {
    spdlog::error("{}", describe(error_));
  } else {
    spdlog::debug("agent shut down");
  }
}

void Handle::submit(Transfer transfer) {
  send(Message::execute(std::move(transfer)));
}

void Handle::send(Message message) {
  if (channel_->send(message)) {
    waker_.wake();
    return;
  }

  // The agent is gone. Drop the transfer first so its future resolves, then
  // find out why.
  message.transfer.reset();
  throw join_error();
}

AgentError Handle::join_error() {
  std::lock_guard<std::mutex> lock(join_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }

  if (error_) {
    return AgentError(describe(error_));
  }
  return AgentError("agent thread terminated prematurely");
}

}  // namespace ferry
