#pragma once

#include <optional>

#include "engine/engine.hpp"

namespace ferry {

// Request sent from a Handle (or a transfer's waker) to the agent thread
struct Message {
  enum class Kind {
    Close,         // Stop the agent
    Execute,       // Begin a new transfer
    UnpauseRead,   // The request body has data again
    UnpauseWrite,  // The response body buffer has space again
  };

  Kind kind = Kind::Close;
  TransferToken token = 0;
  std::optional<Transfer> transfer;

  static Message close() {
    return Message{Kind::Close, 0, std::nullopt};
  }

  static Message execute(Transfer transfer) {
    return Message{Kind::Execute, 0, std::move(transfer)};
  }

  static Message unpause_read(TransferToken token) {
    return Message{Kind::UnpauseRead, token, std::nullopt};
  }

  static Message unpause_write(TransferToken token) {
    return Message{Kind::UnpauseWrite, token, std::nullopt};
  }
};

}  // namespace ferry
