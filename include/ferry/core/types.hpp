#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "ferry/core/error.hpp"

namespace ferry {

using json = nlohmann::json;

// Slot index of a transfer inside the agent's transfer table
using TransferToken = std::size_t;

// Native socket descriptor as handed out by the engine
using Socket = int;

enum class HttpVersion { Unknown, Http09, Http10, Http11, Http2, Http3 };

std::string to_string(HttpVersion version);

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(Error err) {
    return Result{std::nullopt, std::move(err)};
  }
};

}  // namespace ferry
