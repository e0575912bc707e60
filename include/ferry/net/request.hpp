#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "ferry/core/types.hpp"
#include "ferry/net/body.hpp"
#include "ferry/net/headers.hpp"

namespace ferry {

// A prepared HTTP request. Per-request options left unset fall back to the
// client's RequestDefaults.
struct Request {
  std::string method = "GET";
  std::string url;
  Headers headers;
  RequestBody body;

  std::optional<std::chrono::milliseconds> timeout;
  std::optional<std::chrono::milliseconds> connect_timeout;
  std::optional<bool> follow_redirects;
  std::optional<long> max_redirects;
  std::optional<bool> metrics;

  // Preferred protocol version to negotiate
  HttpVersion version = HttpVersion::Unknown;

  static Request get(std::string url) {
    Request r;
    r.url = std::move(url);
    return r;
  }

  static Request head(std::string url) {
    Request r;
    r.method = "HEAD";
    r.url = std::move(url);
    return r;
  }

  static Request post(std::string url, RequestBody body) {
    Request r;
    r.method = "POST";
    r.url = std::move(url);
    r.body = std::move(body);
    return r;
  }

  static Request put(std::string url, RequestBody body) {
    Request r;
    r.method = "PUT";
    r.url = std::move(url);
    r.body = std::move(body);
    return r;
  }
};

}  // namespace ferry
