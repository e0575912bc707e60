#pragma once

#include <memory>
#include <string>

#include "ferry/core/config.hpp"
#include "ferry/core/types.hpp"
#include "ferry/net/body.hpp"
#include "ferry/net/request.hpp"
#include "ferry/net/response.hpp"

namespace ferry {

class Handle;

// HTTP client backed by a dedicated agent thread.
//
// Copies share the same agent; it shuts down once the last copy is gone,
// resolving any outstanding futures. Request options left unset are taken
// from the client's RequestDefaults.
class HttpClient {
 public:
  HttpClient();
  explicit HttpClient(ClientConfig config);
  ~HttpClient();

  HttpClient(const HttpClient&) = default;
  HttpClient& operator=(const HttpClient&) = default;
  HttpClient(HttpClient&&) = default;
  HttpClient& operator=(HttpClient&&) = default;

  // Begin executing a request. Throws AgentError if the agent thread died.
  ResponseFuture send_async(Request request);

  // Execute a request and wait for the response head
  Result<Response> send(Request request);

  // Convenience methods
  Result<Response> get(const std::string& url);
  Result<Response> head(const std::string& url);
  Result<Response> post(const std::string& url, RequestBody body);
  Result<Response> put(const std::string& url, RequestBody body);

  const ClientConfig& config() const {
    return config_;
  }

 private:
  void apply_defaults(Request& request) const;

  ClientConfig config_;
  std::shared_ptr<Handle> handle_;
};

}  // namespace ferry
