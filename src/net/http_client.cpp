#include "ferry/net/http_client.hpp"

#include <spdlog/spdlog.h>

#include "agent/handle.hpp"
#include "engine/curl_engine.hpp"
#include "handler/request_handler.hpp"

namespace ferry {

HttpClient::HttpClient() : HttpClient(ClientConfig{}) {}

HttpClient::HttpClient(ClientConfig config) : config_(std::move(config)) {
  CurlEngine::global_init();
  handle_ = Handle::spawn(config_.agent, [] { return std::make_unique<CurlEngine>(); });
}

HttpClient::~HttpClient() = default;

void HttpClient::apply_defaults(Request& request) const {
  const RequestDefaults& defaults = config_.request;

  if (!request.timeout) {
    request.timeout = defaults.timeout;
  }
  if (!request.connect_timeout) {
    request.connect_timeout = defaults.connect_timeout;
  }
  if (!request.follow_redirects) {
    request.follow_redirects = defaults.follow_redirects;
  }
  if (!request.max_redirects) {
    request.max_redirects = defaults.max_redirects;
  }
  if (!request.metrics) {
    request.metrics = defaults.metrics;
  }
}

ResponseFuture HttpClient::send_async(Request request) {
  apply_defaults(request);
  spdlog::debug("sending {} {}", request.method, request.url);

  auto [handler, future] = RequestHandler::create(std::move(request.body), config_.response_buffer_size);
  request.body = RequestBody();

  handle_->submit(Transfer{std::move(request), std::move(handler)});
  return std::move(future);
}

Result<Response> HttpClient::send(Request request) {
  return send_async(std::move(request)).get();
}

Result<Response> HttpClient::get(const std::string& url) {
  return send(Request::get(url));
}

Result<Response> HttpClient::head(const std::string& url) {
  return send(Request::head(url));
}

Result<Response> HttpClient::post(const std::string& url, RequestBody body) {
  return send(Request::post(url, std::move(body)));
}

Result<Response> HttpClient::put(const std::string& url, RequestBody body) {
  return send(Request::put(url, std::move(body)));
}

}  // namespace ferry
