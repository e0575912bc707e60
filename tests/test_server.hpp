#pragma once

#include <asio.hpp>
#include <atomic>
#include <cctype>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace ferry::testing {

// Minimal HTTP/1.1 server on 127.0.0.1 for exercising the real engine.
//
// Every response is canned per path and the connection is closed after it,
// which also lets a route send a short body under a longer Content-Length.
class TestServer {
 public:
  struct Route {
    // Raw response bytes, status line included
    std::string raw;

    // Wait this long before responding
    std::chrono::milliseconds delay{0};

    // Respond 200 with the request body instead of `raw`
    bool echo = false;
  };

  TestServer() : acceptor_(io_ctx_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    accept();
    thread_ = std::thread([this] { io_ctx_.run(); });
  }

  ~TestServer() {
    io_ctx_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  TestServer(const TestServer&) = delete;
  TestServer& operator=(const TestServer&) = delete;

  void route(const std::string& path, Route route) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[path] = std::move(route);
  }

  // Shorthand for a 200 response with a fixed body
  void route_text(const std::string& path, const std::string& body) {
    route(path, Route{ok_response(body)});
  }

  std::string url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  int requests() const {
    return requests_.load();
  }

  static std::string ok_response(const std::string& body, const std::string& content_type = "text/plain") {
    return "HTTP/1.1 200 OK\r\nContent-Type: " + content_type + "\r\nContent-Length: " + std::to_string(body.size()) +
           "\r\nConnection: close\r\n\r\n" + body;
  }

 private:
  struct Session : std::enable_shared_from_this<Session> {
    Session(TestServer& server, asio::ip::tcp::socket socket)
        : server(server), socket(std::move(socket)), timer(server.io_ctx_) {}

    void start() {
      auto self = shared_from_this();
      asio::async_read_until(socket, buffer, "\r\n\r\n", [self](const asio::error_code& ec, size_t header_size) {
        if (ec) {
          return;
        }
        self->parse_head(header_size);
      });
    }

    void parse_head(size_t header_size) {
      std::string head(asio::buffers_begin(buffer.data()), asio::buffers_begin(buffer.data()) + header_size);
      buffer.consume(header_size);

      std::istringstream lines(head);
      std::string line;
      std::getline(lines, line);
      std::istringstream request_line(line);
      request_line >> method >> path;

      bool expect_continue = false;
      while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
          line.pop_back();
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
          continue;
        }
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        for (auto& c : name) {
          c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if (name == "content-length") {
          content_length = std::stoul(value);
        } else if (name == "transfer-encoding" && value == "chunked") {
          chunked = true;
        } else if (name == "expect" && value == "100-continue") {
          expect_continue = true;
        }
      }

      server.requests_.fetch_add(1);

      if (expect_continue) {
        auto self = shared_from_this();
        auto interim = std::make_shared<std::string>("HTTP/1.1 100 Continue\r\n\r\n");
        asio::async_write(socket, asio::buffer(*interim), [self, interim](const asio::error_code& ec, size_t) {
          if (!ec) {
            self->read_body();
          }
        });
        return;
      }
      read_body();
    }

    void read_body() {
      auto self = shared_from_this();

      if (chunked) {
        asio::async_read_until(socket, buffer, "0\r\n\r\n", [self](const asio::error_code& ec, size_t) {
          if (ec) {
            return;
          }
          self->decode_chunked();
          self->respond();
        });
        return;
      }

      size_t buffered = buffer.size();
      if (buffered >= content_length) {
        take_body(content_length);
        respond();
        return;
      }

      asio::async_read(socket, buffer, asio::transfer_exactly(content_length - buffered),
                       [self](const asio::error_code& ec, size_t) {
                         if (ec) {
                           return;
                         }
                         self->take_body(self->content_length);
                         self->respond();
                       });
    }

    void take_body(size_t n) {
      body.assign(asio::buffers_begin(buffer.data()), asio::buffers_begin(buffer.data()) + n);
      buffer.consume(n);
    }

    void decode_chunked() {
      std::string raw(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
      size_t pos = 0;
      for (;;) {
        size_t eol = raw.find("\r\n", pos);
        if (eol == std::string::npos) {
          break;
        }
        size_t size = std::stoul(raw.substr(pos, eol - pos), nullptr, 16);
        if (size == 0) {
          break;
        }
        body.append(raw, eol + 2, size);
        pos = eol + 2 + size + 2;
      }
    }

    void respond() {
      Route route;
      bool found = false;
      {
        std::lock_guard<std::mutex> lock(server.mutex_);
        auto it = server.routes_.find(path);
        if (it != server.routes_.end()) {
          route = it->second;
          found = true;
        }
      }

      auto response = std::make_shared<std::string>();
      if (!found) {
        *response = "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
      } else if (route.echo) {
        *response = ok_response(body, "application/octet-stream");
      } else {
        *response = route.raw;
      }

      auto self = shared_from_this();
      timer.expires_after(route.delay);
      timer.async_wait([self, response](const asio::error_code& ec) {
        if (ec) {
          return;
        }
        asio::async_write(self->socket, asio::buffer(*response), [self, response](const asio::error_code&, size_t) {
          asio::error_code ignored;
          self->socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
          self->socket.close(ignored);
        });
      });
    }

    TestServer& server;
    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    asio::streambuf buffer;

    std::string method;
    std::string path;
    size_t content_length = 0;
    bool chunked = false;
    std::string body;
  };

  void accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
      if (ec == asio::error::operation_aborted) {
        return;
      }
      if (!ec) {
        std::make_shared<Session>(*this, std::move(socket))->start();
      }
      accept();
    });
  }

  asio::io_context io_ctx_;
  asio::ip::tcp::acceptor acceptor_;
  unsigned short port_ = 0;
  std::thread thread_;

  std::mutex mutex_;
  std::map<std::string, Route> routes_;
  std::atomic<int> requests_{0};
};

}  // namespace ferry::testing
