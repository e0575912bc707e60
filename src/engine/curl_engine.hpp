#pragma once

#include <curl/curl.h>

#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/engine.hpp"

namespace ferry {

// Engine backed by libcurl's multi socket interface.
//
// One easy handle per transfer; curl's callbacks are forwarded to the
// transfer's RequestHandler. Pause state is tracked per direction so that
// resuming one direction leaves the other untouched.
class CurlEngine : public Engine {
 public:
  CurlEngine();
  ~CurlEngine() override;

  // curl_global_init, once per process. Must happen before any agent thread
  // is started.
  static void global_init();

  CurlEngine(const CurlEngine&) = delete;
  CurlEngine& operator=(const CurlEngine&) = delete;

  void set_socket_function(SocketFunction fn) override;
  void set_timer_function(TimerFunction fn) override;
  void configure(const AgentConfig& config) override;

  std::optional<Error> add(TransferToken token, Transfer& transfer) override;
  void remove(TransferToken token) override;
  const TransferInfo* transfer_info(TransferToken token) const override;

  void socket_action(Socket socket, bool readable, bool writable) override;
  void timeout() override;
  std::vector<Completion> take_completions() override;

  std::optional<Error> unpause_read(TransferToken token) override;
  std::optional<Error> unpause_write(TransferToken token) override;

  std::size_t transfer_count() const {
    return easies_.size();
  }

 private:
  struct Easy;

  static int socket_shim(CURL* easy, curl_socket_t socket, int what, void* userp, void* socketp);
  static int timer_shim(CURLM* multi, long timeout_ms, void* userp);

  static size_t header_shim(char* buffer, size_t size, size_t nitems, void* userdata);
  static size_t read_shim(char* buffer, size_t size, size_t nitems, void* userdata);
  static int seek_shim(void* userdata, curl_off_t offset, int origin);
  static size_t write_shim(char* data, size_t size, size_t nmemb, void* userdata);
  static int xferinfo_shim(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);
  static int debug_shim(CURL* handle, curl_infotype type, char* data, size_t size, void* userptr);

  std::optional<Error> unpause(TransferToken token, int resume_bit);

  template <typename T>
  void setopt(CURLMoption option, T value);

  CURLM* multi_ = nullptr;
  std::unordered_map<TransferToken, std::unique_ptr<Easy>> easies_;

  SocketFunction socket_fn_;
  TimerFunction timer_fn_;
};

// Translate a curl result code into an error kind
ErrorKind error_kind_from_curl(CURLcode code);

// Printable rendering of wire data for trace logs
std::string escape_wire_data(std::string_view data);

}  // namespace ferry
