#include "engine/curl_engine.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>

#include "handler/parsing.hpp"
#include "log/log.h"

namespace ferry {

namespace {

void check_multi(CURLMcode result, const std::string& context) {
  if (result != CURLM_OK) {
    // CURLM errors are programming errors; network problems show up on the
    // easy handles instead
    throw std::runtime_error(context + ": " + curl_multi_strerror(result));
  }
}

long curl_http_version(HttpVersion version) {
  switch (version) {
    case HttpVersion::Http10:
      return CURL_HTTP_VERSION_1_0;
    case HttpVersion::Http11:
      return CURL_HTTP_VERSION_1_1;
    case HttpVersion::Http2:
      return CURL_HTTP_VERSION_2_0;
    case HttpVersion::Http3:
      return CURL_HTTP_VERSION_3;
    default:
      return CURL_HTTP_VERSION_NONE;
  }
}

std::optional<std::string> format_addr(const char* ip, long port) {
  if (ip == nullptr || *ip == '\0') {
    return std::nullopt;
  }
  std::string host(ip);
  if (host.find(':') != std::string::npos) {
    host = "[" + host + "]";
  }
  return host + ":" + std::to_string(port);
}

}  // namespace

ErrorKind error_kind_from_curl(CURLcode code) {
  switch (code) {
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CACERT_BADFILE:
      return ErrorKind::BadClientCertificate;
    case CURLE_PEER_FAILED_VERIFICATION:
      return ErrorKind::BadServerCertificate;
    case CURLE_COULDNT_CONNECT:
      return ErrorKind::ConnectionFailed;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
      return ErrorKind::NameResolution;
    case CURLE_BAD_CONTENT_ENCODING:
      return ErrorKind::InvalidContentEncoding;
    case CURLE_LOGIN_DENIED:
      return ErrorKind::InvalidCredentials;
    case CURLE_GOT_NOTHING:
      return ErrorKind::NoResponse;
    case CURLE_RANGE_ERROR:
      return ErrorKind::RangeRequestUnsupported;
    case CURLE_READ_ERROR:
    case CURLE_ABORTED_BY_CALLBACK:
      return ErrorKind::RequestBodyError;
    case CURLE_WRITE_ERROR:
    case CURLE_PARTIAL_FILE:
      return ErrorKind::ResponseBodyError;
    case CURLE_SEND_FAIL_REWIND:
      return ErrorKind::RequestBodyNotRewindable;
    case CURLE_SSL_CONNECT_ERROR:
      return ErrorKind::TlsHandshake;
    case CURLE_SSL_ENGINE_INITFAILED:
    case CURLE_SSL_ENGINE_NOTFOUND:
    case CURLE_SSL_ENGINE_SETFAILED:
      return ErrorKind::TlsEngine;
    case CURLE_OPERATION_TIMEDOUT:
      return ErrorKind::Timeout;
    case CURLE_TOO_MANY_REDIRECTS:
      return ErrorKind::TooManyRedirects;
    default:
      return ErrorKind::Engine;
  }
}

std::string escape_wire_data(std::string_view data) {
  std::string out;
  out.reserve(data.size());
  for (unsigned char c : data) {
    if (c == '\r') {
      out += "\\r";
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\t') {
      out += "\\t";
    } else if (c == '\\') {
      out += "\\\\";
    } else if (c < 0x20 || c >= 0x7f) {
      char hex[5];
      std::snprintf(hex, sizeof(hex), "\\x%02x", c);
      out += hex;
    } else {
      out += static_cast<char>(c);
    }
  }
  return out;
}

// Engine-side record of one transfer
struct CurlEngine::Easy : TransferInfo {
  TransferToken token = 0;
  CURL* handle = nullptr;
  curl_slist* headers = nullptr;
  RequestHandler* handler = nullptr;

  // CURLPAUSE_RECV / CURLPAUSE_SEND bits currently in effect
  int paused = CURLPAUSE_CONT;

  char error_buf[CURL_ERROR_SIZE] = {0};

  std::optional<Error> setopt_error;

  ~Easy() override {
    if (handle) {
      curl_easy_cleanup(handle);
    }
    if (headers) {
      curl_slist_free_all(headers);
    }
  }

  std::optional<std::string> local_addr() const override {
    char* ip = nullptr;
    long port = 0;
    if (curl_easy_getinfo(handle, CURLINFO_LOCAL_IP, &ip) != CURLE_OK ||
        curl_easy_getinfo(handle, CURLINFO_LOCAL_PORT, &port) != CURLE_OK) {
      return std::nullopt;
    }
    return format_addr(ip, port);
  }

  std::optional<std::string> remote_addr() const override {
    char* ip = nullptr;
    long port = 0;
    if (curl_easy_getinfo(handle, CURLINFO_PRIMARY_IP, &ip) != CURLE_OK ||
        curl_easy_getinfo(handle, CURLINFO_PRIMARY_PORT, &port) != CURLE_OK) {
      return std::nullopt;
    }
    return format_addr(ip, port);
  }

  // Options are applied in order; after the first failure the rest are
  // skipped and the failure is kept in setopt_error
  template <typename T>
  void setopt(CURLoption option, T value, const char* name) {
    if (setopt_error) {
      return;
    }
    CURLcode code = curl_easy_setopt(handle, option, value);
    if (code != CURLE_OK) {
      setopt_error = Error(error_kind_from_curl(code),
                           std::string("curl_easy_setopt(") + name + "): " + curl_easy_strerror(code));
    }
  }

  std::string error_context(CURLcode code) const {
    if (error_buf[0] != '\0') {
      return error_buf;
    }
    return curl_easy_strerror(code);
  }
};

template <typename T>
void CurlEngine::setopt(CURLMoption option, T value) {
  check_multi(curl_multi_setopt(multi_, option, value), "curl_multi_setopt(option=" + std::to_string(option) + ")");
}

void CurlEngine::global_init() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
    }
    spdlog::debug("initialized {}", curl_version());
  });
}

CurlEngine::CurlEngine() : multi_(curl_multi_init()) {
  if (!multi_) {
    throw std::runtime_error("curl_multi_init() returned nullptr");
  }

  setopt(CURLMOPT_SOCKETDATA, this);
  setopt<curl_socket_callback>(CURLMOPT_SOCKETFUNCTION, socket_shim);
  setopt(CURLMOPT_TIMERDATA, this);
  setopt<curl_multi_timer_callback>(CURLMOPT_TIMERFUNCTION, timer_shim);
}

CurlEngine::~CurlEngine() {
  for (auto &[token, easy] : easies_) {
    curl_multi_remove_handle(multi_, easy->handle);
  }
  easies_.clear();

  if (auto error = curl_multi_cleanup(multi_)) {
    spdlog::error("curl_multi_cleanup failed: {}", curl_multi_strerror(error));
  }
  multi_ = nullptr;
}

void CurlEngine::set_socket_function(SocketFunction fn) {
  socket_fn_ = std::move(fn);
}

void CurlEngine::set_timer_function(TimerFunction fn) {
  timer_fn_ = std::move(fn);
}

void CurlEngine::configure(const AgentConfig& config) {
  if (config.max_connections > 0) {
    setopt(CURLMOPT_MAX_TOTAL_CONNECTIONS, static_cast<long>(config.max_connections));
  }
  if (config.max_connections_per_host > 0) {
    setopt(CURLMOPT_MAX_HOST_CONNECTIONS, static_cast<long>(config.max_connections_per_host));
  }
  if (config.connection_cache_size > 0) {
    setopt(CURLMOPT_MAXCONNECTS, static_cast<long>(config.connection_cache_size));
  }
}

std::optional<Error> CurlEngine::add(TransferToken token, Transfer& transfer) {
  if (easies_.count(token)) {
    throw std::runtime_error("transfer token " + std::to_string(token) + " already in use");
  }

  auto easy = std::make_unique<Easy>();
  easy->token = token;
  easy->handler = transfer.handler.get();
  easy->handle = curl_easy_init();
  if (!easy->handle) {
    return Error(ErrorKind::Engine, "curl_easy_init() returned nullptr");
  }

  const Request& request = transfer.request;
  Easy& e = *easy;

  e.setopt(CURLOPT_PRIVATE, static_cast<void*>(easy.get()), "CURLOPT_PRIVATE");
  e.setopt(CURLOPT_ERRORBUFFER, easy->error_buf, "CURLOPT_ERRORBUFFER");
  e.setopt(CURLOPT_NOSIGNAL, 1L, "CURLOPT_NOSIGNAL");
  e.setopt(CURLOPT_URL, request.url.c_str(), "CURLOPT_URL");
  e.setopt(CURLOPT_CUSTOMREQUEST, request.method.c_str(), "CURLOPT_CUSTOMREQUEST");

  if (request.method == "HEAD") {
    e.setopt(CURLOPT_NOBODY, 1L, "CURLOPT_NOBODY");
  }

  for (const auto &[name, value] : request.headers) {
    curl_slist* list = curl_slist_append(easy->headers, header_to_curl_string(name, value).c_str());
    if (!list) {
      return Error(ErrorKind::Engine, "curl_slist_append failed");
    }
    easy->headers = list;
  }
  if (easy->headers) {
    e.setopt(CURLOPT_HTTPHEADER, easy->headers, "CURLOPT_HTTPHEADER");
  }

  // The body itself was handed to the handler
  const RequestBody& body = transfer.handler->request_body();
  if (!body.is_empty()) {
    e.setopt(CURLOPT_UPLOAD, 1L, "CURLOPT_UPLOAD");
    if (auto length = body.length()) {
      e.setopt(CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(*length), "CURLOPT_INFILESIZE_LARGE");
    }
  }

  if (request.timeout) {
    e.setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout->count()), "CURLOPT_TIMEOUT_MS");
  }
  if (request.connect_timeout) {
    e.setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout->count()),
             "CURLOPT_CONNECTTIMEOUT_MS");
  }
  if (request.follow_redirects.value_or(false)) {
    e.setopt(CURLOPT_FOLLOWLOCATION, 1L, "CURLOPT_FOLLOWLOCATION");
    e.setopt(CURLOPT_MAXREDIRS, request.max_redirects.value_or(-1L), "CURLOPT_MAXREDIRS");
  }
  if (request.version != HttpVersion::Unknown) {
    e.setopt(CURLOPT_HTTP_VERSION, curl_http_version(request.version), "CURLOPT_HTTP_VERSION");
  }

  e.setopt(CURLOPT_HEADERFUNCTION, header_shim, "CURLOPT_HEADERFUNCTION");
  e.setopt(CURLOPT_HEADERDATA, static_cast<void*>(easy.get()), "CURLOPT_HEADERDATA");
  e.setopt(CURLOPT_READFUNCTION, read_shim, "CURLOPT_READFUNCTION");
  e.setopt(CURLOPT_READDATA, static_cast<void*>(easy.get()), "CURLOPT_READDATA");
  e.setopt(CURLOPT_SEEKFUNCTION, seek_shim, "CURLOPT_SEEKFUNCTION");
  e.setopt(CURLOPT_SEEKDATA, static_cast<void*>(easy.get()), "CURLOPT_SEEKDATA");
  e.setopt(CURLOPT_WRITEFUNCTION, write_shim, "CURLOPT_WRITEFUNCTION");
  e.setopt(CURLOPT_WRITEDATA, static_cast<void*>(easy.get()), "CURLOPT_WRITEDATA");

  if (request.metrics.value_or(false)) {
    e.setopt(CURLOPT_NOPROGRESS, 0L, "CURLOPT_NOPROGRESS");
    e.setopt(CURLOPT_XFERINFOFUNCTION, xferinfo_shim, "CURLOPT_XFERINFOFUNCTION");
    e.setopt(CURLOPT_XFERINFODATA, static_cast<void*>(easy.get()), "CURLOPT_XFERINFODATA");
  }

  if (wire_logging_enabled()) {
    e.setopt(CURLOPT_VERBOSE, 1L, "CURLOPT_VERBOSE");
    e.setopt(CURLOPT_DEBUGFUNCTION, debug_shim, "CURLOPT_DEBUGFUNCTION");
    e.setopt(CURLOPT_DEBUGDATA, static_cast<void*>(easy.get()), "CURLOPT_DEBUGDATA");
  }

  if (e.setopt_error) {
    spdlog::debug("[{}] transfer rejected: {}", token, e.setopt_error->message());
    return std::move(e.setopt_error);
  }

  // Register before adding: curl may fire callbacks right away
  Easy* raw = easy.get();
  easies_.emplace(token, std::move(easy));

  CURLMcode result = curl_multi_add_handle(multi_, raw->handle);
  if (result != CURLM_OK) {
    easies_.erase(token);
    check_multi(result, "curl_multi_add_handle");
  }
  return std::nullopt;
}

void CurlEngine::remove(TransferToken token) {
  auto it = easies_.find(token);
  if (it == easies_.end()) {
    return;
  }

  CURLMcode result = curl_multi_remove_handle(multi_, it->second->handle);
  easies_.erase(it);
  check_multi(result, "curl_multi_remove_handle");
}

const TransferInfo* CurlEngine::transfer_info(TransferToken token) const {
  auto it = easies_.find(token);
  return it == easies_.end() ? nullptr : it->second.get();
}

void CurlEngine::socket_action(Socket socket, bool readable, bool writable) {
  int mask = 0;
  if (readable) {
    mask |= CURL_CSELECT_IN;
  }
  if (writable) {
    mask |= CURL_CSELECT_OUT;
  }

  int running = 0;
  check_multi(curl_multi_socket_action(multi_, socket, mask, &running), "curl_multi_socket_action");
}

void CurlEngine::timeout() {
  int running = 0;
  check_multi(curl_multi_socket_action(multi_, CURL_SOCKET_TIMEOUT, 0, &running), "curl_multi_socket_action");
}

std::vector<Completion> CurlEngine::take_completions() {
  std::vector<Completion> done;

  int in_queue = 0;
  while (CURLMsg* msg = curl_multi_info_read(multi_, &in_queue)) {
    if (msg->msg != CURLMSG_DONE) {
      continue;
    }

    void* priv = nullptr;
    curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);
    auto* easy = static_cast<Easy*>(priv);
    if (!easy) {
      spdlog::warn("completed transfer without a private pointer");
      continue;
    }

    CURLcode code = msg->data.result;
    if (code == CURLE_OK) {
      done.push_back(Completion{easy->token, std::nullopt});
    } else {
      done.push_back(Completion{easy->token, Error(error_kind_from_curl(code), easy->error_context(code))});
    }
  }

  return done;
}

std::optional<Error> CurlEngine::unpause_read(TransferToken token) {
  return unpause(token, CURLPAUSE_SEND);
}

std::optional<Error> CurlEngine::unpause_write(TransferToken token) {
  return unpause(token, CURLPAUSE_RECV);
}

std::optional<Error> CurlEngine::unpause(TransferToken token, int resume_bit) {
  auto it = easies_.find(token);
  if (it == easies_.end()) {
    return Error(ErrorKind::Engine, "unknown transfer " + std::to_string(token));
  }

  Easy& easy = *it->second;
  easy.paused &= ~resume_bit;

  // May re-enter the callbacks, which can pause again
  CURLcode code = curl_easy_pause(easy.handle, easy.paused);
  if (code != CURLE_OK) {
    return Error(error_kind_from_curl(code), curl_easy_strerror(code));
  }
  return std::nullopt;
}

// --- curl callbacks ---

int CurlEngine::socket_shim(CURL*, curl_socket_t socket, int what, void* userp, void*) {
  auto* self = static_cast<CurlEngine*>(userp);
  if (!self->socket_fn_) {
    return 0;
  }

  SocketInterest interest;
  switch (what) {
    case CURL_POLL_IN:
      interest = SocketInterest::Read;
      break;
    case CURL_POLL_OUT:
      interest = SocketInterest::Write;
      break;
    case CURL_POLL_INOUT:
      interest = SocketInterest::ReadWrite;
      break;
    case CURL_POLL_REMOVE:
      interest = SocketInterest::Remove;
      break;
    default:
      return 0;
  }

  try {
    self->socket_fn_(socket, interest);
  } catch (const std::exception& e) {
    spdlog::error("socket callback failed: {}", e.what());
    return -1;
  }
  return 0;
}

int CurlEngine::timer_shim(CURLM*, long timeout_ms, void* userp) {
  auto* self = static_cast<CurlEngine*>(userp);
  if (!self->timer_fn_) {
    return 0;
  }

  try {
    if (timeout_ms < 0) {
      self->timer_fn_(std::nullopt);
    } else {
      self->timer_fn_(std::chrono::milliseconds(timeout_ms));
    }
  } catch (const std::exception& e) {
    spdlog::error("timer callback failed: {}", e.what());
    return -1;
  }
  return 0;
}

size_t CurlEngine::header_shim(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* easy = static_cast<Easy*>(userdata);
  size_t len = size * nitems;

  try {
    if (easy->handler->on_header(std::string_view(buffer, len))) {
      return len;
    }
  } catch (const std::exception& e) {
    spdlog::error("[{}] header callback failed: {}", easy->token, e.what());
  }

  // Anything other than len aborts the transfer
  return len == 0 ? 1 : 0;
}

size_t CurlEngine::read_shim(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* easy = static_cast<Easy*>(userdata);

  try {
    CallbackIo io = easy->handler->on_read(buffer, size * nitems);
    switch (io.action) {
      case CallbackIo::Action::Continue:
        return io.bytes;
      case CallbackIo::Action::Pause:
        easy->paused |= CURLPAUSE_SEND;
        return CURL_READFUNC_PAUSE;
      case CallbackIo::Action::Abort:
        return CURL_READFUNC_ABORT;
    }
  } catch (const std::exception& e) {
    spdlog::error("[{}] read callback failed: {}", easy->token, e.what());
  }
  return CURL_READFUNC_ABORT;
}

int CurlEngine::seek_shim(void* userdata, curl_off_t offset, int origin) {
  auto* easy = static_cast<Easy*>(userdata);

  switch (easy->handler->on_seek(static_cast<int64_t>(offset), origin)) {
    case SeekResult::Ok:
      return CURL_SEEKFUNC_OK;
    case SeekResult::Fail:
      return CURL_SEEKFUNC_FAIL;
    case SeekResult::CantSeek:
      break;
  }
  return CURL_SEEKFUNC_CANTSEEK;
}

size_t CurlEngine::write_shim(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* easy = static_cast<Easy*>(userdata);

  try {
    CallbackIo io = easy->handler->on_write(data, size * nmemb);
    switch (io.action) {
      case CallbackIo::Action::Continue:
        return io.bytes;
      case CallbackIo::Action::Pause:
        easy->paused |= CURLPAUSE_RECV;
        return CURL_WRITEFUNC_PAUSE;
      case CallbackIo::Action::Abort:
        return 0;
    }
  } catch (const std::exception& e) {
    spdlog::error("[{}] write callback failed: {}", easy->token, e.what());
  }
  return 0;
}

int CurlEngine::xferinfo_shim(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal,
                              curl_off_t ulnow) {
  auto* easy = static_cast<Easy*>(clientp);

  TransferProgress progress;
  progress.download_total = static_cast<uint64_t>(dltotal);
  progress.download_now = static_cast<uint64_t>(dlnow);
  progress.upload_total = static_cast<uint64_t>(ultotal);
  progress.upload_now = static_cast<uint64_t>(ulnow);

  curl_off_t value = 0;
  if (curl_easy_getinfo(easy->handle, CURLINFO_SPEED_UPLOAD_T, &value) == CURLE_OK) {
    progress.upload_speed = static_cast<uint64_t>(value);
  }
  if (curl_easy_getinfo(easy->handle, CURLINFO_SPEED_DOWNLOAD_T, &value) == CURLE_OK) {
    progress.download_speed = static_cast<uint64_t>(value);
  }

  auto time_info = [&](CURLINFO info) {
    curl_off_t us = 0;
    if (curl_easy_getinfo(easy->handle, info, &us) != CURLE_OK) {
      us = 0;
    }
    return std::chrono::microseconds(us);
  };

  progress.namelookup = time_info(CURLINFO_NAMELOOKUP_TIME_T);
  progress.connect = time_info(CURLINFO_CONNECT_TIME_T);
  progress.appconnect = time_info(CURLINFO_APPCONNECT_TIME_T);
  progress.pretransfer = time_info(CURLINFO_PRETRANSFER_TIME_T);
  progress.starttransfer = time_info(CURLINFO_STARTTRANSFER_TIME_T);
  progress.total = time_info(CURLINFO_TOTAL_TIME_T);
  progress.redirect = time_info(CURLINFO_REDIRECT_TIME_T);

  // Non-zero aborts the transfer
  return easy->handler->on_progress(progress) ? 0 : 1;
}

int CurlEngine::debug_shim(CURL*, curl_infotype type, char* data, size_t size, void* userptr) {
  auto* easy = static_cast<Easy*>(userptr);
  std::string_view text(data, size);

  switch (type) {
    case CURLINFO_TEXT:
      while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
      }
      spdlog::debug("[{}] {}", easy->token, text);
      break;
    case CURLINFO_HEADER_IN:
      spdlog::trace("[{}] < {}", easy->token, escape_wire_data(text));
      break;
    case CURLINFO_HEADER_OUT:
      spdlog::trace("[{}] > {}", easy->token, escape_wire_data(text));
      break;
    case CURLINFO_DATA_IN:
      spdlog::trace("[{}] << {}", easy->token, escape_wire_data(text));
      break;
    case CURLINFO_DATA_OUT:
      spdlog::trace("[{}] >> {}", easy->token, escape_wire_data(text));
      break;
    default:
      break;
  }
  return 0;
}

}  // namespace ferry
