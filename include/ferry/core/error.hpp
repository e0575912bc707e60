#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ferry {

// Classification of everything that can end a transfer unsuccessfully
enum class ErrorKind {
  Aborted,                   // Cancelled, or the agent dropped the transfer
  BadClientCertificate,      // Problem with the local certificate
  BadServerCertificate,      // Server certificate failed validation
  ConnectionFailed,          // Could not connect to the server
  NameResolution,            // Host or proxy name could not be resolved
  Engine,                    // Unrecognized engine failure
  InvalidContentEncoding,    // Bad or unsupported content encoding
  InvalidCredentials,        // Credentials rejected by the server
  NoResponse,                // Server closed without sending a response
  ProtocolViolation,         // Response could not be parsed
  RangeRequestUnsupported,   // Server refused a range request
  RequestBodyError,          // Reading the request body failed
  RequestBodyNotRewindable,  // Engine needed to replay a body that can't be reset
  ResponseBodyError,         // Writing the response body failed
  Timeout,                   // Transfer exceeded its configured timeout
  TlsEngine,                 // TLS backend failure
  TlsHandshake,              // TLS handshake failed
  TooManyRedirects,          // Redirect limit reached
};

std::string to_string(ErrorKind kind);

// Error reported for a single transfer
class Error {
 public:
  Error(ErrorKind kind, std::string context = {}) : kind_(kind), context_(std::move(context)) {}

  static Error aborted(std::string context = {}) {
    return Error(ErrorKind::Aborted, std::move(context));
  }

  ErrorKind kind() const {
    return kind_;
  }

  // Extra detail, e.g. the engine's error buffer
  const std::string& context() const {
    return context_;
  }

  const std::optional<std::string>& local_addr() const {
    return local_addr_;
  }

  const std::optional<std::string>& remote_addr() const {
    return remote_addr_;
  }

  Error& with_local_addr(std::string addr) {
    local_addr_ = std::move(addr);
    return *this;
  }

  Error& with_remote_addr(std::string addr) {
    remote_addr_ = std::move(addr);
    return *this;
  }

  bool is_timeout() const {
    return kind_ == ErrorKind::Timeout;
  }

  bool is_aborted() const {
    return kind_ == ErrorKind::Aborted;
  }

  // Closest I/O error code, used when the error surfaces through a body read
  std::error_code to_error_code() const;

  std::string message() const;

 private:
  ErrorKind kind_;
  std::string context_;
  std::optional<std::string> local_addr_;
  std::optional<std::string> remote_addr_;
};

// Thrown when the agent thread is gone and can no longer accept work
class AgentError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace ferry
