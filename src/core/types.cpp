#include "ferry/core/error.hpp"
#include "ferry/core/types.hpp"

namespace ferry {

std::string to_string(HttpVersion version) {
  switch (version) {
    case HttpVersion::Http09:
      return "HTTP/0.9";
    case HttpVersion::Http10:
      return "HTTP/1.0";
    case HttpVersion::Http11:
      return "HTTP/1.1";
    case HttpVersion::Http2:
      return "HTTP/2";
    case HttpVersion::Http3:
      return "HTTP/3";
    case HttpVersion::Unknown:
      break;
  }
  return "unknown";
}

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Aborted:
      return "request aborted unexpectedly";
    case ErrorKind::BadClientCertificate:
      return "problem with the local certificate";
    case ErrorKind::BadServerCertificate:
      return "server certificate could not be validated";
    case ErrorKind::ConnectionFailed:
      return "failed to connect to the server";
    case ErrorKind::NameResolution:
      return "couldn't resolve host name";
    case ErrorKind::Engine:
      return "transfer engine error";
    case ErrorKind::InvalidContentEncoding:
      return "unrecognized or bad content encoding";
    case ErrorKind::InvalidCredentials:
      return "credentials were rejected by the server";
    case ErrorKind::NoResponse:
      return "server did not send a response";
    case ErrorKind::ProtocolViolation:
      return "invalid HTTP response";
    case ErrorKind::RangeRequestUnsupported:
      return "server does not support or accept range requests";
    case ErrorKind::RequestBodyError:
      return "error reading the request body";
    case ErrorKind::RequestBodyNotRewindable:
      return "request body could not be re-sent because it is not rewindable";
    case ErrorKind::ResponseBodyError:
      return "error writing the response body";
    case ErrorKind::Timeout:
      return "request took longer than the configured timeout";
    case ErrorKind::TlsEngine:
      return "error in the TLS engine";
    case ErrorKind::TlsHandshake:
      return "failed to connect over a secure socket";
    case ErrorKind::TooManyRedirects:
      return "max redirect limit exceeded";
  }
  return "unknown error";
}

std::error_code Error::to_error_code() const {
  switch (kind_) {
    case ErrorKind::ConnectionFailed:
      return std::make_error_code(std::errc::connection_refused);
    case ErrorKind::Timeout:
      return std::make_error_code(std::errc::timed_out);
    case ErrorKind::Aborted:
    case ErrorKind::NoResponse:
    case ErrorKind::ResponseBodyError:
      // Body cut short
      return std::make_error_code(std::errc::connection_aborted);
    default:
      return std::make_error_code(std::errc::io_error);
  }
}

std::string Error::message() const {
  std::string msg = to_string(kind_);
  if (!context_.empty()) {
    msg += ": " + context_;
  }
  return msg;
}

}  // namespace ferry
