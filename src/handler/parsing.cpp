#include "handler/parsing.hpp"

#include <cctype>

namespace ferry {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

bool is_token_char(char c) {
  // RFC 7230 tchar
  if (std::isalnum(static_cast<unsigned char>(c))) {
    return true;
  }
  switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
      return true;
    default:
      return false;
  }
}

}  // namespace

std::optional<std::pair<HttpVersion, int>> parse_status_line(std::string_view line) {
  line = trim(line);

  auto space = line.find_first_of(" \t");
  if (space == std::string_view::npos) {
    return std::nullopt;
  }

  std::string_view version_str = line.substr(0, space);
  HttpVersion version;
  if (version_str == "HTTP/3") {
    version = HttpVersion::Http3;
  } else if (version_str == "HTTP/2") {
    version = HttpVersion::Http2;
  } else if (version_str == "HTTP/1.1") {
    version = HttpVersion::Http11;
  } else if (version_str == "HTTP/1.0") {
    version = HttpVersion::Http10;
  } else if (version_str == "HTTP/0.9") {
    version = HttpVersion::Http09;
  } else {
    return std::nullopt;
  }

  std::string_view rest = trim(line.substr(space));
  if (rest.size() < 3) {
    return std::nullopt;
  }

  int status = 0;
  for (std::size_t i = 0; i < 3; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(rest[i]))) {
      return std::nullopt;
    }
    status = status * 10 + (rest[i] - '0');
  }

  // Status code is exactly three digits
  if (rest.size() > 3 && !is_space(rest[3])) {
    return std::nullopt;
  }
  if (status < 100) {
    return std::nullopt;
  }

  return std::make_pair(version, status);
}

std::optional<std::pair<std::string, std::string>> parse_header(std::string_view line) {
  auto colon = line.find(':');
  if (colon == std::string_view::npos || colon == 0) {
    return std::nullopt;
  }

  std::string_view name = line.substr(0, colon);
  for (char c : name) {
    if (!is_token_char(c)) {
      return std::nullopt;
    }
  }

  std::string_view value = trim(line.substr(colon + 1));
  for (char c : value) {
    if (c == '\r' || c == '\n' || c == '\0') {
      return std::nullopt;
    }
  }

  return std::make_pair(std::string(name), std::string(value));
}

bool is_header_terminator(std::string_view line) {
  return line == "\r\n" || line == "\n";
}

std::string header_to_curl_string(std::string_view name, std::string_view value) {
  std::string out(name);
  if (trim(value).empty()) {
    out += ';';
  } else {
    out += ": ";
    out += value;
  }
  return out;
}

}  // namespace ferry
