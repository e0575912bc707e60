#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/core/types.hpp"

namespace ferry {

// Parse an HTTP status line such as "HTTP/1.1 200 OK\r\n"
std::optional<std::pair<HttpVersion, int>> parse_status_line(std::string_view line);

// Parse a "Name: value" header line, trimming whitespace around the value
std::optional<std::pair<std::string, std::string>> parse_header(std::string_view line);

// True for the blank line that terminates a header block
bool is_header_terminator(std::string_view line);

// Format a request header the way libcurl expects it; a header with an
// explicitly empty value needs the "Name;" form
std::string header_to_curl_string(std::string_view name, std::string_view value);

}  // namespace ferry
