#include <gtest/gtest.h>

#include "handler/parsing.hpp"

using namespace ferry;

// --- StatusLineTest ---

TEST(StatusLineTest, Versions) {
  auto h11 = parse_status_line("HTTP/1.1 200 OK\r\n");
  ASSERT_TRUE(h11.has_value());
  EXPECT_EQ(h11->first, HttpVersion::Http11);
  EXPECT_EQ(h11->second, 200);

  auto h2 = parse_status_line("HTTP/2 404\r\n");
  ASSERT_TRUE(h2.has_value());
  EXPECT_EQ(h2->first, HttpVersion::Http2);
  EXPECT_EQ(h2->second, 404);

  EXPECT_EQ(parse_status_line("HTTP/1.0 301 Moved Permanently")->first, HttpVersion::Http10);
  EXPECT_EQ(parse_status_line("HTTP/3 204")->first, HttpVersion::Http3);
}

TEST(StatusLineTest, Rejects) {
  EXPECT_FALSE(parse_status_line("").has_value());
  EXPECT_FALSE(parse_status_line("\r\n").has_value());
  EXPECT_FALSE(parse_status_line("HTTP/1.1\r\n").has_value());
  EXPECT_FALSE(parse_status_line("HTTP/1.1 20 OK").has_value());
  EXPECT_FALSE(parse_status_line("HTTP/1.1 2000 OK").has_value());
  EXPECT_FALSE(parse_status_line("HTTP/1.1 abc OK").has_value());
  EXPECT_FALSE(parse_status_line("SPDY/3 200 OK").has_value());
  EXPECT_FALSE(parse_status_line("Content-Type: text/plain").has_value());
}

// --- HeaderLineTest ---

TEST(HeaderLineTest, TrimsValue) {
  auto header = parse_header("Content-Type:   text/html; charset=utf-8  \r\n");
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->first, "Content-Type");
  EXPECT_EQ(header->second, "text/html; charset=utf-8");
}

TEST(HeaderLineTest, EmptyValue) {
  auto header = parse_header("X-Empty:\r\n");
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->first, "X-Empty");
  EXPECT_EQ(header->second, "");
}

TEST(HeaderLineTest, Rejects) {
  EXPECT_FALSE(parse_header("\r\n").has_value());
  EXPECT_FALSE(parse_header("no colon here").has_value());
  EXPECT_FALSE(parse_header(": value").has_value());
  EXPECT_FALSE(parse_header("Bad Name: value").has_value());
  EXPECT_FALSE(parse_header("HTTP/1.1 200 OK\r\n").has_value());
}

TEST(HeaderLineTest, Terminator) {
  EXPECT_TRUE(is_header_terminator("\r\n"));
  EXPECT_TRUE(is_header_terminator("\n"));
  EXPECT_FALSE(is_header_terminator(""));
  EXPECT_FALSE(is_header_terminator("X: y\r\n"));
}

// --- CurlHeaderTest ---

TEST(CurlHeaderTest, Format) {
  EXPECT_EQ(header_to_curl_string("Accept", "*/*"), "Accept: */*");
  // 空值需要 "Name;" 形式
  EXPECT_EQ(header_to_curl_string("X-Empty", ""), "X-Empty;");
  EXPECT_EQ(header_to_curl_string("X-Blank", "  "), "X-Blank;");
}
