#include "h1stream/http/header_parser.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace h1stream;
using namespace h1stream::http;

class HeaderParserTest : public ::testing::Test {
protected:
  auto parse(std::string_view block,
             HttpProtocol protocol = HttpProtocol::Http11)
      -> ParseResult<ParsedHeaders> {
    HeaderParser parser(settings_);
    return parser.parse(test::view(block), 0, protocol);
  }

  void expect_error(std::string_view block, ParseErrc code) {
    auto result = parse(block);
    ASSERT_FALSE(result.has_value()) << block;
    EXPECT_TRUE(result.error().is(code))
        << block << ": " << result.error().code.message();
  }

  ParserSettings settings_;
};

TEST_F(HeaderParserTest, ParsesEntriesInOrder) {
  std::string_view block =
      "Host: example.com\r\n"
      "Accept: */*\r\n"
      "X-Trace:   abc  \r\n"
      "\r\n";
  auto result = parse(block);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->next, block.size());

  const auto& set = result->headers;
  ASSERT_EQ(set.entries.size(), 3);
  EXPECT_EQ(set.entries[0], (HttpHeader{"Host", "example.com"}));
  EXPECT_EQ(set.entries[1], (HttpHeader{"Accept", "*/*"}));
  EXPECT_EQ(set.entries[2], (HttpHeader{"X-Trace", "abc"}));
  EXPECT_TRUE(set.host_present);
  EXPECT_FALSE(set.close_after_response);
}

TEST_F(HeaderParserTest, BareLineFeeds) {
  auto result = parse("Host: a\nX: 1\n\nBODY");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->headers.entries.size(), 2);
  EXPECT_EQ(result->next, 14);
}

TEST_F(HeaderParserTest, EmptyBlock) {
  auto result = parse("\r\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->headers.entries.empty());
  EXPECT_EQ(result->next, 2);
}

TEST_F(HeaderParserTest, IncompleteBlockNeedsMoreData) {
  for (auto block : {"", "Host", "Host: a", "Host: a\r", "Host: a\r\n",
                     "Host: a\r\n\r"}) {
    expect_error(block, ParseErrc::NeedMoreData);
  }
}

TEST_F(HeaderParserTest, DerivedFieldsAreRemovedFromEntries) {
  auto result = parse(
      "Content-Length: 42\r\n"
      "Content-Type: text/plain\r\n"
      "Transfer-Encoding: gzip, Chunked\r\n"
      "X-Other: 1\r\n"
      "\r\n");
  ASSERT_TRUE(result.has_value());
  const auto& set = result->headers;
  ASSERT_EQ(set.entries.size(), 1);
  EXPECT_EQ(set.entries[0].name, "X-Other");
  EXPECT_EQ(set.content_length, 42u);
  EXPECT_EQ(set.content_type, "text/plain");
  EXPECT_EQ(set.transfer_encodings,
            (std::vector<std::string>{"gzip", "chunked"}));
  EXPECT_TRUE(set.is_chunked());
}

TEST_F(HeaderParserTest, TransferEncodingAcrossHeaders) {
  auto result = parse(
      "Transfer-Encoding: chunked\r\n"
      "Transfer-Encoding: gzip;q=1\r\n"
      "\r\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->headers.transfer_encodings,
            (std::vector<std::string>{"chunked", "gzip"}));
  EXPECT_FALSE(result->headers.is_chunked());
}

TEST_F(HeaderParserTest, EmptyTransferEncodingIsMalformed) {
  expect_error("Transfer-Encoding: , \r\n\r\n", ParseErrc::MalformedHeaders);
}

TEST_F(HeaderParserTest, ContentLengthValidation) {
  expect_error("Content-Length: abc\r\n\r\n", ParseErrc::MalformedHeaders);
  expect_error("Content-Length: -1\r\n\r\n", ParseErrc::MalformedHeaders);
  expect_error("Content-Length: 1 2\r\n\r\n", ParseErrc::MalformedHeaders);
  expect_error("Content-Length: 99999999999999999999999\r\n\r\n",
               ParseErrc::MalformedHeaders);
  expect_error("Content-Length: 5\r\nContent-Length: 6\r\n\r\n",
               ParseErrc::MalformedHeaders);

  auto same = parse("Content-Length: 5\r\nContent-Length: 5\r\n\r\n");
  ASSERT_TRUE(same.has_value());
  EXPECT_EQ(same->headers.content_length, 5u);
}

TEST_F(HeaderParserTest, DuplicateHostIsMalformed) {
  expect_error("Host: a\r\nHost: b\r\n\r\n", ParseErrc::MalformedHeaders);
}

TEST_F(HeaderParserTest, DuplicateContentTypeIsMalformed) {
  expect_error("Content-Type: a/b\r\nContent-Type: c/d\r\n\r\n",
               ParseErrc::MalformedHeaders);
}

TEST_F(HeaderParserTest, SyntaxErrors) {
  expect_error("Host : a\r\n\r\n", ParseErrc::MalformedHeaders);
  expect_error(": a\r\n\r\n", ParseErrc::MalformedHeaders);
  expect_error("Host: a\r\n folded\r\n\r\n", ParseErrc::MalformedHeaders);
  expect_error("Host: a\rb\r\n\r\n", ParseErrc::MalformedHeaders);
  expect_error("Host: a\x01\r\n\r\n", ParseErrc::MalformedHeaders);
  expect_error("\rX", ParseErrc::MalformedHeaders);
}

TEST_F(HeaderParserTest, ObsTextAndTabsInValues) {
  auto result = parse("X-Name: caf\xc3\xa9\tbar\r\n\r\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->headers.entries[0].value, "caf\xc3\xa9\tbar");
}

TEST_F(HeaderParserTest, Limits) {
  settings_.max_header_name_length = 4;
  settings_.max_header_value_length = 8;
  settings_.max_header_count = 2;

  EXPECT_TRUE(parse("Abcd: 12345678\r\n\r\n").has_value());
  expect_error("Abcde: 1\r\n\r\n", ParseErrc::HeaderFieldsTooLarge);
  expect_error("Ab: 123456789\r\n\r\n", ParseErrc::HeaderFieldsTooLarge);
  expect_error("A: 1\r\nB: 2\r\nC: 3\r\n\r\n", ParseErrc::HeaderFieldsTooLarge);

  auto result = parse("Abcde: 1\r\n\r\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().status, HttpStatus::RequestHeaderFieldsTooLarge);
}

TEST_F(HeaderParserTest, Expect) {
  auto result = parse("Expect: 100-Continue\r\n\r\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->headers.expect_100_continue);

  auto other = parse("Expect: something-else\r\n\r\n");
  ASSERT_FALSE(other.has_value());
  EXPECT_TRUE(other.error().is(ParseErrc::ExpectationFailed));
  EXPECT_EQ(other.error().status, HttpStatus::ExpectationFailed);
}

TEST_F(HeaderParserTest, ConnectionPersistence) {
  auto close = parse("Connection: keep-alive, Close\r\n\r\n");
  ASSERT_TRUE(close.has_value());
  EXPECT_TRUE(close->headers.close_after_response);

  auto http10 = parse("\r\n", HttpProtocol::Http10);
  ASSERT_TRUE(http10.has_value());
  EXPECT_TRUE(http10->headers.close_after_response);

  auto http10_keep_alive =
      parse("Connection: Keep-Alive\r\n\r\n", HttpProtocol::Http10);
  ASSERT_TRUE(http10_keep_alive.has_value());
  EXPECT_FALSE(http10_keep_alive->headers.close_after_response);
}

TEST_F(HeaderParserTest, ParsesFromOffset) {
  HeaderParser parser(settings_);
  auto input = test::view("GET / HTTP/1.1\r\nHost: a\r\n\r\n");
  auto result = parser.parse(input, 16, HttpProtocol::Http11);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->next, input.size());
  EXPECT_TRUE(result->headers.host_present);
}

TEST_F(HeaderParserTest, Trailer) {
  HeaderParser parser(settings_);
  auto input = test::view("X-Checksum: abc\r\nContent-Length: 3\r\n\r\n");
  auto result = parser.parse_trailer(input, 0);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->entries.size(), 2);
  EXPECT_EQ(result->entries[1], (HttpHeader{"Content-Length", "3"}));
  EXPECT_EQ(result->next, input.size());
}
