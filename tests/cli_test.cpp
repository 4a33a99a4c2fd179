#include "h1stream/cli/commands.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace h1stream;
using namespace h1stream::http;

TEST(EventJsonTest, RequestStart) {
  auto events = test::drive(
      "POST /submit?x=1 HTTP/1.1\r\nHost: a\r\nContent-Type: text/plain\r\n"
      "Content-Length: 4\r\n\r\nping");
  ASSERT_FALSE(events.empty());

  auto j = cli::event_to_json(events.front());
  EXPECT_EQ(j["event"], "request_start");
  EXPECT_EQ(j["method"], "POST");
  EXPECT_EQ(j["target"], "/submit?x=1");
  EXPECT_EQ(j["form"], "origin");
  EXPECT_EQ(j["protocol"], "HTTP/1.1");
  ASSERT_EQ(j["headers"].size(), 1);
  EXPECT_EQ(j["headers"][0][0], "Host");
  EXPECT_EQ(j["headers"][0][1], "a");
  EXPECT_EQ(j["entity"]["framing"], "strict");
  EXPECT_EQ(j["entity"]["length"], 4);
  EXPECT_EQ(j["entity"]["data"], "ping");
  EXPECT_EQ(j["entity"]["content_type"], "text/plain");
  EXPECT_EQ(j["expect_100_continue"], false);
}

TEST(EventJsonTest, ChunkedParts) {
  auto events = test::drive(
      "POST / HTTP/1.1\r\nHost: a\r\nTransfer-Encoding: chunked\r\n\r\n"
      "3;n=1\r\nabc\r\n0\r\nX-Sum: 3\r\n\r\n");
  ASSERT_EQ(events.size(), 4);

  EXPECT_EQ(cli::event_to_json(events[0])["entity"]["framing"],
            "deferred_chunked");

  auto part = cli::event_to_json(events[1]);
  EXPECT_EQ(part["event"], "entity_part");
  EXPECT_EQ(part["size"], 3);
  EXPECT_EQ(part["data"], "abc");
  EXPECT_EQ(part["extension"], "n=1");

  auto end = cli::event_to_json(events[2]);
  EXPECT_EQ(end["event"], "entity_end");
  EXPECT_EQ(end["trailer"][0][0], "X-Sum");

  EXPECT_EQ(cli::event_to_json(events[3])["event"], "stream_end");
}

TEST(EventJsonTest, Failure) {
  auto events = test::drive("GET / HTTP/2.0\r\n\r\n");
  ASSERT_EQ(events.size(), 2);

  auto j = cli::event_to_json(events[0]);
  EXPECT_EQ(j["event"], "failure");
  EXPECT_EQ(j["status"], 505);
  EXPECT_EQ(j["reason"], "HTTP Version Not Supported");
  EXPECT_EQ(j["error"], "unsupported protocol version");
  EXPECT_EQ(j["during_entity"], false);
  EXPECT_FALSE(j.contains("detail"));
}

TEST(EventJsonTest, NeedMoreData) {
  auto j = cli::event_to_json(NeedMoreData{});
  EXPECT_EQ(j["event"], "need_more_data");
  EXPECT_EQ(j.size(), 1);
}
