#include "h1stream/util/log.hpp"

#include "h1stream/http/request_parser.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace h1stream;

class LogTest : public ::testing::Test {
protected:
  void SetUp() override {
    log::set_sink([this](log::Level level, std::string_view line) {
      lines_.push_back({level, std::string(line)});
    });
  }

  void TearDown() override {
    log::set_sink({});
    log::set_level(log::Level::Info);
  }

  auto contains(log::Level level, std::string_view text) const -> bool {
    for (const auto& [l, line] : lines_) {
      if (l == level && line.find(text) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

  std::vector<std::pair<log::Level, std::string>> lines_;
};

TEST_F(LogTest, LevelFiltering) {
  log::set_level("warn");
  log::info("hidden {}", 1);
  log::warn("shown {}", 2);
  log::error("shown {}", 3);

  ASSERT_EQ(lines_.size(), 2);
  EXPECT_TRUE(contains(log::Level::Warn, "shown 2"));
  EXPECT_TRUE(contains(log::Level::Error, "shown 3"));
  EXPECT_TRUE(lines_[0].second.ends_with("\n"));
}

TEST_F(LogTest, OffSilencesEverything) {
  log::set_level("off");
  log::error("nothing");
  EXPECT_TRUE(lines_.empty());
  EXPECT_FALSE(log::logger().enabled(log::Level::Off));
}

TEST_F(LogTest, UnknownLevelNameFallsBackToInfo) {
  log::set_level("chatty");
  EXPECT_EQ(log::logger().level(), log::Level::Info);
}

TEST_F(LogTest, ParserReportsRejections) {
  log::set_level(log::Level::Debug);
  auto events = test::drive("GET / HTTP/1.1\r\n\r\n");
  ASSERT_FALSE(events.empty());
  EXPECT_TRUE(contains(log::Level::Debug, "Rejecting request #1 with 400"));
}

TEST_F(LogTest, ParserWarnsAboutBytesAfterFinish) {
  http::RequestParser parser(test::shared());
  auto first = parser.push(
      "GET /a HTTP/1.1\r\nHost: a\r\n\r\nGET /b HTTP/1.1\r\nHost: a\r\n\r\n");
  EXPECT_TRUE(std::holds_alternative<http::RequestStart>(first));
  EXPECT_TRUE(std::holds_alternative<http::RequestStart>(parser.finish()));

  EXPECT_TRUE(std::holds_alternative<http::StreamEnd>(parser.push("late")));
  EXPECT_TRUE(contains(log::Level::Warn, "Ignoring 4 bytes pushed after end"));
}
