#include "h1stream/http/uri.hpp"

#include "gtest/gtest.h"

using namespace h1stream;
using namespace h1stream::http;

namespace {

auto strict(std::string_view raw) {
  return parse_request_target(raw, UriParsingMode::Strict);
}

auto relaxed(std::string_view raw) {
  return parse_request_target(raw, UriParsingMode::Relaxed);
}

}  // namespace

TEST(UriTest, OriginForm) {
  auto uri = strict("/api/v1/items?limit=10&sort=name");
  ASSERT_TRUE(uri.has_value());
  EXPECT_EQ(uri->form, TargetForm::Origin);
  EXPECT_EQ(uri->path, "/api/v1/items");
  ASSERT_TRUE(uri->query.has_value());
  EXPECT_EQ(*uri->query, "limit=10&sort=name");
  EXPECT_TRUE(uri->host.empty());
  EXPECT_EQ(uri->to_string(), "/api/v1/items?limit=10&sort=name");
}

TEST(UriTest, EmptyQueryIsPresent) {
  auto uri = strict("/search?");
  ASSERT_TRUE(uri.has_value());
  ASSERT_TRUE(uri->query.has_value());
  EXPECT_TRUE(uri->query->empty());
}

TEST(UriTest, PercentEncodingIsKept) {
  auto uri = strict("/a%20b/%C3%A9");
  ASSERT_TRUE(uri.has_value());
  EXPECT_EQ(uri->path, "/a%20b/%C3%A9");
}

TEST(UriTest, BadPercentEncoding) {
  EXPECT_FALSE(strict("/a%2").has_value());
  EXPECT_FALSE(strict("/a%zz").has_value());
  EXPECT_FALSE(relaxed("/a%g1").has_value());
}

TEST(UriTest, AbsoluteForm) {
  auto uri = strict("HTTP://User@Example.COM:8080/index.html?x=1");
  ASSERT_TRUE(uri.has_value());
  EXPECT_EQ(uri->form, TargetForm::Absolute);
  EXPECT_EQ(uri->scheme, "http");
  EXPECT_EQ(uri->userinfo, "User");
  EXPECT_EQ(uri->host, "example.com");
  ASSERT_TRUE(uri->port.has_value());
  EXPECT_EQ(*uri->port, 8080);
  EXPECT_EQ(uri->path, "/index.html");
  EXPECT_EQ(uri->to_string(), "http://User@example.com:8080/index.html?x=1");
}

TEST(UriTest, AbsoluteFormWithoutPath) {
  auto uri = strict("http://example.com");
  ASSERT_TRUE(uri.has_value());
  EXPECT_EQ(uri->host, "example.com");
  EXPECT_TRUE(uri->path.empty());
  EXPECT_FALSE(uri->port.has_value());
}

TEST(UriTest, Ipv6Host) {
  auto uri = strict("http://[::1]:443/");
  ASSERT_TRUE(uri.has_value());
  EXPECT_EQ(uri->host, "[::1]");
  EXPECT_EQ(*uri->port, 443);

  EXPECT_FALSE(strict("http://[::1/").has_value());
}

TEST(UriTest, AuthorityForm) {
  auto uri = strict("Example.com:443");
  ASSERT_TRUE(uri.has_value());
  EXPECT_EQ(uri->form, TargetForm::Authority);
  EXPECT_EQ(uri->host, "example.com");
  EXPECT_EQ(*uri->port, 443);
  EXPECT_EQ(uri->to_string(), "example.com:443");
}

TEST(UriTest, AuthorityFormNeedsPortAndNoUserinfo) {
  EXPECT_FALSE(strict("example.com").has_value());
  EXPECT_FALSE(strict("example.com:").has_value());
  EXPECT_FALSE(strict("user@example.com:443").has_value());
  EXPECT_FALSE(strict("example.com:99999").has_value());
}

TEST(UriTest, AsteriskForm) {
  auto uri = strict("*");
  ASSERT_TRUE(uri.has_value());
  EXPECT_EQ(uri->form, TargetForm::Asterisk);
  EXPECT_EQ(uri->to_string(), "*");
}

TEST(UriTest, EmptyTarget) {
  auto uri = strict("");
  ASSERT_FALSE(uri.has_value());
  EXPECT_EQ(uri.error().summary, "Illegal request-target");
}

TEST(UriTest, FragmentIsRejected) {
  auto uri = strict("/page#section");
  ASSERT_FALSE(uri.has_value());
  EXPECT_NE(uri.error().detail.find("Fragment"), std::string::npos);
  EXPECT_FALSE(relaxed("/page#section").has_value());
}

TEST(UriTest, StrictRejectsUnsafeCharacters) {
  for (auto raw : {"/a|b", "/{x}", "/q?a=\"b\"", "/a\\b", "/caf\xc3\xa9"}) {
    auto uri = strict(raw);
    EXPECT_FALSE(uri.has_value()) << raw;
  }
}

TEST(UriTest, RelaxedAcceptsVisibleCharacters) {
  for (auto raw : {"/a|b", "/{x}", "/q?a=\"b\"", "/a\\b", "/caf\xc3\xa9"}) {
    auto uri = relaxed(raw);
    EXPECT_TRUE(uri.has_value()) << raw;
  }
}

TEST(UriTest, DiagnosticNamesPosition) {
  auto uri = strict("/ab|c");
  ASSERT_FALSE(uri.has_value());
  EXPECT_EQ(uri.error().detail, "Invalid input '|' in path at position 4");
}

TEST(UriTest, Equality) {
  EXPECT_EQ(*strict("/x?y"), *strict("/x?y"));
  EXPECT_NE(*strict("/x"), *strict("/x?"));
}
