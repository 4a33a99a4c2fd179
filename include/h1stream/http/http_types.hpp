#pragma once

#include "h1stream/core/error.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace h1stream::http {

enum class HttpStatus : std::uint16_t {
  Ok = 200,

  BadRequest = 400,
  PayloadTooLarge = 413,
  UriTooLong = 414,
  ExpectationFailed = 417,
  UnprocessableEntity = 422,
  RequestHeaderFieldsTooLarge = 431,

  NotImplemented = 501,
  HttpVersionNotSupported = 505
};

[[nodiscard]] auto status_reason_phrase(HttpStatus status) -> std::string_view;

/// Whether a method may carry a request entity
enum class EntityAcceptance : std::uint8_t {
  Expected,
  Tolerated,
  Disallowed
};

[[nodiscard]] auto parse_entity_acceptance(std::string_view name)
    -> std::optional<EntityAcceptance>;

class HttpMethod {
public:
  HttpMethod() = default;
  HttpMethod(std::string name, EntityAcceptance acceptance)
      : name_(std::move(name)), acceptance_(acceptance) {}

  static auto get() -> HttpMethod;
  static auto post() -> HttpMethod;
  static auto put() -> HttpMethod;
  static auto patch() -> HttpMethod;
  static auto delete_() -> HttpMethod;
  static auto head() -> HttpMethod;
  static auto options() -> HttpMethod;
  static auto trace() -> HttpMethod;
  static auto connect() -> HttpMethod;

  [[nodiscard]] auto name() const noexcept -> std::string_view {
    return name_;
  }

  [[nodiscard]] auto acceptance() const noexcept -> EntityAcceptance {
    return acceptance_;
  }

  [[nodiscard]] auto is_entity_accepted() const noexcept -> bool {
    return acceptance_ != EntityAcceptance::Disallowed;
  }

  friend auto operator==(const HttpMethod& a, const HttpMethod& b) -> bool {
    return a.name_ == b.name_;
  }

private:
  std::string name_{"GET"};
  EntityAcceptance acceptance_{EntityAcceptance::Tolerated};
};

enum class HttpProtocol : std::uint8_t {
  Http10,
  Http11
};

[[nodiscard]] constexpr auto protocol_name(HttpProtocol protocol) noexcept
    -> std::string_view {
  return protocol == HttpProtocol::Http10 ? "HTTP/1.0" : "HTTP/1.1";
}

struct HttpHeader {
  std::string name;
  std::string value;

  [[nodiscard]] auto is(std::string_view other) const -> bool;

  friend auto operator==(const HttpHeader&, const HttpHeader&)
      -> bool = default;
};

using HttpHeaders = std::vector<HttpHeader>;

/// First header named `name` (case-insensitive)
[[nodiscard]] auto find_header(const HttpHeaders& headers,
                               std::string_view name)
    -> std::optional<std::string_view>;

/// ASCII case-insensitive comparison
[[nodiscard]] auto iequals(std::string_view a, std::string_view b) noexcept
    -> bool;

[[nodiscard]] auto to_lower(std::string_view s) -> std::string;

/// Whether a comma-separated header value contains `token`
/// (case-insensitive, surrounding whitespace ignored)
[[nodiscard]] auto has_token(std::string_view list, std::string_view token)
    -> bool;

/// RFC 7230 tchar
[[nodiscard]] constexpr auto is_token_char(std::uint8_t c) noexcept -> bool {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
      (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

}  // namespace h1stream::http

template <>
struct std::formatter<h1stream::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(const h1stream::http::HttpMethod& method, auto& ctx) const {
    return std::formatter<std::string_view>::format(method.name(), ctx);
  }
};

template <>
struct std::formatter<h1stream::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(h1stream::http::HttpStatus status, auto& ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};

template <>
struct std::formatter<h1stream::http::HttpProtocol>
    : std::formatter<std::string_view> {
  auto format(h1stream::http::HttpProtocol protocol, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        h1stream::http::protocol_name(protocol), ctx);
  }
};
