#pragma once

#include "h1stream/http/http_types.hpp"

#include <expected>
#include <string>
#include <system_error>
#include <utility>

namespace h1stream::http {

enum class ParseErrc {
  Success = 0,
  NeedMoreData,
  MalformedRequestLine,
  MethodTooLong,
  WrongProtocol,
  UnsupportedMethod,
  TargetTooLong,
  MalformedRequestTarget,
  UnsupportedProtocolVersion,
  MissingHostHeader,
  ConflictingFraming,
  EntityNotAllowed,
  MalformedHeaders,
  HeaderFieldsTooLarge,
  ExpectationFailed,
  EntityTooLarge,
  MalformedChunk,
  TruncatedStream,
  Aborted,
};

class ParseErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "h1stream.http";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<ParseErrc>(ev)) {
      case ParseErrc::Success: return "success";
      case ParseErrc::NeedMoreData: return "need more data";
      case ParseErrc::MalformedRequestLine: return "malformed request line";
      case ParseErrc::MethodTooLong: return "method too long";
      case ParseErrc::WrongProtocol: return "wrong protocol";
      case ParseErrc::UnsupportedMethod: return "unsupported method";
      case ParseErrc::TargetTooLong: return "request target too long";
      case ParseErrc::MalformedRequestTarget: return "malformed request target";
      case ParseErrc::UnsupportedProtocolVersion:
        return "unsupported protocol version";
      case ParseErrc::MissingHostHeader: return "missing Host header";
      case ParseErrc::ConflictingFraming: return "conflicting message framing";
      case ParseErrc::EntityNotAllowed: return "entity not allowed";
      case ParseErrc::MalformedHeaders: return "malformed headers";
      case ParseErrc::HeaderFieldsTooLarge: return "header fields too large";
      case ParseErrc::ExpectationFailed: return "expectation failed";
      case ParseErrc::EntityTooLarge: return "entity too large";
      case ParseErrc::MalformedChunk: return "malformed chunk";
      case ParseErrc::TruncatedStream: return "truncated stream";
      case ParseErrc::Aborted: return "aborted";
    }
    return "unknown error";
  }
};

[[nodiscard]] inline auto parse_error_category() noexcept
    -> const ParseErrorCategory& {
  static const ParseErrorCategory instance;
  return instance;
}

[[nodiscard]] inline auto make_error_code(ParseErrc e) noexcept
    -> std::error_code {
  return {std::to_underlying(e), parse_error_category()};
}

/// Status a server should answer with for a given failure
[[nodiscard]] auto default_status(ParseErrc e) noexcept -> HttpStatus;

/// A failed or suspended parse step. `summary` is safe to show to a client,
/// `detail` may echo request bytes.
struct ParseError {
  std::error_code code;
  HttpStatus status{HttpStatus::BadRequest};
  std::string summary;
  std::string detail;

  [[nodiscard]] auto need_more_data() const noexcept -> bool {
    return code == make_error_code(ParseErrc::NeedMoreData);
  }

  [[nodiscard]] auto is(ParseErrc e) const noexcept -> bool {
    return code == make_error_code(e);
  }

  /// "summary: detail", or just the summary
  [[nodiscard]] auto formatted() const -> std::string;
};

template <typename T>
using ParseResult = std::expected<T, ParseError>;

[[nodiscard]] inline auto need_more_data()
    -> std::unexpected<ParseError> {
  return std::unexpected{
      ParseError{make_error_code(ParseErrc::NeedMoreData), HttpStatus::Ok,
                 {}, {}}};
}

[[nodiscard]] auto parse_failure(ParseErrc e, std::string summary,
                                 std::string detail = {})
    -> std::unexpected<ParseError>;

[[nodiscard]] auto parse_failure(ParseErrc e, HttpStatus status,
                                 std::string summary, std::string detail = {})
    -> std::unexpected<ParseError>;

}  // namespace h1stream::http

template <>
struct std::is_error_code_enum<h1stream::http::ParseErrc> : std::true_type {};
