#pragma once

#include "h1stream/config/parser_settings.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace h1stream::http {

/// RFC 7230 section 5.3 request-target forms
enum class TargetForm : std::uint8_t {
  Origin,     // /path?query
  Absolute,   // http://host:port/path?query
  Authority,  // host:port, CONNECT only
  Asterisk    // *, OPTIONS only
};

[[nodiscard]] constexpr auto target_form_name(TargetForm form) noexcept
    -> std::string_view {
  switch (form) {
    case TargetForm::Origin: return "origin";
    case TargetForm::Absolute: return "absolute";
    case TargetForm::Authority: return "authority";
    case TargetForm::Asterisk: return "asterisk";
  }
  return "origin";
}

struct Uri {
  TargetForm form{TargetForm::Origin};
  std::string scheme;  // lowercased, absolute form only
  std::string userinfo;
  std::string host;  // lowercased, brackets kept for IPv6 literals
  std::optional<std::uint16_t> port;
  std::string path;  // still percent-encoded
  std::optional<std::string> query;

  [[nodiscard]] auto authority() const -> std::string;
  [[nodiscard]] auto to_string() const -> std::string;

  friend auto operator==(const Uri&, const Uri&) -> bool = default;
};

struct UriError {
  std::string summary;
  std::string detail;
};

/// Parses a request-target. The input is the exact byte range between the
/// method and the protocol; it is never percent-decoded here.
[[nodiscard]] auto parse_request_target(std::string_view raw,
                                        UriParsingMode mode)
    -> std::expected<Uri, UriError>;

}  // namespace h1stream::http
