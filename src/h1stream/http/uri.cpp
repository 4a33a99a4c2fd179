#include "h1stream/http/uri.hpp"

#include "h1stream/http/http_types.hpp"

#include <charconv>
#include <format>

namespace h1stream::http {
namespace {

constexpr auto is_alpha(char c) noexcept -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr auto is_digit(char c) noexcept -> bool {
  return c >= '0' && c <= '9';
}

constexpr auto is_hex(char c) noexcept -> bool {
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

constexpr auto is_unreserved(char c) noexcept -> bool {
  return is_alpha(c) || is_digit(c) || c == '-' || c == '.' || c == '_' ||
         c == '~';
}

constexpr auto is_sub_delim(char c) noexcept -> bool {
  switch (c) {
    case '!': case '$': case '&': case '\'': case '(': case ')': case '*':
    case '+': case ',': case ';': case '=':
      return true;
    default:
      return false;
  }
}

constexpr auto is_pchar(char c) noexcept -> bool {
  return is_unreserved(c) || is_sub_delim(c) || c == ':' || c == '@';
}

// Visible ASCII and obs-text, minus the characters that delimit components
constexpr auto is_relaxed_char(char c) noexcept -> bool {
  auto u = static_cast<unsigned char>(c);
  return (u > 0x20 && u != 0x7f && c != '#');
}

auto invalid_char(std::string_view raw, std::size_t ix, std::string_view what)
    -> std::unexpected<UriError> {
  auto c = static_cast<unsigned char>(raw[ix]);
  std::string shown = (c > 0x20 && c < 0x7f)
                          ? std::format("'{}'", static_cast<char>(c))
                          : std::format("0x{:02x}", c);
  return std::unexpected{
      UriError{"Illegal request-target",
               std::format("Invalid input {} in {} at position {}", shown,
                           what, ix + 1)}};
}

auto uri_error(std::string detail) -> std::unexpected<UriError> {
  return std::unexpected{UriError{"Illegal request-target", std::move(detail)}};
}

// Validates path or query characters in [begin, end) of `raw`.
auto check_component(std::string_view raw, std::size_t begin, std::size_t end,
                     bool is_query, UriParsingMode mode,
                     std::string_view what) -> std::expected<void, UriError> {
  for (auto ix = begin; ix < end; ++ix) {
    char c = raw[ix];
    if (c == '%') {
      if (ix + 2 >= end) {
        return uri_error(std::format(
            "Incomplete percent-encoding in {} at position {}", what, ix + 1));
      }
      if (!is_hex(raw[ix + 1]) || !is_hex(raw[ix + 2])) {
        return uri_error(std::format(
            "Invalid percent-encoding in {} at position {}", what, ix + 1));
      }
      ix += 2;
      continue;
    }
    if (c == '#') {
      return uri_error(std::format(
          "Fragment not allowed in request-target (position {})", ix + 1));
    }
    bool allowed = is_pchar(c) || c == '/' || (is_query && c == '?');
    if (!allowed && mode == UriParsingMode::Relaxed) {
      allowed = is_relaxed_char(c);
    }
    if (!allowed) {
      return invalid_char(raw, ix, what);
    }
  }
  return {};
}

auto parse_port(std::string_view digits) -> std::optional<std::uint16_t> {
  std::uint16_t port = 0;
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), port);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return port;
}

// authority = [ userinfo "@" ] host [ ":" port ], `offset` locates it in raw
auto parse_authority(std::string_view raw, std::size_t offset,
                     std::string_view authority, bool port_required, Uri& uri)
    -> std::expected<void, UriError> {
  auto host_start = std::size_t{0};
  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    for (std::size_t ix = 0; ix < at; ++ix) {
      char c = authority[ix];
      if (c == '%') {
        if (ix + 2 >= at || !is_hex(authority[ix + 1]) ||
            !is_hex(authority[ix + 2])) {
          return uri_error(std::format(
              "Invalid percent-encoding in userinfo at position {}",
              offset + ix + 1));
        }
        ix += 2;
        continue;
      }
      if (!is_unreserved(c) && !is_sub_delim(c) && c != ':') {
        return invalid_char(raw, offset + ix, "userinfo");
      }
    }
    uri.userinfo = std::string(authority.substr(0, at));
    host_start = at + 1;
  }

  auto rest = authority.substr(host_start);
  std::size_t host_len = 0;
  if (!rest.empty() && rest.front() == '[') {
    auto close = rest.find(']');
    if (close == std::string_view::npos) {
      return uri_error("Unterminated IPv6 literal in host");
    }
    for (std::size_t ix = 1; ix < close; ++ix) {
      char c = rest[ix];
      if (!is_hex(c) && c != ':' && c != '.') {
        return invalid_char(raw, offset + host_start + ix, "IPv6 host");
      }
    }
    host_len = close + 1;
  } else {
    while (host_len < rest.size() && rest[host_len] != ':') {
      char c = rest[host_len];
      if (c == '%') {
        if (host_len + 2 >= rest.size() || !is_hex(rest[host_len + 1]) ||
            !is_hex(rest[host_len + 2])) {
          return uri_error(std::format(
              "Invalid percent-encoding in host at position {}",
              offset + host_start + host_len + 1));
        }
        host_len += 3;
        continue;
      }
      if (!is_unreserved(c) && !is_sub_delim(c)) {
        return invalid_char(raw, offset + host_start + host_len, "host");
      }
      ++host_len;
    }
  }

  if (host_len == 0) {
    return uri_error("Empty host in request-target");
  }
  uri.host = to_lower(rest.substr(0, host_len));

  auto port_part = rest.substr(host_len);
  if (port_part.empty()) {
    if (port_required) {
      return uri_error("Authority-form request-target requires a port");
    }
    return {};
  }
  if (port_part.front() != ':') {
    return invalid_char(raw, offset + host_start + host_len, "host");
  }
  port_part.remove_prefix(1);
  if (port_part.empty()) {
    if (port_required) {
      return uri_error("Authority-form request-target requires a port");
    }
    return {};
  }
  auto port = parse_port(port_part);
  if (!port) {
    return uri_error(std::format("Invalid port '{}'", port_part));
  }
  uri.port = *port;
  return {};
}

// path-abempty [ "?" query ] starting at `begin`
auto parse_path_and_query(std::string_view raw, std::size_t begin,
                          UriParsingMode mode, Uri& uri)
    -> std::expected<void, UriError> {
  auto query_pos = raw.find('?', begin);
  auto path_end = query_pos == std::string_view::npos ? raw.size() : query_pos;

  if (auto checked =
          check_component(raw, begin, path_end, false, mode, "path");
      !checked) {
    return checked;
  }
  uri.path = std::string(raw.substr(begin, path_end - begin));

  if (query_pos != std::string_view::npos) {
    if (auto checked = check_component(raw, query_pos + 1, raw.size(), true,
                                       mode, "query");
        !checked) {
      return checked;
    }
    uri.query = std::string(raw.substr(query_pos + 1));
  }
  return {};
}

auto scheme_length(std::string_view raw) -> std::size_t {
  if (raw.empty() || !is_alpha(raw.front())) {
    return 0;
  }
  std::size_t ix = 1;
  while (ix < raw.size() && (is_alpha(raw[ix]) || is_digit(raw[ix]) ||
                             raw[ix] == '+' || raw[ix] == '-' ||
                             raw[ix] == '.')) {
    ++ix;
  }
  if (raw.substr(ix).starts_with("://")) {
    return ix;
  }
  return 0;
}

}  // namespace

auto Uri::authority() const -> std::string {
  std::string out;
  if (!userinfo.empty()) {
    out += userinfo;
    out += '@';
  }
  out += host;
  if (port) {
    out += std::format(":{}", *port);
  }
  return out;
}

auto Uri::to_string() const -> std::string {
  switch (form) {
    case TargetForm::Asterisk:
      return "*";
    case TargetForm::Authority:
      return authority();
    case TargetForm::Absolute:
    case TargetForm::Origin:
      break;
  }
  std::string out;
  if (form == TargetForm::Absolute) {
    out = std::format("{}://{}", scheme, authority());
  }
  out += path;
  if (query) {
    out += '?';
    out += *query;
  }
  return out;
}

auto parse_request_target(std::string_view raw, UriParsingMode mode)
    -> std::expected<Uri, UriError> {
  if (raw.empty()) {
    return uri_error("Empty request-target");
  }

  Uri uri;
  if (raw == "*") {
    uri.form = TargetForm::Asterisk;
    return uri;
  }

  if (raw.front() == '/') {
    uri.form = TargetForm::Origin;
    if (auto checked = parse_path_and_query(raw, 0, mode, uri); !checked) {
      return std::unexpected{checked.error()};
    }
    return uri;
  }

  if (auto len = scheme_length(raw); len > 0) {
    uri.form = TargetForm::Absolute;
    uri.scheme = to_lower(raw.substr(0, len));
    auto authority_start = len + 3;
    auto authority_end = raw.find_first_of("/?#", authority_start);
    if (authority_end == std::string_view::npos) {
      authority_end = raw.size();
    }
    if (auto checked = parse_authority(
            raw, authority_start,
            raw.substr(authority_start, authority_end - authority_start),
            false, uri);
        !checked) {
      return std::unexpected{checked.error()};
    }
    if (auto checked = parse_path_and_query(raw, authority_end, mode, uri); !checked) {
      return std::unexpected{checked.error()};
    }
    return uri;
  }

  uri.form = TargetForm::Authority;
  if (auto checked = parse_authority(raw, 0, raw, true, uri); !checked) {
    return std::unexpected{checked.error()};
  }
  if (!uri.userinfo.empty()) {
    return uri_error("Authority-form request-target must not carry userinfo");
  }
  return uri;
}

}  // namespace h1stream::http
