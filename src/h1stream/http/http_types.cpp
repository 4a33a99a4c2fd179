#include "h1stream/http/http_types.hpp"

#include <algorithm>
#include <cctype>

namespace h1stream::http {

auto HttpMethod::get() -> HttpMethod {
  return {"GET", EntityAcceptance::Tolerated};
}

auto HttpMethod::post() -> HttpMethod {
  return {"POST", EntityAcceptance::Expected};
}

auto HttpMethod::put() -> HttpMethod {
  return {"PUT", EntityAcceptance::Expected};
}

auto HttpMethod::patch() -> HttpMethod {
  return {"PATCH", EntityAcceptance::Expected};
}

auto HttpMethod::delete_() -> HttpMethod {
  return {"DELETE", EntityAcceptance::Tolerated};
}

auto HttpMethod::head() -> HttpMethod {
  return {"HEAD", EntityAcceptance::Disallowed};
}

auto HttpMethod::options() -> HttpMethod {
  return {"OPTIONS", EntityAcceptance::Expected};
}

auto HttpMethod::trace() -> HttpMethod {
  return {"TRACE", EntityAcceptance::Disallowed};
}

auto HttpMethod::connect() -> HttpMethod {
  return {"CONNECT", EntityAcceptance::Disallowed};
}

auto parse_entity_acceptance(std::string_view name)
    -> std::optional<EntityAcceptance> {
  if (iequals(name, "expected"))
    return EntityAcceptance::Expected;
  if (iequals(name, "tolerated"))
    return EntityAcceptance::Tolerated;
  if (iequals(name, "disallowed"))
    return EntityAcceptance::Disallowed;
  return std::nullopt;
}

auto status_reason_phrase(HttpStatus status) -> std::string_view {
  switch (status) {
    case HttpStatus::Ok:
      return "OK";
    case HttpStatus::BadRequest:
      return "Bad Request";
    case HttpStatus::PayloadTooLarge:
      return "Payload Too Large";
    case HttpStatus::UriTooLong:
      return "URI Too Long";
    case HttpStatus::ExpectationFailed:
      return "Expectation Failed";
    case HttpStatus::UnprocessableEntity:
      return "Unprocessable Entity";
    case HttpStatus::RequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case HttpStatus::NotImplemented:
      return "Not Implemented";
    case HttpStatus::HttpVersionNotSupported:
      return "HTTP Version Not Supported";
  }
  return "Unknown";
}

auto HttpHeader::is(std::string_view other) const -> bool {
  return iequals(name, other);
}

auto find_header(const HttpHeaders& headers, std::string_view name)
    -> std::optional<std::string_view> {
  auto it = std::ranges::find_if(
      headers, [name](const HttpHeader& h) { return h.is(name); });
  if (it != headers.end()) {
    return it->value;
  }
  return std::nullopt;
}

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
  if (a.size() != b.size())
    return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto has_token(std::string_view list, std::string_view token) -> bool {
  std::size_t start = 0;
  while (start <= list.size()) {
    auto end = list.find(',', start);
    if (end == std::string_view::npos)
      end = list.size();
    auto part = list.substr(start, end - start);
    while (!part.empty() && (part.front() == ' ' || part.front() == '\t'))
      part.remove_prefix(1);
    while (!part.empty() && (part.back() == ' ' || part.back() == '\t'))
      part.remove_suffix(1);
    if (iequals(part, token))
      return true;
    start = end + 1;
  }
  return false;
}

}  // namespace h1stream::http
