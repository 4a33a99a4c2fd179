#include "h1stream/http/header_parser.hpp"

#include "h1stream/util/log.hpp"

#include <charconv>
#include <format>

namespace h1stream::http {
namespace {

auto trim_ows(std::string_view s) -> std::string_view {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    s.remove_suffix(1);
  return s;
}

auto parse_content_length(std::string_view value)
    -> std::optional<std::uint64_t> {
  if (value.empty()) {
    return std::nullopt;
  }
  std::uint64_t length = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), length);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return length;
}

// Splits a Transfer-Encoding value into lowercased codings
auto append_codings(std::string_view value, std::vector<std::string>& out)
    -> bool {
  bool any = false;
  std::size_t start = 0;
  while (start <= value.size()) {
    auto end = value.find(',', start);
    if (end == std::string_view::npos)
      end = value.size();
    auto coding = trim_ows(value.substr(start, end - start));
    if (!coding.empty()) {
      // transfer-parameters (";q=...") are not part of the coding name
      if (auto semi = coding.find(';'); semi != std::string_view::npos) {
        coding = trim_ows(coding.substr(0, semi));
      }
      out.push_back(to_lower(coding));
      any = true;
    }
    start = end + 1;
  }
  return any;
}

auto too_large(std::string detail) -> std::unexpected<ParseError> {
  return parse_failure(ParseErrc::HeaderFieldsTooLarge,
                       "HTTP header fields too large", std::move(detail));
}

auto malformed(std::string detail) -> std::unexpected<ParseError> {
  return parse_failure(ParseErrc::MalformedHeaders, "Illegal HTTP header",
                       std::move(detail));
}

}  // namespace

auto HeaderParser::parse_line(const io::ByteView& input,
                              std::size_t offset) const
    -> ParseResult<std::optional<Line>> {
  auto pos = offset;
  if (pos >= input.size()) {
    return need_more_data();
  }

  auto first = input[pos];
  if (first == '\n') {
    return std::optional<Line>{};
  }
  if (first == '\r') {
    if (pos + 1 >= input.size()) {
      return need_more_data();
    }
    if (input[pos + 1] == '\n') {
      return std::optional<Line>{};
    }
    return malformed("bare CR in header section");
  }
  if (first == ' ' || first == '\t') {
    return malformed("obsolete line folding is not supported");
  }

  const auto name_start = pos;
  while (true) {
    if (pos >= input.size()) {
      return need_more_data();
    }
    auto c = input[pos];
    if (c == ':') {
      break;
    }
    if (!is_token_char(c)) {
      return malformed(std::format("invalid character 0x{:02x} in header name",
                                   c));
    }
    if (pos - name_start >= settings_.max_header_name_length) {
      return too_large(std::format(
          "HTTP header name exceeds the configured limit of {} characters",
          settings_.max_header_name_length));
    }
    ++pos;
  }
  if (pos == name_start) {
    return malformed("empty header name");
  }
  auto name = input.slice(name_start, pos).as_string_view();
  ++pos;
  while (pos < input.size() && (input[pos] == ' ' || input[pos] == '\t')) {
    ++pos;
  }

  const auto value_start = pos;
  std::size_t value_end = 0;
  std::size_t next = 0;
  while (true) {
    if (pos >= input.size()) {
      return need_more_data();
    }
    auto c = input[pos];
    if (c == '\n') {
      value_end = pos;
      next = pos + 1;
      break;
    }
    if (c == '\r') {
      if (pos + 1 >= input.size()) {
        return need_more_data();
      }
      if (input[pos + 1] != '\n') {
        return malformed(std::format("bare CR in value of header '{}'", name));
      }
      value_end = pos;
      next = pos + 2;
      break;
    }
    if ((c < 0x20 && c != '\t') || c == 0x7f) {
      return malformed(std::format(
          "invalid character 0x{:02x} in value of header '{}'", c, name));
    }
    if (pos - value_start >= settings_.max_header_value_length) {
      return too_large(std::format(
          "HTTP header value exceeds the configured limit of {} characters",
          settings_.max_header_value_length));
    }
    ++pos;
  }

  auto value = trim_ows(input.slice(value_start, value_end).as_string_view());
  return std::optional<Line>{
      Line{HttpHeader{std::string(name), std::string(value)}, next}};
}

auto HeaderParser::parse(const io::ByteView& input, std::size_t offset,
                         HttpProtocol protocol) const
    -> ParseResult<ParsedHeaders> {
  HeaderSet set;
  bool keep_alive = false;
  bool close = false;
  std::size_t count = 0;
  auto pos = offset;

  while (true) {
    auto line = parse_line(input, pos);
    if (!line) {
      return std::unexpected{std::move(line.error())};
    }
    if (!line->has_value()) {
      pos += input[pos] == '\r' ? 2 : 1;
      break;
    }

    auto& [header, next] = **line;
    pos = next;
    if (++count > settings_.max_header_count) {
      return too_large(std::format(
          "HTTP message contains more than the configured limit of {} headers",
          settings_.max_header_count));
    }

    if (header.is("content-length")) {
      auto length = parse_content_length(header.value);
      if (!length) {
        return malformed(std::format("Illegal 'Content-Length' header value '{}'",
                                     header.value));
      }
      if (set.content_length && *set.content_length != *length) {
        return malformed(
            "HTTP message must not contain more than one Content-Length header");
      }
      set.content_length = *length;
      continue;
    }
    if (header.is("content-type")) {
      if (set.content_type) {
        return malformed(
            "HTTP message must not contain more than one Content-Type header");
      }
      set.content_type = std::move(header.value);
      continue;
    }
    if (header.is("transfer-encoding")) {
      if (!append_codings(header.value, set.transfer_encodings)) {
        return malformed("Illegal 'Transfer-Encoding' header value");
      }
      continue;
    }
    if (header.is("host")) {
      if (set.host_present) {
        return malformed(
            "HTTP message must not contain more than one Host header");
      }
      set.host_present = true;
    } else if (header.is("expect")) {
      if (!iequals(header.value, "100-continue")) {
        return parse_failure(ParseErrc::ExpectationFailed,
                             "Unsupported expectation",
                             std::format("Expect: {}", header.value));
      }
      set.expect_100_continue = true;
    } else if (header.is("connection")) {
      close = close || has_token(header.value, "close");
      keep_alive = keep_alive || has_token(header.value, "keep-alive");
    }
    set.entries.push_back(std::move(header));
  }

  set.close_after_response =
      close || (protocol == HttpProtocol::Http10 && !keep_alive);
  log::trace("Parsed {} header lines, next offset {}", count, pos);
  return ParsedHeaders{std::move(set), pos};
}

auto HeaderParser::parse_trailer(const io::ByteView& input,
                                 std::size_t offset) const
    -> ParseResult<ParsedTrailer> {
  ParsedTrailer trailer{{}, offset};
  auto pos = offset;
  while (true) {
    auto line = parse_line(input, pos);
    if (!line) {
      return std::unexpected{std::move(line.error())};
    }
    if (!line->has_value()) {
      trailer.next = pos + (input[pos] == '\r' ? 2 : 1);
      return trailer;
    }
    pos = (*line)->next;
    trailer.entries.push_back(std::move((*line)->header));
    if (trailer.entries.size() > settings_.max_header_count) {
      return too_large(std::format(
          "Chunked trailer contains more than the configured limit of {} "
          "headers",
          settings_.max_header_count));
    }
  }
}

}  // namespace h1stream::http
