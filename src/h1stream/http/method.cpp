#include "h1stream/http/method.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace h1stream::http {
namespace {

constexpr std::uint8_t kTlsHandshakeRecord = 0x16;

const std::array<HttpMethod, 9>& methods() {
  static const std::array<HttpMethod, 9> kMethods{
      HttpMethod::get(),     HttpMethod::post(),   HttpMethod::put(),
      HttpMethod::patch(),   HttpMethod::delete_(), HttpMethod::head(),
      HttpMethod::options(), HttpMethod::trace(),  HttpMethod::connect(),
  };
  return kMethods;
}

enum Known : std::size_t {
  kGet,
  kPost,
  kPut,
  kPatch,
  kDelete,
  kHead,
  kOptions,
  kTrace,
  kConnect
};

auto parse_custom_method(const io::ByteView& input, std::size_t cursor,
                         const ParserSettings& settings)
    -> ParseResult<ParsedMethod> {
  const auto limit = settings.max_method_length;
  for (std::size_t ix = 0; ix <= limit; ++ix) {
    if (cursor + ix >= input.size()) {
      return need_more_data();
    }
    auto c = input[cursor + ix];
    if (c == ' ') {
      if (ix == 0) {
        return parse_failure(ParseErrc::MalformedRequestLine,
                             "Invalid request line", "empty HTTP method");
      }
      auto token = input.slice(cursor, cursor + ix).as_string_view();
      if (const auto* method = settings.find_custom_method(token)) {
        return ParsedMethod{*method, cursor + ix + 1};
      }
      return parse_failure(ParseErrc::UnsupportedMethod,
                           "Unsupported HTTP method", std::string(token));
    }
    if (ix == limit) {
      break;
    }
    if (!is_token_char(c)) {
      return parse_failure(
          ParseErrc::MalformedRequestLine, "Invalid request line",
          std::format("illegal character 0x{:02x} in HTTP method", c));
    }
  }
  return parse_failure(
      ParseErrc::MethodTooLong, "Unsupported HTTP method",
      std::format("HTTP method too long (started with '{}'). Increase "
                  "`parsing.max_method_length` to support HTTP methods with "
                  "more characters.",
                  input.slice(cursor, cursor + limit).as_string_view()));
}

// `from` is the number of leading bytes already known to match
auto match_method(const io::ByteView& input, std::size_t cursor,
                  const HttpMethod& method, std::size_t from,
                  const ParserSettings& settings)
    -> ParseResult<ParsedMethod> {
  auto name = method.name();
  for (std::size_t ix = from; ix < name.size(); ++ix) {
    if (cursor + ix >= input.size()) {
      return need_more_data();
    }
    if (input[cursor + ix] != static_cast<std::uint8_t>(name[ix])) {
      return parse_custom_method(input, cursor, settings);
    }
  }
  auto end = cursor + name.size();
  if (end >= input.size()) {
    return need_more_data();
  }
  if (input[end] == ' ') {
    return ParsedMethod{method, end + 1};
  }
  return parse_custom_method(input, cursor, settings);
}

}  // namespace

auto well_known_methods() -> std::span<const HttpMethod> {
  return methods();
}

auto find_well_known_method(std::string_view name) -> const HttpMethod* {
  auto it = std::ranges::find_if(
      methods(), [name](const HttpMethod& m) { return m.name() == name; });
  return it == methods().end() ? nullptr : &*it;
}

auto parse_method(const io::ByteView& input, std::size_t cursor,
                  const ParserSettings& settings)
    -> ParseResult<ParsedMethod> {
  if (cursor >= input.size()) {
    return need_more_data();
  }

  const auto& known = methods();
  switch (input[cursor]) {
    case 'G':
      return match_method(input, cursor, known[kGet], 1, settings);
    case 'P':
      if (cursor + 1 >= input.size()) {
        return need_more_data();
      }
      switch (input[cursor + 1]) {
        case 'O':
          return match_method(input, cursor, known[kPost], 2, settings);
        case 'U':
          return match_method(input, cursor, known[kPut], 2, settings);
        case 'A':
          return match_method(input, cursor, known[kPatch], 2, settings);
        default:
          return parse_custom_method(input, cursor, settings);
      }
    case 'D':
      return match_method(input, cursor, known[kDelete], 1, settings);
    case 'H':
      return match_method(input, cursor, known[kHead], 1, settings);
    case 'O':
      return match_method(input, cursor, known[kOptions], 1, settings);
    case 'T':
      return match_method(input, cursor, known[kTrace], 1, settings);
    case 'C':
      return match_method(input, cursor, known[kConnect], 1, settings);
    case kTlsHandshakeRecord:
      return parse_failure(
          ParseErrc::WrongProtocol, "Unsupported HTTP method",
          "The HTTP method started with 0x16 rather than any known HTTP "
          "method. Perhaps this was an HTTPS request sent to an HTTP "
          "endpoint?");
    default:
      return parse_custom_method(input, cursor, settings);
  }
}

}  // namespace h1stream::http
