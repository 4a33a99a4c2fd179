#include "h1stream/http/request_parser.hpp"

#include "h1stream/http/method.hpp"
#include "h1stream/http/websocket.hpp"
#include "h1stream/util/log.hpp"

#include <format>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace h1stream::http {
namespace {

constexpr std::string_view kRawRequestUriHeader = "Raw-Request-URI";
constexpr std::string_view kTransferEncodingHeader = "Transfer-Encoding";

auto is_target_end(std::uint8_t c) noexcept -> bool {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Never looks further than max_uri_length bytes past `start`
auto find_target_end(const io::ByteView& input, std::size_t start,
                     std::size_t max_uri_length) -> ParseResult<std::size_t> {
  const auto limit = start + max_uri_length;
  for (auto ix = start;; ++ix) {
    if (ix >= input.size()) {
      return need_more_data();
    }
    if (is_target_end(input[ix])) {
      return ix;
    }
    if (ix >= limit) {
      return parse_failure(
          ParseErrc::TargetTooLong, "URI length exceeds the configured limit",
          std::format("URI length exceeds the configured limit of {} "
                      "characters",
                      max_uri_length));
    }
  }
}

auto unsupported_version() -> std::unexpected<ParseError> {
  return parse_failure(ParseErrc::UnsupportedProtocolVersion,
                       "The server does not support the HTTP protocol "
                       "version used in the request.");
}

struct ParsedProtocol {
  HttpProtocol protocol;
  std::size_t next;
};

auto parse_protocol(const io::ByteView& input, std::size_t pos)
    -> ParseResult<ParsedProtocol> {
  constexpr std::string_view kPrefix = "HTTP/1.";
  for (std::size_t ix = 0; ix < kPrefix.size(); ++ix) {
    if (pos + ix >= input.size()) {
      return need_more_data();
    }
    if (input[pos + ix] != static_cast<std::uint8_t>(kPrefix[ix])) {
      return unsupported_version();
    }
  }

  auto minor = pos + kPrefix.size();
  if (minor >= input.size()) {
    return need_more_data();
  }
  HttpProtocol protocol{};
  switch (input[minor]) {
    case '1': protocol = HttpProtocol::Http11; break;
    case '0': protocol = HttpProtocol::Http10; break;
    default: return unsupported_version();
  }

  auto term = minor + 1;
  if (term >= input.size()) {
    return need_more_data();
  }
  if (input[term] == '\n') {
    return ParsedProtocol{protocol, term + 1};
  }
  if (input[term] != '\r') {
    return unsupported_version();
  }
  if (term + 1 >= input.size()) {
    return need_more_data();
  }
  if (input[term + 1] != '\n') {
    return parse_failure(ParseErrc::MalformedRequestLine,
                         "Invalid request line",
                         "request line must end with CRLF or LF");
  }
  return ParsedProtocol{protocol, term + 2};
}

auto check_target_form(const HttpMethod& method, const Uri& uri)
    -> ParseResult<void> {
  bool is_connect = method == HttpMethod::connect();
  if (uri.form == TargetForm::Authority && !is_connect) {
    return parse_failure(
        ParseErrc::MalformedRequestTarget, "Illegal request-target",
        std::format("authority-form target is only allowed for CONNECT, not {}",
                    method));
  }
  if (is_connect && uri.form != TargetForm::Authority) {
    return parse_failure(ParseErrc::MalformedRequestTarget,
                         "Illegal request-target",
                         "CONNECT requires an authority-form target");
  }
  if (uri.form == TargetForm::Asterisk && method != HttpMethod::options()) {
    return parse_failure(
        ParseErrc::MalformedRequestTarget, "Illegal request-target",
        std::format("asterisk-form target is only allowed for OPTIONS, not {}",
                    method));
  }
  return {};
}

auto entity_not_allowed(const HttpMethod& method)
    -> std::unexpected<ParseError> {
  return parse_failure(ParseErrc::EntityNotAllowed,
                       std::format("{} requests must not have an entity",
                                   method));
}

auto join_codings(const std::vector<std::string>& codings) -> std::string {
  std::string joined;
  for (const auto& coding : codings) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += coding;
  }
  return joined;
}

// Headers as emitted: upgrade, raw URI, Transfer-Encoding with a final
// "chunked" peeled off, then the remaining entries in arrival order.
auto emitted_headers(const ParsedRequestLine& line, HeaderSet& set,
                     const ParserSettings& settings) -> HttpHeaders {
  HttpHeaders headers;
  headers.reserve(set.entries.size() + 3);

  auto codings = set.transfer_encodings;
  if (set.is_chunked()) {
    codings.pop_back();
  }

  std::optional<HttpHeader> upgrade;
  if (line.method == HttpMethod::get()) {
    upgrade = detect_websocket_upgrade(set.entries, set.host_present,
                                       settings.websocket);
  }

  if (upgrade) {
    headers.push_back(std::move(*upgrade));
  }
  if (settings.raw_request_uri_header) {
    headers.push_back(HttpHeader{std::string(kRawRequestUriHeader),
                                 line.raw_target.to_string()});
  }
  if (!codings.empty()) {
    headers.push_back(HttpHeader{std::string(kTransferEncodingHeader),
                                 join_codings(codings)});
  }
  for (auto& entry : set.entries) {
    headers.push_back(std::move(entry));
  }
  return headers;
}

auto to_failure(ParseError error, bool during_entity) -> MessageFailure {
  return MessageFailure{error.code, error.status, std::move(error.summary),
                        std::move(error.detail), during_entity};
}

}  // namespace

auto parse_request_line(const io::ByteView& input, std::size_t offset,
                        const ParserSettings& settings)
    -> ParseResult<ParsedRequestLine> {
  auto method = parse_method(input, offset, settings);
  if (!method) {
    return std::unexpected{std::move(method.error())};
  }

  auto target_start = method->next;
  auto target_end =
      find_target_end(input, target_start, settings.max_uri_length);
  if (!target_end) {
    return std::unexpected{std::move(target_end.error())};
  }
  if (input[*target_end] != ' ') {
    return parse_failure(ParseErrc::MalformedRequestLine,
                         "Invalid request line",
                         "request-target must be followed by a single space "
                         "and the HTTP protocol");
  }

  auto raw_target = input.slice(target_start, *target_end);
  auto uri = parse_request_target(raw_target.as_string_view(),
                                  settings.uri_parsing_mode);
  if (!uri) {
    return parse_failure(ParseErrc::MalformedRequestTarget,
                         std::move(uri.error().summary),
                         std::move(uri.error().detail));
  }
  if (auto form = check_target_form(method->method, *uri); !form) {
    return std::unexpected{std::move(form.error())};
  }

  auto protocol = parse_protocol(input, *target_end + 1);
  if (!protocol) {
    return std::unexpected{std::move(protocol.error())};
  }

  return ParsedRequestLine{std::move(method->method), std::move(*uri),
                           std::move(raw_target), protocol->protocol,
                           protocol->next};
}

auto decide_entity_framing(const HttpMethod& method, HttpProtocol protocol,
                           const HeaderSet& headers, const io::ByteView& input,
                           std::size_t body_start,
                           const ParserSettings& settings)
    -> ParseResult<EntityFraming> {
  if (!headers.host_present && protocol != HttpProtocol::Http10) {
    return parse_failure(ParseErrc::MissingHostHeader,
                         "Request is missing required `Host` header");
  }

  if (headers.has_transfer_encoding()) {
    if (!method.is_entity_accepted()) {
      return entity_not_allowed(method);
    }
    if (headers.is_chunked()) {
      if (headers.content_length) {
        return parse_failure(
            ParseErrc::ConflictingFraming,
            "A chunked request must not contain a Content-Length header.");
      }
      return DeferredChunked{};
    }
    // A final coding other than chunked does not delimit the message:
    // fall through to the length rules.
  }

  auto length = headers.content_length.value_or(0);
  if (length == 0) {
    return EmptyEntity{};
  }
  if (!method.is_entity_accepted()) {
    return entity_not_allowed(method);
  }
  if (length > settings.max_content_length) {
    return parse_failure(
        ParseErrc::EntityTooLarge, "Request Content-Length too large",
        std::format("Request Content-Length of {} bytes exceeds the "
                    "configured limit of {} bytes",
                    length, settings.max_content_length));
  }

  auto available = static_cast<std::uint64_t>(input.size() - body_start);
  if (length <= available) {
    return StrictEntity{
        input.slice(body_start, body_start + static_cast<std::size_t>(length))};
  }
  return DeferredFixedLength{length};
}

// ============================================================================
// RequestParser
// ============================================================================

struct RequestParser::Impl {
  SharedSettings settings;
  HeaderParser header_parser;
  io::ByteView pending;
  ParserState state{ParserState::AwaitingMessage};
  std::uint64_t remaining{0};
  std::optional<ChunkedBody> chunked;
  bool upstream_finished{false};
  std::uint64_t messages{0};

  explicit Impl(SharedSettings s)
      : settings(std::move(s)), header_parser(*settings) {}

  auto transition(ParserState next) -> void {
    log::trace("Request parser: {} -> {}", parser_state_name(state),
               parser_state_name(next));
    state = next;
  }

  auto streaming() const noexcept -> bool {
    return state == ParserState::StreamingFixedBody ||
           state == ParserState::StreamingChunkedBody;
  }

  auto on_error(ParseError error) -> RequestOutput {
    bool during_entity = streaming();
    if (error.need_more_data()) {
      if (!upstream_finished) {
        return NeedMoreData{};
      }
      error = parse_failure(
                  ParseErrc::TruncatedStream,
                  during_entity ? "Entity stream truncated"
                                : "Illegal request, request stream truncated",
                  std::format("{} unconsumed bytes at end of stream",
                              pending.size()))
                  .error();
    }

    log::debug("Rejecting request #{} with {}: {}",
               during_entity ? messages : messages + 1, error.status,
               error.formatted());
    pending = {};
    chunked.reset();
    transition(ParserState::Failed);
    return to_failure(std::move(error), during_entity);
  }

  auto parse_message_start() -> RequestOutput {
    if (pending.empty()) {
      if (upstream_finished) {
        transition(ParserState::Completed);
        return StreamEnd{};
      }
      return NeedMoreData{};
    }

    auto line = parse_request_line(pending, 0, *settings);
    if (!line) {
      return on_error(std::move(line.error()));
    }
    auto parsed = header_parser.parse(pending, line->next, line->protocol);
    if (!parsed) {
      return on_error(std::move(parsed.error()));
    }
    auto& set = parsed->headers;
    auto body_start = parsed->next;

    auto framing = decide_entity_framing(line->method, line->protocol, set,
                                         pending, body_start, *settings);
    if (!framing) {
      return on_error(std::move(framing.error()));
    }

    ++messages;
    log::debug("Request #{}: {} {} {} ({} entity)", messages, line->method,
               line->raw_target.as_string_view(), line->protocol,
               framing_name(*framing));

    auto consumed = body_start;
    std::visit(
        [&](const auto& f) {
          using F = std::decay_t<decltype(f)>;
          if constexpr (std::is_same_v<F, StrictEntity>) {
            consumed += f.data.size();
          } else if constexpr (std::is_same_v<F, DeferredFixedLength>) {
            remaining = f.length;
            transition(ParserState::StreamingFixedBody);
          } else if constexpr (std::is_same_v<F, DeferredChunked>) {
            chunked.emplace(*settings);
            transition(ParserState::StreamingChunkedBody);
          }
        },
        *framing);

    RequestStart start{
        line->method,
        std::move(line->uri),
        line->raw_target.to_string(),
        line->protocol,
        emitted_headers(*line, set, *settings),
        RequestEntity{std::move(*framing), std::move(set.content_type)},
        set.expect_100_continue,
        set.close_after_response,
    };
    pending = pending.drop(consumed);
    return start;
  }

  auto stream_fixed_body() -> RequestOutput {
    auto step = stream_fixed_length(pending, 0, remaining);
    if (!step) {
      return on_error(std::move(step.error()));
    }
    pending = pending.drop(step->next);
    if (auto* chunk = std::get_if<EntityChunk>(&step->event)) {
      remaining -= chunk->data.size();
      return std::move(*chunk);
    }
    transition(ParserState::AwaitingMessage);
    return std::get<EntityEnd>(std::move(step->event));
  }

  auto stream_chunked_body() -> RequestOutput {
    auto step = chunked->stream(pending, 0);
    if (!step) {
      return on_error(std::move(step.error()));
    }
    pending = pending.drop(step->next);
    if (auto* chunk = std::get_if<EntityChunk>(&step->event)) {
      return std::move(*chunk);
    }
    log::trace("Chunked entity complete after {} bytes",
               chunked->total_bytes());
    chunked.reset();
    transition(ParserState::AwaitingMessage);
    return std::get<EntityEnd>(std::move(step->event));
  }

  auto pull() -> RequestOutput {
    switch (state) {
      case ParserState::AwaitingMessage:
        return parse_message_start();
      case ParserState::StreamingFixedBody:
        return stream_fixed_body();
      case ParserState::StreamingChunkedBody:
        return stream_chunked_body();
      case ParserState::Completed:
      case ParserState::Failed:
        break;
    }
    return StreamEnd{};
  }
};

RequestParser::RequestParser(SharedSettings settings)
    : impl_(std::make_unique<Impl>(std::move(settings))) {}

RequestParser::~RequestParser() = default;

RequestParser::RequestParser(RequestParser&&) noexcept = default;

auto RequestParser::operator=(RequestParser&&) noexcept
    -> RequestParser& = default;

auto RequestParser::push(std::span<const std::uint8_t> bytes)
    -> RequestOutput {
  if (impl_->state == ParserState::Completed ||
      impl_->state == ParserState::Failed) {
    return StreamEnd{};
  }
  if (impl_->upstream_finished) {
    log::warn("Ignoring {} bytes pushed after end of stream", bytes.size());
  } else {
    impl_->pending = impl_->pending.append(bytes);
  }
  return impl_->pull();
}

auto RequestParser::push(std::string_view bytes) -> RequestOutput {
  return push(io::as_bytes(bytes));
}

auto RequestParser::pull() -> RequestOutput {
  return impl_->pull();
}

auto RequestParser::finish() -> RequestOutput {
  impl_->upstream_finished = true;
  return impl_->pull();
}

auto RequestParser::fail(std::string reason) -> RequestOutput {
  if (impl_->state == ParserState::Completed ||
      impl_->state == ParserState::Failed) {
    return StreamEnd{};
  }
  return impl_->on_error(
      parse_failure(ParseErrc::Aborted, "Request stream aborted",
                    std::move(reason))
          .error());
}

auto RequestParser::state() const noexcept -> ParserState {
  return impl_->state;
}

auto RequestParser::buffered() const noexcept -> std::size_t {
  return impl_->pending.size();
}

auto RequestParser::settings() const noexcept -> const ParserSettings& {
  return *impl_->settings;
}

}  // namespace h1stream::http
