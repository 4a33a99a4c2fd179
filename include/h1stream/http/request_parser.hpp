#pragma once

#include "h1stream/config/parser_settings.hpp"
#include "h1stream/http/header_parser.hpp"
#include "h1stream/http/parse_error.hpp"
#include "h1stream/http/request_output.hpp"
#include "h1stream/io/byte_view.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace h1stream::http {

struct ParsedRequestLine {
  HttpMethod method;
  Uri uri;
  io::ByteView raw_target;
  HttpProtocol protocol{HttpProtocol::Http11};
  std::size_t next;  // offset of the first header line
};

/// Parses method, request-target and protocol starting at `offset`. Returns
/// NeedMoreData without side effects when the line is incomplete.
[[nodiscard]] auto parse_request_line(const io::ByteView& input,
                                      std::size_t offset,
                                      const ParserSettings& settings)
    -> ParseResult<ParsedRequestLine>;

/// Chooses the entity framing for a message whose header block ends at
/// `body_start`. Depends only on its arguments.
[[nodiscard]] auto decide_entity_framing(const HttpMethod& method,
                                         HttpProtocol protocol,
                                         const HeaderSet& headers,
                                         const io::ByteView& input,
                                         std::size_t body_start,
                                         const ParserSettings& settings)
    -> ParseResult<EntityFraming>;

enum class ParserState : std::uint8_t {
  AwaitingMessage,
  StreamingFixedBody,
  StreamingChunkedBody,
  Completed,
  Failed
};

[[nodiscard]] constexpr auto parser_state_name(ParserState state) noexcept
    -> std::string_view {
  switch (state) {
    case ParserState::AwaitingMessage: return "awaiting_message";
    case ParserState::StreamingFixedBody: return "streaming_fixed_body";
    case ParserState::StreamingChunkedBody: return "streaming_chunked_body";
    case ParserState::Completed: return "completed";
    case ParserState::Failed: return "failed";
  }
  return "unknown";
}

/// Pull-driven request parser for one connection.
///
/// The driver appends bytes with push() and asks for the next event with
/// pull(). Each call produces exactly one event and parses no further than
/// that event needs. NeedMoreData asks for more bytes; StreamEnd is terminal.
/// Instances must not be shared between threads; the settings may be.
class RequestParser {
public:
  explicit RequestParser(SharedSettings settings);
  ~RequestParser();

  RequestParser(const RequestParser&) = delete;
  auto operator=(const RequestParser&) -> RequestParser& = delete;
  RequestParser(RequestParser&&) noexcept;
  auto operator=(RequestParser&&) noexcept -> RequestParser&;

  /// Appends bytes and returns the next event
  auto push(std::span<const std::uint8_t> bytes) -> RequestOutput;
  auto push(std::string_view bytes) -> RequestOutput;

  /// Next event from the bytes buffered so far
  auto pull() -> RequestOutput;

  /// Upstream completed. Clean between messages, truncation otherwise.
  auto finish() -> RequestOutput;

  /// Injects a failure at the current suspension point, e.g. a timeout
  auto fail(std::string reason) -> RequestOutput;

  [[nodiscard]] auto state() const noexcept -> ParserState;

  /// Bytes received but not consumed yet
  [[nodiscard]] auto buffered() const noexcept -> std::size_t;

  [[nodiscard]] auto settings() const noexcept -> const ParserSettings&;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace h1stream::http
