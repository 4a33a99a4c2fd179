#pragma once

#include "h1stream/http/body_parser.hpp"
#include "h1stream/http/http_types.hpp"
#include "h1stream/http/uri.hpp"
#include "h1stream/io/byte_view.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <variant>

namespace h1stream::http {

// ============================================================================
// Entity framing
// ============================================================================

struct EmptyEntity {
  friend auto operator==(const EmptyEntity&, const EmptyEntity&)
      -> bool = default;
};

/// Entity bytes were fully buffered and are inlined with the request start
struct StrictEntity {
  io::ByteView data;
};

/// Length is known, bytes follow as EntityPart events and one EntityEnd
struct DeferredFixedLength {
  std::uint64_t length;

  friend auto operator==(const DeferredFixedLength&, const DeferredFixedLength&)
      -> bool = default;
};

/// Chunks follow as EntityPart events, ended by EntityEnd with the trailer
struct DeferredChunked {
  friend auto operator==(const DeferredChunked&, const DeferredChunked&)
      -> bool = default;
};

using EntityFraming =
    std::variant<EmptyEntity, StrictEntity, DeferredFixedLength,
                 DeferredChunked>;

[[nodiscard]] auto framing_name(const EntityFraming& framing)
    -> std::string_view;

struct RequestEntity {
  EntityFraming framing;
  std::optional<std::string> content_type;
};

// ============================================================================
// Events
// ============================================================================

struct RequestStart {
  HttpMethod method;
  Uri uri;
  std::string raw_target;
  HttpProtocol protocol{HttpProtocol::Http11};
  HttpHeaders headers;
  RequestEntity entity;
  bool expect_100_continue{false};
  bool close_after_response{false};
};

using EntityPart = EntityChunk;

/// Push more bytes, then pull again
struct NeedMoreData {};

/// Terminal: no further events will be produced
struct StreamEnd {};

/// Terminal for the message and the connection. `during_entity` tells a
/// broken entity stream apart from a rejected message start.
struct MessageFailure {
  std::error_code code;
  HttpStatus status{HttpStatus::BadRequest};
  std::string summary;
  std::string detail;
  bool during_entity{false};
};

using RequestOutput = std::variant<RequestStart, EntityPart, EntityEnd,
                                   NeedMoreData, StreamEnd, MessageFailure>;

[[nodiscard]] auto output_name(const RequestOutput& output) -> std::string_view;

}  // namespace h1stream::http
