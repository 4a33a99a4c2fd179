#pragma once

#include "h1stream/config/parser_settings.hpp"
#include "h1stream/http/header_parser.hpp"
#include "h1stream/http/parse_error.hpp"
#include "h1stream/io/byte_view.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace h1stream::http {

/// A piece of entity data. For chunked entities `extension` carries the
/// chunk extension (without the leading ';') of the chunk it belongs to.
struct EntityChunk {
  io::ByteView data;
  std::string extension;
};

/// End of an entity; chunked entities may carry trailer headers
struct EntityEnd {
  HttpHeaders trailer;
};

using BodyEvent = std::variant<EntityChunk, EntityEnd>;

struct BodyStep {
  BodyEvent event;
  std::size_t next;
};

/// Emits whatever is available of the `remaining` bytes as one chunk, or
/// EntityEnd once nothing remains. The caller tracks `remaining`.
[[nodiscard]] auto stream_fixed_length(const io::ByteView& input,
                                       std::size_t offset,
                                       std::uint64_t remaining)
    -> ParseResult<BodyStep>;

/// Incremental decoder for the chunked transfer coding. Every call either
/// produces one event and commits its progress, or returns NeedMoreData and
/// leaves the decoder untouched so the caller can retry from the same offset.
class ChunkedBody {
public:
  explicit ChunkedBody(const ParserSettings& settings)
      : settings_(settings), trailer_parser_(settings) {}

  [[nodiscard]] auto stream(const io::ByteView& input, std::size_t offset)
      -> ParseResult<BodyStep>;

  [[nodiscard]] auto total_bytes() const noexcept -> std::uint64_t {
    return total_bytes_;
  }

  [[nodiscard]] auto done() const noexcept -> bool {
    return phase_ == Phase::Done;
  }

private:
  enum class Phase : std::uint8_t {
    ChunkStart,  // expecting a chunk-size line
    Data,        // inside chunk data
    ChunkEnd,    // expecting CRLF after chunk data, then the next size line
    Done
  };

  struct ChunkHeader {
    std::uint64_t size;
    std::string extension;
    std::size_t next;
  };

  [[nodiscard]] auto parse_chunk_header(const io::ByteView& input,
                                        std::size_t offset) const
      -> ParseResult<ChunkHeader>;

  const ParserSettings& settings_;
  HeaderParser trailer_parser_;
  Phase phase_{Phase::ChunkStart};
  std::uint64_t remaining_{0};
  std::uint64_t total_bytes_{0};
  std::string extension_;
};

}  // namespace h1stream::http
