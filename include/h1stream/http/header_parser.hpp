#pragma once

#include "h1stream/config/parser_settings.hpp"
#include "h1stream/http/http_types.hpp"
#include "h1stream/http/parse_error.hpp"
#include "h1stream/io/byte_view.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace h1stream::http {

/// A parsed header block. Content-Length, Content-Type and
/// Transfer-Encoding are only available through the derived fields; every
/// other header stays in `entries` in arrival order.
struct HeaderSet {
  HttpHeaders entries;
  std::optional<std::uint64_t> content_length;
  std::optional<std::string> content_type;
  std::vector<std::string> transfer_encodings;  // lowercased, in order
  bool host_present{false};
  bool expect_100_continue{false};
  bool close_after_response{false};

  [[nodiscard]] auto has_transfer_encoding() const noexcept -> bool {
    return !transfer_encodings.empty();
  }

  /// Whether the final transfer coding is "chunked"
  [[nodiscard]] auto is_chunked() const noexcept -> bool {
    return !transfer_encodings.empty() &&
           transfer_encodings.back() == "chunked";
  }
};

struct ParsedHeaders {
  HeaderSet headers;
  std::size_t next;  // offset just past the terminating empty line
};

struct ParsedTrailer {
  HttpHeaders entries;
  std::size_t next;
};

class HeaderParser {
public:
  explicit HeaderParser(const ParserSettings& settings) : settings_(settings) {}

  /// Parses header lines from `offset` up to and including the empty line.
  /// `protocol` decides the default connection persistence.
  [[nodiscard]] auto parse(const io::ByteView& input, std::size_t offset,
                           HttpProtocol protocol) const
      -> ParseResult<ParsedHeaders>;

  /// Parses a chunked-body trailer: plain header lines, no derived fields.
  [[nodiscard]] auto parse_trailer(const io::ByteView& input,
                                   std::size_t offset) const
      -> ParseResult<ParsedTrailer>;

private:
  struct Line {
    HttpHeader header;
    std::size_t next;
  };

  // nullopt marks the empty line ending the block
  [[nodiscard]] auto parse_line(const io::ByteView& input,
                                std::size_t offset) const
      -> ParseResult<std::optional<Line>>;

  const ParserSettings& settings_;
};

}  // namespace h1stream::http
