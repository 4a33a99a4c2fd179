#pragma once

#include "h1stream/config/parser_settings.hpp"
#include "h1stream/http/http_types.hpp"
#include "h1stream/http/parse_error.hpp"
#include "h1stream/io/byte_view.hpp"

#include <cstddef>
#include <span>
#include <string_view>

namespace h1stream::http {

/// GET, POST, PUT, PATCH, DELETE, HEAD, OPTIONS, TRACE, CONNECT
[[nodiscard]] auto well_known_methods() -> std::span<const HttpMethod>;

[[nodiscard]] auto find_well_known_method(std::string_view name)
    -> const HttpMethod*;

struct ParsedMethod {
  HttpMethod method;
  std::size_t next;  // offset just past the separating space
};

/// Recognizes the method token at `cursor`. Well-known methods are matched
/// byte by byte; anything else is scanned as a token of at most
/// `settings.max_method_length` bytes and looked up among the custom methods.
[[nodiscard]] auto parse_method(const io::ByteView& input, std::size_t cursor,
                                const ParserSettings& settings)
    -> ParseResult<ParsedMethod>;

}  // namespace h1stream::http
