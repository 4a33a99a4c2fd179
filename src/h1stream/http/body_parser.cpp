#include "h1stream/http/body_parser.hpp"

#include <algorithm>
#include <format>

namespace h1stream::http {
namespace {

// More hex digits than this cannot be a sane chunk size, even zero-padded
constexpr std::size_t kMaxChunkSizeDigits = 16;

auto hex_value(std::uint8_t c) noexcept -> int {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

auto malformed_chunk(std::string detail) -> std::unexpected<ParseError> {
  return parse_failure(ParseErrc::MalformedChunk, "Illegal chunked encoding",
                       std::move(detail));
}

}  // namespace

auto stream_fixed_length(const io::ByteView& input, std::size_t offset,
                         std::uint64_t remaining) -> ParseResult<BodyStep> {
  if (remaining == 0) {
    return BodyStep{EntityEnd{}, offset};
  }
  if (offset >= input.size()) {
    return need_more_data();
  }
  auto available = static_cast<std::uint64_t>(input.size() - offset);
  auto take = static_cast<std::size_t>(std::min(remaining, available));
  return BodyStep{EntityChunk{input.slice(offset, offset + take), {}},
                  offset + take};
}

auto ChunkedBody::parse_chunk_header(const io::ByteView& input,
                                     std::size_t offset) const
    -> ParseResult<ChunkHeader> {
  auto pos = offset;
  std::uint64_t size = 0;
  std::size_t digits = 0;

  while (true) {
    if (pos >= input.size()) {
      return need_more_data();
    }
    auto v = hex_value(input[pos]);
    if (v < 0) {
      break;
    }
    if (++digits > kMaxChunkSizeDigits) {
      return malformed_chunk("chunk size has too many digits");
    }
    size = size * 16 + static_cast<std::uint64_t>(v);
    if (size > settings_.max_chunk_size) {
      return malformed_chunk(std::format(
          "HTTP chunk size exceeds the configured limit of {} bytes",
          settings_.max_chunk_size));
    }
    ++pos;
  }
  if (digits == 0) {
    return malformed_chunk(std::format(
        "Illegal character 0x{:02x} in chunk start", input[pos]));
  }

  std::string extension;
  if (input[pos] == ';') {
    auto ext_start = ++pos;
    while (true) {
      if (pos >= input.size()) {
        return need_more_data();
      }
      auto c = input[pos];
      if (c == '\r' || c == '\n') {
        break;
      }
      if ((c < 0x20 && c != '\t') || c == 0x7f) {
        return malformed_chunk(std::format(
            "Illegal character 0x{:02x} in chunk extension", c));
      }
      if (pos - ext_start >= settings_.max_chunk_ext_length) {
        return malformed_chunk(std::format(
            "HTTP chunk extension length exceeds the configured limit of {} "
            "characters",
            settings_.max_chunk_ext_length));
      }
      ++pos;
    }
    extension = input.slice(ext_start, pos).to_string();
  }

  if (input[pos] == '\n') {
    return ChunkHeader{size, std::move(extension), pos + 1};
  }
  if (input[pos] == '\r') {
    if (pos + 1 >= input.size()) {
      return need_more_data();
    }
    if (input[pos + 1] == '\n') {
      return ChunkHeader{size, std::move(extension), pos + 2};
    }
  }
  return malformed_chunk(std::format("Illegal character 0x{:02x} in chunk start",
                                     input[pos]));
}

auto ChunkedBody::stream(const io::ByteView& input, std::size_t offset)
    -> ParseResult<BodyStep> {
  auto pos = offset;

  switch (phase_) {
    case Phase::Done:
      return malformed_chunk("chunked entity already complete");

    case Phase::Data: {
      if (pos >= input.size()) {
        return need_more_data();
      }
      auto available = static_cast<std::uint64_t>(input.size() - pos);
      auto take = static_cast<std::size_t>(std::min(remaining_, available));
      remaining_ -= take;
      if (remaining_ == 0) {
        phase_ = Phase::ChunkEnd;
      }
      return BodyStep{EntityChunk{input.slice(pos, pos + take), extension_},
                      pos + take};
    }

    case Phase::ChunkEnd:
      if (pos >= input.size()) {
        return need_more_data();
      }
      if (input[pos] == '\n') {
        pos += 1;
      } else if (input[pos] == '\r') {
        if (pos + 1 >= input.size()) {
          return need_more_data();
        }
        if (input[pos + 1] != '\n') {
          return malformed_chunk("missing CRLF after chunk data");
        }
        pos += 2;
      } else {
        return malformed_chunk("missing CRLF after chunk data");
      }
      break;

    case Phase::ChunkStart:
      break;
  }

  auto header = parse_chunk_header(input, pos);
  if (!header) {
    return std::unexpected{std::move(header.error())};
  }

  if (header->size == 0) {
    auto trailer = trailer_parser_.parse_trailer(input, header->next);
    if (!trailer) {
      return std::unexpected{std::move(trailer.error())};
    }
    phase_ = Phase::Done;
    return BodyStep{EntityEnd{std::move(trailer->entries)}, trailer->next};
  }

  if (total_bytes_ + header->size > settings_.max_content_length) {
    return parse_failure(
        ParseErrc::EntityTooLarge, "Request Content-Length too large",
        std::format("Chunked entity exceeds the configured limit of {} bytes",
                    settings_.max_content_length));
  }
  pos = header->next;
  if (pos >= input.size()) {
    return need_more_data();
  }

  auto available = static_cast<std::uint64_t>(input.size() - pos);
  auto take = static_cast<std::size_t>(std::min(header->size, available));
  total_bytes_ += header->size;
  extension_ = std::move(header->extension);
  remaining_ = header->size - take;
  phase_ = remaining_ == 0 ? Phase::ChunkEnd : Phase::Data;
  return BodyStep{EntityChunk{input.slice(pos, pos + take), extension_},
                  pos + take};
}

}  // namespace h1stream::http
