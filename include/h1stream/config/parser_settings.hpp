#pragma once

#include "h1stream/core/error.hpp"
#include "h1stream/http/http_types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace h1stream {

enum class UriParsingMode : std::uint8_t { Strict, Relaxed };

[[nodiscard]] constexpr auto uri_parsing_mode_to_string(
    UriParsingMode mode) noexcept -> std::string_view {
  switch (mode) {
    case UriParsingMode::Strict: return "strict";
    case UriParsingMode::Relaxed: return "relaxed";
  }
  return "strict";
}

[[nodiscard]] inline auto string_to_uri_parsing_mode(
    std::string_view str) noexcept -> std::optional<UriParsingMode> {
  if (str == "strict") return UriParsingMode::Strict;
  if (str == "relaxed") return UriParsingMode::Relaxed;
  return std::nullopt;
}

using CustomMethods =
    std::unordered_map<std::string, http::HttpMethod, StringHash, StringEqual>;

struct WebSocketSettings {
  bool enabled{true};
};

/// Read-only limits and switches shared by every parser instance.
struct ParserSettings {
  std::size_t max_method_length{16};
  std::size_t max_uri_length{2048};
  std::size_t max_header_name_length{64};
  std::size_t max_header_value_length{8192};
  std::size_t max_header_count{64};
  std::uint64_t max_content_length{8 * 1024 * 1024};
  std::size_t max_chunk_ext_length{256};
  std::uint64_t max_chunk_size{1024 * 1024};
  UriParsingMode uri_parsing_mode{UriParsingMode::Strict};
  bool raw_request_uri_header{false};
  CustomMethods custom_methods;
  WebSocketSettings websocket;

  auto add_custom_method(http::HttpMethod method) -> ParserSettings& {
    auto name = std::string(method.name());
    custom_methods.insert_or_assign(std::move(name), std::move(method));
    return *this;
  }

  [[nodiscard]] auto find_custom_method(std::string_view name) const
      -> const http::HttpMethod* {
    auto it = custom_methods.find(name);
    return it == custom_methods.end() ? nullptr : &it->second;
  }
};

struct LogConfig {
  std::string level{"info"};
};

struct Config {
  ParserSettings parsing;
  LogConfig log;
};

using SharedSettings = std::shared_ptr<const ParserSettings>;

}  // namespace h1stream
