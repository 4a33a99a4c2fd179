#include "h1stream/http/websocket.hpp"

#include "h1stream/util/log.hpp"

#include <openssl/sha.h>

#include <array>
#include <format>

namespace h1stream::http {
namespace {

constexpr char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::size_t kWebSocketKeyBytes = 16;

auto base64_index(char c) -> int {
  if (c >= 'A' && c <= 'Z')
    return c - 'A';
  if (c >= 'a' && c <= 'z')
    return c - 'a' + 26;
  if (c >= '0' && c <= '9')
    return c - '0' + 52;
  if (c == '+')
    return 62;
  if (c == '/')
    return 63;
  return -1;
}

}  // namespace

auto base64_encode(std::span<const std::uint8_t> data) -> std::string {
  std::string result;
  result.reserve(((data.size() + 2) / 3) * 4);

  for (std::size_t i = 0; i < data.size(); i += 3) {
    std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
    if (i + 1 < data.size())
      triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
    if (i + 2 < data.size())
      triple |= static_cast<std::uint32_t>(data[i + 2]);

    result += kBase64Chars[(triple >> 18) & 0x3F];
    result += kBase64Chars[(triple >> 12) & 0x3F];
    result += (i + 1 < data.size()) ? kBase64Chars[(triple >> 6) & 0x3F] : '=';
    result += (i + 2 < data.size()) ? kBase64Chars[triple & 0x3F] : '=';
  }

  return result;
}

auto base64_decode(std::string_view text)
    -> std::optional<std::vector<std::uint8_t>> {
  if (text.size() % 4 != 0) {
    return std::nullopt;
  }
  std::size_t padding = 0;
  if (!text.empty() && text.back() == '=')
    ++padding;
  if (text.size() > 1 && text[text.size() - 2] == '=')
    ++padding;

  std::vector<std::uint8_t> out;
  out.reserve(text.size() / 4 * 3);
  for (std::size_t i = 0; i < text.size(); i += 4) {
    std::uint32_t quad = 0;
    for (std::size_t j = 0; j < 4; ++j) {
      char c = text[i + j];
      int v = 0;
      if (c == '=') {
        if (i + j < text.size() - padding) {
          return std::nullopt;
        }
      } else {
        v = base64_index(c);
        if (v < 0) {
          return std::nullopt;
        }
      }
      quad = (quad << 6) | static_cast<std::uint32_t>(v);
    }
    out.push_back(static_cast<std::uint8_t>(quad >> 16));
    out.push_back(static_cast<std::uint8_t>(quad >> 8));
    out.push_back(static_cast<std::uint8_t>(quad));
  }
  out.resize(out.size() - padding);
  return out;
}

auto create_websocket_accept_key(std::string_view sec_key) -> std::string {
  static constexpr auto kMagicGUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
  std::string combined = std::string(sec_key) + kMagicGUID;

  std::array<std::uint8_t, SHA_DIGEST_LENGTH> hash{};
  SHA1(reinterpret_cast<const std::uint8_t*>(combined.data()), combined.size(),
       hash.data());

  return base64_encode(hash);
}

auto detect_websocket_upgrade(const HttpHeaders& headers, bool host_present,
                              const WebSocketSettings& settings)
    -> std::optional<HttpHeader> {
  if (!settings.enabled || !host_present) {
    return std::nullopt;
  }

  auto upgrade = find_header(headers, "upgrade");
  auto connection = find_header(headers, "connection");
  if (!upgrade || !connection || !has_token(*upgrade, "websocket") ||
      !has_token(*connection, "upgrade")) {
    return std::nullopt;
  }

  auto version = find_header(headers, "sec-websocket-version");
  if (!version || *version != "13") {
    log::debug("WebSocket upgrade rejected: unsupported version '{}'",
               version.value_or(""));
    return std::nullopt;
  }

  auto key = find_header(headers, "sec-websocket-key");
  if (!key) {
    log::debug("WebSocket upgrade rejected: missing Sec-WebSocket-Key");
    return std::nullopt;
  }
  auto decoded = base64_decode(*key);
  if (!decoded || decoded->size() != kWebSocketKeyBytes) {
    log::debug("WebSocket upgrade rejected: invalid Sec-WebSocket-Key '{}'",
               *key);
    return std::nullopt;
  }

  auto value = create_websocket_accept_key(*key);
  if (auto protocols = find_header(headers, "sec-websocket-protocol");
      protocols && !protocols->empty()) {
    value += std::format("; protocols={}", *protocols);
  }
  return HttpHeader{std::string(kUpgradeToWebSocketHeader), std::move(value)};
}

}  // namespace h1stream::http
