#pragma once

#include "h1stream/config/parser_settings.hpp"
#include "h1stream/http/http_types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace h1stream::http {

/// Synthetic header prepended to a GET request that is a valid WebSocket
/// handshake. Its value is the Sec-WebSocket-Accept key, optionally followed
/// by "; protocols=<requested subprotocols>".
inline constexpr std::string_view kUpgradeToWebSocketHeader =
    "Upgrade-To-WebSocket";

[[nodiscard]] auto base64_encode(std::span<const std::uint8_t> data)
    -> std::string;

[[nodiscard]] auto base64_decode(std::string_view text)
    -> std::optional<std::vector<std::uint8_t>>;

/// RFC 6455 section 4.2.2: base64(SHA-1(key + GUID))
[[nodiscard]] auto create_websocket_accept_key(std::string_view sec_key)
    -> std::string;

/// Checks the RFC 6455 server-side handshake requirements.
[[nodiscard]] auto detect_websocket_upgrade(const HttpHeaders& headers,
                                            bool host_present,
                                            const WebSocketSettings& settings)
    -> std::optional<HttpHeader>;

}  // namespace h1stream::http
