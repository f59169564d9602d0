#pragma once

#include "gatewayd/common/result.hpp"
#include "gatewayd/gateway/http.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace gatewayd::gateway {

inline constexpr std::size_t MAX_WS_FRAME_BYTES = 1024 * 1024;

enum class WsOpcode : std::uint8_t {
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

struct WsFrame {
  WsOpcode opcode = WsOpcode::Text;
  std::string payload;
};

/// Sec-WebSocket-Accept value for a client key (RFC 6455 section 4.2.2).
[[nodiscard]] std::string websocket_accept(const std::string &client_key);

/// GET with Upgrade: websocket, Connection: upgrade, version 13 and a key.
[[nodiscard]] bool is_websocket_upgrade(const HttpRequest &request);

/// The 101 response completing the handshake for `request`.
[[nodiscard]] std::string render_handshake_response(const HttpRequest &request);

/// Encodes one unfragmented frame. Client frames carry a mask.
[[nodiscard]] std::string encode_frame(WsOpcode opcode, const std::string &payload,
                                       std::optional<std::array<std::uint8_t, 4>> mask =
                                           std::nullopt);

/// Reads one frame. Servers must require masked frames; a client reading
/// server frames passes false. Fragmented and oversized frames are errors.
[[nodiscard]] common::Result<WsFrame> read_frame(int fd, bool require_mask = true);

[[nodiscard]] bool send_frame(int fd, WsOpcode opcode, const std::string &payload);

} // namespace gatewayd::gateway
