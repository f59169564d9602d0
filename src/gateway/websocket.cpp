#include "gatewayd/gateway/websocket.hpp"

#include "gatewayd/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <cerrno>
#include <limits>
#include <sstream>
#include <string_view>
#include <vector>

#include <sys/socket.h>

namespace gatewayd::gateway {

namespace {

constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

bool recv_exact(const int fd, std::uint8_t *data, const std::size_t size) {
  std::size_t received = 0;
  while (received < size) {
    const ssize_t n = recv(fd, data + received, size - received, 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    received += static_cast<std::size_t>(n);
  }
  return true;
}

common::Result<WsFrame> frame_error(std::string message) {
  return common::Result<WsFrame>::failure(common::ErrorCode::Io, std::move(message));
}

} // namespace

std::string websocket_accept(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());

  const int output_len = 4 * static_cast<int>((digest.size() + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), digest.data(),
                  static_cast<int>(digest.size()));
  return output;
}

bool is_websocket_upgrade(const HttpRequest &request) {
  return request.method == "GET" &&
         common::to_lower(common::trim(request.header("upgrade"))) == "websocket" &&
         common::to_lower(request.header("connection")).find("upgrade") != std::string::npos &&
         common::trim(request.header("sec-websocket-version")) == "13" &&
         !common::trim(request.header("sec-websocket-key")).empty();
}

std::string render_handshake_response(const HttpRequest &request) {
  std::ostringstream out;
  out << "HTTP/1.1 101 " << status_text(101) << "\r\n";
  out << "Upgrade: websocket\r\n";
  out << "Connection: Upgrade\r\n";
  out << "Sec-WebSocket-Accept: "
      << websocket_accept(common::trim(request.header("sec-websocket-key"))) << "\r\n";
  out << "\r\n";
  return out.str();
}

std::string encode_frame(const WsOpcode opcode, const std::string &payload,
                         std::optional<std::array<std::uint8_t, 4>> mask) {
  std::string frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<char>(0x80u | (static_cast<std::uint8_t>(opcode) & 0x0Fu)));

  const std::uint8_t mask_bit = mask.has_value() ? 0x80u : 0x00u;
  const auto size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<char>(mask_bit | static_cast<std::uint8_t>(size)));
  } else if (size <= 65535u) {
    frame.push_back(static_cast<char>(mask_bit | 126u));
    frame.push_back(static_cast<char>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<char>(size & 0xFFu));
  } else {
    frame.push_back(static_cast<char>(mask_bit | 127u));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((static_cast<std::uint64_t>(size) >>
                                         static_cast<std::uint64_t>(shift)) &
                                        0xFFu));
    }
  }

  if (!mask.has_value()) {
    frame += payload;
    return frame;
  }
  for (const auto byte : *mask) {
    frame.push_back(static_cast<char>(byte));
  }
  for (std::size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ (*mask)[i % 4]));
  }
  return frame;
}

common::Result<WsFrame> read_frame(const int fd, const bool require_mask) {
  std::array<std::uint8_t, 2> header{};
  if (!recv_exact(fd, header.data(), header.size())) {
    return frame_error("connection closed");
  }

  const bool fin = (header[0] & 0x80u) != 0;
  const auto opcode = static_cast<std::uint8_t>(header[0] & 0x0Fu);
  const bool masked = (header[1] & 0x80u) != 0;
  std::uint64_t payload_len = static_cast<std::uint64_t>(header[1] & 0x7Fu);

  if (!fin) {
    return frame_error("fragmented frames are not supported");
  }

  if (payload_len == 126u) {
    std::array<std::uint8_t, 2> ext{};
    if (!recv_exact(fd, ext.data(), ext.size())) {
      return frame_error("connection closed");
    }
    payload_len = (static_cast<std::uint64_t>(ext[0]) << 8u) | static_cast<std::uint64_t>(ext[1]);
  } else if (payload_len == 127u) {
    std::array<std::uint8_t, 8> ext{};
    if (!recv_exact(fd, ext.data(), ext.size())) {
      return frame_error("connection closed");
    }
    payload_len = 0;
    for (const auto byte : ext) {
      payload_len = (payload_len << 8u) | static_cast<std::uint64_t>(byte);
    }
  }

  if (require_mask && !masked) {
    return frame_error("client frames must be masked");
  }
  if (payload_len > MAX_WS_FRAME_BYTES ||
      payload_len > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
    return frame_error("frame too large");
  }

  std::array<std::uint8_t, 4> mask{};
  if (masked && !recv_exact(fd, mask.data(), mask.size())) {
    return frame_error("connection closed");
  }

  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(payload_len));
  if (!bytes.empty() && !recv_exact(fd, bytes.data(), bytes.size())) {
    return frame_error("connection closed");
  }

  if (masked) {
    for (std::size_t i = 0; i < bytes.size(); ++i) {
      bytes[i] ^= mask[i % mask.size()];
    }
  }

  WsFrame frame;
  frame.opcode = static_cast<WsOpcode>(opcode);
  frame.payload.assign(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  return common::Result<WsFrame>::success(std::move(frame));
}

bool send_frame(const int fd, const WsOpcode opcode, const std::string &payload) {
  return send_all(fd, encode_frame(opcode, payload));
}

} // namespace gatewayd::gateway
