#pragma once

#include <cstdint>
#include <string>

namespace gatewayd::config {

struct GatewayConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 7788;
  bool allow_public_bind = false;
  /// Static bearer token accepted by /rpc and registered routes. Empty means
  /// only issued access tokens are accepted.
  std::string auth_token;
  std::uint32_t pairing_ttl_seconds = 600;
  std::uint32_t max_clients = 256;
  bool broadcast_requires_auth = false;
};

struct ObservabilityConfig {
  /// "log" or "none".
  std::string backend = "log";
  /// Lowest level the log backend writes: debug, info, warn or error.
  std::string log_level = "info";
};

struct Config {
  GatewayConfig gateway;
  ObservabilityConfig observability;
};

} // namespace gatewayd::config
