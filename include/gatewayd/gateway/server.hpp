#pragma once

#include "gatewayd/common/result.hpp"
#include "gatewayd/gateway/event_bus.hpp"
#include "gatewayd/gateway/handlers.hpp"
#include "gatewayd/gateway/http.hpp"
#include "gatewayd/gateway/protocol.hpp"
#include "gatewayd/gateway/registry.hpp"
#include "gatewayd/security/credentials.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace gatewayd::gateway {

struct GatewayServerOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 7788;
  std::string version = "0.0.0";
  /// Static bearer token accepted on `/rpc` and registered routes.
  std::string auth_token;
  std::size_t max_clients = 256;
  /// When set, broadcast events only reach sockets that are both subscribed
  /// and authenticated.
  bool broadcast_requires_auth = false;
  /// A WebSocket write that cannot complete within this window marks the
  /// connection broken and closes it.
  std::chrono::milliseconds send_timeout{2000};
  /// How long stop() waits for connection threads before returning.
  std::chrono::milliseconds stop_drain_timeout{5000};
};

/// HTTP and WebSocket endpoint on one listening socket.
///
/// One accept thread plus one thread per connection. WebSocket sessions live
/// in a connection table keyed by id for exactly as long as their socket is
/// open; nothing about a session outlives it. Connection threads share
/// ownership of the server internals, so a handler still running when stop()
/// gives up waiting finishes against live state. Such a handler must not
/// outlive the objects it captures.
class GatewayServer {
public:
  GatewayServer(GatewayServerOptions options, security::CredentialManager &credentials,
                EventBus &bus, GatewayHandlers handlers, MethodRegistry *methods = nullptr,
                RouteRegistry *routes = nullptr);
  ~GatewayServer();

  GatewayServer(const GatewayServer &) = delete;
  GatewayServer &operator=(const GatewayServer &) = delete;

  /// PortConflict when the address is in use, Io for other socket errors.
  [[nodiscard]] common::Status start();
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::size_t connection_count() const;
  [[nodiscard]] const GatewayServerOptions &options() const;

  /// Routes one plain HTTP request. WebSocket upgrades never reach here.
  [[nodiscard]] HttpResponse dispatch_http(const HttpRequest &request);

private:
  class Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace gatewayd::gateway
