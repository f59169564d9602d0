#include "gatewayd/gateway/server.hpp"

#include "gatewayd/common/fs.hpp"
#include "gatewayd/common/json_util.hpp"
#include "gatewayd/common/time.hpp"
#include "gatewayd/gateway/websocket.hpp"
#include "gatewayd/health/health.hpp"
#include "gatewayd/observability/global.hpp"
#include "gatewayd/security/digest.hpp"

#include <atomic>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace gatewayd::gateway {

namespace {

constexpr int kListenBacklog = 64;
constexpr auto kHttpReadTimeout = std::chrono::milliseconds(15000);
constexpr auto kAcceptBackoff = std::chrono::milliseconds(100);

using SteadyClock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(const SteadyClock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
}

std::string now_iso() { return common::now_rfc3339(); }

std::int64_t now_millis() {
  return common::to_unix_millis(std::chrono::system_clock::now());
}

std::string flat_get(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return "";
  }
  return it->second;
}

std::string dash_whitespace(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  bool in_space = false;
  for (const char ch : value) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      if (!in_space) {
        out.push_back('-');
      }
      in_space = true;
    } else {
      out.push_back(ch);
      in_space = false;
    }
  }
  return out;
}

timeval to_timeval(const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  return tv;
}

void set_receive_timeout(const int fd, const std::chrono::milliseconds timeout) {
  const timeval tv = to_timeval(timeout);
  (void)setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

void set_send_timeout(const int fd, const std::chrono::milliseconds timeout) {
  const timeval tv = to_timeval(timeout);
  (void)setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

/// Errors that leave the listening socket usable but will repeat at once.
bool is_resource_exhaustion(const int error) {
  return error == EMFILE || error == ENFILE || error == ENOBUFS || error == ENOMEM;
}

std::string peer_address(const sockaddr_storage &addr) {
  char buffer[INET6_ADDRSTRLEN] = {0};
  if (addr.ss_family == AF_INET) {
    const auto *in4 = reinterpret_cast<const sockaddr_in *>(&addr);
    if (inet_ntop(AF_INET, &in4->sin_addr, buffer, sizeof(buffer)) != nullptr) {
      return buffer;
    }
  } else if (addr.ss_family == AF_INET6) {
    const auto *in6 = reinterpret_cast<const sockaddr_in6 *>(&addr);
    if (inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer)) != nullptr) {
      return buffer;
    }
  }
  return "";
}

std::optional<std::string> webhook_name(const std::string &path) {
  static const std::string prefix = "/webhooks/";
  if (!common::starts_with(path, prefix)) {
    return std::nullopt;
  }
  const std::string rest = path.substr(prefix.size());
  if (rest.empty() || rest.find('/') != std::string::npos) {
    return std::nullopt;
  }
  std::string name = common::trim(url_decode(rest));
  if (name.empty()) {
    return std::nullopt;
  }
  return name;
}

std::string webhook_body_json(const HttpRequest &request) {
  const std::string content_type = common::to_lower(request.header("content-type"));
  if (content_type.find("application/json") != std::string::npos) {
    if (common::trim(request.body).empty()) {
      return "{}";
    }
    if (common::json_is_valid(request.body)) {
      return common::trim(request.body);
    }
  }
  return common::json_quote(request.body);
}

std::uint64_t matched_jobs_of(const std::string &result_json) {
  const std::string raw = common::json_get_number(result_json, "matchedJobs");
  if (raw.empty()) {
    return 0;
  }
  double value = 0;
  try {
    value = std::stod(raw);
  } catch (const std::exception &) {
    return 0;
  }
  return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

} // namespace

class GatewayServer::Impl : public std::enable_shared_from_this<GatewayServer::Impl> {
public:
  Impl(GatewayServerOptions options, security::CredentialManager &credentials, EventBus &bus,
       GatewayHandlers handlers, MethodRegistry *methods, RouteRegistry *routes);

  [[nodiscard]] common::Status start();
  void stop();

  [[nodiscard]] std::uint16_t port() const { return bound_port_; }
  [[nodiscard]] bool is_running() const { return running_.load(); }
  [[nodiscard]] std::size_t connection_count() const;
  [[nodiscard]] const GatewayServerOptions &options() const { return options_; }

  [[nodiscard]] HttpResponse dispatch_http(const HttpRequest &request);

private:
  struct Connection {
    std::uint64_t id = 0;
    /// Guarded by write_mutex; -1 once the owning thread has closed it.
    int fd = -1;
    /// Guarded by write_mutex. Set after a failed or timed-out write.
    bool broken = false;
    std::atomic<bool> subscribed{false};
    std::atomic<bool> authorized{false};
    std::mutex write_mutex;
    /// Owned by the connection thread.
    std::optional<security::AuthClient> client;
    std::string token;
  };

  [[nodiscard]] HttpResponse handle_health() const;
  [[nodiscard]] HttpResponse handle_webhook(const HttpRequest &request, const std::string &name);
  [[nodiscard]] HttpResponse handle_rpc(const HttpRequest &request);
  [[nodiscard]] std::optional<std::string> bearer_token(const HttpRequest &request) const;
  [[nodiscard]] bool is_authorized_bearer(const HttpRequest &request);

  void accept_loop();
  void handle_socket(int fd, std::string remote_address);
  void run_websocket(const std::shared_ptr<Connection> &connection);
  void handle_ws_message(Connection &connection, const std::string &text);
  void handle_unauthenticated(Connection &connection, const ClientMessage &message);
  void handle_command(Connection &connection, const ClientMessage &message);
  void handle_ws_rpc(Connection &connection, const ClientMessage &message);
  void handle_message_send(Connection &connection, const std::string &id,
                           const std::string &payload_json);
  void broadcast(const GatewayEvent &event);

  bool send_ws(Connection &connection, WsOpcode opcode, const std::string &payload);
  bool send_text(Connection &connection, const std::string &text);
  void track_fd(int fd);
  void untrack_fd(int fd, Connection *connection = nullptr);

  GatewayServerOptions options_;
  security::CredentialManager &credentials_;
  EventBus &bus_;
  GatewayHandlers handlers_;
  MethodRegistry *methods_;
  RouteRegistry *routes_;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::uint16_t bound_port_ = 0;
  std::thread accept_thread_;
  std::optional<EventBus::SubscriptionId> bus_subscription_;

  mutable std::mutex connections_mutex_;
  std::unordered_map<std::uint64_t, std::shared_ptr<Connection>> connections_;
  std::unordered_set<int> open_fds_;
  std::uint64_t next_connection_id_ = 1;
  std::size_t active_handlers_ = 0;
  std::condition_variable handlers_done_;
};

GatewayServer::Impl::Impl(GatewayServerOptions options, security::CredentialManager &credentials,
                          EventBus &bus, GatewayHandlers handlers, MethodRegistry *methods,
                          RouteRegistry *routes)
    : options_(std::move(options)), credentials_(credentials), bus_(bus),
      handlers_(std::move(handlers)), methods_(methods), routes_(routes) {}

common::Status GatewayServer::Impl::start() {
  if (running_) {
    return common::Status::success();
  }
  health::mark_component_starting("gateway");

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
  addrinfo *resolved = nullptr;
  const std::string port_text = std::to_string(options_.port);
  const int gai = getaddrinfo(options_.host.c_str(), port_text.c_str(), &hints, &resolved);
  if (gai != 0 || resolved == nullptr) {
    const std::string msg = "cannot resolve bind host " + options_.host + ": " + gai_strerror(gai);
    health::mark_component_error("gateway", msg);
    return common::Status::error(common::ErrorCode::Io, msg);
  }

  int bind_errno = 0;
  for (addrinfo *candidate = resolved; candidate != nullptr; candidate = candidate->ai_next) {
    const int fd = socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);
    if (fd < 0) {
      bind_errno = errno;
      continue;
    }
    int reuse = 1;
    (void)setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    if (bind(fd, candidate->ai_addr, candidate->ai_addrlen) != 0) {
      bind_errno = errno;
      close(fd);
      continue;
    }
    listen_fd_ = fd;
    break;
  }
  freeaddrinfo(resolved);

  if (listen_fd_ < 0) {
    const std::string where = options_.host + ":" + port_text;
    if (bind_errno == EADDRINUSE) {
      health::mark_component_error("gateway", "address in use: " + where);
      return common::Status::error(common::ErrorCode::PortConflict, "address in use: " + where);
    }
    const std::string msg = "bind " + where + " failed: " + std::strerror(bind_errno);
    health::mark_component_error("gateway", msg);
    return common::Status::error(common::ErrorCode::Io, msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::string("listen failed: ") + std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    health::mark_component_error("gateway", msg);
    return common::Status::error(common::ErrorCode::Io, msg);
  }

  sockaddr_storage actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    if (actual.ss_family == AF_INET6) {
      bound_port_ = ntohs(reinterpret_cast<sockaddr_in6 *>(&actual)->sin6_port);
    } else {
      bound_port_ = ntohs(reinterpret_cast<sockaddr_in *>(&actual)->sin_port);
    }
  } else {
    bound_port_ = options_.port;
  }

  bus_subscription_ =
      bus_.subscribe([weak = weak_from_this()](const GatewayEvent &event) {
        if (const auto self = weak.lock(); self != nullptr) {
          self->broadcast(event);
        }
      });

  running_ = true;
  accept_thread_ = std::thread([self = shared_from_this()]() { self->accept_loop(); });
  health::mark_component_ok("gateway");
  observability::record_lifecycle("gateway", "listening",
                                  options_.host + ":" + std::to_string(bound_port_));
  return common::Status::success();
}

void GatewayServer::Impl::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (bus_subscription_.has_value()) {
    bus_.unsubscribe(*bus_subscription_);
    bus_subscription_.reset();
  }
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  std::unique_lock<std::mutex> lock(connections_mutex_);
  for (const int fd : open_fds_) {
    shutdown(fd, SHUT_RDWR);
  }
  const bool drained = handlers_done_.wait_for(lock, options_.stop_drain_timeout,
                                               [this]() { return active_handlers_ == 0; });
  connections_.clear();
  lock.unlock();

  if (!drained) {
    observability::record_error("gateway", "connection threads still running after stop");
  }
  health::mark_component_stopped("gateway");
  observability::record_lifecycle("gateway", "stopped");
}

std::size_t GatewayServer::Impl::connection_count() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return connections_.size();
}

void GatewayServer::Impl::track_fd(const int fd) {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  open_fds_.insert(fd);
  ++active_handlers_;
}

void GatewayServer::Impl::untrack_fd(const int fd, Connection *connection) {
  {
    // The fd number leaves open_fds_ and the connection before it can be
    // reused by the next accept.
    std::lock_guard<std::mutex> lock(connections_mutex_);
    open_fds_.erase(fd);
    if (connection != nullptr) {
      std::lock_guard<std::mutex> write_lock(connection->write_mutex);
      connection->fd = -1;
    }
    close(fd);
    --active_handlers_;
  }
  handlers_done_.notify_all();
}

void GatewayServer::Impl::accept_loop() {
  while (running_) {
    sockaddr_storage client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      const int error = errno;
      if (!running_) {
        break;
      }
      if (is_resource_exhaustion(error)) {
        observability::record_error("gateway",
                                    std::string("accept failed: ") + std::strerror(error));
        std::this_thread::sleep_for(kAcceptBackoff);
      }
      continue;
    }

    bool over_capacity = false;
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      over_capacity = active_handlers_ >= options_.max_clients;
    }
    if (over_capacity) {
      (void)send_all(client, render_http_response(
                                 make_error_response(503, "too many connections")));
      close(client);
      observability::record_error("gateway", "rejected connection: client limit reached");
      continue;
    }

    track_fd(client);
    std::thread([self = shared_from_this(), client, remote = peer_address(client_addr)]() mutable {
      self->handle_socket(client, std::move(remote));
    }).detach();
  }
}

void GatewayServer::Impl::handle_socket(const int fd, std::string remote_address) {
  try {
    set_receive_timeout(fd, kHttpReadTimeout);
    auto parsed = read_http_request(fd);
    if (!parsed.ok()) {
      if (parsed.code() == common::ErrorCode::Validation) {
        const int status = parsed.error() == "request_too_large" ? 413 : 400;
        (void)send_all(fd, render_http_response(make_error_response(status, parsed.error())));
      }
      untrack_fd(fd);
      return;
    }

    auto &request = parsed.value();
    request.remote_address = std::move(remote_address);

    if (request.path == "/ws" && is_websocket_upgrade(request)) {
      if (!send_all(fd, render_handshake_response(request))) {
        untrack_fd(fd);
        return;
      }
      set_receive_timeout(fd, std::chrono::milliseconds(0));
      set_send_timeout(fd, options_.send_timeout);

      auto connection = std::make_shared<Connection>();
      connection->fd = fd;
      {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connection->id = next_connection_id_++;
        connections_.emplace(connection->id, connection);
        observability::record_metric(
            observability::ActiveConnectionsMetric{.count = connections_.size()});
      }
      observability::record_connection(std::to_string(connection->id), "websocket", true);

      run_websocket(connection);

      {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(connection->id);
        observability::record_metric(
            observability::ActiveConnectionsMetric{.count = connections_.size()});
      }
      observability::record_connection(std::to_string(connection->id), "websocket", false);
      untrack_fd(fd, connection.get());
      return;
    }

    const auto started = SteadyClock::now();
    const HttpResponse response = dispatch_http(request);
    (void)send_all(fd, render_http_response(response));
    observability::record_metric(observability::RequestLatencyMetric{
        .route = request.method + " " + request.path, .latency = elapsed_since(started)});
  } catch (const std::exception &e) {
    observability::record_error("gateway", std::string("connection failed: ") + e.what());
  }
  untrack_fd(fd);
}

void GatewayServer::Impl::run_websocket(const std::shared_ptr<Connection> &connection) {
  (void)send_text(*connection, hello_message(options_.version, now_iso()));

  while (running_) {
    auto frame = read_frame(connection->fd);
    if (!frame.ok()) {
      if (frame.error() != "connection closed") {
        (void)send_ws(*connection, WsOpcode::Close, "");
      }
      break;
    }

    const WsFrame &received = frame.value();
    if (received.opcode == WsOpcode::Close) {
      (void)send_ws(*connection, WsOpcode::Close, "");
      break;
    }
    if (received.opcode == WsOpcode::Ping) {
      (void)send_ws(*connection, WsOpcode::Pong, received.payload);
      continue;
    }
    if (received.opcode == WsOpcode::Pong) {
      continue;
    }

    try {
      handle_ws_message(*connection, received.payload);
    } catch (const std::exception &e) {
      observability::record_error("gateway", "websocket connection " +
                                                 std::to_string(connection->id) +
                                                 " failed: " + e.what());
      break;
    }
  }
}

bool GatewayServer::Impl::send_ws(Connection &connection, const WsOpcode opcode,
                                  const std::string &payload) {
  std::lock_guard<std::mutex> lock(connection.write_mutex);
  if (connection.fd < 0 || connection.broken) {
    return false;
  }
  if (send_frame(connection.fd, opcode, payload)) {
    return true;
  }
  // A timed-out write may have left half a frame on the wire; the stream is
  // unusable. Shutting it down also ends the connection's read loop.
  connection.broken = true;
  shutdown(connection.fd, SHUT_RDWR);
  observability::record_error("gateway", "websocket connection " +
                                             std::to_string(connection.id) +
                                             " write failed; closing");
  return false;
}

bool GatewayServer::Impl::send_text(Connection &connection, const std::string &text) {
  return send_ws(connection, WsOpcode::Text, text);
}

void GatewayServer::Impl::handle_ws_message(Connection &connection, const std::string &text) {
  auto parsed = parse_client_message(text);
  if (!parsed.ok()) {
    (void)send_text(connection, rpc_error_message(parsed.error(), now_iso()));
    return;
  }
  const ClientMessage &message = parsed.value();

  if (message.type == "ping") {
    (void)send_text(connection, pong_message(now_millis()));
    return;
  }
  if (message.type == "subscribe") {
    connection.subscribed = true;
    (void)send_text(connection, subscription_message(true, now_iso()));
    return;
  }
  if (message.type == "unsubscribe") {
    connection.subscribed = false;
    (void)send_text(connection, subscription_message(false, now_iso()));
    return;
  }

  if (!connection.authorized || message.type == "authenticate" || message.type == "pair") {
    handle_unauthenticated(connection, message);
    return;
  }

  if (message.type == "command") {
    handle_command(connection, message);
    return;
  }
  if (message.type == "rpc") {
    handle_ws_rpc(connection, message);
    return;
  }
  (void)send_text(connection, rpc_error_message("Expected command message", now_iso()));
}

void GatewayServer::Impl::handle_unauthenticated(Connection &connection,
                                           const ClientMessage &message) {
  if (message.type == "authenticate") {
    const std::string token = common::trim(message.get("token"));
    const auto client = credentials_.authenticate(token);
    observability::record_auth("token", client.has_value(),
                               client.has_value() ? std::optional<std::string>(client->id)
                                                  : std::nullopt);
    if (!client.has_value()) {
      (void)send_text(connection, auth_error_message("Invalid token"));
      return;
    }
    connection.client = *client;
    connection.token = token;
    connection.authorized = true;
    (void)send_text(connection, auth_ok_message(*client));
    return;
  }

  if (message.type == "pair") {
    const std::string label = common::trim(message.get("label"));
    const auto issued = credentials_.consume_pairing_code(
        common::trim(message.get("code")),
        label.empty() ? std::nullopt : std::optional<std::string>(label));
    observability::record_auth("pairing_code", issued.has_value(),
                               issued.has_value()
                                   ? std::optional<std::string>(issued->client.id)
                                   : std::nullopt);
    if (!issued.has_value()) {
      (void)send_text(connection, auth_error_message("Invalid or expired pairing code"));
      return;
    }
    connection.client = issued->client;
    connection.token = issued->token;
    connection.authorized = true;
    (void)send_text(connection, paired_message(*issued));
    (void)send_text(connection, auth_ok_message(issued->client));
    return;
  }

  if (message.type == "rpc") {
    (void)send_text(connection, rpc_error_message("Unauthorized", now_iso()));
    return;
  }

  (void)send_text(connection, auth_error_message("Authenticate first"));
}

void GatewayServer::Impl::handle_command(Connection &connection, const ClientMessage &message) {
  const std::string id = common::trim(message.get("id"));
  if (id.empty()) {
    (void)send_text(connection, rpc_error_message("Command id is required", now_iso()));
    return;
  }
  const std::string name = common::trim(message.get("name"));
  const std::string payload = message.object("payload");

  if (name == "message.send") {
    handle_message_send(connection, id, payload);
    return;
  }

  const auto started = SteadyClock::now();
  common::Result<std::string> result = common::Result<std::string>::failure(
      common::ErrorCode::UnknownCommand, "Unsupported command: " + name);
  try {
    if (name == "ping") {
      result = common::Result<std::string>::success("{\"pong\":" + std::to_string(now_millis()) +
                                                    "}");
    } else if (name == "status.get") {
      result = handlers_.get_status
                   ? common::Result<std::string>::success(handlers_.get_status())
                   : common::Result<std::string>::success("{}");
    } else if (name == "sessions.list") {
      result = handlers_.list_sessions
                   ? common::Result<std::string>::success(handlers_.list_sessions())
                   : common::Result<std::string>::success("[]");
    } else if (name == "auth.rotate") {
      const auto rotated = credentials_.rotate_token(connection.token);
      if (!rotated.has_value()) {
        result = common::Result<std::string>::failure(common::ErrorCode::AuthRejected,
                                                      "Unable to rotate token");
      } else {
        connection.client = rotated->client;
        connection.token = rotated->token;
        result = common::Result<std::string>::success(
            "{\"token\":" + common::json_quote(rotated->token) +
            ",\"clientId\":" + common::json_quote(rotated->client.id) +
            ",\"label\":" + common::json_quote(rotated->client.label) + "}");
      }
    }
  } catch (const std::exception &e) {
    result = common::Result<std::string>::failure(common::ErrorCode::HandlerError, e.what());
  }

  observability::record_command(name, elapsed_since(started), result.ok());
  (void)send_text(connection, command_result_message(id, result));
}

void GatewayServer::Impl::handle_message_send(Connection &connection, const std::string &id,
                                        const std::string &payload_json) {
  const auto started = SteadyClock::now();
  const auto fields = common::json_parse_flat(payload_json);
  const std::string text = common::trim(flat_get(fields, "message"));
  if (text.empty()) {
    (void)send_text(connection,
                    command_result_message(id, common::Result<std::string>::failure(
                                                   common::ErrorCode::Validation,
                                                   "payload.message is required")));
    observability::record_command("message.send", elapsed_since(started), false);
    return;
  }

  const std::string client_id =
      connection.client.has_value() ? connection.client->id : security::DEFAULT_CLIENT_LABEL;
  std::string session_id = common::trim(flat_get(fields, "sessionId"));
  if (session_id.empty()) {
    session_id = "gateway:" + dash_whitespace(client_id);
  }

  (void)send_text(connection,
                  command_event_message(id, "started",
                                        "{\"sessionId\":" + common::json_quote(session_id) + "}"));

  common::Result<std::string> result =
      common::Result<std::string>::failure(common::ErrorCode::HandlerError,
                                           "message handler is not configured");
  if (handlers_.process_message) {
    try {
      const MessageResult outcome = handlers_.process_message(
          MessageRequest{
              .session_id = session_id,
              .message = text,
              .client_id = client_id,
              .client_label = connection.client.has_value() ? connection.client->label : "",
              .payload_json = payload_json,
          },
          [this, &connection, &id](const std::string &chunk) {
            if (chunk.empty()) {
              return;
            }
            (void)send_text(connection,
                            command_event_message(id, "chunk",
                                                  "{\"chunk\":" + common::json_quote(chunk) + "}"));
          });
      (void)send_text(connection,
                      command_event_message(id, "completed",
                                            "{\"sessionId\":" +
                                                common::json_quote(outcome.session_id) + "}"));
      result = common::Result<std::string>::success(
          "{\"sessionId\":" + common::json_quote(outcome.session_id) +
          ",\"response\":" + common::json_quote(outcome.response) + "}");
    } catch (const std::exception &e) {
      result = common::Result<std::string>::failure(common::ErrorCode::HandlerError, e.what());
    }
  }

  observability::record_command("message.send", elapsed_since(started), result.ok());
  (void)send_text(connection, command_result_message(id, result));
}

void GatewayServer::Impl::handle_ws_rpc(Connection &connection, const ClientMessage &message) {
  const std::string method = common::trim(message.get("method"));
  const std::string request_id = common::trim(message.get("requestId"));
  const std::optional<std::string> rid =
      request_id.empty() ? std::nullopt : std::optional<std::string>(request_id);

  const auto started = SteadyClock::now();
  common::Result<std::string> result =
      common::Result<std::string>::failure(common::ErrorCode::MethodNotFound,
                                           "Unknown method: " + method);
  if (method.empty()) {
    result = common::Result<std::string>::failure(common::ErrorCode::Validation,
                                                  "method is required");
  } else if (methods_ != nullptr) {
    result = methods_->invoke(method, message.object("params"),
                              RpcContext{.auth_token = connection.token,
                                         .request_id = rid,
                                         .session_id = std::nullopt});
  }
  observability::record_command("rpc:" + method, elapsed_since(started), result.ok());
  (void)send_text(connection, rpc_result_message(rid, result));
}

void GatewayServer::Impl::broadcast(const GatewayEvent &event) {
  const std::string text = event_message(event);

  std::vector<std::shared_ptr<Connection>> targets;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    targets.reserve(connections_.size());
    for (const auto &[id, connection] : connections_) {
      (void)id;
      if (!connection->subscribed) {
        continue;
      }
      if (options_.broadcast_requires_auth && !connection->authorized) {
        continue;
      }
      targets.push_back(connection);
    }
  }

  std::uint64_t delivered = 0;
  std::uint64_t failed = 0;
  for (const auto &connection : targets) {
    if (send_text(*connection, text)) {
      ++delivered;
    } else {
      ++failed;
    }
  }
  observability::record_metric(observability::BroadcastDeliveryMetric{
      .event_type = event.type, .delivered = delivered, .failed = failed});
}

std::optional<std::string> GatewayServer::Impl::bearer_token(const HttpRequest &request) const {
  const std::string authorization = common::trim(request.header("authorization"));
  if (authorization.size() > 7 && common::to_lower(authorization.substr(0, 7)) == "bearer ") {
    const std::string token = common::trim(authorization.substr(7));
    if (!token.empty()) {
      return token;
    }
  }
  if (const auto it = request.query.find("token"); it != request.query.end()) {
    const std::string token = common::trim(it->second);
    if (!token.empty()) {
      return token;
    }
  }
  return std::nullopt;
}

bool GatewayServer::Impl::is_authorized_bearer(const HttpRequest &request) {
  const auto token = bearer_token(request);
  if (!token.has_value()) {
    return false;
  }
  if (!options_.auth_token.empty() && security::constant_time_equals(*token, options_.auth_token)) {
    return true;
  }
  return credentials_.authenticate(*token).has_value();
}

HttpResponse GatewayServer::Impl::dispatch_http(const HttpRequest &request) {
  const std::string &path = request.path;

  if (path == "/health") {
    if (request.method != "GET" && request.method != "HEAD") {
      return make_error_response(405, "method not allowed");
    }
    return handle_health();
  }

  if (path == "/ws") {
    return make_error_response(426, "websocket upgrade required");
  }

  if (const auto name = webhook_name(path); name.has_value()) {
    if (request.method != "POST") {
      return make_error_response(405, "method not allowed");
    }
    return handle_webhook(request, *name);
  }

  if (path == "/rpc") {
    if (request.method != "POST") {
      return make_error_response(405, "method not allowed");
    }
    return handle_rpc(request);
  }

  if (routes_ != nullptr) {
    if (const auto handler = routes_->find(request.method, path); handler.has_value()) {
      if (!is_authorized_bearer(request)) {
        return make_error_response(401, "unauthorized");
      }
      try {
        return (*handler)(request);
      } catch (const std::exception &e) {
        observability::record_error("gateway", "route " + request.method + " " + path +
                                                   " failed: " + e.what());
        return make_error_response(500, e.what());
      }
    }
  }

  if (!is_authorized_bearer(request)) {
    return make_error_response(401, "unauthorized");
  }
  return make_error_response(404, "not found");
}

HttpResponse GatewayServer::Impl::handle_health() const {
  std::ostringstream out;
  out << "{\"ok\":true,\"status\":\"ok\",\"host\":" << common::json_quote(options_.host)
      << ",\"port\":" << bound_port_ << ",\"version\":" << common::json_quote(options_.version)
      << ",\"now\":" << common::json_quote(now_iso())
      << ",\"connections\":" << connection_count()
      << ",\"components\":" << health::components_json() << ",\"degraded\":[";
  const auto degraded = health::degraded_components();
  for (std::size_t i = 0; i < degraded.size(); ++i) {
    out << (i == 0 ? "" : ",") << common::json_quote(degraded[i]);
  }
  out << "]}";
  return make_json_response(200, out.str());
}

HttpResponse GatewayServer::Impl::handle_webhook(const HttpRequest &request, const std::string &name) {
  WebhookPayload payload{
      .name = name,
      .headers = request.headers,
      .raw_body = request.body,
      .body_json = webhook_body_json(request),
      .received_at = now_iso(),
      .source_ip = std::nullopt,
  };
  if (const std::string forwarded = common::trim(request.header("x-forwarded-for"));
      !forwarded.empty()) {
    payload.source_ip = forwarded;
  } else if (!request.remote_address.empty()) {
    payload.source_ip = request.remote_address;
  }

  std::uint64_t matched_jobs = 0;
  std::string handler_result;
  if (handlers_.handle_webhook) {
    try {
      handler_result = handlers_.handle_webhook(payload);
      if (!common::json_is_object(handler_result)) {
        handler_result.clear();
      }
      matched_jobs = matched_jobs_of(handler_result);
    } catch (const std::exception &e) {
      observability::record_error("gateway", "webhook " + name + " handler failed: " + e.what());
      handler_result.clear();
      matched_jobs = 0;
    }
  }
  observability::record_webhook(name, matched_jobs);

  std::ostringstream out;
  out << "{\"accepted\":true,\"webhook\":" << common::json_quote(name)
      << ",\"matchedJobs\":" << matched_jobs;
  for (const auto &[key, value] : common::json_object_members(handler_result)) {
    if (key == "accepted" || key == "webhook" || key == "matchedJobs") {
      continue;
    }
    out << "," << common::json_quote(key) << ":" << value;
  }
  out << "}";
  return make_json_response(202, out.str());
}

HttpResponse GatewayServer::Impl::handle_rpc(const HttpRequest &request) {
  const auto token = bearer_token(request);
  if (!is_authorized_bearer(request)) {
    observability::record_auth("bearer", false);
    return make_error_response(401, "unauthorized");
  }

  auto envelope = parse_rpc_envelope(request.body);
  if (!envelope.ok()) {
    return make_json_response(
        400, rpc_response_body(std::nullopt,
                               common::Result<std::string>::failure(envelope.status())));
  }

  const auto started = SteadyClock::now();
  const RpcEnvelope &rpc = envelope.value();
  common::Result<std::string> result =
      common::Result<std::string>::failure(common::ErrorCode::MethodNotFound,
                                           "Unknown method: " + rpc.method);
  if (methods_ != nullptr) {
    result = methods_->invoke(rpc.method, rpc.params_json,
                              RpcContext{.auth_token = token.value_or(""),
                                         .request_id = rpc.request_id,
                                         .session_id = std::nullopt});
  }
  observability::record_command("rpc:" + rpc.method, elapsed_since(started), result.ok());
  return make_json_response(200, rpc_response_body(rpc.request_id, result));
}

GatewayServer::GatewayServer(GatewayServerOptions options,
                             security::CredentialManager &credentials, EventBus &bus,
                             GatewayHandlers handlers, MethodRegistry *methods,
                             RouteRegistry *routes)
    : impl_(std::make_shared<Impl>(std::move(options), credentials, bus, std::move(handlers),
                                   methods, routes)) {}

GatewayServer::~GatewayServer() { impl_->stop(); }

common::Status GatewayServer::start() { return impl_->start(); }

void GatewayServer::stop() { impl_->stop(); }

std::uint16_t GatewayServer::port() const { return impl_->port(); }

bool GatewayServer::is_running() const { return impl_->is_running(); }

std::size_t GatewayServer::connection_count() const { return impl_->connection_count(); }

const GatewayServerOptions &GatewayServer::options() const { return impl_->options(); }

HttpResponse GatewayServer::dispatch_http(const HttpRequest &request) {
  return impl_->dispatch_http(request);
}

} // namespace gatewayd::gateway
