#pragma once

#include "gatewayd/common/time.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace gatewayd::gateway {

class EventBus;

struct MessageRequest {
  std::string session_id;
  std::string message;
  std::string client_id;
  std::string client_label;
  /// The full command payload as JSON object text.
  std::string payload_json = "{}";
};

struct MessageResult {
  std::string session_id;
  std::string response;
};

using ChunkCallback = std::function<void(const std::string &chunk)>;

struct WebhookPayload {
  std::string name;
  std::unordered_map<std::string, std::string> headers;
  std::string raw_body;
  /// JSON value text: the parsed object for JSON bodies, otherwise the raw
  /// body as a JSON string.
  std::string body_json = "null";
  std::string received_at;
  std::optional<std::string> source_ip;

  [[nodiscard]] std::string to_json() const;
};

/// Callbacks the transport dispatches to. Any of them may throw; the server
/// turns the exception into an `ok:false` reply. Results other than
/// MessageResult are JSON text.
struct GatewayHandlers {
  std::function<MessageResult(const MessageRequest &, const ChunkCallback &)> process_message;
  std::function<std::string()> list_sessions;
  std::function<std::string()> get_status;
  /// Returns a JSON object merged into the 202 body. Optional.
  std::function<std::string(const WebhookPayload &)> handle_webhook;
};

/// Built-in handlers used by the daemon: echoes messages back as a single
/// chunk, keeps an in-memory list of sessions and republishes webhooks on
/// the event bus as `webhook.received`.
class LocalSessionHandlers {
public:
  explicit LocalSessionHandlers(EventBus &bus, common::Clock clock = common::system_clock());

  [[nodiscard]] GatewayHandlers bind();

  [[nodiscard]] MessageResult process_message(const MessageRequest &request,
                                              const ChunkCallback &on_chunk);
  [[nodiscard]] std::string list_sessions() const;
  [[nodiscard]] std::string get_status() const;
  [[nodiscard]] std::string handle_webhook(const WebhookPayload &payload);

private:
  struct SessionSummary {
    std::uint64_t message_count = 0;
    std::int64_t last_activity = 0;
    std::string preview;
  };

  EventBus &bus_;
  common::Clock clock_;
  mutable std::mutex mutex_;
  std::map<std::string, SessionSummary> sessions_;
  std::uint64_t webhooks_received_ = 0;
};

} // namespace gatewayd::gateway
