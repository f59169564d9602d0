#include "gatewayd/gateway/handlers.hpp"

#include "gatewayd/common/json_util.hpp"
#include "gatewayd/gateway/event_bus.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace gatewayd::gateway {

namespace {

constexpr std::size_t kPreviewLength = 120;

std::string preview_of(const std::string &message) {
  if (message.size() <= kPreviewLength) {
    return message;
  }
  std::size_t cut = kPreviewLength;
  while (cut > 0 && (static_cast<unsigned char>(message[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return message.substr(0, cut);
}

} // namespace

std::string WebhookPayload::to_json() const {
  std::vector<std::pair<std::string, std::string>> sorted(headers.begin(), headers.end());
  std::sort(sorted.begin(), sorted.end());

  std::ostringstream out;
  out << "{\"name\":" << common::json_quote(name) << ",\"headers\":{";
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << common::json_quote(sorted[i].first) << ":" << common::json_quote(sorted[i].second);
  }
  out << "},\"rawBody\":" << common::json_quote(raw_body) << ",\"body\":"
      << (body_json.empty() ? "null" : body_json)
      << ",\"receivedAt\":" << common::json_quote(received_at);
  if (source_ip.has_value()) {
    out << ",\"sourceIp\":" << common::json_quote(*source_ip);
  }
  out << "}";
  return out.str();
}

LocalSessionHandlers::LocalSessionHandlers(EventBus &bus, common::Clock clock)
    : bus_(bus), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = common::system_clock();
  }
}

GatewayHandlers LocalSessionHandlers::bind() {
  return GatewayHandlers{
      .process_message =
          [this](const MessageRequest &request, const ChunkCallback &on_chunk) {
            return process_message(request, on_chunk);
          },
      .list_sessions = [this]() { return list_sessions(); },
      .get_status = [this]() { return get_status(); },
      .handle_webhook = [this](const WebhookPayload &payload) { return handle_webhook(payload); },
  };
}

MessageResult LocalSessionHandlers::process_message(const MessageRequest &request,
                                                    const ChunkCallback &on_chunk) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &summary = sessions_[request.session_id];
    ++summary.message_count;
    summary.last_activity = common::to_unix_millis(clock_());
    summary.preview = preview_of(request.message);
  }

  if (on_chunk) {
    on_chunk(request.message);
  }
  return MessageResult{.session_id = request.session_id, .response = request.message};
}

std::string LocalSessionHandlers::list_sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream out;
  out << "[";
  bool first = true;
  for (const auto &[id, summary] : sessions_) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << "{\"id\":" << common::json_quote(id) << ",\"messageCount\":" << summary.message_count
        << ",\"lastActivity\":" << summary.last_activity
        << ",\"preview\":" << common::json_quote(summary.preview) << "}";
  }
  out << "]";
  return out.str();
}

std::string LocalSessionHandlers::get_status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return "{\"connected\":true,\"sessions\":" + std::to_string(sessions_.size()) +
         ",\"webhooksReceived\":" + std::to_string(webhooks_received_) + ",\"connectors\":[]}";
}

std::string LocalSessionHandlers::handle_webhook(const WebhookPayload &payload) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++webhooks_received_;
  }
  const std::size_t listeners = bus_.publish("webhook.received", payload.to_json());
  (void)listeners;
  return "{\"matchedJobs\":0}";
}

} // namespace gatewayd::gateway
