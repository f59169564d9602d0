#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace gatewayd::observability {

struct ConnectionEvent {
  std::string connection_id;
  std::string transport;
  bool opened = false;
};

struct AuthEvent {
  std::string method;
  bool success = false;
  std::optional<std::string> client_id;
};

struct CommandEvent {
  std::string command;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct WebhookEvent {
  std::string name;
  std::uint64_t matched_jobs = 0;
};

struct LifecycleEvent {
  std::string component;
  std::string action;
  std::string detail;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ConnectionEvent, AuthEvent, CommandEvent, WebhookEvent,
                                   LifecycleEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::string route;
  std::chrono::milliseconds latency{0};
};

struct ActiveConnectionsMetric {
  std::uint64_t count = 0;
};

struct BroadcastDeliveryMetric {
  std::string event_type;
  std::uint64_t delivered = 0;
  std::uint64_t failed = 0;
};

using ObserverMetric =
    std::variant<RequestLatencyMetric, ActiveConnectionsMetric, BroadcastDeliveryMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace gatewayd::observability
