#include "gatewayd/observability/log_observer.hpp"

#include "gatewayd/common/fs.hpp"
#include "gatewayd/common/time.hpp"

#include <iostream>
#include <type_traits>

namespace gatewayd::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

std::string upper_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  }
  return "info";
}

std::optional<LogLevel> parse_log_level(const std::string &text) {
  const std::string normalized = common::to_lower(common::trim(text));
  if (normalized == "debug" || normalized == "trace") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &sink)
    : min_level_(min_level), sink_(sink) {}

void LogObserver::write(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  const std::string line =
      common::now_rfc3339() + " [" + upper_name(level) + "] " + message + "\n";
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ << line;
  if (level >= LogLevel::Warn) {
    sink_.flush();
  }
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_.flush();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ConnectionEvent>) {
          write(LogLevel::Debug, std::string("connection.") + (evt.opened ? "open" : "close") +
                                     " id=" + evt.connection_id + " transport=" + evt.transport);
        } else if constexpr (std::is_same_v<T, AuthEvent>) {
          write(evt.success ? LogLevel::Info : LogLevel::Warn,
                "auth method=" + evt.method + " success=" + bool_text(evt.success) +
                    (evt.client_id.has_value() ? " client=" + *evt.client_id : ""));
        } else if constexpr (std::is_same_v<T, CommandEvent>) {
          write(evt.success ? LogLevel::Debug : LogLevel::Warn,
                "command name=" + evt.command + " success=" + bool_text(evt.success) +
                    " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, WebhookEvent>) {
          write(LogLevel::Info,
                "webhook name=" + evt.name + " matched_jobs=" + std::to_string(evt.matched_jobs));
        } else if constexpr (std::is_same_v<T, LifecycleEvent>) {
          write(LogLevel::Info,
                evt.component + "." + evt.action + (evt.detail.empty() ? "" : " " + evt.detail));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          write(LogLevel::Debug, "metric.request_latency_ms route=" + m.route +
                                     " value=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveConnectionsMetric>) {
          write(LogLevel::Debug, "metric.active_connections=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, BroadcastDeliveryMetric>) {
          write(m.failed > 0 ? LogLevel::Warn : LogLevel::Debug,
                "metric.broadcast event=" + m.event_type +
                    " delivered=" + std::to_string(m.delivered) +
                    " failed=" + std::to_string(m.failed));
        }
      },
      metric);
}

} // namespace gatewayd::observability
