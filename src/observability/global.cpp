#include "gatewayd/observability/global.hpp"

#include <mutex>

namespace gatewayd::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_connection(const std::string &connection_id, const std::string &transport,
                       const bool opened) {
  record_event(ConnectionEvent{
      .connection_id = connection_id, .transport = transport, .opened = opened});
}

void record_auth(const std::string &method, const bool success,
                 std::optional<std::string> client_id) {
  record_event(AuthEvent{.method = method, .success = success, .client_id = std::move(client_id)});
}

void record_command(const std::string &command, std::chrono::milliseconds duration,
                    const bool success) {
  record_event(CommandEvent{.command = command, .duration = duration, .success = success});
}

void record_webhook(const std::string &name, const std::uint64_t matched_jobs) {
  record_event(WebhookEvent{.name = name, .matched_jobs = matched_jobs});
}

void record_lifecycle(const std::string &component, const std::string &action,
                      const std::string &detail) {
  record_event(LifecycleEvent{.component = component, .action = action, .detail = detail});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace gatewayd::observability
