#include "gatewayd/gateway/event_bus.hpp"

#include "gatewayd/observability/global.hpp"

#include <exception>
#include <vector>

namespace gatewayd::gateway {

EventBus::EventBus(common::Clock clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = common::system_clock();
  }
}

EventBus::SubscriptionId EventBus::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void EventBus::unsubscribe(const SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(id);
}

std::size_t EventBus::publish(const std::string &type, const std::string &payload_json) {
  const GatewayEvent event{
      .type = type, .payload_json = payload_json, .at = common::format_rfc3339(clock_())};

  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners.reserve(listeners_.size());
    for (const auto &[id, listener] : listeners_) {
      (void)id;
      listeners.push_back(listener);
    }
  }

  for (const auto &listener : listeners) {
    try {
      listener(event);
    } catch (const std::exception &e) {
      observability::record_error("event_bus", "listener failed for " + type + ": " + e.what());
    }
  }
  return listeners.size();
}

} // namespace gatewayd::gateway
