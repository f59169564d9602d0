#pragma once

#include "gatewayd/common/time.hpp"
#include "gatewayd/gateway/protocol.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace gatewayd::gateway {

/// In-process publish/subscribe for broadcast events. Listeners run on the
/// publishing thread, outside the bus lock; a throwing listener is logged and
/// does not stop delivery to the others.
class EventBus {
public:
  using Listener = std::function<void(const GatewayEvent &)>;
  using SubscriptionId = std::uint64_t;

  explicit EventBus(common::Clock clock = common::system_clock());

  [[nodiscard]] SubscriptionId subscribe(Listener listener);
  void unsubscribe(SubscriptionId id);

  /// Stamps `at` and returns the number of listeners invoked.
  std::size_t publish(const std::string &type, const std::string &payload_json = "{}");

private:
  common::Clock clock_;
  std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<SubscriptionId, Listener> listeners_;
};

} // namespace gatewayd::gateway
