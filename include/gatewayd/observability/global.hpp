#pragma once

#include "gatewayd/observability/observer.hpp"

#include <memory>

namespace gatewayd::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_connection(const std::string &connection_id, const std::string &transport,
                       bool opened);
void record_auth(const std::string &method, bool success,
                 std::optional<std::string> client_id = std::nullopt);
void record_command(const std::string &command, std::chrono::milliseconds duration,
                    bool success);
void record_webhook(const std::string &name, std::uint64_t matched_jobs);
void record_lifecycle(const std::string &component, const std::string &action,
                      const std::string &detail = "");
void record_error(const std::string &component, const std::string &message);

} // namespace gatewayd::observability
