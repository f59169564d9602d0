#include "gatewayd/observability/factory.hpp"

#include "gatewayd/common/fs.hpp"

namespace gatewayd::observability {

namespace {

class DiscardObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

} // namespace

std::unique_ptr<IObserver> create_observer(const std::string &backend, const LogLevel level) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized == "none" || normalized == "noop") {
    return std::make_unique<DiscardObserver>();
  }
  return std::make_unique<LogObserver>(level);
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto level = parse_log_level(config.observability.log_level).value_or(LogLevel::Info);
  return create_observer(config.observability.backend, level);
}

} // namespace gatewayd::observability
