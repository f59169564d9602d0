#pragma once

#include "gatewayd/observability/observer.hpp"

#include <iosfwd>
#include <mutex>
#include <optional>

namespace gatewayd::observability {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] std::string_view log_level_name(LogLevel level);
/// Case-insensitive; accepts "warning" for Warn.
[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &text);

/// Writes one `<timestamp> [LEVEL] message` line per event at or above
/// `min_level`. The daemon's stderr is redirected to the gateway log file.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(LogLevel min_level, std::ostream &sink);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void write(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream &sink_;
  std::mutex mutex_;
};

} // namespace gatewayd::observability
