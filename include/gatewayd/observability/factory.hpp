#pragma once

#include "gatewayd/config/schema.hpp"
#include "gatewayd/observability/log_observer.hpp"

#include <memory>

namespace gatewayd::observability {

/// Backend "none"/"noop" discards everything; any other name gets a
/// LogObserver at `level`.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend,
                                                         LogLevel level = LogLevel::Info);
/// Unparseable `observability.log_level` values fall back to info.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace gatewayd::observability
