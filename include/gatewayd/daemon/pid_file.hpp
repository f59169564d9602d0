#pragma once

#include "gatewayd/common/result.hpp"

#include <filesystem>
#include <optional>

namespace gatewayd::daemon {

/// One-line file holding the daemon's process id.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);

  /// nullopt when the file is missing, empty or does not hold a positive pid.
  [[nodiscard]] std::optional<int> read() const;
  [[nodiscard]] common::Status write(int pid) const;
  [[nodiscard]] common::Status clear() const;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  /// Signal-0 liveness check. A process owned by another user (EPERM) counts as alive.
  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
};

} // namespace gatewayd::daemon
