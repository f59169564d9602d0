#pragma once

#include "gatewayd/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace gatewayd::daemon {

/// OS process operations used by start/stop supervision. Tests substitute a
/// scripted implementation.
class IProcessControl {
public:
  virtual ~IProcessControl() = default;

  /// Pids listening on `port`, never including the calling process.
  [[nodiscard]] virtual std::vector<int> find_port_holders(std::uint16_t port) = 0;
  [[nodiscard]] virtual common::Status signal(int pid, int signo) = 0;
  [[nodiscard]] virtual bool is_running(int pid) = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

/// Real processes: `lsof`, falling back to `fuser`, for port lookups.
class SystemProcessControl final : public IProcessControl {
public:
  [[nodiscard]] std::vector<int> find_port_holders(std::uint16_t port) override;
  [[nodiscard]] common::Status signal(int pid, int signo) override;
  [[nodiscard]] bool is_running(int pid) override;
  void sleep_for(std::chrono::milliseconds duration) override;
};

/// Whitespace-separated pids from a command's output. Anything that is not
/// a positive integer is skipped, as is `exclude_pid`.
[[nodiscard]] std::vector<int> parse_pid_list(const std::string &output, int exclude_pid);

} // namespace gatewayd::daemon
