#pragma once

#include "gatewayd/common/result.hpp"
#include "gatewayd/daemon/process.hpp"
#include "gatewayd/daemon/state_store.hpp"
#include "gatewayd/gateway/event_bus.hpp"
#include "gatewayd/gateway/handlers.hpp"
#include "gatewayd/gateway/registry.hpp"
#include "gatewayd/gateway/server.hpp"
#include "gatewayd/security/credentials.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gatewayd::daemon {

inline constexpr auto DEFAULT_PORT_RECOVERY_GRACE = std::chrono::milliseconds(750);
inline constexpr auto DEFAULT_STOP_TIMEOUT = std::chrono::milliseconds(6000);
inline constexpr auto DEFAULT_STOP_POLL = std::chrono::milliseconds(120);
inline constexpr auto DEFAULT_START_TIMEOUT = std::chrono::milliseconds(8000);
inline constexpr auto DEFAULT_START_POLL = std::chrono::milliseconds(140);

struct DaemonOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 7788;
  std::string version;
  std::string auth_token;
  std::size_t max_clients = 256;
  bool broadcast_requires_auth = false;
  /// Wait between signalling the old port holders and retrying the bind.
  std::chrono::milliseconds recovery_grace = DEFAULT_PORT_RECOVERY_GRACE;
};

/// The long-running side: owns the gateway server and the pid/state files.
class Daemon {
public:
  Daemon(DaemonStateStore &store, security::CredentialManager &credentials,
         gateway::EventBus &bus, gateway::GatewayHandlers handlers, IProcessControl &process,
         gateway::MethodRegistry *methods = nullptr, gateway::RouteRegistry *routes = nullptr);
  ~Daemon();

  /// Binds (terminating a conflicting listener once if needed), then writes
  /// the pid file and DaemonRecord. Nothing is written unless the bind
  /// succeeded.
  [[nodiscard]] common::Status start(const DaemonOptions &options);
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] std::size_t recovery_attempts() const { return recovery_attempts_; }

  /// Blocks until SIGTERM or SIGINT arrives, or request_stop() is called.
  void run_until_signal();
  void request_stop();

private:
  [[nodiscard]] std::unique_ptr<gateway::GatewayServer> make_server(const DaemonOptions &options);
  [[nodiscard]] common::Status recover_port(const DaemonOptions &options,
                                            const common::Status &conflict);

  DaemonStateStore &store_;
  security::CredentialManager &credentials_;
  gateway::EventBus &bus_;
  gateway::GatewayHandlers handlers_;
  IProcessControl &process_;
  gateway::MethodRegistry *methods_;
  gateway::RouteRegistry *routes_;

  std::unique_ptr<gateway::GatewayServer> server_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::size_t recovery_attempts_ = 0;
};

enum class StopOutcome {
  AlreadyStopped,
  Stopped,
  Killed,
  NotResponding,
};

[[nodiscard]] std::string_view stop_outcome_name(StopOutcome outcome);

struct SpawnRequest {
  std::filesystem::path executable = "/proc/self/exe";
  std::optional<std::filesystem::path> config_path;
  std::string host;
  std::uint16_t port = 0;
  std::filesystem::path log_file;
};

/// The CLI side: inspects and controls a daemon through its state files.
class DaemonController {
public:
  DaemonController(DaemonStateStore &store, IProcessControl &process);

  [[nodiscard]] DaemonStatus status() const;

  /// SIGTERM, poll until the process exits, SIGKILL at the deadline. State
  /// files are cleared on every path.
  [[nodiscard]] StopOutcome stop(std::chrono::milliseconds timeout = DEFAULT_STOP_TIMEOUT,
                                 std::chrono::milliseconds poll = DEFAULT_STOP_POLL);

  /// Forks a detached `daemon` process and returns its pid.
  [[nodiscard]] common::Result<int> spawn(const SpawnRequest &request);

  /// Polls status until a live record exists; ProcessNotResponding on timeout.
  [[nodiscard]] common::Result<DaemonRecord>
  wait_for_start(std::chrono::milliseconds timeout = DEFAULT_START_TIMEOUT,
                 std::chrono::milliseconds poll = DEFAULT_START_POLL);

private:
  [[nodiscard]] bool wait_for_exit(int pid, std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds poll);

  DaemonStateStore &store_;
  IProcessControl &process_;
};

} // namespace gatewayd::daemon
