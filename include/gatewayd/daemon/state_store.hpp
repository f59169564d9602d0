#pragma once

#include "gatewayd/common/result.hpp"
#include "gatewayd/daemon/pid_file.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace gatewayd::daemon {

inline constexpr const char *PID_FILE_NAME = "gateway.pid";
inline constexpr const char *STATE_FILE_NAME = "gateway-state.json";
inline constexpr const char *AUTH_FILE_NAME = "gateway-auth.json";
inline constexpr const char *LOG_FILE_NAME = "gateway.log";

/// Where a running daemon listens. Advisory: liveness is decided by the
/// pid file alone.
struct DaemonRecord {
  int pid = 0;
  std::string started_at;
  std::string host;
  std::uint16_t port = 0;
  std::string version;
};

[[nodiscard]] std::string serialize_daemon_record(const DaemonRecord &record);
[[nodiscard]] common::Result<DaemonRecord> parse_daemon_record(const std::string &json);

struct DaemonStatus {
  bool running = false;
  std::optional<int> pid;
  std::optional<DaemonRecord> record;
};

/// PID file and DaemonRecord under one state directory.
class DaemonStateStore {
public:
  explicit DaemonStateStore(std::filesystem::path state_dir);

  [[nodiscard]] common::Status write(const DaemonRecord &record) const;
  [[nodiscard]] std::optional<DaemonRecord> read() const;
  [[nodiscard]] common::Status write_pid(int pid) const;
  [[nodiscard]] std::optional<int> read_pid() const;
  /// Removes both files. Missing files are fine.
  [[nodiscard]] common::Status clear() const;

  /// Not running when the pid file is absent or its process is gone; the
  /// record is attached either way and never changes the verdict.
  [[nodiscard]] DaemonStatus status() const;

  [[nodiscard]] const std::filesystem::path &state_dir() const { return state_dir_; }
  [[nodiscard]] std::filesystem::path record_path() const;
  [[nodiscard]] std::filesystem::path pid_path() const { return pid_file_.path(); }

private:
  std::filesystem::path state_dir_;
  PidFile pid_file_;
};

} // namespace gatewayd::daemon
