#include "gatewayd/daemon/pid_file.hpp"

#include "gatewayd/common/fs.hpp"

#include <cerrno>
#include <charconv>
#include <string>

#include <signal.h>

namespace gatewayd::daemon {

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<int> PidFile::read() const {
  auto content = common::read_file(path_);
  if (!content.ok()) {
    return std::nullopt;
  }
  const std::string text = common::trim(content.value());
  int pid = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, pid);
  if (ec != std::errc() || ptr != last || pid <= 0) {
    return std::nullopt;
  }
  return pid;
}

common::Status PidFile::write(const int pid) const {
  if (pid <= 0) {
    return common::Status::error(common::ErrorCode::Validation,
                                 "invalid pid " + std::to_string(pid));
  }
  return common::write_file_atomic(path_, std::to_string(pid) + "\n");
}

common::Status PidFile::clear() const { return common::remove_file(path_); }

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  if (kill(pid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

} // namespace gatewayd::daemon
