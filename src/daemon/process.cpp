#include "gatewayd/daemon/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <string>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

namespace gatewayd::daemon {

namespace {

std::string run_capture(const std::string &command) {
  FILE *pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return "";
  }
  std::string output;
  std::array<char, 512> buffer{};
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
    output += buffer.data();
  }
  (void)pclose(pipe);
  return output;
}

} // namespace

std::vector<int> parse_pid_list(const std::string &output, const int exclude_pid) {
  std::vector<int> pids;
  std::istringstream in(output);
  std::string token;
  while (in >> token) {
    int pid = 0;
    const auto *first = token.data();
    const auto *last = first + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, pid);
    if (ec != std::errc() || ptr != last || pid <= 0 || pid == exclude_pid) {
      continue;
    }
    if (std::find(pids.begin(), pids.end(), pid) == pids.end()) {
      pids.push_back(pid);
    }
  }
  return pids;
}

std::vector<int> SystemProcessControl::find_port_holders(const std::uint16_t port) {
  const int self = static_cast<int>(getpid());
  const std::string port_text = std::to_string(port);

  auto pids =
      parse_pid_list(run_capture("lsof -t -iTCP:" + port_text + " -sTCP:LISTEN 2>/dev/null"), self);
  if (!pids.empty()) {
    return pids;
  }
  return parse_pid_list(run_capture("fuser " + port_text + "/tcp 2>/dev/null"), self);
}

common::Status SystemProcessControl::signal(const int pid, const int signo) {
  if (pid <= 0) {
    return common::Status::error(common::ErrorCode::Validation,
                                 "invalid pid " + std::to_string(pid));
  }
  if (kill(pid, signo) != 0) {
    if (errno == ESRCH) {
      return common::Status::error(common::ErrorCode::NotFound,
                                   "no such process " + std::to_string(pid));
    }
    return common::Status::error(common::ErrorCode::Io, "kill " + std::to_string(pid) + ": " +
                                                            std::strerror(errno));
  }
  return common::Status::success();
}

bool SystemProcessControl::is_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  // Reap our own exited children so they do not linger as zombies.
  int status = 0;
  (void)waitpid(pid, &status, WNOHANG);
  if (kill(pid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

void SystemProcessControl::sleep_for(const std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

} // namespace gatewayd::daemon
