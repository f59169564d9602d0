#include "gatewayd/daemon/daemon.hpp"

#include "gatewayd/common/fs.hpp"
#include "gatewayd/common/time.hpp"
#include "gatewayd/health/health.hpp"
#include "gatewayd/observability/global.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace gatewayd::daemon {

namespace {

constexpr auto kSignalPoll = std::chrono::milliseconds(200);
constexpr auto kKillWait = std::chrono::milliseconds(2000);

std::atomic<bool> g_stop_signal{false};

extern "C" void handle_stop_signal(int) { g_stop_signal.store(true); }

std::string join_pids(const std::vector<int> &pids) {
  std::string out;
  for (const int pid : pids) {
    if (!out.empty()) {
      out += ",";
    }
    out += std::to_string(pid);
  }
  return out;
}

} // namespace

Daemon::Daemon(DaemonStateStore &store, security::CredentialManager &credentials,
               gateway::EventBus &bus, gateway::GatewayHandlers handlers,
               IProcessControl &process, gateway::MethodRegistry *methods,
               gateway::RouteRegistry *routes)
    : store_(store), credentials_(credentials), bus_(bus), handlers_(std::move(handlers)),
      process_(process), methods_(methods), routes_(routes) {}

Daemon::~Daemon() { stop(); }

std::unique_ptr<gateway::GatewayServer> Daemon::make_server(const DaemonOptions &options) {
  return std::make_unique<gateway::GatewayServer>(
      gateway::GatewayServerOptions{
          .host = options.host,
          .port = options.port,
          .version = options.version,
          .auth_token = options.auth_token,
          .max_clients = options.max_clients,
          .broadcast_requires_auth = options.broadcast_requires_auth,
      },
      credentials_, bus_, handlers_, methods_, routes_);
}

common::Status Daemon::recover_port(const DaemonOptions &options,
                                    const common::Status &conflict) {
  const auto holders = process_.find_port_holders(options.port);
  if (holders.empty()) {
    return common::Status::error(common::ErrorCode::PortConflict,
                                 conflict.error() + " (no process holding the port was found)");
  }

  ++recovery_attempts_;
  health::bump_component_restart("gateway");
  observability::record_lifecycle("daemon", "port_recovery",
                                  "terminating " + join_pids(holders) + " on port " +
                                      std::to_string(options.port));
  for (const int pid : holders) {
    const auto signalled = process_.signal(pid, SIGTERM);
    if (!signalled.ok()) {
      observability::record_error("daemon", "could not signal " + std::to_string(pid) + ": " +
                                                signalled.error());
    }
  }
  process_.sleep_for(options.recovery_grace);

  server_ = make_server(options);
  return server_->start();
}

common::Status Daemon::start(const DaemonOptions &options) {
  if (running_) {
    return common::Status::error(common::ErrorCode::Validation, "daemon already running");
  }
  stop_requested_ = false;

  server_ = make_server(options);
  auto started = server_->start();
  if (!started.ok() && started.code() == common::ErrorCode::PortConflict) {
    observability::record_lifecycle("daemon", "port_conflict", started.error());
    started = recover_port(options, started);
  }
  if (!started.ok()) {
    server_.reset();
    observability::record_error("daemon", "start failed: " + started.error());
    return started;
  }

  const int pid = static_cast<int>(getpid());
  const DaemonRecord record{
      .pid = pid,
      .started_at = common::now_rfc3339(),
      .host = options.host,
      .port = server_->port(),
      .version = options.version,
  };
  auto written = store_.write_pid(pid);
  if (written.ok()) {
    written = store_.write(record);
  }
  if (!written.ok()) {
    server_->stop();
    server_.reset();
    (void)store_.clear();
    observability::record_error("daemon", "cannot persist daemon state: " + written.error());
    return written;
  }

  running_ = true;
  observability::record_lifecycle("daemon", "started",
                                  "pid " + std::to_string(pid) + " on " + options.host + ":" +
                                      std::to_string(record.port));
  return common::Status::success();
}

void Daemon::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (server_ != nullptr) {
    server_->stop();
    server_.reset();
  }
  // A successor started by port recovery may already own the state files.
  const int self = static_cast<int>(getpid());
  if (const auto owner = store_.read_pid(); owner.has_value() && *owner != self) {
    observability::record_lifecycle("daemon", "stopped",
                                    "state owned by pid " + std::to_string(*owner) + " left intact");
    return;
  }
  const auto cleared = store_.clear();
  if (!cleared.ok()) {
    observability::record_error("daemon", "cannot clear daemon state: " + cleared.error());
  }
  observability::record_lifecycle("daemon", "stopped");
}

bool Daemon::is_running() const { return running_.load(); }

std::uint16_t Daemon::port() const { return server_ != nullptr ? server_->port() : 0; }

void Daemon::request_stop() { stop_requested_ = true; }

void Daemon::run_until_signal() {
  g_stop_signal = false;
  auto previous_term = std::signal(SIGTERM, handle_stop_signal);
  auto previous_int = std::signal(SIGINT, handle_stop_signal);

  while (running_ && !stop_requested_ && !g_stop_signal) {
    std::this_thread::sleep_for(kSignalPoll);
  }
  if (g_stop_signal) {
    observability::record_lifecycle("daemon", "signal", "stop signal received");
  }

  (void)std::signal(SIGTERM, previous_term);
  (void)std::signal(SIGINT, previous_int);
}

std::string_view stop_outcome_name(const StopOutcome outcome) {
  switch (outcome) {
  case StopOutcome::AlreadyStopped:
    return "already_stopped";
  case StopOutcome::Stopped:
    return "stopped";
  case StopOutcome::Killed:
    return "killed";
  case StopOutcome::NotResponding:
    return "not_responding";
  }
  return "unknown";
}

DaemonController::DaemonController(DaemonStateStore &store, IProcessControl &process)
    : store_(store), process_(process) {}

DaemonStatus DaemonController::status() const { return store_.status(); }

bool DaemonController::wait_for_exit(const int pid, const std::chrono::milliseconds timeout,
                                     const std::chrono::milliseconds poll) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (process_.is_running(pid)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    process_.sleep_for(poll);
  }
  return true;
}

StopOutcome DaemonController::stop(const std::chrono::milliseconds timeout,
                                   const std::chrono::milliseconds poll) {
  StopOutcome outcome = StopOutcome::AlreadyStopped;
  const auto pid = store_.read_pid();

  if (pid.has_value() && process_.is_running(*pid)) {
    const auto signalled = process_.signal(*pid, SIGTERM);
    if (!signalled.ok() && signalled.code() != common::ErrorCode::NotFound) {
      observability::record_error("daemon", "SIGTERM failed: " + signalled.error());
    }

    if (wait_for_exit(*pid, timeout, poll)) {
      outcome = StopOutcome::Stopped;
    } else {
      observability::record_lifecycle("daemon", "escalate",
                                      "pid " + std::to_string(*pid) + " ignored SIGTERM");
      const auto killed = process_.signal(*pid, SIGKILL);
      if (!killed.ok() && killed.code() != common::ErrorCode::NotFound) {
        observability::record_error("daemon", "SIGKILL failed: " + killed.error());
      }
      outcome = wait_for_exit(*pid, kKillWait, poll) ? StopOutcome::Killed
                                                      : StopOutcome::NotResponding;
    }
  }

  const auto cleared = store_.clear();
  if (!cleared.ok()) {
    observability::record_error("daemon", "cannot clear daemon state: " + cleared.error());
  }
  return outcome;
}

common::Result<int> DaemonController::spawn(const SpawnRequest &request) {
  std::vector<std::string> args;
  args.push_back(request.executable.string());
  if (request.config_path.has_value()) {
    args.push_back("--config");
    args.push_back(request.config_path->string());
  }
  args.push_back("daemon");
  args.push_back("--host");
  args.push_back(request.host);
  args.push_back("--port");
  args.push_back(std::to_string(request.port));

  if (request.log_file.has_parent_path()) {
    auto dir = common::ensure_dir(request.log_file.parent_path());
    if (!dir.ok()) {
      return common::Result<int>::failure(dir.status());
    }
  }

  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<int>::failure(common::ErrorCode::Io,
                                        std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    (void)setsid();
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      (void)dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    const int log_fd = open(request.log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
    if (log_fd >= 0) {
      (void)dup2(log_fd, STDOUT_FILENO);
      (void)dup2(log_fd, STDERR_FILENO);
      close(log_fd);
    }

    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    execv(request.executable.c_str(), argv.data());
    _exit(127);
  }

  observability::record_lifecycle("daemon", "spawned", "pid " + std::to_string(pid));
  return common::Result<int>::success(static_cast<int>(pid));
}

common::Result<DaemonRecord> DaemonController::wait_for_start(
    const std::chrono::milliseconds timeout, const std::chrono::milliseconds poll) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto current = store_.status();
    if (current.running && current.record.has_value() && current.pid.has_value() &&
        current.record->pid == *current.pid) {
      return common::Result<DaemonRecord>::success(*current.record);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return common::Result<DaemonRecord>::failure(
          common::ErrorCode::ProcessNotResponding,
          "gateway daemon did not report ready within " + std::to_string(timeout.count()) +
              "ms");
    }
    process_.sleep_for(poll);
  }
}

} // namespace gatewayd::daemon
