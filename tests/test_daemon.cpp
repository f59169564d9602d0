#include "test_framework.hpp"

#include "gatewayd/daemon/daemon.hpp"
#include "gatewayd/daemon/pid_file.hpp"
#include "gatewayd/daemon/process.hpp"
#include "gatewayd/daemon/state_store.hpp"
#include "gatewayd/health/health.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <csignal>
#include <functional>
#include <set>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

namespace d = gatewayd::daemon;
namespace c = gatewayd::common;
namespace gw = gatewayd::gateway;
namespace sec = gatewayd::security;
using gatewayd::testing::TempDir;
using gatewayd::tests::require;

/// Scripted process table. `on_signal` runs for every signal sent.
class FakeProcessControl final : public d::IProcessControl {
public:
  std::vector<int> holders;
  std::set<int> alive;
  std::vector<std::pair<int, int>> signals;
  std::vector<std::chrono::milliseconds> sleeps;
  std::function<void(int pid, int signo)> on_signal;

  std::vector<int> find_port_holders(std::uint16_t) override { return holders; }

  c::Status signal(const int pid, const int signo) override {
    signals.emplace_back(pid, signo);
    if (on_signal) {
      on_signal(pid, signo);
    }
    return c::Status::success();
  }

  bool is_running(const int pid) override { return alive.contains(pid); }

  void sleep_for(const std::chrono::milliseconds duration) override {
    sleeps.push_back(duration);
    std::this_thread::sleep_for(std::min(duration, std::chrono::milliseconds(5)));
  }
};

/// A plain listening socket standing in for a stale gateway on some port.
struct PortBlocker {
  int fd = -1;
  std::uint16_t port = 0;

  PortBlocker() {
    fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    require(bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0, "bind blocker");
    require(listen(fd, 4) == 0, "listen blocker");
    socklen_t len = sizeof(addr);
    require(getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0, "getsockname");
    port = ntohs(addr.sin_port);
  }

  ~PortBlocker() { release(); }

  void release() {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
};

struct DaemonHarness {
  TempDir dir;
  d::DaemonStateStore store;
  sec::CredentialManager credentials;
  gw::EventBus bus;
  gw::LocalSessionHandlers handlers;
  FakeProcessControl process;

  DaemonHarness()
      : store(dir.path()),
        credentials(sec::CredentialOptions{.auth_file = dir.path() / d::AUTH_FILE_NAME}),
        handlers(bus) {}

  d::DaemonOptions options(const std::uint16_t port) const {
    return d::DaemonOptions{
        .host = "127.0.0.1",
        .port = port,
        .version = "1.2.3",
        .recovery_grace = std::chrono::milliseconds(20),
    };
  }
};

/// Forks a child that blocks in pause(). With `ignore_term` the child
/// survives SIGTERM; the parent waits until that disposition is in place.
pid_t fork_sleeper(const bool ignore_term) {
  int ready[2];
  require(pipe(ready) == 0, "pipe");
  const pid_t pid = fork();
  require(pid >= 0, "fork");
  if (pid == 0) {
    close(ready[0]);
    if (ignore_term) {
      std::signal(SIGTERM, SIG_IGN);
    }
    const char byte = 1;
    (void)!write(ready[1], &byte, 1);
    close(ready[1]);
    while (true) {
      pause();
    }
  }
  close(ready[1]);
  char byte = 0;
  (void)!read(ready[0], &byte, 1);
  close(ready[0]);
  return pid;
}

void reap(const pid_t pid) {
  int status = 0;
  (void)waitpid(pid, &status, WNOHANG);
}

} // namespace

void register_daemon_tests(std::vector<gatewayd::tests::TestCase> &tests) {
  tests.push_back({"pid_file_round_trip_and_garbage", [] {
                     TempDir dir;
                     d::PidFile pid_file(dir.path() / "gateway.pid");
                     require(!pid_file.read().has_value(), "missing file");
                     require(pid_file.write(4321).ok(), "write");
                     require(pid_file.read().value_or(0) == 4321, "read back");
                     require(dir.read_file("gateway.pid") == "4321\n", "one line on disk");
                     require(!pid_file.write(0).ok(), "zero pid rejected");

                     dir.create_file("gateway.pid", "not-a-pid\n");
                     require(!pid_file.read().has_value(), "garbage ignored");
                     dir.create_file("gateway.pid", "-7");
                     require(!pid_file.read().has_value(), "negative ignored");

                     require(pid_file.clear().ok(), "clear");
                     require(!std::filesystem::exists(pid_file.path()), "file removed");
                     require(pid_file.clear().ok(), "clearing twice is fine");
                     require(d::PidFile::is_process_running(static_cast<int>(getpid())),
                             "self is alive");
                     require(!d::PidFile::is_process_running(0), "pid 0 is never running");
                   }});

  tests.push_back({"daemon_record_serialization", [] {
                     const d::DaemonRecord record{.pid = 99,
                                                  .started_at = "2026-01-01T00:00:00.000Z",
                                                  .host = "127.0.0.1",
                                                  .port = 7788,
                                                  .version = "1.0.0"};
                     const auto parsed = d::parse_daemon_record(d::serialize_daemon_record(record));
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().pid == 99 && parsed.value().port == 7788, "numbers");
                     require(parsed.value().host == "127.0.0.1", "host");
                     require(parsed.value().started_at == record.started_at, "started at");

                     require(!d::parse_daemon_record(R"({"host":"x","port":1})").ok(),
                             "pid required");
                     require(!d::parse_daemon_record(R"({"pid":5,"port":"x"})").ok(),
                             "port must be numeric");
                     require(!d::parse_daemon_record("garbage").ok(), "not json");
                   }});

  tests.push_back({"state_store_status_follows_pid_file", [] {
                     TempDir dir;
                     const d::DaemonStateStore store(dir.path());
                     auto status = store.status();
                     require(!status.running && !status.pid && !status.record, "empty dir");

                     const int self = static_cast<int>(getpid());
                     require(store.write_pid(self).ok(), "write pid");
                     require(store.write({.pid = self, .host = "127.0.0.1", .port = 7788}).ok(),
                             "write record");
                     status = store.status();
                     require(status.running, "live pid means running");
                     require(status.record.has_value() && status.record->port == 7788, "record");

                     require(store.clear().ok(), "clear");
                     require(!std::filesystem::exists(store.pid_path()), "pid removed");
                     require(!std::filesystem::exists(store.record_path()), "record removed");
                   }});

  tests.push_back({"state_store_record_without_pid_is_not_running", [] {
                     TempDir dir;
                     const d::DaemonStateStore store(dir.path());
                     require(store.write({.pid = static_cast<int>(getpid()), .port = 7788}).ok(),
                             "write record");
                     const auto status = store.status();
                     require(!status.running, "record alone does not mean running");
                     require(status.record.has_value(), "record still reported");
                   }});

  tests.push_back({"state_store_stale_pid_is_not_running", [] {
                     const pid_t child = fork();
                     require(child >= 0, "fork");
                     if (child == 0) {
                       _exit(0);
                     }
                     int wstatus = 0;
                     require(waitpid(child, &wstatus, 0) == child, "reap child");

                     TempDir dir;
                     const d::DaemonStateStore store(dir.path());
                     require(store.write_pid(static_cast<int>(child)).ok(), "write stale pid");
                     require(store.write({.pid = static_cast<int>(child), .port = 7788}).ok(),
                             "write record");
                     const auto status = store.status();
                     require(!status.running, "dead pid is not running");
                     require(status.pid.value_or(0) == child, "pid still reported");
                     require(status.record.has_value(), "record still reported");
                   }});

  tests.push_back({"parse_pid_list_dedupes_and_excludes", [] {
                     const auto pids = d::parse_pid_list("123\n456 123\nabc -5 0 789\n", 456);
                     require(pids == std::vector<int>({123, 789}), "filtered pid list");
                     require(d::parse_pid_list("", 1).empty(), "empty output");
                   }});

  tests.push_back({"daemon_start_writes_state_and_stop_clears", [] {
                     DaemonHarness harness;
                     d::Daemon daemon(harness.store, harness.credentials, harness.bus,
                                      harness.handlers.bind(), harness.process);
                     PortBlocker reserved;
                     const auto port = reserved.port;
                     reserved.release();

                     const auto started = daemon.start(harness.options(port));
                     require(started.ok(), started.error());
                     require(daemon.is_running() && daemon.port() == port, "listening");
                     require(harness.process.signals.empty(), "no recovery needed");

                     const auto status = harness.store.status();
                     require(status.running, "status running");
                     require(status.pid.value_or(0) == static_cast<int>(getpid()), "own pid");
                     require(status.record.has_value() && status.record->port == port &&
                                 status.record->version == "1.2.3",
                             "record written");

                     require(!daemon.start(harness.options(port)).ok(), "double start rejected");

                     daemon.stop();
                     require(!daemon.is_running(), "stopped");
                     require(!harness.store.status().pid.has_value(), "pid cleared");
                     require(!harness.store.read().has_value(), "record cleared");
                   }});

  tests.push_back({"daemon_stop_keeps_state_written_by_successor", [] {
                     DaemonHarness harness;
                     d::Daemon daemon(harness.store, harness.credentials, harness.bus,
                                      harness.handlers.bind(), harness.process);
                     PortBlocker reserved;
                     const auto port = reserved.port;
                     reserved.release();
                     require(daemon.start(harness.options(port)).ok(), "start");

                     const d::DaemonRecord successor{.pid = 4242,
                                                     .started_at = "2026-01-01T00:00:00.000Z",
                                                     .host = "127.0.0.1",
                                                     .port = port,
                                                     .version = "2.0.0"};
                     require(harness.store.write_pid(successor.pid).ok(), "successor pid");
                     require(harness.store.write(successor).ok(), "successor record");

                     daemon.stop();
                     require(!daemon.is_running(), "stopped");
                     require(harness.store.read_pid().value_or(0) == 4242, "pid file kept");
                     const auto record = harness.store.read();
                     require(record.has_value() && record->version == "2.0.0", "record kept");
                   }});

  tests.push_back({"daemon_recovers_port_held_by_stale_process", [] {
                     gatewayd::health::clear();
                     DaemonHarness harness;
                     PortBlocker blocker;
                     harness.process.holders = {4242};
                     harness.process.on_signal = [&blocker](int, int signo) {
                       if (signo == SIGTERM) {
                         blocker.release();
                       }
                     };

                     d::Daemon daemon(harness.store, harness.credentials, harness.bus,
                                      harness.handlers.bind(), harness.process);
                     const auto started = daemon.start(harness.options(blocker.port));
                     require(started.ok(), started.error());
                     require(daemon.recovery_attempts() == 1, "one recovery attempt");
                     require(harness.process.signals.size() == 1 &&
                                 harness.process.signals[0] == std::make_pair(4242, SIGTERM),
                             "holder got SIGTERM");
                     require(!harness.process.sleeps.empty() &&
                                 harness.process.sleeps.front() == std::chrono::milliseconds(20),
                             "grace period observed");
                     const auto component = gatewayd::health::get_component("gateway");
                     require(component.has_value() && component->restart_count == 1,
                             "restart counted");
                     require(harness.store.status().running, "state written after recovery");
                     daemon.stop();
                   }});

  tests.push_back({"daemon_port_conflict_without_holders_fails", [] {
                     DaemonHarness harness;
                     PortBlocker blocker;
                     d::Daemon daemon(harness.store, harness.credentials, harness.bus,
                                      harness.handlers.bind(), harness.process);
                     const auto started = daemon.start(harness.options(blocker.port));
                     require(!started.ok(), "start fails");
                     require(started.code() == c::ErrorCode::PortConflict, "port conflict");
                     require(started.error().find("no process holding the port") !=
                                 std::string::npos,
                             started.error());
                     require(daemon.recovery_attempts() == 0, "nothing to recover");
                     require(!harness.store.read_pid().has_value(), "no pid written");
                     require(!harness.store.read().has_value(), "no record written");
                   }});

  tests.push_back({"daemon_retries_bind_only_once", [] {
                     DaemonHarness harness;
                     PortBlocker blocker;
                     harness.process.holders = {4242};
                     d::Daemon daemon(harness.store, harness.credentials, harness.bus,
                                      harness.handlers.bind(), harness.process);
                     const auto started = daemon.start(harness.options(blocker.port));
                     require(!started.ok() && started.code() == c::ErrorCode::PortConflict,
                             "second conflict is fatal");
                     require(daemon.recovery_attempts() == 1, "exactly one retry");
                     require(!daemon.is_running(), "not half started");
                     require(!harness.store.read_pid().has_value(), "no pid written");
                   }});

  tests.push_back({"daemon_request_stop_ends_run_loop", [] {
                     DaemonHarness harness;
                     d::Daemon daemon(harness.store, harness.credentials, harness.bus,
                                      harness.handlers.bind(), harness.process);
                     PortBlocker reserved;
                     const auto port = reserved.port;
                     reserved.release();
                     require(daemon.start(harness.options(port)).ok(), "start");

                     std::thread stopper([&daemon] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(100));
                       daemon.request_stop();
                     });
                     daemon.run_until_signal();
                     stopper.join();
                     daemon.stop();
                     require(!harness.store.status().running, "stopped after the loop");
                   }});

  tests.push_back({"controller_stop_when_nothing_runs", [] {
                     TempDir dir;
                     d::DaemonStateStore store(dir.path());
                     d::SystemProcessControl process;
                     require(store.write({.pid = 1234, .port = 7788}).ok(), "leftover record");
                     d::DaemonController controller(store, process);
                     require(controller.stop() == d::StopOutcome::AlreadyStopped, "already stopped");
                     require(!store.read().has_value(), "leftover record cleared");
                     require(d::stop_outcome_name(d::StopOutcome::AlreadyStopped) ==
                                 "already_stopped",
                             "outcome name");
                   }});

  tests.push_back({"controller_stop_terminates_daemon", [] {
                     TempDir dir;
                     d::DaemonStateStore store(dir.path());
                     d::SystemProcessControl process;
                     const pid_t child = fork_sleeper(false);
                     require(store.write_pid(static_cast<int>(child)).ok(), "pid");
                     require(store.write({.pid = static_cast<int>(child), .port = 7788}).ok(),
                             "record");

                     d::DaemonController controller(store, process);
                     const auto outcome =
                         controller.stop(std::chrono::milliseconds(3000), std::chrono::milliseconds(20));
                     reap(child);
                     require(outcome == d::StopOutcome::Stopped,
                             "graceful stop: " + std::string(d::stop_outcome_name(outcome)));
                     require(!store.status().pid.has_value(), "pid cleared");
                     require(!store.read().has_value(), "record cleared");
                   }});

  tests.push_back({"controller_stop_escalates_to_sigkill", [] {
                     TempDir dir;
                     d::DaemonStateStore store(dir.path());
                     d::SystemProcessControl process;
                     const pid_t child = fork_sleeper(true);
                     require(store.write_pid(static_cast<int>(child)).ok(), "pid");

                     d::DaemonController controller(store, process);
                     const auto outcome =
                         controller.stop(std::chrono::milliseconds(200), std::chrono::milliseconds(20));
                     reap(child);
                     require(outcome == d::StopOutcome::Killed,
                             "forced stop: " + std::string(d::stop_outcome_name(outcome)));
                     require(!process.is_running(static_cast<int>(child)), "child gone");
                     require(!store.status().pid.has_value(), "pid cleared");
                   }});

  tests.push_back({"controller_stop_clears_state_when_kill_fails", [] {
                     TempDir dir;
                     d::DaemonStateStore store(dir.path());
                     FakeProcessControl process;
                     process.alive = {777};
                     require(store.write_pid(777).ok(), "pid");
                     d::DaemonController controller(store, process);
                     const auto outcome =
                         controller.stop(std::chrono::milliseconds(20), std::chrono::milliseconds(5));
                     require(outcome == d::StopOutcome::NotResponding, "not responding");
                     require(process.signals.size() == 2 && process.signals[0].second == SIGTERM &&
                                 process.signals[1].second == SIGKILL,
                             "SIGTERM then SIGKILL");
                     require(!store.read_pid().has_value(), "state cleared anyway");
                   }});

  tests.push_back({"controller_wait_for_start_matches_record_pid", [] {
                     TempDir dir;
                     d::DaemonStateStore store(dir.path());
                     FakeProcessControl process;
                     d::DaemonController controller(store, process);

                     auto waited =
                         controller.wait_for_start(std::chrono::milliseconds(30),
                                                   std::chrono::milliseconds(5));
                     require(!waited.ok() && waited.code() == c::ErrorCode::ProcessNotResponding,
                             "times out without state");

                     const int self = static_cast<int>(getpid());
                     require(store.write_pid(self).ok(), "pid");
                     require(store.write({.pid = self + 1, .port = 7788}).ok(), "foreign record");
                     waited = controller.wait_for_start(std::chrono::milliseconds(30),
                                                        std::chrono::milliseconds(5));
                     require(!waited.ok(), "record from another pid is not ready");

                     require(store.write({.pid = self, .port = 7788}).ok(), "own record");
                     waited = controller.wait_for_start(std::chrono::milliseconds(30),
                                                        std::chrono::milliseconds(5));
                     require(waited.ok() && waited.value().port == 7788, "ready");
                   }});
}
