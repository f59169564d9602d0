#include "gatewayd/cli/commands.hpp"

#include "gatewayd/common/fs.hpp"
#include "gatewayd/config/config.hpp"
#include "gatewayd/daemon/daemon.hpp"
#include "gatewayd/daemon/process.hpp"
#include "gatewayd/daemon/state_store.hpp"
#include "gatewayd/gateway/event_bus.hpp"
#include "gatewayd/gateway/handlers.hpp"
#include "gatewayd/health/health.hpp"
#include "gatewayd/observability/factory.hpp"
#include "gatewayd/observability/global.hpp"
#include "gatewayd/security/credentials.hpp"

#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace gatewayd::cli {

namespace {

constexpr const char *kBootstrapLabel = "bootstrap-client";

std::optional<std::filesystem::path> g_config_override;

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      g_config_override = args[i + 1];
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      g_config_override = value;
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

/// Applies --host/--port on top of the configured endpoint.
bool resolve_endpoint(std::vector<std::string> &args, const config::Config &cfg,
                      std::string &host, std::uint16_t &port) {
  host = cfg.gateway.host;
  port = cfg.gateway.port;

  std::string host_arg;
  if (take_option(args, "--host", "", host_arg) && !common::trim(host_arg).empty()) {
    host = common::trim(host_arg);
  }
  std::string port_arg;
  if (take_option(args, "--port", "-p", port_arg)) {
    std::uint16_t parsed = 0;
    const auto *first = port_arg.data();
    const auto *last = first + port_arg.size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc() || ptr != last || parsed == 0) {
      std::cerr << "invalid port: " << port_arg << "\n";
      return false;
    }
    port = parsed;
  }

  config::Config effective = cfg;
  effective.gateway.host = host;
  effective.gateway.port = port;
  if (auto validated = config::validate_config(effective); !validated.ok()) {
    std::cerr << "invalid endpoint: " << validated.error() << "\n";
    return false;
  }
  return true;
}

std::optional<config::Config> load_checked_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return std::nullopt;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    std::cerr << "invalid configuration: " << validated.error() << "\n";
    return std::nullopt;
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return cfg.value();
}

std::optional<std::filesystem::path> gateway_state_dir() {
  auto dir = config::state_dir();
  if (!dir.ok()) {
    std::cerr << dir.error() << "\n";
    return std::nullopt;
  }
  return dir.value();
}

security::CredentialOptions credential_options(const std::filesystem::path &state_dir,
                                               const config::Config &cfg) {
  security::CredentialOptions options;
  options.auth_file = state_dir / daemon::AUTH_FILE_NAME;
  options.default_pairing_ttl = std::chrono::seconds(cfg.gateway.pairing_ttl_seconds);
  return options;
}

std::string endpoint_url(const std::string &host, const std::uint16_t port) {
  return "ws://" + host + ":" + std::to_string(port) + "/ws";
}

void print_record(const daemon::DaemonRecord &record) {
  std::cout << "  Endpoint: " << endpoint_url(record.host, record.port) << "\n";
  std::cout << "  Health:   http://" << record.host << ":" << record.port << "/health\n";
  if (!record.version.empty()) {
    std::cout << "  Version:  " << record.version << "\n";
  }
  if (!record.started_at.empty()) {
    std::cout << "  Started:  " << record.started_at << "\n";
  }
}

} // namespace

std::string version_string() {
#ifdef GATEWAYD_VERSION
  return GATEWAYD_VERSION;
#else
  return "0.1.0";
#endif
}

int run_start(std::vector<std::string> args) {
  const auto cfg = load_checked_config();
  const auto state_dir = gateway_state_dir();
  if (!cfg.has_value() || !state_dir.has_value()) {
    return 1;
  }
  std::string host;
  std::uint16_t port = 0;
  if (!resolve_endpoint(args, *cfg, host, port)) {
    return 1;
  }

  daemon::DaemonStateStore store(*state_dir);
  daemon::SystemProcessControl process;
  daemon::DaemonController controller(store, process);

  const auto current = controller.status();
  if (current.running) {
    std::cout << "Gateway already running (pid " << current.pid.value_or(0) << ")\n";
    if (current.record.has_value()) {
      print_record(*current.record);
    }
    return 0;
  }
  if (current.pid.has_value()) {
    (void)store.clear();
  }

  auto spawned = controller.spawn(daemon::SpawnRequest{
      .executable = "/proc/self/exe",
      .config_path = g_config_override,
      .host = host,
      .port = port,
      .log_file = *state_dir / daemon::LOG_FILE_NAME,
  });
  if (!spawned.ok()) {
    std::cerr << "failed to start gateway: " << spawned.error() << "\n";
    return 1;
  }

  auto ready = controller.wait_for_start();
  if (!ready.ok()) {
    std::cerr << ready.error() << "\n";
    std::cerr << "See " << (*state_dir / daemon::LOG_FILE_NAME).string() << "\n";
    return 1;
  }

  security::CredentialManager credentials(credential_options(*state_dir, *cfg));
  auto code = credentials.create_pairing_code(kBootstrapLabel);

  std::cout << "Gateway started (pid " << ready.value().pid << ")\n";
  print_record(ready.value());
  if (code.ok()) {
    std::cout << "  Pairing code: " << code.value().code << " (expires "
              << code.value().expires_at << ")\n";
  } else {
    std::cerr << "could not create a pairing code: " << code.error() << "\n";
  }
  return 0;
}

int run_stop() {
  const auto state_dir = gateway_state_dir();
  if (!state_dir.has_value()) {
    return 1;
  }
  daemon::DaemonStateStore store(*state_dir);
  daemon::SystemProcessControl process;
  daemon::DaemonController controller(store, process);

  switch (controller.stop()) {
  case daemon::StopOutcome::AlreadyStopped:
    std::cout << "Gateway is not running\n";
    return 0;
  case daemon::StopOutcome::Stopped:
    std::cout << "Gateway stopped\n";
    return 0;
  case daemon::StopOutcome::Killed:
    std::cout << "Gateway did not exit in time and was killed\n";
    return 0;
  case daemon::StopOutcome::NotResponding:
    std::cerr << "Gateway process is not responding; local state was cleared\n";
    return 1;
  }
  return 1;
}

int run_status() {
  const auto cfg = load_checked_config();
  const auto state_dir = gateway_state_dir();
  if (!cfg.has_value() || !state_dir.has_value()) {
    return 1;
  }
  daemon::DaemonStateStore store(*state_dir);
  daemon::SystemProcessControl process;
  daemon::DaemonController controller(store, process);

  const auto status = controller.status();
  if (status.running) {
    std::cout << "Gateway running (pid " << status.pid.value_or(0) << ")\n";
    if (status.record.has_value()) {
      print_record(*status.record);
    }
  } else if (status.pid.has_value()) {
    std::cout << "Gateway not running (stale pid " << *status.pid << ")\n";
  } else {
    std::cout << "Gateway not running\n";
  }

  security::CredentialManager credentials(credential_options(*state_dir, *cfg));
  const auto summary = credentials.summary();
  std::cout << "  Active tokens: " << summary.active_tokens << "\n";
  std::cout << "  Pending pairing codes: " << summary.pending_pairing_codes;
  if (summary.latest_pairing_expiry.has_value()) {
    std::cout << " (latest expires " << *summary.latest_pairing_expiry << ")";
  }
  std::cout << "\n";
  return 0;
}

int run_pair(std::vector<std::string> args) {
  const auto cfg = load_checked_config();
  const auto state_dir = gateway_state_dir();
  if (!cfg.has_value() || !state_dir.has_value()) {
    return 1;
  }
  std::string label;
  (void)take_option(args, "--label", "-l", label);

  security::CredentialManager credentials(credential_options(*state_dir, *cfg));
  auto code = credentials.create_pairing_code(label);
  if (!code.ok()) {
    std::cerr << "failed to create pairing code: " << code.error() << "\n";
    return 1;
  }
  std::cout << "Pairing code: " << code.value().code << "\n";
  std::cout << "  Label:   " << code.value().label << "\n";
  std::cout << "  Expires: " << code.value().expires_at << "\n";
  return 0;
}

int run_daemon(std::vector<std::string> args) {
  const auto cfg = load_checked_config();
  const auto state_dir = gateway_state_dir();
  if (!cfg.has_value() || !state_dir.has_value()) {
    return 1;
  }
  std::string host;
  std::uint16_t port = 0;
  if (!resolve_endpoint(args, *cfg, host, port)) {
    return 1;
  }

  observability::set_global_observer(observability::create_observer(*cfg));

  security::CredentialManager credentials(credential_options(*state_dir, *cfg));
  health::mark_component_starting("credentials");
  const auto loaded = credentials.load();
  if (!loaded.ok()) {
    health::mark_component_error("credentials", loaded.error());
    std::cerr << "failed to load credentials: " << loaded.error() << "\n";
    return 1;
  }
  health::mark_component_ok("credentials");

  gateway::EventBus bus;
  gateway::LocalSessionHandlers handlers(bus);
  daemon::DaemonStateStore store(*state_dir);
  daemon::SystemProcessControl process;
  daemon::Daemon gateway_daemon(store, credentials, bus, handlers.bind(), process);

  const auto started = gateway_daemon.start(daemon::DaemonOptions{
      .host = host,
      .port = port,
      .version = version_string(),
      .auth_token = cfg->gateway.auth_token,
      .max_clients = cfg->gateway.max_clients,
      .broadcast_requires_auth = cfg->gateway.broadcast_requires_auth,
  });
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }
  (void)bus.publish("gateway.started",
                    "{\"port\":" + std::to_string(gateway_daemon.port()) + "}");

  gateway_daemon.run_until_signal();
  gateway_daemon.stop();
  health::mark_component_stopped("credentials");
  observability::set_global_observer(nullptr);
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  gatewayd" << RESET << DIM << " " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "gatewayd [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "start" << RESET << " [--host H] [--port P]" << DIM
            << "  Start the gateway in the background" << RESET << "\n";
  std::cout << "  " << GREEN << "stop" << RESET << DIM << "                          Stop the gateway"
            << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << DIM
            << "                        Show process and credential status" << RESET << "\n";
  std::cout << "  " << GREEN << "pair" << RESET << " [--label L]" << DIM
            << "              Create a one-time pairing code" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "                       Show version"
            << RESET << "\n";
  std::cout << "\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << "gatewayd " << version_string() << "\n";
    return 0;
  }
  if (subcommand == "start") {
    return run_start(std::move(args));
  }
  if (subcommand == "stop") {
    return run_stop();
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "pair") {
    return run_pair(std::move(args));
  }
  if (subcommand == "daemon") {
    return run_daemon(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace gatewayd::cli
