#include "gatewayd/config/config.hpp"

#include "gatewayd/common/fs.hpp"
#include "gatewayd/common/toml.hpp"
#include "gatewayd/observability/log_observer.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <regex>

namespace gatewayd::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".gatewayd";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *STATE_FOLDER = "gateway";
constexpr std::uint32_t MIN_PAIRING_TTL_SECONDS = 30;
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("GATEWAYD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }

  static const std::regex host_re(
      R"(^(([a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)*[a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?|((25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9])\.){3}(25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9])|::1|\[::1\])$)");
  return std::regex_match(host, host_re);
}

bool is_loopback_host(const std::string &host) {
  return host == "127.0.0.1" || host == "localhost" || host == "::1" || host == "[::1]";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Io, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  if (const char *home_override = non_empty_env("GATEWAYD_HOME"); home_override != nullptr) {
    return common::ensure_dir(common::expand_path(home_override));
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

common::Result<std::filesystem::path> state_dir() {
  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::ensure_dir(cfg_dir.value() / STATE_FOLDER);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *host = non_empty_env("GATEWAYD_HOST"); host != nullptr) {
    config.gateway.host = host;
  }

  if (const char *port = non_empty_env("GATEWAYD_PORT"); port != nullptr) {
    const std::string raw = common::trim(port);
    unsigned int parsed = 0;
    const auto *first = raw.data();
    const auto *last = first + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc() && ptr == last && parsed <= 65535) {
      config.gateway.port = static_cast<std::uint16_t>(parsed);
    }
  }

  if (const char *token = non_empty_env("GATEWAYD_AUTH_TOKEN"); token != nullptr) {
    config.gateway.auth_token = token;
  }

  if (const char *level = non_empty_env("GATEWAYD_LOG_LEVEL"); level != nullptr) {
    config.observability.log_level = level;
  }
}

namespace {

/// Integer key checked against [min, max]; the error names the line.
common::Result<std::optional<std::uint64_t>> bounded(const common::TomlDocument &doc,
                                                     const std::string &key,
                                                     const std::int64_t min,
                                                     const std::int64_t max) {
  using BoundedResult = common::Result<std::optional<std::uint64_t>>;
  const auto value = doc.get_integer(key);
  if (!value.ok()) {
    return BoundedResult::failure(value.status());
  }
  if (!value.value().has_value()) {
    return BoundedResult::success(std::nullopt);
  }
  const std::int64_t raw = *value.value();
  if (raw < min || raw > max) {
    return BoundedResult::failure(common::ErrorCode::Validation,
                                  key + " must be " + std::to_string(min) + "-" +
                                      std::to_string(max) + " (line " +
                                      std::to_string(doc.line_of(key)) + ")");
  }
  return BoundedResult::success(static_cast<std::uint64_t>(raw));
}

} // namespace

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &gateway = config.gateway;
  gateway.host = doc.get_string("gateway.host", gateway.host);
  gateway.allow_public_bind = doc.get_bool("gateway.allow_public_bind", gateway.allow_public_bind);
  gateway.auth_token = common::expand_path(doc.get_string("gateway.auth_token", gateway.auth_token));
  gateway.broadcast_requires_auth =
      doc.get_bool("gateway.broadcast_requires_auth", gateway.broadcast_requires_auth);

  const auto port = bounded(doc, "gateway.port", 0, 65535);
  if (!port.ok()) {
    return common::Result<Config>::failure(port.status());
  }
  gateway.port = static_cast<std::uint16_t>(port.value().value_or(gateway.port));

  const auto ttl = bounded(doc, "gateway.pairing_ttl_seconds", 0, 7 * 24 * 3600);
  if (!ttl.ok()) {
    return common::Result<Config>::failure(ttl.status());
  }
  gateway.pairing_ttl_seconds =
      static_cast<std::uint32_t>(ttl.value().value_or(gateway.pairing_ttl_seconds));

  const auto max_clients = bounded(doc, "gateway.max_clients", 0, 65535);
  if (!max_clients.ok()) {
    return common::Result<Config>::failure(max_clients.status());
  }
  gateway.max_clients =
      static_cast<std::uint32_t>(max_clients.value().value_or(gateway.max_clients));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto content = common::read_file(cfg_path_result.value());
  if (!content.ok() && content.code() != common::ErrorCode::NotFound) {
    return common::Result<Config>::failure(content.status());
  }

  auto parsed = content.ok() ? parse_config(content.value())
                             : common::Result<Config>::success(Config{});
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.code(), cfg_path_result.value().string() +
                                                              ": " + parsed.error());
  }

  apply_env_overrides(parsed.value());
  return parsed;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!is_valid_host(config.gateway.host)) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Validation, "gateway.host is invalid: " + config.gateway.host);
  }
  if (!is_loopback_host(config.gateway.host) && !config.gateway.allow_public_bind) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Validation,
        "gateway.host " + config.gateway.host +
            " is not loopback; set gateway.allow_public_bind = true to expose it");
  }
  if (config.gateway.port == 0) {
    return common::Result<std::vector<std::string>>::failure(common::ErrorCode::Validation,
                                                              "gateway.port must be 1-65535");
  }
  if (config.gateway.max_clients == 0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Validation, "gateway.max_clients must be at least 1");
  }
  if (config.gateway.pairing_ttl_seconds < MIN_PAIRING_TTL_SECONDS) {
    warnings.push_back("gateway.pairing_ttl_seconds below " +
                       std::to_string(MIN_PAIRING_TTL_SECONDS) + " is raised to the minimum");
  }
  if (config.gateway.auth_token == "change-me") {
    warnings.push_back("gateway.auth_token is still the placeholder value");
  }

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none" && backend != "noop") {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Validation,
        "Invalid observability.backend: " + config.observability.backend);
  }
  if (!observability::parse_log_level(config.observability.log_level).has_value()) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Validation,
        "Invalid observability.log_level: " + config.observability.log_level);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace gatewayd::config
