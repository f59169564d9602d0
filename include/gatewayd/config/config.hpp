#pragma once

#include "gatewayd/common/result.hpp"
#include "gatewayd/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace gatewayd::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
/// `<config_dir>/gateway`, home of the pid, state, credential and log files.
[[nodiscard]] common::Result<std::filesystem::path> state_dir();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace gatewayd::config
