#pragma once

#include <string>
#include <vector>

namespace gatewayd::cli {

[[nodiscard]] std::string version_string();

int run_start(std::vector<std::string> args);
int run_stop();
int run_status();
int run_pair(std::vector<std::string> args);
/// The detached process started by `start`.
int run_daemon(std::vector<std::string> args);
void print_help();

int run_cli(int argc, char **argv);

} // namespace gatewayd::cli
