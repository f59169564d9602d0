#include "gatewayd/cli/commands.hpp"

int main(int argc, char **argv) { return gatewayd::cli::run_cli(argc, argv); }
