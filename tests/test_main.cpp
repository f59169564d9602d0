#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<gatewayd::tests::TestCase> &tests);
void register_config_tests(std::vector<gatewayd::tests::TestCase> &tests);
void register_observability_health_tests(std::vector<gatewayd::tests::TestCase> &tests);
void register_credentials_tests(std::vector<gatewayd::tests::TestCase> &tests);
void register_protocol_tests(std::vector<gatewayd::tests::TestCase> &tests);
void register_gateway_tests(std::vector<gatewayd::tests::TestCase> &tests);
void register_daemon_tests(std::vector<gatewayd::tests::TestCase> &tests);

int main(int argc, char **argv) {
  // Ignore SIGPIPE so writes to closed test sockets fail instead of killing the run
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<gatewayd::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_health_tests(tests);
  register_credentials_tests(tests);
  register_protocol_tests(tests);
  register_gateway_tests(tests);
  register_daemon_tests(tests);

  const std::string filter = argc > 1 ? argv[1] : "";

  std::size_t ran = 0;
  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    if (!filter.empty() && test.name.find(filter) == std::string::npos) {
      continue;
    }
    ++ran;
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << ran << " tests: " << passed << " passed, " << failed << " failed\n";

  return failed == 0 ? 0 : 1;
}
