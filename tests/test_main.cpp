#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_config_tests(std::vector<archon::tests::TestCase> &tests);
void register_profiles_tests(std::vector<archon::tests::TestCase> &tests);
void register_token_store_tests(std::vector<archon::tests::TestCase> &tests);
void register_token_manager_tests(std::vector<archon::tests::TestCase> &tests);
void register_claims_tests(std::vector<archon::tests::TestCase> &tests);
void register_require_auth_tests(std::vector<archon::tests::TestCase> &tests);
void register_api_client_tests(std::vector<archon::tests::TestCase> &tests);
void register_observability_tests(std::vector<archon::tests::TestCase> &tests);
void register_cli_tests(std::vector<archon::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<archon::tests::TestCase> tests;
  register_config_tests(tests);
  register_profiles_tests(tests);
  register_token_store_tests(tests);
  register_token_manager_tests(tests);
  register_claims_tests(tests);
  register_require_auth_tests(tests);
  register_api_client_tests(tests);
  register_observability_tests(tests);
  register_cli_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
