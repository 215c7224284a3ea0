#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "test_harness.h"

int g_failures = 0;
std::string g_current_test;

void register_text_buffer_tests(std::vector<TestCase>& tests);
void register_modal_editor_tests(std::vector<TestCase>& tests);
void register_result_grid_tests(std::vector<TestCase>& tests);
void register_query_tests(std::vector<TestCase>& tests);
void register_postgres_tests(std::vector<TestCase>& tests);
void register_render_tests(std::vector<TestCase>& tests);
void register_export_tests(std::vector<TestCase>& tests);
void register_cli_utils_tests(std::vector<TestCase>& tests);
void register_config_tests(std::vector<TestCase>& tests);
void register_key_decoder_tests(std::vector<TestCase>& tests);
void register_workspace_tests(std::vector<TestCase>& tests);

namespace {

std::vector<TestCase> all_tests() {
  std::vector<TestCase> tests;
  register_text_buffer_tests(tests);
  register_modal_editor_tests(tests);
  register_result_grid_tests(tests);
  register_query_tests(tests);
  register_postgres_tests(tests);
  register_render_tests(tests);
  register_export_tests(tests);
  register_cli_utils_tests(tests);
  register_config_tests(tests);
  register_key_decoder_tests(tests);
  register_workspace_tests(tests);
  return tests;
}

int run_test(const TestCase& test) {
  g_current_test = test.name;
  g_failures = 0;
  try {
    test.fn();
  } catch (const std::exception& ex) {
    std::cerr << "FAIL [" << g_current_test << "]: unexpected exception: " << ex.what() << std::endl;
    ++g_failures;
  }
  return g_failures;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = all_tests();
  if (argc > 1) {
    std::string target = argv[1];
    for (const auto& test : tests) {
      if (target == test.name) {
        int failures = run_test(test);
        return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
      }
    }
    std::cerr << "Unknown test: " << target << std::endl;
    std::cerr << "Available tests:" << std::endl;
    for (const auto& test : tests) {
      std::cerr << "  " << test.name << std::endl;
    }
    return EXIT_FAILURE;
  }

  int total_failures = 0;
  for (const auto& test : tests) {
    int failures = run_test(test);
    if (failures > 0) {
      std::cerr << "FAILED: " << test.name << " (" << failures << ")" << std::endl;
      total_failures += failures;
    }
  }

  if (total_failures > 0) {
    std::cerr << total_failures << " test(s) failed." << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << "All tests passed." << std::endl;
  return EXIT_SUCCESS;
}
