#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace sqlterm::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// MUST keep defaults consistent with CLI behavior; unset optionals defer to the config file.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string query;
  std::string query_file;
  std::optional<std::string> db_path;
  std::optional<std::string> backend;
  std::string init_file;
  std::string config_path;
  bool color = true;
  std::string output_mode = "duckbox";
  std::optional<bool> highlight;
  std::optional<size_t> page_size;
  std::optional<size_t> timeout_ms;
  bool show_help = false;
};

/// Prints the full help text for --help.
/// MUST remain accurate to supported flags and MUST not throw on stream failures.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on unknown flags, missing values and invalid numbers.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace sqlterm::cli
