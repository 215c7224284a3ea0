#include "cli_args.h"

#include <string>

#include "util/string_util.h"

namespace sqlterm::cli {

/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags and MUST not throw on stream errors.
void print_help(std::ostream& os) {
  os << "sqlterm - terminal SQL workspace\n\n";
  os << "Usage:\n";
  os << "  sqlterm [--db <path>] [--backend <name>]      Open the interactive workspace\n";
  os << "  sqlterm --query <sql> [--db <path>]          Run one statement and print it\n";
  os << "  sqlterm --query-file <file> [--db <path>]\n\n";
  os << "Options:\n";
  os << "  --db <path>              Database file (default :memory:), or a libpq\n";
  os << "                           connection string for postgres\n";
#ifdef SQLTERM_USE_POSTGRES
  os << "  --backend <name>         sqlite or postgres\n";
#else
  os << "  --backend <name>         sqlite (postgres and mysql are not built in)\n";
#endif
  os << "  --init <file>            Run a SQL script before starting (schema, seed data)\n";
  os << "  --mode duckbox|json|plain  Output format for --query\n";
  os << "  --page-size <n>          Rows per grid page (default 100)\n";
  os << "  --timeout-ms <n>         Wait up to n ms for a lock\n";
  os << "  --highlight on|off       SQL keyword highlighting in the editor\n";
  os << "  --config <path>          Config file (default ~/.config/sqlterm/config.toml)\n";
  os << "  --color=disabled         Disable ANSI colors\n";
  os << "  --help                   Show this help\n\n";
  os << "Workspace keys:\n";
  os << "  F5 / Ctrl-G run query, Tab switch editor/results, Ctrl-Q quit, :help in results\n";
}

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (arg == "--color=disabled") {
      options.color = false;
    } else if (arg == "--query" && has_value) {
      options.query = argv[++i];
    } else if (arg == "--query-file" && has_value) {
      options.query_file = argv[++i];
    } else if (arg == "--db" && has_value) {
      options.db_path = std::string(argv[++i]);
    } else if (arg == "--backend" && has_value) {
      options.backend = std::string(argv[++i]);
    } else if (arg == "--init" && has_value) {
      options.init_file = argv[++i];
    } else if (arg == "--config" && has_value) {
      options.config_path = argv[++i];
    } else if (arg == "--mode" && has_value) {
      std::string mode = argv[++i];
      if (mode != "duckbox" && mode != "json" && mode != "plain") {
        error = "Invalid --mode value (use duckbox|json|plain)";
        return false;
      }
      options.output_mode = mode;
    } else if (arg == "--highlight" && has_value) {
      std::string value = argv[++i];
      if (value == "on") {
        options.highlight = true;
      } else if (value == "off") {
        options.highlight = false;
      } else {
        error = "Invalid --highlight value (use on|off)";
        return false;
      }
    } else if (arg == "--page-size" && has_value) {
      size_t parsed = 0;
      if (!sqlterm::util::parse_positive_size(argv[++i], parsed)) {
        error = "Invalid --page-size value (use a positive integer)";
        return false;
      }
      options.page_size = parsed;
    } else if (arg == "--timeout-ms" && has_value) {
      size_t parsed = 0;
      if (!sqlterm::util::parse_positive_size(argv[++i], parsed)) {
        error = "Invalid --timeout-ms value (use a positive integer)";
        return false;
      }
      options.timeout_ms = parsed;
    } else if (arg.rfind("--", 0) == 0 && !has_value &&
               (arg == "--query" || arg == "--query-file" || arg == "--db" || arg == "--backend" ||
                arg == "--init" || arg == "--config" || arg == "--mode" || arg == "--highlight" ||
                arg == "--page-size" || arg == "--timeout-ms")) {
      error = "Missing value for " + arg;
      return false;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (!options.query.empty() && !options.query_file.empty()) {
    error = "Use either --query or --query-file, not both";
    return false;
  }
  return true;
}

}  // namespace sqlterm::cli
