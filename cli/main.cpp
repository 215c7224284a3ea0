#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "cli_args.h"
#include "cli_utils.h"
#include "render/duckbox_renderer.h"
#include "sqlterm/clipboard.h"
#include "sqlterm/diagnostics.h"
#include "sqlterm/query.h"
#include "sqlterm/sqlite_session.h"
#include "ui/color.h"
#include "workspace/config.h"
#include "workspace/core/workspace.h"

#ifdef SQLTERM_USE_POSTGRES
#include "sqlterm/postgres_session.h"
#endif

namespace {

using sqlterm::cli::CliOptions;
using sqlterm::cli::WorkspaceConfig;

void install_stderr_sink(bool color) {
  sqlterm::set_diagnostic_sink([color](sqlterm::Severity severity, const std::string& message) {
    if (severity == sqlterm::Severity::Error) {
      sqlterm::cli::print_error(message, color);
    } else if (severity == sqlterm::Severity::Warning) {
      sqlterm::cli::print_warning(message, color);
    } else {
      std::cerr << message << std::endl;
    }
  });
}

void apply_cli_overrides(const CliOptions& options, WorkspaceConfig& config) {
  config.color = options.color;
  if (options.db_path) config.connection.path = sqlterm::cli::expand_user_path(*options.db_path);
  if (options.backend) config.connection.backend = *options.backend;
  if (options.highlight) config.highlight = *options.highlight;
  if (options.page_size) config.page_size = *options.page_size;
  if (options.timeout_ms) config.connection.busy_timeout_ms = static_cast<int>(*options.timeout_ms);
  config.init_script = options.init_file;
}

std::shared_ptr<sqlterm::Clipboard> make_clipboard(const WorkspaceConfig& config) {
  if (!config.clipboard_enabled) return nullptr;
  std::string command = config.clipboard_command.empty()
                            ? sqlterm::CommandClipboard::detect_command()
                            : config.clipboard_command;
  if (command.empty()) return nullptr;
  return std::make_shared<sqlterm::CommandClipboard>(command);
}

void run_init_script(sqlterm::DatabaseSession& session, const std::string& path) {
  if (auto* sqlite = dynamic_cast<sqlterm::SqliteSession*>(&session)) {
    sqlite->run_script(sqlterm::cli::read_file(path));
    return;
  }
#ifdef SQLTERM_USE_POSTGRES
  if (auto* postgres = dynamic_cast<sqlterm::PostgresSession*>(&session)) {
    postgres->run_script(sqlterm::cli::read_file(path));
    return;
  }
#endif
  throw sqlterm::QueryError("--init is not supported for the " + session.backend_name() + " backend");
}

int run_once(sqlterm::DatabaseSession& session,
             const std::string& sql,
             const CliOptions& options,
             const WorkspaceConfig& config) {
  sqlterm::QueryOutcome outcome = session.execute(sqlterm::cli::trim_semicolon(sql));
  if (outcome.kind == sqlterm::QueryOutcome::Kind::Affected) {
    std::cout << outcome.message << std::endl;
    return 0;
  }
  if (options.output_mode == "json") {
    std::cout << sqlterm::cli::colorize_json(sqlterm::cli::build_json(outcome.headers, outcome.rows),
                                             config.color)
              << std::endl;
  } else if (options.output_mode == "plain") {
    std::cout << sqlterm::cli::build_plain(outcome.headers, outcome.rows);
  } else {
    sqlterm::render::DuckboxOptions render_options;
    render_options.highlight = config.highlight;
    render_options.is_tty = config.color;
    std::cout << sqlterm::render::render_duckbox(outcome.headers, outcome.rows, render_options)
              << std::endl;
  }
  if (config.color) std::cerr << sqlterm::cli::kColor.dim;
  std::cerr << outcome.message << std::endl;
  if (config.color) std::cerr << sqlterm::cli::kColor.reset;
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  // Clipboard tools may exit before reading their input.
  std::signal(SIGPIPE, SIG_IGN);

  CliOptions options;
  std::string error;
  if (!sqlterm::cli::parse_cli_args(argc, argv, options, error)) {
    sqlterm::cli::print_error(error, isatty(fileno(stderr)) != 0);
    std::cerr << "Try --help" << std::endl;
    return 1;
  }
  if (options.show_help) {
    sqlterm::cli::print_help(std::cout);
    return 0;
  }
  if (!isatty(fileno(stdout))) {
    options.color = false;
  }
  install_stderr_sink(options.color);

  WorkspaceConfig config;
  sqlterm::cli::WorkspaceSettings settings;
  std::string config_path =
      options.config_path.empty() ? sqlterm::cli::resolve_config_path() : options.config_path;
  std::string config_error;
  if (sqlterm::cli::load_workspace_config(config_path, settings, config_error)) {
    sqlterm::cli::apply_workspace_settings(settings, config);
  } else if (!config_error.empty()) {
    sqlterm::cli::print_error(config_error + " (" + config_path + "); using defaults", options.color);
  }
  apply_cli_overrides(options, config);

  std::unique_ptr<sqlterm::DatabaseSession> session;
  try {
    session = sqlterm::open_session(config.connection);
    if (!config.init_script.empty()) {
      run_init_script(*session, config.init_script);
    }
  } catch (const std::exception& ex) {
    sqlterm::cli::print_error(ex.what(), config.color);
    return 1;
  }

  if (!options.query.empty() || !options.query_file.empty()) {
    try {
      std::string sql = options.query.empty() ? sqlterm::cli::read_file(options.query_file)
                                              : options.query;
      return run_once(*session, sql, options, config);
    } catch (const std::exception& ex) {
      sqlterm::cli::print_error(ex.what(), config.color);
      return 1;
    }
  }

  if (!isatty(fileno(stdin))) {
    sqlterm::cli::print_error("stdin is not a terminal; use --query for non-interactive use",
                              config.color);
    return 1;
  }
  std::shared_ptr<sqlterm::Clipboard> clipboard = make_clipboard(config);
  int status = sqlterm::cli::run_workspace(config, std::move(session), std::move(clipboard));
  install_stderr_sink(config.color);
  return status;
}
