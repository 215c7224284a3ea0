#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlterm/clipboard.h"
#include "sqlterm/diagnostics.h"
#include "sqlterm/key_input.h"
#include "sqlterm/modal_editor.h"
#include "sqlterm/query.h"
#include "sqlterm/query_stats.h"
#include "sqlterm/result_grid.h"
#include "workspace/commands/registry.h"

namespace sqlterm::cli {

/// Runtime settings of the interactive workspace, filled from CLI flags and the config file.
/// MUST keep defaults aligned with the documented config keys.
struct WorkspaceConfig {
  ConnectionConfig connection;
  std::string init_script;
  size_t page_size = 100;
  size_t tick_ms = 100;
  bool color = true;
  bool highlight = true;
  /// Empty means autodetect.
  std::string clipboard_command;
  bool clipboard_enabled = true;
};

/// Which component receives keys.
enum class Focus { Editor, Grid, CommandLine };

/// Routes keys between editor, grid and command line, runs queries on a worker and owns the status line.
/// MUST forward each key to exactly one component and MUST keep at most one query in flight.
/// Inputs are decoded keys; side effects are editor/grid changes, queries and clipboard writes.
class Workspace {
 public:
  Workspace(WorkspaceConfig& config,
            std::unique_ptr<DatabaseSession> session,
            std::shared_ptr<Clipboard> clipboard);
  ~Workspace();

  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  /// Dispatches one key according to the current focus.
  void handle_key(const KeyInput& key);
  /// Applies a finished query and drains queued diagnostics; call once per tick.
  /// Returns true when anything visible changed.
  bool tick();
  /// Starts executing the editor text; refused while another query runs.
  void execute_editor_text();
  /// Blocks until the running query finishes, then applies it.
  void wait_for_query();
  /// Runs a ":" command line (without the colon).
  void run_command(const std::string& line);

  bool query_running() const;
  bool quit_requested() const { return quit_; }
  Focus focus() const { return focus_; }
  void set_focus(Focus focus);

  ModalEditor& editor() { return editor_; }
  const ModalEditor& editor() const { return editor_; }
  ResultGridModel& grid() { return grid_; }
  const ResultGridModel& grid() const { return grid_; }
  const QueryStatsContext& stats() const { return stats_; }
  const WorkspaceConfig& config() const { return config_; }

  const std::string& status() const { return status_; }
  bool status_is_error() const { return status_error_; }
  void set_status(std::string message, bool error = false);
  /// Text typed after ':' while the command line has focus.
  const std::string& command_line() const { return command_line_; }

 private:
  void handle_global_key(const KeyInput& key, bool& consumed);
  void handle_grid_key(const KeyInput& key);
  void handle_command_line_key(const KeyInput& key);
  void apply_outcome(std::future<QueryOutcome>& pending);
  void enqueue_diagnostic(Severity severity, const std::string& message);

  WorkspaceConfig& config_;
  std::unique_ptr<DatabaseSession> session_;
  ModalEditor editor_;
  ResultGridModel grid_;
  QueryStatsContext stats_;
  CommandRegistry registry_;
  Focus focus_ = Focus::Editor;
  Focus return_focus_ = Focus::Grid;
  std::string command_line_;
  std::string status_;
  bool status_error_ = false;
  bool quit_ = false;

  std::mutex diagnostics_mutex_;
  std::vector<std::pair<Severity, std::string>> diagnostics_;
  DiagnosticSink previous_sink_;

  // Declared last so a running query finishes before the session is destroyed.
  std::future<QueryOutcome> pending_;
};

/// Runs the full-screen workspace until the user quits and returns an exit status.
/// MUST restore the terminal on every exit path and MUST not throw on normal user exits.
/// Inputs are config values and an open session; side effects are terminal IO and queries.
int run_workspace(WorkspaceConfig& config,
                  std::unique_ptr<DatabaseSession> session,
                  std::shared_ptr<Clipboard> clipboard);

}  // namespace sqlterm::cli
