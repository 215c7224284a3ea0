#include "workspace.h"

#include <chrono>

#include "cli_utils.h"
#include "util/string_util.h"
#include "util/utf8.h"

namespace sqlterm::cli {

namespace {

constexpr size_t kStatusPreviewWidth = 60;

std::string preview(const std::string& text) {
  std::string flat = text;
  for (char& c : flat) {
    if (c == '\n' || c == '\r' || c == '\t') c = ' ';
  }
  std::u32string scalars = sqlterm::util::utf8_to_u32(flat);
  if (scalars.size() <= kStatusPreviewWidth) return flat;
  scalars.resize(kStatusPreviewWidth);
  return sqlterm::util::u32_to_utf8(scalars) + "…";
}

}  // namespace

Workspace::Workspace(WorkspaceConfig& config,
                     std::unique_ptr<DatabaseSession> session,
                     std::shared_ptr<Clipboard> clipboard)
    : config_(config),
      session_(std::move(session)),
      editor_(clipboard),
      grid_(clipboard, config.page_size) {
  register_default_commands(registry_);
  previous_sink_ = set_diagnostic_sink(
      [this](Severity severity, const std::string& message) { enqueue_diagnostic(severity, message); });
}

Workspace::~Workspace() {
  if (pending_.valid()) {
    pending_.wait();
  }
  set_diagnostic_sink(std::move(previous_sink_));
}

void Workspace::set_status(std::string message, bool error) {
  status_ = std::move(message);
  status_error_ = error;
}

void Workspace::set_focus(Focus focus) {
  if (focus == Focus::CommandLine && focus_ != Focus::CommandLine) {
    return_focus_ = focus_;
    command_line_.clear();
  }
  focus_ = focus;
}

bool Workspace::query_running() const {
  return pending_.valid();
}

void Workspace::handle_key(const KeyInput& key) {
  if (key.key == Key::Null) return;
  bool consumed = false;
  handle_global_key(key, consumed);
  if (consumed) return;
  switch (focus_) {
    case Focus::Editor:
      editor_.handle_key(key);
      break;
    case Focus::Grid:
      handle_grid_key(key);
      break;
    case Focus::CommandLine:
      handle_command_line_key(key);
      break;
  }
}

void Workspace::handle_global_key(const KeyInput& key, bool& consumed) {
  if (key.is_ctrl(U'q')) {
    quit_ = true;
    consumed = true;
    return;
  }
  if (focus_ == Focus::CommandLine) {
    return;
  }
  if (key.key == Key::F5 || key.is_ctrl(U'g')) {
    execute_editor_text();
    consumed = true;
    return;
  }
  if (key.key == Key::Tab && !key.ctrl && !key.alt) {
    // Tab is text while typing in the editor.
    if (focus_ == Focus::Editor && editor_.mode() == Mode::Insert) {
      return;
    }
    focus_ = focus_ == Focus::Editor ? Focus::Grid : Focus::Editor;
    consumed = true;
  }
}

void Workspace::handle_grid_key(const KeyInput& key) {
  if (key.is_char(U'j') || key.key == Key::Down) {
    grid_.next_row();
  } else if (key.is_char(U'k') || key.key == Key::Up) {
    grid_.previous_row();
  } else if (key.is_char(U'l')) {
    grid_.next_column();
  } else if (key.is_char(U'h')) {
    grid_.previous_column();
  } else if (key.is_char(U'>') || key.key == Key::Right) {
    grid_.scroll_right();
  } else if (key.is_char(U'<') || key.key == Key::Left) {
    grid_.scroll_left();
  } else if (key.is_char(U']') || key.key == Key::PageDown) {
    grid_.next_page();
  } else if (key.is_char(U'[') || key.key == Key::PageUp) {
    grid_.previous_page();
  } else if (key.is_char(U'g') || key.key == Key::Home) {
    grid_.jump_to_absolute_row(0);
  } else if (key.is_char(U'G') || key.key == Key::End) {
    if (!grid_.empty()) grid_.jump_to_absolute_row(grid_.row_count() - 1);
  } else if (key.is_char(U'w')) {
    grid_.adjust_column_width(1);
  } else if (key.is_char(U'W')) {
    grid_.adjust_column_width(-1);
  } else if (key.is_char(U'y')) {
    auto cell = grid_.copy_selected_cell();
    if (cell) {
      set_status("Copied cell: " + preview(*cell));
    } else {
      set_status("No cell selected; use h/l to pick a column", true);
    }
  } else if (key.is_char(U'Y')) {
    auto row = grid_.copy_selected_row();
    if (row) {
      set_status("Copied row: " + preview(*row));
    }
  } else if (key.is_char(U'q')) {
    quit_ = true;
  } else if (key.is_char(U':')) {
    set_focus(Focus::CommandLine);
  }
}

void Workspace::handle_command_line_key(const KeyInput& key) {
  if (key.key == Key::Esc || key.is_ctrl(U'c')) {
    command_line_.clear();
    focus_ = return_focus_;
    return;
  }
  if (key.key == Key::Enter) {
    std::string line = command_line_;
    command_line_.clear();
    focus_ = return_focus_;
    run_command(line);
    return;
  }
  if (key.key == Key::Backspace) {
    if (command_line_.empty()) {
      focus_ = return_focus_;
      return;
    }
    std::u32string scalars = sqlterm::util::utf8_to_u32(command_line_);
    scalars.pop_back();
    command_line_ = sqlterm::util::u32_to_utf8(scalars);
    return;
  }
  if (key.key == Key::Char && !key.ctrl && !key.alt) {
    sqlterm::util::encode_utf8(key.ch, command_line_);
  }
}

void Workspace::run_command(const std::string& line) {
  std::string trimmed = sqlterm::util::trim_ws(line);
  if (trimmed.empty()) return;
  std::string full = ":" + trimmed;
  CommandContext ctx{config_, grid_, status_, status_error_, quit_};
  if (!registry_.try_handle(full, ctx)) {
    set_status("Unknown command: " + full + " (try :help)", true);
  }
}

void Workspace::execute_editor_text() {
  if (query_running()) {
    set_status("A query is already running; wait for it to finish", true);
    return;
  }
  std::string sql = sqlterm::util::trim_ws(trim_semicolon(editor_.current_text()));
  if (sql.empty()) {
    set_status("Nothing to execute", true);
    return;
  }
  if (!session_) {
    set_status("No database session", true);
    return;
  }
  set_status("Running query...");
  DatabaseSession* session = session_.get();
  QueryStatsContext* stats = &stats_;
  pending_ = std::async(std::launch::async,
                        [session, stats, sql]() { return session->execute(sql, stats); });
}

void Workspace::apply_outcome(std::future<QueryOutcome>& pending) {
  try {
    QueryOutcome outcome = pending.get();
    if (outcome.kind == QueryOutcome::Kind::Rows) {
      grid_.replace(std::move(outcome.headers), std::move(outcome.rows));
    }
    set_status(outcome.message);
  } catch (const QueryError& ex) {
    set_status(std::string("Query failed: ") + ex.what(), true);
  } catch (const std::exception& ex) {
    set_status(std::string("Error: ") + ex.what(), true);
  }
}

bool Workspace::tick() {
  bool changed = false;
  bool applied = false;
  if (pending_.valid() &&
      pending_.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
    apply_outcome(pending_);
    changed = true;
    applied = true;
  }
  std::vector<std::pair<Severity, std::string>> drained;
  {
    std::lock_guard<std::mutex> lock(diagnostics_mutex_);
    drained.swap(diagnostics_);
  }
  for (const auto& item : drained) {
    std::string line = std::string(severity_label(item.first)) + ": " + item.second;
    bool error = item.first != Severity::Info;
    if (applied) {
      status_ += "\n" + line;
      status_error_ = status_error_ || error;
    } else {
      set_status(line, error);
    }
    changed = true;
  }
  return changed;
}

void Workspace::wait_for_query() {
  if (pending_.valid()) {
    pending_.wait();
  }
  tick();
}

void Workspace::enqueue_diagnostic(Severity severity, const std::string& message) {
  std::lock_guard<std::mutex> lock(diagnostics_mutex_);
  diagnostics_.emplace_back(severity, message);
}

}  // namespace sqlterm::cli
