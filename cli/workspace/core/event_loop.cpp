#include "workspace.h"

#include <iostream>

#include "ui/color.h"
#include "workspace/input/key_decoder.h"
#include "workspace/input/terminal.h"
#include "workspace/ui/screen.h"

namespace sqlterm::cli {

int run_workspace(WorkspaceConfig& config,
                  std::unique_ptr<DatabaseSession> session,
                  std::shared_ptr<Clipboard> clipboard) {
  std::string backend = session ? session->backend_name() : "none";
  bool has_clipboard = clipboard != nullptr;
  TermiosGuard guard;
  if (!guard.ok()) {
    print_error("The interactive workspace requires a terminal; use --query for scripts", config.color);
    return 1;
  }

  Workspace workspace(config, std::move(session), std::move(clipboard));
  std::string greeting = "Connected to " + backend + " " + config.connection.path +
                         ". F5 runs the query, Tab switches panes, :help in results.";
  if (!has_clipboard) {
    greeting += "\nNo clipboard tool found; yanks stay in the editor register.";
  }
  workspace.set_status(greeting);

  ScreenStyle style;
  style.color = config.color;
  style.highlight = config.highlight;
  KeyDecoder decoder;
  TerminalSize last_size{};
  bool dirty = true;
  int tick_ms = static_cast<int>(config.tick_ms);

  while (!workspace.quit_requested()) {
    TerminalSize size = terminal_size();
    if (size.rows != last_size.rows || size.cols != last_size.cols) {
      std::cout << "\033[2J";
      last_size = size;
      dirty = true;
    }
    if (dirty) {
      std::cout << render_screen(workspace, size.rows, size.cols, style) << std::flush;
      dirty = false;
    }
    std::string bytes;
    // Drain queued keys without waiting a full tick.
    bool waited = !decoder.has_key();
    if (!read_input(waited ? tick_ms : 0, bytes)) {
      break;
    }
    if (bytes.empty() && waited) {
      decoder.flush();
    } else if (!bytes.empty()) {
      decoder.feed(bytes);
    }
    if (decoder.has_key()) {
      workspace.handle_key(decoder.pop());
      dirty = true;
    }
    if (workspace.tick()) {
      dirty = true;
    }
  }
  return 0;
}

}  // namespace sqlterm::cli
