#pragma once

#include <string>

namespace sqlterm::cli {

/// Puts the terminal in raw mode on the alternate screen for the full-screen workspace.
/// MUST restore terminal settings and the primary screen on destruction.
/// Inputs are implicit terminal state; side effects include termios updates and escape writes.
class TermiosGuard {
 public:
  /// Disables echo, canonical mode, signal keys and flow control so every chord reaches the workspace.
  /// MUST succeed entirely or leave the terminal untouched.
  TermiosGuard();
  /// Restores the saved settings, shows the cursor and leaves the alternate screen.
  ~TermiosGuard();
  TermiosGuard(const TermiosGuard&) = delete;
  TermiosGuard& operator=(const TermiosGuard&) = delete;
  /// Reports whether raw mode was enabled.
  bool ok() const;

 private:
  void* original_ = nullptr;
  bool ok_ = false;
};

struct TerminalSize {
  int rows = 24;
  int cols = 80;
};

/// Detects the terminal size.
/// MUST fall back to 24x80 when detection fails.
TerminalSize terminal_size();

/// Waits up to timeout_ms for stdin and appends whatever bytes are available to out.
/// MUST return false on end of input or a read error; a timeout returns true with nothing read.
bool read_input(int timeout_ms, std::string& out);

}  // namespace sqlterm::cli
