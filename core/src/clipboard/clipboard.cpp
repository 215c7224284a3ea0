#include "sqlterm/clipboard.h"

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <unistd.h>
#include <sys/wait.h>

#include "sqlterm/diagnostics.h"

namespace sqlterm {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool on_path(const std::string& program) {
  std::string path = get_env("PATH");
  std::istringstream iss(path);
  std::string dir;
  while (std::getline(iss, dir, ':')) {
    if (dir.empty()) continue;
    std::string candidate = dir + "/" + program;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

}  // namespace

CommandClipboard::CommandClipboard(std::string command) : command_(std::move(command)) {}

std::string CommandClipboard::detect_command() {
#ifdef __APPLE__
  if (on_path("pbcopy")) return "pbcopy";
#endif
  if (!get_env("WAYLAND_DISPLAY").empty() && on_path("wl-copy")) {
    return "wl-copy";
  }
  if (!get_env("DISPLAY").empty()) {
    if (on_path("xclip")) return "xclip -selection clipboard";
    if (on_path("xsel")) return "xsel --clipboard --input";
  }
  return {};
}

bool CommandClipboard::set_text(const std::string& text, std::string& error) {
  if (command_.empty()) {
    error = "No clipboard tool available";
    return false;
  }
  FILE* pipe = ::popen(command_.c_str(), "w");
  if (!pipe) {
    error = "Failed to start clipboard command: " + command_;
    return false;
  }
  size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
  int status = ::pclose(pipe);
  if (written != text.size()) {
    error = "Short write to clipboard command: " + command_;
    return false;
  }
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    error = "Clipboard command failed: " + command_;
    return false;
  }
  return true;
}

bool MemoryClipboard::set_text(const std::string& text, std::string& error) {
  if (failing_) {
    error = "Clipboard unavailable";
    return false;
  }
  text_ = text;
  ++writes_;
  return true;
}

void copy_to_clipboard(Clipboard* clipboard, const std::string& text) {
  if (!clipboard) return;
  std::string error;
  if (!clipboard->set_text(text, error)) {
    report(Severity::Warning, error.empty() ? "Clipboard write failed" : error);
  }
}

}  // namespace sqlterm
