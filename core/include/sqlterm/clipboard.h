#pragma once

#include <cstddef>
#include <string>

namespace sqlterm {

/// Abstracts the shared system clipboard so editor and grid can export text.
/// MUST report failures through the return value and MUST never throw.
/// Inputs are UTF-8 text; side effects are clipboard writes.
class Clipboard {
 public:
  virtual ~Clipboard() = default;
  /// Writes text to the clipboard.
  /// MUST return false and fill error when the write did not happen.
  virtual bool set_text(const std::string& text, std::string& error) = 0;
};

/// Pipes text into an external clipboard tool (wl-copy, xclip, pbcopy).
/// MUST treat a missing or failing tool as a recoverable error.
class CommandClipboard : public Clipboard {
 public:
  /// Uses command verbatim; an empty command makes every write fail.
  explicit CommandClipboard(std::string command);

  bool set_text(const std::string& text, std::string& error) override;
  const std::string& command() const { return command_; }

  /// Picks a clipboard tool available on PATH for the current display server.
  /// MUST return an empty string when no supported tool is found.
  static std::string detect_command();

 private:
  std::string command_;
};

/// Keeps clipboard contents in memory; used when no system tool exists and in tests.
class MemoryClipboard : public Clipboard {
 public:
  bool set_text(const std::string& text, std::string& error) override;

  const std::string& text() const { return text_; }
  size_t write_count() const { return writes_; }
  /// Makes subsequent writes fail, simulating an unavailable clipboard.
  void set_failing(bool failing) { failing_ = failing; }

 private:
  std::string text_;
  size_t writes_ = 0;
  bool failing_ = false;
};

/// Writes text on a best-effort basis and reports a warning on failure.
/// MUST be a no-op for a null clipboard and MUST not propagate errors.
void copy_to_clipboard(Clipboard* clipboard, const std::string& text);

}  // namespace sqlterm
