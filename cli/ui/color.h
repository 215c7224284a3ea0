#pragma once

#include <string>

namespace sqlterm::cli {

/// ANSI escape sequences shared by the one-shot printer, diagnostics and the workspace screen.
/// MUST remain valid ANSI sequences and MUST stay ASCII-only for terminal compatibility.
struct Color {
  const char* reset = "\033[0m";
  const char* red = "\033[31m";
  const char* green = "\033[32m";
  const char* yellow = "\033[33m";
  const char* blue = "\033[34m";
  const char* magenta = "\033[35m";
  const char* cyan = "\033[36m";
  const char* dim = "\033[2m";
  const char* bold = "\033[1m";
  const char* reverse = "\033[7m";
};

/// Shared palette instance.
/// MUST remain immutable in normal usage.
extern Color kColor;

/// Prints "Error: <message>" to stderr, in red when color is on.
void print_error(const std::string& message, bool color);
/// Prints "Warning: <message>" to stderr, in yellow when color is on.
void print_warning(const std::string& message, bool color);

}  // namespace sqlterm::cli
