#pragma once

#include <cstddef>
#include <string>

namespace sqlterm::render {

/// Replaces newlines, carriage returns and tabs with spaces so a cell stays on one line.
std::string sanitize_cell(std::string value);
/// Returns whether a cell looks like a decimal number such as "-3", "0.5" or "1.5e+10"
/// (right-aligned in tables).
/// MUST treat "NULL" and empty strings as non-numeric.
bool is_numeric(const std::string& value);
/// Cuts value to at most width display columns, ending with an ellipsis when cut.
/// MUST never split a UTF-8 sequence.
std::string truncate_with_ellipsis(const std::string& value, size_t width);
/// Pads value with spaces to width display columns.
std::string pad_cell(const std::string& value, size_t width, bool right_align);
/// Truncates then pads so the result is exactly width columns wide.
std::string fit_cell(const std::string& value, size_t width, bool right_align);
/// Returns the terminal width, or 120 when stdout is not a terminal.
size_t detect_terminal_width();

}  // namespace sqlterm::render
