#pragma once

#include <string>
#include <vector>

namespace sqlterm::cli {

/// Reads a file into memory for --query-file and --init.
/// MUST throw std::runtime_error on missing or unreadable files.
std::string read_file(const std::string& path);
/// Removes trailing semicolons and whitespace for uniform query handling.
/// MUST preserve internal content and MUST only trim at the end.
std::string trim_semicolon(std::string value);
/// Applies ANSI coloring to JSON for readability when enabled.
/// MUST NOT alter JSON semantics and MUST be disabled for non-TTY output.
std::string colorize_json(const std::string& input, bool enable);
/// Serializes rows as a JSON array of objects keyed by header, preserving header order.
/// Cells equal to "null" (any case) become JSON null.
std::string build_json(const std::vector<std::string>& headers,
                       const std::vector<std::vector<std::string>>& rows);
/// Serializes rows as tab-separated lines with a header line.
std::string build_plain(const std::vector<std::string>& headers,
                        const std::vector<std::vector<std::string>>& rows);

}  // namespace sqlterm::cli
