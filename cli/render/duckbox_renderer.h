#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sqlterm::render {

/// Controls table rendering for one-shot output.
struct DuckboxOptions {
  /// 0 means detect the terminal width.
  size_t max_width = 0;
  /// 0 means render every row.
  size_t max_rows = 0;
  bool highlight = true;
  bool is_tty = true;
};

/// Renders headers and rows as a box-drawn table sized to the terminal.
/// MUST shrink the widest columns first and never below 4 columns.
std::string render_duckbox(const std::vector<std::string>& headers,
                           const std::vector<std::vector<std::string>>& rows,
                           const DuckboxOptions& options);

}  // namespace sqlterm::render
