#include "render/duckbox_renderer.h"

#include <algorithm>
#include <sstream>

#include "render/cell_format.h"
#include "ui/color.h"
#include "util/utf8.h"

namespace sqlterm::render {

namespace {

constexpr size_t kMinColumnWidth = 4;
constexpr size_t kMinTableWidth = 20;

/// Border glyphs for one horizontal rule of the table.
struct Rule {
  const char* left;
  const char* mid;
  const char* right;
};

constexpr Rule kTopRule{"┌", "┬", "┐"};
constexpr Rule kHeaderRule{"├", "┼", "┤"};
constexpr Rule kBottomRule{"└", "┴", "┘"};

std::string horizontal_rule(const std::vector<size_t>& widths, const Rule& rule) {
  std::string out = rule.left;
  for (size_t i = 0; i < widths.size(); ++i) {
    if (i > 0) out += rule.mid;
    for (size_t j = 0; j < widths[i] + 2; ++j) out += "─";
  }
  out += rule.right;
  return out;
}

/// Outer border plus " value │" for every column.
size_t table_width(const std::vector<size_t>& widths) {
  size_t total = 1;
  for (size_t w : widths) total += w + 3;
  return total;
}

}  // namespace

std::string render_duckbox(const std::vector<std::string>& headers,
                           const std::vector<std::vector<std::string>>& rows,
                           const DuckboxOptions& options) {
  if (headers.empty()) {
    return "(no columns)";
  }
  size_t shown = options.max_rows == 0 ? rows.size() : std::min(rows.size(), options.max_rows);
  size_t max_width = options.max_width == 0 ? detect_terminal_width() : options.max_width;
  max_width = std::max(max_width, kMinTableWidth);

  // Short rows are padded with NULL so every line has one cell per header.
  std::vector<std::vector<std::string>> cells(shown, std::vector<std::string>(headers.size(), "NULL"));
  std::vector<size_t> widths(headers.size(), kMinColumnWidth);
  for (size_t c = 0; c < headers.size(); ++c) {
    widths[c] = std::max(widths[c], util::display_width(headers[c]));
  }
  for (size_t r = 0; r < shown; ++r) {
    for (size_t c = 0; c < headers.size() && c < rows[r].size(); ++c) {
      cells[r][c] = sanitize_cell(rows[r][c]);
      widths[c] = std::max(widths[c], util::display_width(cells[r][c]));
    }
  }

  while (table_width(widths) > max_width) {
    auto widest = std::max_element(widths.begin(), widths.end());
    if (*widest <= kMinColumnWidth) break;
    --*widest;
  }

  const bool bold = options.highlight && options.is_tty;
  std::ostringstream oss;
  oss << horizontal_rule(widths, kTopRule) << "\n│";
  for (size_t c = 0; c < headers.size(); ++c) {
    std::string title = fit_cell(headers[c], widths[c], false);
    oss << " " << (bold ? cli::kColor.bold + title + cli::kColor.reset : title) << " │";
  }
  oss << "\n" << horizontal_rule(widths, kHeaderRule) << "\n";
  for (const auto& row : cells) {
    oss << "│";
    for (size_t c = 0; c < row.size(); ++c) {
      oss << " " << fit_cell(row[c], widths[c], is_numeric(row[c])) << " │";
    }
    oss << "\n";
  }
  if (rows.size() > shown) {
    std::string note = "… truncated, showing first " + std::to_string(shown) + " of " +
                       std::to_string(rows.size()) + " rows …";
    oss << "│ " << fit_cell(note, table_width(widths) - 4, false) << " │\n";
  }
  oss << horizontal_rule(widths, kBottomRule);
  return oss.str();
}

}  // namespace sqlterm::render
