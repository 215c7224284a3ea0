#include "screen.h"

#include <algorithm>
#include <sstream>
#include <unordered_set>

#include "render/cell_format.h"
#include "sqlterm/modal_editor.h"
#include "sqlterm/query_stats.h"
#include "sqlterm/result_grid.h"
#include "ui/color.h"
#include "util/string_util.h"
#include "util/utf8.h"
#include "workspace/core/workspace.h"

namespace sqlterm::cli {

namespace {

constexpr size_t kGutterWidth = 5;

bool is_sql_keyword(const std::string& word) {
  static const std::unordered_set<std::string> keywords = {
      "select", "from",  "where",  "and",    "or",     "not",   "in",     "limit", "offset",
      "order",  "by",    "group",  "having", "asc",    "desc",  "insert", "into",  "values",
      "update", "set",   "delete", "join",   "left",   "right", "inner",  "outer", "on",
      "as",     "is",    "null",   "like",   "between", "case", "when",   "then",  "else",
      "end",    "count", "distinct", "union", "all",   "exists"};
  return keywords.find(sqlterm::util::to_lower(word)) != keywords.end();
}

bool is_word_scalar(char32_t c) {
  return c == U'_' || (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') ||
         (c >= U'0' && c <= U'9') || c >= 0x80;
}

/// Marks scalars that belong to SQL keywords.
std::vector<bool> keyword_mask(const std::u32string& line) {
  std::vector<bool> mask(line.size(), false);
  size_t i = 0;
  while (i < line.size()) {
    if (!is_word_scalar(line[i])) {
      ++i;
      continue;
    }
    size_t start = i;
    while (i < line.size() && is_word_scalar(line[i])) ++i;
    std::string word = sqlterm::util::u32_to_utf8(line.substr(start, i - start));
    if (is_sql_keyword(word)) {
      std::fill(mask.begin() + static_cast<long>(start), mask.begin() + static_cast<long>(i), true);
    }
  }
  return mask;
}

bool in_range(const std::pair<Position, Position>& range, Position pos) {
  return !(pos < range.first) && pos < range.second;
}

std::string gutter(size_t row) {
  std::string number = std::to_string(row + 1);
  if (number.size() + 1 >= kGutterWidth) return number + " ";
  return std::string(kGutterWidth - 1 - number.size(), ' ') + number + " ";
}

std::string title_bar(const std::string& text, size_t width, bool focused, bool color) {
  std::string line = render::fit_cell(text, width, false);
  if (focused) return std::string(kColor.reverse) + line + kColor.reset;
  if (color) return std::string(kColor.dim) + line + kColor.reset;
  return line;
}

}  // namespace

std::vector<std::string> render_editor_pane(const ModalEditor& editor,
                                            size_t width,
                                            size_t height,
                                            bool focused,
                                            const ScreenStyle& style) {
  std::vector<std::string> out;
  if (height == 0 || width == 0) return out;
  const TextBuffer& buffer = editor.buffer();
  Position cursor = editor.cursor();
  auto selection = editor.selection_range();
  size_t top = cursor.row >= height ? cursor.row - height + 1 : 0;
  size_t text_width = width > kGutterWidth ? width - kGutterWidth : 1;
  size_t left = cursor.col >= text_width ? cursor.col - text_width + 1 : 0;

  for (size_t r = top; r < top + height; ++r) {
    if (r >= buffer.line_count()) {
      std::string filler = render::pad_cell("~", width, false);
      out.push_back(style.color ? std::string(kColor.dim) + filler + kColor.reset : filler);
      continue;
    }
    const std::u32string& line = buffer.line(r);
    std::vector<bool> keywords = style.highlight ? keyword_mask(line) : std::vector<bool>(line.size(), false);
    std::string text = style.color ? std::string(kColor.dim) + gutter(r) + kColor.reset : gutter(r);
    size_t used = 0;
    // One extra column lets the cursor sit after the last scalar.
    for (size_t c = left; c <= line.size() && used < text_width; ++c) {
      Position pos{r, c};
      bool is_cursor = focused && pos == cursor;
      bool selected = selection && in_range(*selection, pos);
      if (c == line.size() && !is_cursor && !selected) break;
      char32_t ch = c < line.size() ? line[c] : U' ';
      if (ch == U'\t') ch = U' ';
      int w = sqlterm::util::display_width(static_cast<uint32_t>(ch));
      if (w <= 0) w = 1;
      if (used + static_cast<size_t>(w) > text_width) break;
      std::string glyph;
      sqlterm::util::encode_utf8(ch, glyph);
      if (is_cursor || selected) {
        text += kColor.reverse + glyph + kColor.reset;
      } else if (style.color && c < keywords.size() && keywords[c]) {
        text += std::string(kColor.blue) + glyph + kColor.reset;
      } else {
        text += glyph;
      }
      used += static_cast<size_t>(w);
    }
    text += std::string(text_width - std::min(used, text_width), ' ');
    out.push_back(text);
  }
  return out;
}

std::vector<std::string> render_grid_pane(const ResultGridModel& grid,
                                          size_t width,
                                          size_t height,
                                          bool focused,
                                          const ScreenStyle& style) {
  std::vector<std::string> out;
  if (height == 0 || width == 0) return out;
  if (grid.column_count() == 0) {
    out.push_back(render::fit_cell(" No results. Write a query and press F5.", width, false));
    return out;
  }

  size_t number_width = std::max<size_t>(std::to_string(grid.row_count()).size(), 1) + 2;
  std::vector<std::pair<size_t, size_t>> columns;  // visible index, width
  columns.emplace_back(0, number_width);
  size_t used = number_width;
  for (size_t v = 1; v < grid.visible_column_count(); ++v) {
    auto data = grid.data_column_for(v);
    if (!data) break;
    size_t w = grid.column_widths()[*data];
    if (used + 1 >= width) break;
    w = std::min(w, width - used - 1);
    columns.emplace_back(v, w);
    used += 1 + w;
  }

  auto cell_text = [&](size_t visible, size_t absolute_row, bool header) -> std::string {
    if (visible == 0) {
      return header ? "#" : std::to_string(absolute_row + 1);
    }
    size_t data = *grid.data_column_for(visible);
    if (header) return grid.headers()[data];
    const auto& row = grid.rows()[absolute_row];
    return data < row.size() ? row[data] : "";
  };

  auto build_line = [&](size_t absolute_row, bool header, bool selected_row) {
    std::string line;
    size_t line_width = 0;
    for (size_t i = 0; i < columns.size(); ++i) {
      if (i > 0) {
        line += "│";
        ++line_width;
      }
      size_t visible = columns[i].first;
      size_t w = columns[i].second;
      std::string value = cell_text(visible, absolute_row, header);
      bool right = !header && (visible == 0 || render::is_numeric(value));
      std::string cell = right ? render::fit_cell(value + " ", w, true)
                               : render::fit_cell(" " + value, w, false);
      bool selected_cell = selected_row && grid.selected_column() && *grid.selected_column() == visible;
      if (header) {
        if (style.color) cell = std::string(kColor.bold) + cell + kColor.reset;
      } else if (selected_cell && focused) {
        cell = std::string(kColor.reverse) + (style.color ? kColor.cyan : "") + cell + kColor.reset;
      } else if (selected_row) {
        cell = (style.color ? std::string(kColor.yellow) : std::string(kColor.bold)) + cell + kColor.reset;
      } else if (visible == 0 && style.color) {
        cell = std::string(kColor.dim) + cell + kColor.reset;
      }
      line += cell;
      line_width += w;
    }
    if (line_width < width) line += std::string(width - line_width, ' ');
    return line;
  };

  out.push_back(build_line(0, true, false));
  std::string separator;
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) separator += "┼";
    for (size_t j = 0; j < columns[i].second; ++j) separator += "─";
  }
  out.push_back(render::pad_cell(separator, width, false));

  if (height <= 2) {
    out.resize(height);
    return out;
  }
  size_t body = height - 2;
  size_t on_page = grid.page_end() - grid.page_start();
  size_t selected = grid.selected_row_on_page().value_or(0);
  size_t top = grid.vertical_offset() >= body ? grid.vertical_offset() - body + 1 : 0;
  if (selected < top) top = selected;
  for (size_t i = top; i < on_page && out.size() < height; ++i) {
    bool is_selected = grid.selected_row_on_page() && *grid.selected_row_on_page() == i;
    out.push_back(build_line(grid.page_start() + i, false, is_selected));
  }
  return out;
}

std::string render_screen(const Workspace& workspace, int rows, int cols, const ScreenStyle& style) {
  size_t height = static_cast<size_t>(std::max(rows, 8));
  size_t width = static_cast<size_t>(std::max(cols, 20));
  constexpr size_t kStatusLines = 2;
  size_t panes = height - kStatusLines - 2;
  size_t editor_height = std::max<size_t>(3, panes / 3);
  size_t grid_height = panes - editor_height;

  const ModalEditor& editor = workspace.editor();
  const ResultGridModel& grid = workspace.grid();
  Focus focus = workspace.focus();

  std::vector<std::string> lines;
  lines.reserve(height);
  Position cursor = editor.cursor();
  std::ostringstream editor_title;
  editor_title << " Query [" << editor.mode_label() << "]  " << cursor.row + 1 << ":" << cursor.col + 1;
  if (workspace.query_running()) editor_title << "  running...";
  lines.push_back(title_bar(editor_title.str(), width, focus == Focus::Editor, style.color));
  for (auto& line : render_editor_pane(editor, width, editor_height, focus == Focus::Editor, style)) {
    lines.push_back(std::move(line));
  }

  std::ostringstream grid_title;
  grid_title << " Results";
  if (grid.column_count() > 0) {
    grid_title << "  page " << (grid.total_pages() == 0 ? 0 : grid.current_page() + 1) << "/"
               << grid.total_pages() << "  rows " << grid.row_count();
    if (auto row = grid.selected_row()) grid_title << "  row " << *row + 1;
    if (grid.column_offset() > 0) grid_title << "  +" << grid.column_offset() << " cols";
  }
  if (auto stats = workspace.stats().last()) {
    grid_title << "  last: " << stats->rows << " rows in " << stats->elapsed.count() << " ms";
  }
  bool grid_focused = focus == Focus::Grid || focus == Focus::CommandLine;
  lines.push_back(title_bar(grid_title.str(), width, grid_focused, style.color));
  std::vector<std::string> grid_lines = render_grid_pane(grid, width, grid_height, grid_focused, style);
  grid_lines.resize(grid_height, std::string(width, ' '));
  for (auto& line : grid_lines) {
    lines.push_back(std::move(line));
  }

  std::vector<std::string> status_lines;
  std::istringstream status_stream(workspace.status());
  std::string status_line;
  while (std::getline(status_stream, status_line)) status_lines.push_back(status_line);
  if (focus == Focus::CommandLine) {
    if (status_lines.size() >= kStatusLines) status_lines.resize(kStatusLines - 1);
    status_lines.push_back(":" + workspace.command_line());
  }
  if (status_lines.size() > kStatusLines) {
    status_lines.erase(status_lines.begin(), status_lines.end() - kStatusLines);
  }
  status_lines.resize(kStatusLines);
  for (size_t i = 0; i < status_lines.size(); ++i) {
    std::string line = render::fit_cell(status_lines[i], width, false);
    bool is_prompt = focus == Focus::CommandLine && i + 1 == status_lines.size();
    if (style.color && workspace.status_is_error() && !is_prompt && !status_lines[i].empty()) {
      line = std::string(kColor.red) + line + kColor.reset;
    }
    lines.push_back(std::move(line));
  }

  std::string frame;
  for (size_t i = 0; i < lines.size() && i < height; ++i) {
    frame += "\033[" + std::to_string(i + 1) + ";1H\033[2K" + lines[i];
  }
  frame += kColor.reset;
  return frame;
}

}  // namespace sqlterm::cli
