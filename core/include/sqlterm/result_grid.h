#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sqlterm/clipboard.h"

namespace sqlterm {

/// Paginated, scrollable view over a fetched result set.
/// MUST keep the selected row inside [page_start, page_end) and current_page inside
/// [0, total_pages) whenever rows exist; every navigation on an empty set is a no-op.
/// Inputs are navigation commands; side effects are view state changes and
/// best-effort clipboard writes.
class ResultGridModel {
 public:
  static constexpr size_t kDefaultPageSize = 100;
  static constexpr size_t kColumnPadding = 2;
  static constexpr size_t kMinColumnWidth = 4;

  explicit ResultGridModel(std::shared_ptr<Clipboard> clipboard = nullptr,
                           size_t page_size = kDefaultPageSize);

  /// Loads a new result set and resets all view state.
  /// MUST derive min widths from content (plus padding, floored) and select row 0 when rows exist.
  void replace(std::vector<std::string> headers, std::vector<std::vector<std::string>> rows);

  /// Moves to the next row of the current page, wrapping to the page's first row.
  void next_row();
  /// Moves to the previous row of the current page, wrapping to the page's last row.
  void previous_row();
  void next_page();
  void previous_page();
  /// Moves the column selection within the visible columns (0 is the row-number column).
  void next_column();
  void previous_column();
  void scroll_left();
  void scroll_right();
  /// Changes the selected data column width by delta.
  /// MUST never shrink a column below its content-derived minimum.
  void adjust_column_width(int delta);
  /// Selects the absolute row n, clamped to the row range, and moves to its page.
  void jump_to_absolute_row(size_t n);

  /// Returns the selected cell's text, or the 1-based row number for the row-number column.
  /// MUST return nullopt when nothing is selected or the column is out of range.
  std::optional<std::string> copy_selected_cell();
  /// Returns the selected row as a JSON object keyed by header, in header order.
  /// MUST report a diagnostic and return nullopt when headers and row differ in length.
  std::optional<std::string> copy_selected_row();

  /// Changes the page size and keeps the selected absolute row in view.
  void set_page_size(size_t page_size);

  const std::vector<std::string>& headers() const { return headers_; }
  const std::vector<std::vector<std::string>>& rows() const { return rows_; }
  size_t row_count() const { return rows_.size(); }
  size_t column_count() const { return headers_.size(); }
  bool empty() const { return rows_.empty(); }
  size_t page_size() const { return page_size_; }
  size_t total_pages() const { return total_pages_; }
  size_t current_page() const { return current_page_; }
  size_t page_start() const;
  size_t page_end() const;
  /// Returns a copy of the rows on the current page.
  std::vector<std::vector<std::string>> visible_rows() const;
  const std::vector<size_t>& column_widths() const { return column_widths_; }
  const std::vector<size_t>& min_column_widths() const { return min_column_widths_; }
  /// Absolute index of the selected row.
  std::optional<size_t> selected_row() const;
  std::optional<size_t> selected_row_on_page() const { return selected_row_on_page_; }
  std::optional<size_t> selected_column() const { return selected_column_; }
  size_t column_offset() const { return column_offset_; }
  size_t vertical_offset() const { return vertical_offset_; }
  /// Number of columns in the visible space, including the row-number column.
  size_t visible_column_count() const;
  /// Maps a visible column index to a data column index; nullopt for the row-number column.
  std::optional<size_t> data_column_for(size_t visible_index) const;

 private:
  size_t rows_on_page() const;
  size_t page_count() const;
  void select_page(size_t page);
  void clamp_selected_column();

  std::vector<std::string> headers_;
  std::vector<std::vector<std::string>> rows_;
  std::vector<size_t> column_widths_;
  std::vector<size_t> min_column_widths_;
  std::shared_ptr<Clipboard> clipboard_;
  size_t page_size_;
  size_t total_pages_ = 0;
  size_t current_page_ = 0;
  std::optional<size_t> selected_row_on_page_;
  std::optional<size_t> selected_column_;
  size_t column_offset_ = 0;
  size_t vertical_offset_ = 0;
};

/// Returns one JSON object key per header; repeats get a numeric suffix ("id", "id_2").
/// MUST return distinct keys in header order.
std::vector<std::string> json_keys(const std::vector<std::string>& headers);

/// Serializes one row as a JSON object, header to value, preserving header order.
/// MUST encode cells equal to "null" (any case) as JSON null and MUST keep every cell
/// when headers repeat.
std::string row_to_json(const std::vector<std::string>& headers,
                        const std::vector<std::string>& row);

}  // namespace sqlterm
