#include "sqlterm/result_grid.h"

#include <algorithm>

#include "sqlterm/diagnostics.h"
#include "util/utf8.h"

namespace sqlterm {

ResultGridModel::ResultGridModel(std::shared_ptr<Clipboard> clipboard, size_t page_size)
    : clipboard_(std::move(clipboard)), page_size_(page_size == 0 ? kDefaultPageSize : page_size) {}

size_t ResultGridModel::page_count() const {
  return rows_.size() / page_size_ + (rows_.size() % page_size_ != 0 ? 1 : 0);
}

void ResultGridModel::replace(std::vector<std::string> headers,
                              std::vector<std::vector<std::string>> rows) {
  headers_ = std::move(headers);
  rows_ = std::move(rows);

  std::vector<size_t> widths(headers_.size(), 0);
  for (size_t i = 0; i < headers_.size(); ++i) {
    widths[i] = util::display_width(headers_[i]);
  }
  for (const auto& row : rows_) {
    for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
      widths[i] = std::max(widths[i], util::display_width(row[i]));
    }
  }
  for (auto& width : widths) {
    width = std::max(width + kColumnPadding, kMinColumnWidth);
  }
  min_column_widths_ = widths;
  column_widths_ = std::move(widths);

  total_pages_ = page_count();
  current_page_ = 0;
  column_offset_ = 0;
  vertical_offset_ = 0;
  selected_column_.reset();
  if (rows_.empty()) {
    selected_row_on_page_.reset();
  } else {
    selected_row_on_page_ = 0;
  }
}

size_t ResultGridModel::page_start() const {
  return current_page_ * page_size_;
}

size_t ResultGridModel::page_end() const {
  size_t start = page_start();
  return start + std::min(page_size_, rows_.size() - start);
}

size_t ResultGridModel::rows_on_page() const {
  if (rows_.empty()) return 0;
  return page_end() - page_start();
}

std::vector<std::vector<std::string>> ResultGridModel::visible_rows() const {
  if (rows_.empty()) return {};
  return std::vector<std::vector<std::string>>(rows_.begin() + page_start(),
                                               rows_.begin() + page_end());
}

std::optional<size_t> ResultGridModel::selected_row() const {
  if (!selected_row_on_page_) return std::nullopt;
  return page_start() + *selected_row_on_page_;
}

size_t ResultGridModel::visible_column_count() const {
  if (headers_.empty()) return 0;
  return 1 + (headers_.size() - column_offset_);
}

std::optional<size_t> ResultGridModel::data_column_for(size_t visible_index) const {
  if (visible_index == 0) return std::nullopt;
  size_t data_index = column_offset_ + visible_index - 1;
  if (data_index >= headers_.size()) return std::nullopt;
  return data_index;
}

void ResultGridModel::next_row() {
  if (rows_.empty()) return;
  size_t count = rows_on_page();
  size_t next = selected_row_on_page_ ? *selected_row_on_page_ + 1 : 0;
  if (next >= count) next = 0;
  selected_row_on_page_ = next;
  vertical_offset_ = next;
}

void ResultGridModel::previous_row() {
  if (rows_.empty()) return;
  size_t count = rows_on_page();
  size_t prev = 0;
  if (selected_row_on_page_ && *selected_row_on_page_ > 0) {
    prev = *selected_row_on_page_ - 1;
  } else if (selected_row_on_page_) {
    prev = count - 1;
  }
  selected_row_on_page_ = prev;
  vertical_offset_ = prev;
}

void ResultGridModel::select_page(size_t page) {
  current_page_ = page;
  selected_row_on_page_ = 0;
  vertical_offset_ = 0;
}

void ResultGridModel::next_page() {
  if (rows_.empty()) return;
  if (current_page_ + 1 >= total_pages_) return;
  select_page(current_page_ + 1);
}

void ResultGridModel::previous_page() {
  if (rows_.empty()) return;
  if (current_page_ == 0) return;
  select_page(current_page_ - 1);
}

void ResultGridModel::next_column() {
  if (rows_.empty() || headers_.empty()) return;
  size_t last = visible_column_count() - 1;
  if (!selected_column_) {
    selected_column_ = 0;
  } else if (*selected_column_ < last) {
    selected_column_ = *selected_column_ + 1;
  }
}

void ResultGridModel::previous_column() {
  if (rows_.empty() || headers_.empty()) return;
  if (!selected_column_) {
    selected_column_ = 0;
  } else if (*selected_column_ > 0) {
    selected_column_ = *selected_column_ - 1;
  }
}

void ResultGridModel::clamp_selected_column() {
  if (!selected_column_) return;
  size_t last = visible_column_count() - 1;
  if (*selected_column_ > last) selected_column_ = last;
}

void ResultGridModel::scroll_left() {
  if (rows_.empty() || headers_.empty()) return;
  if (column_offset_ > 0) {
    --column_offset_;
  }
}

void ResultGridModel::scroll_right() {
  if (rows_.empty() || headers_.empty()) return;
  if (column_offset_ + 1 < headers_.size()) {
    ++column_offset_;
    clamp_selected_column();
  }
}

void ResultGridModel::adjust_column_width(int delta) {
  if (rows_.empty() || !selected_column_) return;
  auto data_index = data_column_for(*selected_column_);
  if (!data_index) return;
  size_t& width = column_widths_[*data_index];
  size_t floor = min_column_widths_[*data_index];
  if (delta < 0) {
    size_t shrink = static_cast<size_t>(-static_cast<long long>(delta));
    width = width > floor + shrink ? width - shrink : floor;
  } else {
    width += static_cast<size_t>(delta);
  }
}

void ResultGridModel::jump_to_absolute_row(size_t n) {
  if (rows_.empty()) return;
  n = std::min(n, rows_.size() - 1);
  current_page_ = n / page_size_;
  selected_row_on_page_ = n % page_size_;
  vertical_offset_ = *selected_row_on_page_;
}

void ResultGridModel::set_page_size(size_t page_size) {
  if (page_size == 0 || page_size == page_size_) return;
  auto absolute = selected_row();
  page_size_ = page_size;
  total_pages_ = page_count();
  if (absolute) {
    jump_to_absolute_row(*absolute);
  } else {
    current_page_ = 0;
    vertical_offset_ = 0;
  }
}

std::optional<std::string> ResultGridModel::copy_selected_cell() {
  auto row = selected_row();
  if (!row || !selected_column_) return std::nullopt;
  std::string text;
  if (*selected_column_ == 0) {
    text = std::to_string(*row + 1);
  } else {
    auto data_index = data_column_for(*selected_column_);
    if (!data_index) return std::nullopt;
    const auto& cells = rows_[*row];
    if (*data_index >= cells.size()) return std::nullopt;
    text = cells[*data_index];
  }
  copy_to_clipboard(clipboard_.get(), text);
  return text;
}

std::optional<std::string> ResultGridModel::copy_selected_row() {
  auto row = selected_row();
  if (!row) return std::nullopt;
  const auto& cells = rows_[*row];
  if (cells.size() != headers_.size()) {
    report(Severity::Error, "Row has " + std::to_string(cells.size()) + " values but result has " +
                                std::to_string(headers_.size()) + " columns; row not copied");
    return std::nullopt;
  }
  std::string json = row_to_json(headers_, cells);
  copy_to_clipboard(clipboard_.get(), json);
  return json;
}

}  // namespace sqlterm
