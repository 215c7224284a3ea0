#include "test_harness.h"
#include "test_utils.h"

#include <limits>
#include <memory>

#include "sqlterm/clipboard.h"
#include "sqlterm/result_grid.h"

namespace {

using sqlterm::ResultGridModel;

using Rows = std::vector<std::vector<std::string>>;

Rows numbered_rows(size_t count) {
  Rows rows;
  rows.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    rows.push_back({std::to_string(i), "name" + std::to_string(i)});
  }
  return rows;
}

void test_replace_computes_pages() {
  ResultGridModel grid;
  grid.replace({"id", "name"}, numbered_rows(250));
  expect_eq(grid.total_pages(), 3, "250 rows at 100 per page");
  expect_eq(grid.current_page(), 0, "starts on first page");
  expect_true(grid.selected_row() == std::optional<size_t>(0), "row 0 selected");
  expect_true(!grid.selected_column().has_value(), "no column selected");
  expect_eq(grid.visible_rows().size(), 100, "first page is full");
}

void test_replace_exact_multiple() {
  ResultGridModel grid(nullptr, 50);
  grid.replace({"id", "name"}, numbered_rows(100));
  expect_eq(grid.total_pages(), 2, "ceil of exact multiple");
}

void test_huge_page_size_is_one_page() {
  const size_t huge = std::numeric_limits<size_t>::max();
  ResultGridModel grid(nullptr, huge);
  grid.replace({"id", "name"}, numbered_rows(3));
  expect_eq(grid.total_pages(), 1, "all rows on one page");
  expect_eq(grid.current_page(), 0, "first page");
  expect_eq(grid.visible_rows().size(), 3, "every row visible");
  grid.set_page_size(huge - 1);
  expect_eq(grid.total_pages(), 1, "still one page");
  expect_eq(grid.visible_rows().size(), 3, "rows kept");
}

void test_last_page_is_partial() {
  ResultGridModel grid;
  grid.replace({"id", "name"}, numbered_rows(250));
  grid.next_page();
  grid.next_page();
  expect_eq(grid.current_page(), 2, "third page");
  expect_eq(grid.page_start(), 200, "page start");
  expect_eq(grid.page_end(), 250, "page end");
  expect_eq(grid.visible_rows().size(), 50, "partial page");
  expect_true(grid.selected_row() == std::optional<size_t>(200), "row resets to page start");
  grid.next_page();
  expect_eq(grid.current_page(), 2, "next_page clamps at last page");
}

void test_previous_page_clamps() {
  ResultGridModel grid;
  grid.replace({"id", "name"}, numbered_rows(250));
  grid.previous_page();
  expect_eq(grid.current_page(), 0, "previous_page clamps at first page");
  grid.next_page();
  grid.next_row();
  grid.next_row();
  grid.previous_page();
  expect_eq(grid.current_page(), 0, "back to first page");
  expect_true(grid.selected_row_on_page() == std::optional<size_t>(0), "row reset on page change");
  expect_eq(grid.vertical_offset(), 0, "scroll reset on page change");
}

void test_rows_wrap_within_page() {
  ResultGridModel grid;
  grid.replace({"id", "name"}, numbered_rows(250));
  grid.previous_row();
  expect_true(grid.selected_row() == std::optional<size_t>(99), "previous from first wraps to page end");
  grid.next_row();
  expect_true(grid.selected_row() == std::optional<size_t>(0), "next from last wraps to page start");
  expect_eq(grid.current_page(), 0, "wrapping never changes page");

  grid.jump_to_absolute_row(249);
  grid.next_row();
  expect_true(grid.selected_row() == std::optional<size_t>(200), "partial page wraps at its end");
}

void test_jump_to_absolute_row() {
  ResultGridModel grid;
  grid.replace({"id", "name"}, numbered_rows(250));
  grid.jump_to_absolute_row(175);
  expect_eq(grid.current_page(), 1, "page for row 175");
  expect_true(grid.selected_row_on_page() == std::optional<size_t>(75), "row on page");
  expect_eq(grid.vertical_offset(), 75, "scroll follows selection");
  grid.jump_to_absolute_row(1000);
  expect_true(grid.selected_row() == std::optional<size_t>(249), "clamped to last row");
  expect_eq(grid.current_page(), 2, "last page");
}

void test_selected_row_stays_on_page() {
  ResultGridModel grid(nullptr, 7);
  grid.replace({"id", "name"}, numbered_rows(30));
  bool ok = true;
  for (int i = 0; i < 200; ++i) {
    switch (i % 5) {
      case 0:
        grid.next_row();
        break;
      case 1:
        if (i % 3 == 0) grid.next_page();
        break;
      case 2:
        grid.previous_row();
        grid.previous_row();
        break;
      case 3:
        grid.jump_to_absolute_row(static_cast<size_t>(i * 13 % 40));
        break;
      default:
        if (i % 4 == 0) grid.previous_page();
        break;
    }
    auto row = grid.selected_row();
    if (!row || *row < grid.page_start() || *row >= grid.page_end() ||
        grid.current_page() >= grid.total_pages()) {
      ok = false;
    }
  }
  expect_true(ok, "selection always inside the current page");
}

void test_column_widths_from_content() {
  ResultGridModel grid;
  grid.replace({"id", "name", "x"}, {{"1", "alice", "7"}, {"22", "bo", "8"}});
  expect_eq(grid.min_column_widths()[0], 4, "id: header 2 plus padding");
  expect_eq(grid.min_column_widths()[1], 7, "name: cell 5 plus padding");
  expect_eq(grid.min_column_widths()[2], 4, "x: floored at minimum");
  expect_eq(grid.column_widths()[1], 7, "widths start at minimum");
}

void test_column_widths_use_display_width() {
  ResultGridModel grid;
  grid.replace({"city"}, {{"東京都"}});
  expect_eq(grid.min_column_widths()[0], 8, "wide glyphs count two columns");
}

void test_adjust_width_needs_selected_column() {
  ResultGridModel grid;
  grid.replace({"id", "name"}, numbered_rows(3));
  size_t before = grid.column_widths()[0];
  grid.adjust_column_width(5);
  expect_eq(grid.column_widths()[0], before, "no column selected");
  grid.next_column();
  grid.adjust_column_width(5);
  expect_eq(grid.column_widths()[0], before, "row-number column has no width");
  grid.next_column();
  grid.adjust_column_width(3);
  expect_eq(grid.column_widths()[0], before + 3, "selected column widened");
  grid.adjust_column_width(-100);
  expect_eq(grid.column_widths()[0], grid.min_column_widths()[0], "never below minimum");
}

void test_column_selection_bounds() {
  ResultGridModel grid;
  grid.replace({"a", "b"}, {{"1", "2"}});
  grid.previous_column();
  expect_true(grid.selected_column() == std::optional<size_t>(0), "previous from none selects 0");
  for (int i = 0; i < 5; ++i) grid.next_column();
  expect_true(grid.selected_column() == std::optional<size_t>(2), "next clamps at last column");
  grid.previous_column();
  grid.previous_column();
  grid.previous_column();
  expect_true(grid.selected_column() == std::optional<size_t>(0), "previous stops at 0");
}

void test_horizontal_scroll_clamps() {
  ResultGridModel grid;
  grid.replace({"a", "b", "c"}, {{"1", "2", "3"}});
  grid.scroll_left();
  expect_eq(grid.column_offset(), 0, "scroll_left clamps at 0");
  for (int i = 0; i < 4; ++i) grid.next_column();
  expect_true(grid.selected_column() == std::optional<size_t>(3), "last visible column");
  for (int i = 0; i < 5; ++i) grid.scroll_right();
  expect_eq(grid.column_offset(), 2, "scroll_right clamps at column_count - 1");
  expect_eq(grid.visible_column_count(), 2, "row numbers plus one data column");
  expect_true(grid.selected_column() == std::optional<size_t>(1), "selection clamped to visible columns");
  expect_true(grid.data_column_for(1) == std::optional<size_t>(2), "visible column maps past offset");
  expect_true(!grid.data_column_for(0).has_value(), "row-number column has no data index");
}

void test_copy_cell_with_scroll_offset() {
  auto clipboard = std::make_shared<sqlterm::MemoryClipboard>();
  ResultGridModel grid(clipboard);
  grid.replace({"a", "b", "c"}, {{"1", "2", "3"}, {"4", "5", "6"}});
  grid.next_row();
  grid.scroll_right();
  grid.next_column();
  grid.next_column();
  auto cell = grid.copy_selected_cell();
  expect_true(cell == std::optional<std::string>("5"), "visible column 1 is data column b");
  expect_str(clipboard->text(), "5", "cell written to clipboard");
}

void test_copy_row_number_column() {
  ResultGridModel grid;
  grid.replace({"a"}, {{"x"}, {"y"}, {"z"}});
  grid.jump_to_absolute_row(2);
  grid.next_column();
  auto cell = grid.copy_selected_cell();
  expect_true(cell == std::optional<std::string>("3"), "row-number column yields 1-based row");
}

void test_copy_cell_without_column() {
  ResultGridModel grid;
  grid.replace({"a"}, {{"x"}});
  expect_true(!grid.copy_selected_cell().has_value(), "no column selected");
}

void test_copy_row_as_json() {
  auto clipboard = std::make_shared<sqlterm::MemoryClipboard>();
  ResultGridModel grid(clipboard);
  grid.replace({"id", "name", "note"}, {{"1", "NULL", "Null"}, {"2", "bob", "null-ish"}});
  auto first = grid.copy_selected_row();
  expect_true(first == std::optional<std::string>("{\"id\":\"1\",\"name\":null,\"note\":null}"),
              "null markers become JSON null");
  grid.next_row();
  auto second = grid.copy_selected_row();
  expect_true(second == std::optional<std::string>("{\"id\":\"2\",\"name\":\"bob\",\"note\":\"null-ish\"}"),
              "only exact null markers are converted");
  expect_eq(clipboard->write_count(), 2, "each copy writes the clipboard");
}

void test_row_to_json_keeps_header_order() {
  std::string json = sqlterm::row_to_json({"zeta", "alpha"}, {"1", "say \"hi\""});
  expect_str(json, "{\"zeta\":\"1\",\"alpha\":\"say \\\"hi\\\"\"}", "header order and escaping");
}

void test_row_to_json_repeated_headers() {
  std::string json = sqlterm::row_to_json({"id", "id"}, {"1", "2"});
  expect_str(json, "{\"id\":\"1\",\"id_2\":\"2\"}", "second id renamed");
  auto keys = sqlterm::json_keys({"id", "id_2", "id"});
  expect_eq(keys.size(), 3, "one key per header");
  if (keys.size() == 3) {
    expect_str(keys[2], "id_3", "rename skips a taken name");
  }
}

void test_copy_row_arity_mismatch() {
  auto clipboard = std::make_shared<sqlterm::MemoryClipboard>();
  ResultGridModel grid(clipboard);
  grid.replace({"a", "b"}, {{"only"}});
  DiagnosticCapture capture;
  auto row = grid.copy_selected_row();
  expect_true(!row.has_value(), "mismatched row is not copied");
  expect_eq(clipboard->write_count(), 0, "clipboard untouched");
  expect_eq(capture.messages.size(), 1, "mismatch reported");
  if (!capture.messages.empty()) {
    expect_true(capture.messages[0].first == sqlterm::Severity::Error, "reported as error");
  }
}

void test_empty_result_is_inert() {
  ResultGridModel grid;
  grid.replace({"a", "b"}, {});
  expect_eq(grid.total_pages(), 0, "no pages");
  expect_true(!grid.selected_row().has_value(), "no selection");
  grid.next_row();
  grid.previous_row();
  grid.next_page();
  grid.previous_page();
  grid.next_column();
  grid.scroll_right();
  grid.adjust_column_width(4);
  grid.jump_to_absolute_row(3);
  expect_true(!grid.selected_row().has_value(), "navigation leaves no selection");
  expect_true(!grid.selected_column().has_value(), "no column selected");
  expect_eq(grid.column_offset(), 0, "no scroll");
  expect_eq(grid.current_page(), 0, "page unchanged");
  expect_true(grid.visible_rows().empty(), "no visible rows");
  expect_true(!grid.copy_selected_cell().has_value(), "no cell to copy");
  expect_true(!grid.copy_selected_row().has_value(), "no row to copy");
}

void test_replace_resets_view() {
  ResultGridModel grid;
  grid.replace({"id", "name"}, numbered_rows(250));
  grid.jump_to_absolute_row(220);
  grid.next_column();
  grid.scroll_right();
  grid.replace({"x"}, {{"1"}});
  expect_eq(grid.current_page(), 0, "page reset");
  expect_eq(grid.column_offset(), 0, "scroll reset");
  expect_true(!grid.selected_column().has_value(), "column selection reset");
  expect_true(grid.selected_row() == std::optional<size_t>(0), "row 0 selected");
}

void test_set_page_size_keeps_row() {
  ResultGridModel grid;
  grid.replace({"id", "name"}, numbered_rows(250));
  grid.jump_to_absolute_row(150);
  grid.set_page_size(20);
  expect_eq(grid.total_pages(), 13, "pages recomputed");
  expect_eq(grid.current_page(), 7, "page holding row 150");
  expect_true(grid.selected_row() == std::optional<size_t>(150), "same absolute row");
}

}  // namespace

void register_result_grid_tests(std::vector<TestCase>& tests) {
  tests.push_back({"grid_replace_computes_pages", test_replace_computes_pages});
  tests.push_back({"grid_replace_exact_multiple", test_replace_exact_multiple});
  tests.push_back({"grid_huge_page_size_is_one_page", test_huge_page_size_is_one_page});
  tests.push_back({"grid_last_page_is_partial", test_last_page_is_partial});
  tests.push_back({"grid_previous_page_clamps", test_previous_page_clamps});
  tests.push_back({"grid_rows_wrap_within_page", test_rows_wrap_within_page});
  tests.push_back({"grid_jump_to_absolute_row", test_jump_to_absolute_row});
  tests.push_back({"grid_selected_row_stays_on_page", test_selected_row_stays_on_page});
  tests.push_back({"grid_column_widths_from_content", test_column_widths_from_content});
  tests.push_back({"grid_column_widths_use_display_width", test_column_widths_use_display_width});
  tests.push_back({"grid_adjust_width_needs_selected_column", test_adjust_width_needs_selected_column});
  tests.push_back({"grid_column_selection_bounds", test_column_selection_bounds});
  tests.push_back({"grid_horizontal_scroll_clamps", test_horizontal_scroll_clamps});
  tests.push_back({"grid_copy_cell_with_scroll_offset", test_copy_cell_with_scroll_offset});
  tests.push_back({"grid_copy_row_number_column", test_copy_row_number_column});
  tests.push_back({"grid_copy_cell_without_column", test_copy_cell_without_column});
  tests.push_back({"grid_copy_row_as_json", test_copy_row_as_json});
  tests.push_back({"grid_row_to_json_keeps_header_order", test_row_to_json_keeps_header_order});
  tests.push_back({"grid_row_to_json_repeated_headers", test_row_to_json_repeated_headers});
  tests.push_back({"grid_copy_row_arity_mismatch", test_copy_row_arity_mismatch});
  tests.push_back({"grid_empty_result_is_inert", test_empty_result_is_inert});
  tests.push_back({"grid_replace_resets_view", test_replace_resets_view});
  tests.push_back({"grid_set_page_size_keeps_row", test_set_page_size_keeps_row});
}
