#include "test_harness.h"

#include "render/cell_format.h"
#include "render/duckbox_renderer.h"

namespace {

sqlterm::render::DuckboxOptions plain_options(size_t max_width, size_t max_rows) {
  sqlterm::render::DuckboxOptions options;
  options.max_width = max_width;
  options.max_rows = max_rows;
  options.highlight = false;
  options.is_tty = false;
  return options;
}

void test_duckbox_basic_table() {
  std::string out = sqlterm::render::render_duckbox({"id", "city"}, {{"1", "Oslo"}, {"22", "Lima"}},
                                                    plain_options(80, 40));
  std::string expected =
      "┌──────┬──────┐\n"
      "│ id   │ city │\n"
      "├──────┼──────┤\n"
      "│    1 │ Oslo │\n"
      "│   22 │ Lima │\n"
      "└──────┴──────┘";
  expect_str(out, expected, "duckbox basic table");
}

void test_duckbox_truncate_cells() {
  std::string out = sqlterm::render::render_duckbox({"query"}, {{"abcdefghijklmnopqrstuvwxyz"}},
                                                    plain_options(20, 40));
  std::string expected =
      "┌──────────────────┐\n"
      "│ query            │\n"
      "├──────────────────┤\n"
      "│ abcdefghijklmno… │\n"
      "└──────────────────┘";
  expect_str(out, expected, "duckbox truncates wide cells");
}

void test_duckbox_maxrows_truncate() {
  std::string out = sqlterm::render::render_duckbox({"first_name_column", "last_name_column"},
                                                    {{"a", "b"}, {"c", "d"}, {"e", "f"}},
                                                    plain_options(120, 2));
  std::string expected =
      "┌───────────────────┬──────────────────┐\n"
      "│ first_name_column │ last_name_column │\n"
      "├───────────────────┼──────────────────┤\n"
      "│ a                 │ b                │\n"
      "│ c                 │ d                │\n"
      "│ … truncated, showing first 2 of 3 r… │\n"
      "└───────────────────┴──────────────────┘";
  expect_str(out, expected, "duckbox maxrows truncation");
}

void test_duckbox_null_rendering() {
  std::string out = sqlterm::render::render_duckbox({"name", "deleted_at"}, {{"ann", "NULL"}},
                                                    plain_options(80, 40));
  std::string expected =
      "┌──────┬────────────┐\n"
      "│ name │ deleted_at │\n"
      "├──────┼────────────┤\n"
      "│ ann  │ NULL       │\n"
      "└──────┴────────────┘";
  expect_str(out, expected, "duckbox null rendering");
}

void test_duckbox_flattens_multiline_cells() {
  std::string out = sqlterm::render::render_duckbox({"note"}, {{"a\nb"}}, plain_options(80, 40));
  expect_true(out.find("│ a b  │") != std::string::npos, "newline rendered as space");
}

void test_duckbox_without_columns() {
  std::string out = sqlterm::render::render_duckbox({}, {}, plain_options(80, 40));
  expect_str(out, "(no columns)", "no headers");
}

void test_is_numeric() {
  using sqlterm::render::is_numeric;
  expect_true(is_numeric("42"), "integer");
  expect_true(is_numeric("-3.5"), "negative decimal");
  expect_true(is_numeric("1.5e+10"), "exponent form of a real");
  expect_true(is_numeric("+7"), "explicit plus sign");
  expect_true(!is_numeric("1e"), "exponent without digits");
  expect_true(!is_numeric("."), "lone dot");
  expect_true(!is_numeric("1.2.3"), "two dots");
  expect_true(!is_numeric("-"), "sign only");
  expect_true(!is_numeric("NULL"), "null marker");
  expect_true(!is_numeric(""), "empty");
  expect_true(!is_numeric("X'0A'"), "blob literal");
}

void test_truncate_with_ellipsis() {
  using sqlterm::render::truncate_with_ellipsis;
  expect_str(truncate_with_ellipsis("short", 10), "short", "fits unchanged");
  expect_str(truncate_with_ellipsis("abcdef", 4), "abc…", "cut with ellipsis");
  expect_str(truncate_with_ellipsis("東京都", 5), "東京…", "wide glyphs never split");
  expect_str(truncate_with_ellipsis("abc", 0), "", "zero width");
}

void test_fit_cell() {
  using sqlterm::render::fit_cell;
  expect_str(fit_cell("7", 4, true), "   7", "right aligned");
  expect_str(fit_cell("ab", 4, false), "ab  ", "left aligned");
  expect_str(fit_cell("abcdef", 4, false), "abc…", "truncated to width");
}

}  // namespace

void register_render_tests(std::vector<TestCase>& tests) {
  tests.push_back({"duckbox_basic_table", test_duckbox_basic_table});
  tests.push_back({"duckbox_truncate_cells", test_duckbox_truncate_cells});
  tests.push_back({"duckbox_maxrows_truncate", test_duckbox_maxrows_truncate});
  tests.push_back({"duckbox_null_rendering", test_duckbox_null_rendering});
  tests.push_back({"duckbox_flattens_multiline_cells", test_duckbox_flattens_multiline_cells});
  tests.push_back({"duckbox_without_columns", test_duckbox_without_columns});
  tests.push_back({"render_is_numeric", test_is_numeric});
  tests.push_back({"render_truncate_with_ellipsis", test_truncate_with_ellipsis});
  tests.push_back({"render_fit_cell", test_fit_cell});
}
