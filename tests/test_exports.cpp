#include "test_harness.h"
#include "test_utils.h"

#include <filesystem>

#include "export/export_sinks.h"

namespace {

void test_csv_escaping() {
  auto path = std::filesystem::temp_directory_path() / "sqlterm_csv_escape_test.csv";
  std::string error;
  bool ok = sqlterm::cli::write_csv({"col1", "col2"},
                                    {{"a,b", "He said \"hi\""}, {"line1\nline2", "plain"}},
                                    path.string(), error);
  expect_true(ok, "csv escaping write ok");
  expect_true(error.empty(), "csv escaping no error");
  std::string content = read_file_to_string(path);
  std::filesystem::remove(path);
  std::string expected =
      "col1,col2\n"
      "\"a,b\",\"He said \"\"hi\"\"\"\n"
      "\"line1\nline2\",plain\n";
  expect_str(content, expected, "csv escaping content");
}

void test_csv_null_cells_are_empty() {
  auto path = std::filesystem::temp_directory_path() / "sqlterm_csv_null_test.csv";
  std::string error;
  bool ok = sqlterm::cli::write_csv({"id", "name"}, {{"1", "NULL"}, {"2", "null"}}, path.string(), error);
  expect_true(ok, "csv null write ok");
  std::string content = read_file_to_string(path);
  std::filesystem::remove(path);
  expect_str(content, "id,name\n1,\n2,null\n", "only the NULL marker is blanked");
}

void test_export_rejects_ragged_rows() {
  auto path = std::filesystem::temp_directory_path() / "sqlterm_csv_ragged_test.csv";
  std::filesystem::remove(path);
  std::string error;
  bool ok = sqlterm::cli::export_rows({"a", "b"}, {{"1", "2"}, {"3"}}, path.string(), error);
  expect_true(!ok, "ragged rows rejected");
  expect_str(error, "Row 2 has 1 values but the result has 2 columns", "ragged row message");
  expect_true(!std::filesystem::exists(path), "nothing written");
}

void test_export_requires_columns() {
  std::string error;
  bool ok = sqlterm::cli::export_rows({}, {}, "unused.csv", error);
  expect_true(!ok, "empty result rejected");
  expect_true(!error.empty(), "empty result message");
}

void test_export_kind_for_path() {
  using sqlterm::cli::ExportKind;
  expect_true(sqlterm::cli::export_kind_for_path("out.parquet") == ExportKind::Parquet, "parquet extension");
  expect_true(sqlterm::cli::export_kind_for_path("OUT.PARQUET") == ExportKind::Parquet, "case-insensitive");
  expect_true(sqlterm::cli::export_kind_for_path("out.csv") == ExportKind::Csv, "csv extension");
  expect_true(sqlterm::cli::export_kind_for_path("out") == ExportKind::Csv, "default is csv");
  expect_str(sqlterm::cli::export_kind_label(ExportKind::Parquet), "PARQUET", "label");
}

void test_export_rows_writes_csv() {
  auto path = std::filesystem::temp_directory_path() / "sqlterm_export_rows_test.csv";
  std::string error;
  bool ok = sqlterm::cli::export_rows({"id"}, {{"1"}, {"2"}}, path.string(), error);
  expect_true(ok, "export_rows ok");
  std::string content = read_file_to_string(path);
  std::filesystem::remove(path);
  expect_str(content, "id\n1\n2\n", "export_rows content");
}

void test_csv_unwritable_path() {
  std::string error;
  bool ok = sqlterm::cli::write_csv({"id"}, {{"1"}}, "/nonexistent-dir-for-sqlterm-tests/out.csv", error);
  expect_true(!ok, "unwritable path fails");
  expect_true(error.find("Failed to open file for writing") != std::string::npos, "open failure message");
}

#ifdef SQLTERM_USE_ARROW
void test_parquet_export_smoke() {
  auto path = std::filesystem::temp_directory_path() / "sqlterm_parquet_smoke.parquet";
  std::string error;
  bool ok = sqlterm::cli::export_rows({"id", "name"}, {{"1", "ann"}, {"2", "NULL"}}, path.string(), error);
  expect_true(ok, "parquet export smoke ok");
  expect_true(error.empty(), "parquet export smoke no error");
  expect_true(std::filesystem::exists(path), "parquet file created");
  if (std::filesystem::exists(path)) {
    expect_true(std::filesystem::file_size(path) > 0, "parquet file non-empty");
    std::filesystem::remove(path);
  }
}
#else
void test_parquet_requires_arrow() {
  std::string error;
  bool ok = sqlterm::cli::write_parquet({"id"}, {{"1"}}, "unused.parquet", error);
  expect_true(!ok, "parquet unavailable without arrow");
  expect_true(error.find("Apache Arrow") != std::string::npos, "explains missing feature");
}
#endif

}  // namespace

void register_export_tests(std::vector<TestCase>& tests) {
  tests.push_back({"csv_escaping", test_csv_escaping});
  tests.push_back({"csv_null_cells_are_empty", test_csv_null_cells_are_empty});
  tests.push_back({"export_rejects_ragged_rows", test_export_rejects_ragged_rows});
  tests.push_back({"export_requires_columns", test_export_requires_columns});
  tests.push_back({"export_kind_for_path", test_export_kind_for_path});
  tests.push_back({"export_rows_writes_csv", test_export_rows_writes_csv});
  tests.push_back({"csv_unwritable_path", test_csv_unwritable_path});
#ifdef SQLTERM_USE_ARROW
  tests.push_back({"parquet_export_smoke", test_parquet_export_smoke});
#else
  tests.push_back({"parquet_requires_arrow", test_parquet_requires_arrow});
#endif
}
