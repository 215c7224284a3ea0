#include "export/export_sinks.h"

#include <fstream>
#include <memory>

#ifdef SQLTERM_USE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

#include "util/string_util.h"

namespace sqlterm::cli {

namespace {

constexpr const char* kNullText = "NULL";

std::string csv_escape(const std::string& value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
  std::string out = "\"";
  for (char c : value) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

#ifdef SQLTERM_USE_ARROW
/// Copies a failed arrow status into error; returns whether st was ok.
bool arrow_ok(const arrow::Status& st, std::string& error) {
  if (st.ok()) return true;
  error = st.ToString();
  return false;
}
#endif

bool validate_rectangular(const std::vector<std::string>& headers,
                          const std::vector<std::vector<std::string>>& rows,
                          std::string& error) {
  if (headers.empty()) {
    error = "Export requires a result with columns; run a SELECT first";
    return false;
  }
  for (size_t i = 0; i < rows.size(); ++i) {
    if (rows[i].size() != headers.size()) {
      error = "Row " + std::to_string(i + 1) + " has " + std::to_string(rows[i].size()) +
              " values but the result has " + std::to_string(headers.size()) + " columns";
      return false;
    }
  }
  return true;
}

}  // namespace

ExportKind export_kind_for_path(const std::string& path) {
  std::string lower = sqlterm::util::to_lower(path);
  const std::string ext = ".parquet";
  if (lower.size() >= ext.size() && lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0) {
    return ExportKind::Parquet;
  }
  return ExportKind::Csv;
}

std::string export_kind_label(ExportKind kind) {
  return kind == ExportKind::Parquet ? "PARQUET" : "CSV";
}

bool write_csv(const std::vector<std::string>& headers,
               const std::vector<std::vector<std::string>>& rows,
               const std::string& path,
               std::string& error) {
  if (!validate_rectangular(headers, rows, error)) return false;
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    error = "Failed to open file for writing: " + path;
    return false;
  }
  for (size_t i = 0; i < headers.size(); ++i) {
    if (i > 0) out << ",";
    out << csv_escape(headers[i]);
  }
  out << "\n";
  for (const auto& row : rows) {
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0) out << ",";
      if (row[i] != kNullText) {
        out << csv_escape(row[i]);
      }
    }
    out << "\n";
  }
  if (!out) {
    error = "Failed while writing: " + path;
    return false;
  }
  return true;
}

bool write_parquet(const std::vector<std::string>& headers,
                   const std::vector<std::vector<std::string>>& rows,
                   const std::string& path,
                   std::string& error) {
  if (!validate_rectangular(headers, rows, error)) return false;
#ifdef SQLTERM_USE_ARROW
  std::vector<std::shared_ptr<arrow::Field>> fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;
  fields.reserve(headers.size());
  arrays.reserve(headers.size());
  for (size_t c = 0; c < headers.size(); ++c) {
    arrow::StringBuilder builder;
    for (const auto& row : rows) {
      if (!arrow_ok(row[c] == kNullText ? builder.AppendNull() : builder.Append(row[c]), error)) {
        return false;
      }
    }
    std::shared_ptr<arrow::Array> column;
    if (!arrow_ok(builder.Finish(&column), error)) return false;
    fields.push_back(arrow::field(headers[c], arrow::utf8(), true));
    arrays.push_back(std::move(column));
  }
  auto table = arrow::Table::Make(arrow::schema(fields), arrays);
  auto output = arrow::io::FileOutputStream::Open(path);
  if (!arrow_ok(output.status(), error)) return false;
  return arrow_ok(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), *output, 1024),
                  error);
#else
  (void)path;
  error = "Parquet export requires the Apache Arrow feature";
  return false;
#endif
}

bool export_rows(const std::vector<std::string>& headers,
                 const std::vector<std::vector<std::string>>& rows,
                 const std::string& path,
                 std::string& error) {
  if (path.empty()) {
    error = "Export requires a file path";
    return false;
  }
  if (export_kind_for_path(path) == ExportKind::Parquet) {
    return write_parquet(headers, rows, path, error);
  }
  return write_csv(headers, rows, path, error);
}

}  // namespace sqlterm::cli
