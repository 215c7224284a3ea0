#pragma once

#include <string>
#include <vector>

namespace sqlterm::cli {

/// File formats the :export command can write.
enum class ExportKind { Csv, Parquet };

/// Picks Parquet for ".parquet" paths (any case) and CSV otherwise.
ExportKind export_kind_for_path(const std::string& path);
/// Returns "CSV" or "PARQUET" for status messages.
std::string export_kind_label(ExportKind kind);

/// Writes a rectangular result to path in the format chosen by its extension.
/// MUST fail without writing when headers are empty, and MUST fill error on failure.
bool export_rows(const std::vector<std::string>& headers,
                 const std::vector<std::vector<std::string>>& rows,
                 const std::string& path,
                 std::string& error);
/// Writes RFC 4180 style CSV with a header line; "NULL" cells are written empty.
bool write_csv(const std::vector<std::string>& headers,
               const std::vector<std::vector<std::string>>& rows,
               const std::string& path,
               std::string& error);
/// Writes a Parquet file with nullable UTF-8 columns; "NULL" cells become nulls.
/// MUST fail with an explanatory error when built without Arrow.
bool write_parquet(const std::vector<std::string>& headers,
                   const std::vector<std::vector<std::string>>& rows,
                   const std::string& path,
                   std::string& error);

}  // namespace sqlterm::cli
