#include "sqlterm/query.h"

#include "util/string_util.h"

namespace sqlterm {

QueryKind classify_query(const std::string& sql) {
  std::string keyword = util::to_upper(util::first_token(sql));
  if (keyword == "SELECT") return QueryKind::Select;
  if (keyword == "INSERT") return QueryKind::Insert;
  if (keyword == "UPDATE") return QueryKind::Update;
  if (keyword == "DELETE") return QueryKind::Delete;
  return QueryKind::Unknown;
}

const char* query_kind_label(QueryKind kind) {
  switch (kind) {
    case QueryKind::Select:
      return "SELECT";
    case QueryKind::Insert:
      return "INSERT";
    case QueryKind::Update:
      return "UPDATE";
    case QueryKind::Delete:
      return "DELETE";
    case QueryKind::Unknown:
      break;
  }
  return "UNKNOWN";
}

std::string rows_fetched_message(size_t rows, std::chrono::milliseconds elapsed) {
  return "Successfully run. Total query runtime: " + std::to_string(elapsed.count()) +
         " ms.\n" + std::to_string(rows) + " rows fetched.";
}

std::string rows_affected_message(QueryKind kind, size_t rows, std::chrono::milliseconds elapsed) {
  return std::string(query_kind_label(kind)) + " " + std::to_string(rows) +
         " rows affected.\nQuery completed in " + std::to_string(elapsed.count()) + " msec.";
}

}  // namespace sqlterm
