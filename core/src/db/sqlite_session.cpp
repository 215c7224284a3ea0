#include "sqlterm/sqlite_session.h"

#include <sqlite3.h>

#include "sqlterm/diagnostics.h"
#include "util/string_util.h"

namespace sqlterm {

namespace {

/// Finalizes a prepared statement when the owning scope exits.
class StatementGuard {
 public:
  explicit StatementGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
  ~StatementGuard() {
    if (stmt_) sqlite3_finalize(stmt_);
  }
  StatementGuard(const StatementGuard&) = delete;
  StatementGuard& operator=(const StatementGuard&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

 private:
  sqlite3_stmt* stmt_;
};

sqlite3_stmt* prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  const char* tail = nullptr;
  int rc = sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &stmt, &tail);
  if (rc != SQLITE_OK) {
    throw QueryError(sqlite3_errmsg(db));
  }
  if (!stmt) {
    throw QueryError("Empty statement");
  }
  if (tail && !util::trim_ws(tail).empty() && util::trim_ws(tail) != ";") {
    report(Severity::Warning, "Only the first statement was executed");
  }
  return stmt;
}

}  // namespace

std::string SqliteRowStringifier::cell_text(sqlite3_stmt* const& stmt, size_t index) const {
  int col = static_cast<int>(index);
  switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_INTEGER:
      return std::to_string(sqlite3_column_int64(stmt, col));
    case SQLITE_FLOAT:
    case SQLITE_TEXT: {
      const unsigned char* text = sqlite3_column_text(stmt, col);
      int bytes = sqlite3_column_bytes(stmt, col);
      if (!text) return "NULL";
      return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(bytes));
    }
    case SQLITE_BLOB: {
      const void* blob = sqlite3_column_blob(stmt, col);
      int bytes = sqlite3_column_bytes(stmt, col);
      return util::hex_blob_literal(static_cast<const unsigned char*>(blob),
                                    static_cast<size_t>(bytes));
    }
    case SQLITE_NULL:
    default:
      return "NULL";
  }
}

SqliteSession::SqliteSession(const std::string& path, int busy_timeout_ms) {
  int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw QueryError("Failed to open database '" + path + "': " + message);
  }
  if (busy_timeout_ms > 0) {
    sqlite3_busy_timeout(db_, busy_timeout_ms);
  }
}

SqliteSession::~SqliteSession() {
  if (db_) sqlite3_close(db_);
}

void SqliteSession::run_script(const std::string& sql) {
  char* errmsg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
  if (rc != SQLITE_OK) {
    std::string message = errmsg ? errmsg : sqlite3_errmsg(db_);
    sqlite3_free(errmsg);
    throw QueryError(message);
  }
}

DatabaseSession::FetchResult SqliteSession::fetch(const std::string& sql) {
  StatementGuard stmt(prepare(db_, sql));
  FetchResult result;
  int columns = sqlite3_column_count(stmt.get());
  result.headers.reserve(static_cast<size_t>(columns));
  for (int i = 0; i < columns; ++i) {
    const char* name = sqlite3_column_name(stmt.get(), i);
    result.headers.push_back(name ? name : "");
  }
  while (true) {
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) {
      throw QueryError(sqlite3_errmsg(db_));
    }
    std::vector<std::string> row;
    row.reserve(static_cast<size_t>(columns));
    for (int i = 0; i < columns; ++i) {
      row.push_back(stringifier_.cell_text(stmt.get(), static_cast<size_t>(i)));
    }
    result.rows.push_back(std::move(row));
  }
  return result;
}

size_t SqliteSession::modify(const std::string& sql) {
  StatementGuard stmt(prepare(db_, sql));
  int rc = SQLITE_ROW;
  while (rc == SQLITE_ROW) {
    rc = sqlite3_step(stmt.get());
  }
  if (rc != SQLITE_DONE) {
    throw QueryError(sqlite3_errmsg(db_));
  }
  return static_cast<size_t>(sqlite3_changes(db_));
}

}  // namespace sqlterm
