#pragma once

#include <string>

#include "sqlterm/query.h"

struct sqlite3;
struct sqlite3_stmt;

namespace sqlterm {

/// Stringifies SQLite columns of the current step of a prepared statement.
class SqliteRowStringifier : public RowStringifier<sqlite3_stmt*> {
 public:
  std::string cell_text(sqlite3_stmt* const& stmt, size_t index) const override;
};

/// DatabaseSession over a SQLite database file or ":memory:".
/// MUST own the connection for its lifetime and MUST surface sqlite errors as QueryError.
class SqliteSession : public DatabaseSession {
 public:
  /// Opens path; throws QueryError when the database cannot be opened.
  SqliteSession(const std::string& path, int busy_timeout_ms);
  ~SqliteSession() override;

  SqliteSession(const SqliteSession&) = delete;
  SqliteSession& operator=(const SqliteSession&) = delete;

  std::string backend_name() const override { return "sqlite"; }

  /// Runs a script of any statements (schema setup, seeding) without classification.
  void run_script(const std::string& sql);

 protected:
  FetchResult fetch(const std::string& sql) override;
  size_t modify(const std::string& sql) override;

 private:
  sqlite3* db_ = nullptr;
  SqliteRowStringifier stringifier_;
};

}  // namespace sqlterm
