#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sqlterm {

class QueryStatsContext;

/// Statement category derived from the first token of the SQL text.
enum class QueryKind { Select, Insert, Update, Delete, Unknown };

/// Classifies SQL by its first whitespace-delimited token, ignoring case.
/// MUST return Unknown for empty input or any other leading keyword.
QueryKind classify_query(const std::string& sql);

/// Returns "SELECT", "INSERT", "UPDATE", "DELETE" or "UNKNOWN".
const char* query_kind_label(QueryKind kind);

/// Raised when a statement cannot be executed (unsupported kind, backend failure).
/// MUST carry a message suitable for the status line.
class QueryError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Result of one executed statement.
/// MUST fill headers/rows only for Kind::Rows; row_count is rows fetched or rows affected.
struct QueryOutcome {
  enum class Kind { Rows, Affected } kind = Kind::Rows;
  QueryKind query_kind = QueryKind::Select;
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> rows;
  size_t row_count = 0;
  std::chrono::milliseconds elapsed{0};
  std::string message;
};

/// Builds "Successfully run. Total query runtime: <ms> ms.\n<n> rows fetched."
std::string rows_fetched_message(size_t rows, std::chrono::milliseconds elapsed);
/// Builds "<KIND> <n> rows affected.\nQuery completed in <ms> msec."
std::string rows_affected_message(QueryKind kind, size_t rows, std::chrono::milliseconds elapsed);

/// Converts one native cell of a backend row to display text.
/// MUST check types in a fixed order (integer, real, text, blob) and yield "NULL" for nulls.
/// One implementation exists per backend and is chosen once per session.
template <typename Row>
class RowStringifier {
 public:
  virtual ~RowStringifier() = default;
  virtual std::string cell_text(const Row& row, size_t index) const = 0;
};

/// Connection parameters for open_session.
struct ConnectionConfig {
  std::string backend = "sqlite";
  /// Database file path, or ":memory:"; a libpq connection string for postgres.
  std::string path = ":memory:";
  /// sqlite busy timeout, or postgres lock_timeout.
  int busy_timeout_ms = 5000;
};

/// A live connection that runs one statement at a time.
/// MUST classify before executing and MUST throw QueryError for Unknown statements.
/// Inputs are SQL strings; side effects are database changes and stats updates.
class DatabaseSession {
 public:
  virtual ~DatabaseSession() = default;

  /// Classifies, executes and times sql; records rows/elapsed in stats when given.
  QueryOutcome execute(const std::string& sql, QueryStatsContext* stats = nullptr);

  virtual std::string backend_name() const = 0;

 protected:
  struct FetchResult {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
  };

  /// Runs a row-returning statement.
  virtual FetchResult fetch(const std::string& sql) = 0;
  /// Runs a modifying statement and returns the affected row count.
  virtual size_t modify(const std::string& sql) = 0;
};

/// Opens a session for config.backend.
/// MUST throw QueryError for unknown backends and for backends not built into this binary.
std::unique_ptr<DatabaseSession> open_session(const ConnectionConfig& config);

}  // namespace sqlterm
