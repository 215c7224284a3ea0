#include "sqlterm/query.h"

#include "sqlterm/query_stats.h"
#include "sqlterm/sqlite_session.h"
#include "util/string_util.h"

#ifdef SQLTERM_USE_POSTGRES
#include "sqlterm/postgres_session.h"
#endif

namespace sqlterm {

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
}

}  // namespace

QueryOutcome DatabaseSession::execute(const std::string& sql, QueryStatsContext* stats) {
  QueryKind kind = classify_query(sql);
  if (kind == QueryKind::Unknown) {
    throw QueryError("Unsupported query: expected SELECT, INSERT, UPDATE or DELETE");
  }

  QueryOutcome outcome;
  outcome.query_kind = kind;
  auto start = std::chrono::steady_clock::now();
  if (kind == QueryKind::Select) {
    FetchResult fetched = fetch(sql);
    outcome.elapsed = elapsed_since(start);
    outcome.kind = QueryOutcome::Kind::Rows;
    outcome.row_count = fetched.rows.size();
    outcome.headers = std::move(fetched.headers);
    outcome.rows = std::move(fetched.rows);
    outcome.message = rows_fetched_message(outcome.row_count, outcome.elapsed);
  } else {
    size_t affected = modify(sql);
    outcome.elapsed = elapsed_since(start);
    outcome.kind = QueryOutcome::Kind::Affected;
    outcome.row_count = affected;
    outcome.message = rows_affected_message(kind, affected, outcome.elapsed);
  }
  if (stats) {
    stats->update(outcome.row_count, outcome.elapsed);
  }
  return outcome;
}

std::unique_ptr<DatabaseSession> open_session(const ConnectionConfig& config) {
  std::string backend = util::to_lower(config.backend);
  if (backend == "sqlite" || backend == "sqlite3") {
    return std::make_unique<SqliteSession>(config.path, config.busy_timeout_ms);
  }
  if (backend == "postgres" || backend == "postgresql") {
#ifdef SQLTERM_USE_POSTGRES
    // ":memory:" is the sqlite default; libpq then falls back to PGHOST and friends.
    std::string conninfo = config.path == ":memory:" ? std::string() : config.path;
    return std::make_unique<PostgresSession>(conninfo, config.busy_timeout_ms);
#else
    throw QueryError("Backend '" + config.backend + "' is not built into this binary");
#endif
  }
  if (backend == "mysql") {
    throw QueryError("Backend '" + config.backend + "' is not built into this binary");
  }
  throw QueryError("Unknown backend: " + config.backend);
}

}  // namespace sqlterm
