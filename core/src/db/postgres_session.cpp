#include "sqlterm/postgres_session.h"

#include <libpq-fe.h>

#include <cstdlib>

#include "sqlterm/diagnostics.h"
#include "util/string_util.h"

namespace sqlterm {

namespace {

// Built-in type oids from pg_type; they are fixed across server versions.
constexpr Oid kBoolOid = 16;
constexpr Oid kByteaOid = 17;
constexpr Oid kCharOid = 18;
constexpr Oid kNameOid = 19;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kTextOid = 25;
constexpr Oid kJsonOid = 114;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;
constexpr Oid kBpcharOid = 1042;
constexpr Oid kVarcharOid = 1043;
constexpr Oid kDateOid = 1082;
constexpr Oid kTimeOid = 1083;
constexpr Oid kTimestampOid = 1114;
constexpr Oid kTimestamptzOid = 1184;
constexpr Oid kUuidOid = 2950;
constexpr Oid kJsonbOid = 3802;

/// Clears a PGresult when the owning scope exits.
class ResultGuard {
 public:
  explicit ResultGuard(PGresult* result) : result_(result) {}
  ~ResultGuard() {
    if (result_) PQclear(result_);
  }
  ResultGuard(const ResultGuard&) = delete;
  ResultGuard& operator=(const ResultGuard&) = delete;

  PGresult* get() const { return result_; }

 private:
  PGresult* result_;
};

std::string connection_error(PGconn* conn) {
  std::string message = conn ? util::trim_ws(PQerrorMessage(conn)) : "out of memory";
  return message.empty() ? "unknown libpq error" : message;
}

std::string result_error(PGconn* conn, const PGresult* result) {
  if (result) {
    std::string message = util::trim_ws(PQresultErrorMessage(result));
    if (!message.empty()) return message;
  }
  return connection_error(conn);
}

bool is_text_type(Oid type) {
  return type == kTextOid || type == kVarcharOid || type == kBpcharOid || type == kNameOid ||
         type == kCharOid;
}

bool is_temporal_type(Oid type) {
  return type == kUuidOid || type == kDateOid || type == kTimestampOid || type == kTimeOid ||
         type == kTimestamptzOid;
}

std::string bytea_text(const char* raw) {
  size_t length = 0;
  unsigned char* bytes = PQunescapeBytea(reinterpret_cast<const unsigned char*>(raw), &length);
  if (!bytes) {
    throw QueryError("Failed to decode bytea value");
  }
  std::string out = util::hex_blob_literal(bytes, length);
  PQfreemem(bytes);
  return out;
}

/// Runs sql and checks the status; the caller owns the returned result.
PGresult* exec_checked(PGconn* conn, const std::string& sql) {
  PGresult* result = PQexec(conn, sql.c_str());
  ExecStatusType status = result ? PQresultStatus(result) : PGRES_FATAL_ERROR;
  if (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK) {
    return result;
  }
  std::string message = result_error(conn, result);
  if (result) PQclear(result);
  throw QueryError(message);
}

}  // namespace

std::string PgRowStringifier::cell_text(const PgRow& row, size_t index) const {
  int col = static_cast<int>(index);
  if (PQgetisnull(row.result, row.tuple, col)) return "NULL";
  const char* raw = PQgetvalue(row.result, row.tuple, col);
  std::string value = raw ? raw : "";
  Oid type = PQftype(row.result, col);
  if (is_text_type(type)) return value;
  if (type == kInt2Oid || type == kInt4Oid || type == kInt8Oid) return value;
  if (type == kFloat4Oid || type == kFloat8Oid) return value;
  if (type == kBoolOid) return value == "t" ? "true" : "false";
  if (is_temporal_type(type)) return value;
  if (type == kJsonOid || type == kJsonbOid) return value;
  if (type == kByteaOid) return bytea_text(raw ? raw : "");
  // numeric, interval, arrays and user types keep the server's text form.
  return value;
}

PostgresSession::PostgresSession(const std::string& conninfo, int lock_timeout_ms) {
  conn_ = PQconnectdb(conninfo.c_str());
  if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
    std::string message = connection_error(conn_);
    if (conn_) PQfinish(conn_);
    conn_ = nullptr;
    throw QueryError("Failed to connect to postgres: " + message);
  }
  if (lock_timeout_ms > 0) {
    try {
      ResultGuard set(exec_checked(conn_, "SET lock_timeout = " + std::to_string(lock_timeout_ms)));
    } catch (const QueryError&) {
      PQfinish(conn_);
      conn_ = nullptr;
      throw;
    }
  }
}

PostgresSession::~PostgresSession() {
  if (conn_) PQfinish(conn_);
}

void PostgresSession::run_script(const std::string& sql) {
  ResultGuard result(exec_checked(conn_, sql));
}

DatabaseSession::FetchResult PostgresSession::fetch(const std::string& sql) {
  ResultGuard result(exec_checked(conn_, sql));
  FetchResult fetched;
  if (PQresultStatus(result.get()) != PGRES_TUPLES_OK) {
    report(Severity::Warning, "Statement returned no result set");
    return fetched;
  }
  int columns = PQnfields(result.get());
  int tuples = PQntuples(result.get());
  fetched.headers.reserve(static_cast<size_t>(columns));
  for (int i = 0; i < columns; ++i) {
    const char* name = PQfname(result.get(), i);
    fetched.headers.push_back(name ? name : "");
  }
  fetched.rows.reserve(static_cast<size_t>(tuples));
  for (int t = 0; t < tuples; ++t) {
    PgRow row{result.get(), t};
    std::vector<std::string> cells;
    cells.reserve(static_cast<size_t>(columns));
    for (int i = 0; i < columns; ++i) {
      cells.push_back(stringifier_.cell_text(row, static_cast<size_t>(i)));
    }
    fetched.rows.push_back(std::move(cells));
  }
  return fetched;
}

size_t PostgresSession::modify(const std::string& sql) {
  ResultGuard result(exec_checked(conn_, sql));
  const char* affected = PQcmdTuples(result.get());
  if (!affected || *affected == '\0') return 0;
  return static_cast<size_t>(std::strtoull(affected, nullptr, 10));
}

}  // namespace sqlterm
