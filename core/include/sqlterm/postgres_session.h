#pragma once

#include <string>

#include "sqlterm/query.h"

struct pg_conn;
struct pg_result;

namespace sqlterm {

/// One tuple of a libpq result set.
struct PgRow {
  const pg_result* result = nullptr;
  int tuple = 0;
};

/// Stringifies libpq text-format columns by their type oid.
/// MUST convert text, int2, int4, int8, float4, float8, bool, uuid, date, timestamp, time,
/// timestamptz, json/jsonb and bytea in that order, and yield "NULL" for nulls.
class PgRowStringifier : public RowStringifier<PgRow> {
 public:
  std::string cell_text(const PgRow& row, size_t index) const override;
};

/// DatabaseSession over a libpq connection.
/// MUST own the connection for its lifetime and MUST surface server errors as QueryError.
class PostgresSession : public DatabaseSession {
 public:
  /// Connects with a libpq connection string ("host=... dbname=..." or a postgresql:// URI).
  /// A positive lock_timeout_ms bounds how long statements wait on row or table locks.
  PostgresSession(const std::string& conninfo, int lock_timeout_ms);
  ~PostgresSession() override;

  PostgresSession(const PostgresSession&) = delete;
  PostgresSession& operator=(const PostgresSession&) = delete;

  std::string backend_name() const override { return "postgres"; }

  /// Runs a script of any statements without classification.
  void run_script(const std::string& sql);

 protected:
  FetchResult fetch(const std::string& sql) override;
  size_t modify(const std::string& sql) override;

 private:
  pg_conn* conn_ = nullptr;
  PgRowStringifier stringifier_;
};

}  // namespace sqlterm
