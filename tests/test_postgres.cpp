#include "test_harness.h"

#ifdef SQLTERM_USE_POSTGRES

#include <libpq-fe.h>

#include "sqlterm/postgres_session.h"

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

struct Column {
  std::string name;
  Oid type;
};

/// Builds a client-side result with one tuple; a null pointer cell becomes SQL NULL.
PGresult* make_result(std::vector<Column> columns, const std::vector<const char*>& cells) {
  PGresult* result = PQmakeEmptyPGresult(nullptr, PGRES_TUPLES_OK);
  std::vector<PGresAttDesc> attrs(columns.size());
  for (size_t i = 0; i < columns.size(); ++i) {
    attrs[i].name = columns[i].name.data();
    attrs[i].tableid = 0;
    attrs[i].columnid = 0;
    attrs[i].format = 0;
    attrs[i].typid = columns[i].type;
    attrs[i].typlen = -1;
    attrs[i].atttypmod = -1;
  }
  PQsetResultAttrs(result, static_cast<int>(attrs.size()), attrs.data());
  for (size_t i = 0; i < cells.size(); ++i) {
    if (!cells[i]) {
      PQsetvalue(result, 0, static_cast<int>(i), nullptr, -1);
      continue;
    }
    std::string value = cells[i];
    PQsetvalue(result, 0, static_cast<int>(i), value.data(), static_cast<int>(value.size()));
  }
  return result;
}

void test_stringifier_by_type() {
  PGresult* result = make_result({{"name", 25},
                                  {"small", 21},
                                  {"big", 20},
                                  {"ratio", 701},
                                  {"active", 16},
                                  {"id", 2950},
                                  {"born", 1082},
                                  {"doc", 3802},
                                  {"raw", 17},
                                  {"price", 1700},
                                  {"missing", 25}},
                                 {"ann", "-3", "9007199254740993", "0.5", "t",
                                  "a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11", "2024-02-29",
                                  "{\"k\": 1}", "\\x00ff10", "12.50", nullptr});
  sqlterm::PgRowStringifier stringifier;
  sqlterm::PgRow row{result, 0};
  expect_str(stringifier.cell_text(row, 0), "ann", "text");
  expect_str(stringifier.cell_text(row, 1), "-3", "int2");
  expect_str(stringifier.cell_text(row, 2), "9007199254740993", "int8 keeps every digit");
  expect_str(stringifier.cell_text(row, 3), "0.5", "float8");
  expect_str(stringifier.cell_text(row, 4), "true", "bool spelled out");
  expect_str(stringifier.cell_text(row, 5), "a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11", "uuid");
  expect_str(stringifier.cell_text(row, 6), "2024-02-29", "date");
  expect_str(stringifier.cell_text(row, 7), "{\"k\": 1}", "jsonb");
  expect_str(stringifier.cell_text(row, 8), "X'00FF10'", "bytea as hex literal");
  expect_str(stringifier.cell_text(row, 9), "12.50", "numeric keeps server text");
  expect_str(stringifier.cell_text(row, 10), "NULL", "null");
  PQclear(result);
}

void test_false_bool() {
  PGresult* result = make_result({{"flag", 16}}, {"f"});
  sqlterm::PgRowStringifier stringifier;
  expect_str(stringifier.cell_text(sqlterm::PgRow{result, 0}, 0), "false", "false spelled out");
  PQclear(result);
}

void test_bad_conninfo_is_query_error() {
  std::string message;
  try {
    sqlterm::PostgresSession session("not_a_keyword=1", 0);
  } catch (const sqlterm::QueryError& ex) {
    message = ex.what();
  }
  expect_true(starts_with(message, "Failed to connect to postgres: "), "connect failure surfaced");
  expect_true(message.find("not_a_keyword") != std::string::npos, "libpq reason kept");

  sqlterm::ConnectionConfig config;
  config.backend = "PostgreSQL";
  config.path = "not_a_keyword=1";
  message.clear();
  try {
    sqlterm::open_session(config);
  } catch (const sqlterm::QueryError& ex) {
    message = ex.what();
  }
  expect_true(starts_with(message, "Failed to connect to postgres: "), "open_session reaches libpq");
}

}  // namespace

void register_postgres_tests(std::vector<TestCase>& tests) {
  tests.push_back({"postgres_stringifier_by_type", test_stringifier_by_type});
  tests.push_back({"postgres_false_bool", test_false_bool});
  tests.push_back({"postgres_bad_conninfo_is_query_error", test_bad_conninfo_is_query_error});
}

#else

void register_postgres_tests(std::vector<TestCase>&) {}

#endif
