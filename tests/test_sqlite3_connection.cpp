// Copyright (c) 2024 liudegui. MIT License.
// Tests for sqlreq::Sqlite3Connection.

#include <catch2/catch.hpp>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include "sqlreq/sqlite3_connection.hpp"

using namespace sqlreq;

static const char* kTestDb = ":memory:";

namespace {

QueryGenerator Sql(std::vector<Query> parts) {
  Query q = Query::S(std::move(parts));
  return [q](const DriverInfo&, Query* out) {
    *out = q;
    return Error::Ok();
  };
}

Error Run(Sqlite3Connection* conn, std::optional<uint64_t> id,
          const QueryGenerator& build, const std::vector<Value>& params = {},
          const std::vector<FieldKind>& kinds = {},
          std::vector<std::vector<Value>>* rows = nullptr,
          int64_t* affected = nullptr) {
  std::optional<QueryKey> key;
  if (id.has_value()) { key = QueryKey{0, *id}; }
  return conn->Execute(key, build, params, kinds,
                       [rows](const std::vector<Value>& row) {
                         if (rows != nullptr) { rows->push_back(row); }
                         return Error::Ok();
                       },
                       affected);
}

// Open an in-memory db with an emp table.
Sqlite3Connection OpenTestDb() {
  Sqlite3Connection conn;
  REQUIRE(conn.Open(kTestDb).ok());
  REQUIRE(Run(&conn, std::nullopt,
              Sql({Query::L("CREATE TABLE emp(empno INTEGER, empname TEXT)")}))
              .ok());
  return conn;
}

}  // namespace

TEST_CASE("Sqlite3Connection: open and close", "[sqlite3_connection]") {
  Sqlite3Connection conn;
  REQUIRE_FALSE(conn.IsOpen());
  REQUIRE(conn.Open(kTestDb).ok());
  REQUIRE(conn.IsOpen());
  REQUIRE(conn.Info().dialect == Dialect::kSqlite);
  REQUIRE(conn.Info().style == ParamStyle::kLinear);
  conn.Close();
  REQUIRE_FALSE(conn.IsOpen());
}

TEST_CASE("Sqlite3Connection: open null path", "[sqlite3_connection]") {
  Sqlite3Connection conn;
  REQUIRE(conn.Open(nullptr).code == ErrorCode::kNullParam);
}

TEST_CASE("Sqlite3Connection: execute on closed connection",
          "[sqlite3_connection]") {
  Sqlite3Connection conn;
  Error err = Run(&conn, std::nullopt, Sql({Query::L("SELECT 1")}));
  REQUIRE(err.code == ErrorCode::kNotOpen);
}

TEST_CASE("Sqlite3Connection: move semantics", "[sqlite3_connection]") {
  Sqlite3Connection a = OpenTestDb();
  REQUIRE(Run(&a, 1, Sql({Query::L("SELECT count(*) FROM emp")}), {},
              {FieldKind::kInt}).ok());
  REQUIRE(a.CachedStatementCount() == 1);

  Sqlite3Connection b(std::move(a));
  REQUIRE(b.IsOpen());
  REQUIRE_FALSE(a.IsOpen());
  REQUIRE(b.CachedStatementCount() == 1);

  Sqlite3Connection c;
  c = std::move(b);
  REQUIRE(c.IsOpen());
  REQUIRE_FALSE(b.IsOpen());
}

TEST_CASE("Sqlite3Connection: statements are prepared once per identity",
          "[sqlite3_connection]") {
  Sqlite3Connection conn = OpenTestDb();
  int builds = 0;
  QueryGenerator build = [&builds](const DriverInfo&, Query* out) {
    ++builds;
    *out = Query::S({Query::L("INSERT INTO emp VALUES("), Query::P(0),
                     Query::L(", "), Query::P(1), Query::L(")")});
    return Error::Ok();
  };
  for (int64_t i = 0; i < 5; ++i) {
    int64_t affected = 0;
    REQUIRE(Run(&conn, 42, build,
                {Value::OfInt(FieldKind::kInt, i), Value::OfString("x")}, {},
                nullptr, &affected).ok());
    REQUIRE(affected == 1);
  }
  REQUIRE(builds == 1);
  REQUIRE(conn.CachedStatementCount() == 1);
}

TEST_CASE("Sqlite3Connection: oneshot statements are not cached",
          "[sqlite3_connection]") {
  Sqlite3Connection conn = OpenTestDb();
  for (int i = 0; i < 3; ++i) {
    REQUIRE(Run(&conn, std::nullopt,
                Sql({Query::L("INSERT INTO emp VALUES(1, 'a')")})).ok());
  }
  REQUIRE(conn.CachedStatementCount() == 0);

  std::vector<std::vector<Value>> rows;
  REQUIRE(Run(&conn, std::nullopt, Sql({Query::L("SELECT count(*) FROM emp")}),
              {}, {FieldKind::kInt}, &rows).ok());
  REQUIRE(rows.size() == 1);
  REQUIRE(rows[0][0].i == 3);
}

TEST_CASE("Sqlite3Connection: repeated parameters are duplicated",
          "[sqlite3_connection]") {
  Sqlite3Connection conn;
  REQUIRE(conn.Open(kTestDb).ok());
  std::vector<std::vector<Value>> rows;
  REQUIRE(Run(&conn, std::nullopt,
              Sql({Query::L("SELECT "), Query::P(1), Query::L(" - "),
                   Query::P(0), Query::L(" * "), Query::P(1)}),
              {Value::OfInt(FieldKind::kInt, 2), Value::OfInt(FieldKind::kInt, 10)},
              {FieldKind::kInt}, &rows).ok());
  REQUIRE(rows.size() == 1);
  REQUIRE(rows[0][0].i == 10 - 2 * 10);
}

TEST_CASE("Sqlite3Connection: quoted text is escaped", "[sqlite3_connection]") {
  Sqlite3Connection conn;
  REQUIRE(conn.Open(kTestDb).ok());
  std::vector<std::vector<Value>> rows;
  REQUIRE(Run(&conn, std::nullopt,
              Sql({Query::L("SELECT "), Query::Q("it's $1 ?")}), {},
              {FieldKind::kString}, &rows).ok());
  REQUIRE(rows[0][0].s == "it's $1 ?");
}

TEST_CASE("Sqlite3Connection: field kinds round-trip", "[sqlite3_connection]") {
  Sqlite3Connection conn;
  REQUIRE(conn.Open(kTestDb).ok());
  REQUIRE(Run(&conn, std::nullopt,
              Sql({Query::L("CREATE TABLE v(b INTEGER, f REAL, o BLOB, "
                            "d TEXT, t TEXT, s REAL, n TEXT)")})).ok());
  std::vector<Value> values = {
      Value::OfBool(true),
      Value::OfFloat(0.25),
      Value::OfOctets(std::string("a\0b", 3)),
      Value::OfDate(Date{DaysFromCivil(2024, 2, 29)}),
      Value::OfTime(Timestamp{1700000000LL * 1000000 + 123456}),
      Value::OfSpan(Span{-1500000}),
      Value::Null(FieldKind::kString),
  };
  std::vector<Query> parts = {Query::L("INSERT INTO v VALUES(")};
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) { parts.push_back(Query::L(", ")); }
    parts.push_back(Query::P(i));
  }
  parts.push_back(Query::L(")"));
  REQUIRE(Run(&conn, std::nullopt, Sql(parts), values).ok());

  std::vector<FieldKind> kinds = {FieldKind::kBool,  FieldKind::kFloat,
                                  FieldKind::kOctets, FieldKind::kDate,
                                  FieldKind::kTime,  FieldKind::kSpan,
                                  FieldKind::kString};
  std::vector<std::vector<Value>> rows;
  REQUIRE(Run(&conn, std::nullopt, Sql({Query::L("SELECT * FROM v")}), {},
              kinds, &rows).ok());
  REQUIRE(rows.size() == 1);
  const std::vector<Value>& r = rows[0];
  REQUIRE(r[0].b);
  REQUIRE(r[1].f == 0.25);
  REQUIRE(r[2].s == std::string("a\0b", 3));
  REQUIRE(FormatDate(Date{static_cast<int32_t>(r[3].i)}) == "2024-02-29");
  REQUIRE(r[4].i == values[4].i);
  REQUIRE(r[5].i == -1500000);
  REQUIRE(r[6].is_null);
}

TEST_CASE("Sqlite3Connection: column count must match the row type",
          "[sqlite3_connection]") {
  Sqlite3Connection conn;
  REQUIRE(conn.Open(kTestDb).ok());
  Error err = Run(&conn, std::nullopt, Sql({Query::L("SELECT 1, 2")}), {},
                  {FieldKind::kInt});
  REQUIRE(err.code == ErrorCode::kCoding);
}

TEST_CASE("Sqlite3Connection: unparsable date column", "[sqlite3_connection]") {
  Sqlite3Connection conn;
  REQUIRE(conn.Open(kTestDb).ok());
  Error err = Run(&conn, std::nullopt, Sql({Query::L("SELECT 'yesterday'")}),
                  {}, {FieldKind::kDate});
  REQUIRE(err.code == ErrorCode::kCoding);
  REQUIRE(err.field == 0);
}

TEST_CASE("Sqlite3Connection: more than one statement", "[sqlite3_connection]") {
  Sqlite3Connection conn;
  REQUIRE(conn.Open(kTestDb).ok());
  Error err = Run(&conn, std::nullopt,
                  Sql({Query::L("SELECT 1; SELECT 2")}), {}, {FieldKind::kInt});
  REQUIRE(err.code == ErrorCode::kMisuse);
}

TEST_CASE("Sqlite3Connection: SQL errors name the statement",
          "[sqlite3_connection]") {
  Sqlite3Connection conn;
  REQUIRE(conn.Open(kTestDb).ok());
  Error err = Run(&conn, 7, Sql({Query::L("SELECT * FROM nowhere")}), {},
                  {FieldKind::kInt});
  REQUIRE(err.code == ErrorCode::kError);
  REQUIRE(std::strstr(err.message, "SELECT * FROM nowhere") != nullptr);
  REQUIRE(conn.CachedStatementCount() == 0);
}

TEST_CASE("Sqlite3Connection: constraint violation", "[sqlite3_connection]") {
  Sqlite3Connection conn;
  REQUIRE(conn.Open(kTestDb).ok());
  REQUIRE(Run(&conn, std::nullopt,
              Sql({Query::L("CREATE TABLE u(id INTEGER PRIMARY KEY)")})).ok());
  QueryGenerator insert = Sql({Query::L("INSERT INTO u VALUES(1)")});
  REQUIRE(Run(&conn, 9, insert).ok());
  REQUIRE(Run(&conn, 9, insert).code == ErrorCode::kConstraint);
  // The cached statement is still usable after a failed step.
  REQUIRE(Run(&conn, 9, insert).code == ErrorCode::kConstraint);
}

TEST_CASE("Sqlite3Connection: row handler can stop iteration",
          "[sqlite3_connection]") {
  Sqlite3Connection conn = OpenTestDb();
  for (int i = 0; i < 3; ++i) {
    REQUIRE(Run(&conn, std::nullopt,
                Sql({Query::L("INSERT INTO emp VALUES(1, 'a')")})).ok());
  }
  int seen = 0;
  Error err = conn.Execute(
      std::nullopt, Sql({Query::L("SELECT empno FROM emp")}), {},
      {FieldKind::kInt},
      [&seen](const std::vector<Value>&) {
        ++seen;
        return Error::Make(ErrorCode::kError, "enough");
      },
      nullptr);
  REQUIRE(err.code == ErrorCode::kError);
  REQUIRE(seen == 1);
}

TEST_CASE("Sqlite3Connection: transactions", "[sqlite3_connection]") {
  Sqlite3Connection conn = OpenTestDb();
  REQUIRE(conn.BeginTransaction().ok());
  REQUIRE(conn.InTransaction());
  REQUIRE(Run(&conn, std::nullopt,
              Sql({Query::L("INSERT INTO emp VALUES(1, 'a')")})).ok());
  REQUIRE(conn.Rollback().ok());
  REQUIRE_FALSE(conn.InTransaction());

  std::vector<std::vector<Value>> rows;
  REQUIRE(Run(&conn, std::nullopt, Sql({Query::L("SELECT count(*) FROM emp")}),
              {}, {FieldKind::kInt}, &rows).ok());
  REQUIRE(rows[0][0].i == 0);
}
