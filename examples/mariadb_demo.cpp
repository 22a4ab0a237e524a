// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq MariaDB demo -- typed requests via Database<MariaBackend>.
//
// Usage:
//   export SQLREQ_MARIA_DSN="localhost:3306:root:pass:sqlreq_test"
//   ./sqlreq_mariadb_demo
//
// Before running, create the database:
//   mysql -u root -e "CREATE DATABASE IF NOT EXISTS sqlreq_test;"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <tuple>
#include <vector>

#include "sqlreq/db.hpp"
#include "sqlreq/describe.hpp"

namespace {

using Emp = std::tuple<int32_t, std::string, sqlreq::Date>;

// Table name per dialect, so the same requests run on any backend.
sqlreq::Error EmpTable(const sqlreq::DriverInfo& di, const std::string& name,
                       sqlreq::Query* out) {
  if (name != "emp") { return sqlreq::NoEnv()(di, name, out); }
  *out = sqlreq::Query::L(di.dialect == sqlreq::Dialect::kMariaDb
                              ? "sqlreq_emp"
                              : "emp");
  return sqlreq::Error::Ok();
}

sqlreq::RequestOptions Opts() {
  sqlreq::RequestOptions o;
  o.env = EmpTable;
  return o;
}

const auto kDropEmp = sqlreq::Exec(
    sqlreq::UnitType(), "DROP TABLE IF EXISTS $(emp)", Opts());
const auto kCreateEmp = sqlreq::Exec(
    sqlreq::UnitType(),
    "CREATE TABLE $(emp)(empno INT PRIMARY KEY, empname VARCHAR(64), "
    "hired DATE)",
    Opts());
const auto kInsertEmp = sqlreq::Exec(
    sqlreq::Tup(sqlreq::Int32(), sqlreq::String(), sqlreq::PDate()),
    "INSERT INTO $(emp) VALUES(?, ?, ?)", Opts());
const auto kHiredSince = sqlreq::Collect(
    sqlreq::PDate(),
    sqlreq::Tup(sqlreq::Int32(), sqlreq::String(), sqlreq::PDate()),
    "SELECT empno, empname, hired FROM $(emp) WHERE hired >= ? ORDER BY empno",
    Opts());

bool Check(const sqlreq::Error& err, const char* what) {
  if (err.ok()) { return true; }
  std::fprintf(stderr, "%s failed: %s\n", what, err.message);
  return false;
}

}  // namespace

int main() {
  const char* dsn = std::getenv("SQLREQ_MARIA_DSN");
  if (dsn == nullptr) {
    dsn = "localhost:3306:root::sqlreq_test";
  }

  // Use the template facade -- same API as SQLite3
  sqlreq::MDb db;
  if (!Check(db.Open(dsn), "Open")) { return 1; }
  std::printf("Connected to MariaDB/MySQL\n");

  std::printf("%s\n", sqlreq::Describe(kInsertEmp).c_str());

  if (!Check(db.Exec(kDropEmp, sqlreq::Unit{}), "Drop") ||
      !Check(db.Exec(kCreateEmp, sqlreq::Unit{}), "Create")) {
    return 1;
  }

  if (!Check(db.BeginTransaction(), "Begin")) { return 1; }
  for (int32_t i = 0; i < 10; ++i) {
    char name[32];
    std::snprintf(name, sizeof(name), "Employee%02d", i);
    sqlreq::Date hired{sqlreq::DaysFromCivil(2020, 1, 1) + 30 * i};
    if (!Check(db.Exec(kInsertEmp, Emp{i, name, hired}), "Insert")) {
      Check(db.Rollback(), "Rollback");
      return 1;
    }
  }
  if (!Check(db.Commit(), "Commit")) { return 1; }

  std::printf("\n--- Hired since 2020-06-01 ---\n");
  sqlreq::Date since{sqlreq::DaysFromCivil(2020, 6, 1)};
  std::vector<Emp> emps;
  if (!Check(db.Collect(kHiredSince, since, &emps), "Collect")) { return 1; }
  for (const Emp& e : emps) {
    std::printf("  empno=%d  empname=%s  hired=%s\n", std::get<0>(e),
                std::get<1>(e).c_str(),
                sqlreq::FormatDate(std::get<2>(e)).c_str());
  }
  std::printf("%zu cached statements\n", db.CachedStatementCount());

  if (!Check(db.Exec(kDropEmp, sqlreq::Unit{}), "Drop")) { return 1; }
  db.Close();
  std::printf("\nDone.\n");
  return 0;
}
