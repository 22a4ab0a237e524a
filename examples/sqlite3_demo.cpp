// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq SQLite3 demo -- typed requests against an in-memory database.
//
// Usage:
//   ./sqlreq_sqlite3_demo
//   SQLREQ_DEBUG_PARAM=1 SQLREQ_LOG_LEVEL=trace ./sqlreq_sqlite3_demo

#include <cstdio>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "sqlreq/db.hpp"
#include "sqlreq/describe.hpp"
#include "sqlreq/dyn_param.hpp"

namespace {

using Emp = std::tuple<int32_t, std::string, std::optional<double>>;

const sqlreq::RequestOptions& Opts() {
  static const sqlreq::RequestOptions opts = [] {
    sqlreq::RequestOptions o;
    o.env = sqlreq::EnvFromMap({{"schema", "main"}});
    return o;
  }();
  return opts;
}

const auto kCreateEmp = sqlreq::Exec(
    sqlreq::UnitType(),
    "CREATE TABLE $(schema.)emp(empno INTEGER PRIMARY KEY, empname TEXT, "
    "salary REAL)",
    Opts());
const auto kInsertEmp = sqlreq::Exec(
    sqlreq::Tup(sqlreq::Int32(), sqlreq::String(),
                sqlreq::Option(sqlreq::Float())),
    "INSERT INTO $(schema.)emp VALUES(?, ?, ?)", Opts());
const auto kCountEmp = sqlreq::Find(
    sqlreq::UnitType(), sqlreq::Int(), "SELECT count(*) FROM $(schema.)emp",
    Opts());
const auto kEmpName = sqlreq::FindOpt(
    sqlreq::Int32(), sqlreq::String(),
    "SELECT empname FROM $(schema.)emp WHERE empno = ?", Opts());
const auto kAllEmp = sqlreq::Collect(
    sqlreq::UnitType(),
    sqlreq::Tup(sqlreq::Int32(), sqlreq::String(),
                sqlreq::Option(sqlreq::Float())),
    "SELECT empno, empname, salary FROM $(schema.)emp ORDER BY empno",
    Opts());
const auto kRename = sqlreq::Exec(
    sqlreq::Tup(sqlreq::String(), sqlreq::Int32()),
    "UPDATE $(schema.)emp SET empname = $1 WHERE empno = $2", Opts());

bool Check(const sqlreq::Error& err, const char* what) {
  if (err.ok()) { return true; }
  std::fprintf(stderr, "%s failed: %s\n", what, err.message);
  return false;
}

}  // namespace

int main() {
  sqlreq::Db db;
  sqlreq::Error err;

  // Open in-memory database
  err = db.Open(":memory:");
  if (!err.ok()) {
    std::fprintf(stderr, "Open failed: %s\n", err.message);
    return 1;
  }

  if (!Check(db.Exec(kCreateEmp, sqlreq::Unit{}), "Create")) { return 1; }
  std::printf("%s\n", sqlreq::Describe(kInsertEmp).c_str());

  // Batch insert in a transaction
  if (!Check(db.BeginTransaction(), "Begin")) { return 1; }
  for (int32_t i = 0; i < 10; ++i) {
    char name[32];
    std::snprintf(name, sizeof(name), "Employee%02d", i);
    std::optional<double> salary;
    if (i % 3 != 0) { salary = 1000.0 * i; }
    if (!Check(db.Exec(kInsertEmp, Emp{i, name, salary}), "Insert")) {
      Check(db.Rollback(), "Rollback");
      return 1;
    }
  }
  if (!Check(db.Commit(), "Commit")) { return 1; }

  int64_t count = 0;
  if (!Check(db.Find(kCountEmp, sqlreq::Unit{}, &count), "Count")) { return 1; }
  std::printf("After batch insert: %lld rows, %zu cached statements\n",
              static_cast<long long>(count), db.CachedStatementCount());

  // Update
  int64_t updated = 0;
  if (!Check(db.ExecAffected(kRename,
                             std::make_tuple(std::string("Boss"), int32_t{0}),
                             &updated),
             "Update")) {
    return 1;
  }
  std::printf("Updated %lld row(s)\n", static_cast<long long>(updated));

  // Zero or one row
  std::optional<std::string> name;
  if (!Check(db.FindOpt(kEmpName, 0, &name), "Lookup")) { return 1; }
  std::printf("empno 0: %s\n", name ? name->c_str() : "(none)");
  if (!Check(db.FindOpt(kEmpName, 99, &name), "Lookup")) { return 1; }
  std::printf("empno 99: %s\n", name ? name->c_str() : "(none)");

  // All rows
  std::printf("\n--- Collect ---\n");
  std::vector<Emp> emps;
  if (!Check(db.Collect(kAllEmp, sqlreq::Unit{}, &emps), "Collect")) { return 1; }
  for (const Emp& e : emps) {
    const std::optional<double>& salary = std::get<2>(e);
    if (salary) {
      std::printf("  empno=%d  empname=%s  salary=%.2f\n", std::get<0>(e),
                  std::get<1>(e).c_str(), *salary);
    } else {
      std::printf("  empno=%d  empname=%s  salary=NULL\n", std::get<0>(e),
                  std::get<1>(e).c_str());
    }
  }

  // Dynamically assembled filter
  std::printf("\n--- Dynamic query ---\n");
  std::string sql = "SELECT empno FROM emp WHERE 1 = 1";
  sqlreq::DynParam params;
  sql += " AND salary >= ?";
  params = params.Add(sqlreq::Float(), 4000.0);
  sql += " AND empname LIKE ?";
  params = params.Add(sqlreq::String(), std::string("Employee%"));
  sqlreq::RequestOptions oneshot;
  oneshot.oneshot = true;
  auto dyn = sqlreq::Collect(params.ParamType(), sqlreq::Int32(), sql, oneshot,
                             &err);
  if (!err.ok()) {
    std::fprintf(stderr, "Bad query: %s\n", err.message);
    return 1;
  }
  std::vector<int32_t> ids;
  if (!Check(db.Collect(dyn, params, &ids), "Dynamic query")) { return 1; }
  for (int32_t id : ids) { std::printf("  empno=%d\n", id); }

  // Row count enforcement
  std::printf("\n--- Row count check ---\n");
  auto one = sqlreq::Find(sqlreq::UnitType(), sqlreq::String(),
                          "SELECT empname FROM emp");
  std::string single;
  err = db.Find(one, sqlreq::Unit{}, &single);
  std::printf("Find over many rows: %s (%s)\n",
              sqlreq::ErrorCodeName(err.code), err.message);

  db.Close();
  std::printf("\nDone.\n");
  return 0;
}
