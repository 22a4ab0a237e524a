// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::DriverInfo -- what the query renderer needs to know about a
// backend: its parameter syntax and how string literals are quoted.

#pragma once

#include <cstdint>
#include <string>

namespace sqlreq {

enum class Dialect : uint8_t {
  kSqlite = 0,
  kMariaDb = 1,
  kPgsql = 2,
  kOther = 3,
};

enum class ParamStyle : uint8_t {
  kLinear = 0,    // "?" per occurrence, values bound by position
  kNumbered = 1,  // "$1", "$2", ... may be repeated
};

struct DriverInfo {
  Dialect dialect = Dialect::kOther;
  std::string name;
  ParamStyle style = ParamStyle::kLinear;
  // Backslash is an escape character inside '...' (MariaDB default mode).
  bool backslash_escapes = false;
  bool can_transact = true;
};

inline DriverInfo Sqlite3DriverInfo() {
  DriverInfo di;
  di.dialect = Dialect::kSqlite;
  di.name = "sqlite3";
  di.style = ParamStyle::kLinear;
  return di;
}

inline DriverInfo MariaDriverInfo() {
  DriverInfo di;
  di.dialect = Dialect::kMariaDb;
  di.name = "mariadb";
  di.style = ParamStyle::kLinear;
  di.backslash_escapes = true;
  return di;
}

inline DriverInfo PgsqlDriverInfo() {
  DriverInfo di;
  di.dialect = Dialect::kPgsql;
  di.name = "postgresql";
  di.style = ParamStyle::kNumbered;
  return di;
}

}  // namespace sqlreq
