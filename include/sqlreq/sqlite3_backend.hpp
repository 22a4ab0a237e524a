// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Sqlite3Backend -- backend traits for SQLite3.
//
// Design:
//   - Aggregates all SQLite3-specific types into a single traits struct
//   - Used as template parameter for Database<Backend>
//   - Zero overhead: just type aliases, no virtual dispatch

#pragma once

#include "sqlreq/sqlite3_connection.hpp"

namespace sqlreq {

// ---------------------------------------------------------------------------
// Sqlite3Backend -- type traits for Database<Backend> template
// ---------------------------------------------------------------------------

struct Sqlite3Backend {
  using Connection = Sqlite3Connection;
  using Statement  = Sqlite3Statement;
};

}  // namespace sqlreq
