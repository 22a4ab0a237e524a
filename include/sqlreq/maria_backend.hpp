// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::MariaBackend -- backend traits for MariaDB/MySQL.
//
// Design:
//   - Aggregates all MariaDB-specific types into a single traits struct
//   - Used as template parameter for Database<Backend>
//   - Zero overhead: just type aliases, no virtual dispatch

#pragma once

#include "sqlreq/maria_connection.hpp"

namespace sqlreq {

// ---------------------------------------------------------------------------
// MariaBackend -- type traits for Database<Backend> template
// ---------------------------------------------------------------------------

struct MariaBackend {
  using Connection = MariaConnection;
  using Statement  = MariaStatement;
};

}  // namespace sqlreq
