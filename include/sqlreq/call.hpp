// Copyright (c) 2024 liudegui. MIT License.
//
// The contract between Database<Backend> and a backend connection.
//
// A backend connection provides:
//   const DriverInfo& Info() const;
//   Error Execute(std::optional<QueryKey> key, const QueryGenerator& build,
//                 const std::vector<Value>& params,
//                 const std::vector<FieldKind>& row_kinds,
//                 const RowHandler& on_row, int64_t* affected);
//
// Execute() builds and prepares the query on first use of key and keeps the
// prepared statement until the connection closes; with no key the statement
// is released before returning. `params` are logical parameters in query
// order; the backend reorders them for its placeholder style. Each result
// row is read as row_kinds and passed to on_row; an error from on_row
// stops the iteration and is returned.

#pragma once

#include <functional>
#include <vector>

#include "sqlreq/error.hpp"
#include "sqlreq/value.hpp"

namespace sqlreq {

using RowHandler = std::function<Error(const std::vector<Value>&)>;

}  // namespace sqlreq
