// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Database<Backend> -- typed request execution over any backend.
//
// Design:
//   - Thin template wrapper over Backend::Connection
//   - Parameters are encoded with the request's parameter type, rows
//     decoded with its row type
//   - Which calls accept a request is checked at compile time from its
//     declared multiplicity; how many rows actually came back is checked
//     here and reported as ErrorCode::kRowCount
//   - Move-only, RAII, no exceptions
//
// Usage (SQLite3, default):
//   #include "sqlreq/db.hpp"
//   static const auto kGetName = sqlreq::Find(
//       sqlreq::Int(), sqlreq::String(), "SELECT name FROM users WHERE id = ?");
//   sqlreq::Db db;
//   db.Open(":memory:");
//   std::string name;
//   sqlreq::Error err = db.Find(kGetName, int64_t{7}, &name);
//
// Usage (MariaDB/MySQL, requires SQLREQ_HAS_MARIADB=1):
//   sqlreq::MDb db;
//   db.Open("localhost:3306:root:pass:testdb");

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "sqlreq/call.hpp"
#include "sqlreq/describe.hpp"
#include "sqlreq/error.hpp"
#include "sqlreq/log.hpp"
#include "sqlreq/mult.hpp"
#include "sqlreq/request.hpp"
#include "sqlreq/sqlite3_backend.hpp"
#include "sqlreq/type.hpp"

#if defined(SQLREQ_HAS_MARIADB) && SQLREQ_HAS_MARIADB
#include "sqlreq/maria_backend.hpp"
#endif

namespace sqlreq {

// ---------------------------------------------------------------------------
// Database<Backend> -- unified facade
// ---------------------------------------------------------------------------

template <typename Backend = Sqlite3Backend>
class Database {
 public:
  using ConnectionType = typename Backend::Connection;

  Database() = default;
  ~Database() = default;

  // Move
  Database(Database&& other) noexcept
      : impl_(std::move(other.impl_)) {}

  Database& operator=(Database&& other) noexcept {
    if (this != &other) {
      impl_ = std::move(other.impl_);
    }
    return *this;
  }

  // No copy
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // --- Open / Close ---

  Error Open(const char* path) { return impl_.Open(path); }
  void Close() { impl_.Close(); }
  bool IsOpen() const { return impl_.IsOpen(); }

  const DriverInfo& Info() const { return impl_.Info(); }

  // --- Requests ---

  /// Run a request that returns no rows.
  template <typename P, typename R, Mult M>
  Error Exec(const Request<P, R, M>& req, const NonDeduced<P>& param) {
    return ExecAffected(req, param, nullptr);
  }

  /// As Exec(), also reporting the number of affected rows.
  template <typename P, typename R, Mult M>
  Error ExecAffected(const Request<P, R, M>& req, const NonDeduced<P>& param,
                     int64_t* affected) {
    static_assert(MultConsumableAs(M, Mult::kZero),
                  "Exec needs a request declared with Mult::kZero");
    size_t rows = 0;
    Error err = Call(req, param, [&rows](const std::vector<Value>&) {
      ++rows;
      return Error::Ok();
    }, affected);
    if (err.ok() && rows > 0) {
      err.SetFormat(ErrorCode::kRowCount,
                    "received %zu rows from a request expected to return none",
                    rows);
    }
    return err;
  }

  /// Exactly one row.
  template <typename P, typename R, Mult M>
  Error Find(const Request<P, R, M>& req, const NonDeduced<P>& param,
             R* out) {
    static_assert(MultConsumableAs(M, Mult::kOne),
                  "Find needs a request that may return rows");
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    std::optional<R> row;
    Error err = FetchAtMostOne(req, param, &row);
    if (!err.ok()) { return err; }
    if (!row.has_value()) {
      return Error::Make(ErrorCode::kRowCount,
                         "received no rows, expected exactly one");
    }
    *out = std::move(*row);
    return Error::Ok();
  }

  /// Zero or one row.
  template <typename P, typename R, Mult M>
  Error FindOpt(const Request<P, R, M>& req, const NonDeduced<P>& param,
                std::optional<R>* out) {
    static_assert(MultConsumableAs(M, Mult::kZeroOrOne),
                  "FindOpt needs a request that may return rows");
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    return FetchAtMostOne(req, param, out);
  }

  /// All rows, in order.
  template <typename P, typename R, Mult M>
  Error Collect(const Request<P, R, M>& req, const NonDeduced<P>& param,
                std::vector<R>* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    std::vector<R> rows;
    Error err = Fold(req, param, [&rows](const R& row) {
      rows.push_back(row);
      return Error::Ok();
    });
    if (err.ok()) { *out = std::move(rows); }
    return err;
  }

  /// Call fn for each row; an error from fn stops the iteration.
  template <typename P, typename R, Mult M>
  Error Fold(const Request<P, R, M>& req, const NonDeduced<P>& param,
             const NonDeduced<std::function<Error(const R&)>>& fn) {
    static_assert(MultConsumableAs(M, Mult::kMany),
                  "Fold/Collect need a request that may return rows");
    size_t index = 0;
    return Call(req, param, [&](const std::vector<Value>& fields) {
      R row{};
      Error err = DecodeRow(req, fields, index++, &row);
      if (!err.ok()) { return err; }
      return fn(row);
    }, nullptr);
  }

  size_t CachedStatementCount() const { return impl_.CachedStatementCount(); }

  // --- Transaction ---

  Error BeginTransaction() { return impl_.BeginTransaction(); }
  Error Commit() { return impl_.Commit(); }
  Error Rollback() { return impl_.Rollback(); }
  bool InTransaction() const { return impl_.InTransaction(); }

  /// Access the underlying backend implementation.
  ConnectionType& Impl() { return impl_; }
  const ConnectionType& Impl() const { return impl_; }

 private:
  template <typename P, typename R, Mult M>
  Error Call(const Request<P, R, M>& req, const NonDeduced<P>& param,
             const RowHandler& on_row, int64_t* affected) {
    if (!req.Valid()) {
      return Error::Make(ErrorCode::kMisuse, "invalid request");
    }
    std::vector<Value> params;
    Error err = req.ParamType().Encode(param, &params);
    if (!err.ok()) {
      err.AddContext("encoding parameters of %s", Describe(req).c_str());
      return err;
    }
    auto logger = Logger();
    if (logger->should_log(spdlog::level::trace)) {
      logger->trace("{} with {}", Describe(req),
                    FormatParams(req.ParamType(), params));
    }
    Error run = impl_.Execute(
        req.CacheKey(),
        [&req](const DriverInfo& di, Query* q) { return req.BuildQuery(di, q); },
        params, req.RowType().FieldKinds(), on_row, affected);
    if (!run.ok() && run.code != ErrorCode::kRowCount &&
        run.code != ErrorCode::kCoding) {
      run.AddContext("%s", Describe(req).c_str());
    }
    return run;
  }

  template <typename P, typename R, Mult M>
  Error DecodeRow(const Request<P, R, M>& req, const std::vector<Value>& fields,
                  size_t index, R* out) {
    Error err = req.RowType().DecodeRow(fields, out);
    if (!err.ok()) {
      err.AddContext("row %zu of %s", index, Describe(req).c_str());
    }
    return err;
  }

  template <typename P, typename R, Mult M>
  Error FetchAtMostOne(const Request<P, R, M>& req,
                       const NonDeduced<P>& param,
                       std::optional<R>* out) {
    std::optional<R> first;
    Error err = Call(req, param, [&](const std::vector<Value>& fields) {
      if (first.has_value()) {
        return Error::Make(ErrorCode::kRowCount,
                           "received more than one row, expected at most one");
      }
      R row{};
      Error e = DecodeRow(req, fields, 0, &row);
      if (!e.ok()) { return e; }
      first = std::move(row);
      return Error::Ok();
    }, nullptr);
    if (!err.ok()) { return err; }
    *out = std::move(first);
    return Error::Ok();
  }

  ConnectionType impl_;
};

// ---------------------------------------------------------------------------
// Default type aliases -- users just use sqlreq::Db
// ---------------------------------------------------------------------------

using Db = Database<Sqlite3Backend>;

#if defined(SQLREQ_HAS_MARIADB) && SQLREQ_HAS_MARIADB
using MDb = Database<MariaBackend>;
#endif

}  // namespace sqlreq
