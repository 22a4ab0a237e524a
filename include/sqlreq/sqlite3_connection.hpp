// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Sqlite3Connection -- SQLite3 connection executing requests.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Move-only (no copy)
//   - Prepared statements cached by request identity, one prepare per
//     identity for the life of the connection
//   - A per-connection mutex covers the cache and statement execution;
//     row handlers must not call back into the same connection
//   - Transaction support (Begin/Commit/Rollback)

#pragma once

#include <cctype>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sqlite3.h"

#include "sqlreq/call.hpp"
#include "sqlreq/driver_info.hpp"
#include "sqlreq/error.hpp"
#include "sqlreq/log.hpp"
#include "sqlreq/query.hpp"
#include "sqlreq/render.hpp"
#include "sqlreq/request.hpp"
#include "sqlreq/sqlite3_statement.hpp"

namespace sqlreq {

// ---------------------------------------------------------------------------
// Sqlite3Connection
// ---------------------------------------------------------------------------

class Sqlite3Connection {
 public:
  Sqlite3Connection() : info_(Sqlite3DriverInfo()) {}

  ~Sqlite3Connection() { Close(); }

  // Move
  Sqlite3Connection(Sqlite3Connection&& other) noexcept
      : info_(std::move(other.info_)),
        db_(other.db_),
        cache_(std::move(other.cache_)) {
    other.db_ = nullptr;
    other.cache_.clear();
  }

  Sqlite3Connection& operator=(Sqlite3Connection&& other) noexcept {
    if (this != &other) {
      Close();
      info_ = std::move(other.info_);
      db_ = other.db_;
      cache_ = std::move(other.cache_);
      other.db_ = nullptr;
      other.cache_.clear();
    }
    return *this;
  }

  // No copy
  Sqlite3Connection(const Sqlite3Connection&) = delete;
  Sqlite3Connection& operator=(const Sqlite3Connection&) = delete;

  // --- Open / Close ---

  Error Open(const char* path) {
    if (path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    Close();
    int32_t rc = sqlite3_open(path, &db_);
    if (rc != SQLITE_OK) {
      Error err = Error::Make(ErrorCode::kError,
                              db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed");
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      Logger()->warn("sqlite3 open {} failed: {}", path, err.message);
      return err;
    }
    Logger()->debug("sqlite3 opened {}", path);
    return Error::Ok();
  }

  /// Finalizes cached statements, then closes the database.
  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const { return db_ != nullptr; }

  const DriverInfo& Info() const { return info_; }

  // --- Requests ---

  Error Execute(std::optional<QueryKey> key, const QueryGenerator& build,
                const std::vector<Value>& params,
                const std::vector<FieldKind>& row_kinds,
                const RowHandler& on_row, int64_t* affected) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }

    Entry transient;
    Entry* entry = &transient;
    if (key.has_value()) {
      auto it = cache_.find(*key);
      if (it == cache_.end()) {
        Entry fresh;
        Error err = Prepare(build, &fresh);
        if (!err.ok()) { return err; }
        Logger()->debug("sqlite3 prepared request {}/{}: {}",
                        key->allocator, key->id,
                        fresh.rendered.sql);
        it = cache_.emplace(*key, std::move(fresh)).first;
      }
      entry = &it->second;
    } else {
      Error err = Prepare(build, &transient);
      if (!err.ok()) { return err; }
    }

    Error result = Run(entry, params, row_kinds, on_row);
    if (result.ok() && affected != nullptr) {
      *affected = sqlite3_changes(db_);
    }
    Error reset = entry->stmt.Reset();
    if (!key.has_value()) {
      Logger()->debug("sqlite3 released oneshot statement");
    }
    if (!result.ok()) {
      Logger()->warn("sqlite3 request failed ({}): {}",
                     ErrorCodeName(result.code), result.message);
      return result;
    }
    return reset;
  }

  size_t CachedStatementCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
  }

  // --- Transaction ---

  Error BeginTransaction() { return ExecRaw("BEGIN TRANSACTION;"); }
  Error Commit() { return ExecRaw("COMMIT TRANSACTION;"); }
  Error Rollback() { return ExecRaw("ROLLBACK;"); }

  bool InTransaction() const {
    if (db_ == nullptr) { return false; }
    return sqlite3_get_autocommit(db_) == 0;
  }

  // --- Misc ---

  void SetBusyTimeout(int32_t ms) {
    if (db_ != nullptr) { sqlite3_busy_timeout(db_, ms); }
  }

  sqlite3* Handle() const { return db_; }

 private:
  struct Entry {
    RenderedQuery rendered;
    Sqlite3Statement stmt;
  };

  Error Prepare(const QueryGenerator& build, Entry* out) {
    Query q;
    Error err = build(info_, &q);
    if (!err.ok()) { return err; }
    err = RenderQuery(q, info_, &out->rendered);
    if (!err.ok()) { return err; }

    const std::string& sql = out->rendered.sql;
    const char* tail = nullptr;
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                    static_cast<int>(sql.size()), &stmt, &tail);
    if (rc != SQLITE_OK) {
      Error e;
      e.SetFormat(ErrorCode::kError, "%s in \"%s\"", sqlite3_errmsg(db_),
                  sql.c_str());
      return e;
    }
    out->stmt = Sqlite3Statement(db_, stmt);
    if (stmt == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "empty statement");
    }
    while (tail != nullptr && *tail != '\0') {
      if (std::isspace(static_cast<unsigned char>(*tail)) == 0 && *tail != ';') {
        Error e;
        e.SetFormat(ErrorCode::kMisuse, "more than one statement in \"%s\"",
                    sql.c_str());
        return e;
      }
      ++tail;
    }
    return Error::Ok();
  }

  Error Run(Entry* entry, const std::vector<Value>& params,
            const std::vector<FieldKind>& row_kinds, const RowHandler& on_row) {
    std::vector<Value> bound;
    Error err = ReorderParams(params, entry->rendered, &bound);
    if (!err.ok()) { return err; }
    err = entry->stmt.BindAll(bound);
    if (!err.ok()) { return err; }

    std::vector<Value> row(row_kinds.size());
    for (;;) {
      bool has_row = false;
      err = entry->stmt.Step(&has_row);
      if (!err.ok() || !has_row) { return err; }
      int32_t ncols = entry->stmt.NumColumns();
      // A zero-width row type only counts rows.
      if (!row_kinds.empty() &&
          ncols != static_cast<int32_t>(row_kinds.size())) {
        Error e;
        e.SetFormat(ErrorCode::kCoding,
                    "query returns %d columns, row type has %zu fields", ncols,
                    row_kinds.size());
        return e;
      }
      for (size_t c = 0; c < row_kinds.size(); ++c) {
        err = entry->stmt.Read(static_cast<int32_t>(c), row_kinds[c], &row[c]);
        if (!err.ok()) { return err; }
      }
      if (on_row) {
        err = on_row(row);
        if (!err.ok()) { return err; }
      }
    }
  }

  Error ExecRaw(const char* sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) { return Error::Ok(); }
    Error err = Error::Make(ErrorCode::kError,
                            errmsg ? errmsg : sqlite3_errmsg(db_));
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return err;
  }

  DriverInfo info_;
  sqlite3* db_ = nullptr;
  std::unordered_map<QueryKey, Entry, QueryKeyHash> cache_;
  mutable std::mutex mutex_;
};

}  // namespace sqlreq
