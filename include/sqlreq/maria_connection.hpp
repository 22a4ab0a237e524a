// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::MariaConnection -- MariaDB/MySQL connection executing requests.
//
// Design:
//   - Wraps MYSQL* with RAII
//   - Move-only (no copy)
//   - Prepared statements cached by request identity, as for SQLite3
//   - Transaction support (Begin/Commit/Rollback)
//   - API-compatible with Sqlite3Connection for Database<Backend> template
//
// Open() format: "host:port:user:password:database"
//   e.g. "localhost:3306:root:pass:testdb"
//   or   "127.0.0.1:3306:root::mydb" (empty password)

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <mysql.h>

#include "sqlreq/call.hpp"
#include "sqlreq/driver_info.hpp"
#include "sqlreq/error.hpp"
#include "sqlreq/log.hpp"
#include "sqlreq/maria_statement.hpp"
#include "sqlreq/query.hpp"
#include "sqlreq/render.hpp"
#include "sqlreq/request.hpp"

namespace sqlreq {

// ---------------------------------------------------------------------------
// MariaConnection
// ---------------------------------------------------------------------------

class MariaConnection {
 public:
  MariaConnection() : info_(MariaDriverInfo()) {}

  ~MariaConnection() { Close(); }

  // Move
  MariaConnection(MariaConnection&& other) noexcept
      : info_(std::move(other.info_)),
        conn_(other.conn_),
        in_transaction_(other.in_transaction_),
        cache_(std::move(other.cache_)) {
    other.conn_ = nullptr;
    other.in_transaction_ = false;
    other.cache_.clear();
  }

  MariaConnection& operator=(MariaConnection&& other) noexcept {
    if (this != &other) {
      Close();
      info_ = std::move(other.info_);
      conn_ = other.conn_;
      in_transaction_ = other.in_transaction_;
      cache_ = std::move(other.cache_);
      other.conn_ = nullptr;
      other.in_transaction_ = false;
      other.cache_.clear();
    }
    return *this;
  }

  // No copy
  MariaConnection(const MariaConnection&) = delete;
  MariaConnection& operator=(const MariaConnection&) = delete;

  // --- Open / Close ---

  /// Open connection. Format: "host:port:user:password:database"
  /// Fields can be empty. Minimal: "localhost:3306:root::testdb"
  Error Open(const char* dsn) {
    if (dsn == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "dsn is null");
    }
    Close();

    // Parse DSN: host:port:user:password:database
    char buf[512];
    std::strncpy(buf, dsn, sizeof(buf) - 1);
    buf[sizeof(buf) - 1] = '\0';

    const char* host = "localhost";
    uint16_t port = 3306;
    const char* user = "root";
    const char* password = nullptr;
    const char* database = nullptr;

    char* parts[5] = {};
    int32_t count = 0;
    char* p = buf;
    parts[0] = p;
    count = 1;
    while (*p != '\0' && count < 5) {
      if (*p == ':') {
        *p = '\0';
        parts[count++] = p + 1;
      }
      ++p;
    }

    if (count >= 1 && parts[0][0] != '\0') { host = parts[0]; }
    if (count >= 2 && parts[1][0] != '\0') {
      port = static_cast<uint16_t>(std::strtoul(parts[1], nullptr, 10));
    }
    if (count >= 3 && parts[2][0] != '\0') { user = parts[2]; }
    if (count >= 4 && parts[3][0] != '\0') { password = parts[3]; }
    if (count >= 5 && parts[4][0] != '\0') { database = parts[4]; }

    std::lock_guard<std::mutex> lock(mutex_);
    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kError, "mysql_init failed");
    }

    if (mysql_real_connect(conn_, host, user, password, database,
                           port, nullptr, 0) == nullptr) {
      Error err = Error::Make(ErrorCode::kError, mysql_error(conn_));
      mysql_close(conn_);
      conn_ = nullptr;
      Logger()->warn("mariadb connect to {}:{} failed: {}", host, port,
                     err.message);
      return err;
    }

    mysql_set_character_set(conn_, "utf8mb4");
    Logger()->debug("mariadb connected to {}:{}", host, port);
    return Error::Ok();
  }

  /// Closes cached statements, then the connection.
  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
    in_transaction_ = false;
  }

  bool IsOpen() const { return conn_ != nullptr; }

  const DriverInfo& Info() const { return info_; }

  // --- Requests ---

  Error Execute(std::optional<QueryKey> key, const QueryGenerator& build,
                const std::vector<Value>& params,
                const std::vector<FieldKind>& row_kinds,
                const RowHandler& on_row, int64_t* affected) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn_ == nullptr) {
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
        Logger()->debug("mariadb prepared request {}/{}: {}",
                        key->allocator, key->id,
                        fresh.rendered.sql);
        it = cache_.emplace(*key, std::move(fresh)).first;
      }
      entry = &it->second;
    } else {
      Error err = Prepare(build, &transient);
      if (!err.ok()) { return err; }
    }

    Error result = Run(entry, params, row_kinds, on_row, affected);
    Error reset = entry->stmt.Reset();
    if (!key.has_value()) {
      Logger()->debug("mariadb released oneshot statement");
    }
    if (!result.ok()) {
      Logger()->warn("mariadb request failed ({}): {}",
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

  Error BeginTransaction() {
    Error err = ExecRaw("START TRANSACTION");
    if (err.ok()) { in_transaction_ = true; }
    return err;
  }

  Error Commit() {
    Error err = ExecRaw("COMMIT");
    in_transaction_ = false;
    return err;
  }

  Error Rollback() {
    Error err = ExecRaw("ROLLBACK");
    in_transaction_ = false;
    return err;
  }

  bool InTransaction() const { return in_transaction_; }

  MYSQL* Handle() const { return conn_; }

 private:
  struct Entry {
    RenderedQuery rendered;
    MariaStatement stmt;
  };

  Error Prepare(const QueryGenerator& build, Entry* out) {
    Query q;
    Error err = build(info_, &q);
    if (!err.ok()) { return err; }
    err = RenderQuery(q, info_, &out->rendered);
    if (!err.ok()) { return err; }

    const std::string& sql = out->rendered.sql;
    MYSQL_STMT* stmt = mysql_stmt_init(conn_);
    if (stmt == nullptr) {
      return Error::Make(ErrorCode::kError, "mysql_stmt_init failed");
    }
    if (mysql_stmt_prepare(stmt, sql.c_str(),
                           static_cast<unsigned long>(sql.size())) != 0) {
      Error e;
      e.SetFormat(ErrorCode::kError, "%s in \"%s\"", mysql_stmt_error(stmt),
                  sql.c_str());
      mysql_stmt_close(stmt);
      return e;
    }
    out->stmt = MariaStatement(stmt);
    return Error::Ok();
  }

  Error Run(Entry* entry, const std::vector<Value>& params,
            const std::vector<FieldKind>& row_kinds, const RowHandler& on_row,
            int64_t* affected) {
    std::vector<Value> bound;
    Error err = ReorderParams(params, entry->rendered, &bound);
    if (!err.ok()) { return err; }
    err = entry->stmt.Execute(bound);
    if (!err.ok()) { return err; }
    if (affected != nullptr) { *affected = entry->stmt.AffectedRows(); }

    int32_t ncols = entry->stmt.NumColumns();
    if (ncols == 0) { return Error::Ok(); }
    // A zero-width row type only counts rows.
    if (!row_kinds.empty() &&
        ncols != static_cast<int32_t>(row_kinds.size())) {
      Error e;
      e.SetFormat(ErrorCode::kCoding,
                  "query returns %d columns, row type has %zu fields", ncols,
                  row_kinds.size());
      return e;
    }
    err = entry->stmt.StoreResult();
    if (!err.ok()) { return err; }

    std::vector<Value> row(row_kinds.size());
    for (;;) {
      bool has_row = false;
      err = entry->stmt.Fetch(&has_row);
      if (!err.ok() || !has_row) { return err; }
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
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    if (mysql_query(conn_, sql) != 0) {
      return Error::Make(ErrorCode::kError, mysql_error(conn_));
    }
    return Error::Ok();
  }

  DriverInfo info_;
  MYSQL* conn_ = nullptr;
  bool in_transaction_ = false;
  std::unordered_map<QueryKey, Entry, QueryKeyHash> cache_;
  mutable std::mutex mutex_;
};

}  // namespace sqlreq
