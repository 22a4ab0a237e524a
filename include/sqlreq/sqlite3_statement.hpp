// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Sqlite3Statement -- prepared statement with RAII.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - 1-based parameter binding (matches SQLite3 convention)
//   - Field values are transported as:
//       bool/int kinds  INTEGER        float  REAL
//       string          TEXT           octets BLOB
//       pdate/ptime     ISO-8601 TEXT  span   REAL seconds

#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "sqlite3.h"

#include "sqlreq/error.hpp"
#include "sqlreq/value.hpp"

namespace sqlreq {

class Sqlite3Connection;

// ---------------------------------------------------------------------------
// Sqlite3Statement
// ---------------------------------------------------------------------------

class Sqlite3Statement {
 public:
  Sqlite3Statement() = default;

  ~Sqlite3Statement() { Finalize(); }

  // Move
  Sqlite3Statement(Sqlite3Statement&& other) noexcept
      : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  Sqlite3Statement& operator=(Sqlite3Statement&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;

  // --- Bind (1-based index) ---

  Error Bind(int32_t param, const Value& v) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t rc = SQLITE_OK;
    if (v.is_null) {
      rc = sqlite3_bind_null(stmt_, param);
    } else {
      switch (v.kind) {
        case FieldKind::kBool:
          rc = sqlite3_bind_int(stmt_, param, v.b ? 1 : 0);
          break;
        case FieldKind::kInt:
        case FieldKind::kInt16:
        case FieldKind::kInt32:
        case FieldKind::kInt64:
          rc = sqlite3_bind_int64(stmt_, param, v.i);
          break;
        case FieldKind::kFloat:
          rc = sqlite3_bind_double(stmt_, param, v.f);
          break;
        case FieldKind::kString:
          rc = sqlite3_bind_text(stmt_, param, v.s.data(),
                                 static_cast<int>(v.s.size()),
                                 SQLITE_TRANSIENT);
          break;
        case FieldKind::kOctets:
          rc = sqlite3_bind_blob(stmt_, param, v.s.data(),
                                 static_cast<int>(v.s.size()),
                                 SQLITE_TRANSIENT);
          break;
        case FieldKind::kDate:
          rc = BindText(param, FormatDate(Date{static_cast<int32_t>(v.i)}));
          break;
        case FieldKind::kTime:
          rc = BindText(param, FormatTimestamp(Timestamp{v.i}));
          break;
        case FieldKind::kSpan:
          rc = sqlite3_bind_double(stmt_, param,
                                   static_cast<double>(v.i) / 1e6);
          break;
      }
    }
    if (rc != SQLITE_OK) {
      Error e;
      e.SetFormat(ErrorCode::kError, "bind %s to parameter %d failed: %s",
                  FieldKindName(v.kind), param,
                  db_ ? sqlite3_errmsg(db_) : "no database");
      e.field = param - 1;
      return e;
    }
    return Error::Ok();
  }

  Error BindAll(const std::vector<Value>& values) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t expected = sqlite3_bind_parameter_count(stmt_);
    if (expected != static_cast<int32_t>(values.size())) {
      Error e;
      e.SetFormat(ErrorCode::kArity, "statement has %d parameters, got %zu",
                  expected, values.size());
      return e;
    }
    for (size_t i = 0; i < values.size(); ++i) {
      Error err = Bind(static_cast<int32_t>(i + 1), values[i]);
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

  // --- Execute ---

  /// Advance one row. *has_row is false once the statement is done.
  Error Step(bool* has_row) {
    *has_row = false;
    if (db_ == nullptr || stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      *has_row = true;
      return Error::Ok();
    }
    if (rc == SQLITE_DONE) { return Error::Ok(); }
    ErrorCode code = (rc == SQLITE_BUSY) ? ErrorCode::kBusy
                     : ((rc & 0xff) == SQLITE_CONSTRAINT) ? ErrorCode::kConstraint
                                                          : ErrorCode::kError;
    return Error::Make(code, sqlite3_errmsg(db_));
  }

  int32_t NumColumns() const {
    return stmt_ ? sqlite3_column_count(stmt_) : 0;
  }

  /// Read column col of the current row as kind.
  Error Read(int32_t col, FieldKind kind, Value* out) const {
    if (stmt_ == nullptr || col < 0 || col >= NumColumns()) {
      return Error::Coding(col, "column out of range");
    }
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
      *out = Value::Null(kind);
      return Error::Ok();
    }
    switch (kind) {
      case FieldKind::kBool:
        *out = Value::OfBool(sqlite3_column_int64(stmt_, col) != 0);
        return Error::Ok();
      case FieldKind::kInt:
      case FieldKind::kInt16:
      case FieldKind::kInt32:
      case FieldKind::kInt64:
        *out = Value::OfInt(kind, sqlite3_column_int64(stmt_, col));
        return Error::Ok();
      case FieldKind::kFloat:
        *out = Value::OfFloat(sqlite3_column_double(stmt_, col));
        return Error::Ok();
      case FieldKind::kString:
        *out = Value::OfString(ColumnBytes(col, false));
        return Error::Ok();
      case FieldKind::kOctets:
        *out = Value::OfOctets(ColumnBytes(col, true));
        return Error::Ok();
      case FieldKind::kDate: {
        Date d;
        std::string text = ColumnBytes(col, false);
        if (!ParseDate(text.c_str(), &d)) { return BadText(col, kind, text); }
        *out = Value::OfDate(d);
        return Error::Ok();
      }
      case FieldKind::kTime: {
        Timestamp t;
        std::string text = ColumnBytes(col, false);
        if (!ParseTimestamp(text.c_str(), &t)) {
          return BadText(col, kind, text);
        }
        *out = Value::OfTime(t);
        return Error::Ok();
      }
      case FieldKind::kSpan: {
        double secs = sqlite3_column_double(stmt_, col);
        *out = Value::OfSpan(Span{static_cast<int64_t>(std::llround(secs * 1e6))});
        return Error::Ok();
      }
    }
    return Error::Coding(col, "unknown field kind");
  }

  // --- Reset ---

  Error Reset() {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t rc = sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
    if (rc != SQLITE_OK) {
      return Error::Make(ErrorCode::kError,
                         db_ ? sqlite3_errmsg(db_) : "reset failed");
    }
    return Error::Ok();
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }
  sqlite3_stmt* Handle() const { return stmt_; }

 private:
  friend class Sqlite3Connection;

  Sqlite3Statement(sqlite3* db, sqlite3_stmt* stmt)
      : db_(db), stmt_(stmt) {}

  int32_t BindText(int32_t param, const std::string& text) {
    return sqlite3_bind_text(stmt_, param, text.data(),
                             static_cast<int>(text.size()), SQLITE_TRANSIENT);
  }

  std::string ColumnBytes(int32_t col, bool blob) const {
    const void* p = blob ? sqlite3_column_blob(stmt_, col)
                         : static_cast<const void*>(sqlite3_column_text(stmt_, col));
    int32_t len = sqlite3_column_bytes(stmt_, col);
    if (p == nullptr || len <= 0) { return std::string(); }
    return std::string(static_cast<const char*>(p), static_cast<size_t>(len));
  }

  static Error BadText(int32_t col, FieldKind kind, const std::string& text) {
    Error e;
    e.SetFormat(ErrorCode::kCoding, "column %d: \"%s\" is not a valid %s", col,
                text.c_str(), FieldKindName(kind));
    e.field = col;
    return e;
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace sqlreq
