// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::MariaStatement -- prepared statement for MariaDB/MySQL.
//
// Design:
//   - Wraps MYSQL_STMT* with RAII
//   - Move-only (no copy)
//   - Parameters bound from a vector of Values; the statement keeps its own
//     copies so bind buffers stay valid through execution
//   - Result columns fetched as text into buffers sized from max_length,
//     then converted to the requested FieldKind
//   - pdate/ptime/ptime_span travel as text, ptime_span as a TIME value

#pragma once

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <mysql.h>

#include "sqlreq/error.hpp"
#include "sqlreq/value.hpp"

namespace sqlreq {

class MariaConnection;

// my_bool in MariaDB Connector/C, bool in MySQL 8.
using MariaFlag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

// Addressable even when MariaFlag is bool (std::vector<bool> is not).
struct MariaFlagCell {
  MariaFlag value = 0;
};

/// "[-]HH:MM:SS[.ffffff]" as accepted by a TIME column.
inline std::string FormatMariaTime(Span span) {
  int64_t us = span.micros < 0 ? -span.micros : span.micros;
  int64_t secs = us / 1000000;
  int64_t frac = us % 1000000;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s%02" PRId64 ":%02d:%02d.%06" PRId64,
                span.micros < 0 ? "-" : "", secs / 3600,
                static_cast<int>((secs / 60) % 60), static_cast<int>(secs % 60),
                frac);
  return buf;
}

inline bool ParseMariaTime(const char* text, Span* out) {
  if (text == nullptr) { return false; }
  int sign = 1;
  if (*text == '-') {
    sign = -1;
    ++text;
  }
  long long h = 0;
  int m = 0;
  int s = 0;
  int consumed = 0;
  if (std::sscanf(text, "%lld:%2d:%2d%n", &h, &m, &s, &consumed) != 3) {
    return false;
  }
  const char* p = text + consumed;
  int64_t frac = 0;
  if (*p == '.') {
    ++p;
    int digits = 0;
    while (*p >= '0' && *p <= '9' && digits < 6) {
      frac = frac * 10 + (*p - '0');
      ++digits;
      ++p;
    }
    for (; digits < 6; ++digits) { frac *= 10; }
  }
  out->micros = sign * ((h * 3600 + m * 60 + s) * 1000000LL + frac);
  return true;
}

// ---------------------------------------------------------------------------
// MariaStatement
// ---------------------------------------------------------------------------

class MariaStatement {
 public:
  MariaStatement() = default;

  ~MariaStatement() { Finalize(); }

  // Move
  MariaStatement(MariaStatement&& other) noexcept
      : stmt_(other.stmt_),
        num_params_(other.num_params_),
        params_(std::move(other.params_)),
        buffers_(std::move(other.buffers_)),
        result_nulls_(std::move(other.result_nulls_)),
        result_lengths_(std::move(other.result_lengths_)),
        result_binds_(std::move(other.result_binds_)) {
    other.stmt_ = nullptr;
    other.num_params_ = 0;
  }

  MariaStatement& operator=(MariaStatement&& other) noexcept {
    if (this != &other) {
      Finalize();
      stmt_ = other.stmt_;
      num_params_ = other.num_params_;
      params_ = std::move(other.params_);
      buffers_ = std::move(other.buffers_);
      result_nulls_ = std::move(other.result_nulls_);
      result_lengths_ = std::move(other.result_lengths_);
      result_binds_ = std::move(other.result_binds_);
      other.stmt_ = nullptr;
      other.num_params_ = 0;
    }
    return *this;
  }

  // No copy
  MariaStatement(const MariaStatement&) = delete;
  MariaStatement& operator=(const MariaStatement&) = delete;

  // --- Execute ---

  /// Bind values in placeholder order and execute.
  Error Execute(const std::vector<Value>& values) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    if (static_cast<int32_t>(values.size()) != num_params_) {
      Error e;
      e.SetFormat(ErrorCode::kArity, "statement has %d parameters, got %zu",
                  num_params_, values.size());
      return e;
    }

    params_ = values;
    std::vector<MYSQL_BIND> binds(params_.size());
    std::vector<MariaFlagCell> nulls(params_.size());
    std::vector<unsigned long> lengths(params_.size(), 0);
    for (size_t i = 0; i < params_.size(); ++i) {
      BindParam(&params_[i], &binds[i], &nulls[i].value, &lengths[i]);
    }
    if (!binds.empty() && mysql_stmt_bind_param(stmt_, binds.data()) != 0) {
      return Error::Make(ErrorCode::kError, mysql_stmt_error(stmt_));
    }
    if (mysql_stmt_execute(stmt_) != 0) {
      return Error::Make(ErrorCode::kError, mysql_stmt_error(stmt_));
    }
    return Error::Ok();
  }

  int32_t NumColumns() const {
    return stmt_ ? static_cast<int32_t>(mysql_stmt_field_count(stmt_)) : 0;
  }

  int64_t AffectedRows() const {
    return stmt_ ? static_cast<int64_t>(mysql_stmt_affected_rows(stmt_)) : 0;
  }

  /// Buffer the result set and bind a text buffer per column.
  Error StoreResult() {
    int32_t ncols = NumColumns();
    if (ncols == 0) { return Error::Ok(); }

    MariaFlag update_max = 1;
    mysql_stmt_attr_set(stmt_, STMT_ATTR_UPDATE_MAX_LENGTH, &update_max);
    if (mysql_stmt_store_result(stmt_) != 0) {
      return Error::Make(ErrorCode::kError, mysql_stmt_error(stmt_));
    }
    MYSQL_RES* meta = mysql_stmt_result_metadata(stmt_);
    if (meta == nullptr) {
      return Error::Make(ErrorCode::kError, "No result metadata");
    }
    MYSQL_FIELD* fields = mysql_fetch_fields(meta);

    size_t n = static_cast<size_t>(ncols);
    buffers_.assign(n, std::vector<char>());
    result_nulls_.assign(n, MariaFlagCell());
    result_lengths_.assign(n, 0);
    result_binds_.assign(n, MYSQL_BIND());
    for (size_t c = 0; c < n; ++c) {
      buffers_[c].resize(static_cast<size_t>(fields[c].max_length) + 1);
      std::memset(&result_binds_[c], 0, sizeof(MYSQL_BIND));
      result_binds_[c].buffer_type = MYSQL_TYPE_STRING;
      result_binds_[c].buffer = buffers_[c].data();
      result_binds_[c].buffer_length =
          static_cast<unsigned long>(buffers_[c].size());
      result_binds_[c].is_null = &result_nulls_[c].value;
      result_binds_[c].length = &result_lengths_[c];
    }
    mysql_free_result(meta);

    if (mysql_stmt_bind_result(stmt_, result_binds_.data()) != 0) {
      return Error::Make(ErrorCode::kError, mysql_stmt_error(stmt_));
    }
    return Error::Ok();
  }

  /// Fetch the next buffered row. *has_row is false at the end.
  Error Fetch(bool* has_row) {
    *has_row = false;
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int rc = mysql_stmt_fetch(stmt_);
    if (rc == MYSQL_NO_DATA) { return Error::Ok(); }
    if (rc == MYSQL_DATA_TRUNCATED) {
      return Error::Make(ErrorCode::kError, "column data truncated");
    }
    if (rc != 0) {
      return Error::Make(ErrorCode::kError, mysql_stmt_error(stmt_));
    }
    *has_row = true;
    return Error::Ok();
  }

  /// Convert column col of the fetched row to kind.
  Error Read(int32_t col, FieldKind kind, Value* out) const {
    size_t c = static_cast<size_t>(col);
    if (col < 0 || c >= buffers_.size()) {
      return Error::Coding(col, "column out of range");
    }
    if (result_nulls_[c].value) {
      *out = Value::Null(kind);
      return Error::Ok();
    }
    std::string text(buffers_[c].data(), result_lengths_[c]);
    switch (kind) {
      case FieldKind::kBool:
        *out = Value::OfBool(std::strtoll(text.c_str(), nullptr, 10) != 0);
        return Error::Ok();
      case FieldKind::kInt:
      case FieldKind::kInt16:
      case FieldKind::kInt32:
      case FieldKind::kInt64: {
        char* end = nullptr;
        long long v = std::strtoll(text.c_str(), &end, 10);
        if (end == text.c_str()) { return BadText(col, kind, text); }
        *out = Value::OfInt(kind, v);
        return Error::Ok();
      }
      case FieldKind::kFloat: {
        char* end = nullptr;
        double v = std::strtod(text.c_str(), &end);
        if (end == text.c_str()) { return BadText(col, kind, text); }
        *out = Value::OfFloat(v);
        return Error::Ok();
      }
      case FieldKind::kString:
        *out = Value::OfString(std::move(text));
        return Error::Ok();
      case FieldKind::kOctets:
        *out = Value::OfOctets(std::move(text));
        return Error::Ok();
      case FieldKind::kDate: {
        Date d;
        if (!ParseDate(text.c_str(), &d)) { return BadText(col, kind, text); }
        *out = Value::OfDate(d);
        return Error::Ok();
      }
      case FieldKind::kTime: {
        Timestamp t;
        if (!ParseTimestamp(text.c_str(), &t)) {
          return BadText(col, kind, text);
        }
        *out = Value::OfTime(t);
        return Error::Ok();
      }
      case FieldKind::kSpan: {
        Span s;
        if (!ParseMariaTime(text.c_str(), &s)) {
          return BadText(col, kind, text);
        }
        *out = Value::OfSpan(s);
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
    mysql_stmt_free_result(stmt_);
    if (mysql_stmt_reset(stmt_) != 0) {
      return Error::Make(ErrorCode::kError, mysql_stmt_error(stmt_));
    }
    params_.clear();
    return Error::Ok();
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      mysql_stmt_close(stmt_);
      stmt_ = nullptr;
    }
    num_params_ = 0;
    params_.clear();
    buffers_.clear();
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class MariaConnection;

  explicit MariaStatement(MYSQL_STMT* stmt) : stmt_(stmt) {
    if (stmt_ != nullptr) {
      num_params_ = static_cast<int32_t>(mysql_stmt_param_count(stmt_));
    }
  }

  // Rewrites *v in place where the wire form differs from the payload.
  static void BindParam(Value* v, MYSQL_BIND* bind, MariaFlag* is_null,
                        unsigned long* length) {
    std::memset(bind, 0, sizeof(MYSQL_BIND));
    bind->is_null = is_null;
    if (v->is_null) {
      bind->buffer_type = MYSQL_TYPE_NULL;
      *is_null = 1;
      return;
    }
    switch (v->kind) {
      case FieldKind::kBool:
        v->i = v->b ? 1 : 0;
        bind->buffer_type = MYSQL_TYPE_LONGLONG;
        bind->buffer = &v->i;
        return;
      case FieldKind::kInt:
      case FieldKind::kInt16:
      case FieldKind::kInt32:
      case FieldKind::kInt64:
        bind->buffer_type = MYSQL_TYPE_LONGLONG;
        bind->buffer = &v->i;
        return;
      case FieldKind::kFloat:
        bind->buffer_type = MYSQL_TYPE_DOUBLE;
        bind->buffer = &v->f;
        return;
      case FieldKind::kString:
      case FieldKind::kOctets:
        break;
      case FieldKind::kDate:
        v->s = FormatDate(Date{static_cast<int32_t>(v->i)});
        break;
      case FieldKind::kTime:
        v->s = FormatTimestamp(Timestamp{v->i});
        break;
      case FieldKind::kSpan:
        v->s = FormatMariaTime(Span{v->i});
        break;
    }
    bind->buffer_type = (v->kind == FieldKind::kOctets) ? MYSQL_TYPE_BLOB
                                                        : MYSQL_TYPE_STRING;
    bind->buffer = const_cast<char*>(v->s.data());
    bind->buffer_length = static_cast<unsigned long>(v->s.size());
    *length = bind->buffer_length;
    bind->length = length;
  }

  static Error BadText(int32_t col, FieldKind kind, const std::string& text) {
    Error e;
    e.SetFormat(ErrorCode::kCoding, "column %d: \"%s\" is not a valid %s", col,
                text.c_str(), FieldKindName(kind));
    e.field = col;
    return e;
  }

  MYSQL_STMT* stmt_ = nullptr;
  int32_t num_params_ = 0;
  std::vector<Value> params_;
  std::vector<std::vector<char>> buffers_;
  std::vector<MariaFlagCell> result_nulls_;
  std::vector<unsigned long> result_lengths_;
  std::vector<MYSQL_BIND> result_binds_;
};

}  // namespace sqlreq
