// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer + field position
//   - Compatible with -fno-exceptions
//   - Context can be prepended while an error travels up the call chain

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace sqlreq {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kBusy = -3,
  kNotFound = -4,
  kConstraint = -5,
  kMismatch = -6,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,
  kIoError = -10,
  kFull = -11,
  kParse = -12,
  kLookup = -13,
  kArity = -14,
  kCoding = -15,
  kRowCount = -16,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:         return "ok";
    case ErrorCode::kError:      return "error";
    case ErrorCode::kNotOpen:    return "not_open";
    case ErrorCode::kBusy:       return "busy";
    case ErrorCode::kNotFound:   return "not_found";
    case ErrorCode::kConstraint: return "constraint";
    case ErrorCode::kMismatch:   return "mismatch";
    case ErrorCode::kMisuse:     return "misuse";
    case ErrorCode::kRange:      return "range";
    case ErrorCode::kNullParam:  return "null_param";
    case ErrorCode::kIoError:    return "io_error";
    case ErrorCode::kFull:       return "full";
    case ErrorCode::kParse:      return "parse";
    case ErrorCode::kLookup:     return "lookup";
    case ErrorCode::kArity:      return "arity";
    case ErrorCode::kCoding:     return "coding";
    case ErrorCode::kRowCount:   return "row_count";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 512;

  ErrorCode code = ErrorCode::kOk;
  // Flattened field position for kCoding, -1 when not applicable.
  int32_t field = -1;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  /// Prepend "<context>: " to the message, keeping code and field.
  void AddContext(const char* fmt, ...) {
    if (fmt == nullptr) { return; }
    char prefix[kMaxMessageLen];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(prefix, sizeof(prefix), fmt, ap);
    va_end(ap);

    char old[kMaxMessageLen];
    std::memcpy(old, message, sizeof(old));
    if (old[0] != '\0') {
      std::snprintf(message, kMaxMessageLen, "%s: %s", prefix, old);
    } else {
      std::snprintf(message, kMaxMessageLen, "%s", prefix);
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    field = -1;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }

  static Error Coding(int32_t field_pos, const char* msg) {
    Error e;
    e.Set(ErrorCode::kCoding, msg);
    e.field = field_pos;
    return e;
  }
};

/// Store err into *out_error if the caller asked for it.
inline void Report(const Error& err, Error* out_error) {
  if (out_error != nullptr) { *out_error = err; }
}

}  // namespace sqlreq
