// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Value -- one flattened field value exchanged with a driver.
//
// Design:
//   - FieldKind names the leaf kinds a type descriptor flattens into
//   - Value is a plain tagged struct: kind + null flag + payload
//   - Date/Timestamp/Span are thin wrappers over integer counts (UTC)
//   - ISO-8601 text conversion for drivers that transport them as text

#pragma once

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>

namespace sqlreq {

// ---------------------------------------------------------------------------
// FieldKind
// ---------------------------------------------------------------------------

enum class FieldKind : uint8_t {
  kBool = 0,
  kInt,
  kInt16,
  kInt32,
  kInt64,
  kFloat,
  kString,
  kOctets,
  kDate,
  kTime,
  kSpan,
};

inline const char* FieldKindName(FieldKind kind) {
  switch (kind) {
    case FieldKind::kBool:   return "bool";
    case FieldKind::kInt:    return "int";
    case FieldKind::kInt16:  return "int16";
    case FieldKind::kInt32:  return "int32";
    case FieldKind::kInt64:  return "int64";
    case FieldKind::kFloat:  return "float";
    case FieldKind::kString: return "string";
    case FieldKind::kOctets: return "octets";
    case FieldKind::kDate:   return "pdate";
    case FieldKind::kTime:   return "ptime";
    case FieldKind::kSpan:   return "ptime_span";
  }
  return "?";
}

inline bool IsIntegerKind(FieldKind kind) {
  return kind == FieldKind::kInt || kind == FieldKind::kInt16 ||
         kind == FieldKind::kInt32 || kind == FieldKind::kInt64;
}

// ---------------------------------------------------------------------------
// Calendar types
// ---------------------------------------------------------------------------

/// Days since 1970-01-01.
struct Date {
  int32_t days = 0;
};

/// Microseconds since 1970-01-01T00:00:00Z.
struct Timestamp {
  int64_t micros = 0;
};

/// Signed duration in microseconds.
struct Span {
  int64_t micros = 0;
};

inline bool operator==(Date a, Date b) { return a.days == b.days; }
inline bool operator==(Timestamp a, Timestamp b) { return a.micros == b.micros; }
inline bool operator==(Span a, Span b) { return a.micros == b.micros; }

// Proleptic Gregorian conversions after H. Hinnant's civil-from-days.
inline int32_t DaysFromCivil(int32_t y, uint32_t m, uint32_t d) {
  y -= m <= 2 ? 1 : 0;
  const int32_t era = (y >= 0 ? y : y - 399) / 400;
  const uint32_t yoe = static_cast<uint32_t>(y - era * 400);
  const uint32_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int32_t>(doe) - 719468;
}

inline void CivilFromDays(int32_t z, int32_t* y, uint32_t* m, uint32_t* d) {
  z += 719468;
  const int32_t era = (z >= 0 ? z : z - 146096) / 146097;
  const uint32_t doe = static_cast<uint32_t>(z - era * 146097);
  const uint32_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const uint32_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const uint32_t mp = (5 * doy + 2) / 153;
  *d = doy - (153 * mp + 2) / 5 + 1;
  *m = mp < 10 ? mp + 3 : mp - 9;
  *y = static_cast<int32_t>(yoe) + era * 400 + (*m <= 2 ? 1 : 0);
}

inline int64_t FloorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) { --q; }
  return q;
}

/// "YYYY-MM-DD"
inline std::string FormatDate(Date date) {
  int32_t y = 0;
  uint32_t m = 0;
  uint32_t d = 0;
  CivilFromDays(date.days, &y, &m, &d);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
  return buf;
}

inline bool ParseDate(const char* text, Date* out) {
  if (text == nullptr || out == nullptr) { return false; }
  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  int consumed = 0;
  if (std::sscanf(text, "%d-%u-%u%n", &y, &m, &d, &consumed) != 3) {
    return false;
  }
  if (m < 1 || m > 12 || d < 1 || d > 31) { return false; }
  out->days = DaysFromCivil(y, m, d);
  return true;
}

/// "YYYY-MM-DD HH:MM:SS" with ".ffffff" appended when sub-second, UTC.
inline std::string FormatTimestamp(Timestamp ts) {
  const int64_t kMicrosPerDay = 86400LL * 1000000LL;
  int64_t days = FloorDiv(ts.micros, kMicrosPerDay);
  int64_t rem = ts.micros - days * kMicrosPerDay;
  int64_t secs = rem / 1000000;
  int64_t frac = rem % 1000000;
  std::string out = FormatDate(Date{static_cast<int32_t>(days)});
  char buf[32];
  std::snprintf(buf, sizeof(buf), " %02d:%02d:%02d",
                static_cast<int>(secs / 3600),
                static_cast<int>((secs / 60) % 60),
                static_cast<int>(secs % 60));
  out += buf;
  if (frac != 0) {
    std::snprintf(buf, sizeof(buf), ".%06" PRId64, frac);
    out += buf;
  }
  return out;
}

/// Accepts "YYYY-MM-DD[ T]HH:MM:SS[.f{1,6}][Z|(+|-)HH[:MM]]".
inline bool ParseTimestamp(const char* text, Timestamp* out) {
  if (text == nullptr || out == nullptr) { return false; }
  Date date;
  if (!ParseDate(text, &date)) { return false; }
  const char* p = text;
  while (*p != '\0' && *p != ' ' && *p != 'T') { ++p; }
  if (*p == '\0') { return false; }
  ++p;
  int hh = 0;
  int mm = 0;
  int ss = 0;
  int consumed = 0;
  if (std::sscanf(p, "%2d:%2d:%2d%n", &hh, &mm, &ss, &consumed) != 3) {
    return false;
  }
  if (hh > 23 || mm > 59 || ss > 60) { return false; }
  p += consumed;
  int64_t frac = 0;
  if (*p == '.') {
    ++p;
    int digits = 0;
    while (*p >= '0' && *p <= '9') {
      if (digits < 6) {
        frac = frac * 10 + (*p - '0');
        ++digits;
      }
      ++p;
    }
    if (digits == 0) { return false; }
    for (; digits < 6; ++digits) { frac *= 10; }
  }
  int64_t offset_secs = 0;
  if (*p == 'Z') {
    ++p;
  } else if (*p == '+' || *p == '-') {
    int sign = (*p == '-') ? -1 : 1;
    ++p;
    // +HH, +HH:MM or +HHMM
    auto two_digits = [&p](int* v) {
      if (p[0] < '0' || p[0] > '9' || p[1] < '0' || p[1] > '9') {
        return false;
      }
      *v = (p[0] - '0') * 10 + (p[1] - '0');
      p += 2;
      return true;
    };
    int oh = 0;
    int om = 0;
    if (!two_digits(&oh)) { return false; }
    if (*p == ':') {
      ++p;
      if (!two_digits(&om)) { return false; }
    } else if (*p != '\0' && !two_digits(&om)) {
      return false;
    }
    if (oh > 23 || om > 59) { return false; }
    offset_secs = sign * (oh * 3600 + om * 60);
  }
  if (*p != '\0') { return false; }
  int64_t secs = static_cast<int64_t>(date.days) * 86400 + hh * 3600 +
                 mm * 60 + ss - offset_secs;
  out->micros = secs * 1000000 + frac;
  return true;
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

struct Value {
  FieldKind kind = FieldKind::kString;
  bool is_null = true;
  bool b = false;
  int64_t i = 0;    // integer kinds, kDate (days), kTime/kSpan (micros)
  double f = 0.0;
  std::string s;    // kString, kOctets

  static Value Null(FieldKind k) {
    Value v;
    v.kind = k;
    return v;
  }

  static Value OfBool(bool x) {
    Value v;
    v.kind = FieldKind::kBool;
    v.is_null = false;
    v.b = x;
    return v;
  }

  static Value OfInt(FieldKind k, int64_t x) {
    Value v;
    v.kind = k;
    v.is_null = false;
    v.i = x;
    return v;
  }

  static Value OfFloat(double x) {
    Value v;
    v.kind = FieldKind::kFloat;
    v.is_null = false;
    v.f = x;
    return v;
  }

  static Value OfString(std::string x) {
    Value v;
    v.kind = FieldKind::kString;
    v.is_null = false;
    v.s = std::move(x);
    return v;
  }

  static Value OfOctets(std::string x) {
    Value v;
    v.kind = FieldKind::kOctets;
    v.is_null = false;
    v.s = std::move(x);
    return v;
  }

  static Value OfDate(Date x) { return OfInt(FieldKind::kDate, x.days); }
  static Value OfTime(Timestamp x) { return OfInt(FieldKind::kTime, x.micros); }
  static Value OfSpan(Span x) { return OfInt(FieldKind::kSpan, x.micros); }
};

/// Human-readable rendering used by request dumps.
inline std::string ValueToString(const Value& v) {
  if (v.is_null) { return "NULL"; }
  char buf[64];
  switch (v.kind) {
    case FieldKind::kBool:
      return v.b ? "true" : "false";
    case FieldKind::kInt:
    case FieldKind::kInt16:
    case FieldKind::kInt32:
    case FieldKind::kInt64:
      std::snprintf(buf, sizeof(buf), "%" PRId64, v.i);
      return buf;
    case FieldKind::kFloat:
      std::snprintf(buf, sizeof(buf), "%.17g", v.f);
      return buf;
    case FieldKind::kString:
      return "\"" + v.s + "\"";
    case FieldKind::kOctets:
      std::snprintf(buf, sizeof(buf), "<%zu octets>", v.s.size());
      return buf;
    case FieldKind::kDate:
      return FormatDate(Date{static_cast<int32_t>(v.i)});
    case FieldKind::kTime:
      return FormatTimestamp(Timestamp{v.i});
    case FieldKind::kSpan:
      std::snprintf(buf, sizeof(buf), "%.6fs",
                    static_cast<double>(v.i) / 1e6);
      return buf;
  }
  return "?";
}

}  // namespace sqlreq
