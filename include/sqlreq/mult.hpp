// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Mult -- how many rows a request may produce.
//
// The ordering is the chain kZero <= kOne <= kZeroOrOne <= kMany, read as
// "at most as permissive as". kZero sits below kOne although the row counts
// they admit are disjoint; the order ranks what a consuming call is
// prepared to handle, not sets of row counts.
//
// Consumption is gated statically only on whether rows are expected at
// all. A narrower call on a wider request (Find on a kMany request) is
// allowed and the row count is checked against the actual result.

#pragma once

#include <cstddef>
#include <cstdint>

namespace sqlreq {

enum class Mult : uint8_t {
  kZero = 0,
  kOne = 1,
  kZeroOrOne = 2,
  kMany = 3,
};

/// a <= b in the multiplicity lattice.
constexpr bool MultLeq(Mult a, Mult b) {
  return static_cast<uint8_t>(a) <= static_cast<uint8_t>(b);
}

/// Least upper bound.
constexpr Mult MultUnion(Mult a, Mult b) {
  return MultLeq(a, b) ? b : a;
}

/// Greatest lower bound.
constexpr Mult MultIntersect(Mult a, Mult b) {
  return MultLeq(a, b) ? a : b;
}

/// Whether a result set of `rows` rows is acceptable under m.
constexpr bool MultAdmits(Mult m, size_t rows) {
  return m == Mult::kZero        ? rows == 0
         : m == Mult::kOne       ? rows == 1
         : m == Mult::kZeroOrOne ? rows <= 1
                                 : true;
}

constexpr bool MultExpectsRows(Mult m) { return m != Mult::kZero; }

/// Whether a request declared m may be consumed by a call expecting x.
/// The no-row call takes only kZero and calls expecting rows take anything
/// else.
constexpr bool MultConsumableAs(Mult m, Mult x) {
  return MultExpectsRows(x) == MultExpectsRows(m);
}

inline const char* MultName(Mult m) {
  switch (m) {
    case Mult::kZero:      return "zero";
    case Mult::kOne:       return "one";
    case Mult::kZeroOrOne: return "zero_or_one";
    case Mult::kMany:      return "many";
  }
  return "?";
}

/// Short suffix used in request dumps, e.g. "(int -> string)?".
inline const char* MultSigil(Mult m) {
  switch (m) {
    case Mult::kZero:      return "";
    case Mult::kOne:       return "!";
    case Mult::kZeroOrOne: return "?";
    case Mult::kMany:      return "*";
  }
  return "";
}

}  // namespace sqlreq
