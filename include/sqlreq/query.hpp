// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Query -- backend-neutral form of an SQL statement.
//
// Design:
//   - Closed set of node kinds:
//       kLiteral  text copied verbatim
//       kQuoted   contents of a single-quoted SQL string (unescaped)
//       kParam    reference to logical parameter `index` (0-based)
//       kSeq      concatenation of `items`
//   - Plain value type; queries are built once and never mutated.
//   - Normalize() flattens sequences and merges adjacent literals, so two
//     queries that render identically compare equal after normalization.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sqlreq {

// ---------------------------------------------------------------------------
// Query
// ---------------------------------------------------------------------------

struct Query {
  enum class Kind : uint8_t { kLiteral, kQuoted, kParam, kSeq };

  Kind kind = Kind::kSeq;
  std::string text;          // kLiteral, kQuoted
  size_t index = 0;          // kParam
  std::vector<Query> items;  // kSeq

  static Query L(std::string s) {
    Query q;
    q.kind = Kind::kLiteral;
    q.text = std::move(s);
    return q;
  }

  static Query Q(std::string s) {
    Query q;
    q.kind = Kind::kQuoted;
    q.text = std::move(s);
    return q;
  }

  static Query P(size_t i) {
    Query q;
    q.kind = Kind::kParam;
    q.index = i;
    return q;
  }

  static Query S(std::vector<Query> parts) {
    Query q;
    q.kind = Kind::kSeq;
    q.items = std::move(parts);
    return q;
  }

  /// The empty query.
  static Query Empty() { return S({}); }
};

inline Query Concat(Query a, Query b) {
  std::vector<Query> parts;
  parts.push_back(std::move(a));
  parts.push_back(std::move(b));
  return Query::S(std::move(parts));
}

/// Structural equality.
inline bool operator==(const Query& a, const Query& b) {
  if (a.kind != b.kind) { return false; }
  switch (a.kind) {
    case Query::Kind::kLiteral:
    case Query::Kind::kQuoted:
      return a.text == b.text;
    case Query::Kind::kParam:
      return a.index == b.index;
    case Query::Kind::kSeq:
      return a.items == b.items;
  }
  return false;
}

inline bool operator!=(const Query& a, const Query& b) { return !(a == b); }

namespace detail {

inline void FlattenInto(const Query& q, std::vector<Query>* out) {
  switch (q.kind) {
    case Query::Kind::kLiteral:
      if (q.text.empty()) { return; }
      if (!out->empty() && out->back().kind == Query::Kind::kLiteral) {
        out->back().text += q.text;
        return;
      }
      out->push_back(q);
      return;
    case Query::Kind::kQuoted:
    case Query::Kind::kParam:
      out->push_back(q);
      return;
    case Query::Kind::kSeq:
      for (const Query& item : q.items) { FlattenInto(item, out); }
      return;
  }
}

}  // namespace detail

/// A flat kSeq of kLiteral/kQuoted/kParam nodes, with no empty literal and
/// no two literals adjacent.
inline Query Normalize(const Query& q) {
  std::vector<Query> parts;
  detail::FlattenInto(q, &parts);
  return Query::S(std::move(parts));
}

/// True if q renders to the empty string.
inline bool IsEmpty(const Query& q) {
  switch (q.kind) {
    case Query::Kind::kLiteral:
      return q.text.empty();
    case Query::Kind::kQuoted:
    case Query::Kind::kParam:
      return false;
    case Query::Kind::kSeq:
      for (const Query& item : q.items) {
        if (!IsEmpty(item)) { return false; }
      }
      return true;
  }
  return true;
}

inline void CollectParamIndices(const Query& q, std::vector<size_t>* out) {
  switch (q.kind) {
    case Query::Kind::kLiteral:
    case Query::Kind::kQuoted:
      return;
    case Query::Kind::kParam:
      out->push_back(q.index);
      return;
    case Query::Kind::kSeq:
      for (const Query& item : q.items) { CollectParamIndices(item, out); }
      return;
  }
}

/// Highest referenced parameter index plus one, 0 without parameters.
inline size_t ParamLength(const Query& q) {
  std::vector<size_t> indices;
  CollectParamIndices(q, &indices);
  size_t n = 0;
  for (size_t i : indices) {
    if (i + 1 > n) { n = i + 1; }
  }
  return n;
}

/// Debug form: literals verbatim, quoted text in '...', params as $n.
inline std::string ToString(const Query& q) {
  switch (q.kind) {
    case Query::Kind::kLiteral:
      return q.text;
    case Query::Kind::kQuoted: {
      std::string s = "'";
      for (char c : q.text) {
        if (c == '\'') { s += '\''; }
        s += c;
      }
      return s + "'";
    }
    case Query::Kind::kParam:
      return "$" + std::to_string(q.index + 1);
    case Query::Kind::kSeq: {
      std::string s;
      for (const Query& item : q.items) { s += ToString(item); }
      return s;
    }
  }
  return std::string();
}

}  // namespace sqlreq
