// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::RenderQuery -- turn a Query into the text a driver prepares.
//
// Design:
//   - Linear drivers get one "?" per parameter occurrence. A logical
//     parameter referenced twice is bound twice, so RenderedQuery::binding
//     lists, per placeholder, which logical value goes there.
//   - Numbered drivers get "$<index+1>" and bind each logical value once.
//   - Referenced indices must cover 0..n-1 without gaps.

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "sqlreq/driver_info.hpp"
#include "sqlreq/error.hpp"
#include "sqlreq/query.hpp"
#include "sqlreq/value.hpp"

namespace sqlreq {

struct RenderedQuery {
  std::string sql;
  // binding[k] is the logical parameter bound to the k-th driver slot.
  std::vector<size_t> binding;
  // Number of logical parameters.
  size_t arity = 0;
};

/// SQL string literal for text under di's quoting rules.
inline std::string QuoteString(const std::string& text, const DriverInfo& di) {
  std::string s = "'";
  for (char c : text) {
    if (c == '\'') {
      s += '\'';
    } else if (c == '\\' && di.backslash_escapes) {
      s += '\\';
    }
    s += c;
  }
  s += '\'';
  return s;
}

namespace detail {

inline void RenderInto(const Query& q, const DriverInfo& di,
                       RenderedQuery* out) {
  switch (q.kind) {
    case Query::Kind::kLiteral:
      out->sql += q.text;
      return;
    case Query::Kind::kQuoted:
      out->sql += QuoteString(q.text, di);
      return;
    case Query::Kind::kParam:
      if (di.style == ParamStyle::kLinear) {
        out->sql += '?';
        out->binding.push_back(q.index);
      } else {
        out->sql += '$';
        out->sql += std::to_string(q.index + 1);
      }
      return;
    case Query::Kind::kSeq:
      for (const Query& item : q.items) { RenderInto(item, di, out); }
      return;
  }
}

}  // namespace detail

inline Error RenderQuery(const Query& q, const DriverInfo& di,
                         RenderedQuery* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  std::vector<size_t> indices;
  CollectParamIndices(q, &indices);
  size_t arity = 0;
  for (size_t i : indices) {
    if (i + 1 > arity) { arity = i + 1; }
  }
  std::vector<bool> seen(arity, false);
  for (size_t i : indices) { seen[i] = true; }
  for (size_t k = 0; k < arity; ++k) {
    if (!seen[k]) {
      Error e;
      e.SetFormat(ErrorCode::kArity,
                  "parameter %zu of %zu is not referenced in \"%s\"", k,
                  arity, ToString(q).c_str());
      return e;
    }
  }

  RenderedQuery r;
  r.arity = arity;
  detail::RenderInto(q, di, &r);
  if (di.style == ParamStyle::kNumbered) {
    for (size_t k = 0; k < arity; ++k) { r.binding.push_back(k); }
  }
  *out = std::move(r);
  return Error::Ok();
}

/// Arrange logical parameter values in driver slot order, duplicating
/// values referenced more than once by a linear-style query.
inline Error ReorderParams(const std::vector<Value>& logical,
                           const RenderedQuery& rq,
                           std::vector<Value>* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  if (logical.size() != rq.arity) {
    Error e;
    e.SetFormat(ErrorCode::kArity, "query takes %zu parameters, got %zu",
                rq.arity, logical.size());
    return e;
  }
  out->clear();
  out->reserve(rq.binding.size());
  for (size_t idx : rq.binding) { out->push_back(logical[idx]); }
  return Error::Ok();
}

}  // namespace sqlreq
