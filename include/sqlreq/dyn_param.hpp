// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::DynParam -- a parameter list whose shape is found at run time,
// for queries assembled dynamically.
//
// Usage:
//   sqlreq::DynParam params;
//   std::string sql = "SELECT id FROM items WHERE 1=1";
//   if (name) { sql += " AND name = ?"; params = params.Add(sqlreq::String(), *name); }
//   if (min)  { sql += " AND price >= ?"; params = params.Add(sqlreq::Float(), *min); }
//   auto req = sqlreq::Collect(params.ParamType(), sqlreq::Int(), sql,
//                              oneshot_opts);
//   conn.Collect(req, params, &ids);
//
// Each DynParam has its own descriptor, so requests built from one should
// be oneshot.

#pragma once

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "sqlreq/error.hpp"
#include "sqlreq/type.hpp"
#include "sqlreq/value.hpp"

namespace sqlreq {

class DynParam {
 public:
  /// No parameters.
  DynParam()
      : node_(MakeProductNode({})),
        encode_([](std::vector<Value>*) { return Error::Ok(); }) {}

  /// A single typed value.
  template <typename T>
  static DynParam Of(const Type<T>& type, T value) {
    DynParam p;
    p.node_ = type.Node();
    p.encode_ = [type, value](std::vector<Value>* out) {
      return type.Encode(value, out);
    };
    return p;
  }

  /// The product of a and b, a's fields first.
  static DynParam Append(const DynParam& a, const DynParam& b) {
    DynParam p;
    p.node_ = MakeProductNode({a.node_, b.node_});
    auto ea = a.encode_;
    auto eb = b.encode_;
    p.encode_ = [ea, eb](std::vector<Value>* out) {
      Error err = ea(out);
      if (!err.ok()) { return err; }
      return eb(out);
    };
    return p;
  }

  template <typename T>
  DynParam Add(const Type<T>& type, T value) const {
    return Append(*this, Of(type, std::move(value)));
  }

  size_t Length() const { return sqlreq::Length(*node_); }
  const TypeNodePtr& Node() const { return node_; }

  Error Encode(std::vector<Value>* out) const { return encode_(out); }

  /// Descriptor matching the shape of this list. Encoding through it
  /// emits the values held by whichever DynParam is passed.
  Type<DynParam> ParamType() const {
    size_t expected = Length();
    return Type<DynParam>(
        node_,
        [expected](const DynParam& p, std::vector<Value>* out) {
          size_t before = out->size();
          Error err = p.Encode(out);
          if (err.ok() && out->size() - before != expected) {
            err.SetFormat(ErrorCode::kArity,
                          "dynamic parameters have %zu fields, expected %zu",
                          out->size() - before, expected);
          }
          return err;
        },
        [](const std::vector<Value>&, size_t* pos, DynParam*) {
          return Error::Coding(static_cast<int32_t>(*pos),
                               "DynParam cannot be decoded");
        });
  }

 private:
  TypeNodePtr node_;
  std::function<Error(std::vector<Value>*)> encode_;
};

}  // namespace sqlreq
