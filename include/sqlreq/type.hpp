// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Type<T> -- value-level description of how T is flattened into
// driver field values and rebuilt from them.
//
// Design:
//   - TypeNode is a closed variant: field / option / product / custom.
//     Length, FieldKinds, Describe and FormatFields match on it exhaustively.
//   - Type<T> pairs a TypeNode with an encoder and a decoder built by the
//     same combinator, so the flattened field sequence produced by Encode
//     is exactly the one Decode consumes.
//   - Immutable and cheap to copy (shared node, shared closures).
//   - Decoding requires T to be default constructible.
//
// Usage:
//   auto t = sqlreq::Tup(sqlreq::Int(), sqlreq::Option(sqlreq::String()));
//   std::vector<sqlreq::Value> fields;
//   t.Encode(std::make_tuple(int64_t{1}, std::optional<std::string>{}),
//            &fields);  // two fields: 1, NULL

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "sqlreq/error.hpp"
#include "sqlreq/value.hpp"

namespace sqlreq {

// ---------------------------------------------------------------------------
// TypeNode
// ---------------------------------------------------------------------------

struct TypeNode;
using TypeNodePtr = std::shared_ptr<const TypeNode>;

struct TypeNode {
  enum class Kind : uint8_t { kField, kOption, kProduct, kCustom };

  Kind kind = Kind::kProduct;
  FieldKind field = FieldKind::kString;  // kField
  // kOption: the wrapped type; kProduct: the components;
  // kCustom: the representation type.
  std::vector<TypeNodePtr> items;
  std::string name;                      // kCustom
  bool redact = false;                   // kCustom
};

inline TypeNodePtr MakeFieldNode(FieldKind field) {
  auto n = std::make_shared<TypeNode>();
  n->kind = TypeNode::Kind::kField;
  n->field = field;
  return n;
}

inline TypeNodePtr MakeOptionNode(TypeNodePtr inner) {
  auto n = std::make_shared<TypeNode>();
  n->kind = TypeNode::Kind::kOption;
  n->items.push_back(std::move(inner));
  return n;
}

inline TypeNodePtr MakeProductNode(std::vector<TypeNodePtr> items) {
  auto n = std::make_shared<TypeNode>();
  n->kind = TypeNode::Kind::kProduct;
  n->items = std::move(items);
  return n;
}

inline TypeNodePtr MakeCustomNode(std::string name, TypeNodePtr rep,
                                  bool redact) {
  auto n = std::make_shared<TypeNode>();
  n->kind = TypeNode::Kind::kCustom;
  n->name = std::move(name);
  n->items.push_back(std::move(rep));
  n->redact = redact;
  return n;
}

/// Number of flattened fields.
inline size_t Length(const TypeNode& node) {
  switch (node.kind) {
    case TypeNode::Kind::kField:
      return 1;
    case TypeNode::Kind::kOption:
    case TypeNode::Kind::kCustom:
      return Length(*node.items[0]);
    case TypeNode::Kind::kProduct: {
      size_t n = 0;
      for (const auto& item : node.items) { n += Length(*item); }
      return n;
    }
  }
  return 0;
}

inline void AppendFieldKinds(const TypeNode& node,
                             std::vector<FieldKind>* out) {
  switch (node.kind) {
    case TypeNode::Kind::kField:
      out->push_back(node.field);
      return;
    case TypeNode::Kind::kOption:
    case TypeNode::Kind::kCustom:
      AppendFieldKinds(*node.items[0], out);
      return;
    case TypeNode::Kind::kProduct:
      for (const auto& item : node.items) { AppendFieldKinds(*item, out); }
      return;
  }
}

inline std::vector<FieldKind> FieldKinds(const TypeNode& node) {
  std::vector<FieldKind> out;
  AppendFieldKinds(node, &out);
  return out;
}

inline std::string DescribeNode(const TypeNode& node) {
  switch (node.kind) {
    case TypeNode::Kind::kField:
      return FieldKindName(node.field);
    case TypeNode::Kind::kOption:
      return "option(" + DescribeNode(*node.items[0]) + ")";
    case TypeNode::Kind::kProduct: {
      if (node.items.empty()) { return "unit"; }
      std::string s = "(";
      for (size_t i = 0; i < node.items.size(); ++i) {
        if (i > 0) { s += ", "; }
        s += DescribeNode(*node.items[i]);
      }
      return s + ")";
    }
    case TypeNode::Kind::kCustom: {
      std::string s = node.name.empty() ? DescribeNode(*node.items[0])
                                        : node.name;
      return node.redact ? "redacted(" + s + ")" : s;
    }
  }
  return "?";
}

inline bool AnyRedacted(const TypeNode& node) {
  if (node.kind == TypeNode::Kind::kCustom && node.redact) { return true; }
  for (const auto& item : node.items) {
    if (AnyRedacted(*item)) { return true; }
  }
  return false;
}

namespace detail {

inline void FormatFieldsAt(const TypeNode& node,
                           const std::vector<Value>& fields, size_t* pos,
                           bool reveal_redacted, std::string* out) {
  switch (node.kind) {
    case TypeNode::Kind::kField:
      *out += (*pos < fields.size()) ? ValueToString(fields[*pos]) : "?";
      ++*pos;
      return;
    case TypeNode::Kind::kOption: {
      size_t n = Length(*node.items[0]);
      bool all_null = n > 0;
      for (size_t i = *pos; i < *pos + n && i < fields.size(); ++i) {
        if (!fields[i].is_null) { all_null = false; }
      }
      if (all_null) {
        *out += "None";
        *pos += n;
      } else {
        FormatFieldsAt(*node.items[0], fields, pos, reveal_redacted, out);
      }
      return;
    }
    case TypeNode::Kind::kProduct:
      *out += "(";
      for (size_t i = 0; i < node.items.size(); ++i) {
        if (i > 0) { *out += ", "; }
        FormatFieldsAt(*node.items[i], fields, pos, reveal_redacted, out);
      }
      *out += ")";
      return;
    case TypeNode::Kind::kCustom:
      if (node.redact && !reveal_redacted) {
        *out += "<redacted>";
        *pos += Length(*node.items[0]);
        return;
      }
      FormatFieldsAt(*node.items[0], fields, pos, reveal_redacted, out);
      return;
  }
}

}  // namespace detail

/// Render encoded fields following the structure of node. Fields under a
/// redacted custom node print as "<redacted>" unless reveal_redacted.
inline std::string FormatFields(const TypeNode& node,
                                const std::vector<Value>& fields,
                                bool reveal_redacted) {
  std::string out;
  size_t pos = 0;
  detail::FormatFieldsAt(node, fields, &pos, reveal_redacted, &out);
  return out;
}

// ---------------------------------------------------------------------------
// Type<T>
// ---------------------------------------------------------------------------

template <typename T>
class Type {
 public:
  using ValueType = T;
  using Encoder = std::function<Error(const T&, std::vector<Value>*)>;
  using Decoder =
      std::function<Error(const std::vector<Value>&, size_t*, T*)>;

  Type() = default;

  Type(TypeNodePtr node, Encoder encode, Decoder decode)
      : node_(std::move(node)),
        encode_(std::move(encode)),
        decode_(std::move(decode)) {}

  bool Valid() const { return node_ != nullptr; }
  const TypeNodePtr& Node() const { return node_; }

  size_t Length() const { return node_ ? sqlreq::Length(*node_) : 0; }

  std::vector<FieldKind> FieldKinds() const {
    return node_ ? sqlreq::FieldKinds(*node_) : std::vector<FieldKind>{};
  }

  std::string Describe() const {
    return node_ ? DescribeNode(*node_) : "<invalid>";
  }

  /// Append the fields of value to out.
  Error Encode(const T& value, std::vector<Value>* out) const {
    if (!encode_) { return Error::Make(ErrorCode::kMisuse, "invalid type"); }
    return encode_(value, out);
  }

  /// Decode starting at fields[*pos], advancing *pos past what was used.
  Error Decode(const std::vector<Value>& fields, size_t* pos,
               T* out) const {
    if (!decode_) { return Error::Make(ErrorCode::kMisuse, "invalid type"); }
    return decode_(fields, pos, out);
  }

  /// Decode a whole row; every field must be consumed.
  Error DecodeRow(const std::vector<Value>& row, T* out) const {
    size_t pos = 0;
    Error err = Decode(row, &pos, out);
    if (!err.ok()) { return err; }
    if (pos != row.size()) {
      Error e;
      e.SetFormat(ErrorCode::kCoding, "row has %zu fields, %s uses %zu",
                  row.size(), Describe().c_str(), pos);
      e.field = static_cast<int32_t>(pos);
      return e;
    }
    return Error::Ok();
  }

 private:
  TypeNodePtr node_;
  Encoder encode_;
  Decoder decode_;
};

namespace detail {

template <typename X>
struct NoDeduce {
  using type = X;
};

}  // namespace detail

/// X, but excluded from template argument deduction.
template <typename X>
using NonDeduced = typename detail::NoDeduce<X>::type;

// ---------------------------------------------------------------------------
// Field types
// ---------------------------------------------------------------------------

namespace detail {

inline Error TakeField(const std::vector<Value>& fields, size_t* pos,
                       FieldKind kind, const Value** out) {
  int32_t at = static_cast<int32_t>(*pos);
  if (*pos >= fields.size()) {
    return Error::Coding(at, "missing field");
  }
  const Value& v = fields[*pos];
  if (v.is_null) {
    Error e = Error::Coding(at, nullptr);
    e.SetFormat(ErrorCode::kCoding, "unexpected NULL for %s field %d",
                FieldKindName(kind), at);
    return e;
  }
  bool compatible = v.kind == kind ||
                    (IsIntegerKind(v.kind) && IsIntegerKind(kind));
  if (!compatible) {
    Error e = Error::Coding(at, nullptr);
    e.SetFormat(ErrorCode::kCoding, "field %d is %s, expected %s", at,
                FieldKindName(v.kind), FieldKindName(kind));
    return e;
  }
  ++*pos;
  *out = &v;
  return Error::Ok();
}

template <typename T>
Type<T> Leaf(FieldKind kind, std::function<Value(const T&)> to_value,
             std::function<Error(const Value&, T*)> from_value) {
  return Type<T>(
      MakeFieldNode(kind),
      [to_value](const T& x, std::vector<Value>* out) {
        out->push_back(to_value(x));
        return Error::Ok();
      },
      [kind, from_value](const std::vector<Value>& fields, size_t* pos,
                         T* out) {
        int32_t at = static_cast<int32_t>(*pos);
        const Value* v = nullptr;
        Error err = TakeField(fields, pos, kind, &v);
        if (!err.ok()) { return err; }
        err = from_value(*v, out);
        if (!err.ok() && err.field < 0) { err.field = at; }
        return err;
      });
}

template <typename I>
Type<I> IntLeaf(FieldKind kind) {
  return Leaf<I>(
      kind,
      [kind](const I& x) { return Value::OfInt(kind, static_cast<int64_t>(x)); },
      [kind](const Value& v, I* out) {
        if (v.i < static_cast<int64_t>(std::numeric_limits<I>::min()) ||
            v.i > static_cast<int64_t>(std::numeric_limits<I>::max())) {
          Error e;
          e.SetFormat(ErrorCode::kCoding, "%lld out of range for %s",
                      static_cast<long long>(v.i), FieldKindName(kind));
          return e;
        }
        *out = static_cast<I>(v.i);
        return Error::Ok();
      });
}

}  // namespace detail

inline Type<bool> Bool() {
  return detail::Leaf<bool>(
      FieldKind::kBool, [](const bool& x) { return Value::OfBool(x); },
      [](const Value& v, bool* out) {
        *out = v.b;
        return Error::Ok();
      });
}

inline Type<int64_t> Int() { return detail::IntLeaf<int64_t>(FieldKind::kInt); }
inline Type<int16_t> Int16() { return detail::IntLeaf<int16_t>(FieldKind::kInt16); }
inline Type<int32_t> Int32() { return detail::IntLeaf<int32_t>(FieldKind::kInt32); }
inline Type<int64_t> Int64() { return detail::IntLeaf<int64_t>(FieldKind::kInt64); }

inline Type<double> Float() {
  return detail::Leaf<double>(
      FieldKind::kFloat, [](const double& x) { return Value::OfFloat(x); },
      [](const Value& v, double* out) {
        *out = v.f;
        return Error::Ok();
      });
}

inline Type<std::string> String() {
  return detail::Leaf<std::string>(
      FieldKind::kString,
      [](const std::string& x) { return Value::OfString(x); },
      [](const Value& v, std::string* out) {
        *out = v.s;
        return Error::Ok();
      });
}

/// Binary data held in a std::string.
inline Type<std::string> Octets() {
  return detail::Leaf<std::string>(
      FieldKind::kOctets,
      [](const std::string& x) { return Value::OfOctets(x); },
      [](const Value& v, std::string* out) {
        *out = v.s;
        return Error::Ok();
      });
}

inline Type<Date> PDate() {
  return detail::Leaf<Date>(
      FieldKind::kDate, [](const Date& x) { return Value::OfDate(x); },
      [](const Value& v, Date* out) {
        out->days = static_cast<int32_t>(v.i);
        return Error::Ok();
      });
}

inline Type<Timestamp> PTime() {
  return detail::Leaf<Timestamp>(
      FieldKind::kTime, [](const Timestamp& x) { return Value::OfTime(x); },
      [](const Value& v, Timestamp* out) {
        out->micros = v.i;
        return Error::Ok();
      });
}

inline Type<Span> PSpan() {
  return detail::Leaf<Span>(
      FieldKind::kSpan, [](const Span& x) { return Value::OfSpan(x); },
      [](const Value& v, Span* out) {
        out->micros = v.i;
        return Error::Ok();
      });
}

// ---------------------------------------------------------------------------
// Unit and products
// ---------------------------------------------------------------------------

struct Unit {};

inline bool operator==(Unit, Unit) { return true; }

/// The arity-0 product.
inline Type<Unit> UnitType() {
  return Type<Unit>(
      MakeProductNode({}),
      [](const Unit&, std::vector<Value>*) { return Error::Ok(); },
      [](const std::vector<Value>&, size_t*, Unit*) { return Error::Ok(); });
}

namespace detail {

template <typename... Ts, size_t... I>
Error EncodeTuple(const std::tuple<Type<Ts>...>& types,
                  const std::tuple<Ts...>& value, std::vector<Value>* out,
                  std::index_sequence<I...>) {
  Error err;
  ((err.ok() ? (void)(err = std::get<I>(types).Encode(std::get<I>(value), out))
             : (void)0),
   ...);
  return err;
}

template <typename... Ts, size_t... I>
Error DecodeTuple(const std::tuple<Type<Ts>...>& types,
                  const std::vector<Value>& fields, size_t* pos,
                  std::tuple<Ts...>* out, std::index_sequence<I...>) {
  Error err;
  ((err.ok() ? (void)(err = std::get<I>(types).Decode(fields, pos,
                                                      &std::get<I>(*out)))
             : (void)0),
   ...);
  return err;
}

}  // namespace detail

/// Positional product of two or more types.
template <typename T1, typename T2, typename... Ts>
Type<std::tuple<T1, T2, Ts...>> Tup(const Type<T1>& t1, const Type<T2>& t2,
                                    const Type<Ts>&... ts) {
  using Tuple = std::tuple<T1, T2, Ts...>;
  auto types = std::make_tuple(t1, t2, ts...);
  auto seq = std::index_sequence_for<T1, T2, Ts...>{};
  return Type<Tuple>(
      MakeProductNode({t1.Node(), t2.Node(), ts.Node()...}),
      [types, seq](const Tuple& value, std::vector<Value>* out) {
        return detail::EncodeTuple(types, value, out, seq);
      },
      [types, seq](const std::vector<Value>& fields, size_t* pos,
                   Tuple* out) {
        return detail::DecodeTuple(types, fields, pos, out, seq);
      });
}

// ---------------------------------------------------------------------------
// Option
// ---------------------------------------------------------------------------

/// Nullable wrapper. Empty encodes as one typed NULL per inner field;
/// decoding yields empty iff every inner field is NULL.
template <typename T>
Type<std::optional<T>> Option(const Type<T>& inner) {
  std::vector<FieldKind> kinds = inner.FieldKinds();
  return Type<std::optional<T>>(
      MakeOptionNode(inner.Node()),
      [inner, kinds](const std::optional<T>& value, std::vector<Value>* out) {
        if (value.has_value()) { return inner.Encode(*value, out); }
        for (FieldKind k : kinds) { out->push_back(Value::Null(k)); }
        return Error::Ok();
      },
      [inner, kinds](const std::vector<Value>& fields, size_t* pos,
                     std::optional<T>* out) {
        size_t n = kinds.size();
        if (*pos + n > fields.size()) {
          return Error::Coding(static_cast<int32_t>(*pos), "missing field");
        }
        bool all_null = n > 0;
        for (size_t i = *pos; i < *pos + n; ++i) {
          if (!fields[i].is_null) {
            all_null = false;
            break;
          }
        }
        if (all_null) {
          out->reset();
          *pos += n;
          return Error::Ok();
        }
        T x{};
        Error err = inner.Decode(fields, pos, &x);
        if (!err.ok()) { return err; }
        *out = std::move(x);
        return Error::Ok();
      });
}

// ---------------------------------------------------------------------------
// Custom
// ---------------------------------------------------------------------------

/// A named type represented on the wire by rep. Failures of encode/decode
/// are reported as kCoding with the position of the first field of rep.
/// T is given explicitly: Custom<Email>("email", String(), enc, dec).
template <typename T, typename R>
Type<T> Custom(std::string name, const Type<R>& rep,
               NonDeduced<std::function<Error(const T&, R*)>> encode,
               NonDeduced<std::function<Error(const R&, T*)>> decode,
               bool redact = false) {
  TypeNodePtr node = MakeCustomNode(name, rep.Node(), redact);
  return Type<T>(
      node,
      [name, rep, encode](const T& value, std::vector<Value>* out) {
        int32_t at = static_cast<int32_t>(out->size());
        R r{};
        Error err = encode(value, &r);
        if (!err.ok()) {
          err.code = ErrorCode::kCoding;
          if (err.field < 0) { err.field = at; }
          err.AddContext("encoding %s", name.c_str());
          return err;
        }
        return rep.Encode(r, out);
      },
      [name, rep, decode](const std::vector<Value>& fields, size_t* pos,
                          T* out) {
        int32_t at = static_cast<int32_t>(*pos);
        R r{};
        Error err = rep.Decode(fields, pos, &r);
        if (!err.ok()) { return err; }
        err = decode(r, out);
        if (!err.ok()) {
          err.code = ErrorCode::kCoding;
          if (err.field < 0) { err.field = at; }
          err.AddContext("decoding %s", name.c_str());
        }
        return err;
      });
}

/// Same wire format as t, but values never appear in request dumps.
template <typename T>
Type<T> Redact(const Type<T>& t) {
  return Type<T>(
      MakeCustomNode("", t.Node(), true),
      [t](const T& value, std::vector<Value>* out) {
        return t.Encode(value, out);
      },
      [t](const std::vector<Value>& fields, size_t* pos, T* out) {
        return t.Decode(fields, pos, out);
      });
}

/// An enumeration stored as its string name.
template <typename T>
Type<T> Enum(std::string name, std::function<std::string(const T&)> to_name,
             std::function<std::optional<T>(const std::string&)> from_name) {
  return Custom<T, std::string>(
      name, String(),
      [to_name](const T& value, std::string* out) {
        *out = to_name(value);
        return Error::Ok();
      },
      [from_name](const std::string& s, T* out) {
        std::optional<T> v = from_name(s);
        if (!v.has_value()) {
          Error e;
          e.SetFormat(ErrorCode::kCoding, "invalid value \"%s\"", s.c_str());
          return e;
        }
        *out = *v;
        return Error::Ok();
      });
}

}  // namespace sqlreq
