// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::ParseTemplate -- compile an SQL template string into a Query.
//
// Syntax:
//   ?          next parameter, in order of occurrence
//   $1, $2     parameter 0, 1, ... (may repeat; not mixable with ?)
//   $(name)    static reference, replaced by env(driver_info, "name")
//   $(name.)   env(driver_info, "name.") if defined, else $(name) followed
//              by "." iff the replacement is non-empty
//   $name.     short for $(name.)
//   $name$     copied unchanged
//   '...'      single-quoted string, copied verbatim; '' is an embedded
//              quote, and so is \' where the driver treats backslash as an
//              escape
// Any other use of $ is an error, including $$.
//
// Design:
//   - Two phases. ParseTemplate() checks syntax and parameter numbering
//     once, when a request is created. ExpandTemplate() resolves static
//     references against a driver and is pure given the same env.
//   - Where quoted strings end depends on the driver's backslash rule, so
//     ExpandTemplate() rescans the source when the driver's rule differs
//     from the one the template was parsed with.
//   - env signals an unknown name by returning ErrorCode::kNotFound; the
//     failure is re-reported with the template and driver attached.

#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "sqlreq/driver_info.hpp"
#include "sqlreq/error.hpp"
#include "sqlreq/query.hpp"

namespace sqlreq {

/// Static reference resolver: (driver, name) -> fragment.
using Env =
    std::function<Error(const DriverInfo&, const std::string&, Query*)>;

/// An environment without any definitions.
inline Env NoEnv() {
  return [](const DriverInfo&, const std::string& name, Query*) {
    Error e;
    e.SetFormat(ErrorCode::kNotFound, "no static reference named \"%s\"",
                name.c_str());
    return e;
  };
}

/// An environment mapping names to literal text, the same for all drivers.
inline Env EnvFromMap(std::map<std::string, std::string> vars) {
  return [vars](const DriverInfo&, const std::string& name, Query* out) {
    auto it = vars.find(name);
    if (it == vars.end()) {
      Error e;
      e.SetFormat(ErrorCode::kNotFound, "no static reference named \"%s\"",
                  name.c_str());
      return e;
    }
    *out = Query::L(it->second);
    return Error::Ok();
  };
}

// ---------------------------------------------------------------------------
// Template
// ---------------------------------------------------------------------------

enum class ParamSyntax : uint8_t {
  kNone = 0,      // no parameters
  kLinear = 1,    // ?
  kNumbered = 2,  // $n
};

struct Template {
  struct Piece {
    bool is_ref = false;
    Query query;       // !is_ref
    std::string name;  // is_ref
    bool dot = false;  // is_ref, from $(name.) or $name.
  };

  std::string source;
  // Quoting rule the pieces were scanned with.
  bool backslash_escapes = false;
  std::vector<Piece> pieces;
  ParamSyntax syntax = ParamSyntax::kNone;
  size_t arity = 0;

  bool HasStaticRefs() const {
    for (const Piece& p : pieces) {
      if (p.is_ref) { return true; }
    }
    return false;
  }
};

namespace detail {

inline bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

inline bool IsIdentChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

inline bool IsIdentifier(const std::string& s) {
  if (s.empty() || !IsIdentStart(s[0])) { return false; }
  for (char c : s) {
    if (!IsIdentChar(c)) { return false; }
  }
  return true;
}

class TemplateScanner {
 public:
  TemplateScanner(const std::string& raw, bool backslash_escapes,
                  Template* out)
      : raw_(raw), backslash_escapes_(backslash_escapes), out_(out) {}

  Error Run() {
    const size_t n = raw_.size();
    size_t i = 0;
    while (i < n) {
      char c = raw_[i];
      Error err;
      if (c == '\'') {
        err = ScanQuoted(&i);
      } else if (c == '?') {
        err = AddLinearParam(i);
        ++i;
      } else if (c == '$') {
        err = ScanDollar(&i);
      } else {
        literal_ += c;
        ++i;
      }
      if (!err.ok()) { return err; }
    }
    FlushLiteral();
    return Finish();
  }

 private:
  Error Fail(size_t at, const char* what) {
    Error e;
    e.SetFormat(ErrorCode::kParse, "%s at offset %zu in \"%s\"", what, at,
                raw_.c_str());
    return e;
  }

  void FlushLiteral() {
    if (literal_.empty()) { return; }
    Template::Piece p;
    p.query = Query::L(literal_);
    out_->pieces.push_back(std::move(p));
    literal_.clear();
  }

  void AddQuery(Query q) {
    FlushLiteral();
    Template::Piece p;
    p.query = std::move(q);
    out_->pieces.push_back(std::move(p));
  }

  void AddRef(std::string name, bool dot) {
    FlushLiteral();
    Template::Piece p;
    p.is_ref = true;
    p.name = std::move(name);
    p.dot = dot;
    out_->pieces.push_back(std::move(p));
  }

  // The whole quoted span, quotes included, joins the literal text as is.
  Error ScanQuoted(size_t* i) {
    const size_t start = *i;
    size_t j = start + 1;
    for (;;) {
      if (j >= raw_.size()) { return Fail(start, "unterminated quote"); }
      if (raw_[j] == '\\' && backslash_escapes_) {
        if (j + 1 >= raw_.size()) { return Fail(start, "unterminated quote"); }
        j += 2;
        continue;
      }
      if (raw_[j] == '\'') {
        if (j + 1 < raw_.size() && raw_[j + 1] == '\'') {
          j += 2;
          continue;
        }
        break;
      }
      ++j;
    }
    literal_.append(raw_, start, j + 1 - start);
    *i = j + 1;
    return Error::Ok();
  }

  Error AddLinearParam(size_t at) {
    if (out_->syntax == ParamSyntax::kNumbered) {
      return Fail(at, "mixed ? and $n parameters");
    }
    out_->syntax = ParamSyntax::kLinear;
    AddQuery(Query::P(linear_count_++));
    return Error::Ok();
  }

  Error ScanDollar(size_t* i) {
    const size_t start = *i;
    const size_t n = raw_.size();
    if (start + 1 >= n) { return Fail(start, "lone $"); }
    char next = raw_[start + 1];

    if (next == '(') {
      size_t close = raw_.find(')', start + 2);
      if (close == std::string::npos) {
        return Fail(start, "unterminated $(");
      }
      std::string name = raw_.substr(start + 2, close - start - 2);
      bool dot = !name.empty() && name.back() == '.';
      if (dot) { name.pop_back(); }
      if (!IsIdentifier(name)) {
        return Fail(start, "invalid static reference name");
      }
      AddRef(std::move(name), dot);
      *i = close + 1;
      return Error::Ok();
    }

    if (std::isdigit(static_cast<unsigned char>(next)) != 0) {
      size_t j = start + 1;
      size_t num = 0;
      while (j < n && std::isdigit(static_cast<unsigned char>(raw_[j])) != 0) {
        num = num * 10 + static_cast<size_t>(raw_[j] - '0');
        if (num > 65535) { return Fail(start, "parameter number too large"); }
        ++j;
      }
      if (num == 0) { return Fail(start, "parameters are numbered from $1"); }
      if (out_->syntax == ParamSyntax::kLinear) {
        return Fail(start, "mixed ? and $n parameters");
      }
      out_->syntax = ParamSyntax::kNumbered;
      AddQuery(Query::P(num - 1));
      *i = j;
      return Error::Ok();
    }

    if (IsIdentStart(next)) {
      size_t j = start + 1;
      while (j < n && IsIdentChar(raw_[j])) { ++j; }
      std::string name = raw_.substr(start + 1, j - start - 1);
      if (j < n && raw_[j] == '.') {
        AddRef(std::move(name), true);
        *i = j + 1;
        return Error::Ok();
      }
      if (j < n && raw_[j] == '$') {
        literal_ += raw_.substr(start, j - start + 1);
        *i = j + 1;
        return Error::Ok();
      }
      return Fail(start, "expected $(name), $name. or $name$");
    }

    if (next == '$') {
      return Fail(start, "doubled $ is not supported");
    }
    return Fail(start, "invalid use of $");
  }

  Error Finish() {
    if (out_->syntax == ParamSyntax::kLinear) {
      out_->arity = linear_count_;
      return Error::Ok();
    }
    if (out_->syntax == ParamSyntax::kNumbered) {
      std::vector<bool> seen;
      for (const Template::Piece& p : out_->pieces) {
        if (p.is_ref || p.query.kind != Query::Kind::kParam) { continue; }
        if (p.query.index >= seen.size()) {
          seen.resize(p.query.index + 1, false);
        }
        seen[p.query.index] = true;
      }
      for (size_t k = 0; k < seen.size(); ++k) {
        if (!seen[k]) {
          Error e;
          e.SetFormat(ErrorCode::kArity,
                      "parameter $%zu is never referenced in \"%s\"", k + 1,
                      raw_.c_str());
          return e;
        }
      }
      out_->arity = seen.size();
    }
    return Error::Ok();
  }

  const std::string& raw_;
  const bool backslash_escapes_;
  Template* out_;
  std::string literal_;
  size_t linear_count_ = 0;
};

}  // namespace detail

/// Check syntax and parameter numbering of raw. Quoted strings end as in
/// standard SQL unless backslash_escapes is set.
inline Error ParseTemplate(const std::string& raw, Template* out,
                           bool backslash_escapes = false) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  Template t;
  t.source = raw;
  t.backslash_escapes = backslash_escapes;
  detail::TemplateScanner scanner(raw, backslash_escapes, &t);
  Error err = scanner.Run();
  if (!err.ok()) { return err; }
  *out = std::move(t);
  return Error::Ok();
}

/// Resolve the static references of t for driver di.
inline Error ExpandTemplate(const Template& t, const Env& env,
                            const DriverInfo& di, Query* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  if (t.backslash_escapes != di.backslash_escapes) {
    Template rescanned;
    Error err = ParseTemplate(t.source, &rescanned, di.backslash_escapes);
    if (!err.ok()) {
      err.AddContext("quoting rules of driver %s", di.name.c_str());
      return err;
    }
    return ExpandTemplate(rescanned, env, di, out);
  }
  const Env none = NoEnv();
  std::vector<Query> parts;
  parts.reserve(t.pieces.size());
  for (const Template::Piece& p : t.pieces) {
    if (!p.is_ref) {
      parts.push_back(p.query);
      continue;
    }
    const Env& lookup = env ? env : none;
    Query fragment;
    Error err;
    bool add_dot = false;
    if (p.dot) {
      // A definition of "name." itself wins over "name" plus a dot.
      err = lookup(di, p.name + ".", &fragment);
      if (err.code == ErrorCode::kNotFound) {
        fragment = Query();
        err = lookup(di, p.name, &fragment);
        add_dot = true;
      }
    } else {
      err = lookup(di, p.name, &fragment);
    }
    if (!err.ok()) {
      if (err.code == ErrorCode::kNotFound) { err.code = ErrorCode::kLookup; }
      err.AddContext("static reference $(%s%s) in \"%s\" for driver %s",
                     p.name.c_str(), p.dot ? "." : "", t.source.c_str(),
                     di.name.c_str());
      return err;
    }
    if (ParamLength(fragment) > 0) {
      Error e;
      e.SetFormat(ErrorCode::kParse,
                  "static reference $(%s) in \"%s\" expands to parameters",
                  p.name.c_str(), t.source.c_str());
      return e;
    }
    bool non_empty = !IsEmpty(fragment);
    parts.push_back(std::move(fragment));
    if (add_dot && non_empty) { parts.push_back(Query::L(".")); }
  }
  *out = Normalize(Query::S(std::move(parts)));
  return Error::Ok();
}

/// Parse and expand in one step.
inline Error ParseQuery(const std::string& raw, const Env& env,
                        const DriverInfo& di, Query* out) {
  Template t;
  Error err = ParseTemplate(raw, &t, di.backslash_escapes);
  if (!err.ok()) { return err; }
  return ExpandTemplate(t, env, di, out);
}

}  // namespace sqlreq
