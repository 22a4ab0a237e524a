// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Request<P, R, M> -- a statement bound to its parameter type,
// row type and row multiplicity.
//
// Design:
//   - Immutable after construction, cheap to copy (shared state)
//   - Holds a generator DriverInfo -> Query; the generator must be pure
//     since connections remember what it produced
//   - Non-oneshot requests carry a process-unique identity, the key under
//     which each connection caches its prepared statement. Oneshot
//     requests carry none and leave nothing behind on the connection.
//   - Template errors and parameter count mismatches are reported when the
//     request is created; static references are resolved per driver.
//
// Usage:
//   static const auto kFindUser = sqlreq::Find(
//       sqlreq::Int(), sqlreq::String(),
//       "SELECT name FROM $(schema.)users WHERE id = ?", opts);

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "sqlreq/driver_info.hpp"
#include "sqlreq/error.hpp"
#include "sqlreq/identity.hpp"
#include "sqlreq/log.hpp"
#include "sqlreq/mult.hpp"
#include "sqlreq/query.hpp"
#include "sqlreq/template_parser.hpp"
#include "sqlreq/type.hpp"

namespace sqlreq {

using QueryGenerator = std::function<Error(const DriverInfo&, Query*)>;

struct RequestOptions {
  // Resolves $(name) references. Unset means no names are defined.
  Env env;
  // Do not cache a prepared statement on the connection.
  bool oneshot = false;
  // Source of identities; the process-wide allocator when null.
  IdentityAllocator* ids = nullptr;
};

namespace detail {
struct RequestAccess;
}  // namespace detail

// ---------------------------------------------------------------------------
// Request
// ---------------------------------------------------------------------------

template <typename P, typename R, Mult M>
class Request {
 public:
  using Param = P;
  using Row = R;
  static constexpr Mult kMult = M;

  /// An invalid request; every accessor that can fail reports kMisuse.
  Request() = default;

  bool Valid() const { return impl_ != nullptr; }

  const Type<P>& ParamType() const {
    static const Type<P> kInvalid;
    return impl_ ? impl_->param_type : kInvalid;
  }

  const Type<R>& RowType() const {
    static const Type<R> kInvalid;
    return impl_ ? impl_->row_type : kInvalid;
  }

  Mult RowMult() const { return M; }

  bool IsOneshot() const { return impl_ == nullptr || impl_->oneshot; }

  /// Identity within its allocator; empty for oneshot requests.
  std::optional<uint64_t> QueryId() const {
    if (impl_ == nullptr || !impl_->key) { return std::nullopt; }
    return impl_->key->id;
  }

  /// Cache key for prepared statements; empty for oneshot requests.
  std::optional<QueryKey> CacheKey() const {
    return impl_ ? impl_->key : std::nullopt;
  }

  /// Template text the request was created from, empty for Create().
  const std::string& Source() const {
    static const std::string kEmpty;
    return impl_ ? impl_->source : kEmpty;
  }

  /// Generate the query for di. Callers memoize per driver.
  Error BuildQuery(const DriverInfo& di, Query* out) const {
    if (impl_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "invalid request");
    }
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    Query q;
    Error err = impl_->generator(di, &q);
    if (!err.ok()) { return err; }
    size_t used = ParamLength(q);
    size_t expected = impl_->param_type.Length();
    if (used != expected) {
      Error e;
      e.SetFormat(ErrorCode::kArity,
                  "query for %s uses %zu parameters but %s has %zu",
                  di.name.c_str(), used,
                  impl_->param_type.Describe().c_str(), expected);
      return e;
    }
    *out = std::move(q);
    return Error::Ok();
  }

 private:
  friend struct detail::RequestAccess;

  struct Impl {
    Type<P> param_type;
    Type<R> row_type;
    QueryGenerator generator;
    bool oneshot = false;
    std::optional<QueryKey> key;
    std::string source;
  };

  explicit Request(std::shared_ptr<const Impl> impl) : impl_(std::move(impl)) {}

  std::shared_ptr<const Impl> impl_;
};

namespace detail {

struct RequestAccess {
  template <Mult M, typename P, typename R>
  static Request<P, R, M> Make(const Type<P>& param, const Type<R>& row,
                               QueryGenerator generator, std::string source,
                               const RequestOptions& opts) {
    using Impl = typename Request<P, R, M>::Impl;
    auto impl = std::make_shared<Impl>();
    impl->param_type = param;
    impl->row_type = row;
    impl->generator = std::move(generator);
    impl->oneshot = opts.oneshot;
    impl->source = std::move(source);
    if (!opts.oneshot) {
      IdentityAllocator& ids =
          opts.ids != nullptr ? *opts.ids : DefaultIdentityAllocator();
      impl->key = QueryKey{ids.Serial(), ids.Next()};
    }
    return Request<P, R, M>(std::shared_ptr<const Impl>(std::move(impl)));
  }
};

}  // namespace detail

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

/// A request whose query comes from generator. Parameter counts are
/// checked when the query is built.
template <Mult M, typename P, typename R>
Request<P, R, M> Create(const Type<P>& param, const Type<R>& row,
                        QueryGenerator generator,
                        const RequestOptions& opts = RequestOptions()) {
  return detail::RequestAccess::Make<M>(param, row, std::move(generator),
                                        std::string(), opts);
}

/// A request from template text. On a syntax error or a parameter count
/// that differs from param.Length(), returns an invalid request and
/// reports the error through out_error.
template <Mult M, typename P, typename R>
Request<P, R, M> CreateP(const Type<P>& param, const Type<R>& row,
                         const std::string& text,
                         const RequestOptions& opts = RequestOptions(),
                         Error* out_error = nullptr) {
  Template t;
  Error err = ParseTemplate(text, &t);
  if (!err.ok()) {
    // Quoted strings such as 'it\'s' only scan where backslash escapes;
    // drivers without that rule reject the template when it is expanded.
    Template escaped;
    if (ParseTemplate(text, &escaped, true).ok()) {
      t = std::move(escaped);
      err = Error::Ok();
    }
  }
  if (err.ok() && t.arity != param.Length()) {
    err.SetFormat(ErrorCode::kArity,
                  "\"%s\" has %zu parameters but %s has %zu", text.c_str(),
                  t.arity, param.Describe().c_str(), param.Length());
  }
  if (!err.ok()) {
    Logger()->debug("rejected request template: {}", err.message);
    Report(err, out_error);
    return Request<P, R, M>();
  }
  Env env = opts.env ? opts.env : NoEnv();
  QueryGenerator generator = [t, env](const DriverInfo& di, Query* out) {
    return ExpandTemplate(t, env, di, out);
  };
  return detail::RequestAccess::Make<M>(param, row, std::move(generator),
                                        text, opts);
}

/// No rows.
template <typename P>
Request<P, Unit, Mult::kZero> Exec(const Type<P>& param,
                                   const std::string& text,
                                   const RequestOptions& opts = RequestOptions(),
                                   Error* out_error = nullptr) {
  return CreateP<Mult::kZero>(param, UnitType(), text, opts, out_error);
}

/// Exactly one row.
template <typename P, typename R>
Request<P, R, Mult::kOne> Find(const Type<P>& param, const Type<R>& row,
                               const std::string& text,
                               const RequestOptions& opts = RequestOptions(),
                               Error* out_error = nullptr) {
  return CreateP<Mult::kOne>(param, row, text, opts, out_error);
}

/// Zero or one row.
template <typename P, typename R>
Request<P, R, Mult::kZeroOrOne> FindOpt(
    const Type<P>& param, const Type<R>& row, const std::string& text,
    const RequestOptions& opts = RequestOptions(),
    Error* out_error = nullptr) {
  return CreateP<Mult::kZeroOrOne>(param, row, text, opts, out_error);
}

/// Any number of rows.
template <typename P, typename R>
Request<P, R, Mult::kMany> Collect(const Type<P>& param, const Type<R>& row,
                                   const std::string& text,
                                   const RequestOptions& opts = RequestOptions(),
                                   Error* out_error = nullptr) {
  return CreateP<Mult::kMany>(param, row, text, opts, out_error);
}

}  // namespace sqlreq
