// Copyright (c) 2024 liudegui. MIT License.
//
// Human-readable dumps of requests, for logs and error reports.
//
// Parameter values are included only when the debug flag is on
// (SQLREQ_DEBUG_PARAM, or the explicit argument). Without it the dump is
// the same as Describe(), whatever the parameter types say.

#pragma once

#include <string>
#include <vector>

#include "sqlreq/config.hpp"
#include "sqlreq/driver_info.hpp"
#include "sqlreq/mult.hpp"
#include "sqlreq/request.hpp"
#include "sqlreq/type.hpp"

namespace sqlreq {

/// "(param -> row)<sigil> <query>", e.g. "(int -> string)! SELECT ...".
/// Requests built by Create() show their query for di when given.
template <typename P, typename R, Mult M>
std::string Describe(const Request<P, R, M>& req,
                     const DriverInfo* di = nullptr) {
  if (!req.Valid()) { return "<invalid request>"; }
  std::string s = "(" + req.ParamType().Describe() + " -> " +
                  req.RowType().Describe() + ")" + MultSigil(M) + " ";
  if (!req.Source().empty()) { return s + req.Source(); }
  if (di != nullptr) {
    Query q;
    Error err = req.BuildQuery(*di, &q);
    if (err.ok()) { return s + ToString(q); }
    return s + "<" + err.message + ">";
  }
  return s + "<generated>";
}

template <typename P, typename R, Mult M>
std::string DescribeWithParams(const Request<P, R, M>& req,
                               const NonDeduced<P>& param,
                               bool debug_param,
                               const DriverInfo* di = nullptr) {
  std::string s = Describe(req, di);
  if (!debug_param || !req.Valid()) { return s; }
  std::vector<Value> fields;
  Error err = req.ParamType().Encode(param, &fields);
  if (!err.ok()) { return s + " with <unencodable: " + err.message + ">"; }
  return s + " with " +
         FormatFields(*req.ParamType().Node(), fields, true);
}

/// Uses the process debug flag.
template <typename P, typename R, Mult M>
std::string DescribeWithParams(const Request<P, R, M>& req,
                               const NonDeduced<P>& param) {
  return DescribeWithParams(req, param, GlobalConfig().debug_param);
}

/// Parameter values with redacted fields masked, for trace logging.
template <typename P>
std::string FormatParams(const Type<P>& type, const std::vector<Value>& fields) {
  if (!type.Valid()) { return "?"; }
  return FormatFields(*type.Node(), fields, false);
}

}  // namespace sqlreq
