// Copyright (c) 2024 liudegui. MIT License.
// Tests for sqlreq::Request construction and accessors.

#include <catch2/catch.hpp>
#include <cstring>
#include <string>
#include <tuple>

#include "sqlreq/render.hpp"
#include "sqlreq/request.hpp"

using namespace sqlreq;

TEST_CASE("Request: shortcuts fix the multiplicity", "[request]") {
  auto e = Exec(Int(), "DELETE FROM t WHERE id = ?");
  auto f = Find(Int(), String(), "SELECT name FROM t WHERE id = ?");
  auto o = FindOpt(Int(), String(), "SELECT name FROM t WHERE id = ?");
  auto c = Collect(UnitType(), Int(), "SELECT id FROM t");
  REQUIRE(e.RowMult() == Mult::kZero);
  REQUIRE(f.RowMult() == Mult::kOne);
  REQUIRE(o.RowMult() == Mult::kZeroOrOne);
  REQUIRE(c.RowMult() == Mult::kMany);
  REQUIRE(decltype(f)::kMult == Mult::kOne);
}

TEST_CASE("Request: accessors project their inputs", "[request]") {
  const std::string raw = "SELECT name, age FROM t WHERE id = ?";
  auto req = Find(Int(), Tup(String(), Int32()), raw);
  REQUIRE(req.Valid());
  REQUIRE_FALSE(req.IsOneshot());
  REQUIRE(req.QueryId().has_value());
  REQUIRE(req.Source() == raw);
  REQUIRE(req.ParamType().Describe() == "int");
  REQUIRE(req.RowType().Describe() == "(string, int32)");
  REQUIRE(req.RowType().Length() == 2);
}

TEST_CASE("Request: copies share identity", "[request]") {
  auto a = Collect(UnitType(), Int(), "SELECT 1");
  auto b = a;
  REQUIRE(a.QueryId() == b.QueryId());
}

TEST_CASE("Request: too many template parameters", "[request]") {
  Error err;
  auto req = Exec(Tup(Int(), Int()), "UPDATE t SET a = $1, b = $2 WHERE c = $3",
                  RequestOptions(), &err);
  REQUIRE_FALSE(req.Valid());
  REQUIRE(err.code == ErrorCode::kArity);
  REQUIRE(std::strstr(err.message, "3 parameters") != nullptr);
  REQUIRE(std::strstr(err.message, "has 2") != nullptr);
}

TEST_CASE("Request: too few template parameters", "[request]") {
  Error err;
  auto req = Find(Tup(Int(), String()), Int(), "SELECT 1 WHERE ? = 1",
                  RequestOptions(), &err);
  REQUIRE_FALSE(req.Valid());
  REQUIRE(err.code == ErrorCode::kArity);
}

TEST_CASE("Request: syntax errors surface at construction", "[request]") {
  Error err;
  auto req = Collect(Int(), Int(), "SELECT x FROM t WHERE 'y = ?", RequestOptions(),
                     &err);
  REQUIRE_FALSE(req.Valid());
  REQUIRE(err.code == ErrorCode::kParse);
}

TEST_CASE("Request: backslash-quoted templates build where they scan",
          "[request]") {
  Error err;
  auto req = Find(Int(), String(), "SELECT 'it\\'s' FROM t WHERE id = ?",
                  RequestOptions(), &err);
  REQUIRE(req.Valid());
  Query q;
  REQUIRE(req.BuildQuery(MariaDriverInfo(), &q).ok());
  RenderedQuery r;
  REQUIRE(RenderQuery(q, MariaDriverInfo(), &r).ok());
  REQUIRE(r.sql == "SELECT 'it\\'s' FROM t WHERE id = ?");
  REQUIRE(req.BuildQuery(Sqlite3DriverInfo(), &q).code == ErrorCode::kParse);
}

TEST_CASE("Request: invalid request accessors", "[request]") {
  Request<int64_t, std::string, Mult::kOne> req;
  REQUIRE_FALSE(req.Valid());
  REQUIRE(req.IsOneshot());
  REQUIRE_FALSE(req.QueryId().has_value());
  REQUIRE(req.Source().empty());
  REQUIRE_FALSE(req.ParamType().Valid());
  Query q;
  REQUIRE(req.BuildQuery(Sqlite3DriverInfo(), &q).code == ErrorCode::kMisuse);
}

TEST_CASE("Request: query is built per driver", "[request]") {
  RequestOptions opts;
  opts.env = EnvFromMap({{"schema", "public"}});
  auto req = Find(Int(), String(),
                  "SELECT name FROM $(schema.)users WHERE id = ?", opts);
  Query q;
  REQUIRE(req.BuildQuery(Sqlite3DriverInfo(), &q).ok());
  REQUIRE(ToString(q) == "SELECT name FROM public.users WHERE id = $1");

  RenderedQuery r;
  REQUIRE(RenderQuery(q, Sqlite3DriverInfo(), &r).ok());
  REQUIRE(r.sql == "SELECT name FROM public.users WHERE id = ?");
  REQUIRE(r.binding.size() == 1);
}

TEST_CASE("Request: missing static reference fails when built", "[request]") {
  auto req = Find(Int(), String(),
                  "SELECT name FROM $(schema.)users WHERE id = ?");
  REQUIRE(req.Valid());
  Query q;
  Error err = req.BuildQuery(Sqlite3DriverInfo(), &q);
  REQUIRE(err.code == ErrorCode::kLookup);
}

TEST_CASE("Request: generator requests", "[request]") {
  auto req = Create<Mult::kMany>(
      Tup(Int(), Int()), Int(),
      [](const DriverInfo& di, Query* out) {
        std::string table = di.dialect == Dialect::kSqlite ? "t_lite" : "t";
        *out = Query::S({Query::L("SELECT x FROM " + table + " WHERE a = "),
                         Query::P(0), Query::L(" AND b = "), Query::P(1)});
        return Error::Ok();
      });
  REQUIRE(req.Source().empty());
  Query q;
  REQUIRE(req.BuildQuery(Sqlite3DriverInfo(), &q).ok());
  REQUIRE(ToString(q) == "SELECT x FROM t_lite WHERE a = $1 AND b = $2");
}

TEST_CASE("Request: generator arity is checked when built", "[request]") {
  auto req = Create<Mult::kZero>(
      Int(), UnitType(), [](const DriverInfo&, Query* out) {
        *out = Query::L("DELETE FROM t");
        return Error::Ok();
      });
  REQUIRE(req.Valid());
  Query q;
  REQUIRE(req.BuildQuery(Sqlite3DriverInfo(), &q).code == ErrorCode::kArity);
}
