// Copyright (c) 2024 liudegui. MIT License.
// Tests for sqlreq::DynParam.

#include <catch2/catch.hpp>
#include <string>
#include <vector>

#include "sqlreq/dyn_param.hpp"

using namespace sqlreq;

TEST_CASE("DynParam: empty list", "[dyn_param]") {
  DynParam p;
  REQUIRE(p.Length() == 0);
  std::vector<Value> out;
  REQUIRE(p.Encode(&out).ok());
  REQUIRE(out.empty());
  REQUIRE(p.ParamType().Describe() == "unit");
}

TEST_CASE("DynParam: values keep insertion order", "[dyn_param]") {
  DynParam p = DynParam()
                   .Add(String(), std::string("widget"))
                   .Add(Float(), 2.5)
                   .Add(Option(Int()), std::optional<int64_t>());
  REQUIRE(p.Length() == 3);

  std::vector<Value> out;
  REQUIRE(p.Encode(&out).ok());
  REQUIRE(out.size() == 3);
  REQUIRE(out[0].s == "widget");
  REQUIRE(out[1].f == 2.5);
  REQUIRE(out[2].is_null);
  REQUIRE(out[2].kind == FieldKind::kInt);
}

TEST_CASE("DynParam: append builds a product", "[dyn_param]") {
  DynParam a = DynParam::Of(Int(), int64_t{1});
  DynParam b = DynParam::Of(Tup(String(), Bool()),
                            std::make_tuple(std::string("x"), true));
  DynParam ab = DynParam::Append(a, b);
  REQUIRE(ab.Length() == 3);
  REQUIRE(ab.ParamType().Describe() == "(int, (string, bool))");
}

TEST_CASE("DynParam: descriptor checks the shape", "[dyn_param]") {
  DynParam two = DynParam().Add(Int(), int64_t{1}).Add(Int(), int64_t{2});
  Type<DynParam> type = two.ParamType();
  REQUIRE(type.Length() == 2);

  std::vector<Value> out;
  REQUIRE(type.Encode(two, &out).ok());
  REQUIRE(out.size() == 2);

  out.clear();
  DynParam one = DynParam().Add(Int(), int64_t{1});
  REQUIRE(type.Encode(one, &out).code == ErrorCode::kArity);
}

TEST_CASE("DynParam: cannot be decoded", "[dyn_param]") {
  DynParam p;
  Error err = p.ParamType().DecodeRow({}, &p);
  REQUIRE(err.code == ErrorCode::kCoding);
}
