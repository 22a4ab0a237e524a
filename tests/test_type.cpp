// Copyright (c) 2024 liudegui. MIT License.
// Tests for sqlreq::Type<T> and the type combinators.

#include <catch2/catch.hpp>
#include <cstring>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "sqlreq/type.hpp"

using namespace sqlreq;

namespace {

struct Email {
  std::string address;
};

Type<Email> EmailType() {
  return Custom<Email, std::string>(
      "email", String(),
      [](const Email& e, std::string* out) {
        if (e.address.find('@') == std::string::npos) {
          return Error::Make(ErrorCode::kError, "missing @");
        }
        *out = e.address;
        return Error::Ok();
      },
      [](const std::string& s, Email* out) {
        if (s.find('@') == std::string::npos) {
          return Error::Make(ErrorCode::kError, "missing @");
        }
        out->address = s;
        return Error::Ok();
      });
}

enum class Color { kRed, kGreen };

Type<Color> ColorType() {
  return Enum<Color>(
      "color",
      [](const Color& c) { return c == Color::kRed ? "red" : "green"; },
      [](const std::string& s) -> std::optional<Color> {
        if (s == "red") { return Color::kRed; }
        if (s == "green") { return Color::kGreen; }
        return std::nullopt;
      });
}

}  // namespace

TEST_CASE("Type: leaf lengths and kinds", "[type]") {
  REQUIRE(Int().Length() == 1);
  REQUIRE(String().Describe() == "string");
  REQUIRE(UnitType().Length() == 0);
  REQUIRE(UnitType().Describe() == "unit");
  REQUIRE(PSpan().FieldKinds() == std::vector<FieldKind>{FieldKind::kSpan});
  REQUIRE_FALSE(Type<int>().Valid());
}

TEST_CASE("Type: invalid type reports misuse", "[type]") {
  Type<int64_t> none;
  std::vector<Value> out;
  REQUIRE(none.Encode(1, &out).code == ErrorCode::kMisuse);
  REQUIRE(none.Describe() == "<invalid>");
}

TEST_CASE("Type: tuple encodes fields in order", "[type]") {
  auto t = Tup(Int(), String(), Bool());
  REQUIRE(t.Length() == 3);
  REQUIRE(t.Describe() == "(int, string, bool)");

  std::vector<Value> fields;
  REQUIRE(t.Encode(std::make_tuple(int64_t{5}, std::string("x"), true),
                   &fields).ok());
  REQUIRE(fields.size() == 3);
  REQUIRE(fields[0].i == 5);
  REQUIRE(fields[1].s == "x");
  REQUIRE(fields[2].b);

  std::tuple<int64_t, std::string, bool> back;
  REQUIRE(t.DecodeRow(fields, &back).ok());
  REQUIRE(std::get<0>(back) == 5);
  REQUIRE(std::get<1>(back) == "x");
}

TEST_CASE("Type: nested tuples flatten", "[type]") {
  auto t = Tup(Int(), Tup(String(), Float()));
  REQUIRE(t.Length() == 3);
  REQUIRE(t.FieldKinds() == std::vector<FieldKind>{
                                FieldKind::kInt, FieldKind::kString,
                                FieldKind::kFloat});
}

TEST_CASE("Type: option encodes typed nulls", "[type]") {
  auto t = Option(Tup(Int(), String()));
  REQUIRE(t.Length() == 2);
  REQUIRE(t.Describe() == "option((int, string))");

  std::vector<Value> fields;
  REQUIRE(t.Encode(std::nullopt, &fields).ok());
  REQUIRE(fields.size() == 2);
  REQUIRE(fields[0].is_null);
  REQUIRE(fields[0].kind == FieldKind::kInt);
  REQUIRE(fields[1].kind == FieldKind::kString);

  std::optional<std::tuple<int64_t, std::string>> out =
      std::make_tuple(int64_t{1}, std::string("a"));
  REQUIRE(t.DecodeRow(fields, &out).ok());
  REQUIRE_FALSE(out.has_value());
}

TEST_CASE("Type: option is present unless all fields are null", "[type]") {
  auto t = Option(Tup(Int(), Option(String())));
  std::vector<Value> fields = {Value::OfInt(FieldKind::kInt, 3),
                               Value::Null(FieldKind::kString)};
  std::optional<std::tuple<int64_t, std::optional<std::string>>> out;
  REQUIRE(t.DecodeRow(fields, &out).ok());
  REQUIRE(out.has_value());
  REQUIRE(std::get<0>(*out) == 3);
  REQUIRE_FALSE(std::get<1>(*out).has_value());
}

TEST_CASE("Type: NULL into non-option is a coding error", "[type]") {
  auto t = Tup(Int(), String());
  std::vector<Value> fields = {Value::OfInt(FieldKind::kInt, 1),
                               Value::Null(FieldKind::kString)};
  std::tuple<int64_t, std::string> out;
  Error err = t.DecodeRow(fields, &out);
  REQUIRE(err.code == ErrorCode::kCoding);
  REQUIRE(err.field == 1);
}

TEST_CASE("Type: kind mismatch and extra fields", "[type]") {
  std::string s;
  Error err = String().DecodeRow({Value::OfInt(FieldKind::kInt, 1)}, &s);
  REQUIRE(err.code == ErrorCode::kCoding);
  REQUIRE(err.field == 0);

  int64_t i = 0;
  err = Int().DecodeRow({Value::OfInt(FieldKind::kInt, 1),
                         Value::OfInt(FieldKind::kInt, 2)},
                        &i);
  REQUIRE(err.code == ErrorCode::kCoding);
  REQUIRE(err.field == 1);

  err = Int().DecodeRow({}, &i);
  REQUIRE(err.code == ErrorCode::kCoding);
}

TEST_CASE("Type: narrow integers are range checked", "[type]") {
  int16_t small = 0;
  Error err = Int16().DecodeRow({Value::OfInt(FieldKind::kInt, 70000)}, &small);
  REQUIRE(err.code == ErrorCode::kCoding);
  REQUIRE(err.field == 0);

  int32_t mid = 0;
  REQUIRE(Int32().DecodeRow({Value::OfInt(FieldKind::kInt64, 70000)}, &mid).ok());
  REQUIRE(mid == 70000);
}

TEST_CASE("Type: custom coder failure carries field position", "[type]") {
  auto t = Tup(Int(), EmailType());
  REQUIRE(t.Describe() == "(int, email)");

  std::vector<Value> fields;
  Error err = t.Encode(std::make_tuple(int64_t{1}, Email{"nobody"}), &fields);
  REQUIRE(err.code == ErrorCode::kCoding);
  REQUIRE(err.field == 1);
  REQUIRE(std::strstr(err.message, "encoding email") != nullptr);

  std::vector<Value> row = {Value::OfInt(FieldKind::kInt, 1),
                            Value::OfString("bad")};
  std::tuple<int64_t, Email> out;
  err = t.DecodeRow(row, &out);
  REQUIRE(err.code == ErrorCode::kCoding);
  REQUIRE(err.field == 1);
  REQUIRE(std::strstr(err.message, "decoding email") != nullptr);

  row[1] = Value::OfString("a@b");
  REQUIRE(t.DecodeRow(row, &out).ok());
  REQUIRE(std::get<1>(out).address == "a@b");
}

TEST_CASE("Type: enum stored by name", "[type]") {
  std::vector<Value> fields;
  REQUIRE(ColorType().Encode(Color::kGreen, &fields).ok());
  REQUIRE(fields[0].s == "green");

  Color c = Color::kRed;
  REQUIRE(ColorType().DecodeRow(fields, &c).ok());
  REQUIRE(c == Color::kGreen);

  Error err = ColorType().DecodeRow({Value::OfString("blue")}, &c);
  REQUIRE(err.code == ErrorCode::kCoding);
}

TEST_CASE("Type: redaction masks dumped values", "[type]") {
  auto t = Tup(String(), Redact(String()));
  REQUIRE(t.Describe() == "(string, redacted(string))");
  REQUIRE(AnyRedacted(*t.Node()));
  REQUIRE_FALSE(AnyRedacted(*Tup(Int(), String()).Node()));

  std::vector<Value> fields;
  REQUIRE(t.Encode(std::make_tuple(std::string("alice"),
                                   std::string("hunter2")),
                   &fields).ok());
  std::string masked = FormatFields(*t.Node(), fields, false);
  REQUIRE(masked == "(\"alice\", <redacted>)");
  std::string revealed = FormatFields(*t.Node(), fields, true);
  REQUIRE(revealed == "(\"alice\", \"hunter2\")");
}

TEST_CASE("Type: dump of optional fields", "[type]") {
  auto t = Tup(Option(Int()), PDate());
  std::vector<Value> fields;
  REQUIRE(t.Encode(std::make_tuple(std::optional<int64_t>(), Date{0}),
                   &fields).ok());
  REQUIRE(FormatFields(*t.Node(), fields, false) == "(None, 1970-01-01)");
}
