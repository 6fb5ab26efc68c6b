#include <gtest/gtest.h>
#include <xschema/xschema.h>

using namespace xschema;
using namespace xschema::ast;

namespace {

const char* const kSchemaURI = "https://json-schema.org/draft/2020-12/schema";

/*! \brief Generate from value and compare with the expected JSON text, keys in sorted order. */
void ExpectSchema(
    const Value& value, const std::string& expected, const GenerateConfig& config = GenerateConfig()
) {
  picojson::value want;
  std::string err = picojson::parse(want, expected);
  ASSERT_TRUE(err.empty()) << err;
  want.get<picojson::object>()["$schema"] = picojson::value(std::string(kSchemaURI));
  picojson::value got = SchemaToJSON(Generate(value, config));
  EXPECT_EQ(got.serialize(), want.serialize());
}

DeclPtr Regular(const std::string& name, ExprPtr value) {
  return NewField(Label::Ident(name), std::move(value));
}

DeclPtr Optional(const std::string& name, ExprPtr value) {
  return NewField(Label::Ident(name), std::move(value), Token::kOption);
}

Value FileValue(std::vector<DeclPtr> decls) {
  auto file = std::make_shared<File>();
  file->decls = std::move(decls);
  return Value::FromFile(file);
}

}  // namespace

TEST(GenerateTest, ClosedStruct) {
  auto value = Value::FromExpr(NewCall(
      NewIdent("close"),
      {NewStruct({Regular("a", NewIdent("string")), Optional("b", NewIdent("number"))})}
  ));
  ExpectSchema(
      value,
      R"({"type":"object","properties":{"a":{"type":"string"},"b":{"type":"number"}},)"
      R"("required":["a"],"additionalProperties":false})"
  );
}

TEST(GenerateTest, Top) {
  ExpectSchema(Value::FromExpr(NewTop()), "{}");
  ExpectSchema(Value::FromExpr(NewStruct()), R"({"type":"object"})");
}

TEST(GenerateTest, Numbers) {
  auto value = Value::FromExpr(NewStruct({
      Regular("x", NewIdent("uint8")),
      Regular(
          "y",
          NewBinary(Token::kAnd, NewUnary(Token::kGeq, NewInt(1)), NewUnary(Token::kLeq, NewInt(10)))
      ),
      Regular("z", NewBinary(Token::kAnd, NewIdent("int"), NewUnary(Token::kGeq, NewInt(0)))),
  }));
  ExpectSchema(
      value,
      R"({"type":"object","properties":{)"
      R"("x":{"type":"integer","minimum":0,"maximum":255},)"
      R"("y":{"type":"number","minimum":1,"maximum":10},)"
      R"("z":{"allOf":[{"type":"number"},{"type":"integer","minimum":0}]}},)"
      R"("required":["x","y","z"]})"
  );
}

TEST(GenerateTest, LargeIntegerBounds) {
  // Above 2^53, where a double cannot hold every integer.
  auto value = Value::FromExpr(NewStruct({
      Regular("big", NewUnary(Token::kLeq, NewLit(Token::kInt, "9007199254740993"))),
      Regular("i64", NewIdent("int64")),
  }));
  ExpectSchema(
      value,
      R"({"type":"object","properties":{)"
      R"("big":{"type":"number","maximum":9007199254740993},)"
      R"("i64":{"type":"integer","minimum":-9223372036854775808,"maximum":9223372036854775807}},)"
      R"("required":["big","i64"]})"
  );
}

TEST(GenerateTest, Strings) {
  auto value = Value::FromExpr(NewStruct({
      Regular("d", NewPkgCall("time", "Format", {NewString("2006-01-02")})),
      Regular(
          "s",
          NewBinary(
              Token::kAnd,
              NewPkgCall("strings", "MinRunes", {NewInt(2)}),
              NewPkgCall("strings", "MaxRunes", {NewInt(5)})
          )
      ),
      Regular("r", NewUnary(Token::kMat, NewString("^a"))),
      Regular("t", NewPkgSel("time", "Time")),
  }));
  ExpectSchema(
      value,
      R"({"type":"object","properties":{)"
      R"("d":{"type":"string","format":"date"},)"
      R"("r":{"type":"string","pattern":"^a"},)"
      R"("s":{"type":"string","minLength":2,"maxLength":5},)"
      R"("t":{"type":"string","format":"date-time"}},)"
      R"("required":["d","s","r","t"]})"
  );
}

TEST(GenerateTest, Lists) {
  auto value = Value::FromExpr(NewStruct({
      Regular("any", NewList({NewEllipsis()})),
      Regular("contains", NewPkgCall("list", "MatchN", {NewUnary(Token::kGeq, NewInt(1)), NewIdent("int")})),
      Regular("pair", NewList({NewIdent("int"), NewIdent("string")})),
      Regular("tags", NewList({NewEllipsis(NewIdent("string"))})),
  }));
  ExpectSchema(
      value,
      R"({"type":"object","properties":{)"
      R"("any":{"type":"array"},)"
      R"("contains":{"type":"array","contains":{"type":"integer"}},)"
      R"("pair":{"type":"array","prefixItems":[{"type":"integer"},{"type":"string"}],)"
      R"("items":false,"minItems":2,"maxItems":2},)"
      R"("tags":{"type":"array","items":{"type":"string"}}},)"
      R"("required":["any","contains","pair","tags"]})"
  );
}

TEST(GenerateTest, Disjunctions) {
  auto value = Value::FromExpr(NewStruct({
      Regular("e", NewBinary(Token::kOr, NewString("a"), NewString("b"))),
      Regular("n", NewUnary(Token::kNeq, NewString("x"))),
      Regular(
          "o",
          NewCall(NewIdent("matchN"), {NewInt(1), NewList({NewIdent("int"), NewIdent("string")})})
      ),
  }));
  ExpectSchema(
      value,
      R"({"type":"object","properties":{)"
      R"("e":{"enum":["a","b"]},)"
      R"("n":{"not":{"const":"x"}},)"
      R"("o":{"oneOf":[{"type":"integer"},{"type":"string"}]}},)"
      R"("required":["e","n","o"]})"
  );
}

TEST(GenerateTest, ConcreteFields) {
  auto value = Value::FromExpr(NewStruct({
      Regular("c", NewString("fixed")),
      Regular("k", NewInt(3)),
  }));
  ExpectSchema(
      value, R"({"type":"object","properties":{"c":{"const":"fixed"},"k":{"const":3}}})"
  );
}

TEST(GenerateTest, PatternConstraints) {
  auto value = Value::FromExpr(NewStruct({
      NewField(Label::Pattern(NewUnary(Token::kMat, NewString("^x-"))), NewIdent("string")),
      NewEllipsisDecl(),
  }));
  ExpectSchema(value, R"({"type":"object","patternProperties":{"^x-":{"type":"string"}}})");
}

TEST(GenerateTest, PatternImpliedFieldConstraints) {
  auto make = [](const std::string& re) {
    return Value::FromExpr(NewStruct({
        NewField(Label::Pattern(NewUnary(Token::kMat, NewString(re))), NewIdent("string")),
        NewField(Label::String("x-a"), NewIdent("string"), Token::kOption),
    }));
  };
  ExpectSchema(
      make("^x-"),
      R"({"type":"object","patternProperties":{"^x-":{"type":"string"}},"properties":{"x-a":true}})"
  );
  // Field names are matched with ECMAScript syntax, which has no inline flags.
  ExpectSchema(
      make("(?i)^X-"),
      R"({"type":"object","patternProperties":{"(?i)^X-":{"type":"string"}},)"
      R"("properties":{"x-a":{"type":"string"}}})"
  );
}

TEST(GenerateTest, Definitions) {
  auto value = FileValue({
      Regular("#A", NewStruct({Regular("a", NewIdent("int"))})),
      Regular("x", NewIdent("#A")),
      Optional("y", NewIdent("#A")),
  });
  ExpectSchema(
      value,
      R"({"$defs":{"#A":{"type":"object","properties":{"a":{"type":"integer"}},)"
      R"("required":["a"],"additionalProperties":false}},)"
      R"("type":"object","properties":{"x":{"$ref":"#/$defs/#A"},"y":{"$ref":"#/$defs/#A"}},)"
      R"("required":["x"]})"
  );
}

TEST(GenerateTest, NameFunc) {
  auto value = FileValue({
      Regular("#A", NewIdent("string")),
      Regular("x", NewIdent("#A")),
  });
  GenerateConfig config;
  config.name_func = [](const Value& root, const Path& path) {
    return PathString(path).substr(1);
  };
  ExpectSchema(
      value,
      R"({"$defs":{"A":{"type":"string"}},)"
      R"("type":"object","properties":{"x":{"$ref":"#/$defs/A"}},"required":["x"]})",
      config
  );
}

TEST(GenerateTest, RecursiveDefinition) {
  auto value = FileValue({
      Regular("#List", NewStruct({Regular("value", NewIdent("int")), Optional("next", NewIdent("#List"))})),
      Regular("l", NewIdent("#List")),
  });
  ExpectSchema(
      value,
      R"({"$defs":{"#List":{"type":"object","properties":{)"
      R"("next":{"$ref":"#/$defs/#List"},"value":{"type":"integer"}},)"
      R"("required":["value"],"additionalProperties":false}},)"
      R"("type":"object","properties":{"l":{"$ref":"#/$defs/#List"}},"required":["l"]})"
  );
}

TEST(GenerateTest, ExplicitOpen) {
  auto value = FileValue({
      Regular("#Closed", NewStruct({Optional("a", NewIdent("int"))})),
      Regular("#Open", NewStruct({Optional("a", NewIdent("int")), NewEllipsisDecl()})),
      Optional("c", NewIdent("#Closed")),
      Optional("o", NewIdent("#Open")),
  });
  ExpectSchema(
      value,
      R"({"$defs":{)"
      R"("#Closed":{"type":"object","properties":{"a":{"type":"integer"}},"additionalProperties":false},)"
      R"("#Open":{"type":"object","properties":{"a":{"type":"integer"}}}},)"
      R"("type":"object","properties":{"c":{"$ref":"#/$defs/#Closed"},"o":{"$ref":"#/$defs/#Open"}}})"
  );

  GenerateConfig config;
  config.explicit_open = true;
  ExpectSchema(
      value,
      R"({"$defs":{)"
      R"("#Closed":{"type":"object","properties":{"a":{"type":"integer"}}},)"
      R"("#Open":{"type":"object","properties":{"a":{"type":"integer"}},"additionalProperties":true}},)"
      R"("type":"object","properties":{"c":{"$ref":"#/$defs/#Closed"},"o":{"$ref":"#/$defs/#Open"}}})",
      config
  );
}

TEST(GenerateTest, Deterministic) {
  auto make = [] {
    return FileValue({
        Regular("#B", NewStruct({Regular("z", NewIdent("bool")), Regular("a", NewIdent("string"))})),
        Regular("#A", NewList({NewEllipsis(NewIdent("#B"))})),
        Regular("x", NewIdent("#A")),
        Regular("y", NewIdent("#B")),
    });
  };
  std::string first = FormatJSON(Generate(make()), 2);
  std::string second = FormatJSON(Generate(make()), 2);
  EXPECT_EQ(first, second);
  EXPECT_EQ(first.find("\"$schema\""), first.find('"'));
}

TEST(GenerateTest, UnresolvedReference) {
  auto value = FileValue({Regular("x", NewIdent("#Missing"))});
  try {
    Generate(value);
    FAIL() << "Expected a SchemaError";
  } catch (const SchemaError& e) {
    ASSERT_EQ(e.Diagnostics().size(), 1u);
    EXPECT_EQ(e.Diagnostics()[0].location, "x");
    EXPECT_EQ(e.Diagnostics()[0].message, "reference \"#Missing\" not found");
  }
}

TEST(GenerateTest, InexpressibleCount) {
  auto value = Value::FromExpr(NewStruct({Regular(
      "x",
      NewCall(
          NewIdent("matchN"),
          {NewInt(2), NewList({NewIdent("int"), NewIdent("string"), NewIdent("bool")})}
      )
  )}));
  try {
    Generate(value);
    FAIL() << "Expected a SchemaError";
  } catch (const SchemaError& e) {
    ASSERT_EQ(e.Diagnostics().size(), 1u);
    EXPECT_EQ(e.Diagnostics()[0].location, "x");
    EXPECT_EQ(e.Diagnostics()[0].message, "cannot express matchN with count 2 over 3 schemas");
  }
}

TEST(GenerateTest, UnsatisfiableSchema) {
  try {
    Generate(Value::FromExpr(NewBottom("nope")));
    FAIL() << "Expected a SchemaError";
  } catch (const SchemaError& e) {
    ASSERT_EQ(e.Diagnostics().size(), 1u);
    EXPECT_EQ(e.Diagnostics()[0].message, "schema cannot be satisfied");
  }
}

TEST(GenerateTest, UnsupportedVersion) {
  GenerateConfig config;
  config.version = Version::kDraft7;
  EXPECT_THROW(Generate(Value::FromExpr(NewIdent("string")), config), InvalidConfigError);
}
