#include <gtest/gtest.h>
#include <xschema/xschema.h>

using namespace xschema;

namespace {

std::string ExtractText(const std::string& schema, const ExtractConfig& config = ExtractConfig()) {
  return ast::Format(*Extract(schema, config));
}

std::vector<SchemaDiagnostic> ExtractErrors(
    const std::string& schema, const ExtractConfig& config = ExtractConfig()
) {
  try {
    Extract(schema, config);
  } catch (const SchemaError& e) {
    return e.Diagnostics();
  }
  ADD_FAILURE() << "Expected a SchemaError for " << schema;
  return {};
}

}  // namespace

TEST(ExtractTest, EmptySchema) { EXPECT_EQ(ExtractText("{}"), "_\n"); }

TEST(ExtractTest, Types) {
  EXPECT_EQ(ExtractText(R"({"type":"string"})"), "string\n");
  EXPECT_EQ(ExtractText(R"({"type":"integer","minimum":0})"), "int & >=0\n");
  EXPECT_EQ(ExtractText(R"({"type":"boolean"})"), "bool\n");
}

TEST(ExtractTest, StringLength) {
  EXPECT_EQ(
      ExtractText(R"({"type":"string","minLength":2,"maxLength":5})"),
      "import \"strings\"\n\nstrings.MaxRunes(5) & strings.MinRunes(2)\n"
  );
}

TEST(ExtractTest, DateTimeFormat) {
  EXPECT_EQ(
      ExtractText(R"({"type":"string","format":"date-time"})"), "import \"time\"\n\ntime.Time\n"
  );
  EXPECT_EQ(
      ExtractText(
          R"({"$schema":"http://json-schema.org/draft-04/schema#","type":"string","format":"date-time"})"
      ),
      "import \"time\"\n\n@jsonschema(schema=\"http://json-schema.org/draft-04/schema#\")\n\n"
      "time.Time\n"
  );
}

TEST(ExtractTest, Properties) {
  std::string schema =
      R"({"type":"object","properties":{"a":{"type":"string"},"b":{"type":"integer"}},"required":["a"]})";
  EXPECT_EQ(ExtractText(schema), "a!: string\nb?: int\n...\n");

  ExtractConfig config;
  config.open_only_when_explicit = true;
  EXPECT_EQ(ExtractText(schema, config), "a!: string\nb?: int\n");
}

TEST(ExtractTest, ClosedObject) {
  EXPECT_EQ(
      ExtractText(
          R"({"type":"object","properties":{"a":{"type":"string"}},"required":["a"],"additionalProperties":false})"
      ),
      "close({\n\ta!: string\n})\n"
  );
}

TEST(ExtractTest, EnumAndOneOf) {
  EXPECT_EQ(ExtractText(R"({"enum":["a","b",1]})"), "\"a\" | \"b\" | 1\n");
  EXPECT_EQ(
      ExtractText(R"({"oneOf":[{"const":"a"},{"const":"b"}]})"), "matchN(1, [\"a\", \"b\"])\n"
  );
}

TEST(ExtractTest, DocComment) {
  EXPECT_EQ(
      ExtractText(R"({"title":"A thing","description":"Long text.","type":"string"})"),
      "// A thing\n//\n// Long text.\n\nstring\n"
  );
}

TEST(ExtractTest, PackageName) {
  ExtractConfig config;
  config.pkg_name = "foo";
  EXPECT_EQ(ExtractText(R"({"type":"string"})", config), "package foo\n\nstring\n");
}

TEST(ExtractTest, SchemaVersionAttribute) {
  EXPECT_EQ(
      ExtractText(R"({"$schema":"http://json-schema.org/draft-04/schema#","type":"string"})"),
      "@jsonschema(schema=\"http://json-schema.org/draft-04/schema#\")\n\nstring\n"
  );
}

TEST(ExtractTest, FormatNotInVersion) {
  std::string schema =
      R"({"$schema":"http://json-schema.org/draft-04/schema#","type":"string","format":"date"})";
  // Lenient by default.
  EXPECT_EQ(
      ExtractText(schema),
      "@jsonschema(schema=\"http://json-schema.org/draft-04/schema#\")\n\nstring\n"
  );

  ExtractConfig config;
  config.strict_keywords = true;
  auto errors = ExtractErrors(schema, config);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].location, "#/format");
  EXPECT_EQ(
      errors[0].message,
      "format \"date\" is not recognized in schema version http://json-schema.org/draft-04/schema#"
  );
}

TEST(ExtractTest, UnknownFormat) {
  std::string schema = R"({"type":"string","format":"x"})";
  EXPECT_EQ(ExtractText(schema), "string\n");

  ExtractConfig config;
  config.strict = true;
  auto errors = ExtractErrors(schema, config);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].ToString(), "#/format: unknown format \"x\"");
}

TEST(ExtractTest, UnknownKeyword) {
  EXPECT_EQ(ExtractText(R"({"foo":1})"), "_\n");
  // Extension keywords are never errors.
  ExtractConfig config;
  config.strict_keywords = true;
  EXPECT_EQ(ExtractText(R"({"x-foo":1})", config), "_\n");

  auto errors = ExtractErrors(R"({"foo":1})", config);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].location, "#/foo");
  EXPECT_EQ(errors[0].message, "unknown keyword \"foo\"");
}

TEST(ExtractTest, ErrorLocations) {
  auto errors = ExtractErrors(R"({"properties":{"a":{"type":"foo"},"b":{"minLength":"x"}}})");
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0].location, "#/properties/a/type");
  EXPECT_EQ(errors[0].message, "unknown type \"foo\"");
  EXPECT_EQ(errors[1].location, "#/properties/b/minLength");
  EXPECT_EQ(errors[1].message, "invalid uint");

  errors = ExtractErrors(R"({"type":"string","minLength":-1})");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].location, "#/minLength");
}

TEST(ExtractTest, BooleanSchemaInDraft4) {
  auto errors = ExtractErrors(
      R"({"$schema":"http://json-schema.org/draft-04/schema#","properties":{"a":true}})"
  );
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].location, "#/properties/a");
  EXPECT_EQ(
      errors[0].message, "boolean schemas not supported in http://json-schema.org/draft-04/schema#"
  );
}

TEST(ExtractTest, SchemaErrorMessage) {
  try {
    Extract(std::string(R"({"type":"string","minLength":"x"})"));
    FAIL() << "Expected a SchemaError";
  } catch (const SchemaError& e) {
    EXPECT_EQ(std::string(e.what()), "#/minLength: invalid uint");
  }
}

TEST(ExtractTest, InvalidInput) {
  EXPECT_THROW(Extract(std::string("{")), InvalidJSONError);

  ExtractConfig config;
  config.id = "foo/bar";
  EXPECT_THROW(Extract(std::string("{}"), config), InvalidConfigError);
  config.id = "http://x/%zz";
  EXPECT_THROW(Extract(std::string("{}"), config), InvalidConfigError);
}

TEST(ExtractTest, KubernetesIntOrString) {
  ExtractConfig config;
  config.default_version = Version::kKubernetesAPI;
  std::string text = ExtractText(R"({"x-kubernetes-int-or-string":true})", config);
  EXPECT_NE(text.find("int | string"), std::string::npos) << text;
}

TEST(ExtractTest, OpenAPIArrayNeedsItems) {
  ExtractConfig config;
  config.default_version = Version::kKubernetesAPI;
  auto errors = ExtractErrors(R"({"type":"array"})", config);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].location, "#");
  EXPECT_EQ(
      errors[0].message, "\"items\" must be present when the \"type\" is \"array\" in Kubernetes API"
  );
  EXPECT_EQ(ExtractText(R"({"type":"array","items":{"type":"string"}})", config), "[...string]\n");
}

TEST(ExtractTest, AllOf) {
  EXPECT_EQ(
      ExtractText(R"({"type":"string","allOf":[{"minLength":1},{"maxLength":5}]})"),
      "import \"strings\"\n\nmatchN(2, [strings.MinRunes(1), strings.MaxRunes(5)])\n"
  );
  // Members without constraints only narrow the types.
  EXPECT_EQ(
      ExtractText(R"({"allOf":[{"type":"string"},{"minLength":1}]})"),
      "import \"strings\"\n\nstrings.MinRunes(1)\n"
  );
}

TEST(ExtractTest, AnyOfAndNot) {
  EXPECT_EQ(
      ExtractText(R"({"anyOf":[{"type":"string"},{"type":"integer"}]})"),
      "matchN(>=1, [string, int])\n"
  );
  EXPECT_EQ(ExtractText(R"({"not":{"type":"string"}})"), "matchN(0, [string])\n");
}

TEST(ExtractTest, IfThenElse) {
  // then is only checked against strings, so its minLength needs no type.
  EXPECT_EQ(
      ExtractText(R"({"if":{"type":"string"},"then":{"minLength":1},"else":{"type":"integer"}})"),
      "import \"strings\"\n\nmatchIf(string, strings.MinRunes(1), int)\n"
  );
}

TEST(ExtractTest, ExclusiveBounds) {
  EXPECT_EQ(
      ExtractText(
          R"({"$schema":"http://json-schema.org/draft-04/schema#","type":"number","minimum":1,"exclusiveMinimum":true})"
      ),
      "@jsonschema(schema=\"http://json-schema.org/draft-04/schema#\")\n\n>1\n"
  );
  EXPECT_EQ(
      ExtractText(R"({"type":"number","exclusiveMinimum":1,"exclusiveMaximum":10})"), "<10 & >1\n"
  );
}

TEST(ExtractTest, AdditionalPropertiesSchema) {
  EXPECT_EQ(
      ExtractText(
          R"({"type":"object","properties":{"a":{"type":"string"}},)"
          R"("patternProperties":{"^x-":{"type":"integer"}},"additionalProperties":{"type":"boolean"}})"
      ),
      "a?: string\n[=~\"^x-\"]: int\n[!~\"^x-\" & !~\"^(a)$\"]: bool\n"
  );
}

TEST(ExtractTest, PrefixItems) {
  EXPECT_EQ(
      ExtractText(R"({"type":"array","prefixItems":[{"type":"string"},{"type":"integer"}],"items":false})"),
      "[] | [string] | [string, int]\n"
  );
  EXPECT_EQ(
      ExtractText(
          R"({"$schema":"http://json-schema.org/draft-07/schema#","type":"array",)"
          R"("items":[{"type":"string"}],"additionalItems":{"type":"integer"}})"
      ),
      "@jsonschema(schema=\"http://json-schema.org/draft-07/schema#\")\n\n[] | [string, ...int]\n"
  );
}

TEST(ExtractTest, Contains) {
  EXPECT_EQ(
      ExtractText(R"({"type":"array","contains":{"type":"integer"},"minContains":2,"maxContains":3})"),
      "import \"list\"\n\nlist.MatchN(>=2 & <=3, int)\n"
  );
}
