#include <gtest/gtest.h>
#include <xschema/xschema.h>

#include "schema_decoder.h"

using namespace xschema;

namespace {

std::string ExtractText(const std::string& schema, const ExtractConfig& config = ExtractConfig()) {
  return ast::Format(*Extract(schema, config));
}

}  // namespace

TEST(ExtractRefsTest, Definitions) {
  EXPECT_EQ(
      ExtractText(R"({"$ref":"#/$defs/foo","$defs":{"foo":{"type":"integer"}}})"),
      "#foo\n#foo: int\n"
  );
  EXPECT_EQ(
      ExtractText(
          R"({"$schema":"http://json-schema.org/draft-07/schema#","definitions":{"foo":{"type":"string"}},"$ref":"#/definitions/foo"})"
      ),
      "@jsonschema(schema=\"http://json-schema.org/draft-07/schema#\")\n\n#foo\n#foo: string\n"
  );
}

TEST(ExtractRefsTest, SelfReference) {
  std::string text =
      ExtractText(R"({"type":"object","properties":{"next":{"$ref":"#"}}})");
  EXPECT_EQ(text, "_schema\n_schema: {\n\tnext?: _schema\n\t...\n}\n");
}

TEST(ExtractRefsTest, Anchor) {
  EXPECT_EQ(
      ExtractText(R"({"$defs":{"foo":{"$anchor":"bar","type":"string"}},"$ref":"#bar"})"),
      "#foo\n#foo: string\n"
  );
}

TEST(ExtractRefsTest, ExternalReference) {
  EXPECT_EQ(
      ExtractText(R"({"$ref":"https://example.com/schemas/foo.json#/$defs/bar"})"),
      "import \"example.com/schemas/foo.json:foo\"\n\nfoo.#bar\n"
  );
}

TEST(ExtractRefsTest, RootDefinitions) {
  ExtractConfig config;
  config.root = "#/definitions";
  EXPECT_EQ(
      ExtractText(
          R"({"definitions":{"a":{"type":"string"},"b":{"$ref":"#/definitions/a"}}})", config
      ),
      "#a: string\n#b: #a\n"
  );
}

TEST(ExtractRefsTest, SingleRoot) {
  ExtractConfig config;
  config.root = "#/components/schemas/Foo";
  config.single_root = true;
  EXPECT_EQ(
      ExtractText(R"({"components":{"schemas":{"Foo":{"type":"string"}}}})", config), "string\n"
  );
}

TEST(ExtractRefsTest, MissingRoot) {
  ExtractConfig config;
  config.root = "#/nope";
  try {
    Extract(std::string("{}"), config);
    FAIL() << "Expected a SchemaError";
  } catch (const SchemaError& e) {
    ASSERT_EQ(e.Diagnostics().size(), 1u);
    EXPECT_EQ(e.Diagnostics()[0].message, "root value at path #/nope does not exist");
  }
}

TEST(ExtractRefsTest, DefineSchemaCallback) {
  std::vector<std::string> defined;
  ExtractConfig config;
  config.map_ref = [](const SchemaLoc& loc) {
    MappedLocation mapped;
    if (loc.is_local && loc.path.size() == 2 && loc.path[0] == "$defs") {
      mapped.import_path = "example.com/defs";
      mapped.path = {ast::Selector::Ident("#" + loc.path[1])};
    }
    return mapped;
  };
  config.define_schema = [&defined](
                             const std::string& import_path,
                             const ast::Path& path,
                             const ast::ExprPtr& expr
                         ) {
    defined.push_back(import_path + " " + ast::PathString(path) + " " + ast::FormatExpr(expr));
  };
  EXPECT_EQ(
      ExtractText(R"({"$defs":{"a":{"type":"string"}},"$ref":"#/$defs/a"})", config),
      "import \"example.com/defs\"\n\ndefs.#a\n"
  );
  ASSERT_EQ(defined.size(), 1u);
  EXPECT_EQ(defined[0], "example.com/defs #a string");
}

TEST(ExtractRefsTest, MapRefFailure) {
  ExtractConfig config;
  config.map_ref = [](const SchemaLoc& loc) -> MappedLocation {
    throw std::runtime_error("boom");
  };
  try {
    Extract(std::string(R"({"$ref":"#/$defs/foo","$defs":{"foo":{}}})"), config);
    FAIL() << "Expected a SchemaError";
  } catch (const SchemaError& e) {
    ASSERT_FALSE(e.Diagnostics().empty());
    EXPECT_EQ(e.Diagnostics()[0].location, "#/$defs/foo");
    EXPECT_EQ(
        e.Diagnostics()[0].message,
        "cannot get reference for id=https://cue.jsonschema.invalid#/$defs/foo "
        "localPath=\"/$defs/foo\": boom"
    );
  }
}

TEST(ExtractRefsTest, DefaultMap) {
  EXPECT_TRUE(DefaultMap({}).empty());
  EXPECT_EQ(ast::PathString(DefaultMap({"$defs", "foo"})), "#foo");
  EXPECT_EQ(ast::PathString(DefaultMap({"definitions", "a-b"})), "#.\"a-b\"");
  EXPECT_EQ(ast::PathString(DefaultMap({"properties", "x"})), "_#defs.\"/properties/x\"");
}

TEST(ExtractRefsTest, DefaultMapURL) {
  EXPECT_EQ(
      DefaultMapURL("https://example.com/schemas/foo.json").import_path,
      "example.com/schemas/foo.json:foo"
  );
  EXPECT_EQ(DefaultMapURL("https://example.com/schemas/foo").import_path, "example.com/schemas/foo");
  EXPECT_EQ(
      DefaultMapURL("https://example.com/schemas/1.json").import_path,
      "example.com/schemas/1.json:schema"
  );
  EXPECT_EQ(DefaultMapURL("urn:uuid:abc").import_path, "dXVpZDphYmM");
  EXPECT_THROW(DefaultMapURL(":foo"), std::runtime_error);
}

TEST(ExtractRefsTest, DefaultMapRef) {
  SchemaLoc external;
  external.id = "https://example.com/foo.json#/definitions/x";
  MappedLocation mapped = DefaultMapRef(external);
  EXPECT_EQ(mapped.import_path, "example.com/foo.json:foo");
  EXPECT_EQ(ast::PathString(mapped.path), "#x");

  external.id = "https://example.com/foo.json#anchor";
  EXPECT_THROW(DefaultMapRef(external), std::runtime_error);

  SchemaLoc local;
  local.id = "https://cue.jsonschema.invalid#/$defs/a";
  local.is_local = true;
  local.path = {"$defs", "a"};
  mapped = DefaultMapRef(local);
  EXPECT_TRUE(mapped.import_path.empty());
  EXPECT_EQ(ast::PathString(mapped.path), "#a");
}

TEST(ExtractRefsTest, ImportQualifier) {
  EXPECT_EQ(ImportQualifier("example.com/schemas/foo.json:foo").Unwrap(), "foo");
  EXPECT_EQ(ImportQualifier("example.com/defs").Unwrap(), "defs");
  EXPECT_EQ(ImportQualifier("example.com/defs@v1").Unwrap(), "defs");
}
