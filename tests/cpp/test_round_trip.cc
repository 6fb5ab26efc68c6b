#include <gtest/gtest.h>
#include <xschema/xschema.h>

using namespace xschema;

namespace {

/*! \brief Extract a schema, then generate a schema back from the result. */
std::string RoundTrip(const std::string& schema) {
  ast::FilePtr file = Extract(schema);
  picojson::value json = SchemaToJSON(Generate(Value::FromFile(file)));
  json.get<picojson::object>().erase("$schema");
  return json.serialize();
}

std::string Normalize(const std::string& json_text) {
  picojson::value value;
  std::string err = picojson::parse(value, json_text);
  EXPECT_TRUE(err.empty()) << err;
  return value.serialize();
}

}  // namespace

TEST(RoundTripTest, Properties) {
  EXPECT_EQ(
      RoundTrip(
          R"({"type":"object","properties":{"a":{"type":"string"},"b":{"type":"integer","minimum":0}},"required":["a"]})"
      ),
      Normalize(
          R"({"type":"object","properties":{"a":{"type":"string"},)"
          R"("b":{"allOf":[{"type":"number"},{"type":"integer","minimum":0}]}},"required":["a"]})"
      )
  );
}

TEST(RoundTripTest, ClosedObject) {
  EXPECT_EQ(
      RoundTrip(
          R"({"type":"object","properties":{"a":{"type":"string"}},"additionalProperties":false})"
      ),
      Normalize(
          R"({"type":"object","properties":{"a":{"type":"string"}},"additionalProperties":false})"
      )
  );
}

TEST(RoundTripTest, StringLength) {
  EXPECT_EQ(
      RoundTrip(R"({"type":"string","minLength":2,"maxLength":5})"),
      Normalize(R"({"type":"string","minLength":2,"maxLength":5})")
  );
}

TEST(RoundTripTest, Definitions) {
  EXPECT_EQ(
      RoundTrip(R"({"$ref":"#/$defs/foo","$defs":{"foo":{"type":"integer"}}})"),
      Normalize(R"({"$defs":{"#foo":{"type":"integer"}},"$ref":"#/$defs/#foo"})")
  );
}

TEST(RoundTripTest, SelfReference) {
  EXPECT_EQ(
      RoundTrip(R"({"type":"object","properties":{"next":{"$ref":"#"}}})"),
      Normalize(
          R"({"$defs":{"_schema":{"type":"object","properties":{"next":{"$ref":"#/$defs/_schema"}}}},)"
          R"("$ref":"#/$defs/_schema"})"
      )
  );
}
