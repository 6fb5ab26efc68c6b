#include <gtest/gtest.h>
#include <picojson.h>

#include "json_pointer.h"

using namespace xschema;

TEST(JSONPointerTest, EscapeToken) {
  EXPECT_EQ(EscapeJSONPointerToken("a/b~c"), "a~1b~0c");
  EXPECT_EQ(EscapeJSONPointerToken("plain"), "plain");
  EXPECT_EQ(JSONPointerFromTokens({"$defs", "a/b"}), "/$defs/a~1b");
  EXPECT_EQ(JSONPointerFromTokens({}), "");
}

TEST(JSONPointerTest, Tokens) {
  auto tokens = JSONPointerTokens("/$defs/a~1b/~0x");
  ASSERT_TRUE(tokens.IsOk());
  std::vector<std::string> expected = {"$defs", "a/b", "~x"};
  EXPECT_EQ(tokens.ValueRef(), expected);

  auto empty = JSONPointerTokens("");
  ASSERT_TRUE(empty.IsOk());
  EXPECT_TRUE(empty.ValueRef().empty());

  auto trailing = JSONPointerTokens("/a/");
  ASSERT_TRUE(trailing.IsOk());
  std::vector<std::string> expected_trailing = {"a", ""};
  EXPECT_EQ(trailing.ValueRef(), expected_trailing);
}

TEST(JSONPointerTest, InvalidPointers) {
  EXPECT_TRUE(JSONPointerTokens("a/b").IsErr());
  EXPECT_TRUE(JSONPointerTokens("/a~2").IsErr());
  EXPECT_TRUE(JSONPointerTokens("/a~").IsErr());
}

TEST(JSONPointerTest, Lookup) {
  picojson::value doc;
  std::string err = picojson::parse(doc, R"({"a": {"b/c": [10, 20]}, "d": "x"})");
  ASSERT_TRUE(err.empty()) << err;

  const picojson::value* found = LookupJSONPointer(doc, {"a", "b/c", "1"});
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->get<int64_t>(), 20);

  EXPECT_EQ(LookupJSONPointer(doc, {}), &doc);
  EXPECT_EQ(LookupJSONPointer(doc, {"a", "b/c", "2"}), nullptr);
  EXPECT_EQ(LookupJSONPointer(doc, {"a", "b/c", "01"}), nullptr);
  EXPECT_EQ(LookupJSONPointer(doc, {"a", "missing"}), nullptr);
  EXPECT_EQ(LookupJSONPointer(doc, {"d", "x"}), nullptr);
}
