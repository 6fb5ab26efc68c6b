#include <gtest/gtest.h>
#include <xschema/ast.h>

#include <algorithm>

#include "schema_item.h"

using namespace xschema;

namespace {

std::string Render(const SchemaItemPtr& item) { return ast::FormatJSON(RenderItem(item), -1); }

}  // namespace

TEST(ItemStoreTest, Interning) {
  ItemStore store;
  auto a = store.Make(TypeItem{{"string"}});
  auto b = store.Make(TypeItem{{"string"}});
  auto c = store.Make(TypeItem{{"integer"}});
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);

  auto props1 = store.Make(PropertiesItem{{{"a", a}}, {"a"}, {}, nullptr});
  auto props2 = store.Make(PropertiesItem{{{"a", b}}, {"a"}, {}, nullptr});
  EXPECT_EQ(props1, props2);
  EXPECT_EQ(store.True(), store.True());
  EXPECT_EQ(store.Size(), 4u);
}

TEST(ItemStoreTest, ApplyKeepsUnchangedItems) {
  ItemStore store;
  auto str = store.Make(TypeItem{{"string"}});
  auto not_str = store.Make(NotItem{str});
  auto same = store.Apply(not_str, [](const SchemaItemPtr& elem) { return elem; });
  EXPECT_EQ(same, not_str);

  auto num = store.Make(TypeItem{{"number"}});
  auto replaced = store.Apply(not_str, [&](const SchemaItemPtr&) { return num; });
  EXPECT_EQ(replaced, store.Make(NotItem{num}));
}

TEST(RewriteTest, MergeAllOfFlattens) {
  ItemStore store;
  auto str = store.Make(TypeItem{{"string"}});
  auto min = store.Make(LengthBoundsItem{Op::kGreaterThanEqual, 1});
  auto max = store.Make(LengthBoundsItem{Op::kLessThanEqual, 5});
  auto inner = store.Make(AllOfItem{{min, str}});
  auto outer = store.Make(AllOfItem{{str, inner, max}});

  auto merged = MergeAllOf(&store, outer);
  ASSERT_TRUE(merged->Is<AllOfItem>());
  const auto& elems = merged->As<AllOfItem>().elems;
  ASSERT_EQ(elems.size(), 3u);
  EXPECT_EQ(elems[0], str);
  EXPECT_EQ(elems[1], min);
  EXPECT_EQ(elems[2], max);

  // Already merged trees are left alone.
  EXPECT_EQ(MergeAllOf(&store, merged), merged);
}

TEST(RewriteTest, MergeAllOfCollapses) {
  ItemStore store;
  auto str = store.Make(TypeItem{{"string"}});
  EXPECT_EQ(MergeAllOf(&store, store.Make(AllOfItem{{str, str}})), str);
  EXPECT_EQ(MergeAllOf(&store, store.Make(AllOfItem{{}})), store.True());

  // Nested in other items.
  auto nested = store.Make(NotItem{store.Make(AllOfItem{{str}})});
  EXPECT_EQ(MergeAllOf(&store, nested), store.Make(NotItem{str}));
}

TEST(RewriteTest, EnumFromConst) {
  ItemStore store;
  auto a = store.Make(ConstItem{ast::NewString("a")});
  auto one = store.Make(ConstItem{ast::NewInt(1)});
  auto any = store.Make(AnyOfItem{{a, one}});
  auto result = EnumFromConst(&store, any);
  ASSERT_TRUE(result->Is<EnumItem>());
  EXPECT_EQ(Render(result), R"({"enum":["a",1]})");
  EXPECT_EQ(EnumFromConst(&store, result), result);

  auto str = store.Make(TypeItem{{"string"}});
  auto mixed = store.Make(AnyOfItem{{a, str}});
  EXPECT_EQ(EnumFromConst(&store, mixed), mixed);

  auto in_props = store.Make(PropertiesItem{{{"x", any}}, {}, {}, nullptr});
  auto rewritten = EnumFromConst(&store, in_props);
  EXPECT_EQ(Render(rewritten), R"({"properties":{"x":{"enum":["a",1]}}})");
  EXPECT_EQ(EnumFromConst(&store, rewritten), rewritten);
}

TEST(RenderTest, Keywords) {
  ItemStore store;
  EXPECT_EQ(Render(store.True()), "true");
  EXPECT_EQ(Render(store.False()), "false");
  EXPECT_EQ(Render(store.Make(TypeItem{{"string", "null"}})), R"({"type":["string","null"]})");
  EXPECT_EQ(Render(store.Make(BoundsItem{Op::kGreaterThan, "0"})), R"({"exclusiveMinimum":0})");
  EXPECT_EQ(Render(store.Make(BoundsItem{Op::kLessThanEqual, "2.5"})), R"({"maximum":2.5})");
  EXPECT_EQ(Render(store.Make(ItemsBoundsItem{Op::kLessThanEqual, 3})), R"({"maxItems":3})");
  EXPECT_EQ(Render(store.Make(PropertyBoundsItem{Op::kGreaterThanEqual, 1})), R"({"minProperties":1})");
  EXPECT_EQ(Render(store.Make(RefItem{"a/b"})), R"({"$ref":"#/$defs/a~1b"})");
  EXPECT_EQ(Render(store.Make(UniqueItemsItem{})), R"({"uniqueItems":true})");
  EXPECT_EQ(
      Render(store.Make(ContainsItem{store.Make(TypeItem{{"integer"}}), 2, std::nullopt})),
      R"({"contains":{"type":"integer"},"minContains":2})"
  );
  EXPECT_EQ(
      Render(store.Make(IfThenElseItem{store.Make(TypeItem{{"string"}}), nullptr, store.False()})),
      R"({"else":false,"if":{"type":"string"}})"
  );
}

TEST(RenderTest, AllOfMergesDistinctKeywords) {
  ItemStore store;
  auto item = store.Make(AllOfItem{{
      store.Make(LengthBoundsItem{Op::kLessThanEqual, 5}),
      store.Make(TypeItem{{"string"}}),
      store.True(),
      store.Make(LengthBoundsItem{Op::kGreaterThanEqual, 2}),
  }});
  EXPECT_EQ(Render(item), R"({"type":"string","maxLength":5,"minLength":2})");
}

TEST(RenderTest, AllOfKeepsRepeatedKeywordsApart) {
  ItemStore store;
  auto item = store.Make(AllOfItem{{
      store.Make(TypeItem{{"integer"}}),
      store.Make(TypeItem{{"number"}}),
      store.Make(BoundsItem{Op::kGreaterThanEqual, "0"}),
  }});
  EXPECT_EQ(Render(item), R"({"allOf":[{"type":"number"},{"type":"integer","minimum":0}]})");
}

TEST(RenderTest, AllOfKeepsInteractingKeywordsApart) {
  ItemStore store;
  auto str = store.Make(TypeItem{{"string"}});
  auto props = store.Make(PropertiesItem{{{"a", str}}, {}, {}, nullptr});
  auto patterns = store.Make(PropertiesItem{{}, {}, {{"^x", str}}, nullptr});
  EXPECT_EQ(
      Render(store.Make(AllOfItem{{props, patterns}})),
      R"({"allOf":[{"patternProperties":{"^x":{"type":"string"}}},{"properties":{"a":{"type":"string"}}}]})"
  );

  auto contains = store.Make(ContainsItem{str, std::nullopt, std::nullopt});
  auto bounded = store.Make(ContainsItem{str, std::nullopt, 3});
  auto rendered = Render(store.Make(AllOfItem{{contains, bounded}}));
  EXPECT_EQ(
      rendered,
      R"({"allOf":[{"contains":{"type":"string"},"maxContains":3},{"contains":{"type":"string"}}]})"
  );

  // A false conjunct makes the whole schema false.
  EXPECT_EQ(Render(store.Make(AllOfItem{{str, store.False()}})), "false");
}

TEST(RenderTest, KeywordOrder) {
  std::vector<std::string> keywords = {
      "required", "minLength", "properties", "type", "$schema", "else", "if",
      "additionalProperties", "$defs", "items", "patternProperties", "contains", "prefixItems",
  };
  std::sort(keywords.begin(), keywords.end(), SchemaKeywordLess);
  std::vector<std::string> expected = {
      "$schema", "$defs", "type", "additionalProperties", "patternProperties", "properties",
      "contains", "items", "prefixItems", "else", "if", "minLength", "required",
  };
  EXPECT_EQ(keywords, expected);

  EXPECT_EQ(KeywordInteractions("minContains").size(), 3u);
  EXPECT_TRUE(KeywordInteractions("minLength").empty());
}

TEST(RenderTest, Properties) {
  ItemStore store;
  auto str = store.Make(TypeItem{{"string"}});
  auto item = store.Make(PropertiesItem{{{"a", str}, {"b", store.True()}}, {"a"}, {}, store.False()});
  EXPECT_EQ(
      Render(item),
      R"({"additionalProperties":false,"properties":{"a":{"type":"string"},"b":true},"required":["a"]})"
  );
}
