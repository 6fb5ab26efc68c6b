#include <gtest/gtest.h>
#include <xschema/ast.h>

#include "struct_builder.h"

using namespace xschema;

namespace {

std::string FormatResult(Result<ast::ExprPtr> result) {
  EXPECT_TRUE(result.IsOk());
  if (result.IsErr()) return result.ErrRef().what();
  return ast::FormatExpr(result.ValueRef());
}

}  // namespace

TEST(StructBuilderTest, RootOnly) {
  StructBuilder builder;
  EXPECT_TRUE(builder.Put({}, ast::NewIdent("string")));
  EXPECT_EQ(FormatResult(builder.Syntax()), "string");
}

TEST(StructBuilderTest, PutTwice) {
  StructBuilder builder;
  EXPECT_TRUE(builder.Put({ast::Selector::Ident("#a")}, ast::NewIdent("int")));
  EXPECT_FALSE(builder.Put({ast::Selector::Ident("#a")}, ast::NewIdent("string")));
  EXPECT_EQ(FormatResult(builder.Syntax()), "{\n\t#a: int\n}");
}

TEST(StructBuilderTest, ForwardReference) {
  StructBuilder builder;
  auto ref = builder.GetRef({ast::Selector::Ident("#foo")});
  ASSERT_TRUE(ref.IsOk());
  builder.Put({}, ref.ValueRef());
  auto value = ast::NewIdent("int");
  builder.Put({ast::Selector::Ident("#foo")}, value);

  auto syntax = builder.Syntax();
  EXPECT_EQ(FormatResult(syntax), "{\n\t#foo\n\t#foo: int\n}");
  // The reference is bound to the value it names.
  EXPECT_EQ(ref.ValueRef()->As<ast::Ident>().node.lock(), value);
}

TEST(StructBuilderTest, NestedPathReference) {
  StructBuilder builder;
  ast::Path path = {ast::Selector::Ident("#defs"), ast::Selector::Str("a-b")};
  auto ref = builder.GetRef(path);
  ASSERT_TRUE(ref.IsOk());
  EXPECT_EQ(ast::FormatExpr(ref.ValueRef()), "#defs.\"a-b\"");
  builder.Put(path, ast::NewIdent("bool"), "A flag.");
  builder.Put({}, ref.ValueRef());
  EXPECT_EQ(
      FormatResult(builder.Syntax()), "{\n\t#defs.\"a-b\"\n\t#defs: {\n\t\t// A flag.\n\t\t\"a-b\": bool\n\t}\n}"
  );
}

TEST(StructBuilderTest, SelfReference) {
  StructBuilder builder;
  auto self = builder.GetRef({});
  ASSERT_TRUE(self.IsOk());
  EXPECT_EQ(ast::FormatExpr(self.ValueRef()), "_schema");
  auto value = ast::NewStruct({ast::NewField(ast::Label::String("next"), self.ValueRef(), ast::Token::kOption)});
  builder.Put({}, value);
  EXPECT_EQ(FormatResult(builder.Syntax()), "{\n\t_schema\n\t_schema: {\n\t\tnext?: _schema\n\t}\n}");
  EXPECT_EQ(self.ValueRef()->As<ast::Ident>().node.lock(), value);
}

TEST(StructBuilderTest, Errors) {
  StructBuilder empty;
  EXPECT_TRUE(empty.Syntax().IsErr());

  StructBuilder undefined;
  auto ref = undefined.GetRef({ast::Selector::Ident("#missing")});
  ASSERT_TRUE(ref.IsOk());
  undefined.Put({}, ref.ValueRef());
  auto syntax = undefined.Syntax();
  ASSERT_TRUE(syntax.IsErr());
  EXPECT_NE(std::string(syntax.ErrRef().what()).find("#missing"), std::string::npos);

  StructBuilder string_root;
  EXPECT_TRUE(string_root.GetRef({ast::Selector::Str("a b")}).IsErr());
}
