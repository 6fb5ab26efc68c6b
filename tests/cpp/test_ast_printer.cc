#include <gtest/gtest.h>
#include <xschema/ast.h>

using namespace xschema;
using namespace xschema::ast;

TEST(ASTPrinterTest, FormatFileWithImports) {
  File file;
  file.package = "foo";
  file.decls.push_back(NewEmbed(NewBinary(
      Token::kAnd,
      NewPkgCall("strings", "MinRunes", {NewInt(2)}),
      NewPkgCall("strings", "MaxRunes", {NewInt(5)})
  )));
  EXPECT_TRUE(CollectImports(&file).empty());
  ASSERT_EQ(file.imports.size(), 1u);
  EXPECT_EQ(file.imports[0].path, "strings");
  EXPECT_EQ(
      Format(file),
      "package foo\n\nimport \"strings\"\n\nstrings.MinRunes(2) & strings.MaxRunes(5)\n"
  );
}

TEST(ASTPrinterTest, FormatSeveralImports) {
  File file;
  file.decls.push_back(NewField(Label::String("t"), NewPkgSel("time", "Time")));
  file.decls.push_back(NewField(Label::String("l"), NewPkgCall("list", "UniqueItems", {})));
  file.decls.push_back(
      NewField(
          Label::String("x"),
          NewSel(NewImportIdent("example.com/schemas:other", "other"), Selector::Ident("#x")),
          Token::kOption
      )
  );
  CollectImports(&file);
  EXPECT_EQ(
      Format(file),
      "import (\n"
      "\t\"example.com/schemas:other\"\n"
      "\t\"list\"\n"
      "\t\"time\"\n"
      ")\n"
      "\n"
      "t: time.Time\n"
      "l: list.UniqueItems()\n"
      "x?: other.#x\n"
  );
}

TEST(ASTPrinterTest, FormatStruct) {
  auto st = NewStruct({
      NewField(Label::String("name"), NewIdent("string"), Token::kNot),
      NewField(Label::String("a-b"), NewBinary(Token::kOr, NewInt(1), NewString("x"))),
      NewField(Label::Pattern(NewUnary(Token::kMat, NewString("^x"))), NewIdent("int")),
      NewEllipsisDecl(),
  });
  EXPECT_EQ(
      FormatExpr(st),
      "{\n\tname!: string\n\t\"a-b\": 1 | \"x\"\n\t[=~\"^x\"]: int\n\t...\n}"
  );
}

TEST(ASTPrinterTest, Precedence) {
  auto or_expr = NewBinary(Token::kOr, NewIdent("a"), NewIdent("b"));
  EXPECT_EQ(FormatExpr(NewBinary(Token::kAnd, or_expr, NewIdent("c"))), "(a | b) & c");
  EXPECT_EQ(FormatExpr(NewBinary(Token::kOr, NewIdent("c"), or_expr)), "c | a | b");
  EXPECT_EQ(FormatExpr(NewUnary(Token::kGeq, NewInt(0))), ">=0");
  EXPECT_EQ(FormatExpr(NewList({NewIdent("int"), NewEllipsis(NewIdent("string"))})), "[int, ...string]");
}

TEST(ASTPrinterTest, ReservedLabelsAreQuoted) {
  auto st = NewStruct({
      NewField(Label::String("if"), NewNull()),
      NewField(Label::String("#x"), NewBool(true)),
      NewField(Label::Ident("#x"), NewBool(false)),
  });
  EXPECT_EQ(FormatExpr(st), "{\n\t\"if\": null\n\t\"#x\": true\n\t#x: false\n}");
}

TEST(ASTPrinterTest, FormatJSON) {
  auto schema = NewStruct({
      NewField(Label::String("type"), NewString("object")),
      NewField(Label::String("required"), NewList({NewString("a"), NewString("b")})),
      NewField(Label::String("properties"), NewStruct()),
      NewField(Label::String("minimum"), NewFloat(1.5)),
  });
  EXPECT_EQ(
      FormatJSON(schema, -1),
      R"({"type":"object","required":["a","b"],"properties":{},"minimum":1.5})"
  );
  EXPECT_EQ(
      FormatJSON(schema),
      "{\n"
      "  \"type\": \"object\",\n"
      "  \"required\": [\n"
      "    \"a\",\n"
      "    \"b\"\n"
      "  ],\n"
      "  \"properties\": {},\n"
      "  \"minimum\": 1.5\n"
      "}"
  );
}

TEST(ASTHelpersTest, Numbers) {
  EXPECT_EQ(FormatNumber(5.0), "5");
  EXPECT_EQ(FormatNumber(-3.0), "-3");
  EXPECT_EQ(FormatNumber(0.1), "0.1");
  EXPECT_EQ(FormatNumber(2.5e-7), "2.5e-07");
  EXPECT_EQ(NewFloat(5.0)->As<BasicLit>().kind, Token::kInt);
  EXPECT_EQ(NewFloat(0.5)->As<BasicLit>().kind, Token::kFloat);
}

TEST(ASTHelpersTest, Identifiers) {
  EXPECT_TRUE(IsValidIdent("foo"));
  EXPECT_TRUE(IsValidIdent("#foo"));
  EXPECT_TRUE(IsValidIdent("_#foo"));
  EXPECT_TRUE(IsValidIdent("_"));
  EXPECT_TRUE(IsValidIdent("$id"));
  EXPECT_FALSE(IsValidIdent("1a"));
  EXPECT_FALSE(IsValidIdent("a-b"));
  EXPECT_FALSE(IsValidIdent(""));
}

TEST(ASTHelpersTest, Selectors) {
  EXPECT_EQ(Selector::Ident("#a").GetType(), Selector::Type::kDefinition);
  EXPECT_EQ(Selector::Ident("_a").GetType(), Selector::Type::kHidden);
  EXPECT_EQ(Selector::Ident("_#a").GetType(), Selector::Type::kHiddenDefinition);
  EXPECT_EQ(Selector::Str("#a").String(), "\"#a\"");
  Path path = {Selector::Ident("#foo"), Selector::Str("a-b"), Selector::Str("c")};
  EXPECT_EQ(PathString(path), "#foo.\"a-b\".c");
  // Regular fields sort before definitions.
  EXPECT_TRUE(Selector::Str("z") < Selector::Ident("#a"));
}
