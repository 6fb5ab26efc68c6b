#include <gtest/gtest.h>
#include <xschema/value.h>

using namespace xschema;
using namespace xschema::ast;

namespace {

/*! \brief #A: {a: int, b?: string, c!: bool}, x: #A, y: {z: _, ...} */
FilePtr MakeFile() {
  auto file = std::make_shared<File>();
  file->decls = {
      NewField(
          Label::Ident("#A"),
          NewStruct({
              NewField(Label::String("a"), NewIdent("int")),
              NewField(Label::String("b"), NewIdent("string"), Token::kOption),
              NewField(Label::String("c"), NewIdent("bool"), Token::kNot),
          })
      ),
      NewField(Label::String("x"), NewIdent("#A")),
      NewField(Label::String("y"), NewStruct({NewField(Label::String("z"), NewTop()), NewEllipsisDecl()})),
  };
  return file;
}

}  // namespace

TEST(ValueTest, ExprDecomposition) {
  std::vector<Value> args;
  auto conj = Value::FromExpr(NewBinary(
      Token::kAnd, NewBinary(Token::kAnd, NewIdent("int"), NewUnary(Token::kGeq, NewInt(0))), NewUnary(Token::kLss, NewInt(10))
  ));
  EXPECT_EQ(conj.Expr(&args), Op::kAnd);
  ASSERT_EQ(args.size(), 3u);
  EXPECT_EQ(FormatExpr(args[0].Syntax()), "int");
  std::vector<Value> bound;
  EXPECT_EQ(args[1].Expr(&bound), Op::kGreaterThanEqual);
  ASSERT_EQ(bound.size(), 1u);
  EXPECT_EQ(FormatExpr(bound[0].Syntax()), "0");
  EXPECT_EQ(args[2].Expr(&bound), Op::kLessThan);

  auto disj = Value::FromExpr(NewBinary(Token::kOr, NewUnary(Token::kMul, NewInt(1)), NewInt(2)));
  EXPECT_EQ(disj.Expr(&args), Op::kOr);
  ASSERT_EQ(args.size(), 2u);
  EXPECT_EQ(FormatExpr(args[0].Syntax()), "1");

  auto call = Value::FromExpr(NewPkgCall("strings", "MinRunes", {NewInt(2)}));
  EXPECT_EQ(call.Expr(&args), Op::kCall);
  ASSERT_EQ(args.size(), 2u);
  EXPECT_EQ(args[0].BuiltinName(), "strings.MinRunes");
  EXPECT_EQ(call.BuiltinName(), "strings.MinRunes");

  auto match = Value::FromExpr(NewUnary(Token::kMat, NewString("^a")));
  EXPECT_EQ(match.Expr(&args), Op::kRegexMatch);
  EXPECT_EQ(Value::FromExpr(NewIdent("string")).Expr(&args), Op::kNoOp);
}

TEST(ValueTest, Kinds) {
  auto kind = [](const ExprPtr& expr) { return Value::FromExpr(expr).IncompleteKind(); };
  EXPECT_EQ(kind(NewIdent("int32")), kIntKind);
  EXPECT_EQ(kind(NewIdent("number")), kNumberKind);
  EXPECT_EQ(kind(NewBinary(Token::kAnd, NewIdent("int"), NewUnary(Token::kGeq, NewInt(0)))), kIntKind);
  EXPECT_EQ(kind(NewBinary(Token::kOr, NewIdent("string"), NewNull())), kStringKind | kNullKind);
  EXPECT_EQ(kind(NewPkgSel("time", "Time")), kStringKind);
  EXPECT_EQ(kind(NewPkgCall("list", "MinItems", {NewInt(1)})), kListKind);
  EXPECT_EQ(kind(NewStruct()), kStructKind);
  EXPECT_EQ(kind(NewList()), kListKind);
  EXPECT_EQ(kind(NewTop()), kTopKind);
  EXPECT_EQ(KindString(kIntKind | kStringKind), "int|string");
  EXPECT_EQ(KindString(kTopKind), "_");
}

TEST(ValueTest, Concrete) {
  EXPECT_TRUE(Value::FromExpr(NewString("a")).IsConcrete());
  EXPECT_TRUE(Value::FromExpr(NewUnary(Token::kSub, NewInt(3))).IsConcrete());
  EXPECT_TRUE(Value::FromExpr(NewList({NewInt(1), NewNull()})).IsConcrete());
  EXPECT_TRUE(Value::FromExpr(NewStruct({NewField(Label::String("a"), NewBool(true))})).IsConcrete());
  EXPECT_FALSE(Value::FromExpr(NewIdent("int")).IsConcrete());
  EXPECT_FALSE(Value::FromExpr(NewList({NewEllipsis()})).IsConcrete());
  EXPECT_FALSE(
      Value::FromExpr(NewStruct({NewField(Label::String("a"), NewInt(1), Token::kOption)})).IsConcrete()
  );
}

TEST(ValueTest, FieldsAndReferences) {
  Value root = Value::FromFile(MakeFile());
  auto fields = root.Fields();
  ASSERT_EQ(fields.size(), 2u);
  EXPECT_EQ(fields[0].name, "x");
  EXPECT_EQ(fields[1].name, "y");

  const Value& x = fields[0].value;
  EXPECT_EQ(PathString(x.Path()), "x");
  Value ref_root;
  Path ref_path;
  ASSERT_TRUE(x.ReferencePath(&ref_root, &ref_path));
  EXPECT_EQ(PathString(ref_path), "#A");
  EXPECT_EQ(ref_root.Syntax(), root.Syntax());

  auto def_fields = x.Fields();
  ASSERT_EQ(def_fields.size(), 3u);
  EXPECT_EQ(def_fields[0].constraint, FieldConstraint::kRegular);
  EXPECT_EQ(def_fields[1].constraint, FieldConstraint::kOptional);
  EXPECT_EQ(def_fields[2].constraint, FieldConstraint::kRequired);
  EXPECT_EQ(PathString(def_fields[0].value.Path()), "#A.a");
  EXPECT_EQ(x.IncompleteKind(), kStructKind);

  EXPECT_FALSE(fields[1].value.ReferencePath(&ref_root, &ref_path));
}

TEST(ValueTest, Openness) {
  Value root = Value::FromFile(MakeFile());
  auto fields = root.Fields();
  EXPECT_EQ(fields[0].value.GetOpenness(), Openness::kImplicitlyClosed);
  EXPECT_EQ(fields[1].value.GetOpenness(), Openness::kExplicitlyOpen);

  Value plain = Value::FromExpr(NewStruct({NewField(Label::String("a"), NewIdent("int"))}));
  EXPECT_EQ(plain.GetOpenness(), Openness::kOpen);
  EXPECT_EQ(plain.Closed().GetOpenness(), Openness::kExplicitlyClosed);
}

TEST(ValueTest, EmbeddedValues) {
  // {#foo, #foo: int}
  auto file = std::make_shared<File>();
  file->decls = {NewEmbed(NewIdent("#foo")), NewField(Label::Ident("#foo"), NewIdent("int"))};
  Value root = Value::FromFile(file);
  std::vector<Value> args;
  EXPECT_EQ(root.Expr(&args), Op::kAnd);
  ASSERT_EQ(args.size(), 1u);
  Value ref_root;
  Path ref_path;
  ASSERT_TRUE(args[0].ReferencePath(&ref_root, &ref_path));
  EXPECT_EQ(PathString(ref_path), "#foo");
  EXPECT_EQ(root.IncompleteKind(), kIntKind);

  // {#foo, a: string} views the fields apart from the embedded value.
  file->decls.push_back(NewField(Label::String("a"), NewIdent("string")));
  root = Value::FromFile(file);
  EXPECT_EQ(root.Expr(&args), Op::kAnd);
  ASSERT_EQ(args.size(), 2u);
  EXPECT_EQ(args[1].Fields().size(), 1u);
  std::vector<Value> nested;
  EXPECT_EQ(args[1].Expr(&nested), Op::kNoOp);
}

TEST(ValueTest, Lists) {
  auto list = Value::FromExpr(NewList({NewIdent("int"), NewEllipsis(NewIdent("string"))})).List();
  ASSERT_EQ(list.prefix.size(), 1u);
  EXPECT_TRUE(list.open);
  ASSERT_TRUE(list.rest.Exists());
  EXPECT_EQ(FormatExpr(list.rest.Syntax()), "string");
  EXPECT_EQ(PathString(list.prefix[0].Path()), "\"0\"");

  auto closed = Value::FromExpr(NewList({NewInt(1)})).List();
  EXPECT_FALSE(closed.open);
  EXPECT_FALSE(closed.rest.Exists());
}

TEST(ValueTest, Literals) {
  int64_t i = 0;
  ASSERT_TRUE(Value::FromExpr(NewUnary(Token::kSub, NewInt(5))).ToInt64(&i));
  EXPECT_EQ(i, -5);
  EXPECT_FALSE(Value::FromExpr(NewFloat(1.5)).ToInt64(&i));

  double d = 0;
  ASSERT_TRUE(Value::FromExpr(NewFloat(1.5)).ToDouble(&d));
  EXPECT_DOUBLE_EQ(d, 1.5);

  std::string s;
  ASSERT_TRUE(Value::FromExpr(NewString("abc")).ToString(&s));
  EXPECT_EQ(s, "abc");
  EXPECT_FALSE(Value::FromExpr(NewIdent("string")).ToString(&s));
}

TEST(ValueTest, Validate) {
  EXPECT_TRUE(Value::FromFile(MakeFile()).Validate().empty());
  EXPECT_TRUE(Value::FromExpr(NewCall(NewIdent("close"), {NewStruct()})).Validate().empty());

  auto file = std::make_shared<File>();
  file->decls = {
      NewField(Label::String("a"), NewIdent("#B")),
      NewField(Label::String("b"), NewStruct({NewField(Label::String("c"), NewIdent("undefinedType"))})),
  };
  auto errors = Value::FromFile(file).Validate();
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0].location, "a");
  EXPECT_EQ(errors[0].message, "reference \"#B\" not found");
  EXPECT_EQ(errors[1].location, "b.c");
}
