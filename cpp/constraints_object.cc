/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/constraints_object.cc
 * \brief The object keywords.
 */
#include "constraints.h"

#include "regexp_syntax.h"

namespace xschema {

namespace {

/*!
 * \brief The expression `!~"^(a|b)$"` that excludes the named fields of the struct, or nullptr
 * when it has none.
 */
ast::ExprPtr ExcludeFields(const ast::StructLit& obj) {
  std::vector<std::string> names;
  for (const auto& decl : obj.elts) {
    if (!decl->Is<ast::Field>()) continue;
    const auto& label = decl->As<ast::Field>().label;
    if (label.type == ast::Label::Type::kPattern) continue;
    names.push_back(QuoteMeta(label.name));
  }
  if (names.empty()) return nullptr;
  return ast::NewUnary(ast::Token::kNmat, ast::NewString("^(" + Join(names, "|") + ")$"));
}

ast::ExprPtr UintLit(uint64_t n) { return ast::NewLit(ast::Token::kInt, std::to_string(n)); }

}  // namespace

void ConstraintProperties(const std::string& key, const JSONNode& n, SchemaState* s) {
  auto& obj = s->Object(n);
  if (n.GetKind() != kStructKind) {
    s->Errorf(n, "\"properties\" expected an object, found " + KindString(n.GetKind()));
    return;
  }
  s->has_properties = true;
  s->ProcessMap(n, [&](const std::string& name, const JSONNode& value) {
    SchemaInfo sub;
    auto expr = s->SubSchema(value, kAllTypes, &sub);
    auto field = ast::NewField(ast::Label::String(name), expr, ast::Token::kOption);
    auto& f = field->As<ast::Field>();
    f.doc = sub.Comment();
    if (sub.deprecated) f.attrs.push_back(ast::Attribute{"@deprecated()"});
    obj.elts.push_back(std::move(field));
  });
}

void ConstraintPatternProperties(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (n.GetKind() != kStructKind) {
    s->Errorf(
        n, "value of \"patternProperties\" must be an object, found " + KindString(n.GetKind())
    );
    return;
  }
  auto& obj = s->Object(n);
  s->ProcessMap(n, [&](const std::string& pattern, const JSONNode& value) {
    if (!s->CheckRegexp(value, pattern)) return;
    // Recorded for additionalProperties, which applies to the fields no pattern matches.
    s->patterns.push_back(ast::NewUnary(ast::Token::kNmat, ast::NewString(pattern)));
    auto label = ast::NewUnary(ast::Token::kMat, ast::NewString(pattern));
    obj.elts.push_back(ast::NewField(ast::Label::Pattern(label), s->Schema(value)));
  });
}

void ConstraintAdditionalProperties(const std::string& key, const JSONNode& n, SchemaState* s) {
  switch (n.GetKind()) {
    case kBoolKind: {
      bool open = true;
      if (!s->BoolValue(n, &open)) return;
      s->has_additional_properties = true;
      s->openness = open ? ObjectOpenness::kExplicitlyOpen : ObjectOpenness::kExplicitlyClosed;
      s->Object(n);
      return;
    }
    case kStructKind: {
      s->has_additional_properties = true;
      s->openness = ObjectOpenness::kAllFieldsCovered;
      auto& obj = s->Object(n);
      // [!~(properties|patternProperties)]: schema
      std::vector<ast::ExprPtr> existing = s->patterns;
      if (auto exclude = ExcludeFields(obj)) existing.push_back(exclude);
      auto expr = s->Schema(n);
      auto label = existing.empty() ? ast::NewIdent("string")
                                    : ast::NewBinExpr(ast::Token::kAnd, existing);
      obj.elts.push_back(ast::NewField(ast::Label::Pattern(label), expr));
      return;
    }
    default:
      s->Errorf(n, "value of \"additionalProperties\" must be an object or boolean");
  }
}

void ConstraintPropertyNames(const std::string& key, const JSONNode& n, SchemaState* s) {
  // [names]: _
  auto names = s->SubSchema(n, kStringKind);
  if (ast::IsIdent(names, "_")) return;
  auto field = ast::NewField(ast::Label::Pattern(names), ast::NewTop());
  s->Add(n, CoreType::kObject, ast::NewStruct({field}));
}

void ConstraintRequired(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (n.GetKind() != kListKind) {
    s->Errorf(n, "value of \"required\" must be list of strings, found " + KindString(n.GetKind()));
    return;
  }
  auto& obj = s->Object(n);
  for (const auto& item : s->ListItems(key, n, true)) {
    std::string name;
    if (!s->StrValue(item, &name)) continue;
    ast::Field* field = s->FindField(name);
    if (field == nullptr) {
      obj.elts.push_back(ast::NewField(ast::Label::String(name), ast::NewTop(), ast::Token::kNot));
      continue;
    }
    if (field->constraint == ast::Token::kNot) {
      s->Errorf(item, "duplicate required field " + Quote(name));
    }
    field->constraint = ast::Token::kNot;
  }
}

void ConstraintMinProperties(const std::string& key, const JSONNode& n, SchemaState* s) {
  uint64_t min = 0;
  if (!s->UintValue(n, &min)) return;
  s->Add(n, CoreType::kObject, ast::NewPkgCall("struct", "MinFields", {UintLit(min)}));
}

void ConstraintMaxProperties(const std::string& key, const JSONNode& n, SchemaState* s) {
  uint64_t max = 0;
  if (!s->UintValue(n, &max)) return;
  s->Add(n, CoreType::kObject, ast::NewPkgCall("struct", "MaxFields", {UintLit(max)}));
}

}  // namespace xschema
