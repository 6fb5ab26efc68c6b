/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/constraints_combinator.cc
 * \brief allOf, anyOf, oneOf, not and if/then/else. They become matchN and matchIf calls.
 */
#include "constraints.h"

namespace xschema {

namespace {

ast::ExprPtr MatchN(ast::ExprPtr count, std::vector<ast::ExprPtr> schemas) {
  return ast::NewCall(ast::NewIdent("matchN"), {std::move(count), ast::NewList(std::move(schemas))});
}

}  // namespace

void ConstraintAllOf(const std::string& key, const JSONNode& n, SchemaState* s) {
  auto items = s->ListItems("allOf", n, false);
  if (items.empty()) {
    s->Errorf(n, "allOf requires at least one subschema");
    return;
  }
  Kind known_types = kBottomKind;
  std::vector<ast::ExprPtr> schemas;
  for (const auto& item : items) {
    SchemaInfo sub;
    auto expr = s->SubSchema(item, s->info.allowed_types, &sub);
    s->info.allowed_types &= sub.allowed_types;
    if (sub.has_constraints) {
      known_types |= sub.known_types;
      schemas.push_back(std::move(expr));
    }
  }
  if (schemas.empty()) return;
  s->info.known_types &= known_types;
  if (schemas.size() == 1) {
    s->all.Add(schemas[0]);
    return;
  }
  auto count = ast::NewInt(static_cast<int64_t>(schemas.size()));
  s->all.Add(MatchN(std::move(count), std::move(schemas)));
}

void ConstraintAnyOf(const std::string& key, const JSONNode& n, SchemaState* s) {
  auto items = s->ListItems("anyOf", n, false);
  if (items.empty()) {
    s->Errorf(n, "anyOf requires at least one subschema");
    return;
  }
  Kind types = kBottomKind;
  Kind known_types = kBottomKind;
  std::vector<ast::ExprPtr> schemas;
  for (const auto& item : items) {
    SchemaInfo sub;
    auto expr = s->SubSchema(item, s->info.allowed_types, &sub);
    if (sub.allowed_types == kBottomKind) continue;
    types |= sub.allowed_types;
    known_types |= sub.known_types;
    schemas.push_back(std::move(expr));
  }
  if (schemas.empty()) {
    s->info.allowed_types = kBottomKind;
    return;
  }
  if (schemas.size() == 1) {
    s->all.Add(schemas[0]);
    return;
  }
  s->info.allowed_types &= types;
  s->info.known_types &= known_types;
  s->all.Add(MatchN(ast::NewUnary(ast::Token::kGeq, ast::NewInt(1)), std::move(schemas)));
}

void ConstraintOneOf(const std::string& key, const JSONNode& n, SchemaState* s) {
  auto items = s->ListItems("oneOf", n, false);
  if (items.empty()) {
    s->Errorf(n, "oneOf requires at least one subschema");
    return;
  }
  Kind types = kBottomKind;
  Kind known_types = kBottomKind;
  // The check is only redundant when the members are bare types that do not overlap.
  bool needs_constraint = false;
  std::vector<ast::ExprPtr> schemas;
  for (const auto& item : items) {
    SchemaInfo sub;
    auto expr = s->SubSchema(item, s->info.allowed_types, &sub);
    if (sub.allowed_types == kBottomKind) continue;
    if (sub.has_constraints || (types & sub.allowed_types) != 0) {
      needs_constraint = true;
    }
    types |= sub.allowed_types;
    known_types |= sub.known_types;
    schemas.push_back(std::move(expr));
  }
  s->info.allowed_types &= types;
  if (schemas.empty() || !needs_constraint) return;
  s->info.known_types &= known_types;
  if (schemas.size() == 1) {
    s->all.Add(schemas[0]);
    return;
  }
  s->all.Add(MatchN(ast::NewInt(1), std::move(schemas)));
}

void ConstraintNot(const std::string& key, const JSONNode& n, SchemaState* s) {
  s->all.Add(MatchN(ast::NewInt(0), {s->Schema(n)}));
}

void ConstraintIf(const std::string& key, const JSONNode& n, SchemaState* s) { s->if_node = n; }

void ConstraintThen(const std::string& key, const JSONNode& n, SchemaState* s) {
  s->then_node = n;
}

void ConstraintElse(const std::string& key, const JSONNode& n, SchemaState* s) {
  s->else_node = n;
}

}  // namespace xschema
