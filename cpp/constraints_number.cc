/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/constraints_number.cc
 * \brief The numeric keywords.
 */
#include "constraints.h"

namespace xschema {

namespace {

bool CheckNumber(const std::string& key, const JSONNode& n, SchemaState* s) {
  if ((n.GetKind() & kNumberKind) == 0) {
    s->Errorf(n, "value of " + Quote(key) + " must be a number");
    return false;
  }
  return true;
}

}  // namespace

void ConstraintMinimum(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (!CheckNumber(key, n, s)) return;
  auto op = s->exclusive_min ? ast::Token::kGtr : ast::Token::kGeq;
  s->Add(n, CoreType::kNumber, ast::NewUnary(op, s->Number(n)));
}

void ConstraintMaximum(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (!CheckNumber(key, n, s)) return;
  auto op = s->exclusive_max ? ast::Token::kLss : ast::Token::kLeq;
  s->Add(n, CoreType::kNumber, ast::NewUnary(op, s->Number(n)));
}

// Draft 4 and OpenAPI give exclusiveMinimum a boolean that modifies minimum; later drafts give it
// the bound itself.
void ConstraintExclusiveMinimum(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (n.GetKind() == kBoolKind) {
    s->BoolValue(n, &s->exclusive_min);
    return;
  }
  if (!CheckNumber(key, n, s)) return;
  s->Add(n, CoreType::kNumber, ast::NewUnary(ast::Token::kGtr, s->Number(n)));
}

void ConstraintExclusiveMaximum(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (n.GetKind() == kBoolKind) {
    s->BoolValue(n, &s->exclusive_max);
    return;
  }
  if (!CheckNumber(key, n, s)) return;
  s->Add(n, CoreType::kNumber, ast::NewUnary(ast::Token::kLss, s->Number(n)));
}

void ConstraintMultipleOf(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (!CheckNumber(key, n, s)) return;
  s->Add(n, CoreType::kNumber, ast::NewPkgCall("math", "MultipleOf", {s->Number(n)}));
}

}  // namespace xschema
