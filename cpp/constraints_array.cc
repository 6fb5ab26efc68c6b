/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/constraints_array.cc
 * \brief The array keywords.
 */
#include "constraints.h"

namespace xschema {

namespace {

ast::ExprPtr UintLit(uint64_t n) { return ast::NewLit(ast::Token::kInt, std::to_string(n)); }

/*! \brief Set the schema of the elements after the prefix. */
void SetRestItems(const JSONNode& n, SchemaState* s) {
  s->list_pos = n;
  if (n.GetKind() == kBoolKind) {
    bool ok = true;
    s->BoolValue(n, &ok);
    s->rest_disallowed = !ok;
    s->rest_items = nullptr;
    return;
  }
  auto elem = s->Schema(n);
  s->rest_items = ast::IsIdent(elem, "_") ? nullptr : elem;
}

}  // namespace

void ConstraintPrefixItems(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (n.GetKind() != kListKind) {
    s->Errorf(n, "value of \"prefixItems\" must be an array, found " + KindString(n.GetKind()));
    return;
  }
  s->has_prefix_items = true;
  s->list_pos = n;
  for (const auto& item : s->ListItems(key, n, true)) {
    s->prefix_items.push_back(s->Schema(item));
  }
}

void ConstraintItems(const std::string& key, const JSONNode& n, SchemaState* s) {
  s->has_items = true;
  switch (n.GetKind()) {
    case kStructKind:
    case kBoolKind: {
      if (s->has_prefix_items) {
        // Since 2020-12, items applies to the elements after prefixItems.
        SetRestItems(n, s);
        return;
      }
      if (n.GetKind() == kBoolKind) {
        bool ok = true;
        s->BoolValue(n, &ok);
        s->Add(n, CoreType::kArray, ok ? ast::NewList({ast::NewEllipsis()}) : ast::NewList());
        return;
      }
      auto elem = s->Schema(n);
      auto ellipsis = ast::IsIdent(elem, "_") ? ast::NewEllipsis() : ast::NewEllipsis(elem);
      s->Add(n, CoreType::kArray, ast::NewList({ellipsis}));
      return;
    }
    case kListKind: {
      if (!VersionsTo(Version::kDraft2019_09).Contains(s->info.schema_version)) {
        s->Errorf(
            n,
            "from version " + VersionString(Version::kDraft2020_12) +
                " onwards, the value of \"items\" must be an object or a boolean"
        );
        return;
      }
      s->list_items_is_array = true;
      s->has_prefix_items = true;
      s->list_pos = n;
      for (const auto& item : s->ListItems(key, n, true)) {
        s->prefix_items.push_back(s->Schema(item));
      }
      return;
    }
    default:
      s->Errorf(n, "value of \"items\" must be an object, array or boolean");
  }
}

void ConstraintAdditionalItems(const std::string& key, const JSONNode& n, SchemaState* s) {
  // Without an array valued items, additionalItems has no effect.
  if (!s->list_items_is_array) return;
  switch (n.GetKind()) {
    case kStructKind:
    case kBoolKind:
      SetRestItems(n, s);
      return;
    default:
      s->Errorf(n, "value of \"additionalItems\" must be an object or boolean");
  }
}

void ConstraintContains(const std::string& key, const JSONNode& n, SchemaState* s) {
  auto elem = s->Schema(n);
  uint64_t min = s->min_contains ? *s->min_contains : 1;
  ast::ExprPtr count = ast::NewUnary(ast::Token::kGeq, UintLit(min));
  if (s->max_contains) {
    count = ast::NewBinary(
        ast::Token::kAnd, count, ast::NewUnary(ast::Token::kLeq, UintLit(*s->max_contains))
    );
  }
  s->Add(n, CoreType::kArray, ast::NewPkgCall("list", "MatchN", {count, elem}));
}

void ConstraintMinContains(const std::string& key, const JSONNode& n, SchemaState* s) {
  uint64_t min = 0;
  if (s->UintValue(n, &min)) s->min_contains = min;
}

void ConstraintMaxContains(const std::string& key, const JSONNode& n, SchemaState* s) {
  uint64_t max = 0;
  if (s->UintValue(n, &max)) s->max_contains = max;
}

void ConstraintMinItems(const std::string& key, const JSONNode& n, SchemaState* s) {
  uint64_t min = 0;
  if (!s->UintValue(n, &min)) return;
  s->Add(n, CoreType::kArray, ast::NewPkgCall("list", "MinItems", {UintLit(min)}));
}

void ConstraintMaxItems(const std::string& key, const JSONNode& n, SchemaState* s) {
  uint64_t max = 0;
  if (!s->UintValue(n, &max)) return;
  s->Add(n, CoreType::kArray, ast::NewPkgCall("list", "MaxItems", {UintLit(max)}));
}

void ConstraintUniqueItems(const std::string& key, const JSONNode& n, SchemaState* s) {
  bool unique = false;
  if (s->BoolValue(n, &unique) && unique) {
    s->Add(n, CoreType::kArray, ast::NewPkgCall("list", "UniqueItems", {}));
  }
}

}  // namespace xschema
