/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/schema_item.cc
 * \brief Interning, rewrite passes and rendering of SchemaItem.
 */
#include "schema_item.h"

#include <algorithm>
#include <cstdlib>
#include <set>
#include <type_traits>
#include <unordered_map>

#include "json_pointer.h"
#include "support/logging.h"
#include "support/utils.h"

namespace xschema {

// ==================== Cache keys ====================

namespace {

std::string ChildKey(const SchemaItemPtr& item) {
  return item ? "#" + std::to_string(item->id) : "-";
}

std::string ChildrenKey(const std::vector<SchemaItemPtr>& elems) {
  std::vector<std::string> keys;
  keys.reserve(elems.size());
  for (const auto& elem : elems) keys.push_back(ChildKey(elem));
  return Join(keys, ",");
}

std::string NamedChildrenKey(const std::vector<std::pair<std::string, SchemaItemPtr>>& elems) {
  std::vector<std::string> keys;
  keys.reserve(elems.size());
  for (const auto& [name, elem] : elems) keys.push_back(Quote(name) + ":" + ChildKey(elem));
  return Join(keys, ",");
}

std::string OptionalKey(const std::optional<int64_t>& n) {
  return n.has_value() ? std::to_string(*n) : "-";
}

}  // namespace

std::string ItemCacheKey(const SchemaItemVariant& node) {
  return std::visit(
      [](const auto& item) -> std::string {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, TrueItem>) {
          return "true";
        } else if constexpr (std::is_same_v<T, FalseItem>) {
          return "false";
        } else if constexpr (std::is_same_v<T, TypeItem>) {
          return "type(" + Join(item.kinds, ",") + ")";
        } else if constexpr (std::is_same_v<T, BoundsItem>) {
          return "bounds(" + std::to_string(static_cast<int>(item.op)) + "," + item.n + ")";
        } else if constexpr (std::is_same_v<T, MultipleOfItem>) {
          return "multipleOf(" + item.n + ")";
        } else if constexpr (std::is_same_v<T, LengthBoundsItem>) {
          return "length(" + std::to_string(static_cast<int>(item.op)) + "," +
                 std::to_string(item.n) + ")";
        } else if constexpr (std::is_same_v<T, ItemsBoundsItem>) {
          return "itemsBounds(" + std::to_string(static_cast<int>(item.op)) + "," +
                 std::to_string(item.n) + ")";
        } else if constexpr (std::is_same_v<T, PropertyBoundsItem>) {
          return "propertyBounds(" + std::to_string(static_cast<int>(item.op)) + "," +
                 std::to_string(item.n) + ")";
        } else if constexpr (std::is_same_v<T, PatternItem>) {
          return "pattern(" + Quote(item.regexp) + ")";
        } else if constexpr (std::is_same_v<T, FormatItem>) {
          return "format(" + Quote(item.format) + ")";
        } else if constexpr (std::is_same_v<T, ConstItem>) {
          return "const(" + ast::FormatJSON(item.value, -1) + ")";
        } else if constexpr (std::is_same_v<T, EnumItem>) {
          std::vector<std::string> values;
          for (const auto& value : item.values) values.push_back(ast::FormatJSON(value, -1));
          return "enum(" + Join(values, ",") + ")";
        } else if constexpr (std::is_same_v<T, AllOfItem>) {
          return "allOf(" + ChildrenKey(item.elems) + ")";
        } else if constexpr (std::is_same_v<T, AnyOfItem>) {
          return "anyOf(" + ChildrenKey(item.elems) + ")";
        } else if constexpr (std::is_same_v<T, OneOfItem>) {
          return "oneOf(" + ChildrenKey(item.elems) + ")";
        } else if constexpr (std::is_same_v<T, NotItem>) {
          return "not(" + ChildKey(item.elem) + ")";
        } else if constexpr (std::is_same_v<T, RefItem>) {
          return "ref(" + Quote(item.name) + ")";
        } else if constexpr (std::is_same_v<T, PropertiesItem>) {
          std::vector<std::string> required;
          for (const auto& name : item.required) required.push_back(Quote(name));
          return "properties({" + NamedChildrenKey(item.properties) + "},[" +
                 Join(required, ",") + "],{" + NamedChildrenKey(item.pattern_properties) + "}," +
                 ChildKey(item.additional) + ")";
        } else if constexpr (std::is_same_v<T, PropertyNamesItem>) {
          return "propertyNames(" + ChildKey(item.elem) + ")";
        } else if constexpr (std::is_same_v<T, ItemsItem>) {
          return "items([" + ChildrenKey(item.prefix) + "]," + ChildKey(item.rest) + ")";
        } else if constexpr (std::is_same_v<T, ContainsItem>) {
          return "contains(" + ChildKey(item.elem) + "," + OptionalKey(item.min) + "," +
                 OptionalKey(item.max) + ")";
        } else if constexpr (std::is_same_v<T, UniqueItemsItem>) {
          return "uniqueItems";
        } else if constexpr (std::is_same_v<T, IfThenElseItem>) {
          return "if(" + ChildKey(item.if_elem) + "," + ChildKey(item.then_elem) + "," +
                 ChildKey(item.else_elem) + ")";
        }
      },
      node
  );
}

// ==================== ItemStore ====================

SchemaItemPtr ItemStore::Make(SchemaItemVariant node) {
  std::string key = ItemCacheKey(node);
  auto it = items_.find(key);
  if (it != items_.end()) return it->second;
  auto item = std::make_shared<SchemaItem>();
  item->node = std::move(node);
  item->cache_key = key;
  item->id = static_cast<int>(items_.size());
  items_.emplace(std::move(key), item);
  return item;
}

namespace {

using ItemFunc = std::function<SchemaItemPtr(const SchemaItemPtr&)>;

SchemaItemPtr ApplyOne(const SchemaItemPtr& item, const ItemFunc& f, bool* changed) {
  if (!item) return item;
  SchemaItemPtr result = f(item);
  if (result != item) *changed = true;
  return result;
}

std::vector<SchemaItemPtr> ApplyElems(
    const std::vector<SchemaItemPtr>& elems, const ItemFunc& f, bool* changed
) {
  std::vector<SchemaItemPtr> result;
  result.reserve(elems.size());
  for (const auto& elem : elems) result.push_back(ApplyOne(elem, f, changed));
  return result;
}

std::vector<std::pair<std::string, SchemaItemPtr>> ApplyNamed(
    const std::vector<std::pair<std::string, SchemaItemPtr>>& elems, const ItemFunc& f, bool* changed
) {
  std::vector<std::pair<std::string, SchemaItemPtr>> result;
  result.reserve(elems.size());
  for (const auto& [name, elem] : elems) result.emplace_back(name, ApplyOne(elem, f, changed));
  return result;
}

}  // namespace

SchemaItemPtr ItemStore::Apply(const SchemaItemPtr& item, const ItemFunc& f) {
  bool changed = false;
  SchemaItemVariant node = std::visit(
      [&](const auto& it) -> SchemaItemVariant {
        using T = std::decay_t<decltype(it)>;
        if constexpr (std::is_same_v<T, AllOfItem> || std::is_same_v<T, AnyOfItem> ||
                      std::is_same_v<T, OneOfItem>) {
          return T{ApplyElems(it.elems, f, &changed)};
        } else if constexpr (std::is_same_v<T, NotItem> || std::is_same_v<T, PropertyNamesItem>) {
          return T{ApplyOne(it.elem, f, &changed)};
        } else if constexpr (std::is_same_v<T, PropertiesItem>) {
          PropertiesItem result;
          result.properties = ApplyNamed(it.properties, f, &changed);
          result.required = it.required;
          result.pattern_properties = ApplyNamed(it.pattern_properties, f, &changed);
          result.additional = ApplyOne(it.additional, f, &changed);
          return result;
        } else if constexpr (std::is_same_v<T, ItemsItem>) {
          return ItemsItem{ApplyElems(it.prefix, f, &changed), ApplyOne(it.rest, f, &changed)};
        } else if constexpr (std::is_same_v<T, ContainsItem>) {
          return ContainsItem{ApplyOne(it.elem, f, &changed), it.min, it.max};
        } else if constexpr (std::is_same_v<T, IfThenElseItem>) {
          SchemaItemPtr if_elem = ApplyOne(it.if_elem, f, &changed);
          SchemaItemPtr then_elem = ApplyOne(it.then_elem, f, &changed);
          SchemaItemPtr else_elem = ApplyOne(it.else_elem, f, &changed);
          return IfThenElseItem{if_elem, then_elem, else_elem};
        } else {
          return it;
        }
      },
      item->node
  );
  if (!changed) return item;
  return Make(std::move(node));
}

// ==================== Rewrite passes ====================

namespace {

void CollectConjuncts(const SchemaItemPtr& item, std::vector<SchemaItemPtr>* conjuncts) {
  for (const auto& elem : item->As<AllOfItem>().elems) {
    if (elem->Is<AllOfItem>()) {
      CollectConjuncts(elem, conjuncts);
    } else {
      conjuncts->push_back(elem);
    }
  }
}

}  // namespace

SchemaItemPtr MergeAllOf(ItemStore* store, const SchemaItemPtr& item) {
  if (!item->Is<AllOfItem>()) {
    return store->Apply(item, [store](const SchemaItemPtr& elem) {
      return MergeAllOf(store, elem);
    });
  }
  std::vector<SchemaItemPtr> conjuncts;
  CollectConjuncts(item, &conjuncts);
  std::vector<SchemaItemPtr> elems;
  for (const auto& conjunct : conjuncts) {
    SchemaItemPtr merged = MergeAllOf(store, conjunct);
    // Interned items are equal exactly when they are the same object.
    if (std::find(elems.begin(), elems.end(), merged) == elems.end()) {
      elems.push_back(merged);
    }
  }
  if (elems.empty()) return store->True();
  if (elems.size() == 1) return elems[0];
  return store->Make(AllOfItem{std::move(elems)});
}

SchemaItemPtr EnumFromConst(ItemStore* store, const SchemaItemPtr& item) {
  if (item->Is<AnyOfItem>()) {
    const auto& elems = item->As<AnyOfItem>().elems;
    bool all_const = !elems.empty() && std::all_of(elems.begin(), elems.end(), [](const auto& e) {
      return e->template Is<ConstItem>();
    });
    if (all_const) {
      EnumItem result;
      for (const auto& elem : elems) result.values.push_back(elem->As<ConstItem>().value);
      return store->Make(std::move(result));
    }
  }
  return store->Apply(item, [store](const SchemaItemPtr& elem) {
    return EnumFromConst(store, elem);
  });
}

// ==================== Rendering ====================

namespace {

const std::vector<std::vector<std::string>>& KeywordGroups() {
  static const std::vector<std::vector<std::string>> groups = {
      {"properties", "patternProperties", "additionalProperties"},
      {"contains", "maxContains", "minContains"},
      {"items", "additionalItems", "prefixItems"},
      {"if", "then", "else"},
  };
  return groups;
}

int KeywordPriority(const std::string& keyword) {
  static const std::unordered_map<std::string, int> priorities = [] {
    std::unordered_map<std::string, int> result = {{"$schema", 0}, {"$defs", 1}, {"type", 2}};
    int n = static_cast<int>(result.size());
    const auto& groups = KeywordGroups();
    for (int i = 0; i < static_cast<int>(groups.size()); ++i) {
      for (const auto& name : groups[i]) result[name] = n + i + 1;
    }
    return result;
  }();
  auto it = priorities.find(keyword);
  return it == priorities.end() ? 1000 : it->second;
}

const std::string& FieldName(const ast::DeclPtr& decl) {
  XSCHEMA_ICHECK(decl->Is<ast::Field>()) << "Unexpected element in a rendered schema";
  return decl->As<ast::Field>().label.name;
}

ast::ExprPtr SingleKeyword(const std::string& name, ast::ExprPtr value) {
  return MakeSchemaStruct({{name, std::move(value)}});
}

ast::ExprPtr RenderList(const std::vector<SchemaItemPtr>& elems) {
  std::vector<ast::ExprPtr> exprs;
  exprs.reserve(elems.size());
  for (const auto& elem : elems) exprs.push_back(RenderItem(elem));
  return ast::NewList(std::move(exprs));
}

ast::ExprPtr RenderNamed(const std::vector<std::pair<std::string, SchemaItemPtr>>& elems) {
  std::vector<ast::DeclPtr> fields;
  fields.reserve(elems.size());
  for (const auto& [name, elem] : elems) {
    fields.push_back(ast::NewField(ast::Label::String(name), RenderItem(elem)));
  }
  return ast::NewStruct(std::move(fields));
}

// Integer literals keep all their digits; other numbers are normalized.
ast::ExprPtr NumberLit(const std::string& text) {
  if (text.find_first_of(".eE") == std::string::npos) return ast::NewLit(ast::Token::kInt, text);
  return ast::NewFloat(std::strtod(text.c_str(), nullptr));
}

const char* BoundsKeyword(Op op) {
  switch (op) {
    case Op::kLessThan:
      return "exclusiveMaximum";
    case Op::kLessThanEqual:
      return "maximum";
    case Op::kGreaterThan:
      return "exclusiveMinimum";
    case Op::kGreaterThanEqual:
      return "minimum";
    default:
      XSCHEMA_LOG(FATAL) << "Unexpected bound operator " << static_cast<int>(op);
  }
  XSCHEMA_UNREACHABLE();
}

const char* SizeKeyword(Op op, const char* min_keyword, const char* max_keyword) {
  switch (op) {
    case Op::kGreaterThanEqual:
      return min_keyword;
    case Op::kLessThanEqual:
      return max_keyword;
    default:
      XSCHEMA_LOG(FATAL) << "Unexpected size operator " << static_cast<int>(op) << " for "
                         << min_keyword;
  }
  XSCHEMA_UNREACHABLE();
}

/*!
 * \brief A schema object is itself a conjunction, so the members of allOf are merged into one
 * object where no keyword repeats and no keywords interact.
 */
ast::ExprPtr RenderAllOf(const AllOfItem& item) {
  std::vector<ast::ExprPtr> unmerged;
  std::vector<std::pair<std::string, ast::ExprPtr>> merged;
  std::set<std::string> merged_names;

  for (const auto& elem : item.elems) {
    ast::ExprPtr expr = RenderItem(elem);
    if (expr->Is<ast::BasicLit>()) {
      ast::Token kind = expr->As<ast::BasicLit>().kind;
      if (kind == ast::Token::kTrue) continue;
      if (kind == ast::Token::kFalse) return expr;
    }
    XSCHEMA_ICHECK(expr->Is<ast::StructLit>()) << "A schema must render as a bool or a struct";

    bool avoid_merging = false;
    for (const auto& decl : expr->As<ast::StructLit>().elts) {
      const std::string& name = FieldName(decl);
      if (merged_names.count(name)) {
        avoid_merging = true;
        break;
      }
      for (const auto& other : KeywordInteractions(name)) {
        if (merged_names.count(other)) {
          avoid_merging = true;
          break;
        }
      }
      if (avoid_merging) break;
    }
    if (avoid_merging) {
      unmerged.push_back(expr);
      continue;
    }
    for (const auto& decl : expr->As<ast::StructLit>().elts) {
      merged_names.insert(FieldName(decl));
      merged.emplace_back(FieldName(decl), decl->As<ast::Field>().value);
    }
  }

  if (unmerged.empty()) return MakeSchemaStruct(std::move(merged));
  if (!merged.empty()) unmerged.push_back(MakeSchemaStruct(std::move(merged)));
  return SingleKeyword("allOf", ast::NewList(std::move(unmerged)));
}

ast::ExprPtr RenderProperties(const PropertiesItem& item) {
  std::vector<std::pair<std::string, ast::ExprPtr>> fields;
  if (!item.properties.empty()) {
    fields.emplace_back("properties", RenderNamed(item.properties));
  }
  if (!item.required.empty()) {
    std::vector<ast::ExprPtr> names;
    for (const auto& name : item.required) names.push_back(ast::NewString(name));
    fields.emplace_back("required", ast::NewList(std::move(names)));
  }
  if (item.additional) {
    fields.emplace_back("additionalProperties", RenderItem(item.additional));
  }
  if (!item.pattern_properties.empty()) {
    fields.emplace_back("patternProperties", RenderNamed(item.pattern_properties));
  }
  return MakeSchemaStruct(std::move(fields));
}

}  // namespace

const std::vector<std::string>& KeywordInteractions(const std::string& keyword) {
  static const std::vector<std::string> kNone;
  for (const auto& group : KeywordGroups()) {
    if (std::find(group.begin(), group.end(), keyword) != group.end()) return group;
  }
  return kNone;
}

bool SchemaKeywordLess(const std::string& lhs, const std::string& rhs) {
  int lhs_priority = KeywordPriority(lhs);
  int rhs_priority = KeywordPriority(rhs);
  if (lhs_priority != rhs_priority) return lhs_priority < rhs_priority;
  return lhs < rhs;
}

ast::ExprPtr MakeSchemaStruct(std::vector<std::pair<std::string, ast::ExprPtr>> fields) {
  std::stable_sort(fields.begin(), fields.end(), [](const auto& lhs, const auto& rhs) {
    return SchemaKeywordLess(lhs.first, rhs.first);
  });
  std::vector<ast::DeclPtr> decls;
  decls.reserve(fields.size());
  for (auto& [name, value] : fields) {
    decls.push_back(ast::NewField(ast::Label::String(name), std::move(value)));
  }
  return ast::NewStruct(std::move(decls));
}

ast::ExprPtr RenderItem(const SchemaItemPtr& item) {
  XSCHEMA_ICHECK(item != nullptr) << "Rendering a missing schema item";
  return std::visit(
      [](const auto& it) -> ast::ExprPtr {
        using T = std::decay_t<decltype(it)>;
        if constexpr (std::is_same_v<T, TrueItem>) {
          return ast::NewBool(true);
        } else if constexpr (std::is_same_v<T, FalseItem>) {
          return ast::NewBool(false);
        } else if constexpr (std::is_same_v<T, TypeItem>) {
          if (it.kinds.size() == 1) return SingleKeyword("type", ast::NewString(it.kinds[0]));
          std::vector<ast::ExprPtr> kinds;
          for (const auto& kind : it.kinds) kinds.push_back(ast::NewString(kind));
          return SingleKeyword("type", ast::NewList(std::move(kinds)));
        } else if constexpr (std::is_same_v<T, BoundsItem>) {
          return SingleKeyword(BoundsKeyword(it.op), NumberLit(it.n));
        } else if constexpr (std::is_same_v<T, MultipleOfItem>) {
          return SingleKeyword("multipleOf", NumberLit(it.n));
        } else if constexpr (std::is_same_v<T, LengthBoundsItem>) {
          return SingleKeyword(SizeKeyword(it.op, "minLength", "maxLength"), ast::NewInt(it.n));
        } else if constexpr (std::is_same_v<T, ItemsBoundsItem>) {
          return SingleKeyword(SizeKeyword(it.op, "minItems", "maxItems"), ast::NewInt(it.n));
        } else if constexpr (std::is_same_v<T, PropertyBoundsItem>) {
          return SingleKeyword(
              SizeKeyword(it.op, "minProperties", "maxProperties"), ast::NewInt(it.n)
          );
        } else if constexpr (std::is_same_v<T, PatternItem>) {
          return SingleKeyword("pattern", ast::NewString(it.regexp));
        } else if constexpr (std::is_same_v<T, FormatItem>) {
          return SingleKeyword("format", ast::NewString(it.format));
        } else if constexpr (std::is_same_v<T, ConstItem>) {
          return SingleKeyword("const", it.value);
        } else if constexpr (std::is_same_v<T, EnumItem>) {
          return SingleKeyword("enum", ast::NewList(it.values));
        } else if constexpr (std::is_same_v<T, AllOfItem>) {
          return RenderAllOf(it);
        } else if constexpr (std::is_same_v<T, AnyOfItem>) {
          return SingleKeyword("anyOf", RenderList(it.elems));
        } else if constexpr (std::is_same_v<T, OneOfItem>) {
          return SingleKeyword("oneOf", RenderList(it.elems));
        } else if constexpr (std::is_same_v<T, NotItem>) {
          return SingleKeyword("not", RenderItem(it.elem));
        } else if constexpr (std::is_same_v<T, RefItem>) {
          return SingleKeyword("$ref", ast::NewString("#/$defs/" + EscapeJSONPointerToken(it.name)));
        } else if constexpr (std::is_same_v<T, PropertiesItem>) {
          return RenderProperties(it);
        } else if constexpr (std::is_same_v<T, PropertyNamesItem>) {
          return SingleKeyword("propertyNames", RenderItem(it.elem));
        } else if constexpr (std::is_same_v<T, ItemsItem>) {
          std::vector<std::pair<std::string, ast::ExprPtr>> fields;
          if (!it.prefix.empty()) fields.emplace_back("prefixItems", RenderList(it.prefix));
          if (it.rest) fields.emplace_back("items", RenderItem(it.rest));
          return MakeSchemaStruct(std::move(fields));
        } else if constexpr (std::is_same_v<T, ContainsItem>) {
          std::vector<std::pair<std::string, ast::ExprPtr>> fields;
          fields.emplace_back("contains", RenderItem(it.elem));
          if (it.min.has_value()) fields.emplace_back("minContains", ast::NewInt(*it.min));
          if (it.max.has_value()) fields.emplace_back("maxContains", ast::NewInt(*it.max));
          return MakeSchemaStruct(std::move(fields));
        } else if constexpr (std::is_same_v<T, UniqueItemsItem>) {
          return SingleKeyword("uniqueItems", ast::NewBool(true));
        } else if constexpr (std::is_same_v<T, IfThenElseItem>) {
          std::vector<std::pair<std::string, ast::ExprPtr>> fields;
          fields.emplace_back("if", RenderItem(it.if_elem));
          if (it.then_elem) fields.emplace_back("then", RenderItem(it.then_elem));
          if (it.else_elem) fields.emplace_back("else", RenderItem(it.else_elem));
          return MakeSchemaStruct(std::move(fields));
        }
      },
      item->node
  );
}

}  // namespace xschema
