/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/schema_item.h
 * \brief The intermediate representation of JSON Schema constraints used by Generate, its
 * rewrite passes and its rendering.
 */
#ifndef XSCHEMA_SCHEMA_ITEM_H_
#define XSCHEMA_SCHEMA_ITEM_H_

#include <xschema/ast.h>
#include <xschema/value.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace xschema {

// ==================== SchemaItem: Intermediate Representation of JSON Schema ====================

struct SchemaItem;
/*! \brief Items are immutable and interned; two equal items share one pointer. */
using SchemaItemPtr = std::shared_ptr<const SchemaItem>;

/*! \brief Accepts everything. */
struct TrueItem {};

/*! \brief Accepts nothing. */
struct FalseItem {};

struct TypeItem {
  /*! \brief JSON Schema type names: null, boolean, string, integer, number, array, object. */
  std::vector<std::string> kinds;
};

/*! \brief minimum, maximum, exclusiveMinimum or exclusiveMaximum. */
/*! \brief The bound is the number literal text, so that large integers stay exact. */
struct BoundsItem {
  Op op = Op::kGreaterThanEqual;
  std::string n;
};

struct MultipleOfItem {
  std::string n;
};

/*! \brief minLength (kGreaterThanEqual) or maxLength (kLessThanEqual). */
struct LengthBoundsItem {
  Op op = Op::kGreaterThanEqual;
  int64_t n = 0;
};

/*! \brief minItems or maxItems. */
struct ItemsBoundsItem {
  Op op = Op::kGreaterThanEqual;
  int64_t n = 0;
};

/*! \brief minProperties or maxProperties. */
struct PropertyBoundsItem {
  Op op = Op::kGreaterThanEqual;
  int64_t n = 0;
};

struct PatternItem {
  std::string regexp;
};

struct FormatItem {
  std::string format;
};

/*! \brief A constant. The value is a JSON-shaped expression. */
struct ConstItem {
  ast::ExprPtr value;
};

struct EnumItem {
  std::vector<ast::ExprPtr> values;
};

struct AllOfItem {
  std::vector<SchemaItemPtr> elems;
};

struct AnyOfItem {
  std::vector<SchemaItemPtr> elems;
};

struct OneOfItem {
  std::vector<SchemaItemPtr> elems;
};

struct NotItem {
  SchemaItemPtr elem;
};

/*! \brief A reference to an entry of `$defs`. */
struct RefItem {
  std::string name;
};

/*! \brief properties, required, patternProperties and additionalProperties. */
struct PropertiesItem {
  /*! \brief Sorted by name. */
  std::vector<std::pair<std::string, SchemaItemPtr>> properties;
  std::vector<std::string> required;
  /*! \brief Sorted by pattern. */
  std::vector<std::pair<std::string, SchemaItemPtr>> pattern_properties;
  /*! \brief nullptr when absent. */
  SchemaItemPtr additional;
};

struct PropertyNamesItem {
  SchemaItemPtr elem;
};

/*! \brief prefixItems and items. */
struct ItemsItem {
  std::vector<SchemaItemPtr> prefix;
  /*! \brief The elements beyond the prefix; nullptr when absent. */
  SchemaItemPtr rest;
};

/*! \brief contains, minContains and maxContains. */
struct ContainsItem {
  SchemaItemPtr elem;
  std::optional<int64_t> min;
  std::optional<int64_t> max;
};

struct UniqueItemsItem {};

/*! \brief if, then and else. Absent branches are nullptr. */
struct IfThenElseItem {
  SchemaItemPtr if_elem;
  SchemaItemPtr then_elem;
  SchemaItemPtr else_elem;
};

using SchemaItemVariant = std::variant<
    TrueItem,
    FalseItem,
    TypeItem,
    BoundsItem,
    MultipleOfItem,
    LengthBoundsItem,
    ItemsBoundsItem,
    PropertyBoundsItem,
    PatternItem,
    FormatItem,
    ConstItem,
    EnumItem,
    AllOfItem,
    AnyOfItem,
    OneOfItem,
    NotItem,
    RefItem,
    PropertiesItem,
    PropertyNamesItem,
    ItemsItem,
    ContainsItem,
    UniqueItemsItem,
    IfThenElseItem>;

struct SchemaItem {
  SchemaItemVariant node;
  /*! \brief The structural key; equal items have equal keys. Children appear by id. */
  std::string cache_key;
  /*! \brief The id assigned by the store that interned the item. */
  int id = -1;

  template <typename T>
  bool Is() const {
    return std::holds_alternative<T>(node);
  }
  template <typename T>
  const T& As() const {
    return std::get<T>(node);
  }
};

/*!
 * \brief Interns items so that equal items are one object. Equality of interned items is pointer
 * equality.
 */
class ItemStore {
 public:
  /*! \brief The interned item for the node. */
  SchemaItemPtr Make(SchemaItemVariant node);

  SchemaItemPtr True() { return Make(TrueItem{}); }
  SchemaItemPtr False() { return Make(FalseItem{}); }

  /*!
   * \brief Rebuild the item with f applied to each of its direct children. f is not applied to
   * the item itself. Returns the same pointer when no child changes.
   */
  SchemaItemPtr Apply(
      const SchemaItemPtr& item, const std::function<SchemaItemPtr(const SchemaItemPtr&)>& f
  );

  /*! \brief The number of distinct items. */
  size_t Size() const { return items_.size(); }

 private:
  std::unordered_map<std::string, SchemaItemPtr> items_;
};

/*! \brief The structural key of a node; children must be interned. */
std::string ItemCacheKey(const SchemaItemVariant& node);

// ==================== Rewrite passes ====================

/*!
 * \brief Flatten nested allOf items into one, drop duplicate conjuncts and collapse an allOf with
 * a single conjunct to that conjunct. Applied throughout the tree.
 */
SchemaItemPtr MergeAllOf(ItemStore* store, const SchemaItemPtr& item);

/*! \brief Replace each anyOf whose members are all constants with an enum. */
SchemaItemPtr EnumFromConst(ItemStore* store, const SchemaItemPtr& item);

// ==================== Rendering ====================

/*!
 * \brief Render the item as a JSON-shaped expression: a boolean literal or a struct of keywords.
 * The members of allOf are merged into one object unless they share a keyword or keywords that
 * interact with each other. Keywords are sorted by SchemaKeywordLess.
 */
ast::ExprPtr RenderItem(const SchemaItemPtr& item);

/*!
 * \brief The order of keywords in a rendered schema: `$schema`, `$defs` and `type` first, then the
 * groups of interacting keywords, then the rest in lexical order.
 */
bool SchemaKeywordLess(const std::string& lhs, const std::string& rhs);

/*! \brief A struct of the fields, sorted by SchemaKeywordLess. */
ast::ExprPtr MakeSchemaStruct(std::vector<std::pair<std::string, ast::ExprPtr>> fields);

/*! \brief The keywords that interact with the keyword, including itself. Empty for others. */
const std::vector<std::string>& KeywordInteractions(const std::string& keyword);

}  // namespace xschema

#endif  // XSCHEMA_SCHEMA_ITEM_H_
