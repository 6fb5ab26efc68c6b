/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/value.h
 * \brief A read-only view of a type language value, used as the input of Generate.
 */
#ifndef XSCHEMA_VALUE_H_
#define XSCHEMA_VALUE_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ast.h"
#include "exception.h"

namespace xschema {

/*!
 * \brief A set of value kinds, as a bitset.
 */
using Kind = uint32_t;

constexpr Kind kBottomKind = 0;
constexpr Kind kNullKind = 1u << 0;
constexpr Kind kBoolKind = 1u << 1;
constexpr Kind kIntKind = 1u << 2;
constexpr Kind kFloatKind = 1u << 3;
constexpr Kind kStringKind = 1u << 4;
constexpr Kind kBytesKind = 1u << 5;
constexpr Kind kListKind = 1u << 6;
constexpr Kind kStructKind = 1u << 7;
constexpr Kind kNumberKind = kIntKind | kFloatKind;
constexpr Kind kTopKind = kNullKind | kBoolKind | kNumberKind | kStringKind | kBytesKind |
                          kListKind | kStructKind;

/*! \brief The kinds as a readable list, e.g. "int|string". */
std::string KindString(Kind kind);

/*! \brief The operator at the top of a value's expression. */
enum class Op : int {
  kNoOp = 0,
  kAnd = 1,
  kOr = 2,
  kLessThan = 3,
  kLessThanEqual = 4,
  kGreaterThan = 5,
  kGreaterThanEqual = 6,
  kNotEqual = 7,
  kRegexMatch = 8,
  kNotRegexMatch = 9,
  kCall = 10,
};

/*! \brief How a field is declared. */
enum class FieldConstraint : int {
  kRegular = 0,
  kOptional = 1,
  kRequired = 2,
};

/*! \brief Whether a struct admits fields it does not declare. */
enum class Openness : int {
  /*! \brief Open because nothing closes it. */
  kOpen = 0,
  /*! \brief Open because it ends with `...`. */
  kExplicitlyOpen = 1,
  /*! \brief Closed because it is declared inside a definition. */
  kImplicitlyClosed = 2,
  /*! \brief Closed by close(). */
  kExplicitlyClosed = 3,
};

struct FieldValue;
struct PatternValue;
struct ListValue;

/*!
 * \brief A value of the type language: an expression together with the scope its identifiers are
 * resolved in and the path it is found at.
 *
 * Identifiers resolve through the expression they are bound to, then through the enclosing fields
 * with identifier labels, then through the predeclared identifiers (string, int, number, int32,
 * ...), then through imports.
 */
class Value {
 public:
  /*! \brief A value that does not exist. */
  Value() = default;

  /*! \brief The value of a whole file: its declarations as one struct. */
  static Value FromFile(const ast::FilePtr& file);

  /*! \brief The value of a standalone expression. */
  static Value FromExpr(const ast::ExprPtr& expr);

  bool Exists() const { return expr_ != nullptr; }

  const ast::ExprPtr& Syntax() const { return expr_; }

  /*! \brief The path of the value from the root it was reached from. */
  const ast::Path& Path() const { return path_; }

  /*! \brief The kinds the value may still take. */
  Kind IncompleteKind() const;

  /*! \brief Whether the value is a single concrete value (a literal, or lists and structs of
   * them). */
  bool IsConcrete() const;

  /*!
   * \brief Decompose the value. And and Or return their flattened operands, comparisons and regex
   * matches their operand, calls the function followed by the arguments.
   */
  Op Expr(std::vector<Value>* args) const;

  /*!
   * \brief If the value is a reference to a field, get the root of the reference and the path of
   * the field from it.
   */
  bool ReferencePath(Value* root, ast::Path* path) const;

  /*! \brief Follow references until a value that is not a reference. */
  Value Eval() const;

  /*!
   * \brief The qualified name of a builtin: "close" or "matchN" for predeclared functions,
   * "strings.MinRunes" or "time.Time" for package members. Empty for other values.
   */
  std::string BuiltinName() const;

  /*! \brief The regular, optional and required data fields of a struct, in declaration order. */
  std::vector<FieldValue> Fields() const;

  /*! \brief The pattern constraints `[label]: value` of a struct, in declaration order. */
  std::vector<PatternValue> Patterns() const;

  Openness GetOpenness() const;

  /*! \brief The elements and the open tail of a list. */
  ListValue List() const;

  /*! \brief The same value, closed as if by close(). */
  Value Closed() const;

  bool ToInt64(int64_t* result) const;
  bool ToDouble(double* result) const;
  /*! \brief The text of a number literal with its sign, e.g. "-12" or "2.5". */
  bool ToNumberLiteral(std::string* result) const;
  bool ToString(std::string* result) const;

  /*! \brief Report references that cannot be resolved. */
  std::vector<SchemaDiagnostic> Validate() const;

 private:
  struct Scope;
  friend class ValueResolver;

  Value(
      ast::ExprPtr expr,
      std::shared_ptr<const Scope> scope,
      ast::Path path,
      bool in_definition
  )
      : expr_(std::move(expr)),
        scope_(std::move(scope)),
        path_(std::move(path)),
        in_definition_(in_definition) {}

  ast::ExprPtr expr_;
  std::shared_ptr<const Scope> scope_;
  ast::Path path_;
  bool in_definition_ = false;
  bool explicitly_closed_ = false;
  /*! \brief Whether only the fields of a struct are viewed, without its embedded values. */
  bool fields_only_ = false;
};

struct FieldValue {
  std::string name;
  FieldConstraint constraint;
  Value value;
};

struct PatternValue {
  Value label;
  Value value;
};

struct ListValue {
  std::vector<Value> prefix;
  /*! \brief Whether the list admits elements beyond the prefix. */
  bool open = false;
  /*! \brief The type of the elements beyond the prefix; does not exist for `...`. */
  Value rest;
};

}  // namespace xschema

#endif  // XSCHEMA_VALUE_H_
