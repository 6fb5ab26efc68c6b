/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/ast.h
 * \brief The syntax tree of the type language. Extract produces it, Generate consumes it through
 * xschema::Value, and the printer renders it as text.
 */
#ifndef XSCHEMA_AST_H_
#define XSCHEMA_AST_H_

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace xschema {
namespace ast {

/*! \brief Literal kinds, operators and field markers. */
enum class Token : int {
  kIllegal = 0,
  // Literal kinds
  kNull = 1,
  kTrue = 2,
  kFalse = 3,
  kInt = 4,
  kFloat = 5,
  kString = 6,
  // Operators
  kAnd = 10,   // &
  kOr = 11,    // |
  kLss = 12,   // <
  kLeq = 13,   // <=
  kGtr = 14,   // >
  kGeq = 15,   // >=
  kNeq = 16,   // !=
  kMat = 17,   // =~
  kNmat = 18,  // !~
  kNot = 19,   // ! (also the required field marker)
  kSub = 20,   // -
  kMul = 21,   // * (default marker)
  kOption = 22,  // ? (optional field marker)
};

/*! \brief The source text of an operator or marker token. */
const char* TokenString(Token token);

/****************** Paths ******************/

/*!
 * \brief One step in a path. Definitions (#x), hidden fields (_x) and hidden definitions (_#x)
 * carry their prefix in the name; string selectors hold the plain field name.
 */
class Selector {
 public:
  enum class Type : int {
    kString = 0,
    kDefinition = 1,
    kHidden = 2,
    kHiddenDefinition = 3,
  };

  Selector() = default;

  static Selector Str(const std::string& name) { return Selector(Type::kString, name); }

  /*! \brief A selector for an identifier label; the type follows the identifier's prefix. */
  static Selector Ident(const std::string& name);

  Type GetType() const { return type_; }
  const std::string& Name() const { return name_; }
  bool IsString() const { return type_ == Type::kString; }

  /*! \brief The selector as written in a path: identifiers as is, other strings quoted. */
  std::string String() const;

  friend bool operator==(const Selector& lhs, const Selector& rhs) {
    return lhs.type_ == rhs.type_ && lhs.name_ == rhs.name_;
  }
  friend bool operator!=(const Selector& lhs, const Selector& rhs) { return !(lhs == rhs); }
  /*! \brief Selectors order by type first, then by text. */
  friend bool operator<(const Selector& lhs, const Selector& rhs);

 private:
  Selector(Type type, std::string name) : type_(type), name_(std::move(name)) {}

  Type type_ = Type::kString;
  std::string name_;
};

using Path = std::vector<Selector>;

/*! \brief The path as written in the type language, e.g. `#foo."a-b".c`. */
std::string PathString(const Path& path);

/****************** Expressions ******************/

struct Expr;
struct Decl;
using ExprPtr = std::shared_ptr<Expr>;
using DeclPtr = std::shared_ptr<Decl>;

/*!
 * \brief An identifier. It may name an imported package, and it may be bound to the expression it
 * refers to; unbound identifiers are resolved by name.
 */
struct Ident {
  std::string name;
  /*! \brief The import path when the identifier is a package qualifier. */
  std::string import_path;
  /*! \brief The expression the identifier refers to, when bound. */
  std::weak_ptr<Expr> node;
};

/*!
 * \brief A literal. Strings hold their unquoted value, numbers their literal text, and null and
 * booleans their keyword.
 */
struct BasicLit {
  Token kind = Token::kIllegal;
  std::string value;
};

struct UnaryExpr {
  Token op = Token::kIllegal;
  ExprPtr x;
};

struct BinaryExpr {
  Token op = Token::kIllegal;
  ExprPtr x;
  ExprPtr y;
};

struct CallExpr {
  ExprPtr fun;
  std::vector<ExprPtr> args;
};

struct SelectorExpr {
  ExprPtr x;
  Selector sel;
};

struct IndexExpr {
  ExprPtr x;
  ExprPtr index;
};

/*! \brief `...` or `...T`, in a list or a struct. */
struct Ellipsis {
  ExprPtr type;
};

struct StructLit {
  std::vector<DeclPtr> elts;
};

/*! \brief A list literal. An Ellipsis element, if any, is the last one. */
struct ListLit {
  std::vector<ExprPtr> elts;
};

struct Expr {
  using Variant = std::variant<
      Ident,
      BasicLit,
      UnaryExpr,
      BinaryExpr,
      CallExpr,
      SelectorExpr,
      IndexExpr,
      StructLit,
      ListLit,
      Ellipsis>;

  Variant node;

  template <typename T>
  bool Is() const {
    return std::holds_alternative<T>(node);
  }
  template <typename T>
  const T& As() const {
    return std::get<T>(node);
  }
  template <typename T>
  T& As() {
    return std::get<T>(node);
  }
};

/****************** Declarations ******************/

/*! \brief A field label: an identifier, a quoted string, or a pattern constraint `[expr]`. */
struct Label {
  enum class Type : int {
    kIdent = 0,
    kString = 1,
    kPattern = 2,
  };

  Type type = Type::kString;
  std::string name;
  ExprPtr pattern;

  static Label Ident(const std::string& name) { return Label{Type::kIdent, name, nullptr}; }
  static Label String(const std::string& name) { return Label{Type::kString, name, nullptr}; }
  static Label Pattern(ExprPtr pattern) { return Label{Type::kPattern, "", std::move(pattern)}; }
  static Label FromSelector(const Selector& sel);
};

/*! \brief An attribute such as `@jsonschema(id="...")`, stored with its full text. */
struct Attribute {
  std::string text;
};

struct Field {
  Label label;
  /*! \brief kIllegal for a regular field, kOption for `?`, kNot for `!`. */
  Token constraint = Token::kIllegal;
  ExprPtr value;
  std::vector<Attribute> attrs;
  /*! \brief The doc comment, one line per '\n' separated line. */
  std::string doc;
};

struct EmbedDecl {
  ExprPtr expr;
};

struct Decl {
  using Variant = std::variant<Field, EmbedDecl, Ellipsis, Attribute>;

  Variant node;

  template <typename T>
  bool Is() const {
    return std::holds_alternative<T>(node);
  }
  template <typename T>
  const T& As() const {
    return std::get<T>(node);
  }
  template <typename T>
  T& As() {
    return std::get<T>(node);
  }
};

struct ImportSpec {
  std::string path;
  /*! \brief The package qualifier used to refer to the import. */
  std::string name;
};

struct File {
  std::string doc;
  std::string package;
  std::vector<ImportSpec> imports;
  std::vector<Attribute> attrs;
  std::vector<DeclPtr> decls;
};

using FilePtr = std::shared_ptr<File>;

/****************** Constructors ******************/

ExprPtr NewIdent(const std::string& name);
/*! \brief An identifier naming the package imported from import_path. */
ExprPtr NewImportIdent(const std::string& import_path, const std::string& name);
/*! \brief The top value `_`. */
ExprPtr NewTop();
ExprPtr NewNull();
ExprPtr NewBool(bool value);
ExprPtr NewString(const std::string& value);
ExprPtr NewInt(int64_t value);
ExprPtr NewFloat(double value);
ExprPtr NewLit(Token kind, const std::string& value);
ExprPtr NewUnary(Token op, ExprPtr x);
ExprPtr NewBinary(Token op, ExprPtr x, ExprPtr y);
/*! \brief Join the operands with op, left to right. Returns nullptr for an empty list. */
ExprPtr NewBinExpr(Token op, const std::vector<ExprPtr>& operands);
ExprPtr NewCall(ExprPtr fun, std::vector<ExprPtr> args);
ExprPtr NewSel(ExprPtr x, const Selector& sel);
/*! \brief A call of a function exported by the package imported from import_path. */
ExprPtr NewPkgCall(
    const std::string& import_path, const std::string& name, std::vector<ExprPtr> args
);
/*! \brief A reference to a value exported by the package imported from import_path. */
ExprPtr NewPkgSel(const std::string& import_path, const std::string& name);
ExprPtr NewStruct(std::vector<DeclPtr> elts = {});
ExprPtr NewList(std::vector<ExprPtr> elts = {});
ExprPtr NewEllipsis(ExprPtr type = nullptr);
/*! \brief `error(msg)`, the expression for a value that allows nothing. */
ExprPtr NewBottom(const std::string& msg);

DeclPtr NewField(Label label, ExprPtr value, Token constraint = Token::kIllegal);
DeclPtr NewEmbed(ExprPtr expr);
DeclPtr NewEllipsisDecl(ExprPtr type = nullptr);
DeclPtr NewAttributeDecl(const std::string& text);

/****************** Helpers ******************/

/*! \brief Whether str can be written as an identifier. */
bool IsValidIdent(const std::string& str);

/*! \brief Whether the identifier names a definition or a hidden field. */
bool IsDefOrHidden(const std::string& ident);

/*! \brief The shortest decimal text that reads back as value. Integral values print without a
 * fraction. */
std::string FormatNumber(double value);

/*! \brief Whether expr is the identifier with the given name. */
bool IsIdent(const ExprPtr& expr, const std::string& name);

/*!
 * \brief Fill file.imports with the packages referenced by the declarations, sorted by path.
 * \return The qualifiers that are used by more than one import path.
 */
std::vector<std::string> CollectImports(File* file);

/****************** Printer ******************/

/*! \brief Render the file as type language text. */
std::string Format(const File& file);

/*! \brief Render one expression as type language text. */
std::string FormatExpr(const ExprPtr& expr);

/*!
 * \brief Render a JSON-shaped expression (structs with string labels, lists and literals) as JSON
 * text. Field order is kept.
 * \param indent The indentation width. A negative value prints everything on one line.
 */
std::string FormatJSON(const ExprPtr& expr, int indent = 2);

}  // namespace ast
}  // namespace xschema

#endif  // XSCHEMA_AST_H_
