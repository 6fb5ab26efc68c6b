/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/ast.cc
 * \brief Constructors and helpers of the type language syntax tree.
 */
#include <xschema/ast.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <map>
#include <set>
#include <type_traits>

#include "support/logging.h"
#include "support/utils.h"

namespace xschema {
namespace ast {

const char* TokenString(Token token) {
  switch (token) {
    case Token::kNull:
      return "null";
    case Token::kTrue:
      return "true";
    case Token::kFalse:
      return "false";
    case Token::kAnd:
      return "&";
    case Token::kOr:
      return "|";
    case Token::kLss:
      return "<";
    case Token::kLeq:
      return "<=";
    case Token::kGtr:
      return ">";
    case Token::kGeq:
      return ">=";
    case Token::kNeq:
      return "!=";
    case Token::kMat:
      return "=~";
    case Token::kNmat:
      return "!~";
    case Token::kNot:
      return "!";
    case Token::kSub:
      return "-";
    case Token::kMul:
      return "*";
    case Token::kOption:
      return "?";
    default:
      return "";
  }
}

// ==================== Selector ====================

Selector Selector::Ident(const std::string& name) {
  if (StartsWith(name, "_#")) return Selector(Type::kHiddenDefinition, name);
  if (StartsWith(name, "#")) return Selector(Type::kDefinition, name);
  if (StartsWith(name, "_")) return Selector(Type::kHidden, name);
  return Selector(Type::kString, name);
}

std::string Selector::String() const {
  if (type_ != Type::kString) return name_;
  if (IsValidIdent(name_) && !IsDefOrHidden(name_)) return name_;
  return Quote(name_);
}

bool operator<(const Selector& lhs, const Selector& rhs) {
  if (lhs.type_ != rhs.type_) return lhs.type_ < rhs.type_;
  return lhs.String() < rhs.String();
}

std::string PathString(const Path& path) {
  std::string result;
  for (size_t i = 0; i < path.size(); ++i) {
    if (i != 0) result += ".";
    result += path[i].String();
  }
  return result;
}

Label Label::FromSelector(const Selector& sel) {
  return sel.IsString() ? Label::String(sel.Name()) : Label::Ident(sel.Name());
}

// ==================== Constructors ====================

namespace {

template <typename T>
ExprPtr MakeExpr(T&& node) {
  auto expr = std::make_shared<Expr>();
  expr->node = std::forward<T>(node);
  return expr;
}

template <typename T>
DeclPtr MakeDecl(T&& node) {
  auto decl = std::make_shared<Decl>();
  decl->node = std::forward<T>(node);
  return decl;
}

}  // namespace

ExprPtr NewIdent(const std::string& name) { return MakeExpr(ast::Ident{name, "", {}}); }

ExprPtr NewImportIdent(const std::string& import_path, const std::string& name) {
  return MakeExpr(ast::Ident{name, import_path, {}});
}

ExprPtr NewTop() { return NewIdent("_"); }

ExprPtr NewNull() { return NewLit(Token::kNull, "null"); }

ExprPtr NewBool(bool value) {
  return value ? NewLit(Token::kTrue, "true") : NewLit(Token::kFalse, "false");
}

ExprPtr NewString(const std::string& value) { return NewLit(Token::kString, value); }

ExprPtr NewInt(int64_t value) { return NewLit(Token::kInt, std::to_string(value)); }

ExprPtr NewFloat(double value) {
  std::string text = FormatNumber(value);
  bool is_int = text.find_first_of(".eE") == std::string::npos;
  return NewLit(is_int ? Token::kInt : Token::kFloat, text);
}

ExprPtr NewLit(Token kind, const std::string& value) { return MakeExpr(BasicLit{kind, value}); }

ExprPtr NewUnary(Token op, ExprPtr x) { return MakeExpr(UnaryExpr{op, std::move(x)}); }

ExprPtr NewBinary(Token op, ExprPtr x, ExprPtr y) {
  return MakeExpr(BinaryExpr{op, std::move(x), std::move(y)});
}

ExprPtr NewBinExpr(Token op, const std::vector<ExprPtr>& operands) {
  ExprPtr result;
  for (const auto& operand : operands) {
    result = result ? NewBinary(op, result, operand) : operand;
  }
  return result;
}

ExprPtr NewCall(ExprPtr fun, std::vector<ExprPtr> args) {
  return MakeExpr(CallExpr{std::move(fun), std::move(args)});
}

ExprPtr NewSel(ExprPtr x, const Selector& sel) { return MakeExpr(SelectorExpr{std::move(x), sel}); }

ExprPtr NewPkgCall(
    const std::string& import_path, const std::string& name, std::vector<ExprPtr> args
) {
  return NewCall(NewPkgSel(import_path, name), std::move(args));
}

ExprPtr NewPkgSel(const std::string& import_path, const std::string& name) {
  return NewSel(NewImportIdent(import_path, import_path), Selector::Str(name));
}

ExprPtr NewStruct(std::vector<DeclPtr> elts) { return MakeExpr(StructLit{std::move(elts)}); }

ExprPtr NewList(std::vector<ExprPtr> elts) { return MakeExpr(ListLit{std::move(elts)}); }

ExprPtr NewEllipsis(ExprPtr type) { return MakeExpr(Ellipsis{std::move(type)}); }

ExprPtr NewBottom(const std::string& msg) { return NewCall(NewIdent("error"), {NewString(msg)}); }

DeclPtr NewField(Label label, ExprPtr value, Token constraint) {
  Field field;
  field.label = std::move(label);
  field.value = std::move(value);
  field.constraint = constraint;
  return MakeDecl(std::move(field));
}

DeclPtr NewEmbed(ExprPtr expr) { return MakeDecl(EmbedDecl{std::move(expr)}); }

DeclPtr NewEllipsisDecl(ExprPtr type) { return MakeDecl(Ellipsis{std::move(type)}); }

DeclPtr NewAttributeDecl(const std::string& text) { return MakeDecl(Attribute{text}); }

// ==================== Helpers ====================

namespace {

bool IsLetter(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' || c >= 0x80;
}

bool IsDigit(unsigned char c) { return c >= '0' && c <= '9'; }

}  // namespace

bool IsValidIdent(const std::string& str) {
  if (str.empty()) return false;
  size_t pos = 0;
  bool consumed = false;
  if (str[pos] == '_') {
    ++pos;
    consumed = true;
    if (pos == str.size()) return true;
  }
  if (str[pos] == '#') {
    ++pos;
    consumed = true;
  }
  if (!consumed && IsDigit(str[pos])) return false;
  for (; pos < str.size(); ++pos) {
    unsigned char c = str[pos];
    if (!IsLetter(c) && !IsDigit(c)) return false;
  }
  return true;
}

bool IsDefOrHidden(const std::string& ident) {
  return StartsWith(ident, "#") || StartsWith(ident, "_");
}

std::string FormatNumber(double value) {
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";
  char buf[64];
  if (value == std::floor(value) && std::fabs(value) < 1e21) {
    std::snprintf(buf, sizeof(buf), "%.0f", value);
    return buf;
  }
  for (int precision = 1; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
    if (std::strtod(buf, nullptr) == value) break;
  }
  return buf;
}

bool IsIdent(const ExprPtr& expr, const std::string& name) {
  return expr && expr->Is<ast::Ident>() && expr->As<ast::Ident>().name == name;
}

namespace {

void WalkExpr(const ExprPtr& expr, const std::function<void(const Expr&)>& visit);

void WalkDecl(const DeclPtr& decl, const std::function<void(const Expr&)>& visit) {
  if (!decl) return;
  if (decl->Is<Field>()) {
    const auto& field = decl->As<Field>();
    if (field.label.type == Label::Type::kPattern) WalkExpr(field.label.pattern, visit);
    WalkExpr(field.value, visit);
  } else if (decl->Is<EmbedDecl>()) {
    WalkExpr(decl->As<EmbedDecl>().expr, visit);
  } else if (decl->Is<Ellipsis>()) {
    WalkExpr(decl->As<Ellipsis>().type, visit);
  }
}

void WalkExpr(const ExprPtr& expr, const std::function<void(const Expr&)>& visit) {
  if (!expr) return;
  visit(*expr);
  std::visit(
      [&](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, UnaryExpr>) {
          WalkExpr(node.x, visit);
        } else if constexpr (std::is_same_v<T, BinaryExpr>) {
          WalkExpr(node.x, visit);
          WalkExpr(node.y, visit);
        } else if constexpr (std::is_same_v<T, CallExpr>) {
          WalkExpr(node.fun, visit);
          for (const auto& arg : node.args) WalkExpr(arg, visit);
        } else if constexpr (std::is_same_v<T, SelectorExpr>) {
          WalkExpr(node.x, visit);
        } else if constexpr (std::is_same_v<T, IndexExpr>) {
          WalkExpr(node.x, visit);
          WalkExpr(node.index, visit);
        } else if constexpr (std::is_same_v<T, StructLit>) {
          for (const auto& elt : node.elts) WalkDecl(elt, visit);
        } else if constexpr (std::is_same_v<T, ListLit>) {
          for (const auto& elt : node.elts) WalkExpr(elt, visit);
        } else if constexpr (std::is_same_v<T, Ellipsis>) {
          WalkExpr(node.type, visit);
        }
      },
      expr->node
  );
}

}  // namespace

std::vector<std::string> CollectImports(File* file) {
  std::map<std::string, std::string> qualifier_for_path;
  auto visit = [&](const Expr& expr) {
    if (!expr.Is<ast::Ident>()) return;
    const auto& ident = expr.As<ast::Ident>();
    if (ident.import_path.empty()) return;
    qualifier_for_path.emplace(ident.import_path, ident.name);
  };
  for (const auto& decl : file->decls) {
    WalkDecl(decl, visit);
  }

  std::map<std::string, int> qualifier_count;
  file->imports.clear();
  for (const auto& [path, name] : qualifier_for_path) {
    file->imports.push_back(ImportSpec{path, name});
    ++qualifier_count[name];
  }
  std::vector<std::string> conflicts;
  for (const auto& [name, count] : qualifier_count) {
    if (count > 1) conflicts.push_back(name);
  }
  return conflicts;
}

}  // namespace ast
}  // namespace xschema
