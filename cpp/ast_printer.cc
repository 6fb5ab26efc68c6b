/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/ast_printer.cc
 * \brief Render the syntax tree as type language text or as JSON.
 */
#include <xschema/ast.h>

#include <functional>
#include <string>
#include <type_traits>
#include <unordered_set>

#include "support/logging.h"
#include "support/utils.h"

namespace xschema {
namespace ast {

namespace {

constexpr int kPrecOr = 1;
constexpr int kPrecAnd = 2;
constexpr int kPrecUnary = 7;
constexpr int kPrecPrimary = 8;

int Precedence(const ExprPtr& expr) {
  if (expr->Is<BinaryExpr>()) {
    return expr->As<BinaryExpr>().op == Token::kOr ? kPrecOr : kPrecAnd;
  }
  if (expr->Is<UnaryExpr>()) return kPrecUnary;
  return kPrecPrimary;
}

const std::unordered_set<std::string>& ReservedLabels() {
  static const std::unordered_set<std::string> reserved = {
      "_", "true", "false", "null", "if", "for", "in", "let", "import", "package", "func"
  };
  return reserved;
}

std::string LabelString(const Label& label, const std::function<std::string(const ExprPtr&)>& expr) {
  switch (label.type) {
    case Label::Type::kIdent:
      return label.name;
    case Label::Type::kString:
      if (IsValidIdent(label.name) && !IsDefOrHidden(label.name) &&
          ReservedLabels().count(label.name) == 0) {
        return label.name;
      }
      return Quote(label.name);
    case Label::Type::kPattern:
      return "[" + expr(label.pattern) + "]";
  }
  XSCHEMA_UNREACHABLE();
}

/*!
 * \brief Prints the type language. Structs print one element per line; everything else prints on
 * one line.
 */
class TextPrinter {
 public:
  std::string PrintFile(const File& file) {
    std::vector<std::string> sections;
    if (!file.doc.empty()) sections.push_back(DocComment(file.doc, ""));
    if (!file.package.empty()) sections.push_back("package " + file.package + "\n");
    if (!file.imports.empty()) sections.push_back(Imports(file.imports));
    if (!file.attrs.empty()) {
      std::string attrs;
      for (const auto& attr : file.attrs) attrs += attr.text + "\n";
      sections.push_back(attrs);
    }
    if (!file.decls.empty()) {
      out_.clear();
      for (const auto& decl : file.decls) {
        PrintDecl(decl);
        out_ += "\n";
      }
      sections.push_back(out_);
    }
    return Join(sections, "\n");
  }

  std::string PrintExprOnly(const ExprPtr& expr) {
    out_.clear();
    PrintExpr(expr, 0);
    return out_;
  }

 private:
  static std::string DocComment(const std::string& doc, const std::string& indent) {
    std::string result;
    size_t start = 0;
    while (start <= doc.size()) {
      size_t end = doc.find('\n', start);
      if (end == std::string::npos) end = doc.size();
      std::string line = doc.substr(start, end - start);
      result += indent + (line.empty() ? "//" : "// " + line) + "\n";
      start = end + 1;
    }
    return result;
  }

  static std::string Imports(const std::vector<ImportSpec>& imports) {
    auto spec = [](const ImportSpec& import) {
      std::string default_name = import.path;
      size_t colon = default_name.rfind(':');
      size_t slash = default_name.rfind('/');
      if (colon != std::string::npos) {
        default_name = default_name.substr(colon + 1);
      } else if (slash != std::string::npos) {
        default_name = default_name.substr(slash + 1);
      }
      std::string quoted = Quote(import.path);
      return import.name == default_name ? quoted : import.name + " " + quoted;
    };
    if (imports.size() == 1) return "import " + spec(imports[0]) + "\n";
    std::string result = "import (\n";
    for (const auto& import : imports) result += "\t" + spec(import) + "\n";
    return result + ")\n";
  }

  void Indent() { out_.append(indent_, '\t'); }

  void PrintDecl(const DeclPtr& decl) {
    std::visit(
        [&](const auto& node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, Field>) {
            if (!node.doc.empty()) {
              // The caller has indented the first line already.
              out_ += DocComment(node.doc, std::string(indent_, '\t')).substr(indent_);
              Indent();
            }
            out_ += LabelString(node.label, [this](const ExprPtr& e) { return Sub(e); });
            if (node.constraint != Token::kIllegal) out_ += TokenString(node.constraint);
            out_ += ": ";
            if (node.value) {
              PrintExpr(node.value, 0);
            } else {
              out_ += "_";
            }
            for (const auto& attr : node.attrs) out_ += " " + attr.text;
          } else if constexpr (std::is_same_v<T, EmbedDecl>) {
            PrintExpr(node.expr, 0);
          } else if constexpr (std::is_same_v<T, Ellipsis>) {
            out_ += "...";
            if (node.type) PrintExpr(node.type, kPrecUnary);
          } else if constexpr (std::is_same_v<T, Attribute>) {
            out_ += node.text;
          }
        },
        decl->node
    );
  }

  // Prints expr into a separate buffer, keeping the current indentation.
  std::string Sub(const ExprPtr& expr) {
    std::string saved;
    saved.swap(out_);
    PrintExpr(expr, 0);
    std::string result;
    result.swap(out_);
    out_.swap(saved);
    return result;
  }

  void PrintExpr(const ExprPtr& expr, int min_prec) {
    if (!expr) {
      out_ += "_";
      return;
    }
    bool paren = Precedence(expr) < min_prec;
    if (paren) out_ += "(";
    std::visit(
        [&](const auto& node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, Ident>) {
            out_ += node.name;
          } else if constexpr (std::is_same_v<T, BasicLit>) {
            out_ += node.kind == Token::kString ? Quote(node.value) : node.value;
          } else if constexpr (std::is_same_v<T, UnaryExpr>) {
            out_ += TokenString(node.op);
            PrintExpr(node.x, kPrecUnary);
          } else if constexpr (std::is_same_v<T, BinaryExpr>) {
            int prec = node.op == Token::kOr ? kPrecOr : kPrecAnd;
            PrintExpr(node.x, prec);
            out_ += std::string(" ") + TokenString(node.op) + " ";
            PrintExpr(node.y, prec);
          } else if constexpr (std::is_same_v<T, CallExpr>) {
            PrintExpr(node.fun, kPrecPrimary);
            out_ += "(";
            for (size_t i = 0; i < node.args.size(); ++i) {
              if (i != 0) out_ += ", ";
              PrintExpr(node.args[i], 0);
            }
            out_ += ")";
          } else if constexpr (std::is_same_v<T, SelectorExpr>) {
            PrintExpr(node.x, kPrecPrimary);
            out_ += "." + node.sel.String();
          } else if constexpr (std::is_same_v<T, IndexExpr>) {
            PrintExpr(node.x, kPrecPrimary);
            out_ += "[";
            PrintExpr(node.index, 0);
            out_ += "]";
          } else if constexpr (std::is_same_v<T, StructLit>) {
            if (node.elts.empty()) {
              out_ += "{}";
              return;
            }
            out_ += "{\n";
            ++indent_;
            for (const auto& elt : node.elts) {
              Indent();
              PrintDecl(elt);
              out_ += "\n";
            }
            --indent_;
            Indent();
            out_ += "}";
          } else if constexpr (std::is_same_v<T, ListLit>) {
            out_ += "[";
            for (size_t i = 0; i < node.elts.size(); ++i) {
              if (i != 0) out_ += ", ";
              PrintExpr(node.elts[i], 0);
            }
            out_ += "]";
          } else if constexpr (std::is_same_v<T, Ellipsis>) {
            out_ += "...";
            if (node.type) PrintExpr(node.type, kPrecUnary);
          }
        },
        expr->node
    );
    if (paren) out_ += ")";
  }

  std::string out_;
  int indent_ = 0;
};

/*!
 * \brief Prints a JSON-shaped tree as JSON text.
 */
class JSONPrinter {
 public:
  explicit JSONPrinter(int indent) : indent_(indent) {}

  std::string Print(const ExprPtr& expr) {
    PrintValue(expr, 0);
    return out_;
  }

 private:
  void NewLine(int depth) {
    if (indent_ < 0) return;
    out_ += "\n";
    out_.append(static_cast<size_t>(depth * indent_), ' ');
  }

  void PrintValue(const ExprPtr& expr, int depth) {
    XSCHEMA_ICHECK(expr) << "Cannot print a missing value as JSON";
    if (expr->Is<BasicLit>()) {
      const auto& lit = expr->As<BasicLit>();
      out_ += lit.kind == Token::kString ? Quote(lit.value) : lit.value;
    } else if (expr->Is<ListLit>()) {
      const auto& list = expr->As<ListLit>();
      if (list.elts.empty()) {
        out_ += "[]";
        return;
      }
      out_ += "[";
      for (size_t i = 0; i < list.elts.size(); ++i) {
        if (i != 0) out_ += ",";
        NewLine(depth + 1);
        PrintValue(list.elts[i], depth + 1);
      }
      NewLine(depth);
      out_ += "]";
    } else if (expr->Is<StructLit>()) {
      const auto& st = expr->As<StructLit>();
      if (st.elts.empty()) {
        out_ += "{}";
        return;
      }
      out_ += "{";
      bool first = true;
      for (const auto& elt : st.elts) {
        XSCHEMA_ICHECK(elt->Is<Field>()) << "Only fields can be printed as JSON";
        const auto& field = elt->As<Field>();
        XSCHEMA_ICHECK(field.label.type != Label::Type::kPattern)
            << "Pattern constraints cannot be printed as JSON";
        if (!first) out_ += ",";
        first = false;
        NewLine(depth + 1);
        out_ += Quote(field.label.name);
        out_ += indent_ < 0 ? ":" : ": ";
        PrintValue(field.value, depth + 1);
      }
      NewLine(depth);
      out_ += "}";
    } else {
      XSCHEMA_LOG(FATAL) << "Expression is not JSON: " << FormatExpr(expr);
    }
  }

  int indent_;
  std::string out_;
};

}  // namespace

std::string Format(const File& file) { return TextPrinter().PrintFile(file); }

std::string FormatExpr(const ExprPtr& expr) { return TextPrinter().PrintExprOnly(expr); }

std::string FormatJSON(const ExprPtr& expr, int indent) { return JSONPrinter(indent).Print(expr); }

}  // namespace ast
}  // namespace xschema
