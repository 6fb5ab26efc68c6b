/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/value.cc
 * \brief Reference resolution and introspection of type language values.
 */
#include <xschema/value.h>

#include <cstdlib>
#include <unordered_map>
#include <unordered_set>

#include "support/logging.h"
#include "support/utils.h"

namespace xschema {

struct Value::Scope {
  /*! \brief The struct literal whose fields are visible. */
  ast::ExprPtr owner;
  std::shared_ptr<const Scope> parent;
  ast::Path path;
  bool in_definition = false;
};

namespace {

constexpr int kMaxReferenceDepth = 64;

const std::unordered_map<std::string, Kind>& PredeclaredTypes() {
  static const std::unordered_map<std::string, Kind> types = {
      {"_", kTopKind},         {"string", kStringKind}, {"bytes", kBytesKind},
      {"bool", kBoolKind},     {"number", kNumberKind}, {"float", kFloatKind},
      {"float32", kFloatKind}, {"float64", kFloatKind}, {"int", kIntKind},
      {"int8", kIntKind},      {"int16", kIntKind},     {"int32", kIntKind},
      {"int64", kIntKind},     {"int128", kIntKind},    {"uint", kIntKind},
      {"uint8", kIntKind},     {"uint16", kIntKind},    {"uint32", kIntKind},
      {"uint64", kIntKind},    {"uint128", kIntKind},   {"rune", kIntKind},
  };
  return types;
}

const std::unordered_set<std::string>& PredeclaredFunctions() {
  static const std::unordered_set<std::string> functions = {
      "close", "error", "matchN", "matchIf", "len", "and", "or", "div", "mod", "quo", "rem"
  };
  return functions;
}

/*! \brief The declarations of a struct, with the declarations of embedded struct literals. */
void FlattenDecls(const ast::ExprPtr& st, std::vector<ast::DeclPtr>* decls) {
  for (const auto& decl : st->As<ast::StructLit>().elts) {
    if (decl->Is<ast::EmbedDecl>() && decl->As<ast::EmbedDecl>().expr &&
        decl->As<ast::EmbedDecl>().expr->Is<ast::StructLit>()) {
      FlattenDecls(decl->As<ast::EmbedDecl>().expr, decls);
    } else {
      decls->push_back(decl);
    }
  }
}

std::vector<ast::DeclPtr> FlattenDecls(const ast::ExprPtr& st) {
  std::vector<ast::DeclPtr> decls;
  FlattenDecls(st, &decls);
  return decls;
}

bool IsDataLabel(const ast::Label& label) {
  switch (label.type) {
    case ast::Label::Type::kString:
      return true;
    case ast::Label::Type::kIdent:
      return !ast::IsDefOrHidden(label.name);
    default:
      return false;
  }
}

/*! \brief Whether a struct has anything besides embedded values and definitions. */
bool HasOwnContent(const std::vector<ast::DeclPtr>& decls) {
  for (const auto& decl : decls) {
    if (decl->Is<ast::Ellipsis>()) return true;
    if (decl->Is<ast::Field>()) {
      const auto& label = decl->As<ast::Field>().label;
      if (label.type == ast::Label::Type::kPattern || IsDataLabel(label)) return true;
    }
  }
  return false;
}

Op ComparisonOp(ast::Token token) {
  switch (token) {
    case ast::Token::kLss:
      return Op::kLessThan;
    case ast::Token::kLeq:
      return Op::kLessThanEqual;
    case ast::Token::kGtr:
      return Op::kGreaterThan;
    case ast::Token::kGeq:
      return Op::kGreaterThanEqual;
    case ast::Token::kNeq:
      return Op::kNotEqual;
    case ast::Token::kMat:
      return Op::kRegexMatch;
    case ast::Token::kNmat:
      return Op::kNotRegexMatch;
    default:
      return Op::kNoOp;
  }
}

Kind LiteralKind(const ast::BasicLit& lit) {
  switch (lit.kind) {
    case ast::Token::kNull:
      return kNullKind;
    case ast::Token::kTrue:
    case ast::Token::kFalse:
      return kBoolKind;
    case ast::Token::kInt:
      return kIntKind;
    case ast::Token::kFloat:
      return kFloatKind;
    case ast::Token::kString:
      return kStringKind;
    default:
      return kBottomKind;
  }
}

Kind BuiltinKind(const std::string& name) {
  if (name == "close") return kStructKind;
  if (name == "error") return kBottomKind;
  if (StartsWith(name, "strings.") || StartsWith(name, "time.") || StartsWith(name, "net.") ||
      StartsWith(name, "regexp.")) {
    return kStringKind;
  }
  if (StartsWith(name, "math.")) return kNumberKind;
  if (StartsWith(name, "list.")) return kListKind;
  if (StartsWith(name, "struct.")) return kStructKind;
  return kTopKind;
}

}  // namespace

std::string KindString(Kind kind) {
  static const std::vector<std::pair<Kind, const char*>> names = {
      {kNullKind, "null"},
      {kBoolKind, "bool"},
      {kIntKind, "int"},
      {kFloatKind, "float"},
      {kStringKind, "string"},
      {kBytesKind, "bytes"},
      {kListKind, "list"},
      {kStructKind, "struct"},
  };
  if (kind == kBottomKind) return "_|_";
  if (kind == kTopKind) return "_";
  std::vector<std::string> parts;
  for (const auto& [bit, name] : names) {
    if (kind & bit) parts.push_back(name);
  }
  return Join(parts, "|");
}

// ==================== ValueResolver ====================

/*!
 * \brief Resolution and introspection over the internals of Value.
 */
class ValueResolver {
 public:
  static Value SameScope(const Value& v, ast::ExprPtr expr) {
    return Value(std::move(expr), v.scope_, v.path_, v.in_definition_);
  }

  /*! \brief The scope seen by the declarations of a struct literal value. */
  static std::shared_ptr<const Value::Scope> ScopeOf(const Value& v) {
    auto scope = std::make_shared<Value::Scope>();
    scope->owner = v.expr_;
    scope->parent = v.scope_;
    scope->path = v.path_;
    scope->in_definition = v.in_definition_;
    return scope;
  }

  static Value FieldOf(const Value& st, const ast::DeclPtr& decl) {
    const auto& field = decl->As<ast::Field>();
    ast::Path path = st.path_;
    ast::Selector sel = field.label.type == ast::Label::Type::kIdent
                            ? ast::Selector::Ident(field.label.name)
                            : ast::Selector::Str(field.label.name);
    path.push_back(sel);
    bool in_definition = st.in_definition_ || sel.GetType() == ast::Selector::Type::kDefinition ||
                         sel.GetType() == ast::Selector::Type::kHiddenDefinition;
    return Value(field.value, ScopeOf(st), std::move(path), in_definition);
  }

  static Value Root(const Value& v) {
    const Value::Scope* top = v.scope_.get();
    if (top == nullptr) return Value(v.expr_, nullptr, {}, false);
    while (top->parent) top = top->parent.get();
    return Value(top->owner, nullptr, {}, false);
  }

  /*! \brief Look up a field with an identifier label through the enclosing scopes. */
  static bool LookupIdent(const Value& v, const ast::Ident& ident, Value* target) {
    auto bound = ident.node.lock();
    std::shared_ptr<const Value::Scope> fallback;
    for (auto scope = v.scope_; scope; scope = scope->parent) {
      Value owner(scope->owner, scope->parent, scope->path, scope->in_definition);
      for (const auto& decl : FlattenDecls(scope->owner)) {
        if (!decl->Is<ast::Field>()) continue;
        const auto& field = decl->As<ast::Field>();
        if (field.label.type != ast::Label::Type::kIdent || field.label.name != ident.name) {
          continue;
        }
        if (bound && field.value != bound) continue;
        *target = FieldOf(owner, decl);
        return true;
      }
      if (!scope->parent) fallback = scope;
    }
    if (bound) {
      // Bound to an expression outside the enclosing scopes: treat it as a field of the root.
      ast::Selector sel = ast::Selector::Ident(ident.name);
      *target = Value(bound, fallback, {sel}, sel.GetType() != ast::Selector::Type::kString);
      return true;
    }
    return false;
  }

  /*! \brief Resolve an identifier or a selector that refers to a field. */
  static bool Resolve(const Value& v, Value* target) {
    if (!v.expr_) return false;
    if (v.expr_->Is<ast::Ident>()) {
      const auto& ident = v.expr_->As<ast::Ident>();
      if (!ident.import_path.empty()) return false;
      return LookupIdent(v, ident, target);
    }
    if (v.expr_->Is<ast::SelectorExpr>()) {
      const auto& sel = v.expr_->As<ast::SelectorExpr>();
      Value base = SameScope(v, sel.x);
      for (int depth = 0; depth < kMaxReferenceDepth; ++depth) {
        Value next;
        if (!Resolve(base, &next)) break;
        base = next;
      }
      if (!base.expr_ || !base.expr_->Is<ast::StructLit>()) return false;
      for (const auto& decl : FlattenDecls(base.expr_)) {
        if (!decl->Is<ast::Field>()) continue;
        const auto& label = decl->As<ast::Field>().label;
        if (label.type == ast::Label::Type::kPattern || label.name != sel.sel.Name()) continue;
        if (sel.sel.IsString() && label.type == ast::Label::Type::kIdent &&
            ast::IsDefOrHidden(label.name)) {
          continue;
        }
        *target = FieldOf(base, decl);
        return true;
      }
    }
    return false;
  }

  static Kind KindOf(const Value& v, int depth) {
    if (!v.expr_) return kBottomKind;
    if (depth > kMaxReferenceDepth) return kTopKind;
    if (v.fields_only_) return kStructKind;
    const auto& expr = v.expr_;
    if (expr->Is<ast::Ident>()) {
      const auto& ident = expr->As<ast::Ident>();
      if (!ident.import_path.empty()) return kTopKind;
      Value target;
      if (Resolve(v, &target)) return KindOf(target, depth + 1);
      auto it = PredeclaredTypes().find(ident.name);
      return it == PredeclaredTypes().end() ? kTopKind : it->second;
    }
    if (expr->Is<ast::BasicLit>()) return LiteralKind(expr->As<ast::BasicLit>());
    if (expr->Is<ast::UnaryExpr>()) {
      const auto& unary = expr->As<ast::UnaryExpr>();
      switch (unary.op) {
        case ast::Token::kLss:
        case ast::Token::kLeq:
        case ast::Token::kGtr:
        case ast::Token::kGeq: {
          Kind operand = KindOf(SameScope(v, unary.x), depth + 1);
          return (operand & kNumberKind) ? kNumberKind : operand;
        }
        case ast::Token::kMat:
        case ast::Token::kNmat:
          return kStringKind;
        case ast::Token::kNot:
          return kBoolKind;
        case ast::Token::kNeq:
          return kTopKind;
        default:
          return KindOf(SameScope(v, unary.x), depth + 1);
      }
    }
    if (expr->Is<ast::BinaryExpr>()) {
      const auto& bin = expr->As<ast::BinaryExpr>();
      Kind x = KindOf(SameScope(v, bin.x), depth + 1);
      Kind y = KindOf(SameScope(v, bin.y), depth + 1);
      return bin.op == ast::Token::kOr ? (x | y) : (x & y);
    }
    if (expr->Is<ast::CallExpr>()) {
      return BuiltinKind(v.BuiltinName());
    }
    if (expr->Is<ast::SelectorExpr>()) {
      Value target;
      if (Resolve(v, &target)) return KindOf(target, depth + 1);
      std::string name = v.BuiltinName();
      return name.empty() ? kTopKind : BuiltinKind(name);
    }
    if (expr->Is<ast::StructLit>()) {
      auto decls = FlattenDecls(expr);
      Kind kind = kTopKind;
      bool has_embed = false;
      for (const auto& decl : decls) {
        if (!decl->Is<ast::EmbedDecl>()) continue;
        has_embed = true;
        Value embed(decl->As<ast::EmbedDecl>().expr, ScopeOf(v), v.path_, v.in_definition_);
        kind &= KindOf(embed, depth + 1);
      }
      if (!has_embed || HasOwnContent(decls)) kind &= kStructKind;
      return kind;
    }
    if (expr->Is<ast::ListLit>()) return kListKind;
    return kTopKind;
  }

  static bool Concrete(const Value& v, int depth) {
    if (!v.expr_ || depth > kMaxReferenceDepth) return false;
    const auto& expr = v.expr_;
    if (expr->Is<ast::BasicLit>()) return true;
    if (expr->Is<ast::UnaryExpr>()) {
      const auto& unary = expr->As<ast::UnaryExpr>();
      return unary.op == ast::Token::kSub && unary.x && unary.x->Is<ast::BasicLit>();
    }
    if (expr->Is<ast::Ident>() || expr->Is<ast::SelectorExpr>()) {
      Value target;
      return Resolve(v, &target) && Concrete(target, depth + 1);
    }
    if (expr->Is<ast::ListLit>()) {
      for (const auto& elt : expr->As<ast::ListLit>().elts) {
        if (elt->Is<ast::Ellipsis>() || !Concrete(SameScope(v, elt), depth + 1)) return false;
      }
      return true;
    }
    if (expr->Is<ast::StructLit>()) {
      for (const auto& decl : FlattenDecls(expr)) {
        if (decl->Is<ast::EmbedDecl>() || decl->Is<ast::Ellipsis>()) return false;
        if (!decl->Is<ast::Field>()) continue;
        const auto& field = decl->As<ast::Field>();
        if (field.label.type == ast::Label::Type::kPattern) return false;
        if (!IsDataLabel(field.label)) continue;
        if (field.constraint != ast::Token::kIllegal) return false;
        if (!Concrete(FieldOf(v, decl), depth + 1)) return false;
      }
      return true;
    }
    return false;
  }

  static void ValidateExpr(
      const Value& v, std::vector<SchemaDiagnostic>* errors, int depth
  ) {
    if (!v.expr_) return;
    const auto& expr = v.expr_;
    std::string location = ast::PathString(v.path_);
    if (expr->Is<ast::Ident>()) {
      const auto& ident = expr->As<ast::Ident>();
      if (!ident.import_path.empty()) return;
      Value target;
      if (Resolve(v, &target)) return;
      if (PredeclaredTypes().count(ident.name) || PredeclaredFunctions().count(ident.name)) return;
      errors->push_back({location, "reference " + Quote(ident.name) + " not found"});
    } else if (expr->Is<ast::SelectorExpr>()) {
      const auto& sel = expr->As<ast::SelectorExpr>();
      if (sel.x && sel.x->Is<ast::Ident>() && !sel.x->As<ast::Ident>().import_path.empty()) {
        return;
      }
      size_t before = errors->size();
      ValidateExpr(SameScope(v, sel.x), errors, depth + 1);
      Value target;
      if (errors->size() == before && !Resolve(v, &target)) {
        errors->push_back({location, "field " + sel.sel.String() + " not found"});
      }
    } else if (expr->Is<ast::UnaryExpr>()) {
      ValidateExpr(SameScope(v, expr->As<ast::UnaryExpr>().x), errors, depth + 1);
    } else if (expr->Is<ast::BinaryExpr>()) {
      ValidateExpr(SameScope(v, expr->As<ast::BinaryExpr>().x), errors, depth + 1);
      ValidateExpr(SameScope(v, expr->As<ast::BinaryExpr>().y), errors, depth + 1);
    } else if (expr->Is<ast::CallExpr>()) {
      const auto& call = expr->As<ast::CallExpr>();
      ValidateExpr(SameScope(v, call.fun), errors, depth + 1);
      for (const auto& arg : call.args) ValidateExpr(SameScope(v, arg), errors, depth + 1);
    } else if (expr->Is<ast::IndexExpr>()) {
      ValidateExpr(SameScope(v, expr->As<ast::IndexExpr>().x), errors, depth + 1);
      ValidateExpr(SameScope(v, expr->As<ast::IndexExpr>().index), errors, depth + 1);
    } else if (expr->Is<ast::ListLit>()) {
      for (const auto& elt : expr->As<ast::ListLit>().elts) {
        ValidateExpr(SameScope(v, elt), errors, depth + 1);
      }
    } else if (expr->Is<ast::Ellipsis>()) {
      ValidateExpr(SameScope(v, expr->As<ast::Ellipsis>().type), errors, depth + 1);
    } else if (expr->Is<ast::StructLit>()) {
      auto scope = ScopeOf(v);
      for (const auto& decl : expr->As<ast::StructLit>().elts) {
        if (decl->Is<ast::Field>()) {
          const auto& field = decl->As<ast::Field>();
          if (field.label.type == ast::Label::Type::kPattern) {
            ValidateExpr(
                Value(field.label.pattern, scope, v.path_, v.in_definition_), errors, depth + 1
            );
            ValidateExpr(Value(field.value, scope, v.path_, v.in_definition_), errors, depth + 1);
          } else {
            ValidateExpr(FieldOf(v, decl), errors, depth + 1);
          }
        } else if (decl->Is<ast::EmbedDecl>()) {
          ValidateExpr(
              Value(decl->As<ast::EmbedDecl>().expr, scope, v.path_, v.in_definition_),
              errors,
              depth + 1
          );
        } else if (decl->Is<ast::Ellipsis>()) {
          ValidateExpr(
              Value(decl->As<ast::Ellipsis>().type, scope, v.path_, v.in_definition_),
              errors,
              depth + 1
          );
        }
      }
    }
  }
};

// ==================== Value ====================

Value Value::FromFile(const ast::FilePtr& file) {
  return Value(ast::NewStruct(file->decls), nullptr, {}, false);
}

Value Value::FromExpr(const ast::ExprPtr& expr) { return Value(expr, nullptr, {}, false); }

Kind Value::IncompleteKind() const { return ValueResolver::KindOf(*this, 0); }

bool Value::IsConcrete() const { return ValueResolver::Concrete(*this, 0); }

Op Value::Expr(std::vector<Value>* args) const {
  args->clear();
  if (!expr_ || fields_only_) return Op::kNoOp;
  if (expr_->Is<ast::BinaryExpr>()) {
    ast::Token op = expr_->As<ast::BinaryExpr>().op;
    // Flatten operands joined by the same operator.
    std::vector<ast::ExprPtr> stack = {expr_};
    std::vector<ast::ExprPtr> operands;
    while (!stack.empty()) {
      ast::ExprPtr e = stack.back();
      stack.pop_back();
      if (e->Is<ast::BinaryExpr>() && e->As<ast::BinaryExpr>().op == op) {
        stack.push_back(e->As<ast::BinaryExpr>().y);
        stack.push_back(e->As<ast::BinaryExpr>().x);
        continue;
      }
      if (op == ast::Token::kOr && e->Is<ast::UnaryExpr>() &&
          e->As<ast::UnaryExpr>().op == ast::Token::kMul) {
        e = e->As<ast::UnaryExpr>().x;
      }
      operands.push_back(e);
    }
    for (const auto& operand : operands) args->push_back(ValueResolver::SameScope(*this, operand));
    return op == ast::Token::kOr ? Op::kOr : Op::kAnd;
  }
  if (expr_->Is<ast::UnaryExpr>()) {
    const auto& unary = expr_->As<ast::UnaryExpr>();
    if (unary.op == ast::Token::kMul) {
      return ValueResolver::SameScope(*this, unary.x).Expr(args);
    }
    Op op = ComparisonOp(unary.op);
    if (op != Op::kNoOp) args->push_back(ValueResolver::SameScope(*this, unary.x));
    return op;
  }
  if (expr_->Is<ast::CallExpr>()) {
    const auto& call = expr_->As<ast::CallExpr>();
    args->push_back(ValueResolver::SameScope(*this, call.fun));
    for (const auto& arg : call.args) args->push_back(ValueResolver::SameScope(*this, arg));
    return Op::kCall;
  }
  if (expr_->Is<ast::StructLit>()) {
    auto decls = FlattenDecls(expr_);
    auto scope = ValueResolver::ScopeOf(*this);
    for (const auto& decl : decls) {
      if (decl->Is<ast::EmbedDecl>()) {
        args->push_back(Value(decl->As<ast::EmbedDecl>().expr, scope, path_, in_definition_));
      }
    }
    if (args->empty()) return Op::kNoOp;
    if (HasOwnContent(decls)) {
      Value fields = *this;
      fields.fields_only_ = true;
      args->push_back(fields);
    }
    return Op::kAnd;
  }
  return Op::kNoOp;
}

bool Value::ReferencePath(Value* root, ast::Path* path) const {
  Value target;
  if (!ValueResolver::Resolve(*this, &target)) return false;
  *root = ValueResolver::Root(*this);
  *path = target.path_;
  return true;
}

Value Value::Eval() const {
  Value current = *this;
  for (int depth = 0; depth < kMaxReferenceDepth; ++depth) {
    Value next;
    if (!ValueResolver::Resolve(current, &next)) break;
    current = next;
  }
  return current;
}

std::string Value::BuiltinName() const {
  if (!expr_) return "";
  if (expr_->Is<ast::CallExpr>()) {
    return ValueResolver::SameScope(*this, expr_->As<ast::CallExpr>().fun).BuiltinName();
  }
  if (expr_->Is<ast::Ident>()) {
    const auto& ident = expr_->As<ast::Ident>();
    Value target;
    if (!ident.import_path.empty() || ValueResolver::Resolve(*this, &target)) return "";
    return PredeclaredFunctions().count(ident.name) ? ident.name : "";
  }
  if (expr_->Is<ast::SelectorExpr>()) {
    const auto& sel = expr_->As<ast::SelectorExpr>();
    if (sel.x && sel.x->Is<ast::Ident>() && !sel.x->As<ast::Ident>().import_path.empty()) {
      return sel.x->As<ast::Ident>().import_path + "." + sel.sel.Name();
    }
  }
  return "";
}

std::vector<FieldValue> Value::Fields() const {
  std::vector<FieldValue> fields;
  Value st = Eval();
  if (!st.expr_ || !st.expr_->Is<ast::StructLit>()) return fields;
  for (const auto& decl : FlattenDecls(st.expr_)) {
    if (!decl->Is<ast::Field>()) continue;
    const auto& field = decl->As<ast::Field>();
    if (!IsDataLabel(field.label)) continue;
    FieldConstraint constraint = FieldConstraint::kRegular;
    if (field.constraint == ast::Token::kOption) {
      constraint = FieldConstraint::kOptional;
    } else if (field.constraint == ast::Token::kNot) {
      constraint = FieldConstraint::kRequired;
    }
    fields.push_back(FieldValue{field.label.name, constraint, ValueResolver::FieldOf(st, decl)});
  }
  return fields;
}

std::vector<PatternValue> Value::Patterns() const {
  std::vector<PatternValue> patterns;
  Value st = Eval();
  if (!st.expr_ || !st.expr_->Is<ast::StructLit>()) return patterns;
  auto scope = ValueResolver::ScopeOf(st);
  for (const auto& decl : FlattenDecls(st.expr_)) {
    if (!decl->Is<ast::Field>()) continue;
    const auto& field = decl->As<ast::Field>();
    if (field.label.type != ast::Label::Type::kPattern) continue;
    patterns.push_back(PatternValue{
        Value(field.label.pattern, scope, st.path_, st.in_definition_),
        Value(field.value, scope, st.path_, st.in_definition_)
    });
  }
  return patterns;
}

Openness Value::GetOpenness() const {
  Value st = Eval();
  if (st.expr_ && st.expr_->Is<ast::StructLit>()) {
    for (const auto& decl : FlattenDecls(st.expr_)) {
      if (decl->Is<ast::Ellipsis>()) return Openness::kExplicitlyOpen;
    }
  }
  if (explicitly_closed_ || st.explicitly_closed_) return Openness::kExplicitlyClosed;
  if (st.in_definition_) return Openness::kImplicitlyClosed;
  return Openness::kOpen;
}

ListValue Value::List() const {
  ListValue list;
  Value lst = Eval();
  if (!lst.expr_ || !lst.expr_->Is<ast::ListLit>()) return list;
  const auto& elts = lst.expr_->As<ast::ListLit>().elts;
  for (size_t i = 0; i < elts.size(); ++i) {
    ast::Path path = lst.path_;
    path.push_back(ast::Selector::Str(std::to_string(i)));
    if (elts[i]->Is<ast::Ellipsis>()) {
      list.open = true;
      const auto& type = elts[i]->As<ast::Ellipsis>().type;
      if (type) list.rest = Value(type, lst.scope_, std::move(path), lst.in_definition_);
      break;
    }
    list.prefix.push_back(Value(elts[i], lst.scope_, std::move(path), lst.in_definition_));
  }
  return list;
}

Value Value::Closed() const {
  Value closed = *this;
  closed.explicitly_closed_ = true;
  return closed;
}

bool Value::ToInt64(int64_t* result) const {
  Value lit = Eval();
  if (!lit.expr_) return false;
  bool negative = false;
  ast::ExprPtr expr = lit.expr_;
  if (expr->Is<ast::UnaryExpr>() && expr->As<ast::UnaryExpr>().op == ast::Token::kSub) {
    negative = true;
    expr = expr->As<ast::UnaryExpr>().x;
  }
  if (!expr || !expr->Is<ast::BasicLit>() || expr->As<ast::BasicLit>().kind != ast::Token::kInt) {
    return false;
  }
  int64_t value = std::strtoll(expr->As<ast::BasicLit>().value.c_str(), nullptr, 10);
  *result = negative ? -value : value;
  return true;
}

bool Value::ToDouble(double* result) const {
  Value lit = Eval();
  if (!lit.expr_) return false;
  bool negative = false;
  ast::ExprPtr expr = lit.expr_;
  if (expr->Is<ast::UnaryExpr>() && expr->As<ast::UnaryExpr>().op == ast::Token::kSub) {
    negative = true;
    expr = expr->As<ast::UnaryExpr>().x;
  }
  if (!expr || !expr->Is<ast::BasicLit>()) return false;
  const auto& basic = expr->As<ast::BasicLit>();
  if (basic.kind != ast::Token::kInt && basic.kind != ast::Token::kFloat) return false;
  double value = std::strtod(basic.value.c_str(), nullptr);
  *result = negative ? -value : value;
  return true;
}

bool Value::ToNumberLiteral(std::string* result) const {
  Value lit = Eval();
  if (!lit.expr_) return false;
  bool negative = false;
  ast::ExprPtr expr = lit.expr_;
  if (expr->Is<ast::UnaryExpr>() && expr->As<ast::UnaryExpr>().op == ast::Token::kSub) {
    negative = true;
    expr = expr->As<ast::UnaryExpr>().x;
  }
  if (!expr || !expr->Is<ast::BasicLit>()) return false;
  const auto& basic = expr->As<ast::BasicLit>();
  if (basic.kind != ast::Token::kInt && basic.kind != ast::Token::kFloat) return false;
  *result = negative ? "-" + basic.value : basic.value;
  return true;
}

bool Value::ToString(std::string* result) const {
  Value lit = Eval();
  if (!lit.expr_ || !lit.expr_->Is<ast::BasicLit>() ||
      lit.expr_->As<ast::BasicLit>().kind != ast::Token::kString) {
    return false;
  }
  *result = lit.expr_->As<ast::BasicLit>().value;
  return true;
}

std::vector<SchemaDiagnostic> Value::Validate() const {
  std::vector<SchemaDiagnostic> errors;
  ValueResolver::ValidateExpr(*this, &errors, 0);
  return errors;
}

}  // namespace xschema
