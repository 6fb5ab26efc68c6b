/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/schema_generator.cc
 */
#include "schema_generator.h"

#include <algorithm>
#include <optional>
#include <regex>
#include <unordered_map>

#include "support/logging.h"
#include "support/utils.h"

namespace xschema {

namespace {

struct IntRange {
  std::optional<std::string> min;
  std::optional<std::string> max;
};

/*! \brief The ranges of the sized integer types. */
const std::unordered_map<std::string, IntRange>& SizedIntegers() {
  static const std::unordered_map<std::string, IntRange> ranges = {
      {"int8", {"-128", "127"}},
      {"int16", {"-32768", "32767"}},
      {"int32", {"-2147483648", "2147483647"}},
      {"rune", {"-2147483648", "2147483647"}},
      {"int64", {"-9223372036854775808", "9223372036854775807"}},
      {"uint", {"0", std::nullopt}},
      {"uint8", {"0", "255"}},
      {"uint16", {"0", "65535"}},
      {"uint32", {"0", "4294967295"}},
      {"uint64", {"0", "18446744073709551615"}},
  };
  return ranges;
}

/*! \brief The formats of the string valued package members. */
const std::unordered_map<std::string, std::string>& BuiltinFormats() {
  static const std::unordered_map<std::string, std::string> formats = {
      {"time.Time", "date-time"},
      {"net.AbsURL", "uri"},
      {"net.URL", "uri-reference"},
      {"regexp.Valid", "regex"},
  };
  return formats;
}

/*! \brief The JSON Schema formats of time layouts. */
const char* TimeLayoutFormat(const std::string& layout) {
  if (layout == "2006-01-02T15:04:05Z07:00" || layout == "2006-01-02T15:04:05.999999999Z07:00") {
    return "date-time";
  }
  if (layout == "2006-01-02") return "date";
  if (layout == "15:04:05") return "time";
  return nullptr;
}

/*!
 * \brief Whether a pattern label covers every field name not otherwise mentioned: `string`, or a
 * conjunction of `!~re`.
 */
bool IsCatchAllLabel(const Value& label) {
  std::vector<Value> args;
  Op op = label.Expr(&args);
  if (op == Op::kNoOp) {
    return !label.IsConcrete() && label.IncompleteKind() == kStringKind &&
           label.BuiltinName().empty();
  }
  if (op == Op::kNotRegexMatch) return true;
  if (op != Op::kAnd) return false;
  return std::all_of(args.begin(), args.end(), [](const Value& arg) {
    std::vector<Value> sub;
    return arg.Expr(&sub) == Op::kNotRegexMatch;
  });
}

// Uses ECMAScript syntax. RE2-only syntax such as `(?i)` never matches, so fields under such a
// pattern keep the conjuncts the pattern already implies.
bool RegexpMatches(const std::string& pattern, const std::string& name) {
  try {
    return std::regex_search(name, std::regex(pattern, std::regex::ECMAScript));
  } catch (const std::regex_error& e) {
    // Valid in the type language but not in ECMAScript syntax.
    XSCHEMA_LOG(DEBUG) << "Cannot match " << Quote(name) << " against " << Quote(pattern) << ": "
                       << e.what();
    return false;
  }
}

/*! \brief Parse the count of list.MatchN: `n`, `>=n`, `<=m` or `>=n & <=m`. */
bool ParseCount(const Value& count, std::optional<int64_t>* min, std::optional<int64_t>* max) {
  int64_t n = 0;
  if (count.ToInt64(&n)) {
    *min = n;
    *max = n;
    return true;
  }
  std::vector<Value> args;
  Op op = count.Expr(&args);
  if (op == Op::kAnd) {
    for (const auto& arg : args) {
      if (!ParseCount(arg, min, max)) return false;
    }
    return true;
  }
  if (args.size() != 1 || !args[0].ToInt64(&n)) return false;
  switch (op) {
    case Op::kGreaterThanEqual:
      *min = n;
      return true;
    case Op::kGreaterThan:
      *min = n + 1;
      return true;
    case Op::kLessThanEqual:
      *max = n;
      return true;
    case Op::kLessThan:
      *max = n - 1;
      return true;
    default:
      return false;
  }
}

}  // namespace

std::vector<std::string> KindToJSONSchemaTypes(Kind kind) {
  std::vector<std::string> types;
  if (kind & kFloatKind) {
    // A float admits all numbers, as the number type does.
    kind &= ~kNumberKind;
    types.push_back("number");
  }
  static const std::vector<std::pair<Kind, const char*>> names = {
      {kNullKind, "null"},
      {kBoolKind, "boolean"},
      {kIntKind, "integer"},
      {kStringKind, "string"},
      {kListKind, "array"},
      {kStructKind, "object"},
  };
  for (const auto& [k, name] : names) {
    if (kind & k) types.push_back(name);
  }
  return types;
}

ast::ExprPtr ConcreteToJSON(const Value& v) {
  if (!v.IsConcrete()) return nullptr;
  Value e = v.Eval();
  const ast::ExprPtr& syntax = e.Syntax();
  if (syntax->Is<ast::BasicLit>()) {
    const auto& lit = syntax->As<ast::BasicLit>();
    return ast::NewLit(lit.kind, lit.value);
  }
  if (syntax->Is<ast::UnaryExpr>()) {
    const auto& lit = syntax->As<ast::UnaryExpr>().x->As<ast::BasicLit>();
    return ast::NewLit(lit.kind, "-" + lit.value);
  }
  if (syntax->Is<ast::ListLit>()) {
    std::vector<ast::ExprPtr> elts;
    for (const auto& elem : e.List().prefix) elts.push_back(ConcreteToJSON(elem));
    return ast::NewList(std::move(elts));
  }
  std::vector<ast::DeclPtr> fields;
  for (const auto& field : e.Fields()) {
    fields.push_back(ast::NewField(ast::Label::String(field.name), ConcreteToJSON(field.value)));
  }
  return ast::NewStruct(std::move(fields));
}

// ==================== SchemaGenerator ====================

SchemaItemPtr SchemaGenerator::Error(const Value& v, const std::string& msg) {
  diagnostics_.push_back(SchemaDiagnostic{ast::PathString(v.Path()), msg});
  return store_.False();
}

SchemaItemPtr SchemaGenerator::Typed(const std::string& type, SchemaItemPtr item) {
  return store_.Make(AllOfItem{{store_.Make(TypeItem{{type}}), std::move(item)}});
}

SchemaItemPtr SchemaGenerator::Rewrite(const SchemaItemPtr& item) {
  return EnumFromConst(&store_, MergeAllOf(&store_, item));
}

ast::ExprPtr SchemaGenerator::Generate(const Value& value) {
  ast::ExprPtr expr = RenderItem(Rewrite(MakeItem(value)));
  if (expr->Is<ast::BasicLit>()) {
    if (expr->As<ast::BasicLit>().kind == ast::Token::kFalse) {
      if (diagnostics_.empty()) {
        diagnostics_.push_back(SchemaDiagnostic{"", "schema cannot be satisfied"});
      }
      return nullptr;
    }
    // true accepts everything, as does the empty schema.
    expr = ast::NewStruct();
  }

  std::vector<std::pair<std::string, ast::ExprPtr>> fields;
  fields.emplace_back("$schema", ast::NewString(VersionString(Version::kDraft2020_12)));
  if (!defs_.empty()) {
    std::vector<ast::DeclPtr> def_fields;
    for (const auto& [name, def] : defs_) {
      XSCHEMA_ICHECK(def != nullptr) << "Definition " << name << " was never completed";
      def_fields.push_back(ast::NewField(ast::Label::String(name), RenderItem(Rewrite(def))));
    }
    fields.emplace_back("$defs", ast::NewStruct(std::move(def_fields)));
  }
  for (const auto& decl : expr->As<ast::StructLit>().elts) {
    const auto& field = decl->As<ast::Field>();
    fields.emplace_back(field.label.name, field.value);
  }
  if (!diagnostics_.empty()) return nullptr;
  return MakeSchemaStruct(std::move(fields));
}

SchemaItemPtr SchemaGenerator::MakeItem(const Value& v) {
  std::vector<Value> args;
  Op op = v.Expr(&args);
  switch (op) {
    case Op::kNoOp: {
      Value root;
      ast::Path path;
      if (v.ReferencePath(&root, &path)) {
        if (!path.empty()) {
          if (auto ref = MakeReferenceItem(v, root, path)) return ref;
        }
      } else if (auto named = MakeNamedItem(v)) {
        return named;
      }
      break;
    }
    case Op::kAnd: {
      AllOfItem all;
      for (const auto& arg : args) all.elems.push_back(MakeItem(arg));
      return store_.Make(std::move(all));
    }
    case Op::kOr: {
      AnyOfItem any;
      for (const auto& arg : args) any.elems.push_back(MakeItem(arg));
      return store_.Make(std::move(any));
    }
    case Op::kRegexMatch:
    case Op::kNotRegexMatch: {
      std::string re;
      if (!args[0].ToString(&re)) {
        return Error(args[0], "regular expression must be a concrete string");
      }
      SchemaItemPtr match = store_.Make(PatternItem{re});
      if (op == Op::kNotRegexMatch) match = store_.Make(NotItem{match});
      return Typed("string", match);
    }
    case Op::kNotEqual: {
      // A constraint on a value that is not known accepts anything.
      if (!args[0].IsConcrete()) return store_.True();
      return store_.Make(NotItem{store_.Make(ConstItem{ConcreteToJSON(args[0])})});
    }
    case Op::kLessThan:
    case Op::kLessThanEqual:
    case Op::kGreaterThan:
    case Op::kGreaterThanEqual:
      return MakeComparisonItem(v, op, args[0]);
    case Op::kCall:
      return MakeCallItem(v, args);
  }

  Kind kind = v.IncompleteKind();
  if (v.IsConcrete() && (kind & (kStructKind | kListKind)) == 0) {
    return store_.Make(ConstItem{ConcreteToJSON(v)});
  }
  if (kind == kTopKind) return store_.True();
  if (kind == kBottomKind) return store_.False();

  std::vector<SchemaItemPtr> elems;
  auto types = KindToJSONSchemaTypes(kind);
  if (!types.empty()) elems.push_back(store_.Make(TypeItem{types}));
  SchemaItemPtr extra;
  if (kind == kStructKind) {
    extra = MakeStructItem(v);
  } else if (kind == kListKind) {
    extra = MakeListItem(v);
  }
  if (extra && !extra->Is<TrueItem>()) elems.push_back(extra);

  switch (elems.size()) {
    case 0:
      return store_.True();
    case 1:
      return elems[0];
    default:
      return store_.Make(AllOfItem{std::move(elems)});
  }
}

SchemaItemPtr SchemaGenerator::MakeReferenceItem(
    const Value& v, const Value& root, const ast::Path& path
) {
  std::string name = config_.name_func(root, path);
  if (name.empty()) return nullptr;
  SchemaItemPtr ref = store_.Make(RefItem{name});
  if (defs_.count(name)) return ref;
  // Reserved before the definition is built, so that cycles end at the reference.
  defs_[name] = nullptr;
  defs_[name] = MakeItem(v.Eval());
  return ref;
}

SchemaItemPtr SchemaGenerator::MakeNamedItem(const Value& v) {
  const ast::ExprPtr& syntax = v.Syntax();
  if (syntax->Is<ast::Ident>() && syntax->As<ast::Ident>().import_path.empty()) {
    auto it = SizedIntegers().find(syntax->As<ast::Ident>().name);
    if (it == SizedIntegers().end()) return nullptr;
    AllOfItem all;
    all.elems.push_back(store_.Make(TypeItem{{"integer"}}));
    if (it->second.min) {
      all.elems.push_back(store_.Make(BoundsItem{Op::kGreaterThanEqual, *it->second.min}));
    }
    if (it->second.max) {
      all.elems.push_back(store_.Make(BoundsItem{Op::kLessThanEqual, *it->second.max}));
    }
    return store_.Make(std::move(all));
  }
  auto it = BuiltinFormats().find(v.BuiltinName());
  if (it == BuiltinFormats().end()) return nullptr;
  return Typed("string", store_.Make(FormatItem{it->second}));
}

SchemaItemPtr SchemaGenerator::MakeComparisonItem(const Value& v, Op op, const Value& arg) {
  Kind kind = arg.IncompleteKind();
  if (kind & kNumberKind) {
    std::string n;
    // A bound that is not known accepts anything.
    if (!arg.ToNumberLiteral(&n)) return store_.True();
    return store_.Make(AllOfItem{
        {store_.Make(BoundsItem{op, n}), store_.Make(TypeItem{{"number"}})}
    });
  }
  if (kind == kStringKind) {
    // Bounds on strings cannot be expressed.
    return store_.Make(TypeItem{{"string"}});
  }
  return Error(arg, "bad argument to unary comparison");
}

SchemaItemPtr SchemaGenerator::MakeCallItem(const Value& v, const std::vector<Value>& args) {
  if (args.empty()) return Error(v, "call operation with no function");
  std::string name = args[0].BuiltinName();
  size_t nargs = args.size() - 1;
  auto check_args = [&](size_t want) {
    if (nargs == want) return true;
    Error(
        v,
        name + " expects " + std::to_string(want) + " argument" + (want == 1 ? "" : "s") +
            ", got " + std::to_string(nargs)
    );
    return false;
  };
  auto int_arg = [&](int64_t* n) {
    if (args[1].ToInt64(n)) return true;
    Error(args[1], "argument of " + name + " must be a concrete integer");
    return false;
  };

  if (name == "strings.MinRunes" || name == "strings.MaxRunes") {
    int64_t n = 0;
    if (!check_args(1) || !int_arg(&n)) return store_.False();
    Op op = name == "strings.MinRunes" ? Op::kGreaterThanEqual : Op::kLessThanEqual;
    return Typed("string", store_.Make(LengthBoundsItem{op, n}));
  }
  if (name == "math.MultipleOf") {
    std::string n;
    if (!check_args(1)) return store_.False();
    if (!args[1].ToNumberLiteral(&n)) {
      return Error(args[1], "argument of " + name + " must be a number");
    }
    return Typed("number", store_.Make(MultipleOfItem{n}));
  }
  if (name == "time.Format") {
    std::string layout;
    if (!check_args(1)) return store_.False();
    if (!args[1].ToString(&layout)) {
      return Error(args[1], "argument of " + name + " must be a concrete string");
    }
    const char* format = TimeLayoutFormat(layout);
    // Other layouts are still strings.
    if (format == nullptr) return store_.Make(TypeItem{{"string"}});
    return Typed("string", store_.Make(FormatItem{format}));
  }
  if (name == "list.MinItems" || name == "list.MaxItems") {
    int64_t n = 0;
    if (!check_args(1) || !int_arg(&n)) return store_.False();
    Op op = name == "list.MinItems" ? Op::kGreaterThanEqual : Op::kLessThanEqual;
    return Typed("array", store_.Make(ItemsBoundsItem{op, n}));
  }
  if (name == "list.UniqueItems") {
    if (!check_args(0)) return store_.False();
    return Typed("array", store_.Make(UniqueItemsItem{}));
  }
  if (name == "list.MatchN") {
    if (!check_args(2)) return store_.False();
    ContainsItem contains;
    if (!ParseCount(args[1], &contains.min, &contains.max)) {
      return Error(args[1], "unsupported count in list.MatchN");
    }
    // One match is what contains means without minContains.
    if (contains.min == int64_t{1}) contains.min.reset();
    contains.elem = MakeItem(args[2]);
    return Typed("array", store_.Make(std::move(contains)));
  }
  if (name == "struct.MinFields" || name == "struct.MaxFields") {
    int64_t n = 0;
    if (!check_args(1) || !int_arg(&n)) return store_.False();
    Op op = name == "struct.MinFields" ? Op::kGreaterThanEqual : Op::kLessThanEqual;
    return Typed("object", store_.Make(PropertyBoundsItem{op, n}));
  }
  if (name == "matchN") {
    if (!check_args(2)) return store_.False();
    return MakeMatchNItem(v, args);
  }
  if (name == "matchIf") {
    if (!check_args(3)) return store_.False();
    IfThenElseItem item;
    item.if_elem = MakeItem(args[1]);
    item.then_elem = MakeItem(args[2]);
    item.else_elem = MakeItem(args[3]);
    if (item.then_elem->Is<TrueItem>()) item.then_elem = nullptr;
    if (item.else_elem->Is<TrueItem>()) item.else_elem = nullptr;
    if (!item.then_elem && !item.else_elem) return store_.True();
    return store_.Make(std::move(item));
  }
  if (name == "close") {
    if (!check_args(1)) return store_.False();
    return MakeItem(args[1].Closed());
  }
  if (name == "error") {
    // Allows nothing.
    return store_.False();
  }
  XSCHEMA_LOG(DEBUG) << "Call of " << (name.empty() ? ast::FormatExpr(v.Syntax()) : name)
                     << " at " << ast::PathString(v.Path()) << " accepts anything";
  return store_.True();
}

SchemaItemPtr SchemaGenerator::MakeMatchNItem(const Value& v, const std::vector<Value>& args) {
  std::vector<SchemaItemPtr> elems;
  for (const auto& elem : args[2].List().prefix) elems.push_back(MakeItem(elem));
  if (elems.empty()) return Error(args[2], "matchN requires a list of schemas");

  int64_t n = 0;
  if (args[1].ToInt64(&n)) {
    if (n == 0) {
      if (elems.size() == 1) return store_.Make(NotItem{elems[0]});
      return store_.Make(NotItem{store_.Make(AnyOfItem{std::move(elems)})});
    }
    if (n == 1) {
      if (elems.size() == 1) return elems[0];
      return store_.Make(OneOfItem{std::move(elems)});
    }
    if (n == static_cast<int64_t>(elems.size())) return store_.Make(AllOfItem{std::move(elems)});
    return Error(
        v,
        "cannot express matchN with count " + std::to_string(n) + " over " +
            std::to_string(elems.size()) + " schemas"
    );
  }
  std::optional<int64_t> min;
  std::optional<int64_t> max;
  if (ParseCount(args[1], &min, &max) && !max) {
    if (min.value_or(0) <= 0) return store_.True();
    if (*min == 1) {
      if (elems.size() == 1) return elems[0];
      return store_.Make(AnyOfItem{std::move(elems)});
    }
  }
  return Error(v, "cannot express matchN with count " + ast::FormatExpr(args[1].Syntax()));
}

namespace {

/*!
 * \brief Remove from a field's item the conjuncts a matching pattern constraint already implies.
 */
SchemaItemPtr StripRedundant(ItemStore* store, const SchemaItemPtr& item, const SchemaItemPtr& pattern) {
  if (item == pattern) return store->True();
  if (!item->Is<AllOfItem>()) return item;
  std::vector<SchemaItemPtr> implied =
      pattern->Is<AllOfItem>() ? pattern->As<AllOfItem>().elems : std::vector<SchemaItemPtr>{pattern};
  std::vector<SchemaItemPtr> remaining;
  for (const auto& elem : item->As<AllOfItem>().elems) {
    if (std::find(implied.begin(), implied.end(), elem) == implied.end()) remaining.push_back(elem);
  }
  if (remaining.size() == item->As<AllOfItem>().elems.size()) return item;
  if (remaining.empty()) return store->True();
  if (remaining.size() == 1) return remaining[0];
  return store->Make(AllOfItem{std::move(remaining)});
}

}  // namespace

SchemaItemPtr SchemaGenerator::MakeStructItem(const Value& v) {
  PropertiesItem props;
  std::vector<SchemaItemPtr> property_names;

  for (const auto& pattern : v.Patterns()) {
    SchemaItemPtr item = MakeItem(pattern.value);
    bool catch_all = IsCatchAllLabel(pattern.label);
    std::vector<Value> label_args;
    std::string re;
    if (item->Is<TrueItem>() && !catch_all) {
      // A constraint on the labels alone.
      property_names.push_back(store_.Make(PropertyNamesItem{MakeItem(pattern.label)}));
    } else if (pattern.label.Expr(&label_args) == Op::kRegexMatch && label_args[0].ToString(&re)) {
      props.pattern_properties.emplace_back(re, item);
    } else if (catch_all) {
      props.additional = props.additional ? store_.Make(AllOfItem{{props.additional, item}}) : item;
    } else {
      XSCHEMA_LOG(DEBUG) << "Pattern constraint " << ast::FormatExpr(pattern.label.Syntax())
                         << " at " << ast::PathString(v.Path()) << " cannot be expressed";
    }
  }
  std::sort(props.pattern_properties.begin(), props.pattern_properties.end(), [](const auto& a, const auto& b) {
    return a.first < b.first;
  });

  std::map<std::string, SchemaItemPtr> properties;
  for (const auto& field : v.Fields()) {
    bool required = field.constraint == FieldConstraint::kRequired ||
                    (field.constraint == FieldConstraint::kRegular && !field.value.IsConcrete());
    if (required &&
        std::find(props.required.begin(), props.required.end(), field.name) == props.required.end()) {
      props.required.push_back(field.name);
    }
    SchemaItemPtr item = MakeItem(field.value);
    for (const auto& [re, pattern_item] : props.pattern_properties) {
      if (RegexpMatches(re, field.name)) item = StripRedundant(&store_, item, pattern_item);
    }
    auto it = properties.find(field.name);
    if (it == properties.end()) {
      properties.emplace(field.name, item);
    } else {
      // A field declared more than once.
      it->second = store_.Make(AllOfItem{{it->second, item}});
    }
  }
  props.properties.assign(properties.begin(), properties.end());

  if (!props.additional) {
    switch (v.GetOpenness()) {
      case Openness::kExplicitlyOpen:
        if (config_.explicit_open) props.additional = store_.True();
        break;
      case Openness::kImplicitlyClosed:
        if (!config_.explicit_open) props.additional = store_.False();
        break;
      case Openness::kExplicitlyClosed:
        props.additional = store_.False();
        break;
      case Openness::kOpen:
        break;
    }
  }

  std::vector<SchemaItemPtr> elems;
  if (!props.properties.empty() || !props.required.empty() || !props.pattern_properties.empty() ||
      props.additional) {
    elems.push_back(store_.Make(std::move(props)));
  }
  elems.insert(elems.end(), property_names.begin(), property_names.end());
  if (elems.empty()) return store_.True();
  if (elems.size() == 1) return elems[0];
  return store_.Make(AllOfItem{std::move(elems)});
}

SchemaItemPtr SchemaGenerator::MakeListItem(const Value& v) {
  ListValue list = v.List();
  ItemsItem items;
  for (const auto& elem : list.prefix) items.prefix.push_back(MakeItem(elem));
  if (!list.open) {
    items.rest = store_.False();
  } else if (list.rest.Exists()) {
    items.rest = MakeItem(list.rest);
    if (items.rest->Is<TrueItem>()) items.rest = nullptr;
  }

  std::vector<SchemaItemPtr> elems;
  auto n = static_cast<int64_t>(items.prefix.size());
  if (!items.prefix.empty() || items.rest) elems.push_back(store_.Make(std::move(items)));
  if (n > 0) {
    elems.push_back(store_.Make(ItemsBoundsItem{Op::kGreaterThanEqual, n}));
    // A closed list has an exact length.
    if (!list.open) elems.push_back(store_.Make(ItemsBoundsItem{Op::kLessThanEqual, n}));
  }
  if (elems.empty()) return store_.True();
  if (elems.size() == 1) return elems[0];
  return store_.Make(AllOfItem{std::move(elems)});
}

}  // namespace xschema
