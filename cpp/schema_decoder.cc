/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/schema_decoder.cc
 */
#include "schema_decoder.h"

#include <algorithm>
#include <cmath>

#include "constraints.h"
#include "json_pointer.h"
#include "regexp_syntax.h"
#include "support/logging.h"
#include "version.h"

namespace xschema {

// ==================== JSONNode ====================

JSONNode JSONNode::Child(const std::string& key) const {
  const auto& obj = value->get<picojson::object>();
  auto it = obj.find(key);
  XSCHEMA_ICHECK(it != obj.end()) << "No member " << key << " at " << Location();
  JSONNode child{&it->second, tokens};
  child.tokens.push_back(key);
  return child;
}

JSONNode JSONNode::Index(size_t i) const {
  const auto& arr = value->get<picojson::array>();
  XSCHEMA_ICHECK(i < arr.size()) << "Index " << i << " out of range at " << Location();
  JSONNode child{&arr[i], tokens};
  child.tokens.push_back(std::to_string(i));
  return child;
}

std::string JSONNode::Location() const { return "#" + JSONPointerFromTokens(tokens); }

Kind JSONNode::GetKind() const {
  if (value == nullptr) return kBottomKind;
  if (value->is<picojson::null>()) return kNullKind;
  if (value->is<bool>()) return kBoolKind;
  // Integral numbers are stored as int64 and also report being a double; check int64 first.
  if (value->is<int64_t>()) return kIntKind;
  if (value->is<double>()) return kFloatKind;
  if (value->is<std::string>()) return kStringKind;
  if (value->is<picojson::array>()) return kListKind;
  return kStructKind;
}

// ==================== Helpers ====================

Kind CoreTypeKind(CoreType type) {
  switch (type) {
    case CoreType::kNull:
      return kNullKind;
    case CoreType::kBool:
      return kBoolKind;
    case CoreType::kNumber:
      return kNumberKind;
    case CoreType::kString:
      return kStringKind;
    case CoreType::kArray:
      return kListKind;
    case CoreType::kObject:
      return kStructKind;
  }
  XSCHEMA_UNREACHABLE();
}

namespace {

const char* CoreTypeName(CoreType type) {
  static const char* names[] = {"null", "bool", "number", "string", "array", "object"};
  return names[static_cast<int>(type)];
}

}  // namespace

ast::ExprPtr KindToAST(Kind kind, bool explicit_open) {
  switch (kind) {
    case kNullKind:
      return ast::NewNull();
    case kBoolKind:
      return ast::NewIdent("bool");
    case kNumberKind:
      return ast::NewIdent("number");
    case kIntKind:
      return ast::NewIdent("int");
    case kFloatKind:
      return ast::NewIdent("float");
    case kStringKind:
      return ast::NewIdent("string");
    case kListKind:
      return ast::NewList({ast::NewEllipsis()});
    case kStructKind:
      if (explicit_open) return ast::NewStruct();
      return ast::NewStruct({ast::NewEllipsisDecl()});
    default:
      XSCHEMA_LOG(FATAL) << "Unexpected kind " << KindString(kind);
  }
  XSCHEMA_UNREACHABLE();
}

ast::ExprPtr ErrorDisallowed() { return ast::NewBottom("disallowed"); }

void ConstraintInfo::Add(ast::ExprPtr expr) {
  if (!ast::IsIdent(expr, "_")) constraints.push_back(std::move(expr));
}

std::string SchemaInfo::Comment() const {
  auto trim = [](const std::string& str) {
    size_t begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::string();
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
  };
  std::string doc = trim(title);
  if (!description.empty()) {
    if (!doc.empty()) doc += "\n\n";
    doc = trim(doc + description);
  }
  return doc;
}

// ==================== SchemaState ====================

SchemaState::SchemaState(SchemaDecoder* decoder, SchemaState* up, JSONNode pos)
    : decoder(decoder), up(up), pos(std::move(pos)) {}

const ExtractConfig& SchemaState::Config() const { return decoder->Config(); }

ast::ExprPtr SchemaState::Errorf(const JSONNode& n, const std::string& msg) {
  decoder->AddError(n, msg);
  return ast::NewTop();
}

void SchemaState::WarnUnrecognizedKeyword(
    const std::string& key, const JSONNode& n, const std::string& msg
) {
  if (!Config().strict_keywords) {
    XSCHEMA_LOG(DEBUG) << "Ignoring keyword " << key << " at " << n.Location() << ": " << msg;
    return;
  }
  // OpenAPI-like versions allow any extension keyword.
  if (kOpenAPILike.Contains(info.schema_version) && StartsWith(key, "x-")) return;
  Errorf(n, msg);
}

bool SchemaState::BoolValue(const JSONNode& n, bool* result) {
  if (n.GetKind() != kBoolKind) {
    Errorf(n, "invalid bool");
    return false;
  }
  *result = n.value->get<bool>();
  return true;
}

bool SchemaState::StrValue(const JSONNode& n, std::string* result) {
  if (n.GetKind() != kStringKind) {
    Errorf(n, "invalid string");
    return false;
  }
  *result = n.value->get<std::string>();
  return true;
}

bool SchemaState::UintValue(const JSONNode& n, uint64_t* result) {
  switch (n.GetKind()) {
    case kIntKind: {
      int64_t v = n.value->get<int64_t>();
      if (v >= 0) {
        *result = static_cast<uint64_t>(v);
        return true;
      }
      break;
    }
    case kFloatKind: {
      double v = n.value->get<double>();
      if (v >= 0 && std::floor(v) == v && v < 18446744073709551616.0) {
        *result = static_cast<uint64_t>(v);
        return true;
      }
      break;
    }
    default:
      break;
  }
  Errorf(n, "invalid uint");
  return false;
}

ast::ExprPtr SchemaState::Number(const JSONNode& n) {
  if (n.GetKind() == kIntKind) return ast::NewInt(n.value->get<int64_t>());
  std::string text = ast::FormatNumber(n.value->get<double>());
  if (text.find_first_of(".eE") == std::string::npos) text += ".0";
  return ast::NewLit(ast::Token::kFloat, text);
}

std::vector<JSONNode> SchemaState::ListItems(
    const std::string& name, const JSONNode& n, bool allow_empty
) {
  std::vector<JSONNode> items;
  if (n.GetKind() != kListKind) {
    Errorf(n, "value of " + Quote(name) + " must be an array, found " + KindString(n.GetKind()));
    return items;
  }
  size_t size = n.value->get<picojson::array>().size();
  for (size_t i = 0; i < size; ++i) items.push_back(n.Index(i));
  if (!allow_empty && items.empty()) {
    Errorf(n, "array for " + Quote(name) + " must be non-empty");
  }
  return items;
}

void SchemaState::ProcessMap(
    const JSONNode& n, const std::function<void(const std::string&, const JSONNode&)>& f
) {
  if (n.GetKind() != kStructKind) return;
  for (const auto& [key, value] : n.value->get<picojson::object>()) {
    f(key, n.Child(key));
  }
}

ast::ExprPtr SchemaState::ConstValue(const JSONNode& n) {
  switch (n.GetKind()) {
    case kNullKind:
      return ast::NewNull();
    case kBoolKind:
      return ast::NewBool(n.value->get<bool>());
    case kIntKind:
    case kFloatKind:
      return Number(n);
    case kStringKind:
      return ast::NewString(n.value->get<std::string>());
    case kListKind: {
      std::vector<ast::ExprPtr> elts;
      for (const auto& item : ListItems("const", n, true)) elts.push_back(ConstValue(item));
      return ast::NewList(std::move(elts));
    }
    default: {
      std::vector<ast::DeclPtr> fields;
      ProcessMap(n, [&](const std::string& key, const JSONNode& value) {
        fields.push_back(ast::NewField(ast::Label::String(key), ConstValue(value), ast::Token::kNot));
      });
      return ast::NewCall(ast::NewIdent("close"), {ast::NewStruct(std::move(fields))});
    }
  }
}

ast::StructLit& SchemaState::Object(const JSONNode& n) {
  if (!obj) {
    obj = ast::NewStruct();
    obj_pos = n;
  }
  return obj->As<ast::StructLit>();
}

ast::Field* SchemaState::FindField(const std::string& name) {
  if (!obj) return nullptr;
  for (auto& decl : obj->As<ast::StructLit>().elts) {
    if (!decl->Is<ast::Field>()) continue;
    auto& field = decl->As<ast::Field>();
    if (field.label.type != ast::Label::Type::kPattern && field.label.name == name) return &field;
  }
  return nullptr;
}

void SchemaState::Add(const JSONNode& n, CoreType type, ast::ExprPtr expr) {
  types[static_cast<int>(type)].Add(std::move(expr));
}

bool SchemaState::CheckRegexp(const JSONNode& n, const std::string& pattern) {
  RegexpCheck check = CheckRegexpSyntax(pattern);
  switch (check.status) {
    case RegexpStatus::kOk:
      return true;
    case RegexpStatus::kUnsupported:
      // Valid in JSON Schema but not expressible; a missing feature rather than a bad pattern.
      if (Config().strict_features) {
        Errorf(n, "unsupported regexp syntax in " + Quote(pattern) + ": " + check.message);
      }
      return false;
    case RegexpStatus::kInvalid:
      Errorf(n, "invalid regexp " + Quote(pattern) + ": " + check.message);
      return false;
  }
  XSCHEMA_UNREACHABLE();
}

/****************** References ******************/

std::optional<URI> SchemaState::ResolveURI(const JSONNode& n) {
  std::string str;
  if (!StrValue(n, &str)) return std::nullopt;
  auto parsed = URI::Parse(str);
  if (parsed.IsErr()) {
    Errorf(n, std::string("invalid JSON reference: ") + parsed.ErrRef().what());
    return std::nullopt;
  }
  URI u = std::move(parsed).Unwrap();
  if (u.IsAbs()) {
    if (u.Host() == kDefaultRootIDHost) {
      Errorf(
          n,
          std::string("invalid use of default root ID host (") + kDefaultRootIDHost + ") in URI"
      );
      return std::nullopt;
    }
    return u;
  }
  return SchemaRoot()->info.id->ResolveReference(u);
}

SchemaState* SchemaState::SchemaRoot() {
  for (SchemaState* s = this; s != nullptr; s = s->up) {
    if (s->info.id) return s;
  }
  XSCHEMA_LOG(FATAL) << "No schema with an ID above " << pos.Location();
  XSCHEMA_UNREACHABLE();
}

void SchemaState::AddAnchor(const JSONNode& n, const std::string& name) {
  SchemaState* root = SchemaRoot();
  const auto& root_tokens = root->pos.tokens;
  std::vector<std::string> rel(pos.tokens.begin() + root_tokens.size(), pos.tokens.end());
  SchemaDecoder::Anchor anchor{pos, root->info.id->WithFragment(JSONPointerFromTokens(rel)).String()};
  decoder->RegisterAnchor(root->info.id->WithFragment(name).String(), std::move(anchor));
}

ast::ExprPtr SchemaState::MakeRef(const JSONNode& n, const URI& u) {
  const std::string& fragment = u.Fragment();
  URI base = u.WithoutFragment();
  const JSONNode* root = decoder->LookupID(base.String());
  DefinedSchema* def = nullptr;

  if (!fragment.empty() && fragment[0] != '/') {
    // A plain name fragment refers to an anchor.
    const SchemaDecoder::Anchor* anchor = decoder->LookupAnchor(u.String());
    if (anchor != nullptr) {
      def = decoder->DefineLocal(anchor->node, anchor->canonical_id, n);
    } else if (decoder->Pass() == 0) {
      // The anchor may be declared later in the document.
      decoder->RequestAnotherPass();
      return ast::NewTop();
    } else if (root != nullptr) {
      return Errorf(n, "cannot find anchor " + Quote(fragment) + " in " + Quote(base.String()));
    } else {
      def = decoder->DefineExternal(u, n);
    }
  } else if (root == nullptr) {
    if (decoder->Pass() == 0) {
      // A schema with this ID may be declared later in the document.
      decoder->RequestAnotherPass();
      return ast::NewTop();
    }
    def = decoder->DefineExternal(u, n);
  } else {
    auto tokens = JSONPointerTokens(fragment);
    if (tokens.IsErr()) {
      return Errorf(n, tokens.ErrRef().what());
    }
    const picojson::value* target = LookupJSONPointer(*root->value, tokens.ValueRef());
    if (target == nullptr) {
      return Errorf(n, "reference " + Quote(u.String()) + " does not refer to an existing value");
    }
    JSONNode target_node{target, root->tokens};
    for (const auto& token : tokens.ValueRef()) target_node.tokens.push_back(token);
    def = decoder->DefineLocal(target_node, u.String(), n);
  }
  if (def == nullptr) return nullptr;
  return RefExpr(n, *def);
}

ast::ExprPtr SchemaState::RefExpr(const JSONNode& n, const DefinedSchema& def) {
  if (def.import_path.empty()) {
    auto ref = decoder->Builder().GetRef(def.path);
    if (ref.IsErr()) {
      Errorf(n, std::string("cannot generate reference: ") + ref.ErrRef().what());
      return nullptr;
    }
    return std::move(ref).Unwrap();
  }
  auto qualifier = ImportQualifier(def.import_path);
  if (qualifier.IsErr()) {
    Errorf(n, qualifier.ErrRef().what());
    return nullptr;
  }
  ast::ExprPtr expr = ast::NewImportIdent(def.import_path, qualifier.ValueRef());
  for (const auto& sel : def.path) {
    if (sel.IsString() && !ast::IsValidIdent(sel.Name())) {
      Errorf(n, "cannot refer to " + Quote(sel.Name()) + " in package " + Quote(def.import_path));
      return nullptr;
    }
    expr = ast::NewSel(expr, sel);
  }
  return expr;
}

/****************** Translation ******************/

ast::ExprPtr SchemaState::Schema(const JSONNode& n) { return SubSchema(n, kAllTypes); }

ast::ExprPtr SchemaState::SubSchema(
    const JSONNode& n,
    Kind types,
    SchemaInfo* info_out,
    const std::function<void(SchemaState*)>& init
) {
  SchemaState s(decoder, this, n);
  s.info.schema_version = info.schema_version;
  s.info.allowed_types = types;
  s.info.known_types = kAllTypes;
  s.is_root = is_root && n.value == pos.value;
  s.preserve_unknown_fields = preserve_unknown_fields;
  if (init) init(&s);
  decoder->MarkVisited(n.value);
  auto expr = s.MaybeDefine(s.Translate());
  if (info_out != nullptr) *info_out = s.info;
  return expr;
}

void SchemaState::AddDefinitions(const std::string& key, const JSONNode& n) {
  if (n.GetKind() != kStructKind) {
    Errorf(n, Quote(key) + " expected an object, found " + KindString(n.GetKind()));
    return;
  }
  ProcessMap(n, [&](const std::string& name, const JSONNode& value) {
    // Each member is named even when nothing refers to it.
    SchemaState* root = SchemaRoot();
    std::vector<std::string> rel(value.tokens.begin() + root->pos.tokens.size(), value.tokens.end());
    decoder->DefineLocal(
        value, root->info.id->WithFragment(JSONPointerFromTokens(rel)).String(), value
    );
    Schema(value);
  });
}

void SchemaState::Dispatch(int phase, const std::string& key, const JSONNode& value) {
  const Constraint* c = LookupConstraint(key);
  if (c == nullptr) {
    // Extension keywords are never errors.
    if (StartsWith(key, "x-")) return;
    if (phase == 0 && Config().strict_keywords) {
      WarnUnrecognizedKeyword(key, value, "unknown keyword " + Quote(key));
    }
    return;
  }
  if (c->phase != phase) return;
  if (!c->versions.Contains(info.schema_version)) {
    WarnUnrecognizedKeyword(
        key,
        value,
        "keyword " + Quote(key) + " is not supported in JSON schema version " +
            VersionString(info.schema_version)
    );
    return;
  }
  if (phase > 0 && has_ref_keyword && key != "$ref" &&
      !VersionsFrom(Version::kDraft2019_09).Contains(info.schema_version)) {
    // Before 2019-09, the keywords next to $ref are ignored.
    WarnUnrecognizedKeyword(key, value, "ignoring keyword " + Quote(key) + " alongside $ref");
    return;
  }
  c->fn(key, value, this);
}

ast::ExprPtr SchemaState::Translate() {
  const JSONNode& n = pos;
  Kind kind = n.GetKind();
  if (kind == kBoolKind) {
    if (VersionsFrom(Version::kDraft6).Contains(info.schema_version)) {
      // From draft 6, true and false are schemas that always pass or fail.
      return n.value->get<bool>() ? ast::NewTop() : ErrorDisallowed();
    }
    return Errorf(n, "boolean schemas not supported in " + VersionString(info.schema_version));
  }
  if (kind != kStructKind) {
    return Errorf(n, "schema expects mapping node, found " + KindString(kind));
  }

  const auto& members = n.value->get<picojson::object>();
  has_ref_keyword = members.count("$ref") != 0;
  // $schema comes first as it selects the keywords, then the IDs as they are the base of the
  // anchors.
  static const char* kFirstKeys[] = {"$schema", "id", "$id"};
  for (int phase = 0; phase < kNumPhases; ++phase) {
    for (const char* key : kFirstKeys) {
      if (members.count(key)) Dispatch(phase, key, n.Child(key));
    }
    for (const auto& member : members) {
      const std::string& key = member.first;
      if (key == "$schema" || key == "id" || key == "$id") continue;
      Dispatch(phase, key, n.Child(key));
    }
    if (info.schema_version == Version::kKubernetesCRD && is_root) {
      // The root of a CRD is always a resource.
      const Constraint* c = LookupConstraint("x-kubernetes-embedded-resource");
      if (c->phase == phase) c->fn("x-kubernetes-embedded-resource", n, this);
    }
  }

  IfThenElse();
  if (info.schema_version == Version::kKubernetesCRD && has_properties &&
      has_additional_properties) {
    Errorf(
        n,
        "additionalProperties may not be combined with properties in " +
            VersionString(info.schema_version)
    );
  }
  if (kOpenAPILike.Contains(info.schema_version) && is_array && !has_items) {
    Errorf(
        n,
        "\"items\" must be present when the \"type\" is \"array\" in " +
            VersionString(info.schema_version)
    );
  }

  auto expr = Finalize();
  info.has_constraints = HasConstraints();
  return expr;
}

ast::ExprPtr SchemaState::MaybeDefine(ast::ExprPtr expr) {
  DefinedSchema* def = decoder->DefinitionForNode(pos.value);
  if (def == nullptr || (def->import_path.empty() && def->path.empty())) return expr;
  if (def->defined_pass == decoder->Pass()) {
    // Translated again in the same pass, e.g. as an extra schema.
    return RefExpr(pos, *def);
  }
  def->defined_pass = decoder->Pass();
  def->schema = expr;
  def->comment = info.Comment();
  if (def->import_path.empty()) {
    if (!decoder->Builder().Put(def->path, expr, def->comment)) {
      Errorf(pos, "redefinition of schema CUE path " + ast::PathString(def->path));
      return expr;
    }
  }
  auto ref = RefExpr(pos, *def);
  return ref ? ref : expr;
}

void SchemaState::IfThenElse() {
  if (!if_node.Exists() || (!then_node.Exists() && !else_node.Exists())) return;
  SchemaInfo if_info;
  auto if_expr = SubSchema(if_node, info.allowed_types, &if_info);
  // then only applies to the values that if accepts.
  auto then_expr = then_node.Exists()
                       ? SubSchema(then_node, info.allowed_types & if_info.allowed_types)
                       : ast::NewTop();
  auto else_expr = else_node.Exists() ? SubSchema(else_node, info.allowed_types) : ast::NewTop();
  all.Add(ast::NewCall(ast::NewIdent("matchIf"), {if_expr, then_expr, else_expr}));
}

void SchemaState::FinalizeList() {
  if (!has_prefix_items) return;
  // [] | [a] | [a, b, ...rest]: the prefix items only constrain the elements that are present.
  std::vector<ast::ExprPtr> disjuncts;
  for (size_t i = 0; i < prefix_items.size(); ++i) {
    disjuncts.push_back(
        ast::NewList(std::vector<ast::ExprPtr>(prefix_items.begin(), prefix_items.begin() + i))
    );
  }
  std::vector<ast::ExprPtr> full = prefix_items;
  if (!rest_disallowed) full.push_back(ast::NewEllipsis(rest_items));
  disjuncts.push_back(ast::NewList(std::move(full)));
  Add(list_pos, CoreType::kArray, ast::NewBinExpr(ast::Token::kOr, disjuncts));
}

void SchemaState::FinalizeObject() {
  if (!obj && info.schema_version == Version::kKubernetesCRD &&
      (info.allowed_types & kStructKind) != 0 && preserve_unknown_fields) {
    // The ellipsis must be explicit even without properties.
    Object(pos);
  }
  if (!obj) return;
  if (preserve_unknown_fields) openness = ObjectOpenness::kExplicitlyOpen;
  ast::ExprPtr e = obj;
  if (Config().open_only_when_explicit && openness == ObjectOpenness::kImplicitlyOpen) {
    // Left implicitly open as configured.
  } else if (openness == ObjectOpenness::kAllFieldsCovered) {
    // A pattern constraint covers all other fields.
  } else if (openness == ObjectOpenness::kExplicitlyClosed) {
    e = ast::NewCall(ast::NewIdent("close"), {obj});
  } else {
    obj->As<ast::StructLit>().elts.push_back(ast::NewEllipsisDecl());
  }
  Add(obj_pos, CoreType::kObject, e);
}

ast::ExprPtr SchemaState::Finalize() {
  if (info.allowed_types == kBottomKind) {
    // Not necessarily a problem: the schema may be one branch of a combinator.
    return ErrorDisallowed();
  }
  FinalizeList();
  FinalizeObject();

  // Literal lists and structs go last.
  auto literal_last = [](std::vector<ast::ExprPtr>* exprs, auto is_literal) {
    std::stable_sort(exprs->begin(), exprs->end(), [&](const auto& a, const auto& b) {
      return !is_literal(a) && is_literal(b);
    });
  };
  literal_last(&types[static_cast<int>(CoreType::kArray)].constraints, [](const ast::ExprPtr& e) {
    return e->Is<ast::ListLit>();
  });
  literal_last(&types[static_cast<int>(CoreType::kObject)].constraints, [](const ast::ExprPtr& e) {
    return e->Is<ast::StructLit>();
  });

  std::vector<ast::ExprPtr> conjuncts;
  std::vector<ast::ExprPtr> disjuncts;

  bool needs_type_disjunction = info.allowed_types != info.known_types;
  for (int i = 0; i < kNumCoreTypes && !needs_type_disjunction; ++i) {
    Kind k = CoreTypeKind(static_cast<CoreType>(i));
    if (!types[i].constraints.empty() && (info.allowed_types & k) != 0) {
      needs_type_disjunction = true;
    }
  }

  if (needs_type_disjunction) {
    int npossible = 0;
    std::vector<std::pair<CoreType, const ConstraintInfo*>> excluded;
    for (int i = 0; i < kNumCoreTypes; ++i) {
      auto type = static_cast<CoreType>(i);
      Kind k = CoreTypeKind(type);
      bool allowed = (info.allowed_types & k) != 0;
      if (!types[i].constraints.empty()) {
        ++npossible;
        if (!allowed) {
          excluded.emplace_back(type, &types[i]);
          continue;
        }
        disjuncts.push_back(ast::NewBinExpr(ast::Token::kAnd, types[i].constraints));
      } else if (allowed) {
        ++npossible;
        if ((info.known_types & k) != 0) {
          // An integer type is known from the `int` constraint.
          Kind kind = (k == kNumberKind && (info.allowed_types & kNumberKind) == kIntKind)
                          ? kIntKind
                          : k;
          disjuncts.push_back(KindToAST(kind, Config().open_only_when_explicit));
        }
      }
    }
    if (npossible > 0 && excluded.size() == static_cast<size_t>(npossible)) {
      for (const auto& [type, constraint_info] : excluded) {
        Errorf(
            pos,
            std::string("constraint not allowed because type ") + CoreTypeName(type) +
                " is excluded"
        );
      }
    }
  }
  for (const auto& c : all.constraints) conjuncts.push_back(c);
  if (!disjuncts.empty()) conjuncts.push_back(ast::NewBinExpr(ast::Token::kOr, disjuncts));

  ast::ExprPtr e = conjuncts.empty() ? ast::NewTop() : ast::NewBinExpr(ast::Token::kAnd, conjuncts);
  if (nullable) e = ast::NewBinary(ast::Token::kOr, nullable, e);

  if (info.id) {
    // The ID is kept in the output.
    auto tag = ast::NewAttributeDecl("@jsonschema(id=" + Quote(info.id->String()) + ")");
    if (e->Is<ast::StructLit>()) {
      auto& elts = e->As<ast::StructLit>().elts;
      elts.insert(elts.begin(), tag);
    } else {
      e = ast::NewStruct({tag, ast::NewEmbed(e)});
    }
  }

  // All allowed types are now explicit in the syntax.
  info.known_types = info.allowed_types;
  return e;
}

bool SchemaState::HasConstraints() const {
  if (!all.constraints.empty()) return true;
  for (const auto& t : types) {
    if (!t.constraints.empty()) return true;
  }
  return !patterns.empty() || !info.title.empty() || !info.description.empty() || obj ||
         info.id.has_value();
}

// ==================== SchemaDecoder ====================

SchemaDecoder::SchemaDecoder(const picojson::value& root, ExtractConfig config, URI root_id)
    : root_(root), config_(std::move(config)), root_id_(std::move(root_id)) {}

void SchemaDecoder::AddError(const JSONNode& n, const std::string& msg) {
  diagnostics_.push_back(SchemaDiagnostic{n.Exists() ? n.Location() : "", msg});
}

void SchemaDecoder::RegisterID(const URI& id, const JSONNode& node) {
  ids_.emplace(id.WithoutFragment().String(), node);
}

const JSONNode* SchemaDecoder::LookupID(const std::string& uri) const {
  auto it = ids_.find(uri);
  return it == ids_.end() ? nullptr : &it->second;
}

void SchemaDecoder::RegisterAnchor(const std::string& uri, Anchor anchor) {
  anchors_.emplace(uri, std::move(anchor));
}

const SchemaDecoder::Anchor* SchemaDecoder::LookupAnchor(const std::string& uri) const {
  auto it = anchors_.find(uri);
  return it == anchors_.end() ? nullptr : &it->second;
}

DefinedSchema* SchemaDecoder::DefineLocal(
    const JSONNode& target, const std::string& canonical_id, const JSONNode& site
) {
  auto node_it = def_for_node_.find(target.value);
  if (node_it != def_for_node_.end()) return node_it->second;
  auto def_it = defs_.find(canonical_id);
  if (def_it != defs_.end()) {
    def_for_node_[target.value] = def_it->second.get();
    return def_it->second.get();
  }
  SchemaLoc loc;
  loc.id = canonical_id;
  loc.is_local = true;
  loc.path = target.tokens;
  MappedLocation mapped;
  try {
    mapped = config_.map_ref(loc);
  } catch (const std::exception& e) {
    // Not cached, so that every pass reports it.
    AddError(site, "cannot get reference for " + loc.ToString() + ": " + e.what());
    return nullptr;
  }
  auto def = std::make_unique<DefinedSchema>();
  def->import_path = std::move(mapped.import_path);
  def->path = std::move(mapped.path);
  def->is_local = true;
  def->node = target;
  if (!def->import_path.empty() && !config_.define_schema) {
    XSCHEMA_LOG(WARNING) << "Schema at " << target.Location() << " is mapped to package "
                         << def->import_path << " but no define_schema callback is set";
  }
  DefinedSchema* result = def.get();
  def_for_node_[target.value] = result;
  defs_.emplace(canonical_id, std::move(def));
  return result;
}

DefinedSchema* SchemaDecoder::DefineExternal(const URI& uri, const JSONNode& site) {
  std::string id = uri.String();
  auto it = defs_.find(id);
  if (it != defs_.end()) return it->second.get();
  SchemaLoc loc;
  loc.id = id;
  loc.is_local = false;
  MappedLocation mapped;
  try {
    mapped = config_.map_ref(loc);
  } catch (const std::exception& e) {
    AddError(site, "cannot get reference for " + loc.ToString() + ": " + e.what());
    return nullptr;
  }
  auto def = std::make_unique<DefinedSchema>();
  def->import_path = std::move(mapped.import_path);
  def->path = std::move(mapped.path);
  DefinedSchema* result = def.get();
  defs_.emplace(id, std::move(def));
  return result;
}

DefinedSchema* SchemaDecoder::DefinitionForNode(const picojson::value* node) const {
  auto it = def_for_node_.find(node);
  return it == def_for_node_.end() ? nullptr : it->second;
}

Result<std::vector<std::string>> SchemaDecoder::ParseRootRef(const std::string& str) {
  auto parsed = URI::Parse(str);
  if (parsed.IsErr()) {
    return ResultErr(std::string("invalid JSON reference: ") + parsed.ErrRef().what());
  }
  const URI& u = parsed.ValueRef();
  if (!u.Host().empty() || !u.PathPart().empty() || !u.Opaque().empty()) {
    return ResultErr("external references (" + str + ") not supported in Root");
  }
  // "#/" is accepted for the document itself, and "#/components/schemas/" for its members.
  std::string fragment = u.Fragment();
  if (EndsWith(fragment, "/")) fragment.pop_back();
  return JSONPointerTokens(fragment);
}

ast::FilePtr SchemaDecoder::Decode() {
  JSONNode doc{&root_, {}};
  JSONNode schema = doc;
  JSONNode defs_root;
  if (!config_.root.empty()) {
    auto tokens = ParseRootRef(config_.root);
    if (tokens.IsErr()) {
      AddError(
          JSONNode(),
          "invalid Config.Root value " + Quote(config_.root) + ": " + tokens.ErrRef().what()
      );
      return nullptr;
    }
    JSONNode root_node{LookupJSONPointer(root_, tokens.ValueRef()), tokens.ValueRef()};
    if (!root_node.Exists() && !config_.allow_non_existent_root) {
      AddError(doc, "root value at path " + config_.root + " does not exist");
      return nullptr;
    }
    if (config_.single_root) {
      if (!root_node.Exists()) return std::make_shared<ast::File>();
      schema = root_node;
    } else {
      if (!root_node.Exists()) root_node.value = &empty_root_;
      if (root_node.GetKind() != kStructKind) {
        AddError(
            root_node,
            "value at path " + config_.root +
                " must be struct containing definitions but is actually " +
                KindString(root_node.GetKind())
        );
        return nullptr;
      }
      defs_root = root_node;
    }
  }

  RegisterID(root_id_, doc);
  SchemaInfo root_info;
  // Nodes that are referred to but not reached by the traversal of the schema.
  std::vector<JSONNode> extra_schemas;
  std::unordered_set<const picojson::value*> extra_set;
  for (pass_ = 0;; ++pass_) {
    if (pass_ > kMaxPasses) {
      AddError(doc, "internal error: too many passes without resolution");
      return nullptr;
    }
    diagnostics_.clear();
    builder_ = StructBuilder();
    visited_.clear();
    need_another_pass_ = false;
    for (auto& [id, def] : defs_) def->schema = nullptr;

    SchemaState root(this, nullptr, doc);
    root.info.schema_version = config_.default_version;
    root.info.id = root_id_;
    root.is_root = true;

    if (defs_root.Exists()) {
      root.AddDefinitions("schemas", defs_root);
    } else {
      SchemaInfo info;
      auto expr = root.SubSchema(schema, kAllTypes, &info, [](SchemaState* s) {
        s->is_root = true;
      });
      if (info.allowed_types == kBottomKind) {
        AddError(schema, "constraints are not possible to satisfy");
        return nullptr;
      }
      if (!builder_.Put({}, expr, info.Comment())) {
        AddError(schema, "duplicate definition at root");
        return nullptr;
      }
      root_info = info;
    }
    for (const auto& node : extra_schemas) {
      // Extra schemas are translated as if they were directly under the root.
      root.Schema(node);
    }

    bool dangling = false;
    for (const auto& [id, def] : defs_) {
      if (!def->is_local || def->schema != nullptr || !def->import_path.empty() ||
          def->path.empty()) {
        continue;
      }
      dangling = true;
      if (!visited_.count(def->node.value) && extra_set.insert(def->node.value).second) {
        XSCHEMA_LOG(DEBUG) << "Translating " << def->node.Location()
                           << " as it is referred to from outside the schema";
        extra_schemas.push_back(def->node);
      }
    }
    if (!need_another_pass_ && !dangling) break;
    XSCHEMA_LOG(DEBUG) << "Starting decoder pass " << pass_ + 1;
  }

  if (config_.define_schema) {
    // Tell the caller about the local schemas that are mapped to another package.
    for (const auto& [id, def] : defs_) {
      if (def->is_local && def->schema != nullptr && !def->import_path.empty()) {
        config_.define_schema(def->import_path, def->path, def->schema);
      }
    }
  }

  auto syntax = builder_.Syntax();
  if (syntax.IsErr()) {
    AddError(doc, std::string("cannot build final syntax: ") + syntax.ErrRef().what());
    return nullptr;
  }
  return MakeFile(std::move(syntax).Unwrap(), root_info);
}

ast::FilePtr SchemaDecoder::MakeFile(ast::ExprPtr expr, const SchemaInfo& root_info) {
  auto file = std::make_shared<ast::File>();
  file->package = config_.pkg_name;
  file->doc = root_info.Comment();
  if (root_info.schema_version_present) {
    file->attrs.push_back(
        ast::Attribute{"@jsonschema(schema=" + Quote(VersionString(root_info.schema_version)) + ")"}
    );
  }
  if (root_info.deprecated) {
    file->attrs.push_back(ast::Attribute{"@deprecated()"});
  }
  if (expr->Is<ast::StructLit>()) {
    file->decls = expr->As<ast::StructLit>().elts;
  } else {
    file->decls.push_back(ast::NewEmbed(expr));
  }
  for (const auto& qualifier : ast::CollectImports(file.get())) {
    diagnostics_.push_back(SchemaDiagnostic{
        "", "import qualifier " + Quote(qualifier) + " is used for more than one package"
    });
  }
  return file;
}

// ==================== Mapping of locations ====================

Result<std::string> ImportQualifier(const std::string& import_path) {
  std::string path = import_path;
  std::string qualifier;
  size_t colon = path.rfind(':');
  if (colon != std::string::npos && path.find('/', colon) == std::string::npos) {
    qualifier = path.substr(colon + 1);
    path = path.substr(0, colon);
  }
  if (qualifier.empty()) {
    size_t at = path.rfind('@');
    if (at != std::string::npos && path.find('/', at) == std::string::npos) {
      path = path.substr(0, at);
    }
    size_t slash = path.rfind('/');
    qualifier = slash == std::string::npos ? path : path.substr(slash + 1);
  }
  if (!ast::IsValidIdent(qualifier) || ast::IsDefOrHidden(qualifier)) {
    return ResultErr("cannot determine package name from import path " + Quote(import_path));
  }
  return ResultOk(qualifier);
}

ast::Path DefaultMap(const std::vector<std::string>& tokens) {
  if (tokens.empty()) return {};
  if (tokens.size() == 2 && (tokens[0] == "$defs" || tokens[0] == "definitions")) {
    const std::string& name = tokens[1];
    std::string ident = "#" + name;
    if (ast::IsValidIdent(ident)) return {ast::Selector::Ident(ident)};
    return {ast::Selector::Ident("#"), ast::Selector::Str(name)};
  }
  return {ast::Selector::Ident("_#defs"), ast::Selector::Str(JSONPointerFromTokens(tokens))};
}

MappedLocation MapRefWith(
    const SchemaLoc& loc,
    const std::function<ast::Path(const std::vector<std::string>&)>& map,
    const std::function<MappedLocation(const std::string&)>& map_url
) {
  MappedLocation result;
  std::string fragment;
  if (loc.is_local) {
    fragment = JSONPointerFromTokens(loc.path);
  } else {
    auto parsed = URI::Parse(loc.id);
    if (parsed.IsErr()) {
      throw std::runtime_error(std::string("invalid URI: ") + parsed.ErrRef().what());
    }
    const URI& u = parsed.ValueRef();
    result = map_url(u.WithoutFragment().String());
    fragment = u.Fragment();
  }
  if (!fragment.empty() && fragment[0] != '/') {
    throw std::runtime_error("anchors (" + fragment + ") not supported");
  }
  auto tokens = JSONPointerTokens(fragment);
  if (tokens.IsErr()) throw std::runtime_error(tokens.ErrRef().what());
  for (auto& sel : map(tokens.ValueRef())) result.path.push_back(std::move(sel));
  return result;
}

}  // namespace xschema
