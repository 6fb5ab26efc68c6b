/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/constraints.cc
 * \brief The keyword table and the keywords that apply to every type.
 */
#include "constraints.h"

#include <cctype>
#include <unordered_map>

#include "support/logging.h"

namespace xschema {

namespace {

constexpr VersionSet kFromDraft6 = VersionsFrom(Version::kDraft6);
constexpr VersionSet kFromDraft7 = VersionsFrom(Version::kDraft7);
constexpr VersionSet kFrom2019 = VersionsFrom(Version::kDraft2019_09);
constexpr VersionSet kFrom2020 = VersionsFrom(Version::kDraft2020_12);

}  // namespace

const Constraint* LookupConstraint(const std::string& key) {
  static const std::unordered_map<std::string, Constraint> constraints = {
      // Phase 0: the dialect and the base URI.
      {"$schema", {0, kAllVersions, ConstraintSchema}},
      {"$id", {0, kFromDraft6 | kOpenAPILike, ConstraintID}},
      {"id", {0, VersionsTo(Version::kDraft4), ConstraintID}},
      {"$anchor", {0, kFrom2019, ConstraintAnchor}},

      // Phase 1.
      {"$comment", {1, kFromDraft7, ConstraintAnnotation}},
      {"$defs", {1, kFrom2019, ConstraintAddDefinitions}},
      {"definitions", {1, kAllDrafts, ConstraintAddDefinitions}},
      {"$ref", {1, kAllVersions, ConstraintRef}},
      {"$dynamicAnchor", {1, kFrom2020, ConstraintTODO}},
      {"$dynamicRef", {1, kFrom2020, ConstraintTODO}},
      {"$recursiveAnchor", {1, VersionsOf(Version::kDraft2019_09), ConstraintTODO}},
      {"$recursiveRef", {1, VersionsOf(Version::kDraft2019_09), ConstraintTODO}},
      {"$vocabulary", {1, kFrom2019, ConstraintTODO}},
      {"const", {1, kFromDraft6 | kOpenAPILike, ConstraintConst}},
      {"contentEncoding", {1, kFromDraft7, ConstraintAnnotation}},
      {"contentMediaType", {1, kFromDraft7, ConstraintAnnotation}},
      {"contentSchema", {1, kFrom2019, ConstraintTODO}},
      {"default", {1, kAllVersions, ConstraintAnnotation}},
      {"dependencies", {1, VersionsTo(Version::kDraft7), ConstraintTODO}},
      {"dependentRequired", {1, kFrom2019, ConstraintTODO}},
      {"dependentSchemas", {1, kFrom2019, ConstraintTODO}},
      {"deprecated", {1, kFrom2019 | kOpenAPILike, ConstraintDeprecated}},
      {"description", {1, kAllVersions, ConstraintDescription}},
      {"discriminator", {1, kOpenAPI, ConstraintTODO}},
      {"else", {1, kFromDraft7, ConstraintElse}},
      {"enum", {1, kAllVersions, ConstraintEnum}},
      {"example", {1, kOpenAPILike, ConstraintAnnotation}},
      {"examples", {1, kFromDraft6, ConstraintExamples}},
      {"exclusiveMaximum", {1, kAllVersions, ConstraintExclusiveMaximum}},
      {"exclusiveMinimum", {1, kAllVersions, ConstraintExclusiveMinimum}},
      {"externalDocs", {1, kOpenAPI, ConstraintTODO}},
      {"format", {1, kAllVersions, ConstraintFormat}},
      {"if", {1, kFromDraft7, ConstraintIf}},
      {"maxContains", {1, kFrom2019, ConstraintMaxContains}},
      {"maxItems", {1, kAllVersions, ConstraintMaxItems}},
      {"maxLength", {1, kAllVersions, ConstraintMaxLength}},
      {"maxProperties", {1, kAllVersions, ConstraintMaxProperties}},
      {"minContains", {1, kFrom2019, ConstraintMinContains}},
      {"minItems", {1, kAllVersions, ConstraintMinItems}},
      {"minLength", {1, kAllVersions, ConstraintMinLength}},
      {"minProperties", {1, kAllVersions, ConstraintMinProperties}},
      {"multipleOf", {1, kAllVersions, ConstraintMultipleOf}},
      {"not", {1, kAllVersions, ConstraintNot}},
      {"nullable", {1, kOpenAPILike, ConstraintNullable}},
      {"pattern", {1, kAllVersions, ConstraintPattern}},
      {"prefixItems", {1, kFrom2020, ConstraintPrefixItems}},
      {"properties", {1, kAllVersions, ConstraintProperties}},
      {"propertyNames", {1, kFromDraft6, ConstraintPropertyNames}},
      {"readOnly", {1, kFromDraft7 | kOpenAPILike, ConstraintAnnotation}},
      {"then", {1, kFromDraft7, ConstraintThen}},
      {"title", {1, kAllVersions, ConstraintTitle}},
      {"type", {1, kAllVersions, ConstraintType}},
      {"unevaluatedItems", {1, kFrom2019, ConstraintTODO}},
      {"unevaluatedProperties", {1, kFrom2019, ConstraintTODO}},
      {"uniqueItems", {1, kAllVersions, ConstraintUniqueItems}},
      {"writeOnly", {1, kFromDraft7 | kOpenAPILike, ConstraintAnnotation}},
      {"xml", {1, kOpenAPI, ConstraintTODO}},
      {"x-kubernetes-group-version-kind", {1, kKubernetes, ConstraintGroupVersionKind}},
      {"x-kubernetes-int-or-string", {1, kKubernetes, ConstraintIntOrString}},
      {"x-kubernetes-list-map-keys", {1, kKubernetes, ConstraintTODO}},
      {"x-kubernetes-list-type", {1, kKubernetes, ConstraintTODO}},
      {"x-kubernetes-map-type", {1, kKubernetes, ConstraintTODO}},
      {"x-kubernetes-preserve-unknown-fields", {1, kKubernetes, ConstraintPreserveUnknownFields}},
      {"x-kubernetes-validations", {1, kKubernetes, ConstraintTODO}},

      // Phase 2: keywords that need the type, the exclusivity flags, the properties or the
      // prefix items.
      {"allOf", {2, kAllVersions, ConstraintAllOf}},
      {"anyOf", {2, kAllVersions, ConstraintAnyOf}},
      {"contains", {2, kFromDraft6, ConstraintContains}},
      {"items", {2, kAllVersions, ConstraintItems}},
      {"maximum", {2, kAllVersions, ConstraintMaximum}},
      {"minimum", {2, kAllVersions, ConstraintMinimum}},
      {"oneOf", {2, kAllVersions, ConstraintOneOf}},
      {"patternProperties", {2, kAllDrafts | kKubernetes, ConstraintPatternProperties}},
      {"required", {2, kAllVersions, ConstraintRequired}},
      {"x-kubernetes-embedded-resource", {2, kKubernetes, ConstraintEmbeddedResource}},

      // Phase 3: keywords that need everything else about the object or the list.
      {"additionalItems", {3, VersionsTo(Version::kDraft2019_09), ConstraintAdditionalItems}},
      {"additionalProperties", {3, kAllVersions, ConstraintAdditionalProperties}},
  };
  auto it = constraints.find(key);
  return it == constraints.end() ? nullptr : &it->second;
}

/****************** Generic keywords ******************/

void ConstraintSchema(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (!s->is_root && !VersionsFrom(Version::kDraft2019_09).Contains(s->info.schema_version)) {
    // Before 2019-09, $schema may only appear at the root.
    s->Errorf(
        n,
        "$schema can only appear at the root in JSON schema version " +
            VersionString(s->info.schema_version)
    );
    return;
  }
  std::string str;
  if (!s->StrValue(n, &str)) return;
  auto version = ParseVersion(str);
  if (version.IsErr()) {
    s->Errorf(n, "invalid $schema URL " + Quote(str) + ": " + version.ErrRef().what());
    return;
  }
  s->info.schema_version_present = true;
  s->info.schema_version = std::move(version).Unwrap();
}

void ConstraintID(const std::string& key, const JSONNode& n, SchemaState* s) {
  auto u = s->ResolveURI(n);
  if (!u) return;
  if (u->HasFragment() && !u->Fragment().empty()) {
    const std::string& fragment = u->Fragment();
    // Drafts 6 and 7 allow a plain name fragment, which acts as an anchor.
    if (VersionsBetween(Version::kDraft6, Version::kDraft7).Contains(s->info.schema_version) &&
        fragment[0] != '/') {
      URI base = u->WithoutFragment();
      if (base != s->SchemaRoot()->info.id->WithoutFragment()) {
        s->info.id = base;
        s->decoder->RegisterID(base, s->pos);
      }
      s->AddAnchor(n, fragment);
      return;
    }
    if (s->Config().strict_features) {
      s->Errorf(n, "$id URI may not contain a fragment");
    }
    return;
  }
  s->info.id = u->WithoutFragment();
  s->decoder->RegisterID(*s->info.id, s->pos);
}

void ConstraintAnchor(const std::string& key, const JSONNode& n, SchemaState* s) {
  std::string name;
  if (!s->StrValue(n, &name)) return;
  // An anchor is a letter followed by letters, digits and "-_.:".
  bool valid = !name.empty() && std::isalpha(static_cast<unsigned char>(name[0]));
  for (char c : name) {
    valid = valid && (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
                      c == '.' || c == ':');
  }
  if (!valid) {
    s->Errorf(n, "invalid $anchor " + Quote(name));
    return;
  }
  s->AddAnchor(n, name);
}

void ConstraintRef(const std::string& key, const JSONNode& n, SchemaState* s) {
  auto u = s->ResolveURI(n);
  if (!u) return;
  auto expr = s->MakeRef(n, *u);
  if (expr) s->all.Add(std::move(expr));
}

void ConstraintAddDefinitions(const std::string& key, const JSONNode& n, SchemaState* s) {
  s->AddDefinitions(key, n);
}

void ConstraintAnnotation(const std::string& key, const JSONNode& n, SchemaState* s) {}

void ConstraintTitle(const std::string& key, const JSONNode& n, SchemaState* s) {
  s->StrValue(n, &s->info.title);
}

void ConstraintDescription(const std::string& key, const JSONNode& n, SchemaState* s) {
  s->StrValue(n, &s->info.description);
}

void ConstraintDeprecated(const std::string& key, const JSONNode& n, SchemaState* s) {
  bool deprecated = false;
  if (s->BoolValue(n, &deprecated) && deprecated) {
    s->info.deprecated = true;
  }
}

void ConstraintExamples(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (n.GetKind() != kListKind) {
    s->Errorf(n, "value of \"examples\" must be an array, found " + KindString(n.GetKind()));
  }
}

void ConstraintType(const std::string& key, const JSONNode& n, SchemaState* s) {
  Kind types = kBottomKind;
  auto set = [&](const JSONNode& t) {
    std::string str;
    if (!s->StrValue(t, &str)) return;
    if (str == "null") {
      types |= kNullKind;
    } else if (str == "boolean") {
      types |= kBoolKind;
    } else if (str == "string") {
      types |= kStringKind;
    } else if (str == "number") {
      types |= kNumberKind;
    } else if (str == "integer") {
      types |= kIntKind;
      s->Add(t, CoreType::kNumber, ast::NewIdent("int"));
    } else if (str == "array") {
      types |= kListKind;
      s->is_array = true;
    } else if (str == "object") {
      types |= kStructKind;
    } else {
      s->Errorf(t, "unknown type " + Quote(str));
    }
  };

  switch (n.GetKind()) {
    case kStringKind:
      set(n);
      break;
    case kListKind:
      for (size_t i = 0; i < n.value->get<picojson::array>().size(); ++i) {
        set(n.Index(i));
      }
      break;
    default:
      s->Errorf(n, "value of \"type\" must be a string or list of strings");
      return;
  }
  s->info.allowed_types &= types;
}

void ConstraintEnum(const std::string& key, const JSONNode& n, SchemaState* s) {
  std::vector<ast::ExprPtr> values;
  Kind types = kBottomKind;
  for (const auto& item : s->ListItems("enum", n, true)) {
    Kind kind = item.GetKind();
    // Values of a type the schema does not allow can never match.
    if ((s->info.allowed_types & kind) == 0) continue;
    values.push_back(s->ConstValue(item));
    types |= kind;
  }
  s->info.known_types &= types;
  s->info.allowed_types &= types;
  if (!values.empty()) {
    s->all.Add(ast::NewBinExpr(ast::Token::kOr, values));
  }
}

void ConstraintConst(const std::string& key, const JSONNode& n, SchemaState* s) {
  s->all.Add(s->ConstValue(n));
  s->info.allowed_types &= n.GetKind();
  s->info.known_types &= n.GetKind();
}

void ConstraintNullable(const std::string& key, const JSONNode& n, SchemaState* s) {
  bool nullable = false;
  if (s->BoolValue(n, &nullable) && nullable) {
    s->nullable = ast::NewNull();
  }
}

void ConstraintTODO(const std::string& key, const JSONNode& n, SchemaState* s) {
  if (s->Config().strict_features) {
    s->Errorf(n, "keyword " + Quote(key) + " not yet implemented");
    return;
  }
  XSCHEMA_LOG(DEBUG) << "Ignoring keyword " << key << " at " << n.Location();
}

}  // namespace xschema
