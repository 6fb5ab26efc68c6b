/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/constraints_kubernetes.cc
 * \brief The Kubernetes extensions to the OpenAPI schema object.
 */
#include "constraints.h"

namespace xschema {

namespace {

/*! \brief metadata!: {name!: string, namespace?: string, labels?: ..., annotations?: ..., ...} */
ast::ExprPtr ObjectMeta() {
  auto string_map = [] {
    return ast::NewStruct(
        {ast::NewField(ast::Label::Pattern(ast::NewIdent("string")), ast::NewIdent("string"))}
    );
  };
  return ast::NewStruct({
      ast::NewField(ast::Label::Ident("name"), ast::NewIdent("string"), ast::Token::kNot),
      ast::NewField(ast::Label::Ident("namespace"), ast::NewIdent("string"), ast::Token::kOption),
      ast::NewField(ast::Label::Ident("labels"), string_map(), ast::Token::kOption),
      ast::NewField(ast::Label::Ident("annotations"), string_map(), ast::Token::kOption),
      ast::NewEllipsisDecl(),
  });
}

}  // namespace

void ConstraintPreserveUnknownFields(const std::string& key, const JSONNode& n, SchemaState* s) {
  s->BoolValue(n, &s->preserve_unknown_fields);
}

void ConstraintIntOrString(const std::string& key, const JSONNode& n, SchemaState* s) {
  bool int_or_string = false;
  if (!s->BoolValue(n, &int_or_string) || !int_or_string) return;
  Kind types = kStringKind | kIntKind;
  s->info.allowed_types &= types;
  s->info.known_types &= types;
  s->all.Add(ast::NewBinary(ast::Token::kOr, ast::NewIdent("int"), ast::NewIdent("string")));
}

void ConstraintGroupVersionKind(const std::string& key, const JSONNode& n, SchemaState* s) {
  auto items = s->ListItems(key, n, true);
  // The values are only known when there is exactly one kind.
  if (items.size() != 1) return;
  const JSONNode& gvk = items[0];
  if (gvk.GetKind() != kStructKind) {
    s->Errorf(gvk, "value of " + Quote(key) + " must be a list of objects");
    return;
  }
  std::string group, version, kind;
  const auto& obj = gvk.value->get<picojson::object>();
  if (obj.count("group")) s->StrValue(gvk.Child("group"), &group);
  if (obj.count("version")) s->StrValue(gvk.Child("version"), &version);
  if (obj.count("kind")) s->StrValue(gvk.Child("kind"), &kind);
  if (version.empty() || kind.empty()) return;
  s->k8s_api_version = group.empty() ? version : group + "/" + version;
  s->k8s_resource_kind = kind;
}

void ConstraintEmbeddedResource(const std::string& key, const JSONNode& n, SchemaState* s) {
  // The root of a CRD is passed as its own node rather than as a boolean.
  if (n.GetKind() == kBoolKind) {
    bool embedded = false;
    if (!s->BoolValue(n, &embedded) || !embedded) return;
  }
  auto& obj = s->Object(n);
  auto api_version = s->k8s_api_version.empty() ? ast::NewIdent("string")
                                                : ast::NewString(s->k8s_api_version);
  auto kind = s->k8s_resource_kind.empty() ? ast::NewIdent("string")
                                           : ast::NewString(s->k8s_resource_kind);
  obj.elts.push_back(ast::NewField(ast::Label::Ident("apiVersion"), api_version, ast::Token::kNot));
  obj.elts.push_back(ast::NewField(ast::Label::Ident("kind"), kind, ast::Token::kNot));
  obj.elts.push_back(ast::NewField(ast::Label::Ident("metadata"), ObjectMeta(), ast::Token::kNot));
}

}  // namespace xschema
