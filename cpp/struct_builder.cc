/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/struct_builder.cc
 */
#include "struct_builder.h"

namespace xschema {

namespace {

void Bind(const std::vector<ast::ExprPtr>& idents, const ast::ExprPtr& target) {
  for (const auto& ident : idents) {
    ident->As<ast::Ident>().node = target;
  }
}

}  // namespace

StructBuilder::Node* StructBuilder::GetNode(const ast::Path& path) {
  Node* node = &root_;
  for (const auto& sel : path) {
    auto& child = node->entries[sel];
    if (!child) child = std::make_unique<Node>();
    node = child.get();
  }
  return node;
}

bool StructBuilder::Put(const ast::Path& path, ast::ExprPtr value, const std::string& comment) {
  Node* node = GetNode(path);
  if (node->is_present) return false;
  node->is_present = true;
  node->value = std::move(value);
  node->comment = comment;
  return true;
}

Result<ast::ExprPtr> StructBuilder::GetRef(const ast::Path& path) {
  if (path.empty()) {
    auto ident = ast::NewIdent(kRootIdent);
    root_.ref_idents.push_back(ident);
    return ResultOk(std::move(ident));
  }
  if (path[0].IsString()) {
    return ResultErr(
        "initial element of path " + Quote(ast::PathString(path)) +
        " cannot be expressed as an identifier"
    );
  }
  GetNode(path);
  auto ident = ast::NewIdent(path[0].Name());
  GetNode({path[0]})->ref_idents.push_back(ident);
  ast::ExprPtr expr = ident;
  for (size_t i = 1; i < path.size(); ++i) {
    expr = ast::NewSel(expr, path[i]);
  }
  return ResultOk(std::move(expr));
}

Result<std::vector<ast::DeclPtr>> StructBuilder::EntryFields(Node* node, const ast::Path& path) {
  std::vector<ast::DeclPtr> fields;
  for (auto& [sel, child] : node->entries) {
    ast::Path child_path = path;
    child_path.push_back(sel);
    auto expr = NodeSyntax(child.get(), child_path);
    if (expr.IsErr()) return ResultErr(std::move(expr).UnwrapErr());
    auto field = ast::NewField(ast::Label::FromSelector(sel), std::move(expr).Unwrap());
    field->As<ast::Field>().doc = child->comment;
    fields.push_back(std::move(field));
  }
  return ResultOk(std::move(fields));
}

Result<ast::ExprPtr> StructBuilder::NodeSyntax(Node* node, const ast::Path& path) {
  ast::ExprPtr result;
  if (node->entries.empty()) {
    if (!node->is_present) {
      return ResultErr("reference to undefined schema " + Quote(ast::PathString(path)));
    }
    result = node->value;
  } else {
    std::vector<ast::DeclPtr> elts;
    if (node->is_present) elts.push_back(ast::NewEmbed(node->value));
    auto fields = EntryFields(node, path);
    if (fields.IsErr()) return ResultErr(std::move(fields).UnwrapErr());
    for (auto& field : std::move(fields).Unwrap()) elts.push_back(std::move(field));
    result = ast::NewStruct(std::move(elts));
  }
  Bind(node->ref_idents, result);
  return ResultOk(std::move(result));
}

Result<ast::ExprPtr> StructBuilder::Syntax() {
  if (!root_.is_present && root_.entries.empty()) {
    return ResultErr("no schema defined");
  }
  if (root_.ref_idents.empty()) {
    return NodeSyntax(&root_, {});
  }
  if (!root_.is_present) {
    return ResultErr("reference to the root of a document without a root schema");
  }
  // The root refers to itself: name it so that the references have something to point to.
  auto self = ast::NewIdent(kRootIdent);
  std::vector<ast::DeclPtr> elts = {
      ast::NewEmbed(self),
      ast::NewField(ast::Label::Ident(kRootIdent), root_.value),
  };
  auto fields = EntryFields(&root_, {});
  if (fields.IsErr()) return ResultErr(std::move(fields).UnwrapErr());
  for (auto& field : std::move(fields).Unwrap()) elts.push_back(std::move(field));
  Bind(root_.ref_idents, root_.value);
  self->As<ast::Ident>().node = root_.value;
  return ResultOk(ast::NewStruct(std::move(elts)));
}

}  // namespace xschema
