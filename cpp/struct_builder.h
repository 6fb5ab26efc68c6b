/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/struct_builder.h
 * \brief Assemble a tree of named definitions with forward and cyclic references into one struct.
 */
#ifndef XSCHEMA_STRUCT_BUILDER_H_
#define XSCHEMA_STRUCT_BUILDER_H_

#include <xschema/ast.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "support/utils.h"

namespace xschema {

/*!
 * \brief Builds a struct from values put at paths. References to paths may be taken before the
 * value at the path exists; the identifiers of those references are bound to the final
 * expressions when the syntax is built.
 * \code
 * StructBuilder builder;
 * auto ref = builder.GetRef({ast::Selector::Ident("#foo")});  // #foo
 * builder.Put({}, ref.Unwrap());
 * builder.Put({ast::Selector::Ident("#foo")}, ast::NewIdent("int"));
 * auto syntax = builder.Syntax();  // {#foo, #foo: int}
 * \endcode
 */
class StructBuilder {
 public:
  /*! \brief The identifier of the root in a self-referencing result. */
  static constexpr const char* kRootIdent = "_schema";

  /*!
   * \brief Put a value at the path.
   * \return false if the path already has a value; the value is left unchanged.
   */
  bool Put(const ast::Path& path, ast::ExprPtr value, const std::string& comment = "");

  /*!
   * \brief A reference to the value at the path. The empty path refers to the root.
   * \return The reference, or an error if the first selector of the path is not an identifier.
   */
  Result<ast::ExprPtr> GetRef(const ast::Path& path);

  /*!
   * \brief Build the struct. Nodes with both a value and children embed the value next to the
   * children. A referenced root is named kRootIdent.
   * \return The expression, or an error if a referenced path never received a value.
   */
  Result<ast::ExprPtr> Syntax();

 private:
  struct Node {
    bool is_present = false;
    ast::ExprPtr value;
    std::string comment;
    std::map<ast::Selector, std::unique_ptr<Node>> entries;
    /*! \brief The identifiers that refer to this node. */
    std::vector<ast::ExprPtr> ref_idents;
  };

  Node* GetNode(const ast::Path& path);

  static Result<ast::ExprPtr> NodeSyntax(Node* node, const ast::Path& path);

  static Result<std::vector<ast::DeclPtr>> EntryFields(Node* node, const ast::Path& path);

  Node root_;
};

}  // namespace xschema

#endif  // XSCHEMA_STRUCT_BUILDER_H_
