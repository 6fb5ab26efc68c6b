/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/schema_generator.h
 * \brief The generator that translates a type language value into JSON Schema.
 */
#ifndef XSCHEMA_SCHEMA_GENERATOR_H_
#define XSCHEMA_SCHEMA_GENERATOR_H_

#include <xschema/ast.h>
#include <xschema/exception.h>
#include <xschema/jsonschema.h>
#include <xschema/value.h>

#include <map>
#include <string>
#include <vector>

#include "schema_item.h"

namespace xschema {

/*!
 * \brief Builds the item of a value bottom-up, runs the rewrite passes and renders the result.
 * One generator translates one value.
 */
class SchemaGenerator {
 public:
  /*! \brief The configuration must be complete: name_func set, the version checked. */
  explicit SchemaGenerator(GenerateConfig config) : config_(std::move(config)) {}

  /*!
   * \brief Translate the value into a 2020-12 schema.
   * \return The schema, or nullptr when the value cannot be translated. The reasons are in
   * Diagnostics().
   */
  ast::ExprPtr Generate(const Value& value);

  const std::vector<SchemaDiagnostic>& Diagnostics() const { return diagnostics_; }

  /*! \brief The naive item of a value, before the rewrite passes. */
  SchemaItemPtr MakeItem(const Value& v);

  ItemStore* Store() { return &store_; }

 private:
  SchemaItemPtr MakeReferenceItem(const Value& v, const Value& root, const ast::Path& path);
  SchemaItemPtr MakeComparisonItem(const Value& v, Op op, const Value& arg);
  SchemaItemPtr MakeCallItem(const Value& v, const std::vector<Value>& args);
  SchemaItemPtr MakeMatchNItem(const Value& v, const std::vector<Value>& args);
  /*! \brief The items of identifiers and package members with a known meaning. */
  SchemaItemPtr MakeNamedItem(const Value& v);
  SchemaItemPtr MakeStructItem(const Value& v);
  SchemaItemPtr MakeListItem(const Value& v);

  /*! \brief The item for a value of the given type with an extra constraint. */
  SchemaItemPtr Typed(const std::string& type, SchemaItemPtr item);

  /*! \brief Records the error and returns the false item. */
  SchemaItemPtr Error(const Value& v, const std::string& msg);

  /*! \brief Apply the rewrite passes. */
  SchemaItemPtr Rewrite(const SchemaItemPtr& item);

  GenerateConfig config_;
  ItemStore store_;
  /*! \brief The `$defs` entries by name. nullptr while the entry is being built. */
  std::map<std::string, SchemaItemPtr> defs_;
  std::vector<SchemaDiagnostic> diagnostics_;
};

/*! \brief The JSON Schema type names for a set of kinds, e.g. {"number", "string"}. */
std::vector<std::string> KindToJSONSchemaTypes(Kind kind);

/*!
 * \brief The literal of a concrete value as a JSON-shaped expression.
 * \return nullptr when the value is not concrete.
 */
ast::ExprPtr ConcreteToJSON(const Value& v);

}  // namespace xschema

#endif  // XSCHEMA_SCHEMA_GENERATOR_H_
