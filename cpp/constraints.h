/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/constraints.h
 * \brief The JSON Schema keywords: the phase each one is processed in, the versions it belongs
 * to, and its handler.
 */
#ifndef XSCHEMA_CONSTRAINTS_H_
#define XSCHEMA_CONSTRAINTS_H_

#include <string>

#include "schema_decoder.h"
#include "version.h"

namespace xschema {

/*!
 * \brief The handler of a keyword. key is the keyword, n its value, s the schema it appears in.
 */
using ConstraintFunc = void (*)(const std::string& key, const JSONNode& n, SchemaState* s);

/*!
 * \brief A keyword. Keywords are processed in phases so that a keyword can rely on the effects
 * of keywords of earlier phases: required needs the properties, additionalProperties needs the
 * properties and the patterns, minimum needs the exclusiveMinimum flag of draft 4.
 */
struct Constraint {
  int phase;
  VersionSet versions;
  ConstraintFunc fn;
};

constexpr int kNumPhases = 4;

/*! \brief The keyword, or nullptr when it is unknown. */
const Constraint* LookupConstraint(const std::string& key);

// Generic
void ConstraintSchema(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintID(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintAnchor(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintRef(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintAddDefinitions(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintAnnotation(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintTitle(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintDescription(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintDeprecated(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintExamples(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintType(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintEnum(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintConst(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintNullable(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintTODO(const std::string& key, const JSONNode& n, SchemaState* s);

// Combinators
void ConstraintAllOf(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintAnyOf(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintOneOf(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintNot(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintIf(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintThen(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintElse(const std::string& key, const JSONNode& n, SchemaState* s);

// Numbers
void ConstraintMinimum(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintMaximum(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintExclusiveMinimum(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintExclusiveMaximum(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintMultipleOf(const std::string& key, const JSONNode& n, SchemaState* s);

// Strings
void ConstraintMinLength(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintMaxLength(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintPattern(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintFormat(const std::string& key, const JSONNode& n, SchemaState* s);

// Arrays
void ConstraintPrefixItems(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintItems(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintAdditionalItems(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintContains(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintMinContains(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintMaxContains(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintMinItems(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintMaxItems(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintUniqueItems(const std::string& key, const JSONNode& n, SchemaState* s);

// Objects
void ConstraintProperties(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintPatternProperties(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintAdditionalProperties(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintPropertyNames(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintRequired(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintMinProperties(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintMaxProperties(const std::string& key, const JSONNode& n, SchemaState* s);

// Kubernetes
void ConstraintPreserveUnknownFields(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintIntOrString(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintGroupVersionKind(const std::string& key, const JSONNode& n, SchemaState* s);
void ConstraintEmbeddedResource(const std::string& key, const JSONNode& n, SchemaState* s);

}  // namespace xschema

#endif  // XSCHEMA_CONSTRAINTS_H_
