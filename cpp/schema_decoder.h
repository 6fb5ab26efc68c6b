/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/schema_decoder.h
 * \brief The decoder that translates a JSON Schema document into type language syntax.
 */
#ifndef XSCHEMA_SCHEMA_DECODER_H_
#define XSCHEMA_SCHEMA_DECODER_H_

#include <picojson.h>
#include <xschema/ast.h>
#include <xschema/exception.h>
#include <xschema/jsonschema.h>
#include <xschema/value.h>

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "struct_builder.h"
#include "support/utils.h"
#include "uri.h"

namespace xschema {

/*! \brief The kinds a JSON value can have. */
constexpr Kind kAllTypes = kTopKind & ~kBytesKind;

/*! \brief The host of kDefaultRootID. Schemas may not use it in their own URIs. */
constexpr const char* kDefaultRootIDHost = "cue.jsonschema.invalid";

/*!
 * \brief A value in the input document together with its location.
 */
struct JSONNode {
  const picojson::value* value = nullptr;
  /*! \brief The JSON Pointer tokens from the document root. */
  std::vector<std::string> tokens;

  bool Exists() const { return value != nullptr; }

  /*! \brief The member with the given key. The value must be an object containing it. */
  JSONNode Child(const std::string& key) const;

  /*! \brief The element at index i. The value must be an array. */
  JSONNode Index(size_t i) const;

  /*! \brief The location as a JSON Pointer fragment, e.g. "#/properties/a". */
  std::string Location() const;

  Kind GetKind() const;
};

/*! \brief The types of JSON Schema, each collecting its own constraints. */
enum class CoreType : int {
  kNull = 0,
  kBool = 1,
  kNumber = 2,
  kString = 3,
  kArray = 4,
  kObject = 5,
};

constexpr int kNumCoreTypes = 6;

/*! \brief The kinds of a core type. kNumber covers both int and float. */
Kind CoreTypeKind(CoreType type);

/*! \brief The expression for a kind, e.g. `string` or `[...]`. */
ast::ExprPtr KindToAST(Kind kind, bool explicit_open);

/*! \brief `error("disallowed")`. */
ast::ExprPtr ErrorDisallowed();

struct ConstraintInfo {
  std::vector<ast::ExprPtr> constraints;

  /*! \brief Add a constraint. The top value `_` is dropped. */
  void Add(ast::ExprPtr expr);
};

/*!
 * \brief What is known about a translated schema once its keywords have been processed.
 */
struct SchemaInfo {
  /*! \brief The kinds the schema admits. */
  Kind allowed_types = kAllTypes;
  /*! \brief The kinds the schema is already known to be restricted to by its constraints. */
  Kind known_types = kAllTypes;

  std::string title;
  std::string description;
  /*! \brief The absolute URI of the schema when it has an `$id`. */
  std::optional<URI> id;
  bool deprecated = false;

  Version schema_version = Version::kUnknown;
  bool schema_version_present = false;

  bool has_constraints = false;

  /*! \brief The doc comment: the title and the description separated by a blank line. */
  std::string Comment() const;
};

/*!
 * \brief A schema that has a name in the output: the target of a reference or a member of a
 * definitions root.
 */
struct DefinedSchema {
  /*! \brief Empty for schemas in the package being extracted. */
  std::string import_path;
  /*! \brief The location relative to import_path. */
  ast::Path path;
  /*! \brief Whether the schema is in the document being extracted. */
  bool is_local = false;
  /*! \brief The node of a local schema. */
  JSONNode node;
  /*! \brief The translated schema, set when the node has been translated in the current pass. */
  ast::ExprPtr schema;
  std::string comment;
  /*! \brief The decoder pass in which schema was set. */
  int defined_pass = -1;
};

/*! \brief How an object came to be open or closed. */
enum class ObjectOpenness : int {
  kImplicitlyOpen = 0,
  kExplicitlyOpen = 1,
  kExplicitlyClosed = 2,
  /*! \brief A pattern constraint covers all fields not otherwise mentioned. */
  kAllFieldsCovered = 3,
};

class SchemaDecoder;

/*!
 * \brief The state of one schema being translated. Keyword handlers add constraints to it; it is
 * finalized into one expression.
 */
struct SchemaState {
  SchemaState(SchemaDecoder* decoder, SchemaState* up, JSONNode pos);

  SchemaDecoder* decoder;
  SchemaState* up;
  JSONNode pos;
  SchemaInfo info;

  /*! \brief The constraints per core type. They become the branches of a disjunction. */
  std::array<ConstraintInfo, kNumCoreTypes> types;
  /*! \brief The constraints that apply regardless of type. */
  ConstraintInfo all;
  /*! \brief `null` when the schema is nullable. */
  ast::ExprPtr nullable;

  bool exclusive_min = false;
  bool exclusive_max = false;

  bool is_root = false;

  std::optional<uint64_t> min_contains;
  std::optional<uint64_t> max_contains;

  JSONNode if_node;
  JSONNode then_node;
  JSONNode else_node;

  /*! \brief The struct that properties and pattern constraints are added to. */
  ast::ExprPtr obj;
  JSONNode obj_pos;
  ObjectOpenness openness = ObjectOpenness::kImplicitlyOpen;
  /*! \brief The `!~re` expressions of the patternProperties keys. */
  std::vector<ast::ExprPtr> patterns;

  /*! \brief The schemas of prefixItems, or of an array valued items before 2020-12. */
  std::vector<ast::ExprPtr> prefix_items;
  bool has_prefix_items = false;
  JSONNode list_pos;
  /*! \brief The schema of the elements after the prefix; nullptr when unconstrained. */
  ast::ExprPtr rest_items;
  bool rest_disallowed = false;
  bool list_items_is_array = false;

  bool has_properties = false;
  bool has_additional_properties = false;
  bool has_items = false;
  bool is_array = false;
  bool has_ref_keyword = false;
  bool preserve_unknown_fields = false;
  std::string k8s_resource_kind;
  std::string k8s_api_version;

  /****************** Translation ******************/

  /*! \brief Translate a subschema that admits any type. */
  ast::ExprPtr Schema(const JSONNode& n);

  /*!
   * \brief Translate a subschema.
   * \param n The schema node.
   * \param types The kinds the subschema may admit.
   * \param info_out Receives the information about the subschema when not null.
   * \param init Called on the new state before any keyword is processed.
   */
  ast::ExprPtr SubSchema(
      const JSONNode& n,
      Kind types,
      SchemaInfo* info_out = nullptr,
      const std::function<void(SchemaState*)>& init = nullptr
  );

  /*! \brief Process each member of a definitions object. */
  void AddDefinitions(const std::string& key, const JSONNode& n);

  /****************** Helpers for keyword handlers ******************/

  const ExtractConfig& Config() const;

  /*! \brief Record a problem at the node. Returns `_` so that translation can continue. */
  ast::ExprPtr Errorf(const JSONNode& n, const std::string& msg);

  /*! \brief Report a keyword that is not translated, when strict_keywords is set. */
  void WarnUnrecognizedKeyword(const std::string& key, const JSONNode& n, const std::string& msg);

  bool BoolValue(const JSONNode& n, bool* result);
  bool StrValue(const JSONNode& n, std::string* result);
  /*! \brief A non-negative whole number. Integral floating point values are accepted. */
  bool UintValue(const JSONNode& n, uint64_t* result);
  /*! \brief The literal for a number node. */
  ast::ExprPtr Number(const JSONNode& n);

  /*! \brief The elements of an array node. */
  std::vector<JSONNode> ListItems(const std::string& name, const JSONNode& n, bool allow_empty);

  /*! \brief Call f for each member of an object node, in key order. */
  void ProcessMap(
      const JSONNode& n, const std::function<void(const std::string&, const JSONNode&)>& f
  );

  /*! \brief The expression for a constant: literals, lists and closed structs of required
   * fields. */
  ast::ExprPtr ConstValue(const JSONNode& n);

  /*! \brief The struct under construction, created on first use. */
  ast::StructLit& Object(const JSONNode& n);

  /*! \brief The regular field with the given name in the struct under construction. */
  ast::Field* FindField(const std::string& name);

  void Add(const JSONNode& n, CoreType type, ast::ExprPtr expr);

  /*! \brief Check a regular expression. Unsupported syntax is reported under strict_features. */
  bool CheckRegexp(const JSONNode& n, const std::string& pattern);

  /*! \brief Parse a URI and resolve it against the nearest `$id`. */
  std::optional<URI> ResolveURI(const JSONNode& n);

  /*! \brief The nearest state with an `$id`; the root state always has one. */
  SchemaState* SchemaRoot();

  /*! \brief The expression for a `$ref` to the resolved URI. */
  ast::ExprPtr MakeRef(const JSONNode& n, const URI& u);

  /*! \brief Register an anchor naming this schema. */
  void AddAnchor(const JSONNode& n, const std::string& name);

  /*! \brief The reference expression for a defined schema. */
  ast::ExprPtr RefExpr(const JSONNode& n, const DefinedSchema& def);

 private:
  /*! \brief Process the keywords and build the expression. */
  ast::ExprPtr Translate();
  void Dispatch(int phase, const std::string& key, const JSONNode& value);
  /*! \brief Replace the expression by a reference when the schema has a name. */
  ast::ExprPtr MaybeDefine(ast::ExprPtr expr);
  void IfThenElse();
  void FinalizeList();
  void FinalizeObject();
  ast::ExprPtr Finalize();
  bool HasConstraints() const;
};

/*!
 * \brief Translates one document. The decoder runs over the document until all references are
 * resolved: a reference may be seen before the schema it refers to, and may refer to a location
 * that is not otherwise a schema.
 */
class SchemaDecoder {
 public:
  /*! \brief The configuration must be complete: all callbacks set, the version known. */
  SchemaDecoder(const picojson::value& root, ExtractConfig config, URI root_id);

  /*! \brief Translate the document. Returns nullptr when translation cannot produce a file. */
  ast::FilePtr Decode();

  /*! \brief The problems found, in the order they were found. */
  const std::vector<SchemaDiagnostic>& Diagnostics() const { return diagnostics_; }

  const ExtractConfig& Config() const { return config_; }

  StructBuilder& Builder() { return builder_; }

  int Pass() const { return pass_; }

  void AddError(const JSONNode& n, const std::string& msg);

  void RequestAnotherPass() { need_another_pass_ = true; }

  /*! \brief Register the node of a schema with an `$id`. */
  void RegisterID(const URI& id, const JSONNode& node);

  /*! \brief The node registered for the URI without fragment; nullptr when unknown. */
  const JSONNode* LookupID(const std::string& uri) const;

  struct Anchor {
    JSONNode node;
    /*! \brief The URI with a JSON Pointer fragment relative to the anchor's schema root. */
    std::string canonical_id;
  };

  void RegisterAnchor(const std::string& uri, Anchor anchor);

  const Anchor* LookupAnchor(const std::string& uri) const;

  /*! \brief The definition of a local node, created through map_ref when needed. */
  DefinedSchema* DefineLocal(
      const JSONNode& target, const std::string& canonical_id, const JSONNode& site
  );

  /*! \brief The definition of a schema outside the document. */
  DefinedSchema* DefineExternal(const URI& uri, const JSONNode& site);

  /*! \brief The definition of a node, or nullptr when the node needs none. */
  DefinedSchema* DefinitionForNode(const picojson::value* node) const;

  void MarkVisited(const picojson::value* node) { visited_.insert(node); }

 private:
  /*! \brief Parse the root option into JSON Pointer tokens. */
  Result<std::vector<std::string>> ParseRootRef(const std::string& str);

  /*! \brief The file for the built syntax and the information about the root schema. */
  ast::FilePtr MakeFile(ast::ExprPtr expr, const SchemaInfo& root_info);

  static constexpr int kMaxPasses = 10;

  const picojson::value& root_;
  ExtractConfig config_;
  URI root_id_;
  /*! \brief Stands in for a definitions root that does not exist. */
  picojson::value empty_root_ = picojson::value(picojson::object());

  std::vector<SchemaDiagnostic> diagnostics_;
  StructBuilder builder_;
  int pass_ = 0;
  bool need_another_pass_ = false;

  /*! \brief The nodes of the schemas with an `$id`, by URI without fragment. */
  std::unordered_map<std::string, JSONNode> ids_;
  std::unordered_map<std::string, Anchor> anchors_;
  /*! \brief The named schemas by canonical URI. */
  std::map<std::string, std::unique_ptr<DefinedSchema>> defs_;
  std::unordered_map<const picojson::value*, DefinedSchema*> def_for_node_;
  /*! \brief The nodes translated in the current pass. */
  std::unordered_set<const picojson::value*> visited_;
};

/*!
 * \brief The package qualifier of an import path: the part after ':' when present, otherwise the
 * last path element without a major version suffix such as "@v1".
 */
Result<std::string> ImportQualifier(const std::string& import_path);

/*! \brief The default ExtractConfig::map: `$defs` and `definitions` members become definitions. */
ast::Path DefaultMap(const std::vector<std::string>& tokens);

/*! \brief DefaultMapRef with the given map and map_url. Throws on failure. */
MappedLocation MapRefWith(
    const SchemaLoc& loc,
    const std::function<ast::Path(const std::vector<std::string>&)>& map,
    const std::function<MappedLocation(const std::string&)>& map_url
);

}  // namespace xschema

#endif  // XSCHEMA_SCHEMA_DECODER_H_
