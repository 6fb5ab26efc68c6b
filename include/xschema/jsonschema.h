/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/jsonschema.h
 * \brief Translate JSON Schema into the type language (Extract) and back (Generate).
 */
#ifndef XSCHEMA_JSONSCHEMA_H_
#define XSCHEMA_JSONSCHEMA_H_

#include <picojson.h>

#include <functional>
#include <string>
#include <vector>

#include "ast.h"
#include "exception.h"
#include "value.h"

namespace xschema {

/*!
 * \brief A JSON Schema dialect. The values are ordered from the oldest draft to the newest; the
 * OpenAPI and Kubernetes dialects follow.
 */
enum class Version : int {
  kUnknown = 0,
  kDraft4 = 1,
  kDraft6 = 2,
  kDraft7 = 3,
  kDraft2019_09 = 4,
  kDraft2020_12 = 5,
  /*! \brief OpenAPI 3.0 schema objects. */
  kOpenAPI = 6,
  /*! \brief Schemas in Kubernetes API definitions. */
  kKubernetesAPI = 7,
  /*! \brief Schemas in Kubernetes custom resource definitions. */
  kKubernetesCRD = 8,
};

/*! \brief The `$schema` URI of a draft, or a descriptive name for the other dialects. */
std::string VersionString(Version version);

/*! \brief The root ID used when a schema has none; references to it are local. */
extern const char* const kDefaultRootID;

/*!
 * \brief The location of a schema, passed to ExtractConfig::map_ref.
 */
struct SchemaLoc {
  /*! \brief The canonical URI of the schema, with a JSON Pointer fragment. */
  std::string id;
  /*! \brief Whether the schema is in the document being extracted. */
  bool is_local = false;
  /*! \brief For a local schema, the JSON Pointer tokens of its location in the document. */
  std::vector<std::string> path;

  std::string ToString() const;
};

/*!
 * \brief Where a schema lives in the type language: a package and a path in it. An empty
 * import_path means the package being extracted.
 */
struct MappedLocation {
  std::string import_path;
  ast::Path path;
};

/*!
 * \brief Options of Extract. The mapping callbacks report failures by throwing; the message is
 * recorded as a diagnostic of the referring schema.
 */
struct ExtractConfig {
  /*! \brief The package name of the result. No package clause when empty. */
  std::string pkg_name;

  /*! \brief The URI of the document, used to resolve relative references. Must be absolute.
   * Defaults to kDefaultRootID. */
  std::string id;

  /*!
   * \brief The JSON Pointer (e.g. "#/definitions") of a location holding one schema per member,
   * each of which becomes a definition. With single_root, the location of the schema itself.
   * Empty means the document is the schema.
   */
  std::string root;

  /*! \brief Treat a missing root location as an empty one. */
  bool allow_non_existent_root = false;

  /*! \brief The root location holds a single schema rather than a set of definitions. */
  bool single_root = false;

  /*!
   * \brief Deprecated: maps the JSON Pointer tokens of a local reference to a path. Used by the
   * default map_ref when set.
   */
  std::function<ast::Path(const std::vector<std::string>& tokens)> map;

  /*!
   * \brief Maps the URI (without fragment) of an external schema to the package holding it. Used
   * by the default map_ref. Defaults to DefaultMapURL.
   */
  std::function<MappedLocation(const std::string& url)> map_url;

  /*! \brief Maps a schema location to a package and a path. Defaults to DefaultMapRef. */
  std::function<MappedLocation(const SchemaLoc& loc)> map_ref;

  /*!
   * \brief Called for each locally defined schema that map_ref places in another package.
   */
  std::function<void(const std::string& import_path, const ast::Path& path, const ast::ExprPtr& expr)>
      define_schema;

  /*! \brief Implies strict_features and strict_keywords. */
  bool strict = false;

  /*! \brief Report keywords and constructs that are recognised but not translated. */
  bool strict_features = false;

  /*! \brief Report unknown keywords and unknown formats. */
  bool strict_keywords = false;

  /*! \brief Leave objects open only when the schema says so explicitly. */
  bool open_only_when_explicit = false;

  /*! \brief The dialect used when the schema has no `$schema`. Defaults to 2020-12. */
  Version default_version = Version::kUnknown;
};

/*!
 * \brief Options of Generate.
 */
struct GenerateConfig {
  /*! \brief The output dialect. Only 2020-12 is supported, which is also the default. */
  Version version = Version::kUnknown;

  /*! \brief Names the `$defs` entry of a referenced value. Defaults to DefaultNameFunc. */
  std::function<std::string(const Value& root, const ast::Path& path)> name_func;

  /*!
   * \brief Never emit `additionalProperties: false` for implicitly closed structs, and emit
   * `additionalProperties: true` for structs that are explicitly open.
   */
  bool explicit_open = false;
};

/*!
 * \brief Translate a JSON Schema document into type language syntax.
 * \param data The schema document.
 * \param config The extraction options.
 * \return The translated file.
 * \throws InvalidConfigError if the ID is not an absolute URI.
 * \throws SchemaError with all problems found in the schema.
 */
ast::FilePtr Extract(const picojson::value& data, const ExtractConfig& config = ExtractConfig());

/*!
 * \brief Translate a JSON Schema given as JSON text.
 * \throws InvalidJSONError if the text does not parse.
 */
ast::FilePtr Extract(const std::string& json_text, const ExtractConfig& config = ExtractConfig());

/*!
 * \brief Translate a type language value into a 2020-12 JSON Schema.
 * \param value The value to translate.
 * \param config The generation options.
 * \return The schema as a JSON-shaped expression; see ast::FormatJSON and SchemaToJSON.
 * \throws InvalidConfigError for an unsupported version.
 * \throws SchemaError with all problems found in the value.
 */
ast::ExprPtr Generate(const Value& value, const GenerateConfig& config = GenerateConfig());

/*! \brief Convert a JSON-shaped expression, such as the result of Generate, into JSON. */
picojson::value SchemaToJSON(const ast::ExprPtr& expr);

/*!
 * \brief The default ExtractConfig::map_ref. Local schemas map through the configured map (or the
 * default mapping of `$defs` and `definitions` members to definitions); external schemas map
 * through map_url and the JSON Pointer in the fragment.
 */
MappedLocation DefaultMapRef(const SchemaLoc& loc);

/*!
 * \brief The default ExtractConfig::map_url: the import path is the host and path of the URL,
 * qualified with "schema" when its last element is not an identifier.
 */
MappedLocation DefaultMapURL(const std::string& url);

/*! \brief The default GenerateConfig::name_func: the selectors of the path joined with ".". */
std::string DefaultNameFunc(const Value& root, const ast::Path& path);

}  // namespace xschema

#endif  // XSCHEMA_JSONSCHEMA_H_
