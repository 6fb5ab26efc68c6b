/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/jsonschema.cc
 * \brief The public entry points of Extract and Generate and the default mapping functions.
 */
#include <xschema/jsonschema.h>

#include <cerrno>
#include <cstdlib>

#include "json_pointer.h"
#include "schema_decoder.h"
#include "schema_generator.h"
#include "support/logging.h"
#include "support/utils.h"
#include "uri.h"
#include "version.h"

namespace xschema {

const char* const kDefaultRootID = "https://cue.jsonschema.invalid";

std::string SchemaLoc::ToString() const {
  if (is_local) return "id=" + id + " localPath=" + Quote(JSONPointerFromTokens(path));
  return "id=" + id;
}

namespace {

/*! \brief The last element of a slash separated path, ignoring trailing slashes. */
std::string PathBase(const std::string& path) {
  if (path.empty()) return ".";
  size_t end = path.find_last_not_of('/');
  if (end == std::string::npos) return "/";
  size_t start = path.rfind('/', end);
  start = start == std::string::npos ? 0 : start + 1;
  return path.substr(start, end - start + 1);
}

}  // namespace

// ==================== Extract ====================

ast::FilePtr Extract(const picojson::value& data, const ExtractConfig& config) {
  ExtractConfig cfg = config;
  if (cfg.strict) {
    cfg.strict_features = true;
    cfg.strict_keywords = true;
  }
  if (cfg.default_version == Version::kUnknown) cfg.default_version = kDefaultVersion;
  if (cfg.id.empty()) cfg.id = kDefaultRootID;

  auto parsed = URI::Parse(cfg.id);
  if (parsed.IsErr()) {
    throw InvalidConfigError(
        "invalid Config.ID value " + Quote(cfg.id) + ": " + parsed.ErrRef().what()
    );
  }
  URI root_id = std::move(parsed).Unwrap();
  if (!root_id.IsAbs()) {
    throw InvalidConfigError("Config.ID " + Quote(cfg.id) + " is not absolute");
  }

  if (!cfg.map_url) cfg.map_url = DefaultMapURL;
  if (!cfg.map_ref) {
    auto map = cfg.map ? cfg.map : std::function<ast::Path(const std::vector<std::string>&)>(DefaultMap);
    auto map_url = cfg.map_url;
    cfg.map_ref = [map, map_url](const SchemaLoc& loc) { return MapRefWith(loc, map, map_url); };
  }

  SchemaDecoder decoder(data, std::move(cfg), std::move(root_id));
  ast::FilePtr file = decoder.Decode();
  if (!decoder.Diagnostics().empty()) {
    XSCHEMA_LOG(DEBUG) << "Extract found " << decoder.Diagnostics().size() << " problems";
    throw SchemaError(decoder.Diagnostics());
  }
  XSCHEMA_ICHECK(file != nullptr) << "Decoding failed without a diagnostic";
  return file;
}

ast::FilePtr Extract(const std::string& json_text, const ExtractConfig& config) {
  picojson::value data;
  std::string err = picojson::parse(data, json_text);
  if (!err.empty()) throw InvalidJSONError(err);
  return Extract(data, config);
}

// ==================== Generate ====================

ast::ExprPtr Generate(const Value& value, const GenerateConfig& config) {
  auto invalid = value.Validate();
  if (!invalid.empty()) throw SchemaError(std::move(invalid));

  GenerateConfig cfg = config;
  if (!cfg.name_func) cfg.name_func = DefaultNameFunc;
  if (cfg.version == Version::kUnknown) cfg.version = Version::kDraft2020_12;
  if (cfg.version != Version::kDraft2020_12) {
    throw InvalidConfigError(
        "only version " + VersionString(Version::kDraft2020_12) +
        " is supported for generating JSON Schema"
    );
  }

  SchemaGenerator generator(std::move(cfg));
  ast::ExprPtr schema = generator.Generate(value);
  if (!generator.Diagnostics().empty()) throw SchemaError(generator.Diagnostics());
  XSCHEMA_ICHECK(schema != nullptr) << "Generation failed without a diagnostic";
  return schema;
}

picojson::value SchemaToJSON(const ast::ExprPtr& expr) {
  XSCHEMA_CHECK(expr != nullptr) << "Cannot convert a null expression to JSON";
  if (expr->Is<ast::StructLit>()) {
    picojson::object obj;
    for (const auto& decl : expr->As<ast::StructLit>().elts) {
      XSCHEMA_CHECK(decl->Is<ast::Field>()) << "Only fields can be converted to JSON";
      const auto& field = decl->As<ast::Field>();
      obj[field.label.name] = SchemaToJSON(field.value);
    }
    return picojson::value(std::move(obj));
  }
  if (expr->Is<ast::ListLit>()) {
    picojson::array arr;
    for (const auto& elem : expr->As<ast::ListLit>().elts) arr.push_back(SchemaToJSON(elem));
    return picojson::value(std::move(arr));
  }
  XSCHEMA_CHECK(expr->Is<ast::BasicLit>())
      << "Expression " << ast::FormatExpr(expr) << " is not JSON-shaped";
  const auto& lit = expr->As<ast::BasicLit>();
  switch (lit.kind) {
    case ast::Token::kNull:
      return picojson::value();
    case ast::Token::kTrue:
      return picojson::value(true);
    case ast::Token::kFalse:
      return picojson::value(false);
    case ast::Token::kString:
      return picojson::value(lit.value);
    case ast::Token::kInt: {
      errno = 0;
      char* end = nullptr;
      long long n = std::strtoll(lit.value.c_str(), &end, 10);
      if (errno == 0 && end != nullptr && *end == '\0') return picojson::value(static_cast<int64_t>(n));
      // Out of the int64 range.
      return picojson::value(std::strtod(lit.value.c_str(), nullptr));
    }
    case ast::Token::kFloat:
      return picojson::value(std::strtod(lit.value.c_str(), nullptr));
    default:
      XSCHEMA_LOG(FATAL) << "Literal " << Quote(lit.value) << " is not JSON";
      XSCHEMA_UNREACHABLE();
  }
}

// ==================== Default mappings ====================

MappedLocation DefaultMapRef(const SchemaLoc& loc) { return MapRefWith(loc, DefaultMap, DefaultMapURL); }

MappedLocation DefaultMapURL(const std::string& url) {
  auto parsed = URI::Parse(url);
  if (parsed.IsErr()) throw std::runtime_error(std::string("invalid URL: ") + parsed.ErrRef().what());
  const URI& u = parsed.ValueRef();
  MappedLocation result;
  if (!u.Opaque().empty()) {
    result.import_path = Base64RawURLEncode(u.Opaque());
    return result;
  }
  std::string path = u.PathPart();
  std::string base = PathBase(path);
  if (!ast::IsValidIdent(base)) {
    if (EndsWith(base, ".json")) base = base.substr(0, base.size() - 5);
    if (!ast::IsValidIdent(base)) base = "schema";
    path += ":" + base;
  }
  result.import_path = u.Host() + path;
  return result;
}

std::string DefaultNameFunc(const Value& root, const ast::Path& path) {
  std::vector<std::string> parts;
  for (const auto& sel : path) parts.push_back(sel.String());
  return Join(parts, ".");
}

}  // namespace xschema
