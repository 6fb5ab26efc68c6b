/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/constraints_string.cc
 * \brief The string keywords, including the format vocabulary.
 */
#include "constraints.h"

#include <unordered_map>

#include "support/logging.h"

namespace xschema {

void ConstraintMinLength(const std::string& key, const JSONNode& n, SchemaState* s) {
  uint64_t min = 0;
  if (!s->UintValue(n, &min)) return;
  auto arg = ast::NewLit(ast::Token::kInt, std::to_string(min));
  s->Add(n, CoreType::kString, ast::NewPkgCall("strings", "MinRunes", {arg}));
}

void ConstraintMaxLength(const std::string& key, const JSONNode& n, SchemaState* s) {
  uint64_t max = 0;
  if (!s->UintValue(n, &max)) return;
  auto arg = ast::NewLit(ast::Token::kInt, std::to_string(max));
  s->Add(n, CoreType::kString, ast::NewPkgCall("strings", "MaxRunes", {arg}));
}

void ConstraintPattern(const std::string& key, const JSONNode& n, SchemaState* s) {
  std::string pattern;
  if (!s->StrValue(n, &pattern)) return;
  if (!s->CheckRegexp(n, pattern)) return;
  s->Add(n, CoreType::kString, ast::NewUnary(ast::Token::kMat, ast::NewString(pattern)));
}

// ==================== Formats ====================

namespace {

using FormatFunc = void (*)(const JSONNode& n, SchemaState* s);

struct FormatInfo {
  VersionSet versions;
  /*! \brief nullptr for formats that are recognised but not checked. */
  FormatFunc fn;
};

void FormatURI(const JSONNode& n, SchemaState* s) {
  s->Add(n, CoreType::kString, ast::NewPkgSel("net", "AbsURL"));
}

void FormatURIReference(const JSONNode& n, SchemaState* s) {
  s->Add(n, CoreType::kString, ast::NewPkgSel("net", "URL"));
}

void FormatDateTime(const JSONNode& n, SchemaState* s) {
  s->Add(n, CoreType::kString, ast::NewPkgSel("time", "Time"));
}

void FormatDate(const JSONNode& n, SchemaState* s) {
  s->Add(n, CoreType::kString, ast::NewPkgCall("time", "Format", {ast::NewString("2006-01-02")}));
}

void FormatRegex(const JSONNode& n, SchemaState* s) {
  s->Add(n, CoreType::kString, ast::NewPkgSel("regexp", "Valid"));
}

void FormatInt32(const JSONNode& n, SchemaState* s) {
  s->Add(n, CoreType::kNumber, ast::NewIdent("int32"));
}

void FormatInt64(const JSONNode& n, SchemaState* s) {
  s->Add(n, CoreType::kNumber, ast::NewIdent("int64"));
}

void FormatUint32(const JSONNode& n, SchemaState* s) {
  s->Add(n, CoreType::kNumber, ast::NewIdent("uint32"));
}

void FormatUint64(const JSONNode& n, SchemaState* s) {
  s->Add(n, CoreType::kNumber, ast::NewIdent("uint64"));
}

const std::unordered_map<std::string, FormatInfo>& Formats() {
  static constexpr VersionSet kFromDraft6 = VersionsFrom(Version::kDraft6);
  static constexpr VersionSet kFromDraft7 = VersionsFrom(Version::kDraft7);
  static constexpr VersionSet kFrom2019 = VersionsFrom(Version::kDraft2019_09);
  static const std::unordered_map<std::string, FormatInfo> formats = {
      {"binary", {kOpenAPI, nullptr}},
      {"bsonobjectid", {kKubernetes, nullptr}},
      {"byte", {kOpenAPILike, nullptr}},
      {"cidr", {kKubernetes, nullptr}},
      {"creditcard", {kKubernetes, nullptr}},
      {"data", {kOpenAPI, nullptr}},
      {"date", {kFromDraft7 | kOpenAPILike, FormatDate}},
      {"date-time", {kAllDrafts | kOpenAPILike, FormatDateTime}},
      {"datetime", {kKubernetes, FormatDateTime}},
      {"double", {kOpenAPILike, nullptr}},
      {"duration", {kFrom2019 | kKubernetes, nullptr}},
      {"email", {kAllDrafts | kOpenAPILike, nullptr}},
      {"float", {kOpenAPILike, nullptr}},
      {"hexcolor", {kKubernetes, nullptr}},
      {"hostname", {kAllDrafts | kOpenAPILike, nullptr}},
      {"idn-email", {kFromDraft7, nullptr}},
      {"idn-hostname", {kFromDraft7, nullptr}},
      {"int32", {kOpenAPILike, FormatInt32}},
      {"int64", {kOpenAPILike, FormatInt64}},
      {"ipv4", {kAllDrafts | kOpenAPILike, nullptr}},
      {"ipv6", {kAllDrafts | kOpenAPILike, nullptr}},
      {"iri", {kFromDraft7, FormatURI}},
      {"iri-reference", {kFromDraft7, FormatURIReference}},
      {"isbn", {kKubernetes, nullptr}},
      {"isbn10", {kKubernetes, nullptr}},
      {"isbn13", {kKubernetes, nullptr}},
      {"json-pointer", {kFromDraft6, nullptr}},
      {"mac", {kKubernetes, nullptr}},
      {"password", {kOpenAPILike, nullptr}},
      {"regex", {kFromDraft7, FormatRegex}},
      {"relative-json-pointer", {kFromDraft7, nullptr}},
      {"rgbcolor", {kKubernetes, nullptr}},
      {"ssn", {kKubernetes, nullptr}},
      {"time", {kFromDraft7, nullptr}},
      {"uint32", {kKubernetes, FormatUint32}},
      {"uint64", {kKubernetes, FormatUint64}},
      {"uri", {kAllDrafts | kOpenAPILike, FormatURI}},
      {"uri-reference", {kFromDraft6, FormatURIReference}},
      {"uri-template", {kFromDraft6, nullptr}},
      {"uuid", {kFrom2019 | kKubernetes, nullptr}},
      {"uuid3", {kKubernetes, nullptr}},
      {"uuid4", {kKubernetes, nullptr}},
      {"uuid5", {kKubernetes, nullptr}},
  };
  return formats;
}

}  // namespace

void ConstraintFormat(const std::string& key, const JSONNode& n, SchemaState* s) {
  std::string format;
  if (!s->StrValue(n, &format)) return;
  // Formats are an open vocabulary in OpenAPI.
  bool report = s->Config().strict_keywords && !kOpenAPILike.Contains(s->info.schema_version);
  const auto& formats = Formats();
  auto it = formats.find(format);
  if (it == formats.end()) {
    if (report) s->Errorf(n, "unknown format " + Quote(format));
    return;
  }
  if (!it->second.versions.Contains(s->info.schema_version)) {
    if (report) {
      s->Errorf(
          n,
          "format " + Quote(format) + " is not recognized in schema version " +
              VersionString(s->info.schema_version)
      );
    }
    return;
  }
  if (it->second.fn == nullptr) {
    XSCHEMA_LOG(DEBUG) << "Format " << format << " at " << n.Location() << " is not checked";
    return;
  }
  it->second.fn(n, s);
}

}  // namespace xschema
