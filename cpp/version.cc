/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/version.cc
 */
#include "version.h"

#include <unordered_map>

namespace xschema {

std::string VersionString(Version version) {
  switch (version) {
    case Version::kDraft4:
      return "http://json-schema.org/draft-04/schema#";
    case Version::kDraft6:
      return "http://json-schema.org/draft-06/schema#";
    case Version::kDraft7:
      return "http://json-schema.org/draft-07/schema#";
    case Version::kDraft2019_09:
      return "https://json-schema.org/draft/2019-09/schema";
    case Version::kDraft2020_12:
      return "https://json-schema.org/draft/2020-12/schema";
    case Version::kOpenAPI:
      return "OpenAPI 3.0";
    case Version::kKubernetesAPI:
      return "Kubernetes API";
    case Version::kKubernetesCRD:
      return "Kubernetes CRD";
    default:
      return "unknown";
  }
}

Result<Version> ParseVersion(const std::string& uri) {
  static const std::unordered_map<std::string, Version> kVersionForPath = {
      {"json-schema.org/draft-04/schema", Version::kDraft4},
      {"json-schema.org/draft-06/schema", Version::kDraft6},
      {"json-schema.org/draft-07/schema", Version::kDraft7},
      {"json-schema.org/draft/2019-09/schema", Version::kDraft2019_09},
      {"json-schema.org/draft/2020-12/schema", Version::kDraft2020_12},
  };
  std::string text = uri;
  if (EndsWith(text, "#")) text.pop_back();
  std::string rest;
  if (StartsWith(text, "https://")) {
    rest = text.substr(8);
  } else if (StartsWith(text, "http://")) {
    rest = text.substr(7);
  }
  auto it = kVersionForPath.find(rest);
  if (rest.empty() || it == kVersionForPath.end()) {
    return ResultErr("$schema URI not recognized");
  }
  return ResultOk(it->second);
}

}  // namespace xschema
