/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/version.h
 * \brief Sets of JSON Schema dialects, used to state where keywords and formats apply.
 */
#ifndef XSCHEMA_VERSION_H_
#define XSCHEMA_VERSION_H_

#include <xschema/jsonschema.h>

#include <cstdint>
#include <string>

#include "support/utils.h"

namespace xschema {

/*! \brief The dialect used when neither the schema nor the configuration names one. */
constexpr Version kDefaultVersion = Version::kDraft2020_12;

/*!
 * \brief A set of dialects, as a bitset indexed by Version.
 */
class VersionSet {
 public:
  constexpr VersionSet() = default;
  constexpr explicit VersionSet(uint32_t bits) : bits_(bits) {}

  constexpr bool Contains(Version version) const {
    return (bits_ & (1u << static_cast<int>(version))) != 0;
  }

  constexpr VersionSet operator|(VersionSet other) const { return VersionSet(bits_ | other.bits_); }

  constexpr uint32_t Bits() const { return bits_; }

 private:
  uint32_t bits_ = 0;
};

/*! \brief The drafts from v to the newest one. */
constexpr VersionSet VersionsFrom(Version v) {
  uint32_t bits = 0;
  for (int i = static_cast<int>(v); i <= static_cast<int>(Version::kDraft2020_12); ++i) {
    bits |= 1u << i;
  }
  return VersionSet(bits);
}

/*! \brief The drafts from the oldest one to v. */
constexpr VersionSet VersionsTo(Version v) {
  uint32_t bits = 0;
  for (int i = static_cast<int>(Version::kDraft4); i <= static_cast<int>(v); ++i) {
    bits |= 1u << i;
  }
  return VersionSet(bits);
}

/*! \brief The drafts from v0 to v1. */
constexpr VersionSet VersionsBetween(Version v0, Version v1) {
  return VersionSet(VersionsFrom(v0).Bits() & VersionsTo(v1).Bits());
}

constexpr VersionSet VersionsOf(Version v) { return VersionSet(1u << static_cast<int>(v)); }

constexpr VersionSet kAllDrafts = VersionsFrom(Version::kDraft4);
constexpr VersionSet kOpenAPI = VersionsOf(Version::kOpenAPI);
constexpr VersionSet kKubernetes =
    VersionsOf(Version::kKubernetesAPI) | VersionsOf(Version::kKubernetesCRD);
/*! \brief OpenAPI and the Kubernetes dialects, which share OpenAPI's schema object. */
constexpr VersionSet kOpenAPILike = kOpenAPI | kKubernetes;
constexpr VersionSet kAllVersions = kAllDrafts | kOpenAPILike;

/*!
 * \brief Parse a `$schema` URI. A trailing empty fragment and either URI scheme are accepted.
 */
Result<Version> ParseVersion(const std::string& uri);

}  // namespace xschema

#endif  // XSCHEMA_VERSION_H_
