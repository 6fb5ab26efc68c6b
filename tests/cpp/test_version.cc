#include <gtest/gtest.h>

#include "version.h"

using namespace xschema;

TEST(VersionTest, ParseVersion) {
  auto draft7 = ParseVersion("http://json-schema.org/draft-07/schema#");
  ASSERT_TRUE(draft7.IsOk());
  EXPECT_EQ(draft7.ValueRef(), Version::kDraft7);

  auto https_draft4 = ParseVersion("https://json-schema.org/draft-04/schema");
  ASSERT_TRUE(https_draft4.IsOk());
  EXPECT_EQ(https_draft4.ValueRef(), Version::kDraft4);

  auto latest = ParseVersion("https://json-schema.org/draft/2020-12/schema");
  ASSERT_TRUE(latest.IsOk());
  EXPECT_EQ(latest.ValueRef(), Version::kDraft2020_12);
}

TEST(VersionTest, ParseVersionUnknown) {
  EXPECT_TRUE(ParseVersion("http://json-schema.org/draft-05/schema#").IsErr());
  EXPECT_TRUE(ParseVersion("json-schema.org/draft-07/schema").IsErr());
  EXPECT_TRUE(ParseVersion("").IsErr());
}

TEST(VersionTest, VersionString) {
  EXPECT_EQ(VersionString(Version::kDraft4), "http://json-schema.org/draft-04/schema#");
  EXPECT_EQ(VersionString(Version::kDraft2020_12), "https://json-schema.org/draft/2020-12/schema");
  EXPECT_EQ(VersionString(Version::kKubernetesCRD), "Kubernetes CRD");
}

TEST(VersionTest, VersionSets) {
  VersionSet from7 = VersionsFrom(Version::kDraft7);
  EXPECT_FALSE(from7.Contains(Version::kDraft6));
  EXPECT_TRUE(from7.Contains(Version::kDraft7));
  EXPECT_TRUE(from7.Contains(Version::kDraft2020_12));
  EXPECT_FALSE(from7.Contains(Version::kOpenAPI));

  VersionSet to6 = VersionsTo(Version::kDraft6);
  EXPECT_TRUE(to6.Contains(Version::kDraft4));
  EXPECT_FALSE(to6.Contains(Version::kDraft7));

  VersionSet between = VersionsBetween(Version::kDraft6, Version::kDraft2019_09);
  EXPECT_FALSE(between.Contains(Version::kDraft4));
  EXPECT_TRUE(between.Contains(Version::kDraft2019_09));
  EXPECT_FALSE(between.Contains(Version::kDraft2020_12));

  EXPECT_TRUE(kOpenAPILike.Contains(Version::kKubernetesAPI));
  EXPECT_FALSE(kAllDrafts.Contains(Version::kOpenAPI));
}
