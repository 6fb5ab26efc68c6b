#include <gtest/gtest.h>

#include "uri.h"

using namespace xschema;

TEST(URITest, ParseParts) {
  auto uri = URI::Parse("https://example.com/schemas/foo.json?x=1#/$defs/a%20b");
  ASSERT_TRUE(uri.IsOk());
  const URI& u = uri.ValueRef();
  EXPECT_TRUE(u.IsAbs());
  EXPECT_EQ(u.Scheme(), "https");
  EXPECT_EQ(u.Host(), "example.com");
  EXPECT_EQ(u.PathPart(), "/schemas/foo.json");
  EXPECT_TRUE(u.HasFragment());
  EXPECT_EQ(u.Fragment(), "/$defs/a b");
  EXPECT_EQ(u.WithoutFragment().String(), "https://example.com/schemas/foo.json?x=1");
}

TEST(URITest, ParseOpaqueAndRelative) {
  auto urn = URI::Parse("urn:uuid:1234");
  ASSERT_TRUE(urn.IsOk());
  EXPECT_TRUE(urn.ValueRef().IsAbs());
  EXPECT_EQ(urn.ValueRef().Opaque(), "uuid:1234");
  EXPECT_EQ(urn.ValueRef().String(), "urn:uuid:1234");

  auto relative = URI::Parse("#/definitions/x");
  ASSERT_TRUE(relative.IsOk());
  EXPECT_FALSE(relative.ValueRef().IsAbs());
  EXPECT_EQ(relative.ValueRef().Fragment(), "/definitions/x");
}

TEST(URITest, ParseErrors) {
  EXPECT_TRUE(URI::Parse(":foo").IsErr());
  EXPECT_TRUE(URI::Parse("http://x/%zz").IsErr());
}

TEST(URITest, ResolveReference) {
  URI base = URI::Parse("https://example.com/a/b/schema.json").Unwrap();
  auto resolve = [&](const std::string& ref) {
    return base.ResolveReference(URI::Parse(ref).Unwrap()).String();
  };
  EXPECT_EQ(resolve("other.json"), "https://example.com/a/b/other.json");
  EXPECT_EQ(resolve("../c.json#/x"), "https://example.com/a/c.json#/x");
  EXPECT_EQ(resolve("/root.json"), "https://example.com/root.json");
  EXPECT_EQ(resolve("#/$defs/foo"), "https://example.com/a/b/schema.json#/$defs/foo");
  EXPECT_EQ(resolve("http://other.org/x"), "http://other.org/x");
}

TEST(URITest, FragmentEscaping) {
  URI base = URI::Parse("https://example.com/s").Unwrap();
  EXPECT_EQ(base.WithFragment("/a b").String(), "https://example.com/s#/a%20b");
  EXPECT_EQ(base.WithFragment("/$defs/x").String(), "https://example.com/s#/$defs/x");
}

TEST(URITest, Base64RawURLEncode) {
  EXPECT_EQ(Base64RawURLEncode(""), "");
  EXPECT_EQ(Base64RawURLEncode("f"), "Zg");
  EXPECT_EQ(Base64RawURLEncode("fo"), "Zm8");
  EXPECT_EQ(Base64RawURLEncode("foo"), "Zm9v");
  EXPECT_EQ(Base64RawURLEncode("\xfb\xff"), "-_8");
}
