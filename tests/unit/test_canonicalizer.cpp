#include <gtest/gtest.h>
#include "../../src/engine/canonical/canonicalizer.hpp"

using namespace Spoor::Engine::Canonical;
using Spoor::Engine::Extract::CandidateMatch;
using Spoor::Engine::Extract::OriginField;

class CanonicalizerTest : public ::testing::Test {
protected:
    Canonicalizer canonicalizer;
};

TEST_F(CanonicalizerTest, StripsSchemeAndLowercases) {
    auto entity = canonicalizer.canonicalize("HTTPS://Foo-Bar.MyShopify.com/products/x");
    ASSERT_TRUE(entity.has_value());
    EXPECT_EQ(entity->key, "foo-bar");
    EXPECT_EQ(entity->uri, "https://foo-bar.myshopify.com");
}

TEST_F(CanonicalizerTest, StripsCommonPrefixes) {
    EXPECT_EQ(canonicalizer.canonicalize("//foo.myshopify.com")->key, "foo");
    EXPECT_EQ(canonicalizer.canonicalize("www.foo.myshopify.com")->key, "foo");
    EXPECT_EQ(canonicalizer.canonicalize("*.foo.myshopify.com")->key, "foo");
    EXPECT_EQ(canonicalizer.canonicalize("  foo.myshopify.com  ")->key, "foo");
}

TEST_F(CanonicalizerTest, TakesTokenDirectlyBeforeSuffix) {
    EXPECT_EQ(canonicalizer.canonicalize("checkout.foo.myshopify.com")->key, "foo");
    EXPECT_EQ(canonicalizer.canonicalize("https://r.example.com/?u=https://foo.myshopify.com")->key,
              "foo");
}

TEST_F(CanonicalizerTest, RejectsReservedWords) {
    EXPECT_FALSE(canonicalizer.canonicalize("WWW.myshopify.com").has_value());
    EXPECT_FALSE(canonicalizer.canonicalize("admin.myshopify.com").has_value());
    EXPECT_FALSE(canonicalizer.canonicalize("https://cdn.myshopify.com/s/files").has_value());
}

TEST_F(CanonicalizerTest, RejectsInvalidLengthAndHyphens) {
    EXPECT_FALSE(canonicalizer.canonicalize("a.myshopify.com").has_value());
    EXPECT_FALSE(canonicalizer.canonicalize("-foo.myshopify.com").has_value());
    EXPECT_FALSE(canonicalizer.canonicalize("foo-.myshopify.com").has_value());
    EXPECT_FALSE(canonicalizer.canonicalize(std::string(64, 'a') + ".myshopify.com").has_value());
    EXPECT_TRUE(canonicalizer.canonicalize(std::string(63, 'a') + ".myshopify.com").has_value());
}

TEST_F(CanonicalizerTest, RequiresSuffixAtHostEnd) {
    EXPECT_FALSE(canonicalizer.canonicalize("foo.myshopify.com.evil.net").has_value());
    EXPECT_FALSE(canonicalizer.canonicalize("foo.myshopify.community").has_value());
    EXPECT_EQ(canonicalizer.canonicalize("visit foo.myshopify.com.")->key, "foo");
    EXPECT_FALSE(canonicalizer.canonicalize("myshopify.com").has_value());
    EXPECT_FALSE(canonicalizer.canonicalize("").has_value());
}

TEST_F(CanonicalizerTest, IsIdempotent) {
    const std::vector<std::string> inputs = {"HTTP://WWW.Foo.myshopify.com/cart",
                                             "//bar-baz.myshopify.com",
                                             "shop: qux9.MYSHOPIFY.COM",
                                             "checkout.alpha.myshopify.com/x?y=1"};
    for (const auto& input : inputs) {
        auto once = canonicalizer.canonicalize(input);
        ASSERT_TRUE(once.has_value()) << input;
        auto twice = canonicalizer.canonicalize(once->uri);
        ASSERT_TRUE(twice.has_value()) << input;
        EXPECT_EQ(*once, *twice) << input;
    }
}

TEST_F(CanonicalizerTest, AcceptsCandidateMatches) {
    CandidateMatch candidate{"Foo.myshopify.com", OriginField::LinkText, "http://src.test/"};
    EXPECT_EQ(canonicalizer.canonicalize(candidate)->key, "foo");
}

TEST(CanonicalizerCustomTest, CustomFingerprint) {
    Fingerprint fp;
    fp.suffix   = ".Fingerprint.com";
    fp.reserved = {"www"};
    Canonicalizer canonicalizer(fp);

    EXPECT_EQ(canonicalizer.canonicalize("foo.fingerprint.com")->uri, "https://foo.fingerprint.com");
    EXPECT_FALSE(canonicalizer.canonicalize("WWW.fingerprint.com").has_value());
    EXPECT_EQ(canonicalizer.canonicalize("admin.fingerprint.com")->key, "admin");
    EXPECT_FALSE(canonicalizer.canonicalize("foo.myshopify.com").has_value());
}
