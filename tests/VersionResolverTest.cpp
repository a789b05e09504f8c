// tests/VersionResolverTest.cpp
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/VersionCatalog.hpp>
#include <Neo4jCtl/VersionResolver.hpp>

#include "TestSupport.hpp"

using namespace Neo4jCtl;
using namespace Neo4jCtl::Testing;

namespace {

const std::string kCatalogUrl = "https://example.test/neo4j_versions.yml";

} // namespace

class VersionResolverTest : public ::testing::Test {
protected:
    FakeHttpClient http;
    VersionCatalog catalog{http, kCatalogUrl};
    VersionResolver resolver{catalog};

    void SetUp() override {
        http.gets[kCatalogUrl] = makeResponse(200,
            "latest: 3.0.1\n"
            "stable: 2.3.3\n"
            "test: 3.0.0-M05\n"
            "enterprise: 4.0.1\n"
            "retired: ~\n");
    }
};

TEST_F(VersionResolverTest, SubstitutesNicknameSuffix) {
    EXPECT_EQ(resolver.resolve("community-latest"), "community-3.0.1");
    EXPECT_EQ(resolver.resolve("Enterprise-Stable"), "enterprise-2.3.3");
}

TEST_F(VersionResolverTest, CatalogFetchedOnce) {
    resolver.resolve("community-latest");
    resolver.resolve("community-test");
    EXPECT_EQ(http.count("GET"), 1u);
}

TEST_F(VersionResolverTest, LiteralVersionSkipsNetwork) {
    EXPECT_EQ(resolver.resolve("community-2.3.3"), "community-2.3.3");
    EXPECT_EQ(resolver.resolve("3.0.1"), "3.0.1");
    EXPECT_TRUE(http.requests.empty());
    EXPECT_FALSE(catalog.isLoaded());
}

TEST_F(VersionResolverTest, BareNicknameFromCatalog) {
    EXPECT_EQ(resolver.resolve("enterprise"), "4.0.1");
}

TEST_F(VersionResolverTest, BareWordNotInCatalogStaysLiteral) {
    EXPECT_EQ(resolver.resolve("community"), "community");
}

TEST_F(VersionResolverTest, BareWordSurvivesUnreachableCatalog) {
    http.gets.clear();
    EXPECT_EQ(resolver.resolve("community"), "community");
    EXPECT_EQ(http.count("GET"), 1u);

    http.gets[kCatalogUrl] = makeResponse(200, "- not\n- a mapping\n");
    EXPECT_EQ(resolver.resolve("Enterprise"), "enterprise");
}

TEST_F(VersionResolverTest, UnknownNicknameThrows) {
    try {
        resolver.resolve("x-unknown");
        FAIL() << "expected VersionResolutionError";
    } catch (const VersionResolutionError& e) {
        EXPECT_EQ(e.kind(), VersionResolutionError::Kind::UnknownNickname);
        EXPECT_EQ(e.nickname(), "unknown");
    }
}

TEST_F(VersionResolverTest, NicknameWithoutVersionThrows) {
    try {
        resolver.resolve("community-retired");
        FAIL() << "expected VersionResolutionError";
    } catch (const VersionResolutionError& e) {
        EXPECT_EQ(e.kind(), VersionResolutionError::Kind::NicknameHasNoVersion);
    }
}

TEST_F(VersionResolverTest, UnreachableCatalogThrowsHttpError) {
    http.gets.clear();
    EXPECT_THROW(resolver.resolve("community-latest"), HttpError);
}

TEST(NicknameSuffixTest, OnlyLetterSegments) {
    EXPECT_EQ(VersionResolver::nicknameSuffix("community-LATEST"), std::optional<std::string>("latest"));
    EXPECT_EQ(VersionResolver::nicknameSuffix("enterprise"), std::optional<std::string>("enterprise"));
    EXPECT_FALSE(VersionResolver::nicknameSuffix("community-3.0.1").has_value());
    EXPECT_FALSE(VersionResolver::nicknameSuffix("community-").has_value());
}

TEST(VersionCatalogParseTest, NullValuesAreAbsentVersions) {
    VersionMap versions = VersionCatalog::parse("latest: '3.0.1'\nold:\n");
    ASSERT_EQ(versions.size(), 2u);
    EXPECT_EQ(versions["latest"], std::optional<std::string>("3.0.1"));
    EXPECT_FALSE(versions["old"].has_value());
}

TEST(VersionCatalogParseTest, NonMappingDocumentThrows) {
    EXPECT_THROW(VersionCatalog::parse("- 3.0.1\n- 2.3.3\n"), HttpError);
    EXPECT_THROW(VersionCatalog::parse("{unbalanced"), HttpError);
}

TEST(VersionCatalogParseTest, NonScalarKeyThrowsHttpError) {
    EXPECT_THROW(VersionCatalog::parse("? [a, b]\n: 3.0.1\n"), HttpError);
}
