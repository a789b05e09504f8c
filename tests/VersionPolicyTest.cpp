// tests/VersionPolicyTest.cpp
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/VersionPolicy.hpp>

#include "TestSupport.hpp"

using namespace Neo4jCtl;
using Neo4jCtl::Testing::TempDirTest;

TEST(ServerVersionTest, ParsesDottedNumbers) {
    auto version = ServerVersion::parse("3.0.1");
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(version->str(), "3.0.1");
    EXPECT_FALSE(ServerVersion::parse("3.0.M01").has_value());
    EXPECT_FALSE(ServerVersion::parse("").has_value());
    EXPECT_FALSE(ServerVersion::parse("3..0").has_value());
}

TEST(ServerVersionTest, ComparesNumerically) {
    EXPECT_TRUE(*ServerVersion::parse("2.3.10") < *ServerVersion::parse("3.0.0"));
    EXPECT_TRUE(*ServerVersion::parse("10.0") >= *ServerVersion::parse("3.0.0"));
    EXPECT_TRUE(*ServerVersion::parse("3.0") == ServerVersion({3, 0, 0}));
    EXPECT_TRUE(*ServerVersion::parse("2.3.10") >= *ServerVersion::parse("2.3.9"));
}

TEST(VersionPolicyTest, ModernLayoutFromThreeZero) {
    VersionPolicy policy(ServerVersion({3, 0, 0}));
    EXPECT_TRUE(policy.usesModernLayout());
    EXPECT_EQ(policy.configPath(), std::filesystem::path("conf") / "neo4j.conf");
    EXPECT_EQ(policy.pidPath(), std::filesystem::path("run") / "neo4j.pid");
}

TEST(VersionPolicyTest, LegacyLayoutBeforeThreeZero) {
    VersionPolicy policy(ServerVersion({2, 3, 3}));
    EXPECT_FALSE(policy.usesModernLayout());
    EXPECT_EQ(policy.configPath(), std::filesystem::path("conf") / "neo4j-server.properties");
    EXPECT_EQ(policy.pidPath(), std::filesystem::path("data") / "neo4j-service.pid");
}

TEST(VersionPolicyTest, ModernPortProperties) {
    VersionPolicy policy(ServerVersion({3, 1, 0}));
    PropertyList expected{
        {"dbms.connector.https.enabled", "false"},
        {"dbms.connector.http.enabled", "true"},
        {"dbms.connector.http.address", "0.0.0.0:7474"},
        {"dbms.connector.https.address", "localhost:7473"},
    };
    EXPECT_EQ(policy.portProperties(7474), expected);
}

TEST(VersionPolicyTest, LegacyPortProperties) {
    VersionPolicy policy(ServerVersion({2, 3, 3}));
    PropertyList expected{
        {"org.neo4j.server.webserver.https.enabled", "false"},
        {"org.neo4j.server.webserver.port", "8000"},
        {"org.neo4j.server.webserver.https.port", "7999"},
    };
    EXPECT_EQ(policy.portProperties(8000), expected);
}

class VersionDetectionTest : public TempDirTest {};

TEST_F(VersionDetectionTest, ReadsKernelJar) {
    makeInstallation(m_dir, "3.0.1");
    writeFile(m_dir / "lib" / "neo4j-kernel-helper-9.9.jar", "");
    EXPECT_EQ(VersionPolicy::detectVersion(m_dir).str(), "3.0.1");
    EXPECT_TRUE(VersionPolicy::forInstallation(m_dir).usesModernLayout());
}

TEST_F(VersionDetectionTest, NoInstallationThrows) {
    EXPECT_THROW(VersionPolicy::detectVersion(m_dir), VersionUndetected);
    writeFile(m_dir / "lib" / "other.jar", "");
    EXPECT_THROW(VersionPolicy::detectVersion(m_dir), VersionUndetected);
}
