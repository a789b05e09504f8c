// tests/ConfigTest.cpp
#include <Neo4jCtl/Config.hpp>

#include <gtest/gtest.h>

#include <cstdlib>

using namespace Neo4jCtl;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("NEO4JCTL_DOWNLOAD_URL");
        unsetenv("NEO4JCTL_VERIFY_CHECKSUM");
        unsetenv("NEO4JCTL_LOG_DIR");
    }
};

TEST_F(ConfigTest, InstallPathIsAbsoluteAndNormalized) {
    Config config("/srv/db/../db/neo4j/development");
    EXPECT_EQ(config.installPath, std::filesystem::path("/srv/db/neo4j/development"));
    EXPECT_EQ(config.logDir, std::filesystem::path("/srv/db/neo4j/neo4jctl-logs"));
    EXPECT_TRUE(config.verifyChecksum);
    EXPECT_FALSE(config.caBundle.has_value());
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    setenv("NEO4JCTL_DOWNLOAD_URL", "https://mirror.example.test/neo4j//", 1);
    setenv("NEO4JCTL_VERIFY_CHECKSUM", "False", 1);
    setenv("NEO4JCTL_LOG_DIR", "/var/log/neo4jctl", 1);

    Config config = Config::fromEnvironment("/srv/neo4j");

    EXPECT_EQ(config.downloadBaseUrl, "https://mirror.example.test/neo4j");
    EXPECT_FALSE(config.verifyChecksum);
    EXPECT_EQ(config.logDir, std::filesystem::path("/var/log/neo4jctl"));
}
