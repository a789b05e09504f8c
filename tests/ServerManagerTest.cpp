// tests/ServerManagerTest.cpp
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/ServerManager.hpp>

#include "TestSupport.hpp"

using namespace Neo4jCtl;
using namespace Neo4jCtl::Testing;
using namespace std::chrono_literals;

namespace {

const std::string kCatalogUrl = "https://example.test/neo4j_versions.yml";
const std::string kDownloadBase = "http://dist.example.test";

} // namespace

class ServerManagerTest : public TempDirTest {
protected:
    FakeHttpClient http;
    FakeCommandRunner runner;

    Config makeConfig() const {
        Config config(m_dir / "db" / "neo4j" / "development");
        config.versionsCatalogUrl = kCatalogUrl;
        config.downloadBaseUrl = kDownloadBase;
        config.verifyChecksum = false;
        return config;
    }

    std::filesystem::path installPath() const { return m_dir / "db" / "neo4j" / "development"; }

    // Serves a community 3.0.1 tarball behind the catalog's "latest" nickname
    void serveDistribution() {
        http.gets[kCatalogUrl] = makeResponse(200, "latest: 3.0.1\n");
        const std::string url = kDownloadBase + "/neo4j-community-3.0.1-unix.tar.gz";
        http.heads[url] = makeResponse(200);

        const std::filesystem::path tarball = m_dir / "fixture.tar.gz";
        writeTarGz(tarball, {
            {"neo4j-community-3.0.1/bin/neo4j", "#!/bin/sh\n", 0755},
            {"neo4j-community-3.0.1/bin/neo4j-shell", "#!/bin/sh\n", 0755},
            {"neo4j-community-3.0.1/lib/neo4j-kernel-3.0.1.jar", "jar", 0644},
            {"neo4j-community-3.0.1/conf/neo4j.conf",
             "#dbms.security.auth_enabled=false\n"
             "#dbms.connector.http.address=0.0.0.0:7474\n"
             "dbms.connector.https.address=localhost:7473\n"
             "dbms.connector.http.enabled=true\n"
             "dbms.connector.https.enabled=true\n",
             0644},
        });
        http.bodies[url] = readFile(tarball);
        std::filesystem::remove(tarball);
    }
};

TEST_F(ServerManagerTest, ConstructionCreatesInstallationDirectory) {
    ServerManager manager(makeConfig(), Platform::posix(), http, runner);
    EXPECT_TRUE(std::filesystem::is_directory(installPath()));
}

TEST_F(ServerManagerTest, InstallResolvesDownloadsAndExtracts) {
    serveDistribution();
    ServerManager manager(makeConfig(), Platform::posix(), http, runner);

    EXPECT_EQ(manager.install("community-latest"), InstallResult::Installed);

    EXPECT_TRUE(std::filesystem::exists(installPath() / "bin" / "neo4j"));
    EXPECT_TRUE(std::filesystem::exists(installPath() / "conf" / "neo4j.conf"));
    EXPECT_EQ(http.count("DOWNLOAD " + kDownloadBase + "/neo4j-community-3.0.1-unix.tar.gz"), 1u);
}

TEST_F(ServerManagerTest, InstallIsSkippedWhenAlreadyInstalled) {
    makeInstallation(installPath(), "3.0.1");
    ServerManager manager(makeConfig(), Platform::posix(), http, runner);

    EXPECT_EQ(manager.install("community-latest"), InstallResult::AlreadyInstalled);
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(ServerManagerTest, InstallOfUnavailableVersionThrows) {
    http.gets[kCatalogUrl] = makeResponse(200, "latest: 9.9.9\n");
    ServerManager manager(makeConfig(), Platform::posix(), http, runner);

    EXPECT_THROW(manager.install("community-latest"), DownloadError);
    EXPECT_FALSE(std::filesystem::exists(installPath() / "bin" / "neo4j"));
}

TEST_F(ServerManagerTest, SetAuthEnabledUncommentsProperty) {
    serveDistribution();
    ServerManager manager(makeConfig(), Platform::posix(), http, runner);
    manager.install("community-latest");

    manager.setAuthEnabled(true);

    const std::string conf = readFile(installPath() / "conf" / "neo4j.conf");
    EXPECT_EQ(conf.rfind("dbms.security.auth_enabled=true\n", 0), 0u);
}

TEST_F(ServerManagerTest, SetPortWritesHttpAndHttpsPair) {
    serveDistribution();
    ServerManager manager(makeConfig(), Platform::posix(), http, runner);
    manager.install("community-latest");

    manager.setPort(7474);

    EXPECT_EQ(readFile(installPath() / "conf" / "neo4j.conf"),
              "#dbms.security.auth_enabled=false\n"
              "dbms.connector.http.address=0.0.0.0:7474\n"
              "dbms.connector.https.address=localhost:7473\n"
              "dbms.connector.http.enabled=true\n"
              "dbms.connector.https.enabled=false\n");
}

TEST_F(ServerManagerTest, SetPortRejectsOutOfRangePort) {
    makeInstallation(installPath(), "3.0.1");
    ServerManager manager(makeConfig(), Platform::posix(), http, runner);
    EXPECT_THROW(manager.setPort(0), ConfigError);
    EXPECT_THROW(manager.setPort(70000), ConfigError);
}

TEST_F(ServerManagerTest, ConfigChangesNeedAnInstallation) {
    ServerManager manager(makeConfig(), Platform::posix(), http, runner);
    EXPECT_THROW(manager.setAuthEnabled(false), VersionUndetected);
}

TEST_F(ServerManagerTest, LifecycleDelegatesToProcessController) {
    makeInstallation(installPath(), "3.0.1");
    runner.scripts["start"].effect = [this]() { writeFile(installPath() / "run" / "neo4j.pid", "1234"); };
    runner.scripts["stop"].timesOut = true;
    ServerManager manager(makeConfig(), Platform::posix(), http, runner);

    manager.start();
    EXPECT_EQ(manager.stop(2s), StopOutcome::Killed);
    EXPECT_EQ(runner.killed, std::vector<int>{1234});

    manager.info();
    manager.restart();
    manager.console();
    EXPECT_EQ(runner.subcommands(), (std::vector<std::string>{"start", "stop", "info", "restart", "console"}));
}

TEST_F(ServerManagerTest, GateAppliesThroughManager) {
    makeInstallation(installPath(), "3.0.1");
    ServerManager manager(makeConfig(), Platform::posix(), http, runner,
                          PermissionGate([](AdminOperation op) { return op != AdminOperation::Reset; }));

    EXPECT_THROW(manager.reset(), PermissionDenied);
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(ServerManagerTest, ChangePasswordUsesPromptAndHttp) {
    ScriptedPrompt prompt({"", "", "fresh"});
    http.postResponse = makeResponse(200, "{}");

    PasswordChangeResult result = ServerManager::changePassword(prompt, http);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(http.lastPostFields["new_password"], "fresh");
}
