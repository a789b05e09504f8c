// src/main.cpp
#include <Neo4jCtl/CommandRunner.hpp>
#include <Neo4jCtl/Config.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/HttpManager.hpp>
#include <Neo4jCtl/PromptPort.hpp>
#include <Neo4jCtl/ServerManager.hpp>
#include <Neo4jCtl/Types/Platform.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>
#include <spdlog/spdlog.h> // For spdlog::shutdown()

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cerr << "Usage: neo4jctl [--path DIR] [--superuser-only] <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  install <edition>        download and extract, e.g. community-latest\n"
                 "  start [--no-wait]        start the server\n"
                 "  stop [timeout-seconds]   stop the server, killing it after the timeout\n"
                 "  console                  run the server in the foreground\n"
                 "  shell                    open the interactive shell\n"
                 "  info                     print server information\n"
                 "  restart                  restart the server\n"
                 "  reset                    stop, delete all data and logs, start\n"
                 "  config-auth <true|false> enable or disable authentication\n"
                 "  config-port <port>       HTTP on port, HTTPS on port - 1\n"
                 "  change-password          change the neo4j user's password\n";
}

bool parseBool(const std::string& text) {
    if (text == "true" || text == "1" || text == "yes") return true;
    if (text == "false" || text == "0" || text == "no") return false;
    throw Neo4jCtl::ConfigError("Expected true or false, got: " + text);
}

int parseInt(const std::string& text, const std::string& what) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw Neo4jCtl::ConfigError("Invalid " + what + ": " + text);
}

const char* toString(Neo4jCtl::StopOutcome outcome) {
    switch (outcome) {
        case Neo4jCtl::StopOutcome::Stopped: return "stopped";
        case Neo4jCtl::StopOutcome::Killed: return "killed after timeout";
        case Neo4jCtl::StopOutcome::TimedOut: return "timed out";
    }
    return "unknown";
}

int runCommand(const Neo4jCtl::Config& config, bool superuserOnly, const std::vector<std::string>& args) {
    const std::string& command = args.front();
    const auto argument = [&args](size_t i) -> std::optional<std::string> {
        if (i < args.size()) return args[i];
        return std::nullopt;
    };

    Neo4jCtl::HttpManager httpManager(config.caBundle);

    if (command == "change-password") {
        Neo4jCtl::ConsolePromptPort prompt;
        Neo4jCtl::PasswordChangeResult result = Neo4jCtl::ServerManager::changePassword(prompt, httpManager);
        return result.success ? 0 : 1;
    }

    Neo4jCtl::PosixCommandRunner runner;
    Neo4jCtl::PermissionGate gate =
        superuserOnly ? Neo4jCtl::PermissionGate::requireSuperuser() : Neo4jCtl::PermissionGate::allowAll();
    Neo4jCtl::ServerManager manager(config, Neo4jCtl::Platform::current(), httpManager, runner, gate);

    if (command == "install") {
        auto edition = argument(1);
        if (!edition) {
            printUsage();
            return 2;
        }
        manager.install(*edition);
    } else if (command == "start") {
        manager.start(argument(1) != std::optional<std::string>("--no-wait"));
    } else if (command == "stop") {
        std::optional<std::chrono::milliseconds> timeout;
        if (auto seconds = argument(1)) {
            timeout = std::chrono::seconds(parseInt(*seconds, "timeout"));
        }
        Neo4jCtl::StopOutcome outcome = manager.stop(timeout);
        CORE_LOG_INFO("Neo4j server {}", toString(outcome));
    } else if (command == "console") {
        manager.console();
    } else if (command == "shell") {
        manager.shell();
    } else if (command == "info") {
        manager.info();
    } else if (command == "restart") {
        manager.restart();
    } else if (command == "reset") {
        manager.reset();
    } else if (command == "config-auth") {
        auto value = argument(1);
        if (!value) {
            printUsage();
            return 2;
        }
        manager.setAuthEnabled(parseBool(*value));
    } else if (command == "config-port") {
        auto value = argument(1);
        if (!value) {
            printUsage();
            return 2;
        }
        manager.setPort(parseInt(*value, "port"));
    } else {
        CORE_LOG_ERROR("Unknown command: {}", command);
        printUsage();
        return 2;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path installation = "./db/neo4j/development";
    bool superuserOnly = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--path" && i + 1 < argc) {
            installation = argv[++i];
        } else if (arg == "--superuser-only") {
            superuserOnly = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage();
        return 2;
    }

    const Neo4jCtl::Config config = Neo4jCtl::Config::fromEnvironment(installation);
    Neo4jCtl::Utils::Logger::Init(config.logDir, "neo4jctl.log", spdlog::level::info, spdlog::level::trace);
    CORE_LOG_TRACE("Installation path: {}", config.installPath.string());
    CORE_LOG_TRACE("Platform: {}", Neo4jCtl::Utils::toString(Neo4jCtl::Platform::current().os));

    int status = 0;
    try {
        status = runCommand(config, superuserOnly, args);
    } catch (const Neo4jCtl::Error& e) {
        CORE_LOG_CRITICAL("{}", e.what());
        status = 1;
    } catch (const std::exception& e) {
        CORE_LOG_CRITICAL("Unexpected failure: {}", e.what());
        status = 1;
    }

    spdlog::shutdown();
    return status;
}
