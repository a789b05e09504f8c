// include/Neo4jCtl/ProcessController.hpp
#ifndef NEO4JCTL_PROCESS_CONTROLLER_HPP
#define NEO4JCTL_PROCESS_CONTROLLER_HPP

#include <Neo4jCtl/CommandRunner.hpp>
#include <Neo4jCtl/PermissionGate.hpp>
#include <Neo4jCtl/Types/Platform.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <spdlog/logger.h>

namespace Neo4jCtl {

    enum class ProcessState {
        NotStarted,
        Starting,
        Running,
        Stopping,
        Stopped
    };

    enum class StopOutcome {
        Stopped,  // the stop command finished within the bound
        Killed,   // bound exceeded, recorded pid force-killed
        TimedOut  // bound exceeded, no pid known (or the kill failed)
    };

    std::string toString(ProcessState state);

    // Drives bin/<server binary> for one installation. Not safe to share an
    // installation path between several controllers at once.
    class ProcessController {
    public:
        ProcessController(std::filesystem::path installPath, Platform platform, CommandRunner& runner,
                          PermissionGate gate = PermissionGate());

        // "start" or "start-no-wait", then records the pid from the pid file
        void start(bool wait = true);

        // Without a timeout waits for the stop command indefinitely
        StopOutcome stop(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        void restart();
        void info();
        void console();

        // Runs the interactive shell, starting the server around it if it was not running.
        // Not gated, including the stop that undoes its own start.
        void shell();

        // Stops the server, empties data/graph.db and data/log, starts again. No confirmation.
        void reset();

        ProcessState state() const { return m_state; }
        std::optional<int> pid() const { return m_pid; }

        // The pid file exists
        bool isRunning() const;

        std::filesystem::path serverBinaryPath() const;
        std::filesystem::path shellBinaryPath() const;
        std::filesystem::path pidFilePath() const;

    private:
        std::filesystem::path m_installPath;
        Platform m_platform;
        CommandRunner& m_runner;
        PermissionGate m_gate;
        ProcessState m_state;
        std::optional<int> m_pid;
        std::shared_ptr<spdlog::logger> m_logger;

        StopOutcome stopServer(std::optional<std::chrono::milliseconds> timeout);
        CommandLine serverCommand(const std::string& subcommand) const;
        void runOrFail(const CommandLine& command);
        std::optional<int> readPidFile(const std::filesystem::path& path) const;
        void clearDirectory(const std::filesystem::path& directory);
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_PROCESS_CONTROLLER_HPP
