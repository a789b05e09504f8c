// include/Neo4jCtl/CommandRunner.hpp
#ifndef NEO4JCTL_COMMAND_RUNNER_HPP
#define NEO4JCTL_COMMAND_RUNNER_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Neo4jCtl {

    using CommandLine = std::vector<std::string>; // argv[0] is the program path

    std::string toString(const CommandLine& command);

    // Runs the server's scripts. Children inherit the terminal so interactive
    // subcommands (console, shell) work.
    class CommandRunner {
    public:
        virtual ~CommandRunner() = default;

        // Blocks until the command exits and returns its exit status
        virtual int run(const CommandLine& command) = 0;

        // Returns nullopt when the command is still running after timeout; the
        // command is then terminated and reaped before returning.
        virtual std::optional<int> runFor(const CommandLine& command, std::chrono::milliseconds timeout) = 0;

        // Forced termination (SIGKILL). Returns false if the signal could not be delivered.
        virtual bool kill(int pid) = 0;
    };

    class PosixCommandRunner : public CommandRunner {
    public:
        PosixCommandRunner();

        int run(const CommandLine& command) override;
        std::optional<int> runFor(const CommandLine& command, std::chrono::milliseconds timeout) override;
        bool kill(int pid) override;

        // Non-blocking check on a child of this process. Leaves an exited child unreaped.
        static bool hasExited(int pid);

    private:
        std::shared_ptr<spdlog::logger> m_logger;

        int spawn(const CommandLine& command);
        int reap(int pid);
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_COMMAND_RUNNER_HPP
