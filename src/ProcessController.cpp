// src/ProcessController.cpp
#include <Neo4jCtl/ProcessController.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/VersionPolicy.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>

#include <fstream>

namespace Neo4jCtl {

std::string toString(ProcessState state) {
    switch (state) {
        case ProcessState::NotStarted: return "not started";
        case ProcessState::Starting: return "starting";
        case ProcessState::Running: return "running";
        case ProcessState::Stopping: return "stopping";
        case ProcessState::Stopped: return "stopped";
    }
    return "unknown";
}

ProcessController::ProcessController(std::filesystem::path installPath, Platform platform, CommandRunner& runner,
                                     PermissionGate gate)
    : m_installPath(std::move(installPath)),
      m_platform(std::move(platform)),
      m_runner(runner),
      m_gate(std::move(gate)),
      m_state(ProcessState::NotStarted) {
    m_logger = Utils::Logger::GetOrCreateLogger("ProcessController");
}

std::filesystem::path ProcessController::serverBinaryPath() const {
    return m_installPath / "bin" / m_platform.serverBinary;
}

std::filesystem::path ProcessController::shellBinaryPath() const {
    return m_installPath / "bin" / m_platform.shellBinary;
}

std::filesystem::path ProcessController::pidFilePath() const {
    return m_installPath / VersionPolicy::forInstallation(m_installPath).pidPath();
}

bool ProcessController::isRunning() const {
    return std::filesystem::exists(pidFilePath());
}

CommandLine ProcessController::serverCommand(const std::string& subcommand) const {
    return {serverBinaryPath().string(), subcommand};
}

void ProcessController::runOrFail(const CommandLine& command) {
    int exitStatus = m_runner.run(command);
    if (exitStatus != 0) {
        throw CommandFailed(toString(command), exitStatus);
    }
}

std::optional<int> ProcessController::readPidFile(const std::filesystem::path& path) const {
    std::ifstream in(path);
    int pid = 0;
    if (!(in >> pid) || pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

void ProcessController::start(bool wait) {
    // Resolved first so a missing version fails before anything runs
    const std::filesystem::path pidFile = pidFilePath();

    const ProcessState previous = m_state;
    m_state = ProcessState::Starting;
    try {
        runOrFail(serverCommand(wait ? "start" : "start-no-wait"));
    } catch (const CommandFailed&) {
        m_state = previous;
        throw;
    }

    m_pid = readPidFile(pidFile);
    if (m_pid) {
        m_logger->debug("Server started with pid {}", *m_pid);
    } else {
        m_logger->warn("Server started but no pid could be read from {}", pidFile.string());
    }
    m_state = ProcessState::Running;
    m_logger->debug("Server {}", toString(m_state));
}

StopOutcome ProcessController::stop(std::optional<std::chrono::milliseconds> timeout) {
    m_gate.require(AdminOperation::Stop);
    return stopServer(timeout);
}

StopOutcome ProcessController::stopServer(std::optional<std::chrono::milliseconds> timeout) {
    const ProcessState previous = m_state;
    m_state = ProcessState::Stopping;
    const CommandLine command = serverCommand("stop");

    if (!timeout) {
        try {
            runOrFail(command);
        } catch (const CommandFailed&) {
            m_state = previous;
            throw;
        }
        m_state = ProcessState::Stopped;
        return StopOutcome::Stopped;
    }

    std::optional<int> exitStatus = m_runner.runFor(command, *timeout);
    if (exitStatus) {
        if (*exitStatus != 0) {
            m_state = previous;
            throw CommandFailed(toString(command), *exitStatus);
        }
        m_state = ProcessState::Stopped;
        return StopOutcome::Stopped;
    }

    m_logger->warn("Shutdown timeout reached, killing process...");
    if (!m_pid) {
        m_logger->warn("No process id was recorded by start; nothing to kill.");
        m_state = previous;
        return StopOutcome::TimedOut;
    }

    if (!m_runner.kill(*m_pid)) {
        m_logger->error("Could not kill process {}", *m_pid);
        m_state = previous;
        return StopOutcome::TimedOut;
    }

    m_logger->info("Killed process {}", *m_pid);
    m_pid.reset();

    // The killed server never got to remove its own pid file
    std::error_code ec;
    std::filesystem::remove(pidFilePath(), ec);
    if (ec) {
        m_logger->warn("Could not remove stale pid file {}: {}", pidFilePath().string(), ec.message());
    }
    m_state = ProcessState::Stopped;
    m_logger->debug("Server {}", toString(m_state));
    return StopOutcome::Killed;
}

void ProcessController::restart() {
    m_gate.require(AdminOperation::Restart);
    const std::filesystem::path pidFile = pidFilePath();
    runOrFail(serverCommand("restart"));
    m_pid = readPidFile(pidFile);
    m_state = ProcessState::Running;
}

void ProcessController::info() {
    m_gate.require(AdminOperation::Info);
    runOrFail(serverCommand("info"));
}

void ProcessController::console() {
    runOrFail(serverCommand("console"));
}

void ProcessController::shell() {
    const bool notStarted = !isRunning();

    if (notStarted) {
        start();
    }

    try {
        runOrFail({shellBinaryPath().string()});
    } catch (const Error&) {
        if (notStarted) {
            stopServer(std::nullopt);
        }
        throw;
    }

    if (notStarted) {
        stopServer(std::nullopt);
    }
}

void ProcessController::clearDirectory(const std::filesystem::path& directory) {
    m_logger->info("Deleting all files matching {}", (directory / "*").string());

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return;
    }
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        std::filesystem::remove_all(entry.path(), ec);
        if (ec) {
            throw Error("Unable to delete " + entry.path().string() + ": " + ec.message());
        }
    }
}

void ProcessController::reset() {
    m_gate.require(AdminOperation::Reset);

    stopServer(std::nullopt);

    clearDirectory(m_installPath / "data" / "graph.db");
    clearDirectory(m_installPath / "data" / "log");

    start();
}

} // namespace Neo4jCtl
