// src/CommandRunner.cpp
#include <Neo4jCtl/CommandRunner.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <future>
#include <thread>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Neo4jCtl {

std::string toString(const CommandLine& command) {
    std::string line;
    for (const auto& arg : command) {
        if (!line.empty()) line += ' ';
        line += arg;
    }
    return line;
}

PosixCommandRunner::PosixCommandRunner() {
    m_logger = Utils::Logger::GetOrCreateLogger("CommandRunner");
}

int PosixCommandRunner::spawn(const CommandLine& command) {
    if (command.empty()) {
        throw CommandFailed("<empty command>", -1);
    }

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    m_logger->debug("Running: {}", toString(command));
    pid_t pid = fork();
    if (pid < 0) {
        m_logger->error("fork failed for {}: {}", command.front(), std::strerror(errno));
        throw CommandFailed(toString(command), -1);
    }

    if (pid == 0) {
        // CHILD: only async-signal-safe calls from here on
        execvp(argv[0], argv.data());
        _exit(127);
    }
    return pid;
}

int PosixCommandRunner::reap(int pid) {
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid, &status, 0);
    } while (r == -1 && errno == EINTR);

    if (r == -1) {
        m_logger->error("waitpid({}) failed: {}", pid, std::strerror(errno));
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int PosixCommandRunner::run(const CommandLine& command) {
    int pid = spawn(command);
    int exitStatus = reap(pid);
    m_logger->debug("{} exited with status {}", command.front(), exitStatus);
    return exitStatus;
}

std::optional<int> PosixCommandRunner::runFor(const CommandLine& command, std::chrono::milliseconds timeout) {
    int pid = spawn(command);

    // The waiter observes the exit without reaping (WNOWAIT), so the pid stays
    // ours until this thread decides between "finished" and "timed out".
    std::promise<void> exited;
    std::future<void> exitedFuture = exited.get_future();
    std::thread waiter([pid, &exited]() {
        siginfo_t info;
        std::memset(&info, 0, sizeof(info));
        while (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) == -1 && errno == EINTR) {
        }
        exited.set_value();
    });

    // A command that exits right at the bound still counts as finished
    if (exitedFuture.wait_for(timeout) == std::future_status::ready || hasExited(pid)) {
        waiter.join();
        int exitStatus = reap(pid);
        m_logger->debug("{} exited with status {}", command.front(), exitStatus);
        return exitStatus;
    }

    m_logger->debug("{} still running after {} ms; terminating it", command.front(), timeout.count());
    ::kill(pid, SIGKILL);
    waiter.join();
    reap(pid);
    return std::nullopt;
}

bool PosixCommandRunner::hasExited(int pid) {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    int r;
    do {
        r = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (r == -1 && errno == EINTR);
    // si_pid stays zero while the child is still running
    return r == 0 && info.si_pid != 0;
}

bool PosixCommandRunner::kill(int pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, SIGKILL) != 0) {
        m_logger->error("kill({}, SIGKILL) failed: {}", pid, std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace Neo4jCtl
