// include/Neo4jCtl/Errors.hpp
#ifndef NEO4JCTL_ERRORS_HPP
#define NEO4JCTL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Neo4jCtl {

    // Base of everything the manager throws. Callers catch this to report and exit.
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class VersionResolutionError : public Error {
    public:
        enum class Kind {
            UnknownNickname,      // nickname is not a key of the catalog
            NicknameHasNoVersion  // key present, value null
        };

        VersionResolutionError(Kind kind, const std::string& nickname, const std::string& message)
            : Error(message), m_kind(kind), m_nickname(nickname) {}

        Kind kind() const { return m_kind; }
        const std::string& nickname() const { return m_nickname; }

    private:
        Kind m_kind;
        std::string m_nickname;
    };

    class DownloadError : public Error {
    public:
        using Error::Error;
    };

    class InstallError : public Error {
    public:
        using Error::Error;
    };

    class CommandFailed : public Error {
    public:
        CommandFailed(const std::string& commandLine, int exitStatus)
            : Error("Unable to run: " + commandLine + " (exit status " + std::to_string(exitStatus) + ")"),
              m_commandLine(commandLine), m_exitStatus(exitStatus) {}

        const std::string& commandLine() const { return m_commandLine; }
        int exitStatus() const { return m_exitStatus; }

    private:
        std::string m_commandLine;
        int m_exitStatus;
    };

    class PermissionDenied : public Error {
    public:
        using Error::Error;
    };

    class ConfigError : public Error {
    public:
        using Error::Error;
    };

    class VersionUndetected : public Error {
    public:
        using Error::Error;
    };

    class MissingNewPassword : public Error {
    public:
        MissingNewPassword() : Error("A new password is required") {}
    };

    // Transport failure or an unparseable body from a remote endpoint
    class HttpError : public Error {
    public:
        HttpError(const std::string& message, long statusCode = 0)
            : Error(message), m_statusCode(statusCode) {}

        long statusCode() const { return m_statusCode; }

    private:
        long m_statusCode;
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_ERRORS_HPP
