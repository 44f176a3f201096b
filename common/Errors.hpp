#pragma once

#include <stdexcept>
#include <string>

namespace lanwatch::common
{
    // Elevated rights or a capture handle are unavailable.
    class PrivilegeError : public std::runtime_error
    {
    public:
        explicit PrivilegeError(const std::string &what) : std::runtime_error(what) {}
    };

    // Gateway, hostname or vendor lookup failed.
    class ResolutionError : public std::runtime_error
    {
    public:
        explicit ResolutionError(const std::string &what) : std::runtime_error(what) {}
    };

    // An OS-level control command could not be run or exited nonzero.
    class CommandError : public std::runtime_error
    {
    public:
        CommandError(const std::string &what, int exitCode)
            : std::runtime_error(what), m_exitCode(exitCode) {}

        int ExitCode() const { return m_exitCode; }

    private:
        int m_exitCode;
    };

    class TimeoutError : public std::runtime_error
    {
    public:
        explicit TimeoutError(const std::string &what) : std::runtime_error(what) {}
    };
}
