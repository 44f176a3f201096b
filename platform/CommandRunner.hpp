#pragma once

#include <string>
#include <vector>

namespace lanwatch::platform
{
    struct CommandOutput
    {
        int exitCode = -1;
        // stdout and stderr, interleaved.
        std::string output;

        bool Ok() const { return exitCode == 0; }
    };

    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;

        // Runs argv[0] with the given arguments, without a shell, and blocks until it
        // exits. `input` is written to the child's stdin. Throws CommandError when the
        // process cannot be started at all.
        virtual CommandOutput Run(const std::vector<std::string> &argv, const std::string &input = "") = 0;
    };

    // fork/exec with pipes; POSIX hosts only.
    class ProcessCommandRunner : public CommandRunner
    {
    public:
        CommandOutput Run(const std::vector<std::string> &argv, const std::string &input = "") override;
    };

    std::string JoinCommand(const std::vector<std::string> &argv);
}
