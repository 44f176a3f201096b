#include "CommandRunner.hpp"
#include "../common/Errors.hpp"

#include <cerrno>
#include <cstring>

#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lanwatch::platform
{
    std::string JoinCommand(const std::vector<std::string> &argv)
    {
        std::string joined;
        for (const auto &arg : argv)
        {
            if (!joined.empty())
                joined += ' ';
            joined += arg;
        }
        return joined;
    }


    namespace
    {
        void CloseFd(int &fd)
        {
            if (fd != -1)
            {
                close(fd);
                fd = -1;
            }
        }

        // Close-on-exec so children forked by other threads do not hold our pipe ends open.
        bool MakePipe(int fds[2])
        {
            if (pipe(fds) != 0)
                return false;
            fcntl(fds[0], F_SETFD, FD_CLOEXEC);
            fcntl(fds[1], F_SETFD, FD_CLOEXEC);
            return true;
        }
    }

    CommandOutput ProcessCommandRunner::Run(const std::vector<std::string> &argv, const std::string &input)
    {
        if (argv.empty())
            throw common::CommandError("empty command", -1);

        int outPipe[2] = {-1, -1};
        int inPipe[2] = {-1, -1};

        if (!MakePipe(outPipe))
            throw common::CommandError(std::string("pipe failed: ") + std::strerror(errno), -1);
        if (!MakePipe(inPipe))
        {
            CloseFd(outPipe[0]);
            CloseFd(outPipe[1]);
            throw common::CommandError(std::string("pipe failed: ") + std::strerror(errno), -1);
        }

        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &arg : argv)
            args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0)
        {
            CloseFd(outPipe[0]);
            CloseFd(outPipe[1]);
            CloseFd(inPipe[0]);
            CloseFd(inPipe[1]);
            throw common::CommandError(std::string("fork failed: ") + std::strerror(errno), -1);
        }

        if (pid == 0)
        {
            dup2(inPipe[0], STDIN_FILENO);
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(outPipe[1], STDERR_FILENO);
            close(inPipe[0]);
            close(inPipe[1]);
            close(outPipe[0]);
            close(outPipe[1]);

            execvp(args[0], args.data());
            _exit(127);
        }

        CloseFd(inPipe[0]);
        CloseFd(outPipe[1]);

        // A child that exits early must not kill us with SIGPIPE.
        static const bool sigpipeIgnored = []
        {
            std::signal(SIGPIPE, SIG_IGN);
            return true;
        }();
        (void)sigpipeIgnored;

        size_t written = 0;
        while (written < input.size())
        {
            ssize_t n = write(inPipe[1], input.data() + written, input.size() - written);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            written += static_cast<size_t>(n);
        }
        CloseFd(inPipe[1]);

        CommandOutput result;
        char buffer[4096];
        while (true)
        {
            ssize_t n = read(outPipe[0], buffer, sizeof(buffer));
            if (n > 0)
            {
                result.output.append(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            break;
        }
        CloseFd(outPipe[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
                throw common::CommandError("waitpid failed for " + argv[0], -1);
        }

        if (WIFEXITED(status))
            result.exitCode = WEXITSTATUS(status);
        else
            result.exitCode = -1;

        if (result.exitCode == 127 && result.output.empty())
            throw common::CommandError("command not found: " + argv[0], 127);

        return result;
    }
}
