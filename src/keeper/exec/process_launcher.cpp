/// @file src/keeper/exec/process_launcher.cpp
/// @brief Implementation for detached target launching.

#include <cerrno>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include "./process_launcher.h"
#include "./exec_error_domain.h"

namespace keeper
{
    namespace exec
    {
        namespace
        {
            const int cFirstInheritedFd{3};
            const int cLastInheritedFd{255};

            // Runs in the grandchild after fork; only async-signal-safe calls.
            void ExecDetached(const std::vector<char *> &argv)
            {
                const int cDevNull{::open("/dev/null", O_RDWR)};
                if (cDevNull >= 0)
                {
                    (void)::dup2(cDevNull, STDIN_FILENO);
                    (void)::dup2(cDevNull, STDOUT_FILENO);
                    (void)::dup2(cDevNull, STDERR_FILENO);
                    if (cDevNull > STDERR_FILENO)
                    {
                        (void)::close(cDevNull);
                    }
                }

                for (int fd = cFirstInheritedFd; fd <= cLastInheritedFd; ++fd)
                {
                    (void)::close(fd);
                }

                ::execvp(argv[0], argv.data());
                _exit(127);
            }
        }

        ShellOpenLauncher::ShellOpenLauncher(const std::string &openCommand)
            : mOpenCommand{SplitCommand(openCommand)}
        {
        }

        std::vector<std::string> ShellOpenLauncher::SplitCommand(const std::string &command)
        {
            std::vector<std::string> _result;
            std::istringstream _stream(command);
            std::string _token;
            while (_stream >> _token)
            {
                _result.push_back(_token);
            }

            return _result;
        }

        std::vector<std::string> ShellOpenLauncher::BuildCommandLine(
            const std::vector<std::string> &openCommand,
            const TargetReference &target)
        {
            std::vector<std::string> _result{openCommand};
            _result.push_back(target.Path);
            return _result;
        }

        core::Result<void> ShellOpenLauncher::Launch(const TargetReference &target)
        {
            const std::vector<std::string> cCommandLine{
                BuildCommandLine(mOpenCommand, target)};

            // argv is prepared before fork so the children never allocate.
            std::vector<char *> _argv;
            _argv.reserve(cCommandLine.size() + 1U);
            for (const auto &argument : cCommandLine)
            {
                _argv.push_back(const_cast<char *>(argument.c_str()));
            }
            _argv.push_back(nullptr);

            const pid_t cChildPid{::fork()};
            if (cChildPid < 0)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(
                        ExecErrc::kLaunchFailed,
                        "Cannot fork to launch " + target.Path + ": " +
                            std::strerror(errno)));
            }

            if (cChildPid == 0)
            {
                if (::setsid() < 0)
                {
                    _exit(126);
                }

                const pid_t cGrandchildPid{::fork()};
                if (cGrandchildPid < 0)
                {
                    _exit(126);
                }
                if (cGrandchildPid == 0)
                {
                    ExecDetached(_argv);
                }

                _exit(0);
            }

            int _status{0};
            pid_t _waited{-1};
            do
            {
                _waited = ::waitpid(cChildPid, &_status, 0);
            } while (_waited < 0 && errno == EINTR);

            if (_waited < 0 || !WIFEXITED(_status) || WEXITSTATUS(_status) != 0)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(
                        ExecErrc::kLaunchFailed,
                        "Cannot detach launch of " + target.Path + "."));
            }

            return core::Result<void>::FromValue();
        }
    }
}
