/// @file src/keeper/sup/notifier.cpp
/// @brief Implementation for operator notification.

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include "./notifier.h"
#include "../exec/helper/file_system.h"

namespace keeper
{
    namespace sup
    {
        namespace
        {
            bool IsNonEmptyEnv(const char *key)
            {
                const char *value{std::getenv(key)};
                return value != nullptr && value[0] != '\0';
            }

            // Blocks until the dialog is closed.
            bool RunAndWait(const std::vector<std::string> &command)
            {
                std::vector<char *> _argv;
                _argv.reserve(command.size() + 1U);
                for (const auto &argument : command)
                {
                    _argv.push_back(const_cast<char *>(argument.c_str()));
                }
                _argv.push_back(nullptr);

                const pid_t cPid{::fork()};
                if (cPid < 0)
                {
                    return false;
                }

                if (cPid == 0)
                {
                    const int cDevNull{::open("/dev/null", O_RDWR)};
                    if (cDevNull >= 0)
                    {
                        (void)::dup2(cDevNull, STDIN_FILENO);
                        (void)::dup2(cDevNull, STDOUT_FILENO);
                        (void)::dup2(cDevNull, STDERR_FILENO);
                    }
                    ::execv(_argv[0], _argv.data());
                    _exit(127);
                }

                int _status{0};
                pid_t _waited{-1};
                do
                {
                    _waited = ::waitpid(cPid, &_status, 0);
                } while (_waited < 0 && errno == EINTR);

                // Dialog tools exit non-zero when the dialog is dismissed.
                return _waited == cPid &&
                       WIFEXITED(_status) &&
                       WEXITSTATUS(_status) != 127;
            }
        }

        ConsoleNotifier::ConsoleNotifier(
            std::string title,
            std::ostream &stream) : mTitle{std::move(title)},
                                    mStream{stream}
        {
        }

        void ConsoleNotifier::Notify(const std::string &message)
        {
            if (mTitle.empty())
            {
                mStream << message << std::endl;
            }
            else
            {
                mStream << mTitle << ": " << message << std::endl;
            }
        }

        DialogNotifier::DialogNotifier(
            std::string title,
            std::unique_ptr<Notifier> fallback) : mTitle{std::move(title)},
                                                  mFallback{std::move(fallback)}
        {
            if (!mFallback)
            {
                throw std::invalid_argument("Dialog notifier requires a fallback notifier.");
            }
        }

        bool DialogNotifier::HasGraphicalSession()
        {
            return IsNonEmptyEnv("DISPLAY") || IsNonEmptyEnv("WAYLAND_DISPLAY");
        }

        bool DialogNotifier::TryFindProgram(const std::string &program, std::string &path)
        {
            const char *cSearchPath{std::getenv("PATH")};
            if (cSearchPath == nullptr || program.empty())
            {
                return false;
            }

            std::istringstream _stream(cSearchPath);
            std::string _directory;
            while (std::getline(_stream, _directory, ':'))
            {
                if (_directory.empty())
                {
                    continue;
                }

                const std::string cCandidate{exec::helper::JoinPath(_directory, program)};
                if (exec::helper::FileExists(cCandidate) &&
                    ::access(cCandidate.c_str(), X_OK) == 0)
                {
                    path = cCandidate;
                    return true;
                }
            }

            return false;
        }

        std::vector<std::string> DialogNotifier::BuildDialogCommand(
            const std::string &tool,
            const std::string &title,
            const std::string &message)
        {
            std::vector<std::string> _result;
            if (tool == "zenity")
            {
                _result = {
                    tool,
                    "--error",
                    "--no-markup",
                    "--title=" + title,
                    "--text=" + message};
            }
            else if (tool == "kdialog")
            {
                _result = {tool, "--title", title, "--error", message};
            }

            return _result;
        }

        bool DialogNotifier::tryShowDialog(const std::string &message) const
        {
            if (!HasGraphicalSession())
            {
                return false;
            }

            const std::vector<std::string> cTools{"zenity", "kdialog"};
            for (const auto &tool : cTools)
            {
                std::string _programPath;
                if (!TryFindProgram(tool, _programPath))
                {
                    continue;
                }

                std::vector<std::string> _command{
                    BuildDialogCommand(tool, mTitle, message)};
                _command.front() = _programPath;
                if (RunAndWait(_command))
                {
                    return true;
                }
            }

            return false;
        }

        void DialogNotifier::Notify(const std::string &message)
        {
            if (!tryShowDialog(message))
            {
                mFallback->Notify(message);
            }
        }

        NotifierKind ParseNotifierKind(const std::string &text, NotifierKind fallback)
        {
            const std::string cLowered{exec::helper::ToLower(text)};
            if (cLowered == "console")
            {
                return NotifierKind::kConsole;
            }
            if (cLowered == "dialog")
            {
                return NotifierKind::kDialog;
            }

            return fallback;
        }

        std::unique_ptr<Notifier> CreateNotifier(NotifierKind kind, const std::string &title)
        {
            std::unique_ptr<Notifier> _console{new ConsoleNotifier(title)};
            if (kind == NotifierKind::kConsole)
            {
                return _console;
            }

            return std::unique_ptr<Notifier>{
                new DialogNotifier(title, std::move(_console))};
        }
    }
}
