/// @file src/keeper/exec/process_table.cpp
/// @brief Implementation for process table queries.

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <dirent.h>
#include <unistd.h>
#include "./process_table.h"
#include "./helper/file_system.h"
#include "./exec_error_domain.h"

namespace keeper
{
    namespace exec
    {
        namespace
        {
            // Kernel task names are truncated to TASK_COMM_LEN - 1 characters.
            const std::size_t cCommLength{15U};

            bool IsDigits(const char *text) noexcept
            {
                if (text == nullptr || *text == '\0')
                {
                    return false;
                }

                for (const char *c = text; *c != '\0'; ++c)
                {
                    if (*c < '0' || *c > '9')
                    {
                        return false;
                    }
                }

                return true;
            }

            std::string ReadFirstLine(const std::string &path)
            {
                std::ifstream _stream(path);
                std::string _line;
                if (_stream.is_open())
                {
                    std::getline(_stream, _line);
                }

                return _line;
            }

            std::string ReadArgv0(const std::string &path)
            {
                std::ifstream _stream(path, std::ios::binary);
                std::string _argv0;
                if (_stream.is_open())
                {
                    std::getline(_stream, _argv0, '\0');
                }

                return _argv0;
            }

            char ReadProcessState(const std::string &statPath)
            {
                const std::string cLine{ReadFirstLine(statPath)};
                const std::size_t cCloseParenPos{cLine.rfind(')')};
                if (cCloseParenPos == std::string::npos ||
                    (cCloseParenPos + 2U) >= cLine.size())
                {
                    return '\0';
                }

                return cLine.at(cCloseParenPos + 2U);
            }

            bool EqualsEither(const std::string &candidate, const std::string &name)
            {
                if (candidate.empty())
                {
                    return false;
                }

                const std::string cLowered{helper::ToLower(candidate)};
                return cLowered == name ||
                       helper::ToLower(helper::FileStem(candidate)) == name;
            }
        }

        ProcProcessTable::ProcProcessTable(std::string procRoot)
            : mProcRoot{std::move(procRoot)},
              mSelfPid{::getpid()}
        {
        }

        bool ProcProcessTable::MatchesName(
            const std::string &processName,
            const std::string &comm,
            const std::string &argv0)
        {
            if (processName.empty())
            {
                return false;
            }

            const std::string cName{helper::ToLower(processName)};
            if (EqualsEither(helper::BaseName(argv0), cName))
            {
                return true;
            }

            if (comm.empty())
            {
                return false;
            }

            const std::string cComm{helper::ToLower(comm)};
            if (EqualsEither(cComm, cName))
            {
                return true;
            }

            // A truncated comm is only trusted when argv0 is unavailable.
            return argv0.empty() &&
                   cComm.size() == cCommLength &&
                   cName.size() > cCommLength &&
                   cName.compare(0U, cCommLength, cComm) == 0;
        }

        core::Result<std::vector<pid_t>> ProcProcessTable::FindByName(
            const std::string &processName) const
        {
            DIR *_directory{::opendir(mProcRoot.c_str())};
            if (_directory == nullptr)
            {
                return core::Result<std::vector<pid_t>>::FromError(
                    MakeErrorCode(
                        ExecErrc::kProcessQueryFailed,
                        "Cannot read process table " + mProcRoot + ": " +
                            std::strerror(errno)));
            }

            std::vector<pid_t> _pids;
            struct dirent *_entry{nullptr};
            while ((_entry = ::readdir(_directory)) != nullptr)
            {
                if (!IsDigits(_entry->d_name))
                {
                    continue;
                }

                const pid_t cPid{static_cast<pid_t>(std::atoi(_entry->d_name))};
                if (cPid <= 0 || cPid == mSelfPid)
                {
                    continue;
                }

                const std::string cProcessDir{helper::JoinPath(mProcRoot, _entry->d_name)};
                const std::string cComm{ReadFirstLine(cProcessDir + "/comm")};
                const std::string cArgv0{ReadArgv0(cProcessDir + "/cmdline")};
                if (!MatchesName(processName, cComm, cArgv0))
                {
                    continue;
                }

                if (ReadProcessState(cProcessDir + "/stat") == 'Z')
                {
                    continue;
                }

                _pids.push_back(cPid);
            }

            (void)::closedir(_directory);

            std::sort(_pids.begin(), _pids.end());
            return core::Result<std::vector<pid_t>>::FromValue(std::move(_pids));
        }
    }
}
