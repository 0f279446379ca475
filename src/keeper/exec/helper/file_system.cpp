/// @file src/keeper/exec/helper/file_system.cpp
/// @brief Implementation for POSIX path and file helpers.

#include <cctype>
#include <cerrno>
#include <cstring>
#include <vector>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>
#include "./file_system.h"
#include "../exec_error_domain.h"

namespace keeper
{
    namespace exec
    {
        namespace helper
        {
            bool FileExists(const std::string &path) noexcept
            {
                struct stat _status;
                if (path.empty() || ::stat(path.c_str(), &_status) != 0)
                {
                    return false;
                }

                return !S_ISDIR(_status.st_mode);
            }

            bool DirectoryExists(const std::string &path) noexcept
            {
                struct stat _status;
                if (path.empty() || ::stat(path.c_str(), &_status) != 0)
                {
                    return false;
                }

                return S_ISDIR(_status.st_mode);
            }

            std::string JoinPath(const std::string &lhs, const std::string &rhs)
            {
                if (lhs.empty())
                {
                    return rhs;
                }
                if (rhs.empty())
                {
                    return lhs;
                }

                const bool cLhsSeparator{lhs.back() == '/'};
                const bool cRhsSeparator{rhs.front() == '/'};
                if (cLhsSeparator && cRhsSeparator)
                {
                    return lhs + rhs.substr(1);
                }
                if (cLhsSeparator || cRhsSeparator)
                {
                    return lhs + rhs;
                }

                return lhs + "/" + rhs;
            }

            std::string MakeAbsolutePath(
                const std::string &path,
                const std::string &baseDirectory)
            {
                if (path.empty() || path.front() == '/')
                {
                    return path;
                }

                return JoinPath(baseDirectory, path);
            }

            std::string BaseName(const std::string &path)
            {
                std::string _trimmed{path};
                while (_trimmed.size() > 1U && _trimmed.back() == '/')
                {
                    _trimmed.pop_back();
                }

                const std::size_t cSeparatorPos{_trimmed.rfind('/')};
                if (cSeparatorPos == std::string::npos)
                {
                    return _trimmed;
                }

                return _trimmed.substr(cSeparatorPos + 1U);
            }

            std::string DirName(const std::string &path)
            {
                const std::size_t cSeparatorPos{path.rfind('/')};
                if (cSeparatorPos == std::string::npos)
                {
                    return std::string();
                }
                if (cSeparatorPos == 0U)
                {
                    return "/";
                }

                return path.substr(0U, cSeparatorPos);
            }

            std::string FileStem(const std::string &path)
            {
                const std::string cBaseName{BaseName(path)};
                const std::size_t cDotPos{cBaseName.rfind('.')};
                if (cDotPos == std::string::npos || cDotPos == 0U)
                {
                    return cBaseName;
                }

                return cBaseName.substr(0U, cDotPos);
            }

            std::string ToLower(const std::string &text)
            {
                std::string _lowered;
                _lowered.reserve(text.size());
                for (char c : text)
                {
                    _lowered.push_back(
                        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
                }

                return _lowered;
            }

            core::Result<std::string> GetExecutablePath()
            {
                std::vector<char> _buffer(PATH_MAX + 1, '\0');
                const ssize_t cLength{
                    ::readlink("/proc/self/exe", _buffer.data(), _buffer.size() - 1U)};
                if (cLength <= 0)
                {
                    return core::Result<std::string>::FromError(
                        exec::MakeErrorCode(
                            exec::ExecErrc::kSetupFailed,
                            std::string("Cannot read executable location: ") +
                                std::strerror(errno)));
                }

                return core::Result<std::string>::FromValue(
                    std::string(_buffer.data(), static_cast<std::size_t>(cLength)));
            }

            core::Result<std::string> GetWorkingDirectory()
            {
                std::vector<char> _buffer(PATH_MAX + 1, '\0');
                if (::getcwd(_buffer.data(), _buffer.size()) == nullptr)
                {
                    return core::Result<std::string>::FromError(
                        exec::MakeErrorCode(
                            exec::ExecErrc::kSetupFailed,
                            std::string("Cannot read working directory: ") +
                                std::strerror(errno)));
                }

                return core::Result<std::string>::FromValue(
                    std::string(_buffer.data()));
            }

            core::Result<void> SetWorkingDirectory(const std::string &path)
            {
                if (::chdir(path.c_str()) != 0)
                {
                    return core::Result<void>::FromError(
                        exec::MakeErrorCode(
                            exec::ExecErrc::kSetupFailed,
                            "Cannot change working directory to " + path + ": " +
                                std::strerror(errno)));
                }

                return core::Result<void>::FromValue();
            }
        }
    }
}
