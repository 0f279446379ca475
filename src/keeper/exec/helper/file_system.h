/// @file src/keeper/exec/helper/file_system.h
/// @brief POSIX path and file helpers shared by the supervisor components.

#ifndef KEEPER_EXEC_HELPER_FILE_SYSTEM_H
#define KEEPER_EXEC_HELPER_FILE_SYSTEM_H

#include <string>
#include "../../core/result.h"

namespace keeper
{
    namespace exec
    {
        namespace helper
        {
            /// @brief Determine whether a path names an existing non-directory file
            bool FileExists(const std::string &path) noexcept;

            /// @brief Determine whether a path names an existing directory
            bool DirectoryExists(const std::string &path) noexcept;

            /// @brief Join two path segments with exactly one separator
            std::string JoinPath(const std::string &lhs, const std::string &rhs);

            /// @brief Anchor a relative path at a base directory
            /// @returns The path itself when it is absolute or empty
            std::string MakeAbsolutePath(
                const std::string &path,
                const std::string &baseDirectory);

            /// @brief Last path segment, e.g. "AutoQC.exe" for "/opt/qc/AutoQC.exe"
            std::string BaseName(const std::string &path);

            /// @brief Path without its last segment; empty when there is none
            std::string DirName(const std::string &path);

            /// @brief File name without its last extension, e.g. "AutoQC" for "AutoQC.exe"
            std::string FileStem(const std::string &path);

            /// @brief Lower-case ASCII copy of a string
            std::string ToLower(const std::string &text);

            /// @brief Absolute path of the running executable
            /// @returns Path read from /proc/self/exe, or kSetupFailed
            core::Result<std::string> GetExecutablePath();

            /// @brief Current working directory of the process
            /// @returns Working directory, or kSetupFailed
            core::Result<std::string> GetWorkingDirectory();

            /// @brief Change the working directory of the process
            /// @param path New working directory
            /// @returns Void result, or kSetupFailed with the system error
            core::Result<void> SetWorkingDirectory(const std::string &path);
        }
    }
}

#endif
