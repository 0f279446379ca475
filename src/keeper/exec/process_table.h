/// @file src/keeper/exec/process_table.h
/// @brief Declarations for process table queries.

#ifndef KEEPER_EXEC_PROCESS_TABLE_H
#define KEEPER_EXEC_PROCESS_TABLE_H

#include <string>
#include <vector>
#include <sys/types.h>
#include "../core/result.h"

namespace keeper
{
    namespace exec
    {
        /// @brief Operating system process table, queried by logical process name
        class ProcessTable
        {
        public:
            virtual ~ProcessTable() noexcept = default;

            /// @brief Find live processes by name
            /// @param processName Logical process name, e.g. "AutoQC"
            /// @returns Sorted pids of matching processes (possibly empty),
            ///          or kProcessQueryFailed if the table cannot be read
            virtual core::Result<std::vector<pid_t>> FindByName(
                const std::string &processName) const = 0;
        };

        /// @brief Process table backed by the Linux procfs
        /// @details A process matches when its comm, or the base name of its argv[0],
        ///          equals the logical name, either verbatim or without its file
        ///          extension. Matching is case-insensitive. Zombies and the calling
        ///          process itself never match.
        class ProcProcessTable final : public ProcessTable
        {
        private:
            std::string mProcRoot;
            pid_t mSelfPid;

        public:
            /// @brief Constructor
            /// @param procRoot procfs mount point
            explicit ProcProcessTable(std::string procRoot = "/proc");

            core::Result<std::vector<pid_t>> FindByName(
                const std::string &processName) const override;

            /// @brief Name matching rule applied to a single process
            /// @param processName Logical process name
            /// @param comm Content of /proc/<pid>/comm without the trailing newline
            /// @param argv0 First entry of /proc/<pid>/cmdline
            /// @returns True if the process is an instance of processName
            static bool MatchesName(
                const std::string &processName,
                const std::string &comm,
                const std::string &argv0);
        };
    }
}

#endif
