/// @file src/keeper/exec/process_monitor.h
/// @brief Declarations for the target process monitor loop.

#ifndef KEEPER_EXEC_PROCESS_MONITOR_H
#define KEEPER_EXEC_PROCESS_MONITOR_H

#include <chrono>
#include <cstdint>
#include <functional>
#include "../core/result.h"
#include "../log/logging_framework.h"
#include "./target_reference.h"
#include "./process_launcher.h"
#include "./process_table.h"

namespace keeper
{
    namespace exec
    {
        /// @brief Monitor-owned state carried from one tick to the next
        struct RunState
        {
            /// @brief Target was found running at the last tick
            bool Running{false};
            /// @brief "is running" was already logged for the current running interval
            bool LastAnnounced{false};
        };

        /// @brief What a single tick observed and did
        enum class TickOutcome
        {
            kLaunched,     ///< Target was absent and a launch was issued
            kRunning,      ///< Target was already running
            kTargetMissing ///< Target path no longer exists
        };

        /// @brief Keeps a resolved target running by polling the process table
        /// @details Each tick first checks that the target path still exists; a
        ///          vanished path ends monitoring for good. Otherwise the process
        ///          table is queried by name and the target is launched when no
        ///          instance is found. A launch that fails to start the target is
        ///          not detected here; the next tick simply launches again.
        class ProcessMonitor
        {
        public:
            /// @brief Inter-tick wait; returns true when shutdown was requested
            using WaitCallback = std::function<bool(std::chrono::milliseconds)>;

        private:
            const TargetReference mTarget;
            const ProcessTable &mProcessTable;
            ProcessLauncher &mProcessLauncher;
            log::LoggingFramework &mLoggingFramework;
            const log::Logger &mLogger;
            const std::chrono::milliseconds mPollInterval;
            WaitCallback mWaitCallback;

            RunState mRunState;
            std::uint64_t mTickCount;
            std::uint64_t mLaunchCount;

            void logMessage(log::LogLevel level, const std::string &message);

        public:
            /// @brief Constructor
            /// @param target Resolved target to keep running
            /// @param processTable Process table used for the running check
            /// @param processLauncher Launcher used when the target is absent
            /// @param loggingFramework Logging framework
            /// @param logger Logger context for monitor records
            /// @param pollInterval Wait between two ticks
            /// @param waitCallback Inter-tick wait
            /// @throws std::invalid_argument Throws when the wait callback is empty
            ProcessMonitor(
                TargetReference target,
                const ProcessTable &processTable,
                ProcessLauncher &processLauncher,
                log::LoggingFramework &loggingFramework,
                const log::Logger &logger,
                std::chrono::milliseconds pollInterval,
                WaitCallback waitCallback);

            ProcessMonitor(const ProcessMonitor &) = delete;
            ProcessMonitor &operator=(const ProcessMonitor &) = delete;

            /// @brief Run one check-and-launch tick without waiting
            /// @returns Tick outcome, or kProcessQueryFailed
            core::Result<TickOutcome> Tick();

            /// @brief Tick until a terminal condition
            /// @returns Void result when shutdown was requested through the wait
            ///          callback; kTargetMissing when the target path vanished;
            ///          kProcessQueryFailed when the process table failed
            core::Result<void> Run();

            const RunState &GetRunState() const noexcept;

            std::uint64_t GetTickCount() const noexcept;

            /// @brief Number of launches issued, including failed ones
            std::uint64_t GetLaunchCount() const noexcept;

            const TargetReference &GetTarget() const noexcept;
        };
    }
}

#endif
