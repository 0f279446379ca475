/// @file src/keeper/sup/supervisor.h
/// @brief Declarations for the supervisor run sequence.

#ifndef KEEPER_SUP_SUPERVISOR_H
#define KEEPER_SUP_SUPERVISOR_H

#include <string>
#include "../core/result.h"
#include "../exec/process_launcher.h"
#include "../exec/process_monitor.h"
#include "../exec/process_table.h"
#include "../log/logging_framework.h"
#include "./error_reporter.h"
#include "./notifier.h"
#include "./path_resolver.h"
#include "./supervisor_config.h"

namespace keeper
{
    namespace sup
    {
        /// @brief Runs the supervisor from instance locking to the end of monitoring
        /// @details The run sequence is: log file probe, instance lock, working
        ///          directory, target resolution and finally the monitor loop.
        ///          Every terminal failure is logged and notified exactly once.
        class Supervisor
        {
        private:
            const SupervisorConfig mConfig;
            const SupervisorIdentity mIdentity;
            const std::string mExecutableDirectory;
            log::LoggingFramework &mLoggingFramework;
            Notifier &mNotifier;
            const exec::ProcessTable &mProcessTable;
            exec::ProcessLauncher &mProcessLauncher;
            exec::ProcessMonitor::WaitCallback mWaitCallback;
            const log::Logger &mLogger;
            const log::Logger &mResolverLogger;
            const log::Logger &mMonitorLogger;
            ErrorReporter mErrorReporter;

            void logInfo(const std::string &message);
            bool tryProbeLogFile();
            core::Result<std::string> setupWorkingDirectory();
            void removeAutostartEntry();
            void reportUnhandledFault(const std::string &detail);
            int execute(const core::Result<Invocation> &invocation);

        public:
            /// @brief Constructor
            /// @param config Startup configuration
            /// @param executableDirectory Directory of the supervisor executable, empty if unknown
            /// @param loggingFramework Logging framework writing the supervisor log
            /// @param notifier Operator notification channel
            /// @param processTable Process table used by the monitor
            /// @param processLauncher Target launcher used by the monitor
            /// @param waitCallback Inter-tick wait of the monitor
            /// @throws std::invalid_argument Throws when the configured identity is incomplete
            Supervisor(
                SupervisorConfig config,
                std::string executableDirectory,
                log::LoggingFramework &loggingFramework,
                Notifier &notifier,
                const exec::ProcessTable &processTable,
                exec::ProcessLauncher &processLauncher,
                exec::ProcessMonitor::WaitCallback waitCallback);

            Supervisor(const Supervisor &) = delete;
            Supervisor &operator=(const Supervisor &) = delete;

            /// @brief Log file path of the supervisor
            std::string GetLogFilePath() const;

            /// @brief Run the supervisor
            /// @param invocation Parsed command line
            /// @returns Process exit code, 0 after a requested shutdown
            int Run(const core::Result<Invocation> &invocation);

            /// @brief Log file path for a configuration
            /// @param config Startup configuration
            /// @param executableDirectory Directory used when no log directory is configured
            static std::string GetLogFilePath(
                const SupervisorConfig &config,
                const std::string &executableDirectory);
        };
    }
}

#endif
