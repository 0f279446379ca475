/// @file src/keeper/sup/supervisor.cpp
/// @brief Implementation for the supervisor run sequence.

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include "./supervisor.h"
#include "./autostart_entry.h"
#include "./supervisor_error_domain.h"
#include "../exec/helper/file_system.h"
#include "../exec/instance_guard.h"

namespace keeper
{
    namespace sup
    {
        Supervisor::Supervisor(
            SupervisorConfig config,
            std::string executableDirectory,
            log::LoggingFramework &loggingFramework,
            Notifier &notifier,
            const exec::ProcessTable &processTable,
            exec::ProcessLauncher &processLauncher,
            exec::ProcessMonitor::WaitCallback waitCallback)
            : mConfig{std::move(config)},
              mIdentity{mConfig.GetIdentity()},
              mExecutableDirectory{std::move(executableDirectory)},
              mLoggingFramework{loggingFramework},
              mNotifier{notifier},
              mProcessTable{processTable},
              mProcessLauncher{processLauncher},
              mWaitCallback{std::move(waitCallback)},
              mLogger{loggingFramework.CreateLogger("SUP", "Supervisor", mConfig.MinimumLogLevel)},
              mResolverLogger{loggingFramework.CreateLogger("RSLV", "Path resolver", mConfig.MinimumLogLevel)},
              mMonitorLogger{loggingFramework.CreateLogger("MON", "Process monitor", mConfig.MinimumLogLevel)},
              mErrorReporter{loggingFramework, mLogger, notifier}
        {
        }

        std::string Supervisor::GetLogFilePath(
            const SupervisorConfig &config,
            const std::string &executableDirectory)
        {
            const std::string &cDirectory{
                config.LogDirectory.empty() ? executableDirectory : config.LogDirectory};

            return exec::helper::JoinPath(cDirectory, config.GetIdentity().LogFileName());
        }

        std::string Supervisor::GetLogFilePath() const
        {
            return GetLogFilePath(mConfig, mExecutableDirectory);
        }

        void Supervisor::logInfo(const std::string &message)
        {
            mLoggingFramework.Log(mLogger, log::LogLevel::kInfo, message);
        }

        bool Supervisor::tryProbeLogFile()
        {
            const std::string cLogFilePath{GetLogFilePath()};
            std::ofstream _stream(cLogFilePath, std::ios::out | std::ios::app);
            if (_stream.is_open())
            {
                return true;
            }

            // The log is unusable, so the operator is the only audience.
            const std::string cReason{std::strerror(errno)};
            mNotifier.Notify(
                "Cannot create or write to log file: " + cLogFilePath + ".\n" + cReason);
            return false;
        }

        core::Result<std::string> Supervisor::setupWorkingDirectory()
        {
            if (mExecutableDirectory.empty())
            {
                return core::Result<std::string>::FromError(
                    MakeErrorCode(
                        SupervisorErrc::kSetupFailed,
                        "Executable location is unknown."));
            }

            logInfo("Executable location: " + mExecutableDirectory);

            auto _currentDirectory{exec::helper::GetWorkingDirectory()};
            if (!_currentDirectory.HasValue())
            {
                return _currentDirectory;
            }

            logInfo("Current working directory is: " + _currentDirectory.Value());
            if (_currentDirectory.Value() != mExecutableDirectory)
            {
                logInfo("Setting working directory to: " + mExecutableDirectory);
                const auto cChangeResult{
                    exec::helper::SetWorkingDirectory(mExecutableDirectory)};
                if (!cChangeResult.HasValue())
                {
                    return core::Result<std::string>::FromError(cChangeResult.Error());
                }
            }

            return _currentDirectory;
        }

        void Supervisor::removeAutostartEntry()
        {
            if (!mConfig.CleanupAutostart)
            {
                return;
            }

            const AutostartEntry cEntry{mConfig.AutostartDirectory, mIdentity.GetAppName()};
            (void)cEntry.Remove(mLoggingFramework, mLogger);
        }

        void Supervisor::reportUnhandledFault(const std::string &detail)
        {
            const std::string cDirectory{exec::helper::DirName(GetLogFilePath())};
            mErrorReporter.Report(
                mIdentity.GetAppName() +
                    " encountered an unexpected error. Error details may be found in the " +
                    mIdentity.LogFileName() + " file in this directory: " + cDirectory,
                detail);
        }

        int Supervisor::execute(const core::Result<Invocation> &invocation)
        {
            if (!tryProbeLogFile())
            {
                return static_cast<int>(SupervisorErrc::kSetupFailed);
            }

            auto _acquireResult{
                exec::InstanceGuard::TryAcquire(mIdentity.LockName(), mConfig.LockDirectory)};
            if (!_acquireResult.HasValue())
            {
                if (exec::IsError(_acquireResult.Error(), exec::ExecErrc::kAlreadyRunning))
                {
                    mErrorReporter.Report(
                        mIdentity.GetAppName() + " is already running.",
                        _acquireResult.Error().Message());
                }
                else
                {
                    mErrorReporter.Report(_acquireResult.Error());
                }

                return ToExitCode(_acquireResult.Error());
            }
            exec::InstanceGuard _instanceGuard{std::move(_acquireResult.Value())};

            logInfo("Starting " + mIdentity.GetAppName() + "...");

            if (!invocation.HasValue())
            {
                mErrorReporter.Report(invocation.Error());
                removeAutostartEntry();
                return ToExitCode(invocation.Error());
            }

            const auto cStartDirectoryResult{setupWorkingDirectory()};
            if (!cStartDirectoryResult.HasValue())
            {
                _instanceGuard.Release();
                mErrorReporter.Report(
                    "Could not set working directory. Stopping.",
                    cStartDirectoryResult.Error().Message());
                return ToExitCode(cStartDirectoryResult.Error());
            }

            // A relative argument names a file seen from the caller's directory.
            Invocation _invocation{invocation.Value()};
            if (_invocation.InvocationKind == Invocation::Kind::kExplicitPath)
            {
                _invocation.ExplicitPath = exec::helper::MakeAbsolutePath(
                    _invocation.ExplicitPath, cStartDirectoryResult.Value());
            }

            ResolverEnvironment _environment;
            _environment.ProgramsDirectory = mConfig.ProgramsDirectory;
            _environment.ExecutableDirectory = mExecutableDirectory;
            PathResolver _resolver(
                mIdentity,
                mConfig.Naming,
                _environment,
                mLoggingFramework,
                mResolverLogger);

            auto _resolveResult{_resolver.Resolve(_invocation)};
            if (!_resolveResult.HasValue())
            {
                mErrorReporter.Report(_resolveResult.Error());
                if (_invocation.HasArgument())
                {
                    removeAutostartEntry();
                }
                return ToExitCode(_resolveResult.Error());
            }

            logInfo("Target path: " + _resolveResult.Value().Path);

            exec::ProcessMonitor _monitor(
                _resolveResult.Value(),
                mProcessTable,
                mProcessLauncher,
                mLoggingFramework,
                mMonitorLogger,
                mConfig.PollInterval,
                mWaitCallback);

            const auto cRunResult{_monitor.Run()};
            if (cRunResult.HasValue())
            {
                logInfo("Stopping " + mIdentity.GetAppName() + ".");
                return 0;
            }

            if (exec::IsError(cRunResult.Error(), exec::ExecErrc::kTargetMissing))
            {
                mErrorReporter.Report(cRunResult.Error());
                return ToExitCode(cRunResult.Error());
            }

            reportUnhandledFault(cRunResult.Error().Message());
            return static_cast<int>(SupervisorErrc::kUnhandledFault);
        }

        int Supervisor::Run(const core::Result<Invocation> &invocation)
        {
            try
            {
                return execute(invocation);
            }
            catch (const std::exception &ex)
            {
                // The instance guard is already released by unwinding.
                reportUnhandledFault(ex.what());
                return static_cast<int>(SupervisorErrc::kUnhandledFault);
            }
            catch (...)
            {
                reportUnhandledFault("Unknown exception.");
                return static_cast<int>(SupervisorErrc::kUnhandledFault);
            }
        }
    }
}
