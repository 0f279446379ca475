/// @file src/keeper/exec/process_monitor.cpp
/// @brief Implementation for the target process monitor loop.

#include <stdexcept>
#include "./process_monitor.h"
#include "./helper/file_system.h"
#include "./exec_error_domain.h"

namespace keeper
{
    namespace exec
    {
        ProcessMonitor::ProcessMonitor(
            TargetReference target,
            const ProcessTable &processTable,
            ProcessLauncher &processLauncher,
            log::LoggingFramework &loggingFramework,
            const log::Logger &logger,
            std::chrono::milliseconds pollInterval,
            WaitCallback waitCallback) : mTarget{std::move(target)},
                                         mProcessTable{processTable},
                                         mProcessLauncher{processLauncher},
                                         mLoggingFramework{loggingFramework},
                                         mLogger{logger},
                                         mPollInterval{pollInterval},
                                         mWaitCallback{std::move(waitCallback)},
                                         mTickCount{0U},
                                         mLaunchCount{0U}
        {
            if (!mWaitCallback)
            {
                throw std::invalid_argument("Monitor wait callback cannot be empty.");
            }
        }

        void ProcessMonitor::logMessage(log::LogLevel level, const std::string &message)
        {
            log::LogStream _stream{mLogger.WithLevel(level)};
            _stream << message;
            mLoggingFramework.Log(mLogger, level, _stream);
        }

        core::Result<TickOutcome> ProcessMonitor::Tick()
        {
            ++mTickCount;

            if (!helper::FileExists(mTarget.Path))
            {
                mRunState.Running = false;
                return core::Result<TickOutcome>::FromValue(TickOutcome::kTargetMissing);
            }

            auto _queryResult{mProcessTable.FindByName(mTarget.ProcessName)};
            if (!_queryResult.HasValue())
            {
                return core::Result<TickOutcome>::FromError(_queryResult.Error());
            }

            if (_queryResult.Value().empty())
            {
                mRunState.Running = false;
                mRunState.LastAnnounced = false;

                logMessage(log::LogLevel::kInfo, "Starting " + mTarget.ProcessName + ".");
                ++mLaunchCount;

                auto _launchResult{mProcessLauncher.Launch(mTarget)};
                if (!_launchResult.HasValue())
                {
                    log::LogStream _stream{mLogger.WithLevel(log::LogLevel::kWarn)};
                    _stream << _launchResult.Error();
                    mLoggingFramework.Log(mLogger, log::LogLevel::kWarn, _stream);
                }

                return core::Result<TickOutcome>::FromValue(TickOutcome::kLaunched);
            }

            mRunState.Running = true;
            if (!mRunState.LastAnnounced)
            {
                logMessage(log::LogLevel::kInfo, mTarget.ProcessName + " is running.");
                mRunState.LastAnnounced = true;
            }

            return core::Result<TickOutcome>::FromValue(TickOutcome::kRunning);
        }

        core::Result<void> ProcessMonitor::Run()
        {
            while (true)
            {
                auto _tickResult{Tick()};
                if (!_tickResult.HasValue())
                {
                    return core::Result<void>::FromError(_tickResult.Error());
                }

                if (_tickResult.Value() == TickOutcome::kTargetMissing)
                {
                    return core::Result<void>::FromError(
                        MakeErrorCode(
                            ExecErrc::kTargetMissing,
                            mTarget.Path + " no longer exists. Stopping."));
                }

                if (mWaitCallback(mPollInterval))
                {
                    logMessage(log::LogLevel::kInfo, "Termination requested. Stopping.");
                    return core::Result<void>::FromValue();
                }
            }
        }

        const RunState &ProcessMonitor::GetRunState() const noexcept
        {
            return mRunState;
        }

        std::uint64_t ProcessMonitor::GetTickCount() const noexcept
        {
            return mTickCount;
        }

        std::uint64_t ProcessMonitor::GetLaunchCount() const noexcept
        {
            return mLaunchCount;
        }

        const TargetReference &ProcessMonitor::GetTarget() const noexcept
        {
            return mTarget;
        }
    }
}
