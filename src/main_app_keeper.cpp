/// @file src/main_app_keeper.cpp
/// @brief Entry point of the single-instance application keeper.

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include "./application/helper/argument_configuration.h"
#include "./keeper/exec/helper/file_system.h"
#include "./keeper/exec/process_launcher.h"
#include "./keeper/exec/process_table.h"
#include "./keeper/exec/signal_handler.h"
#include "./keeper/log/logging_framework.h"
#include "./keeper/sup/notifier.h"
#include "./keeper/sup/supervisor.h"
#include "./keeper/sup/supervisor_config.h"
#include "./keeper/sup/supervisor_error_domain.h"

namespace
{
    bool WaitForNextTick(std::chrono::milliseconds interval)
    {
        return keeper::exec::SignalHandler::WaitForTerminationFor(interval);
    }

    std::string GetExecutableDirectory()
    {
        const auto cExecutablePath{keeper::exec::helper::GetExecutablePath()};
        if (!cExecutablePath.HasValue())
        {
            return std::string();
        }

        return keeper::exec::helper::DirName(cExecutablePath.Value());
    }

    int RunKeeper(int argc, char *argv[])
    {
        application::helper::ArgumentConfiguration argumentConfiguration(argc, argv);
        const keeper::sup::SupervisorConfig cConfig{
            keeper::sup::SupervisorConfig::FromEnvironment()};
        const std::string cExecutableDirectory{GetExecutableDirectory()};

        keeper::log::LogMode _logMode{keeper::log::LogMode::kFile};
        if (cConfig.LogToConsole)
        {
            _logMode = _logMode | keeper::log::LogMode::kConsole;
        }

        std::unique_ptr<keeper::log::LoggingFramework> _loggingFramework{
            keeper::log::LoggingFramework::Create(
                cConfig.AppName,
                _logMode,
                cConfig.MinimumLogLevel,
                "Single-instance application keeper",
                keeper::sup::Supervisor::GetLogFilePath(cConfig, cExecutableDirectory))};

        std::unique_ptr<keeper::sup::Notifier> _notifier{
            keeper::sup::CreateNotifier(cConfig.Notification, cConfig.AppName)};
        keeper::exec::ProcProcessTable _processTable;
        keeper::exec::ShellOpenLauncher _processLauncher(cConfig.OpenCommand);

        keeper::sup::Supervisor _supervisor(
            cConfig,
            cExecutableDirectory,
            *_loggingFramework,
            *_notifier,
            _processTable,
            _processLauncher,
            WaitForNextTick);

        return _supervisor.Run(argumentConfiguration.GetInvocation());
    }
}

int main(int argc, char *argv[])
{
    keeper::exec::SignalHandler::Register();

    // Faults outside the supervisor run, e.g. while building the logger.
    const int cFaultExitCode{
        static_cast<int>(keeper::sup::SupervisorErrc::kUnhandledFault)};
    try
    {
        return RunKeeper(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "app_keeper: " << ex.what() << std::endl;
        return cFaultExitCode;
    }
    catch (...)
    {
        std::cerr << "app_keeper: Unknown exception." << std::endl;
        return cFaultExitCode;
    }
}
