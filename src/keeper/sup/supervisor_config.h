/// @file src/keeper/sup/supervisor_config.h
/// @brief Declarations for the supervisor startup configuration.

#ifndef KEEPER_SUP_SUPERVISOR_CONFIG_H
#define KEEPER_SUP_SUPERVISOR_CONFIG_H

#include <chrono>
#include <cstdint>
#include <string>
#include "../log/common.h"
#include "./notifier.h"
#include "./path_resolver.h"
#include "./supervisor_identity.h"

namespace keeper
{
    namespace sup
    {
        /// @brief Startup configuration of the supervisor, read once from the environment
        struct SupervisorConfig
        {
            std::string Publisher{"University of Washington"};
            std::string AppName{"AutoQCStarter"};
            TargetNaming Naming;
            std::chrono::milliseconds PollInterval{60000};
            std::string ProgramsDirectory;
            std::string AutostartDirectory;
            std::string LockDirectory{"/tmp"};
            /// @brief Command that opens the target, empty to execute the target directly
            std::string OpenCommand{"xdg-open"};
            NotifierKind Notification{NotifierKind::kDialog};
            /// @brief Delete the auto-start entry when the command line is unusable
            bool CleanupAutostart{true};
            /// @brief Log directory, empty for the executable directory
            std::string LogDirectory;
            bool LogToConsole{false};
            log::LogLevel MinimumLogLevel{log::LogLevel::kInfo};

            /// @brief Supervisor identity built from the configured names
            /// @throws std::invalid_argument Throws when a name is empty
            SupervisorIdentity GetIdentity() const;

            /// @brief Minimum accepted poll interval in milliseconds
            static const std::uint32_t cMinPollIntervalMs;
            /// @brief Maximum accepted poll interval in milliseconds
            static const std::uint32_t cMaxPollIntervalMs;

            /// @brief Read the configuration from KEEPER_* environment variables
            /// @returns Configuration with defaults for missing or malformed values
            static SupervisorConfig FromEnvironment();
        };
    }
}

#endif
