/// @file src/keeper/sup/autostart_entry.h
/// @brief Declarations for the desktop auto-start entry of the supervisor.

#ifndef KEEPER_SUP_AUTOSTART_ENTRY_H
#define KEEPER_SUP_AUTOSTART_ENTRY_H

#include <string>
#include "../log/logging_framework.h"

namespace keeper
{
    namespace sup
    {
        /// @brief Login auto-start entry that launches the supervisor
        class AutostartEntry
        {
        private:
            const std::string mPath;

        public:
            /// @brief Constructor
            /// @param directory Auto-start directory
            /// @param appName Supervisor application name
            AutostartEntry(const std::string &directory, const std::string &appName);

            /// @brief Entry path, "{directory}/{appName}.desktop"
            const std::string &GetPath() const noexcept;

            bool Exists() const;

            /// @brief Delete the entry if present
            /// @param loggingFramework Logging framework
            /// @param logger Logger context
            /// @returns True if the entry is absent afterwards
            /// @note A failed deletion is logged and otherwise ignored.
            bool Remove(log::LoggingFramework &loggingFramework, const log::Logger &logger) const;
        };
    }
}

#endif
