/// @file src/keeper/sup/error_reporter.h
/// @brief Declarations for terminal failure reporting.

#ifndef KEEPER_SUP_ERROR_REPORTER_H
#define KEEPER_SUP_ERROR_REPORTER_H

#include <string>
#include "../core/error_code.h"
#include "../log/logging_framework.h"
#include "./notifier.h"

namespace keeper
{
    namespace sup
    {
        /// @brief Logs a terminal failure and notifies the operator once
        class ErrorReporter
        {
        private:
            log::LoggingFramework &mLoggingFramework;
            const log::Logger &mLogger;
            Notifier &mNotifier;

        public:
            /// @brief Constructor
            /// @param loggingFramework Logging framework
            /// @param logger Logger context for error records
            /// @param notifier Operator notification channel
            ErrorReporter(
                log::LoggingFramework &loggingFramework,
                const log::Logger &logger,
                Notifier &notifier) noexcept;

            /// @brief Log a message at error level, then notify it
            void Report(const std::string &message);

            /// @brief Log a message together with its detail, then notify the message only
            /// @param message Operator-facing message
            /// @param detail Technical detail written to the log
            void Report(const std::string &message, const std::string &detail);

            /// @brief Report the message carried by an error code
            void Report(const core::ErrorCode &errorCode);
        };
    }
}

#endif
