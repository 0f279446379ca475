/// @file src/keeper/log/logger.h
/// @brief Declarations for logger contexts.

#ifndef KEEPER_LOG_LOGGER_H
#define KEEPER_LOG_LOGGER_H

#include <string>
#include "./log_stream.h"

namespace keeper
{
    namespace log
    {
        /// @brief Context of a group of log records, e.g. the monitor loop
        /// @note Contexts are created and owned by LoggingFramework.
        class Logger
        {
        private:
            std::string mContextId;
            std::string mContextDescription;
            LogLevel mThreshold;

            Logger(std::string ctxId,
                   std::string ctxDescription,
                   LogLevel threshold);

        public:
            Logger() = delete;
            ~Logger() noexcept = default;

            /// @brief Determine whether records of a level pass the context threshold
            /// @param logLevel Record severity
            /// @returns False for kOff records and for a kOff context
            bool IsEnabled(LogLevel logLevel) const noexcept;

            LogLevel GetLogLevel() const noexcept;

            const std::string &GetContextId() const noexcept;

            const std::string &GetContextDescription() const noexcept;

            /// @brief Start a record
            /// @param logLevel Record severity
            /// @returns Empty stream to be filled and passed to the framework
            LogStream WithLevel(LogLevel logLevel) const;

            /// @brief Logger factory
            /// @param ctxId Context ID
            /// @param ctxDescription Context description
            /// @param threshold Least severe level that is still written
            static Logger CreateLogger(
                std::string ctxId,
                std::string ctxDescription,
                LogLevel threshold);
        };
    }
}

#endif
