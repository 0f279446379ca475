/// @file src/keeper/log/logging_framework.h
/// @brief Declarations for logging framework.

#ifndef KEEPER_LOG_LOGGING_FRAMEWORK_H
#define KEEPER_LOG_LOGGING_FRAMEWORK_H

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "./logger.h"
#include "./sink/log_sink.h"

namespace keeper
{
    namespace log
    {
        /// @brief Process-wide logging framework that owns the context loggers and the sinks
        class LoggingFramework
        {
        private:
            const std::string mAppId;
            const LogLevel mDefaultLogLevel;
            std::vector<std::unique_ptr<sink::LogSink>> mSinks;
            std::deque<Logger> mLoggers;
            mutable std::mutex mMutex;

            LoggingFramework(std::string appId, LogLevel defaultLogLevel);

        public:
            LoggingFramework() = delete;
            LoggingFramework(const LoggingFramework &) = delete;
            LoggingFramework &operator=(const LoggingFramework &) = delete;
            ~LoggingFramework() noexcept = default;

            /// @brief Create a logger context owned by the framework
            /// @param ctxId Context ID
            /// @param ctxDescription Context description
            /// @param ctxDefLogLevel Context log level
            /// @returns Reference to the created logger, valid as long as the framework
            const Logger &CreateLogger(
                std::string ctxId,
                std::string ctxDescription,
                LogLevel ctxDefLogLevel);

            /// @brief Create a logger context with the framework default log level
            const Logger &CreateLogger(
                std::string ctxId,
                std::string ctxDescription);

            /// @brief Attach an additional sink
            /// @param logSink Sink to be owned by the framework
            /// @throws std::invalid_argument Throws when the sink is null
            void AddSink(std::unique_ptr<sink::LogSink> logSink);

            /// @brief Number of attached sinks
            std::size_t GetSinkCount() const noexcept;

            /// @brief Application ID of the framework
            const std::string &GetAppId() const noexcept;

            /// @brief Log a record in a logger context
            /// @param logger Logger context
            /// @param logLevel Record severity
            /// @param logStream Record content
            /// @note Records below the context log level are dropped. Sink
            ///       failures are contained by the sinks themselves.
            void Log(
                const Logger &logger,
                LogLevel logLevel,
                const LogStream &logStream);

            /// @brief Convenience overload for a plain text record
            void Log(
                const Logger &logger,
                LogLevel logLevel,
                const std::string &message);

            /// @brief Logging framework factory
            /// @param appId Application ID
            /// @param logMode Sink selection mask
            /// @param logLevel Default log level of created contexts
            /// @param appDescription Application description
            /// @param logFilePath Log file path, required by LogMode::kFile
            /// @returns Heap-allocated framework owned by the caller
            /// @throws std::invalid_argument Throws when kFile is requested without a path
            static LoggingFramework *Create(
                std::string appId,
                LogMode logMode,
                LogLevel logLevel = LogLevel::kInfo,
                std::string appDescription = "",
                std::string logFilePath = "");
        };
    }
}

#endif
