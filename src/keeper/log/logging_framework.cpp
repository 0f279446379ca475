/// @file src/keeper/log/logging_framework.cpp
/// @brief Implementation for logging framework.

#include <stdexcept>
#include "./logging_framework.h"
#include "./sink/console_log_sink.h"
#include "./sink/file_log_sink.h"

namespace keeper
{
    namespace log
    {
        LoggingFramework::LoggingFramework(
            std::string appId,
            LogLevel defaultLogLevel) : mAppId{std::move(appId)},
                                        mDefaultLogLevel{defaultLogLevel}
        {
        }

        const Logger &LoggingFramework::CreateLogger(
            std::string ctxId,
            std::string ctxDescription,
            LogLevel ctxDefLogLevel)
        {
            std::lock_guard<std::mutex> _lock(mMutex);
            mLoggers.push_back(
                Logger::CreateLogger(
                    std::move(ctxId), std::move(ctxDescription), ctxDefLogLevel));

            return mLoggers.back();
        }

        const Logger &LoggingFramework::CreateLogger(
            std::string ctxId,
            std::string ctxDescription)
        {
            return CreateLogger(
                std::move(ctxId), std::move(ctxDescription), mDefaultLogLevel);
        }

        void LoggingFramework::AddSink(std::unique_ptr<sink::LogSink> logSink)
        {
            if (!logSink)
            {
                throw std::invalid_argument("Log sink cannot be null.");
            }

            std::lock_guard<std::mutex> _lock(mMutex);
            mSinks.push_back(std::move(logSink));
        }

        std::size_t LoggingFramework::GetSinkCount() const noexcept
        {
            std::lock_guard<std::mutex> _lock(mMutex);
            return mSinks.size();
        }

        const std::string &LoggingFramework::GetAppId() const noexcept
        {
            return mAppId;
        }

        void LoggingFramework::Log(
            const Logger &logger,
            LogLevel logLevel,
            const LogStream &logStream)
        {
            if (!logger.IsEnabled(logLevel))
            {
                return;
            }

            std::lock_guard<std::mutex> _lock(mMutex);
            for (const auto &logSink : mSinks)
            {
                logSink->Log(logStream);
            }
        }

        void LoggingFramework::Log(
            const Logger &logger,
            LogLevel logLevel,
            const std::string &message)
        {
            LogStream _stream{logger.WithLevel(logLevel)};
            _stream << message;
            Log(logger, logLevel, _stream);
        }

        LoggingFramework *LoggingFramework::Create(
            std::string appId,
            LogMode logMode,
            LogLevel logLevel,
            std::string appDescription,
            std::string logFilePath)
        {
            if (HasMode(logMode, LogMode::kFile) && logFilePath.empty())
            {
                throw std::invalid_argument(
                    "File logging mode requires a log file path.");
            }

            std::unique_ptr<LoggingFramework> _result{
                new LoggingFramework(appId, logLevel)};

            if (HasMode(logMode, LogMode::kFile))
            {
                _result->mSinks.emplace_back(
                    new sink::FileLogSink(appId, appDescription, logFilePath));
            }

            if (HasMode(logMode, LogMode::kConsole))
            {
                _result->mSinks.emplace_back(
                    new sink::ConsoleLogSink(appId, appDescription));
            }

            return _result.release();
        }
    }
}
