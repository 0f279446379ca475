#include "./logger.h"

namespace keeper
{
    namespace log
    {
        Logger::Logger(std::string ctxId,
                       std::string ctxDescription,
                       LogLevel threshold) : mContextId{std::move(ctxId)},
                                             mContextDescription{std::move(ctxDescription)},
                                             mThreshold{threshold}
        {
        }

        bool Logger::IsEnabled(LogLevel logLevel) const noexcept
        {
            if (mThreshold == LogLevel::kOff || logLevel == LogLevel::kOff)
            {
                return false;
            }

            // Lower values are more severe.
            return static_cast<std::uint8_t>(logLevel) <=
                   static_cast<std::uint8_t>(mThreshold);
        }

        LogLevel Logger::GetLogLevel() const noexcept
        {
            return mThreshold;
        }

        const std::string &Logger::GetContextId() const noexcept
        {
            return mContextId;
        }

        const std::string &Logger::GetContextDescription() const noexcept
        {
            return mContextDescription;
        }

        LogStream Logger::WithLevel(LogLevel logLevel) const
        {
            (void)logLevel;
            return LogStream();
        }

        Logger Logger::CreateLogger(
            std::string ctxId,
            std::string ctxDescription,
            LogLevel threshold)
        {
            return Logger(std::move(ctxId), std::move(ctxDescription), threshold);
        }
    }
}
