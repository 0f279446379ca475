/// @file src/keeper/log/sink/log_sink.cpp
/// @brief Implementation for log sink.

#include <ctime>
#include "./log_sink.h"

namespace keeper
{
    namespace log
    {
        namespace sink
        {
            const std::string LogSink::cHeaderSeparator{": "};

            LogSink::LogSink(
                std::string appId,
                std::string appDescription) : mAppId{std::move(appId)},
                                              mAppDescription{std::move(appDescription)}
            {
            }

            LogStream LogSink::GetTimestamp()
            {
                const std::time_t cNow{std::time(nullptr)};
                std::tm _localTime{};
                localtime_r(&cNow, &_localTime);

                char _buffer[32];
                const std::size_t cLength{
                    std::strftime(_buffer, sizeof(_buffer), "%Y-%m-%d %H:%M:%S", &_localTime)};

                LogStream _result;
                _result << std::string(_buffer, cLength);
                return _result;
            }

            LogStream LogSink::GetAppstamp() const
            {
                LogStream _result;
                _result << mAppId;
                return _result;
            }

            const std::string &LogSink::GetAppId() const noexcept
            {
                return mAppId;
            }

            const std::string &LogSink::GetAppDescription() const noexcept
            {
                return mAppDescription;
            }
        }
    }
}
