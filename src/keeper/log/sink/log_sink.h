/// @file src/keeper/log/sink/log_sink.h
/// @brief Declarations for log sink.

#ifndef KEEPER_LOG_SINK_LOG_SINK_H
#define KEEPER_LOG_SINK_LOG_SINK_H

#include <string>
#include "../log_stream.h"

namespace keeper
{
    namespace log
    {
        /// @brief Log record destinations
        namespace sink
        {
            /// @brief Logging sink abstract class
            /// @note Sinks are best-effort: Log shall never throw.
            class LogSink
            {
            private:
                const std::string mAppId;
                const std::string mAppDescription;

            protected:
                /// @brief Separator between the line header and the record
                static const std::string cHeaderSeparator;

                /// @brief Constructor
                /// @param appId Application ID
                /// @param appDescription Application description
                LogSink(std::string appId, std::string appDescription);

                /// @brief Get current local time as "YYYY-MM-DD HH:MM:SS"
                /// @returns Log stream containing the timestamp
                static LogStream GetTimestamp();

                /// @brief Get the application ID stamp
                /// @returns Log stream containing the application ID
                LogStream GetAppstamp() const;

            public:
                LogSink() = delete;
                virtual ~LogSink() noexcept = default;

                /// @brief Application ID the sink was created for
                const std::string &GetAppId() const noexcept;

                /// @brief Application description the sink was created for
                const std::string &GetAppDescription() const noexcept;

                /// @brief Write a log record to the sink
                /// @param logStream Log record
                virtual void Log(const LogStream &logStream) const noexcept = 0;
            };
        }
    }
}

#endif
