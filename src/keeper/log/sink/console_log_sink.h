/// @file src/keeper/log/sink/console_log_sink.h
/// @brief Declarations for console log sink.

#ifndef KEEPER_LOG_SINK_CONSOLE_LOG_SINK_H
#define KEEPER_LOG_SINK_CONSOLE_LOG_SINK_H

#include "./log_sink.h"

namespace keeper
{
    namespace log
    {
        namespace sink
        {
            /// @brief Log sink implementation that writes logs to standard output.
            class ConsoleLogSink : public LogSink
            {
            public:
                /// @brief Constructor
                /// @param appId Application ID
                /// @param appDescription Application description
                ConsoleLogSink(
                    std::string appId,
                    std::string appDescription);

                ConsoleLogSink() = delete;
                void Log(const LogStream &logStream) const noexcept override;
            };
        }
    }
}

#endif
