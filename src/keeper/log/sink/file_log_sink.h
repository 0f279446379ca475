/// @file src/keeper/log/sink/file_log_sink.h
/// @brief Declarations for file log sink.

#ifndef KEEPER_LOG_SINK_FILE_LOG_SINK_H
#define KEEPER_LOG_SINK_FILE_LOG_SINK_H

#include <string>
#include "./log_sink.h"

namespace keeper
{
    namespace log
    {
        namespace sink
        {
            /// @brief Log sink implementation that appends logs to a file.
            /// @details Each record becomes one "<date> <time>: <message>" line.
            ///          The file is opened in append mode for every record and
            ///          closed again, so it is never held open between writes.
            ///          Write failures are echoed to std::cerr and dropped.
            class FileLogSink : public LogSink
            {
            private:
                std::string mLogFilePath;

            public:
                /// @brief Constructor
                /// @param appId Application ID
                /// @param appDescription Application description
                /// @param logFilePath Logging file sink path
                FileLogSink(
                    std::string appId,
                    std::string appDescription,
                    std::string logFilePath);

                FileLogSink() = delete;

                /// @brief Path of the log file
                const std::string &GetLogFilePath() const noexcept;

                void Log(const LogStream &logStream) const noexcept override;
            };
        }
    }
}

#endif
