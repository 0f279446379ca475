/// @file src/keeper/log/sink/file_log_sink.cpp
/// @brief Implementation for file log sink.

#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include "./file_log_sink.h"

namespace keeper
{
    namespace log
    {
        namespace sink
        {
            FileLogSink::FileLogSink(
                std::string appId,
                std::string appDescription,
                std::string logFilePath) : LogSink(std::move(appId), std::move(appDescription)),
                                           mLogFilePath{std::move(logFilePath)}
            {
            }

            const std::string &FileLogSink::GetLogFilePath() const noexcept
            {
                return mLogFilePath;
            }

            void FileLogSink::Log(const LogStream &logStream) const noexcept
            {
                try
                {
                    const std::string cNewline{"\n"};

                    LogStream _line = GetTimestamp();
                    _line << cHeaderSeparator << logStream;
                    const std::string cLogString{_line.ToString()};

                    std::ofstream _logFileStream(
                        mLogFilePath, std::ofstream::out | std::ofstream::app);
                    if (!_logFileStream.is_open())
                    {
                        std::cerr << "Cannot write to log file " << mLogFilePath
                                  << ": " << std::strerror(errno) << std::endl;
                        return;
                    }

                    _logFileStream << cLogString << cNewline;
                    _logFileStream.close();
                    if (_logFileStream.fail())
                    {
                        std::cerr << "Failed writing to log file " << mLogFilePath
                                  << std::endl;
                    }
                }
                catch (const std::exception &ex)
                {
                    std::cerr << "Log file sink error: " << ex.what() << std::endl;
                }
            }
        }
    }
}
