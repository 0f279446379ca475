/// @file src/keeper/log/sink/console_log_sink.cpp
/// @brief Implementation for console log sink.

#include <exception>
#include <iostream>
#include "./console_log_sink.h"

namespace keeper
{
    namespace log
    {
        namespace sink
        {
            ConsoleLogSink::ConsoleLogSink(
                std::string appId,
                std::string appDescription) : LogSink(std::move(appId), std::move(appDescription))
            {
            }

            void ConsoleLogSink::Log(const LogStream &logStream) const noexcept
            {
                try
                {
                    const std::string cWhitespace{" "};

                    LogStream _line = GetTimestamp();
                    LogStream _appstamp = GetAppstamp();
                    _line << cWhitespace << _appstamp << cHeaderSeparator << logStream;

                    std::cout << _line.ToString() << std::endl;
                }
                catch (const std::exception &ex)
                {
                    std::cerr << "Console log sink error: " << ex.what() << std::endl;
                }
            }
        }
    }
}
