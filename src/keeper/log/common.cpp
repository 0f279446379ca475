/// @file src/keeper/log/common.cpp
/// @brief Implementation for common logging types.

#include <cctype>
#include "./common.h"

namespace keeper
{
    namespace log
    {
        namespace
        {
            bool equalsIgnoreCase(const std::string &text, const char *name) noexcept
            {
                std::size_t _index{0U};
                for (; name[_index] != '\0'; ++_index)
                {
                    if (_index >= text.size() ||
                        std::tolower(static_cast<unsigned char>(text[_index])) != name[_index])
                    {
                        return false;
                    }
                }

                return _index == text.size();
            }
        }

        std::string ToString(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::kOff:
                return "OFF";
            case LogLevel::kFatal:
                return "FATAL";
            case LogLevel::kError:
                return "ERROR";
            case LogLevel::kWarn:
                return "WARN";
            case LogLevel::kInfo:
                return "INFO";
            case LogLevel::kDebug:
                return "DEBUG";
            case LogLevel::kVerbose:
                return "VERBOSE";
            default:
                return "UNKNOWN";
            }
        }

        LogLevel ParseLogLevel(const std::string &text, LogLevel fallback) noexcept
        {
            if (equalsIgnoreCase(text, "off"))
            {
                return LogLevel::kOff;
            }
            if (equalsIgnoreCase(text, "fatal"))
            {
                return LogLevel::kFatal;
            }
            if (equalsIgnoreCase(text, "error"))
            {
                return LogLevel::kError;
            }
            if (equalsIgnoreCase(text, "warn") || equalsIgnoreCase(text, "warning"))
            {
                return LogLevel::kWarn;
            }
            if (equalsIgnoreCase(text, "info"))
            {
                return LogLevel::kInfo;
            }
            if (equalsIgnoreCase(text, "debug"))
            {
                return LogLevel::kDebug;
            }
            if (equalsIgnoreCase(text, "verbose"))
            {
                return LogLevel::kVerbose;
            }

            return fallback;
        }
    }
}
