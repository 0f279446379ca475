/// @file src/keeper/log/common.h
/// @brief Common logging types.

#ifndef KEEPER_LOG_COMMON_H
#define KEEPER_LOG_COMMON_H

#include <cstdint>
#include <string>

namespace keeper
{
    /// @brief Logging framework namespace
    namespace log
    {
        /// @brief Log severity level
        enum class LogLevel : std::uint8_t
        {
            kOff = 0x00,     ///< No logging
            kFatal = 0x01,   ///< Fatal error, not recoverable
            kError = 0x02,   ///< Error with impact to correct functionality
            kWarn = 0x03,    ///< Warning if correct behavior cannot be ensured
            kInfo = 0x04,    ///< Informational, providing high level understanding
            kDebug = 0x05,   ///< Detailed information for programmers
            kVerbose = 0x06  ///< Extra-verbose debug messages
        };

        /// @brief Log sink selection, combinable as a bit mask
        enum class LogMode : std::uint8_t
        {
            kFile = 0x02,   ///< Append to a log file
            kConsole = 0x04 ///< Write to the standard output
        };

        inline LogMode operator|(LogMode lhs, LogMode rhs) noexcept
        {
            return static_cast<LogMode>(
                static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
        }

        /// @brief Determine whether a mode mask contains a specific mode
        inline bool HasMode(LogMode mask, LogMode mode) noexcept
        {
            return (static_cast<std::uint8_t>(mask) &
                    static_cast<std::uint8_t>(mode)) != 0U;
        }

        /// @brief Convert a log level to its display name
        /// @param level Log severity level
        /// @returns Upper-case level name
        std::string ToString(LogLevel level);

        /// @brief Parse a log level name (case-insensitive)
        /// @param text Level name such as "info" or "debug"
        /// @param fallback Level returned for unknown names
        /// @returns Parsed level or the fallback
        LogLevel ParseLogLevel(const std::string &text, LogLevel fallback) noexcept;
    }
}

#endif
