/// @file src/keeper/log/log_stream.h
/// @brief Declarations for the log record builder.

#ifndef KEEPER_LOG_LOG_STREAM_H
#define KEEPER_LOG_LOG_STREAM_H

#include <cstdint>
#include <string>
#include "../core/error_code.h"
#include "./common.h"

namespace keeper
{
    namespace log
    {
        /// @brief Accumulates the parts of one log record
        class LogStream final
        {
        private:
            std::string mRecord;

        public:
            LogStream &operator<<(const LogStream &value);

            LogStream &operator<<(const std::string &value);

            /// @note A null pointer appends nothing.
            LogStream &operator<<(const char *value);

            LogStream &operator<<(std::int32_t value);

            LogStream &operator<<(std::uint64_t value);

            /// @brief Append an error as "{domain}:{value} {message}"
            LogStream &operator<<(const keeper::core::ErrorCode &value);

            /// @brief Record text accumulated so far
            std::string ToString() const noexcept;
        };
    }
}

#endif
