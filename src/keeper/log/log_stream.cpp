/// @file src/keeper/log/log_stream.cpp
/// @brief Implementation for the log record builder.

#include "./log_stream.h"

namespace keeper
{
    namespace log
    {
        LogStream &LogStream::operator<<(const LogStream &value)
        {
            mRecord += value.mRecord;
            return *this;
        }

        LogStream &LogStream::operator<<(const std::string &value)
        {
            mRecord += value;
            return *this;
        }

        LogStream &LogStream::operator<<(const char *value)
        {
            if (value != nullptr)
            {
                mRecord += value;
            }

            return *this;
        }

        LogStream &LogStream::operator<<(std::int32_t value)
        {
            mRecord += std::to_string(value);
            return *this;
        }

        LogStream &LogStream::operator<<(std::uint64_t value)
        {
            mRecord += std::to_string(value);
            return *this;
        }

        LogStream &LogStream::operator<<(const keeper::core::ErrorCode &value)
        {
            mRecord += value.Domain().Name();
            mRecord += ":";
            mRecord += std::to_string(value.Value());
            mRecord += " ";
            mRecord += value.Message();

            return *this;
        }

        std::string LogStream::ToString() const noexcept
        {
            return mRecord;
        }
    }
}
