/// @file src/keeper/core/error_code.cpp
/// @brief Implementation for error code.
/// @details This file is part of the app_keeper supervisor.

#include "./error_code.h"

namespace keeper
{
    namespace core
    {
        std::string ErrorCode::Message() const
        {
            if (!mUserMessage.empty())
            {
                return mUserMessage;
            }

            std::string _result(mDomain->Message(mValue));
            return _result;
        }
    }
}
