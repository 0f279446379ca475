/// @file src/keeper/core/error_code.h
/// @brief Declarations for error code.
/// @details This file is part of the app_keeper supervisor.

#ifndef KEEPER_CORE_ERROR_CODE_H
#define KEEPER_CORE_ERROR_CODE_H

#include <string>
#include <utility>
#include "./error_domain.h"

namespace keeper
{
    namespace core
    {
        /// @brief A raw error value bound to the ErrorDomain that defines it
        class ErrorCode final
        {
        private:
            ErrorDomain::CodeType mValue;
            const ErrorDomain *mDomain;
            std::string mUserMessage;

        public:
            /// @brief Constructor
            /// @param value Error code value
            /// @param domain Error code domain
            /// @param userMessage Context that replaces the domain message, if not empty
            ErrorCode(
                ErrorDomain::CodeType value,
                const ErrorDomain &domain,
                std::string userMessage = "") : mValue{value},
                                                mDomain{&domain},
                                                mUserMessage{std::move(userMessage)}
            {
            }

            ErrorCode() = delete;
            ~ErrorCode() noexcept = default;

            /// @brief Get error code value
            /// @returns Raw error code value
            ErrorDomain::CodeType Value() const noexcept
            {
                return mValue;
            }

            /// @brief Get error code domain
            /// @returns Error domain which the error code belongs to
            const ErrorDomain &Domain() const noexcept
            {
                return *mDomain;
            }

            /// @brief Get error message
            /// @returns The user message if one was attached; otherwise the domain message
            std::string Message() const;

            /// @note The user message does not take part in the comparison.
            bool operator==(const ErrorCode &other) const noexcept
            {
                return *mDomain == *other.mDomain && mValue == other.mValue;
            }
        };
    }
}

#endif
