/// @file src/keeper/core/error_domain.h
/// @brief Declarations for error domain.
/// @details This file is part of the app_keeper supervisor.

#ifndef KEEPER_CORE_ERROR_DOMAIN_H
#define KEEPER_CORE_ERROR_DOMAIN_H

#include <stdint.h>

namespace keeper
{
    /// @brief Basic core types shared by every keeper component
    namespace core
    {
        /// @brief Namespace of error values; two codes are equal only within the same domain
        /// @note A concrete domain is a single object with static storage duration,
        ///       ErrorCode keeps a pointer to it.
        class ErrorDomain
        {
        public:
            /// @brief Unsigned integral type used as error-domain identifier.
            using IdType = uint64_t;
            /// @brief Unsigned integral type used as raw error code value.
            using CodeType = uint32_t;

        private:
            IdType mId;

        public:
            /// @brief Constructor
            /// @param id Error domain ID
            explicit constexpr ErrorDomain(IdType id) noexcept : mId{id}
            {
            }

            ~ErrorDomain() noexcept = default;

            ErrorDomain(const ErrorDomain &) = delete;
            ErrorDomain(ErrorDomain &&) = delete;
            ErrorDomain &operator=(const ErrorDomain &) = delete;
            ErrorDomain &operator=(ErrorDomain &&) = delete;

            constexpr bool operator==(const ErrorDomain &other) const noexcept
            {
                return mId == other.mId;
            }

            constexpr bool operator!=(const ErrorDomain &other) const noexcept
            {
                return mId != other.mId;
            }

            /// @brief Short domain name used when an error is logged
            virtual const char *Name() const noexcept = 0;

            /// @brief Default text of an error value, used when no context message is attached
            virtual const char *Message(CodeType errorCode) const noexcept = 0;
        };
    }
}

#endif
