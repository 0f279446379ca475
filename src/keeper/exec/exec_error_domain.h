/// @file src/keeper/exec/exec_error_domain.h
/// @brief Declarations for the execution error domain.

#ifndef KEEPER_EXEC_EXEC_ERROR_DOMAIN_H
#define KEEPER_EXEC_EXEC_ERROR_DOMAIN_H

#include <string>
#include "../core/error_domain.h"
#include "../core/error_code.h"

namespace keeper
{
    namespace exec
    {
        /// @brief Errors of the process-level primitives
        enum class ExecErrc : keeper::core::ErrorDomain::CodeType
        {
            kAlreadyRunning = 1,    ///< Instance lock is held by another owner
            kSetupFailed = 2,       ///< File system or lock file operation failed
            kTargetMissing = 3,     ///< Monitored target file no longer exists
            kLaunchFailed = 4,      ///< Target launch could not be issued
            kProcessQueryFailed = 5 ///< Process table could not be read
        };

        /// @brief Execution ErrorDomain
        class ExecErrorDomain final : public core::ErrorDomain
        {
        private:
            static const core::ErrorDomain::IdType cDomainId{0x8000000000000A02};

        public:
            ExecErrorDomain() noexcept;

            const char *Name() const noexcept override;

            const char *Message(
                core::ErrorDomain::CodeType errorCode) const noexcept override;
        };

        /// @brief Create keeper::core::ErrorCode in the execution domain
        /// @param code Execution error code
        /// @param userMessage Optional context, returned by ErrorCode::Message()
        core::ErrorCode MakeErrorCode(
            ExecErrc code,
            std::string userMessage = "");

        /// @brief Determine whether an error code is a given execution error
        bool IsError(const core::ErrorCode &errorCode, ExecErrc code) noexcept;

        /// @brief Determine whether an error code belongs to the execution domain
        bool IsExecError(const core::ErrorCode &errorCode) noexcept;
    }
}

#endif
