/// @file src/keeper/sup/supervisor_error_domain.h
/// @brief Declarations for the supervisor error domain.

#ifndef KEEPER_SUP_SUPERVISOR_ERROR_DOMAIN_H
#define KEEPER_SUP_SUPERVISOR_ERROR_DOMAIN_H

#include <string>
#include "../core/error_domain.h"
#include "../core/error_code.h"
#include "../exec/exec_error_domain.h"

namespace keeper
{
    /// @brief Supervisor functional cluster
    namespace sup
    {
        /// @brief Terminal and non-terminal supervisor error codes
        /// @note The numeric values double as the process exit codes.
        enum class SupervisorErrc : keeper::core::ErrorDomain::CodeType
        {
            kAlreadyRunning = 1,     ///< Another instance holds the instance lock
            kSetupFailed = 2,        ///< Log file, lock file or working directory setup failed
            kResolutionFailed = 3,   ///< No valid target could be resolved
            kTargetMissing = 4,      ///< Resolved target vanished after monitoring started
            kUnhandledFault = 5,     ///< Unexpected failure caught at the top level
            kInvalidArgument = 6     ///< Unusable command line
        };

        /// @brief Supervisor ErrorDomain
        class SupervisorErrorDomain final : public core::ErrorDomain
        {
        private:
            static const core::ErrorDomain::IdType cDomainId{0x8000000000000A01};

        public:
            SupervisorErrorDomain() noexcept;

            const char *Name() const noexcept override;

            const char *Message(
                core::ErrorDomain::CodeType errorCode) const noexcept override;
        };

        /// @brief Create keeper::core::ErrorCode in the supervisor domain
        /// @param code Supervisor error code
        /// @param userMessage Optional context, returned by ErrorCode::Message()
        /// @returns Error code bound to SupervisorErrorDomain
        core::ErrorCode MakeErrorCode(
            SupervisorErrc code,
            std::string userMessage = "");

        /// @brief Determine whether an error code is a given supervisor error
        bool IsError(const core::ErrorCode &errorCode, SupervisorErrc code) noexcept;

        /// @brief Map an error code to the process exit code
        /// @param errorCode Terminal error
        /// @returns Supervisor error value; execution errors map to their supervisor
        ///          counterpart, anything else to kUnhandledFault
        int ToExitCode(const core::ErrorCode &errorCode) noexcept;
    }
}

#endif
