#include "./exec_error_domain.h"

namespace keeper
{
    namespace exec
    {
        namespace
        {
            const ExecErrorDomain &GetDomain() noexcept
            {
                static const ExecErrorDomain cDomain;
                return cDomain;
            }
        }

        ExecErrorDomain::ExecErrorDomain() noexcept : ErrorDomain{cDomainId}
        {
        }

        const char *ExecErrorDomain::Name() const noexcept
        {
            return "Exec";
        }

        const char *ExecErrorDomain::Message(
            core::ErrorDomain::CodeType errorCode) const noexcept
        {
            switch (static_cast<ExecErrc>(errorCode))
            {
            case ExecErrc::kAlreadyRunning:
                return "Instance lock is already held.";
            case ExecErrc::kSetupFailed:
                return "File system operation failed.";
            case ExecErrc::kTargetMissing:
                return "Target file no longer exists.";
            case ExecErrc::kLaunchFailed:
                return "Target could not be launched.";
            case ExecErrc::kProcessQueryFailed:
                return "Process table could not be queried.";
            default:
                return "Unknown execution error.";
            }
        }

        core::ErrorCode MakeErrorCode(
            ExecErrc code,
            std::string userMessage)
        {
            return core::ErrorCode{
                static_cast<core::ErrorDomain::CodeType>(code),
                GetDomain(),
                std::move(userMessage)};
        }

        bool IsError(const core::ErrorCode &errorCode, ExecErrc code) noexcept
        {
            return IsExecError(errorCode) &&
                   errorCode.Value() == static_cast<core::ErrorDomain::CodeType>(code);
        }

        bool IsExecError(const core::ErrorCode &errorCode) noexcept
        {
            return errorCode.Domain() == GetDomain();
        }
    }
}
