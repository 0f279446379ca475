#include "./supervisor_error_domain.h"

namespace keeper
{
    namespace sup
    {
        namespace
        {
            const SupervisorErrorDomain &GetDomain() noexcept
            {
                static const SupervisorErrorDomain cDomain;
                return cDomain;
            }
        }

        SupervisorErrorDomain::SupervisorErrorDomain() noexcept : ErrorDomain{cDomainId}
        {
        }

        const char *SupervisorErrorDomain::Name() const noexcept
        {
            return "Supervisor";
        }

        const char *SupervisorErrorDomain::Message(
            core::ErrorDomain::CodeType errorCode) const noexcept
        {
            SupervisorErrc _code{static_cast<SupervisorErrc>(errorCode)};

            switch (_code)
            {
            case SupervisorErrc::kAlreadyRunning:
                return "Supervisor is already running.";
            case SupervisorErrc::kSetupFailed:
                return "Supervisor environment setup failed.";
            case SupervisorErrc::kResolutionFailed:
                return "Target application could not be found.";
            case SupervisorErrc::kTargetMissing:
                return "Target application no longer exists.";
            case SupervisorErrc::kUnhandledFault:
                return "Unexpected supervisor error.";
            case SupervisorErrc::kInvalidArgument:
                return "Invalid command line argument.";
            default:
                return "Unknown supervisor error.";
            }
        }

        core::ErrorCode MakeErrorCode(
            SupervisorErrc code,
            std::string userMessage)
        {
            return core::ErrorCode{
                static_cast<core::ErrorDomain::CodeType>(code),
                GetDomain(),
                std::move(userMessage)};
        }

        bool IsError(const core::ErrorCode &errorCode, SupervisorErrc code) noexcept
        {
            return errorCode.Domain() == GetDomain() &&
                   errorCode.Value() == static_cast<core::ErrorDomain::CodeType>(code);
        }

        int ToExitCode(const core::ErrorCode &errorCode) noexcept
        {
            if (errorCode.Domain() == GetDomain())
            {
                return static_cast<int>(errorCode.Value());
            }

            SupervisorErrc _code{SupervisorErrc::kUnhandledFault};
            if (exec::IsError(errorCode, exec::ExecErrc::kAlreadyRunning))
            {
                _code = SupervisorErrc::kAlreadyRunning;
            }
            else if (exec::IsError(errorCode, exec::ExecErrc::kSetupFailed))
            {
                _code = SupervisorErrc::kSetupFailed;
            }
            else if (exec::IsError(errorCode, exec::ExecErrc::kTargetMissing))
            {
                _code = SupervisorErrc::kTargetMissing;
            }

            return static_cast<int>(_code);
        }
    }
}
