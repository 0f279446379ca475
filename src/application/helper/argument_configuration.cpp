#include "./argument_configuration.h"
#include "../../keeper/sup/supervisor_error_domain.h"

namespace application
{
    namespace helper
    {
        namespace
        {
            std::vector<std::string> CollectArguments(int argc, char *argv[])
            {
                std::vector<std::string> _result;
                for (int i = 1; i < argc; ++i)
                {
                    if (argv[i] != nullptr)
                    {
                        _result.push_back(argv[i]);
                    }
                }

                return _result;
            }

            std::string Trim(const std::string &text)
            {
                const char *cWhitespace{" \t\r\n"};
                const std::size_t cBegin{text.find_first_not_of(cWhitespace)};
                if (cBegin == std::string::npos)
                {
                    return std::string();
                }

                const std::size_t cEnd{text.find_last_not_of(cWhitespace)};
                return text.substr(cBegin, cEnd - cBegin + 1U);
            }
        }

        const std::string ArgumentConfiguration::cUsage{
            "Expected no argument, one of \"release\" or \"daily\", or a path to the target executable."};

        ArgumentConfiguration::ArgumentConfiguration(
            int argc,
            char *argv[]) : mArguments{CollectArguments(argc, argv)},
                            mInvocation{Parse(mArguments)}
        {
        }

        const std::vector<std::string> &ArgumentConfiguration::GetArguments() const noexcept
        {
            return mArguments;
        }

        const keeper::core::Result<keeper::sup::Invocation> &
        ArgumentConfiguration::GetInvocation() const noexcept
        {
            return mInvocation;
        }

        keeper::core::Result<keeper::sup::Invocation> ArgumentConfiguration::Parse(
            const std::vector<std::string> &arguments)
        {
            using keeper::sup::Invocation;
            using ResultType = keeper::core::Result<Invocation>;

            Invocation _invocation;
            if (arguments.empty())
            {
                return ResultType::FromValue(_invocation);
            }

            if (arguments.size() > 1U)
            {
                return ResultType::FromError(
                    keeper::sup::MakeErrorCode(
                        keeper::sup::SupervisorErrc::kInvalidArgument,
                        "Too many arguments given. " + cUsage));
            }

            const std::string cArgument{Trim(arguments.front())};
            if (cArgument.empty())
            {
                return ResultType::FromError(
                    keeper::sup::MakeErrorCode(
                        keeper::sup::SupervisorErrc::kInvalidArgument,
                        "Empty argument given. " + cUsage));
            }

            if (keeper::sup::TryParseChannel(cArgument, _invocation.Channel))
            {
                _invocation.InvocationKind = Invocation::Kind::kChannel;
            }
            else
            {
                _invocation.InvocationKind = Invocation::Kind::kExplicitPath;
                _invocation.ExplicitPath = cArgument;
            }

            return ResultType::FromValue(_invocation);
        }
    }
}
