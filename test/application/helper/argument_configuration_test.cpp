#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "../../../src/application/helper/argument_configuration.h"
#include "../../../src/keeper/sup/supervisor_error_domain.h"

namespace application
{
    namespace helper
    {
        using keeper::sup::Invocation;

        TEST(ArgumentConfigurationTest, NoArgument)
        {
            char _program[] = "app_keeper";
            char *_argv[] = {_program, nullptr};

            ArgumentConfiguration _configuration(1, _argv);

            ASSERT_TRUE(_configuration.GetInvocation().HasValue());
            EXPECT_EQ(
                Invocation::Kind::kDefault,
                _configuration.GetInvocation().Value().InvocationKind);
            EXPECT_FALSE(_configuration.GetInvocation().Value().HasArgument());
            EXPECT_TRUE(_configuration.GetArguments().empty());
        }

        TEST(ArgumentConfigurationTest, ChannelKeyword)
        {
            char _program[] = "app_keeper";
            char _keyword[] = "Daily";
            char *_argv[] = {_program, _keyword, nullptr};

            ArgumentConfiguration _configuration(2, _argv);

            ASSERT_TRUE(_configuration.GetInvocation().HasValue());
            const Invocation &_invocation{_configuration.GetInvocation().Value()};
            EXPECT_EQ(Invocation::Kind::kChannel, _invocation.InvocationKind);
            EXPECT_EQ(keeper::sup::ReleaseChannel::kDaily, _invocation.Channel);
            EXPECT_TRUE(_invocation.HasArgument());
        }

        TEST(ArgumentConfigurationTest, ExplicitPath)
        {
            const std::vector<std::string> cArguments{"  /opt/AutoQC/AutoQC.exe "};

            const auto cResult{ArgumentConfiguration::Parse(cArguments)};

            ASSERT_TRUE(cResult.HasValue());
            EXPECT_EQ(Invocation::Kind::kExplicitPath, cResult.Value().InvocationKind);
            EXPECT_EQ("/opt/AutoQC/AutoQC.exe", cResult.Value().ExplicitPath);
        }

        TEST(ArgumentConfigurationTest, TooManyArguments)
        {
            const std::vector<std::string> cArguments{"daily", "release"};

            const auto cResult{ArgumentConfiguration::Parse(cArguments)};

            ASSERT_FALSE(cResult.HasValue());
            EXPECT_TRUE(
                keeper::sup::IsError(
                    cResult.Error(), keeper::sup::SupervisorErrc::kInvalidArgument));
        }

        TEST(ArgumentConfigurationTest, BlankArgument)
        {
            const std::vector<std::string> cArguments{"   "};

            const auto cResult{ArgumentConfiguration::Parse(cArguments)};

            ASSERT_FALSE(cResult.HasValue());
            EXPECT_NE(
                std::string::npos,
                cResult.Error().Message().find(ArgumentConfiguration::cUsage));
        }
    }
}
