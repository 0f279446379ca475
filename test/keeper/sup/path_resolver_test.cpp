#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include "../../../src/keeper/sup/path_resolver.h"
#include "../../../src/keeper/sup/supervisor_error_domain.h"
#include "../log/memory_log_sink.h"

namespace keeper
{
    namespace sup
    {
        static const std::string cTestRoot{"/tmp/keeper_path_resolver_test"};
        static const std::string cProgramsDir{cTestRoot + "/applications"};
        static const std::string cPublisherDir{cProgramsDir + "/University of Washington"};
        static const std::string cExecutableDir{cTestRoot + "/bin"};

        class PathResolverTest : public ::testing::Test
        {
        protected:
            std::unique_ptr<log::LoggingFramework> mLoggingFramework;
            log::sink::MemoryLogSink *mMemorySink;

            void SetUp() override
            {
                std::string cmd = "rm -rf '" + cTestRoot + "'";
                std::system(cmd.c_str());
                ::mkdir(cTestRoot.c_str(), 0755);
                ::mkdir(cProgramsDir.c_str(), 0755);
                ::mkdir(cExecutableDir.c_str(), 0755);

                mLoggingFramework.reset(
                    log::LoggingFramework::Create("TEST", log::LogMode::kConsole));
                mMemorySink = new log::sink::MemoryLogSink();
                mLoggingFramework->AddSink(std::unique_ptr<log::sink::LogSink>(mMemorySink));
            }

            void TearDown() override
            {
                std::string cmd = "rm -rf '" + cTestRoot + "'";
                std::system(cmd.c_str());
            }

            static void touch(const std::string &path)
            {
                std::ofstream _stream(path);
                _stream << "content";
            }

            PathResolver createResolver()
            {
                const log::Logger &_logger{
                    mLoggingFramework->CreateLogger("RSLV", "Path resolver")};

                ResolverEnvironment _environment;
                _environment.ProgramsDirectory = cProgramsDir;
                _environment.ExecutableDirectory = cExecutableDir;

                return PathResolver(
                    SupervisorIdentity("University of Washington", "AutoQCStarter"),
                    TargetNaming(),
                    _environment,
                    *mLoggingFramework,
                    _logger);
            }

            static Invocation channelInvocation(ReleaseChannel channel)
            {
                Invocation _result;
                _result.InvocationKind = Invocation::Kind::kChannel;
                _result.Channel = channel;
                return _result;
            }

            static Invocation pathInvocation(const std::string &path)
            {
                Invocation _result;
                _result.InvocationKind = Invocation::Kind::kExplicitPath;
                _result.ExplicitPath = path;
                return _result;
            }
        };

        TEST(ReleaseChannelTest, Parse)
        {
            ReleaseChannel _channel{ReleaseChannel::kRelease};

            EXPECT_TRUE(TryParseChannel("DAILY", _channel));
            EXPECT_EQ(ReleaseChannel::kDaily, _channel);
            EXPECT_TRUE(TryParseChannel("Release", _channel));
            EXPECT_EQ(ReleaseChannel::kRelease, _channel);
            EXPECT_FALSE(TryParseChannel("nightly", _channel));
        }

        TEST(ReleaseChannelTest, TargetName)
        {
            EXPECT_EQ("AutoQC", GetChannelTargetName("AutoQC", ReleaseChannel::kRelease));
            EXPECT_EQ("AutoQC-daily", GetChannelTargetName("AutoQC", ReleaseChannel::kDaily));
        }

        TEST_F(PathResolverTest, ExplicitValidPath)
        {
            const std::string cExplicitPath{cTestRoot + "/AutoQC-daily.exe"};
            touch(cExplicitPath);
            ::mkdir(cPublisherDir.c_str(), 0755);
            touch(cPublisherDir + "/AutoQC-daily.appref-ms");

            PathResolver _resolver{createResolver()};
            auto _result{_resolver.Resolve(pathInvocation(cExplicitPath))};

            ASSERT_TRUE(_result.HasValue());
            EXPECT_EQ(cExplicitPath, _result.Value().Path);
            EXPECT_EQ(exec::TargetKind::kExecutable, _result.Value().Kind);
            EXPECT_EQ("AutoQC-daily", _result.Value().ProcessName);
            EXPECT_FALSE(mMemorySink->Contains("Looking for"));
        }

        TEST_F(PathResolverTest, ExplicitPathWithWrongName)
        {
            const std::string cExplicitPath{cTestRoot + "/Skyline.exe"};
            touch(cExplicitPath);
            touch(cExecutableDir + "/AutoQC.exe");

            PathResolver _resolver{createResolver()};
            auto _result{_resolver.Resolve(pathInvocation(cExplicitPath))};

            ASSERT_FALSE(_result.HasValue());
            EXPECT_TRUE(IsError(_result.Error(), SupervisorErrc::kResolutionFailed));
            EXPECT_EQ(
                "Given path is not to a AutoQC.exe or AutoQC-daily.exe: " + cExplicitPath,
                _result.Error().Message());
            EXPECT_FALSE(mMemorySink->Contains("Looking for"));
        }

        TEST_F(PathResolverTest, ExplicitPathMissing)
        {
            const std::string cExplicitPath{cTestRoot + "/AutoQC.exe"};
            touch(cExecutableDir + "/AutoQC.exe");

            PathResolver _resolver{createResolver()};
            auto _result{_resolver.Resolve(pathInvocation(cExplicitPath))};

            ASSERT_FALSE(_result.HasValue());
            EXPECT_TRUE(IsError(_result.Error(), SupervisorErrc::kResolutionFailed));
            EXPECT_NE(std::string::npos, _result.Error().Message().find("does not exist"));
        }

        TEST_F(PathResolverTest, DefaultFindsCoLocatedExecutable)
        {
            touch(cExecutableDir + "/AutoQC.exe");

            PathResolver _resolver{createResolver()};
            auto _result{_resolver.Resolve(Invocation())};

            ASSERT_TRUE(_result.HasValue());
            EXPECT_EQ(cExecutableDir + "/AutoQC.exe", _result.Value().Path);
            EXPECT_EQ(exec::TargetKind::kExecutable, _result.Value().Kind);
            EXPECT_EQ("AutoQC", _result.Value().ProcessName);
        }

        TEST_F(PathResolverTest, DailyReferenceUnderPublisher)
        {
            ::mkdir(cPublisherDir.c_str(), 0755);
            touch(cPublisherDir + "/AutoQC-daily.appref-ms");
            touch(cPublisherDir + "/AutoQC.appref-ms");
            touch(cExecutableDir + "/AutoQC.exe");

            PathResolver _resolver{createResolver()};
            auto _result{_resolver.Resolve(channelInvocation(ReleaseChannel::kDaily))};

            ASSERT_TRUE(_result.HasValue());
            EXPECT_EQ(cPublisherDir + "/AutoQC-daily.appref-ms", _result.Value().Path);
            EXPECT_EQ(exec::TargetKind::kApplicationReference, _result.Value().Kind);
            EXPECT_EQ("AutoQC-daily", _result.Value().ProcessName);
            EXPECT_FALSE(mMemorySink->Contains("AutoQC.appref-ms"));
        }

        TEST_F(PathResolverTest, ReferenceUnderProductDirectory)
        {
            const std::string cProductDir{cProgramsDir + "/AutoQC"};
            ::mkdir(cProductDir.c_str(), 0755);
            touch(cProductDir + "/AutoQC.appref-ms");

            PathResolver _resolver{createResolver()};
            auto _result{_resolver.Resolve(channelInvocation(ReleaseChannel::kRelease))};

            ASSERT_TRUE(_result.HasValue());
            EXPECT_EQ(cProductDir + "/AutoQC.appref-ms", _result.Value().Path);
            EXPECT_EQ(exec::TargetKind::kApplicationReference, _result.Value().Kind);
        }

        TEST_F(PathResolverTest, PublisherDirectoryWithoutReference)
        {
            ::mkdir(cPublisherDir.c_str(), 0755);
            const std::string cProductDir{cProgramsDir + "/AutoQC"};
            ::mkdir(cProductDir.c_str(), 0755);
            touch(cProductDir + "/AutoQC.appref-ms");
            touch(cExecutableDir + "/AutoQC.exe");

            PathResolver _resolver{createResolver()};
            auto _result{_resolver.Resolve(Invocation())};

            ASSERT_TRUE(_result.HasValue());
            EXPECT_EQ(cExecutableDir + "/AutoQC.exe", _result.Value().Path);
        }

        TEST_F(PathResolverTest, NothingFound)
        {
            PathResolver _resolver{createResolver()};
            auto _result{_resolver.Resolve(channelInvocation(ReleaseChannel::kDaily))};

            ASSERT_FALSE(_result.HasValue());
            EXPECT_TRUE(IsError(_result.Error(), SupervisorErrc::kResolutionFailed));
            EXPECT_EQ(
                "Cannot find path to AutoQC-daily.appref-ms or AutoQC-daily.exe. Stopping.",
                _result.Error().Message());
        }

        TEST_F(PathResolverTest, DefaultChannelFromNaming)
        {
            touch(cExecutableDir + "/AutoQC-daily.exe");
            const log::Logger &_logger{
                mLoggingFramework->CreateLogger("RSLV", "Path resolver")};

            TargetNaming _naming;
            _naming.DefaultChannel = ReleaseChannel::kDaily;
            ResolverEnvironment _environment;
            _environment.ProgramsDirectory = cProgramsDir;
            _environment.ExecutableDirectory = cExecutableDir;
            PathResolver _resolver(
                SupervisorIdentity("University of Washington", "AutoQCStarter"),
                _naming,
                _environment,
                *mLoggingFramework,
                _logger);

            auto _result{_resolver.Resolve(Invocation())};

            ASSERT_TRUE(_result.HasValue());
            EXPECT_EQ("AutoQC-daily", _result.Value().ProcessName);
        }
    }
}
