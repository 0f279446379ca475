#include <gtest/gtest.h>
#include <memory>
#include "../../../src/keeper/sup/error_reporter.h"
#include "../../../src/keeper/sup/supervisor_error_domain.h"
#include "../log/memory_log_sink.h"
#include "./fake_notifier.h"

namespace keeper
{
    namespace sup
    {
        class ErrorReporterTest : public ::testing::Test
        {
        protected:
            std::unique_ptr<log::LoggingFramework> mLoggingFramework;
            log::sink::MemoryLogSink *mMemorySink;
            FakeNotifier mNotifier;

            void SetUp() override
            {
                mLoggingFramework.reset(
                    log::LoggingFramework::Create("TEST", log::LogMode::kConsole));
                mMemorySink = new log::sink::MemoryLogSink();
                mLoggingFramework->AddSink(std::unique_ptr<log::sink::LogSink>(mMemorySink));
            }
        };

        TEST_F(ErrorReporterTest, LogsThenNotifiesOnce)
        {
            const log::Logger &_logger{mLoggingFramework->CreateLogger("SUP", "Supervisor")};
            ErrorReporter _reporter(*mLoggingFramework, _logger, mNotifier);

            _reporter.Report("AutoQCStarter is already running.");

            EXPECT_EQ(1U, mMemorySink->Count("AutoQCStarter is already running."));
            ASSERT_EQ(1U, mNotifier.Messages.size());
            EXPECT_EQ("AutoQCStarter is already running.", mNotifier.Messages.front());
        }

        TEST_F(ErrorReporterTest, DetailIsLoggedOnly)
        {
            const log::Logger &_logger{mLoggingFramework->CreateLogger("SUP", "Supervisor")};
            ErrorReporter _reporter(*mLoggingFramework, _logger, mNotifier);

            _reporter.Report("Could not set working directory. Stopping.", "Permission denied");

            EXPECT_TRUE(mMemorySink->Contains("Permission denied"));
            ASSERT_EQ(1U, mNotifier.Messages.size());
            EXPECT_EQ("Could not set working directory. Stopping.", mNotifier.Messages.front());
        }

        TEST_F(ErrorReporterTest, ErrorCode)
        {
            const log::Logger &_logger{mLoggingFramework->CreateLogger("SUP", "Supervisor")};
            ErrorReporter _reporter(*mLoggingFramework, _logger, mNotifier);

            _reporter.Report(MakeErrorCode(SupervisorErrc::kTargetMissing, "/opt/AutoQC.exe no longer exists. Stopping."));

            ASSERT_EQ(1U, mNotifier.Messages.size());
            EXPECT_EQ("/opt/AutoQC.exe no longer exists. Stopping.", mNotifier.Messages.front());
        }

        TEST_F(ErrorReporterTest, NotifiesEvenWhenErrorsAreFiltered)
        {
            const log::Logger &_logger{
                mLoggingFramework->CreateLogger("SUP", "Supervisor", log::LogLevel::kOff)};
            ErrorReporter _reporter(*mLoggingFramework, _logger, mNotifier);

            _reporter.Report("message");

            EXPECT_TRUE(mMemorySink->GetRecords().empty());
            EXPECT_EQ(1U, mNotifier.Messages.size());
        }
    }
}
