#include <gtest/gtest.h>
#include <string>
#include <memory>
#include "../../../src/keeper/log/logging_framework.h"
#include "./memory_log_sink.h"

namespace keeper
{
    namespace log
    {
        TEST(LoggingFrameworkTest, FactoryException)
        {
            const std::string cAppId{"APP01"};
            const LogMode cLogMode{LogMode::kFile};

            ASSERT_THROW(
                LoggingFramework::Create(cAppId, cLogMode),
                std::invalid_argument);
        }

        TEST(LoggingFrameworkTest, FactorySinks)
        {
            std::unique_ptr<LoggingFramework> _loggingFramework{
                LoggingFramework::Create(
                    "APP01",
                    LogMode::kFile | LogMode::kConsole,
                    LogLevel::kInfo,
                    "Test application",
                    "/tmp/keeper_logging_framework_test.log")};

            EXPECT_EQ(2U, _loggingFramework->GetSinkCount());
            EXPECT_EQ("APP01", _loggingFramework->GetAppId());
        }

        TEST(LoggingFrameworkTest, NullSink)
        {
            std::unique_ptr<LoggingFramework> _loggingFramework{
                LoggingFramework::Create("APP01", LogMode::kConsole)};

            EXPECT_THROW(
                _loggingFramework->AddSink(std::unique_ptr<sink::LogSink>()),
                std::invalid_argument);
        }

        TEST(LoggingFrameworkTest, LevelFiltering)
        {
            std::unique_ptr<LoggingFramework> _loggingFramework{
                LoggingFramework::Create("APP01", LogMode::kConsole)};
            auto _memorySink{new sink::MemoryLogSink()};
            _loggingFramework->AddSink(std::unique_ptr<sink::LogSink>(_memorySink));

            const Logger &_logger{
                _loggingFramework->CreateLogger("CTX01", "Test context", LogLevel::kWarn)};

            _loggingFramework->Log(_logger, LogLevel::kError, "error record");
            _loggingFramework->Log(_logger, LogLevel::kInfo, "info record");

            auto _stream{_logger.WithLevel(LogLevel::kWarn)};
            _stream << "warning " << 7;
            _loggingFramework->Log(_logger, LogLevel::kWarn, _stream);

            const std::vector<std::string> cRecords{_memorySink->GetRecords()};
            ASSERT_EQ(2U, cRecords.size());
            EXPECT_EQ("error record", cRecords.at(0));
            EXPECT_EQ("warning 7", cRecords.at(1));
        }

        TEST(LoggingFrameworkTest, LoggerContexts)
        {
            std::unique_ptr<LoggingFramework> _loggingFramework{
                LoggingFramework::Create("APP01", LogMode::kConsole, LogLevel::kDebug)};

            const Logger &_first{_loggingFramework->CreateLogger("CTX01", "First")};
            const Logger &_second{_loggingFramework->CreateLogger("CTX02", "Second")};

            EXPECT_EQ("CTX01", _first.GetContextId());
            EXPECT_EQ("Second", _second.GetContextDescription());
            EXPECT_EQ(LogLevel::kDebug, _first.GetLogLevel());
            EXPECT_TRUE(_first.IsEnabled(LogLevel::kDebug));
            EXPECT_FALSE(_first.IsEnabled(LogLevel::kVerbose));
        }

        TEST(LogLevelTest, Parse)
        {
            EXPECT_EQ(LogLevel::kVerbose, ParseLogLevel("verbose", LogLevel::kInfo));
            EXPECT_EQ(LogLevel::kError, ParseLogLevel("ERROR", LogLevel::kInfo));
            EXPECT_EQ(LogLevel::kInfo, ParseLogLevel("loud", LogLevel::kInfo));
        }

        TEST(LogLevelTest, ParseMatchesWholeName)
        {
            EXPECT_EQ(LogLevel::kWarn, ParseLogLevel("Warning", LogLevel::kInfo));
            EXPECT_EQ(LogLevel::kDebug, ParseLogLevel("DeBuG", LogLevel::kOff));
            EXPECT_EQ(LogLevel::kOff, ParseLogLevel("", LogLevel::kOff));
            EXPECT_EQ(LogLevel::kInfo, ParseLogLevel("inf", LogLevel::kInfo));
            EXPECT_EQ(LogLevel::kInfo, ParseLogLevel("warnings", LogLevel::kInfo));
            EXPECT_EQ(LogLevel::kInfo, ParseLogLevel(std::string(4096, 'e'), LogLevel::kInfo));
            EXPECT_TRUE(noexcept(ParseLogLevel(std::string("info"), LogLevel::kOff)));
        }
    }
}
