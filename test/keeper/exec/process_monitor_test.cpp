#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include "../../../src/keeper/exec/process_monitor.h"
#include "../../../src/keeper/exec/exec_error_domain.h"
#include "../log/memory_log_sink.h"
#include "./fake_process_launcher.h"
#include "./fake_process_table.h"

namespace keeper
{
    namespace exec
    {
        static const std::string cTargetPath{"/tmp/keeper_process_monitor_test_AutoQC.exe"};

        class ProcessMonitorTest : public ::testing::Test
        {
        protected:
            std::unique_ptr<log::LoggingFramework> mLoggingFramework;
            log::sink::MemoryLogSink *mMemorySink;
            FakeProcessTable mProcessTable;
            FakeProcessLauncher mProcessLauncher;
            TargetReference mTarget;
            std::size_t mWaitCount;

            void SetUp() override
            {
                std::ofstream _stream(cTargetPath);
                _stream << "binary";
                _stream.close();

                mLoggingFramework.reset(
                    log::LoggingFramework::Create("TEST", log::LogMode::kConsole));
                mMemorySink = new log::sink::MemoryLogSink();
                mLoggingFramework->AddSink(std::unique_ptr<log::sink::LogSink>(mMemorySink));

                mTarget.Path = cTargetPath;
                mTarget.Kind = TargetKind::kExecutable;
                mTarget.ProcessName = "AutoQC";
                mWaitCount = 0U;
            }

            void TearDown() override
            {
                std::remove(cTargetPath.c_str());
            }

            std::unique_ptr<ProcessMonitor> createMonitor(std::size_t waitsBeforeShutdown)
            {
                const log::Logger &_logger{
                    mLoggingFramework->CreateLogger("MON", "Process monitor")};

                return std::unique_ptr<ProcessMonitor>(
                    new ProcessMonitor(
                        mTarget,
                        mProcessTable,
                        mProcessLauncher,
                        *mLoggingFramework,
                        _logger,
                        std::chrono::milliseconds(60000),
                        [this, waitsBeforeShutdown](std::chrono::milliseconds interval)
                        {
                            EXPECT_EQ(std::chrono::milliseconds(60000), interval);
                            ++mWaitCount;
                            return mWaitCount >= waitsBeforeShutdown;
                        }));
            }
        };

        TEST_F(ProcessMonitorTest, EmptyWaitCallback)
        {
            const log::Logger &_logger{
                mLoggingFramework->CreateLogger("MON", "Process monitor")};

            EXPECT_THROW(
                ProcessMonitor(
                    mTarget,
                    mProcessTable,
                    mProcessLauncher,
                    *mLoggingFramework,
                    _logger,
                    std::chrono::milliseconds(1),
                    ProcessMonitor::WaitCallback()),
                std::invalid_argument);
        }

        TEST_F(ProcessMonitorTest, AbsentTargetLaunchedEveryTick)
        {
            auto _monitor{createMonitor(5U)};

            for (int i = 0; i < 5; ++i)
            {
                auto _outcome{_monitor->Tick()};
                ASSERT_TRUE(_outcome.HasValue());
                EXPECT_EQ(TickOutcome::kLaunched, _outcome.Value());
            }

            EXPECT_EQ(5U, mProcessLauncher.Launched.size());
            EXPECT_EQ(5U, _monitor->GetLaunchCount());
            EXPECT_EQ(5U, mMemorySink->Count("Starting AutoQC."));
            EXPECT_EQ(cTargetPath, mProcessLauncher.Launched.front().Path);
            EXPECT_FALSE(_monitor->GetRunState().Running);
        }

        TEST_F(ProcessMonitorTest, PresentTargetAnnouncedOnce)
        {
            mProcessTable.Pids = {4242};
            auto _monitor{createMonitor(3U)};

            auto _result{_monitor->Run()};

            ASSERT_TRUE(_result.HasValue());
            EXPECT_EQ(3U, _monitor->GetTickCount());
            EXPECT_TRUE(mProcessLauncher.Launched.empty());
            EXPECT_EQ(1U, mMemorySink->Count("AutoQC is running."));
            EXPECT_TRUE(_monitor->GetRunState().Running);
            EXPECT_TRUE(_monitor->GetRunState().LastAnnounced);
            EXPECT_TRUE(mMemorySink->Contains("Termination requested. Stopping."));
        }

        TEST_F(ProcessMonitorTest, RelaunchStartsNewRunningInterval)
        {
            auto _monitor{createMonitor(100U)};

            mProcessTable.Pids = {4242};
            ASSERT_EQ(TickOutcome::kRunning, _monitor->Tick().Value());
            ASSERT_EQ(TickOutcome::kRunning, _monitor->Tick().Value());

            mProcessTable.Pids.clear();
            ASSERT_EQ(TickOutcome::kLaunched, _monitor->Tick().Value());
            EXPECT_FALSE(_monitor->GetRunState().LastAnnounced);

            mProcessTable.Pids = {4343};
            ASSERT_EQ(TickOutcome::kRunning, _monitor->Tick().Value());
            ASSERT_EQ(TickOutcome::kRunning, _monitor->Tick().Value());

            EXPECT_EQ(2U, mMemorySink->Count("AutoQC is running."));
            EXPECT_EQ(1U, mProcessLauncher.Launched.size());
        }

        TEST_F(ProcessMonitorTest, QueriesByProcessName)
        {
            auto _monitor{createMonitor(1U)};
            ASSERT_TRUE(_monitor->Tick().HasValue());

            ASSERT_EQ(1U, mProcessTable.QueriedNames.size());
            EXPECT_EQ("AutoQC", mProcessTable.QueriedNames.front());
        }

        TEST_F(ProcessMonitorTest, LaunchFailureIsNotDistinguished)
        {
            mProcessLauncher.Fail = true;
            auto _monitor{createMonitor(3U)};

            auto _result{_monitor->Run()};

            ASSERT_TRUE(_result.HasValue());
            EXPECT_EQ(3U, mProcessLauncher.Launched.size());
            EXPECT_TRUE(mMemorySink->Contains("fork failed"));
        }

        TEST_F(ProcessMonitorTest, TargetDeletedBetweenTicks)
        {
            mProcessTable.Pids = {4242};
            auto _monitor{createMonitor(100U)};
            ASSERT_EQ(TickOutcome::kRunning, _monitor->Tick().Value());

            std::remove(cTargetPath.c_str());
            auto _result{_monitor->Run()};

            ASSERT_FALSE(_result.HasValue());
            EXPECT_TRUE(IsError(_result.Error(), ExecErrc::kTargetMissing));
            EXPECT_EQ(cTargetPath + " no longer exists. Stopping.", _result.Error().Message());
            EXPECT_EQ(1U, mProcessTable.QueriedNames.size());
            EXPECT_TRUE(mProcessLauncher.Launched.empty());
            EXPECT_EQ(0U, mWaitCount);
        }

        TEST_F(ProcessMonitorTest, ProcessQueryFailure)
        {
            mProcessTable.Fail = true;
            auto _monitor{createMonitor(100U)};

            auto _result{_monitor->Run()};

            ASSERT_FALSE(_result.HasValue());
            EXPECT_TRUE(
                IsError(_result.Error(), ExecErrc::kProcessQueryFailed));
            EXPECT_TRUE(mProcessLauncher.Launched.empty());
        }
    }
}
