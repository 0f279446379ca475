#include "./error_reporter.h"

namespace keeper
{
    namespace sup
    {
        ErrorReporter::ErrorReporter(
            log::LoggingFramework &loggingFramework,
            const log::Logger &logger,
            Notifier &notifier) noexcept : mLoggingFramework{loggingFramework},
                                           mLogger{logger},
                                           mNotifier{notifier}
        {
        }

        void ErrorReporter::Report(const std::string &message)
        {
            mLoggingFramework.Log(mLogger, log::LogLevel::kError, message);
            mNotifier.Notify(message);
        }

        void ErrorReporter::Report(const std::string &message, const std::string &detail)
        {
            mLoggingFramework.Log(mLogger, log::LogLevel::kError, message);
            if (!detail.empty())
            {
                mLoggingFramework.Log(mLogger, log::LogLevel::kError, detail);
            }
            mNotifier.Notify(message);
        }

        void ErrorReporter::Report(const core::ErrorCode &errorCode)
        {
            Report(errorCode.Message());
        }
    }
}
