#include "./signal_handler.h"
#include <algorithm>
#include <csignal>

namespace keeper
{
    namespace exec
    {
        std::atomic<bool> SignalHandler::mTerminationRequested{false};
        std::mutex SignalHandler::mMutex;
        std::condition_variable SignalHandler::mCondVar;

        void SignalHandler::handleSignal(int signal)
        {
            (void)signal;
            mTerminationRequested.store(true);
            mCondVar.notify_all();
        }

        void SignalHandler::Register()
        {
            std::signal(SIGTERM, &SignalHandler::handleSignal);
            std::signal(SIGINT, &SignalHandler::handleSignal);
        }

        void SignalHandler::WaitForTermination()
        {
            const std::chrono::milliseconds cSliceMs{200};
            std::unique_lock<std::mutex> lock(mMutex);
            while (!mTerminationRequested.load())
            {
                mCondVar.wait_for(lock, cSliceMs);
            }
        }

        bool SignalHandler::WaitForTerminationFor(std::chrono::milliseconds timeout)
        {
            // A notification raised from the handler can slip in between the
            // predicate check and the wait, so wake up periodically as well.
            const std::chrono::milliseconds cSliceMs{200};
            const auto cDeadline{std::chrono::steady_clock::now() + timeout};

            std::unique_lock<std::mutex> lock(mMutex);
            while (!mTerminationRequested.load())
            {
                const auto cNow{std::chrono::steady_clock::now()};
                if (cNow >= cDeadline)
                {
                    return false;
                }

                const auto cRemaining{
                    std::chrono::duration_cast<std::chrono::milliseconds>(cDeadline - cNow)};
                mCondVar.wait_for(lock, std::min(cRemaining, cSliceMs));
            }

            return true;
        }

        bool SignalHandler::IsTerminationRequested() noexcept
        {
            return mTerminationRequested.load();
        }

        void SignalHandler::RequestTermination() noexcept
        {
            mTerminationRequested.store(true);
            mCondVar.notify_all();
        }

        void SignalHandler::Reset() noexcept
        {
            mTerminationRequested.store(false);
        }
    }
}
