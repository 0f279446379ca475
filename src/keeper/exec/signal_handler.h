/// @file src/keeper/exec/signal_handler.h
/// @brief Declarations for the shutdown signal handler.

#ifndef KEEPER_EXEC_SIGNAL_HANDLER_H
#define KEEPER_EXEC_SIGNAL_HANDLER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace keeper
{
    /// @brief Operating system facing execution primitives
    namespace exec
    {
        /// @brief Turns SIGTERM and SIGINT into a shutdown request for the monitor loop.
        class SignalHandler
        {
        private:
            static std::atomic<bool> mTerminationRequested;
            static std::mutex mMutex;
            static std::condition_variable mCondVar;

            static void handleSignal(int signal);

        public:
            /// @brief Install the SIGTERM and SIGINT handlers, once at startup
            static void Register();

            /// @brief Block until shutdown is requested
            static void WaitForTermination();

            /// @brief Sleep through one poll interval unless shutdown is requested first
            /// @param timeout Poll interval
            /// @returns True if shutdown was requested; false once the interval elapsed
            static bool WaitForTerminationFor(std::chrono::milliseconds timeout);

            static bool IsTerminationRequested() noexcept;

            /// @brief Request shutdown without a signal
            static void RequestTermination() noexcept;

            /// @brief Clear a pending shutdown request
            static void Reset() noexcept;
        };
    }
}

#endif
