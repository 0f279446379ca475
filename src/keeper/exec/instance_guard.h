/// @file src/keeper/exec/instance_guard.h
/// @brief Declarations for the single-instance guard.

#ifndef KEEPER_EXEC_INSTANCE_GUARD_H
#define KEEPER_EXEC_INSTANCE_GUARD_H

#include <string>
#include "../core/result.h"

namespace keeper
{
    namespace exec
    {
        /// @brief System-wide named lock that keeps a single owner per lock name
        /// @details The lock is an exclusive flock(2) on "{lockDirectory}/{LockName}.lock".
        ///          It is released when the guard is destroyed or explicitly released,
        ///          and by the kernel if the process dies. flock locks belong to the
        ///          open file description, so a second acquisition inside the same
        ///          process is rejected as well.
        class InstanceGuard final
        {
        private:
            int mFd;
            std::string mLockPath;

            InstanceGuard(int fd, std::string lockPath) noexcept;

        public:
            InstanceGuard() = delete;
            InstanceGuard(const InstanceGuard &) = delete;
            InstanceGuard &operator=(const InstanceGuard &) = delete;

            InstanceGuard(InstanceGuard &&other) noexcept;
            InstanceGuard &operator=(InstanceGuard &&other) noexcept;

            ~InstanceGuard() noexcept;

            /// @brief Try to take the instance lock without waiting
            /// @param lockName Name of the lock, '/' is replaced with '_'
            /// @param lockDirectory Directory that holds the lock file
            /// @returns Held guard, kAlreadyRunning if another holder exists,
            ///          or kSetupFailed if the lock file cannot be opened
            static core::Result<InstanceGuard> TryAcquire(
                const std::string &lockName,
                const std::string &lockDirectory);

            /// @brief Lock file path for a lock name
            static std::string GetLockPath(
                const std::string &lockName,
                const std::string &lockDirectory);

            /// @brief Release the lock; further calls have no effect
            void Release() noexcept;

            /// @brief Determine whether the guard still holds the lock
            bool IsHeld() const noexcept;

            /// @brief Path of the held lock file
            const std::string &GetLockPath() const noexcept;
        };
    }
}

#endif
