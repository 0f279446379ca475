/// @file src/keeper/exec/instance_guard.cpp
/// @brief Implementation for the single-instance guard.

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include "./instance_guard.h"
#include "./helper/file_system.h"
#include "./exec_error_domain.h"

namespace keeper
{
    namespace exec
    {
        InstanceGuard::InstanceGuard(int fd, std::string lockPath) noexcept
            : mFd{fd}, mLockPath{std::move(lockPath)}
        {
        }

        InstanceGuard::InstanceGuard(InstanceGuard &&other) noexcept
            : mFd{other.mFd}, mLockPath{std::move(other.mLockPath)}
        {
            other.mFd = -1;
        }

        InstanceGuard &InstanceGuard::operator=(InstanceGuard &&other) noexcept
        {
            if (this != &other)
            {
                Release();
                mFd = other.mFd;
                mLockPath = std::move(other.mLockPath);
                other.mFd = -1;
            }

            return *this;
        }

        InstanceGuard::~InstanceGuard() noexcept
        {
            Release();
        }

        std::string InstanceGuard::GetLockPath(
            const std::string &lockName,
            const std::string &lockDirectory)
        {
            std::string _fileName{lockName};
            for (char &c : _fileName)
            {
                if (c == '/')
                {
                    c = '_';
                }
            }
            _fileName += ".lock";

            return helper::JoinPath(lockDirectory, _fileName);
        }

        core::Result<InstanceGuard> InstanceGuard::TryAcquire(
            const std::string &lockName,
            const std::string &lockDirectory)
        {
            const std::string cLockPath{GetLockPath(lockName, lockDirectory)};

            const int cFd{::open(cLockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)};
            if (cFd < 0)
            {
                return core::Result<InstanceGuard>::FromError(
                    MakeErrorCode(
                        ExecErrc::kSetupFailed,
                        "Cannot open instance lock " + cLockPath + ": " +
                            std::strerror(errno)));
            }

            if (::flock(cFd, LOCK_EX | LOCK_NB) != 0)
            {
                const int cError{errno};
                (void)::close(cFd);

                if (cError == EWOULDBLOCK)
                {
                    return core::Result<InstanceGuard>::FromError(
                        MakeErrorCode(
                            ExecErrc::kAlreadyRunning,
                            "Instance lock " + cLockPath + " is held by another process."));
                }

                return core::Result<InstanceGuard>::FromError(
                    MakeErrorCode(
                        ExecErrc::kSetupFailed,
                        "Cannot lock " + cLockPath + ": " + std::strerror(cError)));
            }

            // Holder pid is informational only; the flock is the lock.
            if (::ftruncate(cFd, 0) == 0)
            {
                const std::string cPid{std::to_string(::getpid()) + "\n"};
                const ssize_t cWritten{::write(cFd, cPid.data(), cPid.size())};
                (void)cWritten;
            }

            InstanceGuard _guard{cFd, cLockPath};
            return core::Result<InstanceGuard>::FromValue(std::move(_guard));
        }

        void InstanceGuard::Release() noexcept
        {
            if (mFd < 0)
            {
                return;
            }

            (void)::flock(mFd, LOCK_UN);
            (void)::close(mFd);
            mFd = -1;
        }

        bool InstanceGuard::IsHeld() const noexcept
        {
            return mFd >= 0;
        }

        const std::string &InstanceGuard::GetLockPath() const noexcept
        {
            return mLockPath;
        }
    }
}
