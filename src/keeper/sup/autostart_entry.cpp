#include <cerrno>
#include <cstring>
#include <unistd.h>
#include "./autostart_entry.h"
#include "../exec/helper/file_system.h"

namespace keeper
{
    namespace sup
    {
        AutostartEntry::AutostartEntry(
            const std::string &directory,
            const std::string &appName) : mPath{exec::helper::JoinPath(directory, appName + ".desktop")}
        {
        }

        const std::string &AutostartEntry::GetPath() const noexcept
        {
            return mPath;
        }

        bool AutostartEntry::Exists() const
        {
            return exec::helper::FileExists(mPath);
        }

        bool AutostartEntry::Remove(
            log::LoggingFramework &loggingFramework,
            const log::Logger &logger) const
        {
            if (!Exists())
            {
                return true;
            }

            loggingFramework.Log(logger, log::LogLevel::kInfo, "Deleting shortcut " + mPath);
            if (::unlink(mPath.c_str()) != 0 && errno != ENOENT)
            {
                const std::string cReason{std::strerror(errno)};
                loggingFramework.Log(
                    logger,
                    log::LogLevel::kWarn,
                    "Unable to delete " + mPath + ": " + cReason);
                return false;
            }

            return true;
        }
    }
}
