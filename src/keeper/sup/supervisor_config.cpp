/// @file src/keeper/sup/supervisor_config.cpp
/// @brief Implementation for the supervisor startup configuration.

#include <cstdlib>
#include <stdexcept>
#include "./supervisor_config.h"
#include "../exec/helper/file_system.h"

namespace keeper
{
    namespace sup
    {
        namespace
        {
            std::string GetEnvOrDefault(const char *key, std::string fallback)
            {
                const char *value{std::getenv(key)};
                if (value != nullptr && value[0] != '\0')
                {
                    return value;
                }

                return fallback;
            }

            std::uint32_t GetEnvU32(
                const char *key,
                std::uint32_t fallback,
                std::uint32_t minValue,
                std::uint32_t maxValue)
            {
                const char *value{std::getenv(key)};
                if (value == nullptr)
                {
                    return fallback;
                }

                try
                {
                    const std::string cText{value};
                    std::size_t _consumed{0U};
                    const unsigned long long cParsed{std::stoull(cText, &_consumed)};
                    if (_consumed != cText.size() ||
                        cText.front() == '-' ||
                        cParsed < minValue ||
                        cParsed > maxValue)
                    {
                        return fallback;
                    }
                    return static_cast<std::uint32_t>(cParsed);
                }
                catch (const std::invalid_argument &)
                {
                    return fallback;
                }
                catch (const std::out_of_range &)
                {
                    return fallback;
                }
            }

            bool GetEnvBool(const char *key, bool fallback)
            {
                const char *value{std::getenv(key)};
                if (value == nullptr)
                {
                    return fallback;
                }

                const std::string text{exec::helper::ToLower(value)};
                if (text == "1" || text == "true" || text == "on" || text == "yes")
                {
                    return true;
                }
                if (text == "0" || text == "false" || text == "off" || text == "no")
                {
                    return false;
                }

                return fallback;
            }

            std::string GetHomeDirectory()
            {
                return GetEnvOrDefault("HOME", "/tmp");
            }

            // XDG base directory with the home-relative default
            std::string GetXdgDirectory(const char *key, const std::string &homeRelative)
            {
                return GetEnvOrDefault(
                    key,
                    exec::helper::JoinPath(GetHomeDirectory(), homeRelative));
            }
        }

        const std::uint32_t SupervisorConfig::cMinPollIntervalMs{1U};
        const std::uint32_t SupervisorConfig::cMaxPollIntervalMs{86400000U};

        SupervisorIdentity SupervisorConfig::GetIdentity() const
        {
            return SupervisorIdentity(Publisher, AppName);
        }

        SupervisorConfig SupervisorConfig::FromEnvironment()
        {
            SupervisorConfig _result;

            _result.Publisher = GetEnvOrDefault("KEEPER_PUBLISHER", _result.Publisher);
            _result.AppName = GetEnvOrDefault("KEEPER_APP_NAME", _result.AppName);

            _result.Naming.TargetBaseName =
                GetEnvOrDefault("KEEPER_TARGET_NAME", _result.Naming.TargetBaseName);
            _result.Naming.ReferenceExtension =
                GetEnvOrDefault(
                    "KEEPER_REFERENCE_EXTENSION",
                    _result.Naming.ReferenceExtension);

            // An empty executable extension is meaningful on Linux.
            const char *cExecutableExtension{std::getenv("KEEPER_EXECUTABLE_EXTENSION")};
            if (cExecutableExtension != nullptr)
            {
                _result.Naming.ExecutableExtension = cExecutableExtension;
            }

            ReleaseChannel _defaultChannel{ReleaseChannel::kRelease};
            if (TryParseChannel(
                    GetEnvOrDefault("KEEPER_DEFAULT_CHANNEL", "release"),
                    _defaultChannel))
            {
                _result.Naming.DefaultChannel = _defaultChannel;
            }

            _result.PollInterval = std::chrono::milliseconds(
                GetEnvU32(
                    "KEEPER_POLL_INTERVAL_MS",
                    static_cast<std::uint32_t>(_result.PollInterval.count()),
                    cMinPollIntervalMs,
                    cMaxPollIntervalMs));

            _result.ProgramsDirectory =
                GetEnvOrDefault(
                    "KEEPER_PROGRAMS_DIR",
                    exec::helper::JoinPath(
                        GetXdgDirectory("XDG_DATA_HOME", ".local/share"),
                        "applications"));
            _result.AutostartDirectory =
                GetEnvOrDefault(
                    "KEEPER_AUTOSTART_DIR",
                    exec::helper::JoinPath(
                        GetXdgDirectory("XDG_CONFIG_HOME", ".config"),
                        "autostart"));
            _result.LockDirectory =
                GetEnvOrDefault(
                    "KEEPER_LOCK_DIR",
                    GetEnvOrDefault("XDG_RUNTIME_DIR", _result.LockDirectory));

            const char *cOpenCommand{std::getenv("KEEPER_OPEN_COMMAND")};
            if (cOpenCommand != nullptr)
            {
                _result.OpenCommand = cOpenCommand;
            }

            _result.Notification =
                ParseNotifierKind(
                    GetEnvOrDefault("KEEPER_NOTIFIER", "dialog"),
                    _result.Notification);
            _result.CleanupAutostart =
                GetEnvBool("KEEPER_CLEANUP_AUTOSTART", _result.CleanupAutostart);

            _result.LogDirectory = GetEnvOrDefault("KEEPER_LOG_DIRECTORY", "");
            _result.LogToConsole = GetEnvBool("KEEPER_LOG_CONSOLE", _result.LogToConsole);
            _result.MinimumLogLevel =
                log::ParseLogLevel(
                    GetEnvOrDefault("KEEPER_LOG_LEVEL", "info"),
                    _result.MinimumLogLevel);

            return _result;
        }
    }
}
