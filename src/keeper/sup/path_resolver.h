/// @file src/keeper/sup/path_resolver.h
/// @brief Declarations for target path resolution.

#ifndef KEEPER_SUP_PATH_RESOLVER_H
#define KEEPER_SUP_PATH_RESOLVER_H

#include <string>
#include <vector>
#include "../core/result.h"
#include "../exec/target_reference.h"
#include "../log/logging_framework.h"
#include "./supervisor_identity.h"

namespace keeper
{
    namespace sup
    {
        /// @brief Release channel of the target application
        enum class ReleaseChannel
        {
            kRelease, ///< Released build, "{Target}"
            kDaily    ///< Daily build, "{Target}-daily"
        };

        /// @brief Parse a channel keyword ("release" or "daily", case-insensitive)
        /// @param keyword Command line keyword
        /// @param channel Parsed channel
        /// @returns True if the keyword names a channel
        bool TryParseChannel(const std::string &keyword, ReleaseChannel &channel);

        /// @brief Name of the target for a channel, e.g. "AutoQC-daily"
        std::string GetChannelTargetName(
            const std::string &targetBaseName,
            ReleaseChannel channel);

        /// @brief What the command line asked the supervisor to run
        struct Invocation
        {
            enum class Kind
            {
                kDefault,     ///< No argument
                kChannel,     ///< Channel keyword
                kExplicitPath ///< Literal path of the target executable
            };

            Kind InvocationKind{Kind::kDefault};
            ReleaseChannel Channel{ReleaseChannel::kRelease};
            std::string ExplicitPath;

            /// @brief Determine whether the invocation came from a command line argument
            bool HasArgument() const noexcept
            {
                return InvocationKind != Kind::kDefault;
            }
        };

        /// @brief Naming of the supervised target
        struct TargetNaming
        {
            /// @brief Release-channel target name, e.g. "AutoQC"
            std::string TargetBaseName{"AutoQC"};
            /// @brief Application reference file extension
            std::string ReferenceExtension{".appref-ms"};
            /// @brief Executable file extension, possibly empty
            std::string ExecutableExtension{".exe"};
            /// @brief Channel used when no argument is given
            ReleaseChannel DefaultChannel{ReleaseChannel::kRelease};
        };

        /// @brief Directories the resolver searches
        struct ResolverEnvironment
        {
            /// @brief Desktop application shortcuts directory
            std::string ProgramsDirectory;
            /// @brief Directory of the supervisor executable
            std::string ExecutableDirectory;
        };

        /// @brief Resolves the target through an ordered fallback chain
        /// @details An explicit path is validated and used as is. Otherwise the
        ///          application reference is searched under the publisher's
        ///          shortcuts subdirectory, or, when that directory does not exist,
        ///          under a subdirectory named after the target. The last fallback
        ///          is an executable beside the supervisor.
        class PathResolver
        {
        private:
            const SupervisorIdentity mIdentity;
            const TargetNaming mNaming;
            const ResolverEnvironment mEnvironment;
            log::LoggingFramework &mLoggingFramework;
            const log::Logger &mLogger;

            void logMessage(const std::string &message);

            core::Result<exec::TargetReference> resolveExplicitPath(const std::string &path);

            bool tryFindApplicationReference(
                const std::string &targetName,
                std::string &referencePath);

            bool tryFindCoLocatedExecutable(
                const std::string &targetName,
                std::string &executablePath);

        public:
            /// @brief Constructor
            /// @param identity Supervisor identity, its publisher names the shortcuts subdirectory
            /// @param naming Target naming
            /// @param environment Searched directories
            /// @param loggingFramework Logging framework
            /// @param logger Logger context for resolver records
            PathResolver(
                SupervisorIdentity identity,
                TargetNaming naming,
                ResolverEnvironment environment,
                log::LoggingFramework &loggingFramework,
                const log::Logger &logger);

            /// @brief Executable names accepted for an explicit path
            /// @returns "{Target}{ExeExt}" and "{Target}-daily{ExeExt}"
            std::vector<std::string> GetAcceptedExecutableNames() const;

            /// @brief Resolve the target of an invocation
            /// @param invocation Parsed command line
            /// @returns Target reference, or kResolutionFailed
            core::Result<exec::TargetReference> Resolve(const Invocation &invocation);
        };
    }
}

#endif
