/// @file src/keeper/sup/path_resolver.cpp
/// @brief Implementation for target path resolution.

#include "./path_resolver.h"
#include "./supervisor_error_domain.h"
#include "../exec/helper/file_system.h"

namespace keeper
{
    namespace sup
    {
        namespace helper = keeper::exec::helper;

        bool TryParseChannel(const std::string &keyword, ReleaseChannel &channel)
        {
            const std::string cLowered{helper::ToLower(keyword)};
            if (cLowered == "release")
            {
                channel = ReleaseChannel::kRelease;
                return true;
            }
            if (cLowered == "daily")
            {
                channel = ReleaseChannel::kDaily;
                return true;
            }

            return false;
        }

        std::string GetChannelTargetName(
            const std::string &targetBaseName,
            ReleaseChannel channel)
        {
            return channel == ReleaseChannel::kDaily
                       ? targetBaseName + "-daily"
                       : targetBaseName;
        }

        PathResolver::PathResolver(
            SupervisorIdentity identity,
            TargetNaming naming,
            ResolverEnvironment environment,
            log::LoggingFramework &loggingFramework,
            const log::Logger &logger) : mIdentity{std::move(identity)},
                                         mNaming{std::move(naming)},
                                         mEnvironment{std::move(environment)},
                                         mLoggingFramework{loggingFramework},
                                         mLogger{logger}
        {
        }

        void PathResolver::logMessage(const std::string &message)
        {
            mLoggingFramework.Log(mLogger, log::LogLevel::kInfo, message);
        }

        std::vector<std::string> PathResolver::GetAcceptedExecutableNames() const
        {
            std::vector<std::string> _result;
            _result.push_back(
                GetChannelTargetName(mNaming.TargetBaseName, ReleaseChannel::kRelease) +
                mNaming.ExecutableExtension);
            _result.push_back(
                GetChannelTargetName(mNaming.TargetBaseName, ReleaseChannel::kDaily) +
                mNaming.ExecutableExtension);

            return _result;
        }

        core::Result<exec::TargetReference> PathResolver::resolveExplicitPath(
            const std::string &path)
        {
            if (!helper::FileExists(path))
            {
                return core::Result<exec::TargetReference>::FromError(
                    MakeErrorCode(
                        SupervisorErrc::kResolutionFailed,
                        "Given path to " + mNaming.TargetBaseName +
                            " executable does not exist: " + path));
            }

            const std::string cFileName{helper::BaseName(path)};
            const std::vector<std::string> cAcceptedNames{GetAcceptedExecutableNames()};
            bool _accepted{false};
            for (const auto &acceptedName : cAcceptedNames)
            {
                if (cFileName == acceptedName)
                {
                    _accepted = true;
                    break;
                }
            }

            if (!_accepted)
            {
                return core::Result<exec::TargetReference>::FromError(
                    MakeErrorCode(
                        SupervisorErrc::kResolutionFailed,
                        "Given path is not to a " + cAcceptedNames.at(0) + " or " +
                            cAcceptedNames.at(1) + ": " + path));
            }

            exec::TargetReference _reference;
            _reference.Path = path;
            _reference.Kind = exec::TargetKind::kExecutable;
            _reference.ProcessName = helper::FileStem(path);
            return core::Result<exec::TargetReference>::FromValue(std::move(_reference));
        }

        bool PathResolver::tryFindApplicationReference(
            const std::string &targetName,
            std::string &referencePath)
        {
            const std::string cReferenceName{targetName + mNaming.ReferenceExtension};
            std::string _referenceDir{
                helper::JoinPath(mEnvironment.ProgramsDirectory, mIdentity.GetPublisher())};

            logMessage(
                "Looking for application reference " + cReferenceName +
                " in " + _referenceDir + ".");
            if (!helper::DirectoryExists(_referenceDir))
            {
                _referenceDir = helper::JoinPath(mEnvironment.ProgramsDirectory, targetName);
                logMessage(
                    "Looking for application reference " + cReferenceName +
                    " in " + _referenceDir + ".");
            }

            if (!helper::DirectoryExists(_referenceDir))
            {
                logMessage(
                    "Could not find location of application reference " +
                    cReferenceName + ".");
                return false;
            }

            const std::string cCandidate{helper::JoinPath(_referenceDir, cReferenceName)};
            if (helper::FileExists(cCandidate))
            {
                referencePath = cCandidate;
                return true;
            }

            logMessage(
                "Application reference " + cReferenceName +
                " does not exist in " + _referenceDir + ".");
            return false;
        }

        bool PathResolver::tryFindCoLocatedExecutable(
            const std::string &targetName,
            std::string &executablePath)
        {
            if (mEnvironment.ExecutableDirectory.empty())
            {
                return false;
            }

            const std::string cExecutableName{targetName + mNaming.ExecutableExtension};
            logMessage(
                "Looking for " + cExecutableName + " in " +
                mEnvironment.ExecutableDirectory + ".");

            const std::string cCandidate{
                helper::JoinPath(mEnvironment.ExecutableDirectory, cExecutableName)};
            if (!helper::FileExists(cCandidate))
            {
                return false;
            }

            executablePath = cCandidate;
            return true;
        }

        core::Result<exec::TargetReference> PathResolver::Resolve(const Invocation &invocation)
        {
            if (invocation.InvocationKind == Invocation::Kind::kExplicitPath)
            {
                return resolveExplicitPath(invocation.ExplicitPath);
            }

            const ReleaseChannel cChannel{
                invocation.InvocationKind == Invocation::Kind::kChannel
                    ? invocation.Channel
                    : mNaming.DefaultChannel};
            const std::string cTargetName{
                GetChannelTargetName(mNaming.TargetBaseName, cChannel)};

            exec::TargetReference _reference;
            _reference.ProcessName = cTargetName;

            if (tryFindApplicationReference(cTargetName, _reference.Path))
            {
                _reference.Kind = exec::TargetKind::kApplicationReference;
                return core::Result<exec::TargetReference>::FromValue(std::move(_reference));
            }

            // An unplugged install has no application reference.
            if (tryFindCoLocatedExecutable(cTargetName, _reference.Path))
            {
                _reference.Kind = exec::TargetKind::kExecutable;
                return core::Result<exec::TargetReference>::FromValue(std::move(_reference));
            }

            return core::Result<exec::TargetReference>::FromError(
                MakeErrorCode(
                    SupervisorErrc::kResolutionFailed,
                    "Cannot find path to " + cTargetName + mNaming.ReferenceExtension +
                        " or " + cTargetName + mNaming.ExecutableExtension +
                        ". Stopping."));
        }
    }
}
