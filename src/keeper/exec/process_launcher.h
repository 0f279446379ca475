/// @file src/keeper/exec/process_launcher.h
/// @brief Declarations for detached target launching.

#ifndef KEEPER_EXEC_PROCESS_LAUNCHER_H
#define KEEPER_EXEC_PROCESS_LAUNCHER_H

#include <string>
#include <vector>
#include "../core/result.h"
#include "./target_reference.h"

namespace keeper
{
    namespace exec
    {
        /// @brief Starts a target without waiting for it
        class ProcessLauncher
        {
        public:
            virtual ~ProcessLauncher() noexcept = default;

            /// @brief Launch the target detached from the caller
            /// @param target Resolved target
            /// @returns Void result once the launch has been issued, or kLaunchFailed
            /// @note Success does not mean the target started; its own startup
            ///       failures are not observed.
            virtual core::Result<void> Launch(const TargetReference &target) = 0;
        };

        /// @brief Launcher that hands the target to the desktop open command
        /// @details The command (e.g. "xdg-open") receives the target path as its
        ///          last argument, so application reference files resolve the same
        ///          way a double click would. With an empty command the target path
        ///          is executed directly. The child runs in its own session with
        ///          its standard streams on /dev/null and is reparented to init.
        class ShellOpenLauncher final : public ProcessLauncher
        {
        private:
            std::vector<std::string> mOpenCommand;

        public:
            /// @brief Constructor
            /// @param openCommand Whitespace-separated open command, possibly empty
            explicit ShellOpenLauncher(const std::string &openCommand);

            core::Result<void> Launch(const TargetReference &target) override;

            /// @brief Build the argv used to open a target
            /// @param openCommand Split open command
            /// @param target Target to be opened
            /// @returns Command line, open command first and target path last
            static std::vector<std::string> BuildCommandLine(
                const std::vector<std::string> &openCommand,
                const TargetReference &target);

            /// @brief Split a command string on whitespace
            static std::vector<std::string> SplitCommand(const std::string &command);
        };
    }
}

#endif
