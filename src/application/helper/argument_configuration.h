/// @file src/application/helper/argument_configuration.h
/// @brief Declarations for argument configuration.
/// @details This file is part of the app_keeper supervisor.

#ifndef ARGUMENT_CONFIGURATION_H
#define ARGUMENT_CONFIGURATION_H

#include <string>
#include <vector>
#include "../../keeper/core/result.h"
#include "../../keeper/sup/path_resolver.h"

namespace application
{
    namespace helper
    {
        /// @brief A helper class to turn the arguments passed to the main application into an invocation
        class ArgumentConfiguration
        {
        public:
            /// @brief Command line usage text
            static const std::string cUsage;

            /// @brief Constructor
            /// @param argc Argument count
            /// @param argv Passed arguments
            ArgumentConfiguration(int argc, char *argv[]);
            ArgumentConfiguration() = delete;

            /// @brief Arguments property getter
            /// @return Passed arguments without the program name
            const std::vector<std::string> &GetArguments() const noexcept;

            /// @brief Invocation property getter
            /// @return Parsed invocation, or kInvalidArgument for an unusable command line
            const keeper::core::Result<keeper::sup::Invocation> &GetInvocation() const noexcept;

            /// @brief Parse a command line without the program name
            /// @param arguments Passed arguments
            /// @returns Default invocation for no argument, a channel for a channel
            ///          keyword, otherwise the trimmed argument as an explicit path
            static keeper::core::Result<keeper::sup::Invocation> Parse(
                const std::vector<std::string> &arguments);

        private:
            std::vector<std::string> mArguments;
            keeper::core::Result<keeper::sup::Invocation> mInvocation;
        };
    }
}

#endif
