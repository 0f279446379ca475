/// @file src/keeper/exec/target_reference.h
/// @brief Resolved target value type shared by the launcher and the monitor.

#ifndef KEEPER_EXEC_TARGET_REFERENCE_H
#define KEEPER_EXEC_TARGET_REFERENCE_H

#include <string>

namespace keeper
{
    namespace exec
    {
        /// @brief How a resolved target is opened
        enum class TargetKind
        {
            kApplicationReference, ///< Indirect launch descriptor resolved by the desktop
            kExecutable            ///< Executable file of the target itself
        };

        /// @brief Target location produced once by the path resolver
        struct TargetReference
        {
            /// @brief Resolved absolute path, existing at resolution time
            std::string Path;
            /// @brief Kind of the resolved file
            TargetKind Kind{TargetKind::kExecutable};
            /// @brief Logical process name used to detect a running target
            std::string ProcessName;
        };
    }
}

#endif
