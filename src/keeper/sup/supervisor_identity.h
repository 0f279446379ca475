/// @file src/keeper/sup/supervisor_identity.h
/// @brief Supervisor identity value type.

#ifndef KEEPER_SUP_SUPERVISOR_IDENTITY_H
#define KEEPER_SUP_SUPERVISOR_IDENTITY_H

#include <stdexcept>
#include <utility>
#include <string>

namespace keeper
{
    namespace sup
    {
        /// @brief (publisher, application name) pair that scopes the instance lock and the log file
        class SupervisorIdentity final
        {
        private:
            std::string mPublisher;
            std::string mAppName;

        public:
            /// @brief Constructor
            /// @param publisher Publisher name
            /// @param appName Supervisor application name
            /// @throws std::invalid_argument Throws when either name is empty
            SupervisorIdentity(std::string publisher, std::string appName)
                : mPublisher{std::move(publisher)},
                  mAppName{std::move(appName)}
            {
                if (mPublisher.empty() || mAppName.empty())
                {
                    throw std::invalid_argument(
                        "Supervisor identity requires a publisher and an application name.");
                }
            }

            const std::string &GetPublisher() const noexcept
            {
                return mPublisher;
            }

            const std::string &GetAppName() const noexcept
            {
                return mAppName;
            }

            /// @brief Name of the system-wide instance lock
            /// @returns "{publisher} {appName}"
            std::string LockName() const
            {
                return mPublisher + " " + mAppName;
            }

            /// @brief File name of the supervisor log
            /// @returns "{appName}.log"
            std::string LogFileName() const
            {
                return mAppName + ".log";
            }
        };
    }
}

#endif
