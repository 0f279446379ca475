/// @file src/keeper/sup/notifier.h
/// @brief Declarations for operator notification.

#ifndef KEEPER_SUP_NOTIFIER_H
#define KEEPER_SUP_NOTIFIER_H

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace keeper
{
    namespace sup
    {
        /// @brief Channel that brings a terminal failure to the operator's attention
        class Notifier
        {
        public:
            Notifier() noexcept = default;
            Notifier(const Notifier &) = delete;
            Notifier &operator=(const Notifier &) = delete;
            virtual ~Notifier() noexcept = default;

            /// @brief Notify the operator
            /// @param message Human-readable message
            /// @note The call may block until the operator acknowledges it.
            virtual void Notify(const std::string &message) = 0;
        };

        /// @brief Notifier that writes to a console stream
        class ConsoleNotifier : public Notifier
        {
        private:
            const std::string mTitle;
            std::ostream &mStream;

        public:
            /// @brief Constructor
            /// @param title Prefix of every notification
            /// @param stream Output stream, standard error by default
            explicit ConsoleNotifier(
                std::string title,
                std::ostream &stream = std::cerr);

            void Notify(const std::string &message) override;
        };

        /// @brief Notifier that shows a blocking modal error dialog
        /// @details zenity is preferred over kdialog. Without a graphical
        ///          session, or when neither tool can be run, the message goes
        ///          to the fallback notifier.
        class DialogNotifier : public Notifier
        {
        private:
            const std::string mTitle;
            std::unique_ptr<Notifier> mFallback;

            bool tryShowDialog(const std::string &message) const;

        public:
            /// @brief Constructor
            /// @param title Dialog window title
            /// @param fallback Notifier used when no dialog can be shown
            /// @throws std::invalid_argument Throws when the fallback is null
            DialogNotifier(std::string title, std::unique_ptr<Notifier> fallback);

            void Notify(const std::string &message) override;

            /// @brief Determine whether a graphical session is available
            static bool HasGraphicalSession();

            /// @brief Find an executable on PATH
            /// @param program Program name
            /// @param path Full path of the program if found
            /// @returns True if the program was found
            static bool TryFindProgram(const std::string &program, std::string &path);

            /// @brief Argument vector of an error dialog
            /// @param tool "zenity" or "kdialog"
            /// @param title Window title
            /// @param message Dialog text
            /// @returns Arguments including the tool name, empty for an unknown tool
            static std::vector<std::string> BuildDialogCommand(
                const std::string &tool,
                const std::string &title,
                const std::string &message);
        };

        /// @brief Available notifier kinds
        enum class NotifierKind
        {
            kConsole, ///< Standard error
            kDialog   ///< Modal dialog with console fallback
        };

        /// @brief Parse a notifier kind ("console" or "dialog")
        /// @param text Configuration text
        /// @param fallback Kind returned for an unknown text
        NotifierKind ParseNotifierKind(const std::string &text, NotifierKind fallback);

        /// @brief Notifier factory
        /// @param kind Notifier kind
        /// @param title Notification title
        std::unique_ptr<Notifier> CreateNotifier(NotifierKind kind, const std::string &title);
    }
}

#endif
