#ifndef APGUARD_SERVICES_SETTINGS_STORE_HPP
#define APGUARD_SERVICES_SETTINGS_STORE_HPP

#include <string>
#include <optional>
#include <memory>
#include <sys/types.h>

#include "core/session_request.hpp"

namespace apguard
{
    namespace core
    {
        class Logger;
    }

    namespace services
    {

        /**
         * User the settings file belongs to. Under sudo this is the invoking
         * user, not root.
         */
        struct SettingsOwner
        {
            std::optional<uid_t> uid;
            std::optional<gid_t> gid;
            std::string home;
        };

        SettingsOwner detect_settings_owner();

        // $XDG_CONFIG_HOME/apguard/settings.json, or ~/.config/apguard/settings.json
        std::string default_settings_path(const SettingsOwner &owner);

        /**
         * Last-used SessionRequest, passphrase included, readable by its owner only
         */
        class SettingsStore
        {
        public:
            SettingsStore(std::string path, SettingsOwner owner);

            // nullopt when missing or unreadable
            std::optional<core::SessionRequest> load() const;

            // Throws ConfigurationError
            void save(const core::SessionRequest &request) const;

            const std::string &path() const { return path_; }

        private:
            void hand_over(const std::string &path) const;

            std::string path_;
            SettingsOwner owner_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace apguard

#endif // APGUARD_SERVICES_SETTINGS_STORE_HPP
