#include "services/settings_store.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "core/logger.hpp"

#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

namespace apguard
{
    namespace services
    {

        namespace
        {
            constexpr mode_t SETTINGS_FILE_MODE = 0600;
            constexpr mode_t SETTINGS_DIR_MODE = 0700;

            std::optional<unsigned long> env_number(const char *name)
            {
                const char *value = std::getenv(name);
                if (!value || !*value)
                    return std::nullopt;
                char *end = nullptr;
                errno = 0;
                unsigned long number = std::strtoul(value, &end, 10);
                if (errno != 0 || *end != '\0')
                    return std::nullopt;
                return number;
            }
        } // namespace

        SettingsOwner detect_settings_owner()
        {
            SettingsOwner owner;

            auto sudo_uid = env_number("SUDO_UID");
            auto sudo_gid = env_number("SUDO_GID");
            if (sudo_uid)
            {
                owner.uid = static_cast<uid_t>(*sudo_uid);
                if (sudo_gid)
                    owner.gid = static_cast<gid_t>(*sudo_gid);

                struct passwd pwd;
                struct passwd *result = nullptr;
                char buffer[4096];
                if (getpwuid_r(owner.uid.value(), &pwd, buffer, sizeof(buffer), &result) == 0 && result)
                {
                    owner.home = result->pw_dir;
                    if (!owner.gid)
                        owner.gid = result->pw_gid;
                }
                return owner;
            }

            const char *home = std::getenv("HOME");
            owner.home = home ? home : "";
            return owner;
        }

        std::string default_settings_path(const SettingsOwner &owner)
        {
            // sudo does not carry the invoking user's XDG_CONFIG_HOME reliably
            const char *xdg = std::getenv("XDG_CONFIG_HOME");
            if (!owner.uid && xdg && *xdg)
            {
                return std::string(xdg) + "/apguard/settings.json";
            }
            const std::string home = owner.home.empty() ? "/root" : owner.home;
            return home + "/.config/apguard/settings.json";
        }

        SettingsStore::SettingsStore(std::string path, SettingsOwner owner)
            : path_(std::move(path)), owner_(std::move(owner)), logger_(core::get_logger("SettingsStore"))
        {
        }

        std::optional<core::SessionRequest> SettingsStore::load() const
        {
            auto contents = core::files::read_file(path_);
            if (!contents)
            {
                return std::nullopt;
            }
            try
            {
                return core::SessionRequest::from_json(nlohmann::json::parse(*contents));
            }
            catch (const std::exception &e)
            {
                logger_->warning("Ignoring unreadable settings file",
                                 core::LogContext().add("path", path_).add("error", e.what()));
                return std::nullopt;
            }
        }

        void SettingsStore::save(const core::SessionRequest &request) const
        {
            const std::filesystem::path dir = std::filesystem::path(path_).parent_path();
            const bool created = !dir.empty() && !std::filesystem::exists(dir);

            core::files::ensure_parent_directory(path_, SETTINGS_DIR_MODE);
            core::files::write_file_atomically(path_, request.to_json(true).dump(2) + "\n", SETTINGS_FILE_MODE);

            if (created)
            {
                hand_over(dir.string());
            }
            hand_over(path_);

            logger_->info("Settings saved", core::LogContext().add("path", path_));
        }

        void SettingsStore::hand_over(const std::string &path) const
        {
            if (!owner_.uid)
            {
                return;
            }
            const gid_t gid = owner_.gid.value_or(static_cast<gid_t>(-1));
            if (::chown(path.c_str(), *owner_.uid, gid) != 0)
            {
                throw core::ConfigurationError("Cannot hand " + path + " to its owner: " + std::strerror(errno));
            }
        }

    } // namespace services
} // namespace apguard
