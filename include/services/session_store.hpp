#ifndef APGUARD_SERVICES_SESSION_STORE_HPP
#define APGUARD_SERVICES_SESSION_STORE_HPP

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>
#include <sys/types.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/session_request.hpp"
#include "infrastructure/hotspot_configurator.hpp"

namespace apguard
{
    namespace core
    {
        class Logger;
    }

    namespace services
    {

        struct LastError
        {
            core::ErrorKind kind;
            std::string message;
        };

        /**
         * Session record shared by every backend invocation. Never holds the
         * passphrase.
         */
        struct SessionState
        {
            core::Phase phase = core::Phase::Idle;
            std::string session_id;
            pid_t pid = 0;
            std::string pid_identity; // start time of `pid`, guards against pid reuse
            std::optional<core::SessionRequest> request;
            std::string hotspot_interface;
            std::string upstream_interface;
            std::optional<std::int64_t> deadline; // epoch seconds
            infrastructure::ActionLog actions;
            std::optional<LastError> last_error;
            std::vector<std::string> warnings;
            std::int64_t updated_at = 0;

            // Phases in which a live controlling process is expected
            bool expects_controller() const;

            nlohmann::json to_json() const;
            static SessionState from_json(const nlohmann::json &j);
        };

        std::string generate_session_id();
        std::int64_t epoch_seconds();

        /**
         * Atomic load/save of SessionState. Callers hold the session lock.
         *
         * The record lives in a directory private to `owner`. A record that
         * `owner` did not write is never trusted.
         */
        class SessionStore
        {
        public:
            explicit SessionStore(std::string path, uid_t owner = geteuid());

            // Missing file: Idle. Unreadable or foreign-owned file: Error with an empty action log.
            SessionState load() const;

            // Stamps updated_at; throws ConfigurationError if the file cannot be written
            void save(SessionState &state) const;

            const std::string &path() const { return path_; }

        private:
            SessionState unusable(const std::string &reason) const;

            std::string path_;
            uid_t owner_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace apguard

#endif // APGUARD_SERVICES_SESSION_STORE_HPP
