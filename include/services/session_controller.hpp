#ifndef APGUARD_SERVICES_SESSION_CONTROLLER_HPP
#define APGUARD_SERVICES_SESSION_CONTROLLER_HPP

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/session_request.hpp"
#include "services/session_store.hpp"
#include "services/auto_off_timer.hpp"

namespace apguard
{
    namespace core
    {
        class Logger;
    }

    namespace infrastructure
    {
        class HotspotConfigurator;
        class ProcessControl;
        class SessionLock;
    }

    namespace services
    {
        class InterfaceInventory;
        class SafetyValidator;
        class StatusPublisher;
        class SettingsStore;

        enum class Outcome
        {
            Success,
            NoOp,           // stop while Idle
            AlreadyRunning, // start while a session is live
            Blocked,        // blocking safety violation
            ConfigurationFailed,
            InvalidArgument
        };

        std::string to_string(Outcome outcome);
        int exit_code_for(Outcome outcome);

        /**
         * Publishes an invalid_argument status carrying the current persisted
         * phase. Session state itself is left untouched.
         */
        void publish_invalid_argument(const SessionStore &store, StatusPublisher &status,
                                      const infrastructure::ProcessControl &processes,
                                      const std::string &message);

        struct ControllerResult
        {
            Outcome outcome = Outcome::Success;
            std::string message;
            std::vector<std::string> warnings;

            int exit_code() const { return exit_code_for(outcome); }
        };

        /**
         * Hotspot lifecycle: Idle -> Validating -> Starting -> Active ->
         * Stopping -> Idle, with Error reachable from Validating and Starting.
         *
         * Every transition happens under the session lock and is persisted
         * before the next side effect, so a later invocation can always pick
         * up where a crashed one left off.
         */
        class SessionController
        {
        public:
            SessionController(const core::BackendConfig &config,
                              InterfaceInventory &inventory,
                              SafetyValidator &validator,
                              infrastructure::HotspotConfigurator &configurator,
                              SessionStore &store,
                              StatusPublisher &status,
                              infrastructure::ProcessControl &processes,
                              SettingsStore *settings = nullptr);
            ~SessionController();

            // Returns once the session is Active or has failed
            ControllerResult start(core::SessionRequest request);

            // Explicit stop from any invocation; idempotent
            ControllerResult stop();

            // Stop path for the session this process controls (signal received)
            ControllerResult stop_own_session(const std::string &reason);

            // Timer entry point; a no-op unless the same session is still Active
            void handle_deadline(const std::string &session_id);

            /**
             * Follows the preferred upstream while the session is Active: NAT is
             * moved to a new upstream in place. A VPN-routed session whose
             * tunnel is gone is stopped instead. Called periodically by the
             * supervising process.
             */
            void check_upstream();

            bool timer_armed() const { return timer_.armed(); }

            // True once the session this process started has returned to Idle
            bool session_finished() const { return finished_.load(); }
            bool owns_session() const { return !own_session_id_.empty(); }

            // Status record plus liveness and session details, read-only
            nlohmann::json status_report() const;

            // Records a rejected command without touching session state
            void publish_invalid_argument(const std::string &message);

        private:
            SessionState load_locked();
            void commit(SessionState &state, const std::string &message);
            void revert_leftovers(SessionState &state);
            ControllerResult stop_locked(SessionState &state, const std::string &reason);
            ControllerResult stop_foreign(pid_t pid, const std::string &identity);
            ControllerResult fail_start(SessionState &state, core::ErrorKind kind, const std::string &message,
                                        Outcome outcome);
            void arm_timer(const std::string &session_id, std::chrono::system_clock::time_point fire_at);

            std::unique_ptr<infrastructure::SessionLock> acquire_lock() const;

            core::BackendConfig config_;
            InterfaceInventory &inventory_;
            SafetyValidator &validator_;
            infrastructure::HotspotConfigurator &configurator_;
            SessionStore &store_;
            StatusPublisher &status_;
            infrastructure::ProcessControl &processes_;
            SettingsStore *settings_;
            std::shared_ptr<core::Logger> logger_;

            std::string own_session_id_;
            std::atomic<bool> finished_{false};
            AutoOffTimer timer_;
        };

    } // namespace services
} // namespace apguard

#endif // APGUARD_SERVICES_SESSION_CONTROLLER_HPP
