#include "services/session_controller.hpp"
#include "services/interface_inventory.hpp"
#include "services/safety_validator.hpp"
#include "services/status_publisher.hpp"
#include "services/settings_store.hpp"
#include "infrastructure/hotspot_configurator.hpp"
#include "infrastructure/process_control.hpp"
#include "infrastructure/session_lock.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <thread>

namespace apguard
{
    namespace services
    {

        namespace
        {
            constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);
            constexpr auto KILL_GRACE = std::chrono::seconds(2);

            // Alive, and not a later process that reused the recorded pid
            bool controller_alive(const infrastructure::ProcessControl &processes, pid_t pid, const std::string &identity)
            {
                if (pid <= 0 || !processes.is_alive(pid))
                    return false;
                return identity.empty() || processes.identity(pid) == identity;
            }

            bool controller_alive(const infrastructure::ProcessControl &processes, const SessionState &state)
            {
                return controller_alive(processes, state.pid, state.pid_identity);
            }

            std::string active_message(const SessionState &state)
            {
                std::string message = "Hotspot '" + (state.request ? state.request->ssid : std::string()) +
                                      "' active on " + state.hotspot_interface;
                if (!state.upstream_interface.empty())
                {
                    message += " via " + state.upstream_interface;
                }
                return message;
            }
        } // namespace

        std::string to_string(Outcome outcome)
        {
            switch (outcome)
            {
            case Outcome::Success:
                return "success";
            case Outcome::NoOp:
                return "no_op";
            case Outcome::AlreadyRunning:
                return "already_running";
            case Outcome::Blocked:
                return "blocked";
            case Outcome::ConfigurationFailed:
                return "configuration_failed";
            case Outcome::InvalidArgument:
                return "invalid_argument";
            }
            return "unknown";
        }

        int exit_code_for(Outcome outcome)
        {
            switch (outcome)
            {
            case Outcome::Success:
            case Outcome::NoOp:
            case Outcome::AlreadyRunning:
                return core::EXIT_OK;
            case Outcome::Blocked:
                return core::EXIT_BLOCKED;
            case Outcome::ConfigurationFailed:
                return core::EXIT_CONFIGURATION;
            case Outcome::InvalidArgument:
                return core::EXIT_INVALID_ARGUMENT;
            }
            return core::EXIT_CONFIGURATION;
        }

        SessionController::SessionController(const core::BackendConfig &config,
                                             InterfaceInventory &inventory,
                                             SafetyValidator &validator,
                                             infrastructure::HotspotConfigurator &configurator,
                                             SessionStore &store,
                                             StatusPublisher &status,
                                             infrastructure::ProcessControl &processes,
                                             SettingsStore *settings)
            : config_(config),
              inventory_(inventory),
              validator_(validator),
              configurator_(configurator),
              store_(store),
              status_(status),
              processes_(processes),
              settings_(settings),
              logger_(core::get_logger("SessionController"))
        {
        }

        SessionController::~SessionController()
        {
            timer_.cancel();
        }

        std::unique_ptr<infrastructure::SessionLock> SessionController::acquire_lock() const
        {
            return std::make_unique<infrastructure::SessionLock>(config_.paths.lock_file, config_.timeouts.lock());
        }

        // Start

        ControllerResult SessionController::start(core::SessionRequest request)
        {
            timer_.cancel();

            try
            {
                request.validate();
            }
            catch (const core::InvalidArgumentError &e)
            {
                publish_invalid_argument(e.what());
                return {Outcome::InvalidArgument, e.what(), {}};
            }

            std::unique_ptr<infrastructure::SessionLock> lock;
            try
            {
                lock = acquire_lock();
            }
            catch (const core::ConfigurationError &e)
            {
                logger_->error("Cannot acquire session lock", core::LogContext().add("error", e.what()));
                return {Outcome::ConfigurationFailed, e.what(), {}};
            }

            SessionState state = load_locked();
            if (state.expects_controller())
            {
                const std::string message = "Hotspot is already running on " + state.hotspot_interface;
                logger_->info(message, core::LogContext().add("pid", state.pid).add("phase", core::to_string(state.phase)));
                return {Outcome::AlreadyRunning, message, {}};
            }

            if (state.phase == core::Phase::Error && !state.actions.empty())
            {
                revert_leftovers(state);
            }

            // New session
            SessionState next;
            next.phase = core::Phase::Validating;
            next.session_id = generate_session_id();
            next.pid = processes_.self_pid();
            next.pid_identity = processes_.identity(next.pid);
            next.request = request;
            own_session_id_ = next.session_id;
            finished_ = false;
            commit(next, "Validating hotspot configuration");

            logger_->info("Starting session",
                          core::LogContext()
                              .add("session", next.session_id)
                              .add("ssid", request.ssid)
                              .add_secret("password", request.passphrase.value_or(""))
                              .add("band", core::to_string(request.band)));

            auto inventory = inventory_.list_interfaces();
            auto validation = validator_.validate(request, inventory, OverrideFlags{request.force_single_interface});
            next.hotspot_interface = validation.interfaces.hotspot;
            next.upstream_interface = validation.interfaces.upstream;
            next.warnings = validation.warning_messages();
            for (const auto &warning : validation.warnings)
            {
                logger_->warning(warning.message, core::LogContext().add("check", warning.check));
            }

            if (!validation.ok())
            {
                const auto &first = validation.blocking.front();
                for (const auto &violation : validation.blocking)
                {
                    logger_->error(violation.message, core::LogContext().add("check", violation.check));
                }
                return fail_start(next, first.kind, "Blocked: " + validation.blocking_summary(), Outcome::Blocked);
            }

            try
            {
                configurator_.ensure_network_manager();
            }
            catch (const core::ConfigurationError &e)
            {
                return fail_start(next, core::ErrorKind::ConfigurationError, std::string("Blocked: ") + e.what(),
                                  Outcome::Blocked);
            }

            next.phase = core::Phase::Starting;
            status_.write_pid(next.pid);
            commit(next, "Starting hotspot on " + next.hotspot_interface);

            infrastructure::ConfigurationPlan plan{request, next.hotspot_interface, next.upstream_interface};
            try
            {
                // Each completed step is persisted before the next one runs
                configurator_.apply(plan, [&](const infrastructure::AppliedAction &action)
                                    {
                    next.actions.push_back(action);
                    store_.save(next); });
            }
            catch (const core::ConfigurationError &e)
            {
                logger_->error("Configuration failed, rolling back",
                               core::LogContext().add("error", e.what()).add("applied", next.actions.size()));
                auto report = configurator_.revert(next.actions);
                next.actions.clear();
                if (!report.clean())
                {
                    next.warnings.push_back("Rollback incomplete: " + report.summary());
                }
                status_.clear_pid();
                return fail_start(next, core::ErrorKind::ConfigurationError, e.what(), Outcome::ConfigurationFailed);
            }

            next.phase = core::Phase::Active;
            std::string message = active_message(next);
            std::optional<std::chrono::system_clock::time_point> fire_at;
            if (request.auto_off_minutes)
            {
                fire_at = std::chrono::system_clock::now() + config_.timeouts.auto_off_minute() * *request.auto_off_minutes;
                next.deadline = std::chrono::duration_cast<std::chrono::seconds>(fire_at->time_since_epoch()).count();
                message += " (auto-off in " + std::to_string(*request.auto_off_minutes) + " min)";
            }
            commit(next, message);
            if (fire_at)
            {
                arm_timer(next.session_id, *fire_at);
            }

            ControllerResult result{Outcome::Success, message, next.warnings};
            if (settings_)
            {
                try
                {
                    settings_->save(request);
                }
                catch (const core::ConfigurationError &e)
                {
                    logger_->warning("Could not save settings", core::LogContext().add("error", e.what()));
                    result.warnings.push_back(std::string("Settings not saved: ") + e.what());
                }
            }
            return result;
        }

        ControllerResult SessionController::fail_start(SessionState &state, core::ErrorKind kind,
                                                       const std::string &message, Outcome outcome)
        {
            state.phase = core::Phase::Error;
            state.last_error = LastError{kind, message};
            own_session_id_.clear();
            commit(state, message);
            return {outcome, message, state.warnings};
        }

        void SessionController::arm_timer(const std::string &session_id, std::chrono::system_clock::time_point fire_at)
        {
            timer_.arm(fire_at, session_id, [this](const std::string &id)
                       { handle_deadline(id); });
        }

        // Stop

        ControllerResult SessionController::stop()
        {
            timer_.cancel();

            std::unique_ptr<infrastructure::SessionLock> lock;
            try
            {
                lock = acquire_lock();
            }
            catch (const core::ConfigurationError &e)
            {
                logger_->error("Cannot acquire session lock", core::LogContext().add("error", e.what()));
                return {Outcome::ConfigurationFailed, e.what(), {}};
            }

            SessionState state = load_locked();
            switch (state.phase)
            {
            case core::Phase::Idle:
                if (status_.read_pid())
                {
                    status_.clear_pid();
                }
                logger_->info("Stop requested while idle");
                return {Outcome::NoOp, "Hotspot is not running", {}};

            case core::Phase::Error:
            {
                revert_leftovers(state);
                SessionState idle;
                idle.warnings = state.warnings;
                status_.clear_pid();
                commit(idle, "Hotspot stopped; previous error cleared");
                return {Outcome::Success, "Hotspot stopped; previous error cleared", idle.warnings};
            }

            default:
                break;
            }

            if (state.pid == processes_.self_pid())
            {
                return stop_locked(state, "Hotspot stopped");
            }

            // Another live process controls the session; let it stop itself
            const pid_t pid = state.pid;
            const std::string identity = state.pid_identity;
            lock.reset();
            return stop_foreign(pid, identity);
        }

        ControllerResult SessionController::stop_foreign(pid_t pid, const std::string &identity)
        {
            // Re-checked before every signal: the pid may be recycled while we wait
            auto still_running = [&]()
            { return controller_alive(processes_, pid, identity); };

            logger_->info("Asking controlling process to stop", core::LogContext().add("pid", pid));
            if (!still_running())
            {
                logger_->info("Controlling process already gone", core::LogContext().add("pid", pid));
            }
            else if (!processes_.terminate(pid) && still_running())
            {
                logger_->warning("Could not signal controlling process", core::LogContext().add("pid", pid));
            }

            const auto deadline = std::chrono::steady_clock::now() + config_.timeouts.stop_wait();
            while (still_running() && std::chrono::steady_clock::now() < deadline)
            {
                std::this_thread::sleep_for(POLL_INTERVAL);
            }

            bool killed = false;
            if (still_running())
            {
                logger_->warning("Controlling process did not stop in time, killing it", core::LogContext().add("pid", pid));
                if (!processes_.kill(pid))
                {
                    logger_->warning("SIGKILL not delivered", core::LogContext().add("pid", pid));
                }
                killed = true;
                const auto grace = std::chrono::steady_clock::now() + KILL_GRACE;
                while (still_running() && std::chrono::steady_clock::now() < grace)
                {
                    std::this_thread::sleep_for(POLL_INTERVAL);
                }
            }

            std::unique_ptr<infrastructure::SessionLock> lock;
            try
            {
                lock = acquire_lock();
            }
            catch (const core::ConfigurationError &e)
            {
                return {Outcome::ConfigurationFailed, e.what(), {}};
            }

            SessionState state = store_.load();
            if (state.phase == core::Phase::Idle)
            {
                return {Outcome::Success, "Hotspot stopped", {}};
            }
            if (state.pid != pid && state.expects_controller() && controller_alive(processes_, state))
            {
                return {Outcome::AlreadyRunning, "A new session was started meanwhile", {}};
            }

            // The controller ended without cleaning up; revert its log directly
            return stop_locked(state, killed ? "Hotspot stopped after terminating an unresponsive backend"
                                             : "Hotspot stopped; cleaned up after the backend process");
        }

        ControllerResult SessionController::stop_own_session(const std::string &reason)
        {
            timer_.cancel();

            std::unique_ptr<infrastructure::SessionLock> lock;
            try
            {
                lock = acquire_lock();
            }
            catch (const core::ConfigurationError &e)
            {
                logger_->error("Cannot acquire session lock", core::LogContext().add("error", e.what()));
                return {Outcome::ConfigurationFailed, e.what(), {}};
            }

            SessionState state = store_.load();
            if (own_session_id_.empty() || state.session_id != own_session_id_ ||
                state.phase == core::Phase::Idle || state.phase == core::Phase::Error)
            {
                finished_ = true;
                return {Outcome::NoOp, "Session already ended", {}};
            }
            return stop_locked(state, reason);
        }

        ControllerResult SessionController::stop_locked(SessionState &state, const std::string &reason)
        {
            timer_.cancel();

            state.phase = core::Phase::Stopping;
            commit(state, "Stopping hotspot");

            auto report = configurator_.revert(state.actions);

            SessionState idle;
            std::string message = reason;
            if (!report.clean())
            {
                idle.warnings.push_back(report.summary());
                message += " (cleanup incomplete: " + report.summary() + ")";
            }
            status_.clear_pid();
            commit(idle, message);
            logger_->info("Session stopped", core::LogContext().add("session", state.session_id).add("reason", reason));

            // Last touch of this object on the timer thread; the supervisor may tear down after it
            if (!own_session_id_.empty() && state.session_id == own_session_id_)
            {
                finished_ = true;
            }
            return {Outcome::Success, message, idle.warnings};
        }

        void SessionController::handle_deadline(const std::string &session_id)
        {
            try
            {
                auto lock = acquire_lock();
                SessionState state = store_.load();
                if (state.session_id != session_id || state.phase != core::Phase::Active)
                {
                    logger_->info("Ignoring auto-off for a session that already ended",
                                  core::LogContext().add("session", session_id));
                    return;
                }
                stop_locked(state, "Hotspot stopped: auto-off timer expired");
            }
            catch (const std::exception &e)
            {
                logger_->error("Auto-off stop failed", core::LogContext().add("session", session_id).add("error", e.what()));
            }
        }

        void SessionController::check_upstream()
        {
            if (!owns_session() || finished_)
            {
                return;
            }

            try
            {
                auto lock = acquire_lock();
                SessionState state = store_.load();
                if (state.session_id != own_session_id_ || state.phase != core::Phase::Active || !state.request)
                {
                    return;
                }

                auto nat = std::find_if(state.actions.begin(), state.actions.end(), [](const infrastructure::AppliedAction &a)
                                        { return a.type == infrastructure::ActionType::Nat; });
                if (nat == state.actions.end())
                {
                    return;
                }

                core::SessionRequest pinned = *state.request;
                pinned.hotspot_interface = state.hotspot_interface;
                const auto resolved = resolve_interfaces(pinned, inventory_.list_interfaces());

                if (resolved.upstream.empty())
                {
                    if (state.request->route_via_vpn)
                    {
                        logger_->warning("VPN tunnel went down", core::LogContext().add("previous", state.upstream_interface));
                        stop_locked(state, "Hotspot stopped: VPN tunnel went down; refusing to route outside the tunnel");
                    }
                    return;
                }
                if (resolved.upstream == state.upstream_interface || resolved.upstream == state.hotspot_interface)
                {
                    return;
                }

                configurator_.reroute_nat(*nat, resolved.upstream);
                state.upstream_interface = resolved.upstream;
                commit(state, active_message(state));
            }
            catch (const core::ConfigurationError &e)
            {
                logger_->error("Upstream check failed", core::LogContext().add("error", e.what()));
            }
        }

        // State helpers

        SessionState SessionController::load_locked()
        {
            SessionState state = store_.load();
            if (state.expects_controller() && state.pid != processes_.self_pid() && !controller_alive(processes_, state))
            {
                logger_->warning("Controlling backend process is gone; marking session as failed",
                                 core::LogContext()
                                     .add("pid", state.pid)
                                     .add("phase", core::to_string(state.phase))
                                     .add("actions", state.actions.size()));
                state.phase = core::Phase::Error;
                state.last_error = LastError{core::ErrorKind::ConfigurationError,
                                             "Backend process " + std::to_string(state.pid) + " exited unexpectedly"};
                status_.clear_pid();
                commit(state, state.last_error->message);
            }
            return state;
        }

        void SessionController::commit(SessionState &state, const std::string &message)
        {
            store_.save(state);

            std::optional<core::ErrorKind> error;
            if (state.phase == core::Phase::Error && state.last_error)
            {
                error = state.last_error->kind;
            }
            status_.publish(state.phase, message, error);
        }

        void SessionController::revert_leftovers(SessionState &state)
        {
            logger_->warning("Reverting configuration left by a previous session",
                             core::LogContext().add("session", state.session_id).add("actions", state.actions.size()));
            auto report = configurator_.revert(state.actions);
            state.actions.clear();
            if (!report.clean())
            {
                state.warnings.push_back("Cleanup of previous session incomplete: " + report.summary());
            }
            store_.save(state);
        }

        // Read-only views

        nlohmann::json SessionController::status_report() const
        {
            SessionState state = store_.load();
            const bool alive = controller_alive(processes_, state);

            StatusRecord current;
            auto published = status_.read_status();
            if (published)
            {
                current = *published;
            }
            else
            {
                current.phase = state.phase;
                current.message = state.phase == core::Phase::Idle ? "Hotspot is not running" : core::to_string(state.phase);
                current.timestamp = epoch_seconds_precise();
            }

            if (state.expects_controller() && !alive)
            {
                current.phase = core::Phase::Error;
                current.message = "Backend process exited unexpectedly; run --stop to clean up";
                current.error_code = core::error_code(core::ErrorKind::ConfigurationError);
            }

            nlohmann::json report = current.to_json();
            report["backendAlive"] = alive && state.expects_controller();
            report["sessionId"] = state.session_id;
            report["hotspotInterface"] = state.hotspot_interface;
            report["upstreamInterface"] = state.upstream_interface;
            report["deadline"] = state.deadline ? nlohmann::json(*state.deadline) : nlohmann::json(nullptr);
            report["ssid"] = state.request ? nlohmann::json(state.request->ssid) : nlohmann::json(nullptr);
            report["warnings"] = state.warnings;
            return report;
        }

        void SessionController::publish_invalid_argument(const std::string &message)
        {
            services::publish_invalid_argument(store_, status_, processes_, message);
        }

        void publish_invalid_argument(const SessionStore &store, StatusPublisher &status,
                                      const infrastructure::ProcessControl &processes,
                                      const std::string &message)
        {
            SessionState state = store.load();
            core::Phase phase = state.phase;
            if (state.expects_controller() && !controller_alive(processes, state))
            {
                phase = core::Phase::Error;
            }

            try
            {
                status.publish(phase, message, core::ErrorKind::InvalidArgument);
            }
            catch (const core::ConfigurationError &e)
            {
                core::get_logger("SessionController")->warning("Could not publish status", core::LogContext().add("error", e.what()));
            }
        }

    } // namespace services
} // namespace apguard
