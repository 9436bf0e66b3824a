#include "services/session_store.hpp"
#include "core/file_utils.hpp"
#include "core/logger.hpp"

#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>

namespace apguard
{
    namespace services
    {

        namespace
        {
            constexpr mode_t STATE_FILE_MODE = 0600;
        }

        std::string generate_session_id()
        {
            std::random_device rd;
            std::mt19937_64 gen(rd());
            std::ostringstream id;
            id << std::hex << std::setfill('0') << std::setw(16) << gen();
            return id.str();
        }

        std::int64_t epoch_seconds()
        {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        bool SessionState::expects_controller() const
        {
            return phase == core::Phase::Validating || phase == core::Phase::Starting ||
                   phase == core::Phase::Active || phase == core::Phase::Stopping;
        }

        nlohmann::json SessionState::to_json() const
        {
            nlohmann::json j;
            j["phase"] = core::to_string(phase);
            j["sessionId"] = session_id;
            j["pid"] = pid;
            j["pidIdentity"] = pid_identity;
            j["request"] = request ? request->to_json(false) : nlohmann::json(nullptr);
            j["hotspotInterface"] = hotspot_interface;
            j["upstreamInterface"] = upstream_interface;
            j["deadline"] = deadline ? nlohmann::json(*deadline) : nlohmann::json(nullptr);

            j["actions"] = nlohmann::json::array();
            for (const auto &action : actions)
            {
                j["actions"].push_back(action.to_json());
            }

            if (last_error)
            {
                j["lastError"] = {{"code", core::error_code(last_error->kind)}, {"message", last_error->message}};
            }
            else
            {
                j["lastError"] = nullptr;
            }
            j["warnings"] = warnings;
            j["updatedAt"] = updated_at;
            return j;
        }

        SessionState SessionState::from_json(const nlohmann::json &j)
        {
            SessionState state;
            try
            {
                auto phase = core::phase_from_string(j.at("phase").get<std::string>());
                if (!phase)
                {
                    throw core::ConfigurationError("Unknown phase: " + j["phase"].get<std::string>());
                }
                state.phase = *phase;
                state.session_id = j.value("sessionId", "");
                state.pid = j.value("pid", 0);
                state.pid_identity = j.value("pidIdentity", "");
                if (j.contains("request") && j["request"].is_object())
                    state.request = core::SessionRequest::from_json(j["request"]);
                state.hotspot_interface = j.value("hotspotInterface", "");
                state.upstream_interface = j.value("upstreamInterface", "");
                if (j.contains("deadline") && j["deadline"].is_number_integer())
                    state.deadline = j["deadline"].get<std::int64_t>();

                if (j.contains("actions"))
                {
                    for (const auto &action : j["actions"])
                    {
                        state.actions.push_back(infrastructure::AppliedAction::from_json(action));
                    }
                }

                if (j.contains("lastError") && j["lastError"].is_object())
                {
                    auto kind = core::error_kind_from_code(j["lastError"].value("code", ""));
                    state.last_error = LastError{kind.value_or(core::ErrorKind::ConfigurationError),
                                                 j["lastError"].value("message", "")};
                }
                if (j.contains("warnings"))
                    state.warnings = j["warnings"].get<std::vector<std::string>>();
                state.updated_at = j.value("updatedAt", static_cast<std::int64_t>(0));
            }
            catch (const nlohmann::json::exception &e)
            {
                throw core::ConfigurationError(std::string("Malformed session state: ") + e.what());
            }
            return state;
        }

        SessionStore::SessionStore(std::string path, uid_t owner)
            : path_(std::move(path)), owner_(owner), logger_(core::get_logger("SessionStore"))
        {
        }

        SessionState SessionStore::load() const
        {
            struct stat st;
            if (::lstat(path_.c_str(), &st) == 0)
            {
                if (!S_ISREG(st.st_mode))
                {
                    return unusable("not a regular file");
                }
                if (st.st_uid != owner_)
                {
                    return unusable("owned by uid " + std::to_string(st.st_uid) + ", expected uid " + std::to_string(owner_));
                }
            }

            auto contents = core::files::read_file(path_);
            if (!contents)
            {
                return SessionState{};
            }

            try
            {
                return SessionState::from_json(nlohmann::json::parse(*contents));
            }
            catch (const std::exception &e)
            {
                return unusable(e.what());
            }
        }

        // An untrusted record cannot drive a revert; surface it as Error so stop can clear it
        SessionState SessionStore::unusable(const std::string &reason) const
        {
            logger_->error("Session state unusable", core::LogContext().add("path", path_).add("error", reason));
            SessionState state;
            state.phase = core::Phase::Error;
            state.last_error = LastError{core::ErrorKind::ConfigurationError, "Session state unusable: " + reason};
            return state;
        }

        void SessionStore::save(SessionState &state) const
        {
            state.updated_at = epoch_seconds();
            core::files::ensure_private_parent_directory(path_, owner_);
            core::files::write_file_atomically(path_, state.to_json().dump(2) + "\n", STATE_FILE_MODE);
            logger_->debug("Session state saved",
                           core::LogContext()
                               .add("phase", core::to_string(state.phase))
                               .add("actions", state.actions.size()));
        }

    } // namespace services
} // namespace apguard
