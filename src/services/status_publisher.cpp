#include "services/status_publisher.hpp"
#include "infrastructure/process_control.hpp"
#include "core/file_utils.hpp"
#include "core/logger.hpp"

#include <chrono>

namespace apguard
{
    namespace services
    {

        namespace
        {
            // Readable by the unprivileged front end
            constexpr mode_t PUBLIC_FILE_MODE = 0644;
        }

        double epoch_seconds_precise()
        {
            return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
        }

        nlohmann::json StatusRecord::to_json() const
        {
            nlohmann::json j{
                {"phase", core::to_string(phase)},
                {"message", message},
                {"timestamp", timestamp}};
            if (error_code)
            {
                j["errorCode"] = *error_code;
            }
            return j;
        }

        StatusRecord StatusRecord::from_json(const nlohmann::json &j)
        {
            StatusRecord record;
            auto phase = core::phase_from_string(j.at("phase").get<std::string>());
            if (!phase)
            {
                throw core::ConfigurationError("Unknown phase in status record");
            }
            record.phase = *phase;
            record.message = j.value("message", "");
            record.timestamp = j.value("timestamp", 0.0);
            if (j.contains("errorCode") && j["errorCode"].is_string())
            {
                record.error_code = j["errorCode"].get<std::string>();
            }
            return record;
        }

        StatusPublisher::StatusPublisher(std::string status_path, std::string pid_path,
                                         infrastructure::ProcessControl &processes)
            : status_path_(std::move(status_path)),
              pid_path_(std::move(pid_path)),
              processes_(processes),
              logger_(core::get_logger("StatusPublisher"))
        {
        }

        void StatusPublisher::publish(const StatusRecord &record)
        {
            core::files::ensure_parent_directory(status_path_, 0755);
            core::files::write_file_atomically(status_path_, record.to_json().dump() + "\n", PUBLIC_FILE_MODE);
            logger_->info("Status published",
                          core::LogContext()
                              .add("phase", core::to_string(record.phase))
                              .add("message", record.message)
                              .add("error_code", record.error_code.value_or("")));
        }

        void StatusPublisher::publish(core::Phase phase, const std::string &message,
                                      std::optional<core::ErrorKind> error)
        {
            StatusRecord record;
            record.phase = phase;
            record.message = message;
            record.timestamp = epoch_seconds_precise();
            if (error)
            {
                record.error_code = core::error_code(*error);
            }
            publish(record);
        }

        std::optional<StatusRecord> StatusPublisher::read_status() const
        {
            auto contents = core::files::read_file(status_path_);
            if (!contents)
            {
                return std::nullopt;
            }
            try
            {
                return StatusRecord::from_json(nlohmann::json::parse(*contents));
            }
            catch (const std::exception &e)
            {
                logger_->warning("Status file unreadable", core::LogContext().add("path", status_path_).add("error", e.what()));
                return std::nullopt;
            }
        }

        void StatusPublisher::write_pid(pid_t pid)
        {
            core::files::ensure_parent_directory(pid_path_, 0755);
            core::files::write_file_atomically(pid_path_, std::to_string(pid) + "\n", PUBLIC_FILE_MODE);
        }

        void StatusPublisher::clear_pid()
        {
            if (!core::files::remove_file(pid_path_))
            {
                logger_->warning("Could not remove PID file", core::LogContext().add("path", pid_path_));
            }
        }

        std::optional<pid_t> StatusPublisher::read_pid() const
        {
            auto line = core::files::read_first_line(pid_path_);
            if (!line || line->empty())
            {
                return std::nullopt;
            }
            try
            {
                size_t consumed = 0;
                long value = std::stol(*line, &consumed);
                if (consumed != line->size() || value <= 0)
                {
                    return std::nullopt;
                }
                return static_cast<pid_t>(value);
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }

        bool StatusPublisher::is_backend_alive() const
        {
            auto pid = read_pid();
            return pid && processes_.is_alive(*pid);
        }

    } // namespace services
} // namespace apguard
