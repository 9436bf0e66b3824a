#ifndef APGUARD_SERVICES_STATUS_PUBLISHER_HPP
#define APGUARD_SERVICES_STATUS_PUBLISHER_HPP

#include <string>
#include <optional>
#include <memory>
#include <sys/types.h>
#include <nlohmann/json.hpp>

#include "core/types.hpp"
#include "core/errors.hpp"

namespace apguard
{
    namespace core
    {
        class Logger;
    }

    namespace infrastructure
    {
        class ProcessControl;
    }

    namespace services
    {

        /**
         * Snapshot read by the front end
         */
        struct StatusRecord
        {
            core::Phase phase = core::Phase::Idle;
            std::string message;
            double timestamp = 0.0; // epoch seconds
            std::optional<std::string> error_code;

            nlohmann::json to_json() const;
            static StatusRecord from_json(const nlohmann::json &j);
        };

        double epoch_seconds_precise();

        /**
         * Status file and PID marker. Both are replaced atomically, so a
         * concurrent reader sees either the previous or the new document.
         */
        class StatusPublisher
        {
        public:
            StatusPublisher(std::string status_path, std::string pid_path,
                            infrastructure::ProcessControl &processes);

            // Throws ConfigurationError if the file cannot be written
            void publish(const StatusRecord &record);
            void publish(core::Phase phase, const std::string &message,
                         std::optional<core::ErrorKind> error = std::nullopt);

            std::optional<StatusRecord> read_status() const;

            // PID marker
            void write_pid(pid_t pid);
            void clear_pid();
            std::optional<pid_t> read_pid() const;
            bool is_backend_alive() const;

        private:
            std::string status_path_;
            std::string pid_path_;
            infrastructure::ProcessControl &processes_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace apguard

#endif // APGUARD_SERVICES_STATUS_PUBLISHER_HPP
