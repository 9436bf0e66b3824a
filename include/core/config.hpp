#ifndef APGUARD_CORE_CONFIG_HPP
#define APGUARD_CORE_CONFIG_HPP

#include <string>
#include <memory>
#include <chrono>
#include <nlohmann/json.hpp>

namespace apguard
{
    namespace core
    {

        /**
         * Well-known files shared with the front end and later invocations
         */
        struct PathsConfig
        {
            std::string status_file = "/tmp/apguard_status.json";
            std::string pid_file = "/tmp/apguard.pid";
            // Private to root; kept out of world-writable /tmp
            std::string state_file = "/run/apguard/session.json";
            std::string lock_file = "/run/apguard/apguard.lock";
            std::string sysfs_root = "/sys";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Hotspot network settings
         */
        struct NetworkConfig
        {
            std::string connection_name = "apguard-hotspot";
            std::string gateway_address = "10.42.0.1";
            int prefix_length = 24;
            std::string chain_prefix = "APGUARD";

            // e.g. "10.42.0.0/24"
            std::string hotspot_subnet() const;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Bounds for blocking operations, in milliseconds
         */
        struct TimeoutsConfig
        {
            int command_ms = 10000;
            int activation_ms = 45000;
            int lock_ms = 10000;
            int stop_wait_ms = 15000;
            int auto_off_minute_ms = 60000; // length of one auto-off minute

            std::chrono::milliseconds command() const { return std::chrono::milliseconds(command_ms); }
            std::chrono::milliseconds activation() const { return std::chrono::milliseconds(activation_ms); }
            std::chrono::milliseconds lock() const { return std::chrono::milliseconds(lock_ms); }
            std::chrono::milliseconds stop_wait() const { return std::chrono::milliseconds(stop_wait_ms); }
            std::chrono::milliseconds auto_off_minute() const { return std::chrono::milliseconds(auto_off_minute_ms); }

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Logging configuration
         */
        struct LoggingConfig
        {
            std::string log_level = "WARNING";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete backend configuration
         */
        class BackendConfig
        {
        public:
            static constexpr const char *DEFAULT_PATH = "/etc/apguard/apguard.json";

            PathsConfig paths;
            NetworkConfig network;
            TimeoutsConfig timeouts;
            LoggingConfig logging;

        public:
            BackendConfig() = default;

            // Factory methods
            static std::unique_ptr<BackendConfig> from_file(const std::string &config_path);
            static std::unique_ptr<BackendConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<BackendConfig> create_default();

            // Missing default file means defaults; an explicit path must exist
            static std::unique_ptr<BackendConfig> load(const std::string &explicit_path);

            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            // Throws InvalidArgumentError describing the first problem found
            void validate() const;
        };

    } // namespace core
} // namespace apguard

#endif // APGUARD_CORE_CONFIG_HPP
