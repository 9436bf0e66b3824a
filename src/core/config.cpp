#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "core/net_utils.hpp"
#include <fstream>
#include <filesystem>

namespace apguard
{
    namespace core
    {

        // PathsConfig implementation
        void PathsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("status_file"))
                status_file = j["status_file"];
            if (j.contains("pid_file"))
                pid_file = j["pid_file"];
            if (j.contains("state_file"))
                state_file = j["state_file"];
            if (j.contains("lock_file"))
                lock_file = j["lock_file"];
            if (j.contains("sysfs_root"))
                sysfs_root = j["sysfs_root"];
        }

        nlohmann::json PathsConfig::to_json() const
        {
            return nlohmann::json{
                {"status_file", status_file},
                {"pid_file", pid_file},
                {"state_file", state_file},
                {"lock_file", lock_file},
                {"sysfs_root", sysfs_root}};
        }

        // NetworkConfig implementation
        std::string NetworkConfig::hotspot_subnet() const
        {
            return net::network_cidr(gateway_address, prefix_length);
        }

        void NetworkConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("connection_name"))
                connection_name = j["connection_name"];
            if (j.contains("gateway_address"))
                gateway_address = j["gateway_address"];
            if (j.contains("prefix_length"))
                prefix_length = j["prefix_length"];
            if (j.contains("chain_prefix"))
                chain_prefix = j["chain_prefix"];
        }

        nlohmann::json NetworkConfig::to_json() const
        {
            return nlohmann::json{
                {"connection_name", connection_name},
                {"gateway_address", gateway_address},
                {"prefix_length", prefix_length},
                {"chain_prefix", chain_prefix}};
        }

        // TimeoutsConfig implementation
        void TimeoutsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("command"))
                command_ms = j["command"];
            if (j.contains("activation"))
                activation_ms = j["activation"];
            if (j.contains("lock"))
                lock_ms = j["lock"];
            if (j.contains("stop_wait"))
                stop_wait_ms = j["stop_wait"];
            if (j.contains("auto_off_minute"))
                auto_off_minute_ms = j["auto_off_minute"];
        }

        nlohmann::json TimeoutsConfig::to_json() const
        {
            return nlohmann::json{
                {"command", command_ms},
                {"activation", activation_ms},
                {"lock", lock_ms},
                {"stop_wait", stop_wait_ms},
                {"auto_off_minute", auto_off_minute_ms}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"];
            if (j.contains("log_file"))
                log_file = j["log_file"];
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            return nlohmann::json{
                {"log_level", log_level},
                {"log_file", log_file}};
        }

        // BackendConfig implementation
        std::unique_ptr<BackendConfig> BackendConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw InvalidArgumentError("Cannot open configuration file: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw InvalidArgumentError("Malformed configuration file " + config_path + ": " + e.what());
            }

            return from_json(j);
        }

        std::unique_ptr<BackendConfig> BackendConfig::from_json(const nlohmann::json &j)
        {
            auto config = std::make_unique<BackendConfig>();

            try
            {
                if (j.contains("paths"))
                {
                    config->paths.from_json(j["paths"]);
                }
                if (j.contains("network"))
                {
                    config->network.from_json(j["network"]);
                }
                if (j.contains("timeouts"))
                {
                    config->timeouts.from_json(j["timeouts"]);
                }
                if (j.contains("logging"))
                {
                    config->logging.from_json(j["logging"]);
                }
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw InvalidArgumentError(std::string("Configuration field has the wrong type: ") + e.what());
            }

            return config;
        }

        std::unique_ptr<BackendConfig> BackendConfig::create_default()
        {
            return std::make_unique<BackendConfig>();
        }

        std::unique_ptr<BackendConfig> BackendConfig::load(const std::string &explicit_path)
        {
            if (!explicit_path.empty())
            {
                return from_file(explicit_path);
            }

            std::error_code ec;
            if (std::filesystem::exists(DEFAULT_PATH, ec))
            {
                return from_file(DEFAULT_PATH);
            }
            return create_default();
        }

        nlohmann::json BackendConfig::to_json() const
        {
            return nlohmann::json{
                {"paths", paths.to_json()},
                {"network", network.to_json()},
                {"timeouts", timeouts.to_json()},
                {"logging", logging.to_json()}};
        }

        void BackendConfig::save_to_file(const std::string &config_path) const
        {
            files::write_file_atomically(config_path, to_json().dump(4) + "\n", 0644);
        }

        void BackendConfig::validate() const
        {
            if (paths.status_file.empty() || paths.pid_file.empty() ||
                paths.state_file.empty() || paths.lock_file.empty())
            {
                throw InvalidArgumentError("Configuration validation error: paths must not be empty");
            }

            if (network.connection_name.empty())
            {
                throw InvalidArgumentError("Configuration validation error: network.connection_name cannot be empty");
            }

            if (!net::is_valid_ipv4(network.gateway_address))
            {
                throw InvalidArgumentError("Configuration validation error: network.gateway_address is not an IPv4 address");
            }

            if (network.prefix_length < 8 || network.prefix_length > 30)
            {
                throw InvalidArgumentError("Configuration validation error: network.prefix_length must be between 8 and 30");
            }

            // iptables chain names are limited to 28 characters; longest suffix is _POSTROUTING
            if (network.chain_prefix.empty() || network.chain_prefix.size() > 16)
            {
                throw InvalidArgumentError("Configuration validation error: network.chain_prefix must be 1-16 characters");
            }

            if (timeouts.command_ms <= 0 || timeouts.activation_ms <= 0 ||
                timeouts.lock_ms <= 0 || timeouts.stop_wait_ms <= 0 ||
                timeouts.auto_off_minute_ms <= 0)
            {
                throw InvalidArgumentError("Configuration validation error: timeouts must be positive");
            }
        }

    } // namespace core
} // namespace apguard
