#ifndef APGUARD_CLI_CLI_OPTIONS_HPP
#define APGUARD_CLI_CLI_OPTIONS_HPP

#include <string>
#include <optional>

#include "core/session_request.hpp"

namespace apguard
{
    namespace cli
    {

        enum class Command
        {
            Start,
            Stop,
            Status,
            ListInterfaces,
            Help,
            Version
        };

        /**
         * Parsed command line
         */
        struct CliOptions
        {
            Command command = Command::Start;
            core::SessionRequest request;

            // Which request fields came from the command line
            bool ssid_given = false;
            bool password_given = false;
            bool interface_given = false;
            bool band_given = false;

            int verbosity = 0;
            std::string log_file;
            std::string backend_config;
            std::string settings_path;
            bool no_save = false;
        };

        // Throws InvalidArgumentError; never exits the process
        CliOptions parse_arguments(int argc, char *argv[]);

        /**
         * Fills SSID, password, interface and band from the stored settings
         * when the command line left them out.
         */
        core::SessionRequest merge_with_settings(const CliOptions &options,
                                                 const std::optional<core::SessionRequest> &stored);

        std::string usage(const std::string &program_name);

    } // namespace cli
} // namespace apguard

#endif // APGUARD_CLI_CLI_OPTIONS_HPP
