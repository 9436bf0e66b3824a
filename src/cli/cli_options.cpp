#include "cli/cli_options.hpp"
#include "core/errors.hpp"

#include <getopt.h>
#include <sstream>

namespace apguard
{
    namespace cli
    {

        namespace
        {
            // Long-only options
            enum LongOption
            {
                OPT_HIDDEN = 256,
                OPT_EXCLUDE_VPN,
                OPT_ROUTE_VPN,
                OPT_FORCE_SINGLE,
                OPT_STOP,
                OPT_BLOCK_MAC,
                OPT_ALLOW_MAC,
                OPT_DNS,
                OPT_OPEN,
                OPT_STATUS,
                OPT_LIST,
                OPT_BACKEND_CONFIG,
                OPT_SETTINGS,
                OPT_NO_SAVE,
                OPT_VERSION
            };

            std::string short_option(int option)
            {
                return std::string("-") + static_cast<char>(option);
            }

            // getopt stays inside a cluster such as "-xv" after rejecting x, so
            // argv only names the option reliably for long forms
            std::string unknown_option(char *argv[])
            {
                if (optopt == 0 || optopt >= OPT_HIDDEN)
                    return argv[optind - 1];
                return short_option(optopt);
            }

            // A missing value can only happen on the last argument
            std::string option_missing_value(int argc, char *argv[])
            {
                const std::string last = argv[argc - 1];
                if (last.compare(0, 2, "--") == 0)
                    return last.substr(0, last.find('='));
                return short_option(optopt);
            }

            int parse_minutes(const std::string &value)
            {
                const std::string message = "Timer must be a whole number of minutes: " + value;
                size_t consumed = 0;
                int minutes = 0;
                try
                {
                    minutes = std::stoi(value, &consumed);
                }
                catch (const std::logic_error &)
                {
                    throw core::InvalidArgumentError(message);
                }
                if (consumed != value.size())
                {
                    throw core::InvalidArgumentError(message);
                }
                return minutes;
            }

            void add_macs(CliOptions &options, core::MacFilterMode mode, const std::string &value)
            {
                auto &request = options.request;
                if (request.mac_filter_mode != core::MacFilterMode::None && request.mac_filter_mode != mode)
                {
                    throw core::InvalidArgumentError("--allow-mac and --block-mac cannot be combined");
                }
                request.mac_filter_mode = mode;

                std::istringstream list(value);
                std::string mac;
                while (std::getline(list, mac, ','))
                {
                    if (!mac.empty())
                        request.mac_addresses.push_back(mac);
                }
            }

            void set_command(CliOptions &options, Command command)
            {
                if (options.command != Command::Start && options.command != command)
                {
                    throw core::InvalidArgumentError("--stop, --status and --list-interfaces are mutually exclusive");
                }
                options.command = command;
            }
        } // namespace

        CliOptions parse_arguments(int argc, char *argv[])
        {
            CliOptions options;

            static struct option long_options[] = {
                {"ssid", required_argument, 0, 's'},
                {"password", required_argument, 0, 'p'},
                {"interface", required_argument, 0, 'i'},
                {"internet-interface", required_argument, 0, 'u'},
                {"band", required_argument, 0, 'b'},
                {"timer", required_argument, 0, 't'},
                {"hidden", no_argument, 0, OPT_HIDDEN},
                {"exclude-vpn", no_argument, 0, OPT_EXCLUDE_VPN},
                {"route-vpn", no_argument, 0, OPT_ROUTE_VPN},
                {"force-single-interface", no_argument, 0, OPT_FORCE_SINGLE},
                {"stop", no_argument, 0, OPT_STOP},
                {"block-mac", required_argument, 0, OPT_BLOCK_MAC},
                {"allow-mac", required_argument, 0, OPT_ALLOW_MAC},
                {"dns", required_argument, 0, OPT_DNS},
                {"open", no_argument, 0, OPT_OPEN},
                {"status", no_argument, 0, OPT_STATUS},
                {"list-interfaces", no_argument, 0, OPT_LIST},
                {"verbose", no_argument, 0, 'v'},
                {"log-file", required_argument, 0, 'l'},
                {"backend-config", required_argument, 0, OPT_BACKEND_CONFIG},
                {"settings", required_argument, 0, OPT_SETTINGS},
                {"no-save", no_argument, 0, OPT_NO_SAVE},
                {"help", no_argument, 0, 'h'},
                {"version", no_argument, 0, OPT_VERSION},
                {0, 0, 0, 0}};

            // Full rescan, so the parser can run more than once per process
            optind = 0;
            opterr = 0;

            int c;
            int option_index = 0;
            while ((c = getopt_long(argc, argv, ":s:p:i:u:b:t:vl:h", long_options, &option_index)) != -1)
            {
                switch (c)
                {
                case 's':
                    options.request.ssid = optarg;
                    options.ssid_given = true;
                    break;
                case 'p':
                    options.request.passphrase = std::string(optarg);
                    options.password_given = true;
                    break;
                case 'i':
                    options.request.hotspot_interface = optarg;
                    options.interface_given = true;
                    break;
                case 'u':
                    options.request.internet_interface = optarg;
                    break;
                case 'b':
                {
                    auto band = core::band_from_string(optarg);
                    if (!band)
                        throw core::InvalidArgumentError(std::string("Band must be 'g' (2.4GHz) or 'a' (5GHz): ") + optarg);
                    options.request.band = *band;
                    options.band_given = true;
                    break;
                }
                case 't':
                    options.request.auto_off_minutes = parse_minutes(optarg);
                    break;
                case OPT_HIDDEN:
                    options.request.hidden = true;
                    break;
                case OPT_EXCLUDE_VPN:
                    options.request.exclude_vpn = true;
                    break;
                case OPT_ROUTE_VPN:
                    options.request.route_via_vpn = true;
                    break;
                case OPT_FORCE_SINGLE:
                    options.request.force_single_interface = true;
                    break;
                case OPT_STOP:
                    set_command(options, Command::Stop);
                    break;
                case OPT_BLOCK_MAC:
                    add_macs(options, core::MacFilterMode::BlockList, optarg);
                    break;
                case OPT_ALLOW_MAC:
                    add_macs(options, core::MacFilterMode::AllowList, optarg);
                    break;
                case OPT_DNS:
                    options.request.dns_override = std::string(optarg);
                    break;
                case OPT_OPEN:
                    options.request.open_network = true;
                    break;
                case OPT_STATUS:
                    set_command(options, Command::Status);
                    break;
                case OPT_LIST:
                    set_command(options, Command::ListInterfaces);
                    break;
                case 'v':
                    options.verbosity++;
                    break;
                case 'l':
                    options.log_file = optarg;
                    break;
                case OPT_BACKEND_CONFIG:
                    options.backend_config = optarg;
                    break;
                case OPT_SETTINGS:
                    options.settings_path = optarg;
                    break;
                case OPT_NO_SAVE:
                    options.no_save = true;
                    break;
                case 'h':
                    options.command = Command::Help;
                    return options;
                case OPT_VERSION:
                    options.command = Command::Version;
                    return options;
                case ':':
                    throw core::InvalidArgumentError("Missing value for " + option_missing_value(argc, argv));
                case '?':
                default:
                    throw core::InvalidArgumentError("Unknown option: " + unknown_option(argv));
                }
            }

            if (optind < argc)
            {
                throw core::InvalidArgumentError(std::string("Unexpected argument: ") + argv[optind]);
            }

            return options;
        }

        core::SessionRequest merge_with_settings(const CliOptions &options,
                                                 const std::optional<core::SessionRequest> &stored)
        {
            core::SessionRequest request = options.request;
            if (!stored)
            {
                return request;
            }

            if (!options.ssid_given)
                request.ssid = stored->ssid;
            if (!options.password_given && !request.open_network && stored->passphrase)
                request.passphrase = stored->passphrase;
            if (!options.interface_given)
                request.hotspot_interface = stored->hotspot_interface;
            if (!options.band_given)
                request.band = stored->band;

            // A stored interface may not name the chosen upstream as well
            if (request.hotspot_interface == request.internet_interface && !options.interface_given)
                request.hotspot_interface.clear();

            return request;
        }

        std::string usage(const std::string &program_name)
        {
            std::ostringstream out;
            out << "apguard - Wi-Fi hotspot backend\n\n";
            out << "Usage: " << program_name << " [OPTIONS]\n\n";
            out << "Start options:\n";
            out << "  -s, --ssid NAME               Network name (1-32 bytes)\n";
            out << "  -p, --password PASS           WPA2 passphrase (8-63 characters)\n";
            out << "      --open                    Unsecured network (no password)\n";
            out << "  -i, --interface IFACE         Wi-Fi interface to host the hotspot (default: automatic)\n";
            out << "  -u, --internet-interface IF   Internet source (default: current default route)\n";
            out << "  -b, --band {g|a}              2.4GHz (g) or 5GHz (a)\n";
            out << "      --hidden                  Do not broadcast the SSID\n";
            out << "      --dns ADDR                Redirect client DNS to ADDR\n";
            out << "      --exclude-vpn             Never use a VPN tunnel as the internet source\n";
            out << "      --route-vpn               Route clients through the active VPN tunnel (fail closed)\n";
            out << "      --force-single-interface  Allow hosting on the only internet connection\n";
            out << "  -t, --timer MINUTES           Stop automatically after 1-120 minutes\n";
            out << "      --allow-mac MAC[,MAC]     Only admit these clients\n";
            out << "      --block-mac MAC[,MAC]     Refuse these clients\n";
            out << "      --settings FILE           User settings file\n";
            out << "      --no-save                 Do not remember these settings\n\n";
            out << "Commands:\n";
            out << "      --stop                    Stop the hotspot (no-op if not running)\n";
            out << "      --status                  Print the current status as JSON\n";
            out << "      --list-interfaces         Print the network interfaces as JSON\n\n";
            out << "General:\n";
            out << "  -v, --verbose                 Increase verbosity (-v INFO, -vv DEBUG)\n";
            out << "  -l, --log-file FILE           Append log output to FILE\n";
            out << "      --backend-config FILE     Backend configuration (default: /etc/apguard/apguard.json)\n";
            out << "  -h, --help                    Show this help message\n";
            out << "      --version                 Show version information\n\n";
            out << "Exit codes: 0 success, 1 blocked for safety, 2 configuration failure, 3 invalid argument\n";
            return out.str();
        }

    } // namespace cli
} // namespace apguard
