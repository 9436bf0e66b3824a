/**
 * apguard
 * Privileged backend for the Wi-Fi hotspot: start, stop, status
 */

#include <iostream>
#include <csignal>
#include <signal.h>
#include <cstring>
#include <ctime>
#include <unistd.h>
#include <memory>
#include <string>

#include "cli/cli_options.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/interface_probe.hpp"
#include "infrastructure/hotspot_configurator.hpp"
#include "infrastructure/process_control.hpp"
#include "services/interface_inventory.hpp"
#include "services/safety_validator.hpp"
#include "services/session_store.hpp"
#include "services/status_publisher.hpp"
#include "services/settings_store.hpp"
#include "services/session_controller.hpp"

namespace apguard {

constexpr const char *VERSION = "1.0.0";
constexpr uid_t ROOT_UID = 0;

/**
 * Signals that end a running session
 */
sigset_t session_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGQUIT);
    return set;
}

/**
 * Block session signals so they are only ever consumed by the supervisor loop.
 * Must run before any thread is created; threads inherit the mask.
 */
void block_session_signals() {
    sigset_t set = session_signals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw core::ConfigurationError(std::string("Cannot block signals: ") + strerror(rc));
    }
}

/**
 * Check if running with required privileges
 */
bool check_root_privileges(const infrastructure::ProcessControl& processes) {
    if (!processes.is_root()) {
        std::cerr << "ERROR: apguard must run as root to configure network interfaces." << std::endl;
        std::cerr << "Please run with: sudo apguard ..." << std::endl;
        return false;
    }
    return true;
}

void print_version() {
    std::cout << "apguard v" << VERSION << std::endl;
    std::cout << "Built for Linux with NetworkManager and iptables" << std::endl;
}

void print_result(const services::ControllerResult& result) {
    for (const auto& warning : result.warnings) {
        std::cerr << "Warning: " << warning << std::endl;
    }
    if (result.outcome == services::Outcome::Success ||
        result.outcome == services::Outcome::NoOp ||
        result.outcome == services::Outcome::AlreadyRunning) {
        std::cout << result.message << std::endl;
    } else {
        std::cerr << "Error: " << result.message << std::endl;
    }
}

/**
 * Wait until the session ends: a signal, or the auto-off timer finishing it
 */
int supervise(services::SessionController& controller) {
    auto logger = core::get_logger("main");
    sigset_t set = session_signals();
    struct timespec step = {1, 0};

    while (!controller.session_finished()) {
        int signum = sigtimedwait(&set, nullptr, &step);
        if (signum > 0) {
            logger->info("Received signal, stopping hotspot",
                         core::LogContext().add("signal", strsignal(signum)));
            auto result = controller.stop_own_session("Hotspot stopped");
            print_result(result);
            return result.exit_code();
        }
        controller.check_upstream();
    }

    logger->info("Session ended");
    return core::EXIT_OK;
}

/**
 * Record a rejected command line in the status file
 */
void report_invalid_arguments(const std::string& message) {
    std::cerr << "Error: " << message << std::endl;
    std::cerr << "Try 'apguard --help' for more information." << std::endl;

    try {
        auto config = core::BackendConfig::load("");
        infrastructure::PosixProcessControl processes;
        services::SessionStore store(config->paths.state_file, ROOT_UID);
        services::StatusPublisher status(config->paths.status_file, config->paths.pid_file, processes);
        services::publish_invalid_argument(store, status, processes, message);
    } catch (const core::ApguardError& e) {
        core::get_logger("main")->warning("Rejected arguments not recorded in status",
                                          core::LogContext().add("error", e.what()));
    }
}

} // namespace apguard

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace apguard;

    cli::CliOptions args;
    try {
        args = cli::parse_arguments(argc, argv);
    } catch (const core::InvalidArgumentError& e) {
        report_invalid_arguments(e.what());
        return core::EXIT_INVALID_ARGUMENT;
    }

    if (args.command == cli::Command::Help) {
        std::cout << cli::usage(argv[0]);
        return core::EXIT_OK;
    }

    if (args.command == cli::Command::Version) {
        print_version();
        return core::EXIT_OK;
    }

    try {
        // Load configuration
        std::unique_ptr<core::BackendConfig> config;
        try {
            config = core::BackendConfig::load(args.backend_config);
            config->validate();
        } catch (const core::InvalidArgumentError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return core::EXIT_INVALID_ARGUMENT;
        }

        // Setup logging; the command line wins over the configuration file
        core::LogLevel log_level = core::LoggerManager::string_to_level(config->logging.log_level);
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }
        std::string log_file = args.log_file.empty() ? config->logging.log_file : args.log_file;
        core::setup_logging(log_level, log_file, log_file.empty());
        auto logger = core::get_logger("main");

        // Wiring
        infrastructure::ProcessCommandRunner runner;
        infrastructure::PosixProcessControl processes;
        infrastructure::LinuxInterfaceProbe probe(config->paths.sysfs_root, runner, config->timeouts.command());
        services::InterfaceInventory inventory(probe);

        if (args.command == cli::Command::ListInterfaces) {
            nlohmann::json listing = nlohmann::json::array();
            for (const auto& iface : inventory.list_interfaces()) {
                listing.push_back(iface.to_json());
            }
            std::cout << listing.dump(2) << std::endl;
            return core::EXIT_OK;
        }

        services::SafetyValidator validator;
        infrastructure::HotspotConfigurator configurator(runner, config->network, config->timeouts);
        services::SessionStore store(config->paths.state_file, ROOT_UID);
        services::StatusPublisher status(config->paths.status_file, config->paths.pid_file, processes);

        auto owner = services::detect_settings_owner();
        std::string settings_path = args.settings_path.empty() ? services::default_settings_path(owner)
                                                               : args.settings_path;
        services::SettingsStore settings(settings_path, owner);

        if (args.command == cli::Command::Status) {
            services::SessionController controller(*config, inventory, validator, configurator,
                                                   store, status, processes);
            std::cout << controller.status_report().dump(2) << std::endl;
            return core::EXIT_OK;
        }

        if (!check_root_privileges(processes)) {
            return core::EXIT_CONFIGURATION;
        }

        // Signals must be blocked before the controller can start the timer thread
        block_session_signals();

        services::SessionController controller(*config, inventory, validator, configurator,
                                               store, status, processes,
                                               args.no_save ? nullptr : &settings);

        if (args.command == cli::Command::Stop) {
            auto result = controller.stop();
            print_result(result);
            return result.exit_code();
        }

        // Start
        core::SessionRequest request = cli::merge_with_settings(args, settings.load());
        logger->info("Starting apguard",
                     core::LogContext().add("version", VERSION).add("settings", settings_path));

        auto result = controller.start(request);
        print_result(result);
        if (result.outcome != services::Outcome::Success) {
            return result.exit_code();
        }

        // Keep controlling the session until it ends
        return supervise(controller);

    } catch (const core::ApguardError& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return core::exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return core::EXIT_CONFIGURATION;
    }
}
