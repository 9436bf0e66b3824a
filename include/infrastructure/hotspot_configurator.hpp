#ifndef APGUARD_INFRASTRUCTURE_HOTSPOT_CONFIGURATOR_HPP
#define APGUARD_INFRASTRUCTURE_HOTSPOT_CONFIGURATOR_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/session_request.hpp"
#include "infrastructure/command_runner.hpp"

namespace apguard
{
    namespace core
    {
        class Logger;
    }

    namespace infrastructure
    {

        enum class ActionType
        {
            AccessPointProfile,
            Nat,
            MacFilter,
            DnsOverride
        };

        std::string to_string(ActionType type);

        /**
         * One completed configuration step, with everything its inverse needs
         */
        struct AppliedAction
        {
            ActionType type;
            std::map<std::string, std::string> data;

            std::string get(const std::string &key) const;

            nlohmann::json to_json() const;
            static AppliedAction from_json(const nlohmann::json &j);
        };

        using ActionLog = std::vector<AppliedAction>;

        /**
         * Outcome of a best-effort revert
         */
        struct RevertReport
        {
            size_t attempted = 0;
            std::vector<std::string> failures;

            bool clean() const { return failures.empty(); }
            std::string summary() const;
        };

        /**
         * Resolved request handed to the configurator
         */
        struct ConfigurationPlan
        {
            core::SessionRequest request;
            std::string hotspot_interface;
            std::string upstream_interface; // empty: no upstream resolved
        };

        /**
         * Creates and tears down the access point, NAT, MAC filter and DNS
         * override using nmcli, sysctl and iptables.
         *
         * Steps run strictly in order. Each completed step is reported through
         * the callback before the next one starts. A step that fails undoes its
         * own partial work and throws ConfigurationError; steps completed
         * before it stay applied for the caller to revert from its log.
         */
        class HotspotConfigurator
        {
        public:
            using ActionCallback = std::function<void(const AppliedAction &)>;

            HotspotConfigurator(CommandRunner &runner,
                                const core::NetworkConfig &network,
                                const core::TimeoutsConfig &timeouts);
            ~HotspotConfigurator() = default;

            ActionLog apply(const ConfigurationPlan &plan, const ActionCallback &on_applied = ActionCallback());

            // Newest-first; never throws for individual inverse failures
            RevertReport revert(const ActionLog &actions);

            // Throws ConfigurationError unless NetworkManager answers as running
            void ensure_network_manager();

            /**
             * Points an applied NAT action at a different upstream by refilling
             * its chains in place. The hooks into POSTROUTING and FORWARD are
             * left untouched. Updates `nat` on success.
             */
            void reroute_nat(AppliedAction &nat, const std::string &upstream);

            // Chain names derived from the configured prefix
            std::string postrouting_chain() const { return network_.chain_prefix + "_POSTROUTING"; }
            std::string forward_chain() const { return network_.chain_prefix + "_FORWARD"; }
            std::string mac_filter_chain() const { return network_.chain_prefix + "_MACFILTER"; }
            std::string dns_chain() const { return network_.chain_prefix + "_DNS"; }

        private:
            // Steps
            AppliedAction create_access_point(const ConfigurationPlan &plan);
            AppliedAction enable_nat(const ConfigurationPlan &plan);
            AppliedAction apply_mac_filter(const ConfigurationPlan &plan);
            AppliedAction apply_dns_override(const ConfigurationPlan &plan);

            // Inverses
            void revert_action(const AppliedAction &action, RevertReport &report);
            void remove_access_point(const AppliedAction &action, RevertReport &report);
            void disable_nat(const AppliedAction &action, RevertReport &report);
            void remove_mac_filter(const AppliedAction &action, RevertReport &report);
            void remove_dns_override(const AppliedAction &action, RevertReport &report);

            // NAT chain contents, shared by enable_nat and reroute_nat
            void fill_postrouting_chain(const std::string &upstream);
            void fill_forward_chain(const std::string &hotspot, const std::string &upstream);

            // Runs a step body; on ConfigurationError reverts the partial action and rethrows
            AppliedAction guarded_step(AppliedAction action, const std::function<void(AppliedAction &)> &body);

            // nmcli
            bool connection_exists(const std::string &connection);

            // iptables
            bool chain_exists(const std::string &table, const std::string &chain);
            void reset_chain(const std::string &table, const std::string &chain);
            void append_rule(const std::string &table, const std::string &chain, const std::vector<std::string> &rule);
            void hook_chain(const std::string &table, const std::string &builtin,
                            const std::vector<std::string> &match, const std::string &chain);
            void unhook_chain(const std::string &table, const std::string &builtin,
                              const std::vector<std::string> &match, const std::string &chain,
                              RevertReport &report);
            void delete_chain(const std::string &table, const std::string &chain, RevertReport &report);

            // Command helpers
            CommandResult run(const std::vector<std::string> &argv);
            void run_checked(const std::vector<std::string> &argv, const std::string &what,
                             std::chrono::milliseconds timeout);
            void run_checked(const std::vector<std::string> &argv, const std::string &what);
            void attempt(const std::vector<std::string> &argv, const std::string &what, RevertReport &report);
            std::vector<std::string> iptables(const std::string &table, std::vector<std::string> args) const;

            CommandRunner &runner_;
            core::NetworkConfig network_;
            core::TimeoutsConfig timeouts_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace apguard

#endif // APGUARD_INFRASTRUCTURE_HOTSPOT_CONFIGURATOR_HPP
