#include "infrastructure/hotspot_configurator.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <sstream>

namespace apguard
{
    namespace infrastructure
    {

        namespace
        {
            constexpr int MAX_UNHOOK_ATTEMPTS = 8;

            std::string trim(const std::string &value)
            {
                const auto begin = value.find_first_not_of(" \t\r\n");
                if (begin == std::string::npos)
                    return "";
                const auto end = value.find_last_not_of(" \t\r\n");
                return value.substr(begin, end - begin + 1);
            }

            std::vector<std::string> concat(std::vector<std::string> head, const std::vector<std::string> &tail)
            {
                head.insert(head.end(), tail.begin(), tail.end());
                return head;
            }

            // "-o <if>" / "-i <if>", or nothing when the interface is unknown
            std::vector<std::string> iface_match(const std::string &flag, const std::string &iface)
            {
                if (iface.empty())
                    return {};
                return {flag, iface};
            }

            std::string describe_failure(const std::string &what, const CommandResult &result,
                                         std::chrono::milliseconds timeout)
            {
                std::ostringstream message;
                message << what;
                if (result.timed_out)
                    message << " timed out after " << timeout.count() << " ms";
                else if (result.spawn_failed)
                    message << " failed: tool could not be started";
                else
                {
                    message << " failed (exit " << result.exit_code << ")";
                    auto output = trim(result.output);
                    if (!output.empty())
                        message << ": " << output;
                }
                return message.str();
            }
        } // namespace

        std::string to_string(ActionType type)
        {
            switch (type)
            {
            case ActionType::AccessPointProfile:
                return "ap_profile";
            case ActionType::Nat:
                return "nat";
            case ActionType::MacFilter:
                return "mac_filter";
            case ActionType::DnsOverride:
                return "dns_override";
            }
            return "unknown";
        }

        std::string AppliedAction::get(const std::string &key) const
        {
            auto it = data.find(key);
            return it != data.end() ? it->second : std::string();
        }

        nlohmann::json AppliedAction::to_json() const
        {
            return nlohmann::json{{"type", to_string(type)}, {"data", data}};
        }

        AppliedAction AppliedAction::from_json(const nlohmann::json &j)
        {
            try
            {
                const std::string type = j.at("type").get<std::string>();
                AppliedAction action;
                if (type == "ap_profile")
                    action.type = ActionType::AccessPointProfile;
                else if (type == "nat")
                    action.type = ActionType::Nat;
                else if (type == "mac_filter")
                    action.type = ActionType::MacFilter;
                else if (type == "dns_override")
                    action.type = ActionType::DnsOverride;
                else
                    throw core::ConfigurationError("Unknown action type in action log: " + type);

                if (j.contains("data"))
                    action.data = j["data"].get<std::map<std::string, std::string>>();
                return action;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw core::ConfigurationError(std::string("Malformed action log entry: ") + e.what());
            }
        }

        std::string RevertReport::summary() const
        {
            std::ostringstream out;
            out << failures.size() << " of " << attempted << " undo steps failed";
            for (const auto &failure : failures)
            {
                out << "; " << failure;
            }
            return out.str();
        }

        HotspotConfigurator::HotspotConfigurator(CommandRunner &runner,
                                                 const core::NetworkConfig &network,
                                                 const core::TimeoutsConfig &timeouts)
            : runner_(runner),
              network_(network),
              timeouts_(timeouts),
              logger_(core::get_logger("HotspotConfigurator"))
        {
        }

        ActionLog HotspotConfigurator::apply(const ConfigurationPlan &plan, const ActionCallback &on_applied)
        {
            logger_->info("Applying hotspot configuration",
                          core::LogContext()
                              .add("hotspot", plan.hotspot_interface)
                              .add("upstream", plan.upstream_interface)
                              .add("ssid", plan.request.ssid)
                              .add_secret("password", plan.request.passphrase.value_or("")));

            ActionLog applied;
            auto record = [&](AppliedAction action)
            {
                applied.push_back(std::move(action));
                logger_->info("Configuration step applied",
                              core::LogContext().add("step", to_string(applied.back().type)));
                if (on_applied)
                    on_applied(applied.back());
            };

            record(create_access_point(plan));
            record(enable_nat(plan));
            if (plan.request.mac_filter_mode != core::MacFilterMode::None)
            {
                record(apply_mac_filter(plan));
            }
            if (plan.request.dns_override)
            {
                record(apply_dns_override(plan));
            }

            return applied;
        }

        RevertReport HotspotConfigurator::revert(const ActionLog &actions)
        {
            RevertReport report;
            logger_->info("Reverting hotspot configuration", core::LogContext().add("actions", actions.size()));

            for (auto it = actions.rbegin(); it != actions.rend(); ++it)
            {
                revert_action(*it, report);
            }

            if (!report.clean())
            {
                logger_->warning("Revert finished with failures", core::LogContext().add("summary", report.summary()));
            }
            return report;
        }

        AppliedAction HotspotConfigurator::guarded_step(AppliedAction action,
                                                        const std::function<void(AppliedAction &)> &body)
        {
            try
            {
                body(action);
            }
            catch (const core::ConfigurationError &e)
            {
                logger_->warning("Configuration step failed, undoing partial work",
                                 core::LogContext().add("step", to_string(action.type)).add("error", e.what()));
                RevertReport report;
                revert_action(action, report);
                for (const auto &failure : report.failures)
                {
                    logger_->error("Partial undo failed", core::LogContext().add("detail", failure));
                }
                throw;
            }
            return action;
        }

        // Step 1: access point profile

        AppliedAction HotspotConfigurator::create_access_point(const ConfigurationPlan &plan)
        {
            const auto &request = plan.request;
            const std::string &conn = network_.connection_name;

            AppliedAction action{ActionType::AccessPointProfile,
                                 {{"connection", conn}, {"interface", plan.hotspot_interface}}};

            return guarded_step(action, [&](AppliedAction &)
                                {
                run_checked({"nmcli", "radio", "wifi", "on"}, "Enabling the Wi-Fi radio");

                if (connection_exists(conn))
                {
                    logger_->debug("Removing leftover hotspot profile", core::LogContext().add("connection", conn));
                    run_checked({"nmcli", "connection", "delete", conn}, "Removing leftover hotspot profile");
                }

                std::vector<std::string> command = {
                    "nmcli", "connection", "add",
                    "type", "wifi",
                    "ifname", plan.hotspot_interface,
                    "con-name", conn,
                    "autoconnect", "no",
                    "wifi.mode", "ap",
                    "wifi.ssid", request.ssid,
                    "wifi.band", core::to_string(request.band),
                    "wifi.hidden", request.hidden ? "yes" : "no"};

                if (!request.open_network)
                {
                    // WPA2 (RSN) with AES-CCMP only, WPS disabled
                    command = concat(command, {
                        "wifi-sec.key-mgmt", "wpa-psk",
                        "wifi-sec.psk", request.passphrase.value_or(""),
                        "wifi-sec.proto", "rsn",
                        "wifi-sec.pairwise", "ccmp",
                        "wifi-sec.group", "ccmp",
                        "wifi-sec.wps-method", "disabled"});
                }

                command = concat(command, {
                    "ipv4.method", "shared",
                    "ipv4.addresses", network_.gateway_address + "/" + std::to_string(network_.prefix_length),
                    "ipv6.method", "ignore"});

                logger_->debug("Creating hotspot connection", core::LogContext().add("command", describe_command(command)));
                run_checked(command, "Creating the access point profile");

                const auto activation = timeouts_.activation();
                const auto wait_seconds = std::chrono::duration_cast<std::chrono::seconds>(activation).count();
                run_checked({"nmcli", "--wait", std::to_string(wait_seconds > 0 ? wait_seconds : 1),
                             "connection", "up", conn, "ifname", plan.hotspot_interface},
                            "Activating the access point", activation + timeouts_.command()); });
        }

        void HotspotConfigurator::remove_access_point(const AppliedAction &action, RevertReport &report)
        {
            const std::string conn = action.get("connection");
            if (!connection_exists(conn))
            {
                logger_->debug("Hotspot profile already gone", core::LogContext().add("connection", conn));
                return;
            }

            auto active = run({"nmcli", "-t", "-f", "NAME", "connection", "show", "--active"});
            std::istringstream lines(active.output);
            std::string line;
            bool is_active = false;
            while (std::getline(lines, line))
            {
                if (trim(line) == conn)
                    is_active = true;
            }
            if (is_active)
            {
                attempt({"nmcli", "connection", "down", conn}, "Deactivating the access point", report);
            }
            attempt({"nmcli", "connection", "delete", conn}, "Deleting the access point profile", report);
        }

        // Step 2: forwarding and NAT

        AppliedAction HotspotConfigurator::enable_nat(const ConfigurationPlan &plan)
        {
            const std::string &hotspot = plan.hotspot_interface;
            const std::string &upstream = plan.upstream_interface;

            if (plan.request.route_via_vpn && upstream.empty())
            {
                throw core::ConfigurationError(
                    "VPN routing requested but no VPN tunnel is up; refusing to route outside the tunnel");
            }

            AppliedAction action{ActionType::Nat,
                                 {{"hotspot", hotspot},
                                  {"upstream", upstream},
                                  {"subnet", network_.hotspot_subnet()},
                                  {"postrouting_chain", postrouting_chain()},
                                  {"forward_chain", forward_chain()}}};

            return guarded_step(action, [&](AppliedAction &a)
                                {
                auto current = run({"sysctl", "-n", "net.ipv4.ip_forward"});
                if (!current.ok())
                {
                    throw core::ConfigurationError(describe_failure("Reading net.ipv4.ip_forward", current, timeouts_.command()));
                }
                a.data["ip_forward"] = trim(current.output);
                run_checked({"sysctl", "-w", "net.ipv4.ip_forward=1"}, "Enabling IP forwarding");

                fill_postrouting_chain(upstream);
                hook_chain("nat", "POSTROUTING", {}, postrouting_chain());

                fill_forward_chain(hotspot, upstream);
                hook_chain("filter", "FORWARD", {}, forward_chain()); });
        }

        void HotspotConfigurator::fill_postrouting_chain(const std::string &upstream)
        {
            // Masquerade hotspot clients behind the upstream
            const std::string chain = postrouting_chain();
            reset_chain("nat", chain);
            append_rule("nat", chain,
                        concat({"-s", network_.hotspot_subnet()},
                               concat(iface_match("-o", upstream), {"-j", "MASQUERADE"})));
        }

        void HotspotConfigurator::fill_forward_chain(const std::string &hotspot, const std::string &upstream)
        {
            const std::string chain = forward_chain();
            reset_chain("filter", chain);
            append_rule("filter", chain,
                        concat(concat(iface_match("-i", upstream), {"-o", hotspot}),
                               {"-m", "conntrack", "--ctstate", "RELATED,ESTABLISHED", "-j", "ACCEPT"}));
            append_rule("filter", chain,
                        concat(concat({"-i", hotspot}, iface_match("-o", upstream)), {"-j", "ACCEPT"}));
            append_rule("filter", chain,
                        concat(concat({"-i", hotspot}, iface_match("-o", upstream)),
                               {"-p", "tcp", "--tcp-flags", "SYN,RST", "SYN", "-j", "TCPMSS", "--clamp-mss-to-pmtu"}));
        }

        void HotspotConfigurator::reroute_nat(AppliedAction &nat, const std::string &upstream)
        {
            if (nat.type != ActionType::Nat)
            {
                throw core::ConfigurationError("Rerouting requires the NAT action, got " + to_string(nat.type));
            }

            const std::string hotspot = nat.get("hotspot");
            logger_->info("Rerouting hotspot traffic",
                          core::LogContext().add("from", nat.get("upstream")).add("to", upstream));

            // The chains stay hooked where they are, so the MAC filter keeps its place in front of them
            fill_postrouting_chain(upstream);
            fill_forward_chain(hotspot, upstream);
            nat.data["upstream"] = upstream;
        }

        void HotspotConfigurator::disable_nat(const AppliedAction &action, RevertReport &report)
        {
            const std::string postrouting = action.get("postrouting_chain");
            const std::string forward = action.get("forward_chain");

            if (!postrouting.empty())
            {
                unhook_chain("nat", "POSTROUTING", {}, postrouting, report);
                delete_chain("nat", postrouting, report);
            }
            if (!forward.empty())
            {
                unhook_chain("filter", "FORWARD", {}, forward, report);
                delete_chain("filter", forward, report);
            }

            const std::string previous = action.get("ip_forward");
            if (!previous.empty() && previous != "1")
            {
                attempt({"sysctl", "-w", "net.ipv4.ip_forward=" + previous}, "Restoring IP forwarding", report);
            }
        }

        // Step 3: MAC filter

        AppliedAction HotspotConfigurator::apply_mac_filter(const ConfigurationPlan &plan)
        {
            const auto &request = plan.request;
            const std::string chain = mac_filter_chain();

            AppliedAction action{ActionType::MacFilter,
                                 {{"hotspot", plan.hotspot_interface},
                                  {"chain", chain},
                                  {"mode", core::to_string(request.mac_filter_mode)}}};

            return guarded_step(action, [&](AppliedAction &)
                                {
                reset_chain("filter", chain);
                const bool allow_list = request.mac_filter_mode == core::MacFilterMode::AllowList;
                for (const auto &mac : request.mac_addresses)
                {
                    append_rule("filter", chain, {"-m", "mac", "--mac-source", mac, "-j", allow_list ? "RETURN" : "DROP"});
                }
                if (allow_list)
                {
                    append_rule("filter", chain, {"-j", "DROP"});
                }
                hook_chain("filter", "FORWARD", {"-i", plan.hotspot_interface}, chain); });
        }

        void HotspotConfigurator::remove_mac_filter(const AppliedAction &action, RevertReport &report)
        {
            const std::string chain = action.get("chain");
            unhook_chain("filter", "FORWARD", {"-i", action.get("hotspot")}, chain, report);
            delete_chain("filter", chain, report);
        }

        // Step 4: DNS override

        AppliedAction HotspotConfigurator::apply_dns_override(const ConfigurationPlan &plan)
        {
            const std::string chain = dns_chain();
            const std::string address = plan.request.dns_override.value_or("");

            AppliedAction action{ActionType::DnsOverride,
                                 {{"hotspot", plan.hotspot_interface},
                                  {"chain", chain},
                                  {"address", address}}};

            return guarded_step(action, [&](AppliedAction &)
                                {
                reset_chain("nat", chain);
                for (const char *proto : {"udp", "tcp"})
                {
                    append_rule("nat", chain, {"-p", proto, "--dport", "53", "-j", "DNAT", "--to-destination", address});
                }
                hook_chain("nat", "PREROUTING", {"-i", plan.hotspot_interface}, chain); });
        }

        void HotspotConfigurator::remove_dns_override(const AppliedAction &action, RevertReport &report)
        {
            const std::string chain = action.get("chain");
            unhook_chain("nat", "PREROUTING", {"-i", action.get("hotspot")}, chain, report);
            delete_chain("nat", chain, report);
        }

        void HotspotConfigurator::revert_action(const AppliedAction &action, RevertReport &report)
        {
            report.attempted++;
            logger_->debug("Reverting step", core::LogContext().add("step", to_string(action.type)));

            switch (action.type)
            {
            case ActionType::AccessPointProfile:
                remove_access_point(action, report);
                break;
            case ActionType::Nat:
                disable_nat(action, report);
                break;
            case ActionType::MacFilter:
                remove_mac_filter(action, report);
                break;
            case ActionType::DnsOverride:
                remove_dns_override(action, report);
                break;
            }
        }

        // nmcli helpers

        void HotspotConfigurator::ensure_network_manager()
        {
            auto result = run({"nmcli", "-t", "-f", "RUNNING", "general"});
            if (!result.ok() || trim(result.output) != "running")
            {
                logger_->error("NetworkManager is not available",
                               core::LogContext()
                                   .add("exit_code", result.exit_code)
                                   .add("timed_out", result.timed_out)
                                   .add("output", trim(result.output)));
                throw core::ConfigurationError(
                    "NetworkManager is not running. Start it with: sudo systemctl start NetworkManager");
            }
        }

        bool HotspotConfigurator::connection_exists(const std::string &connection)
        {
            if (connection.empty())
                return false;
            return run({"nmcli", "connection", "show", connection}).ok();
        }

        // iptables helpers

        std::vector<std::string> HotspotConfigurator::iptables(const std::string &table, std::vector<std::string> args) const
        {
            return concat({"iptables", "-w", "-t", table}, args);
        }

        bool HotspotConfigurator::chain_exists(const std::string &table, const std::string &chain)
        {
            return run(iptables(table, {"-n", "-L", chain})).ok();
        }

        void HotspotConfigurator::reset_chain(const std::string &table, const std::string &chain)
        {
            if (chain_exists(table, chain))
                run_checked(iptables(table, {"-F", chain}), "Flushing chain " + chain);
            else
                run_checked(iptables(table, {"-N", chain}), "Creating chain " + chain);
        }

        void HotspotConfigurator::append_rule(const std::string &table, const std::string &chain,
                                              const std::vector<std::string> &rule)
        {
            run_checked(iptables(table, concat({"-A", chain}, rule)), "Adding rule to " + chain);
        }

        void HotspotConfigurator::hook_chain(const std::string &table, const std::string &builtin,
                                             const std::vector<std::string> &match, const std::string &chain)
        {
            const auto jump = concat(match, {"-j", chain});
            if (run(iptables(table, concat({"-C", builtin}, jump))).ok())
            {
                logger_->debug("Chain already hooked", core::LogContext().add("chain", chain).add("builtin", builtin));
                return;
            }
            run_checked(iptables(table, concat({"-I", builtin, "1"}, jump)), "Hooking " + chain + " into " + builtin);
        }

        void HotspotConfigurator::unhook_chain(const std::string &table, const std::string &builtin,
                                               const std::vector<std::string> &match, const std::string &chain,
                                               RevertReport &report)
        {
            const auto jump = concat(match, {"-j", chain});
            for (int i = 0; i < MAX_UNHOOK_ATTEMPTS; ++i)
            {
                if (!run(iptables(table, concat({"-C", builtin}, jump))).ok())
                    return;

                const size_t failures_before = report.failures.size();
                attempt(iptables(table, concat({"-D", builtin}, jump)), "Unhooking " + chain + " from " + builtin, report);
                if (report.failures.size() != failures_before)
                    return;
            }
        }

        void HotspotConfigurator::delete_chain(const std::string &table, const std::string &chain, RevertReport &report)
        {
            if (!chain_exists(table, chain))
                return;
            attempt(iptables(table, {"-F", chain}), "Flushing chain " + chain, report);
            attempt(iptables(table, {"-X", chain}), "Deleting chain " + chain, report);
        }

        // Command helpers

        CommandResult HotspotConfigurator::run(const std::vector<std::string> &argv)
        {
            return runner_.run(argv, timeouts_.command());
        }

        void HotspotConfigurator::run_checked(const std::vector<std::string> &argv, const std::string &what,
                                              std::chrono::milliseconds timeout)
        {
            auto result = runner_.run(argv, timeout);
            if (!result.ok())
            {
                logger_->error("Command failed",
                               core::LogContext()
                                   .add("command", describe_command(argv))
                                   .add("exit_code", result.exit_code)
                                   .add("timed_out", result.timed_out)
                                   .add("output", trim(result.output)));
                throw core::ConfigurationError(describe_failure(what, result, timeout));
            }
        }

        void HotspotConfigurator::run_checked(const std::vector<std::string> &argv, const std::string &what)
        {
            run_checked(argv, what, timeouts_.command());
        }

        void HotspotConfigurator::attempt(const std::vector<std::string> &argv, const std::string &what,
                                          RevertReport &report)
        {
            auto result = run(argv);
            if (!result.ok())
            {
                report.failures.push_back(describe_failure(what, result, timeouts_.command()));
            }
        }

    } // namespace infrastructure
} // namespace apguard
