#include "services/safety_validator.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace apguard
{
    namespace services
    {

        namespace
        {
            // Interfaces currently giving the operator internet access
            std::vector<const core::NetworkInterface *> connectivity_providers(const core::Inventory &inventory)
            {
                std::vector<const core::NetworkInterface *> providers;
                for (const auto &iface : inventory)
                {
                    if (iface.type == core::InterfaceType::VpnTunnel)
                        continue;
                    if (iface.live.has_default_route() && iface.usable_uplink())
                        providers.push_back(&iface);
                }
                return providers;
            }

            bool has_non_ascii(const std::string &value)
            {
                return std::any_of(value.begin(), value.end(),
                                   [](char c)
                                   { return static_cast<unsigned char>(c) > 0x7f; });
            }
        } // namespace

        std::string ValidationResult::blocking_summary() const
        {
            std::string summary;
            for (const auto &violation : blocking)
            {
                if (!summary.empty())
                    summary += "; ";
                summary += violation.message;
            }
            return summary;
        }

        std::vector<std::string> ValidationResult::warning_messages() const
        {
            std::vector<std::string> messages;
            for (const auto &warning : warnings)
            {
                messages.push_back(warning.message);
            }
            return messages;
        }

        ResolvedInterfaces resolve_interfaces(const core::SessionRequest &request,
                                              const core::Inventory &inventory)
        {
            ResolvedInterfaces resolved;

            // Hotspot
            if (!request.hotspot_interface.empty())
            {
                resolved.hotspot = request.hotspot_interface;
            }
            else
            {
                const core::NetworkInterface *fallback = nullptr;
                for (const auto &iface : inventory)
                {
                    if (!core::is_wireless(iface.type))
                        continue;
                    if (!fallback)
                        fallback = &iface;
                    const bool ap_possible = iface.capabilities.ap_mode.value_or(true);
                    if (ap_possible && !iface.live.has_default_route() &&
                        iface.live.mode != core::OperatingMode::Monitor)
                    {
                        resolved.hotspot = iface.name;
                        break;
                    }
                }
                if (resolved.hotspot.empty() && fallback)
                {
                    resolved.hotspot = fallback->name;
                }
            }

            // Upstream
            if (request.route_via_vpn)
            {
                for (const auto &iface : inventory)
                {
                    if (iface.type != core::InterfaceType::VpnTunnel || !iface.live.admin_up)
                        continue;
                    if (!request.internet_interface.empty() && iface.name != request.internet_interface)
                        continue;
                    resolved.upstream = iface.name;
                    break;
                }
                return resolved;
            }

            if (!request.internet_interface.empty())
            {
                resolved.upstream = request.internet_interface;
                return resolved;
            }

            const core::NetworkInterface *best = nullptr;
            for (const auto &iface : inventory)
            {
                if (iface.name == resolved.hotspot || !iface.live.has_default_route())
                    continue;
                if (request.exclude_vpn && iface.type == core::InterfaceType::VpnTunnel)
                    continue;
                if (!best || iface.live.default_route_rank < best->live.default_route_rank)
                    best = &iface;
            }
            if (best)
            {
                resolved.upstream = best->name;
            }
            return resolved;
        }

        SafetyValidator::SafetyValidator()
            : logger_(core::get_logger("SafetyValidator"))
        {
        }

        ValidationResult SafetyValidator::validate(const core::SessionRequest &request,
                                                   const core::Inventory &inventory,
                                                   const OverrideFlags &overrides) const
        {
            ValidationResult result;
            result.interfaces = resolve_interfaces(request, inventory);

            const auto *hotspot = core::find_interface(inventory, result.interfaces.hotspot);
            if (!hotspot)
            {
                const std::string message = result.interfaces.hotspot.empty()
                                                ? "No wireless interface available for the hotspot"
                                                : "Interface " + result.interfaces.hotspot + " not found";
                result.blocking.push_back({core::ErrorKind::HardwareError, "interface_missing", message});
                return result;
            }

            check_hotspot_hardware(request, *hotspot, result);
            check_connectivity(request, inventory, *hotspot, overrides, result);

            if (has_non_ascii(request.ssid))
            {
                result.warnings.push_back({"ssid_non_ascii",
                                           "SSID contains non-ASCII characters; some clients may not display it"});
            }

            logger_->info("Validation finished",
                          core::LogContext()
                              .add("hotspot", result.interfaces.hotspot)
                              .add("upstream", result.interfaces.upstream)
                              .add("blocking", result.blocking.size())
                              .add("warnings", result.warnings.size()));
            return result;
        }

        void SafetyValidator::check_hotspot_hardware(const core::SessionRequest &request,
                                                     const core::NetworkInterface &hotspot,
                                                     ValidationResult &result) const
        {
            const std::string &name = hotspot.name;

            if (!core::is_wireless(hotspot.type))
            {
                result.blocking.push_back({core::ErrorKind::HardwareError, "ap_mode",
                                           name + " is not a wireless interface and lacks AP-mode capability"});
                return;
            }

            if (hotspot.live.rfkill_blocked)
            {
                result.blocking.push_back({core::ErrorKind::HardwareError, "rfkill",
                                           name + " is blocked by rfkill"});
            }

            if (!hotspot.capabilities.ap_mode)
            {
                result.warnings.push_back({"ap_mode_unknown",
                                           "Could not determine whether " + name + " supports AP mode"});
            }
            else if (!*hotspot.capabilities.ap_mode)
            {
                result.blocking.push_back({core::ErrorKind::HardwareError, "ap_mode",
                                           name + " does not support AP mode"});
            }

            if (hotspot.live.mode == core::OperatingMode::Monitor)
            {
                result.blocking.push_back({core::ErrorKind::HardwareError, "monitor_mode",
                                           name + " is in monitor mode"});
            }

            if (request.band == core::Band::Band5GHz)
            {
                if (!hotspot.capabilities.band_5ghz)
                {
                    result.warnings.push_back({"band_unknown",
                                               "Could not determine whether " + name + " supports 5GHz"});
                }
                else if (!*hotspot.capabilities.band_5ghz)
                {
                    result.blocking.push_back({core::ErrorKind::HardwareError, "band",
                                               name + " does not support the 5GHz band"});
                }
            }
        }

        void SafetyValidator::check_connectivity(const core::SessionRequest &request,
                                                 const core::Inventory &inventory,
                                                 const core::NetworkInterface &hotspot,
                                                 const OverrideFlags &overrides,
                                                 ValidationResult &result) const
        {
            const std::string &upstream_name = result.interfaces.upstream;

            if (!upstream_name.empty() && upstream_name == hotspot.name)
            {
                result.blocking.push_back({core::ErrorKind::SafetyBlock, "same_interface",
                                           "Internet source " + upstream_name + " cannot also host the hotspot"});
                return;
            }

            // Single-adapter lockout
            bool locked_out = false;
            auto providers = connectivity_providers(inventory);
            bool hotspot_provides = std::any_of(providers.begin(), providers.end(),
                                                [&](const core::NetworkInterface *iface)
                                                { return iface->name == hotspot.name; });
            if (hotspot_provides)
            {
                bool alternate = std::any_of(providers.begin(), providers.end(),
                                             [&](const core::NetworkInterface *iface)
                                             { return iface->name != hotspot.name; });
                const auto *explicit_upstream = core::find_interface(inventory, request.internet_interface);
                if (explicit_upstream && explicit_upstream->name != hotspot.name &&
                    explicit_upstream->type != core::InterfaceType::VpnTunnel &&
                    explicit_upstream->usable_uplink())
                {
                    alternate = true;
                }
                locked_out = !alternate;
            }

            if (locked_out)
            {
                const std::string message = hotspot.name +
                                            " is your only internet connection; starting the hotspot would disconnect you";
                if (overrides.force_single_interface)
                {
                    result.warnings.push_back({"single_adapter_lockout", message});
                }
                else
                {
                    result.blocking.push_back({core::ErrorKind::SafetyBlock, "single_adapter_lockout",
                                               message + " (use --force-single-interface to override)"});
                }
            }
            else if (!hotspot.live.connected_network.empty())
            {
                result.warnings.push_back({"hotspot_connected",
                                           hotspot.name + " will be disconnected from " +
                                               hotspot.live.connected_network});
            }

            // Upstream health
            if (upstream_name.empty())
            {
                if (!request.route_via_vpn)
                {
                    result.warnings.push_back({"no_upstream",
                                               "No internet source found; clients will have no internet access"});
                }
                return;
            }

            const auto *upstream = core::find_interface(inventory, upstream_name);
            if (!upstream)
            {
                result.warnings.push_back({"upstream_down", "Internet source " + upstream_name + " not found"});
            }
            else if (!upstream->live.admin_up)
            {
                result.warnings.push_back({"upstream_down", "Internet source " + upstream_name + " is down"});
            }
            else if (!upstream->live.has_address && upstream->type != core::InterfaceType::VpnTunnel)
            {
                result.warnings.push_back({"upstream_down",
                                           "Internet source " + upstream_name + " has no IPv4 address"});
            }
        }

    } // namespace services
} // namespace apguard
