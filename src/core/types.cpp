#include "core/types.hpp"

#include <algorithm>

namespace apguard
{
    namespace core
    {

        std::string to_string(InterfaceType type)
        {
            switch (type)
            {
            case InterfaceType::BuiltinWifi:
                return "builtin_wifi";
            case InterfaceType::UsbWifi:
                return "usb_wifi";
            case InterfaceType::Ethernet:
                return "ethernet";
            case InterfaceType::MobileBroadband:
                return "mobile_broadband";
            case InterfaceType::PhoneTether:
                return "phone_tether";
            case InterfaceType::VpnTunnel:
                return "vpn_tunnel";
            case InterfaceType::Bridge:
                return "bridge";
            case InterfaceType::Unknown:
                return "unknown";
            }
            return "unknown";
        }

        std::string to_string(OperatingMode mode)
        {
            switch (mode)
            {
            case OperatingMode::Managed:
                return "managed";
            case OperatingMode::AccessPoint:
                return "ap";
            case OperatingMode::Monitor:
                return "monitor";
            case OperatingMode::Other:
                return "other";
            case OperatingMode::Unknown:
                return "unknown";
            }
            return "unknown";
        }

        std::string to_string(Band band)
        {
            return band == Band::Band5GHz ? "a" : "bg";
        }

        std::string to_string(MacFilterMode mode)
        {
            switch (mode)
            {
            case MacFilterMode::AllowList:
                return "allow";
            case MacFilterMode::BlockList:
                return "block";
            case MacFilterMode::None:
                return "none";
            }
            return "none";
        }

        std::string to_string(Phase phase)
        {
            switch (phase)
            {
            case Phase::Idle:
                return "idle";
            case Phase::Validating:
                return "validating";
            case Phase::Starting:
                return "starting";
            case Phase::Active:
                return "active";
            case Phase::Stopping:
                return "stopping";
            case Phase::Error:
                return "error";
            }
            return "error";
        }

        std::optional<Band> band_from_string(const std::string &value)
        {
            if (value == "g" || value == "bg" || value == "2.4")
                return Band::Band2_4GHz;
            if (value == "a" || value == "5")
                return Band::Band5GHz;
            return std::nullopt;
        }

        std::optional<MacFilterMode> mac_filter_mode_from_string(const std::string &value)
        {
            if (value == "none")
                return MacFilterMode::None;
            if (value == "allow")
                return MacFilterMode::AllowList;
            if (value == "block")
                return MacFilterMode::BlockList;
            return std::nullopt;
        }

        std::optional<Phase> phase_from_string(const std::string &value)
        {
            static const Phase phases[] = {Phase::Idle, Phase::Validating, Phase::Starting,
                                           Phase::Active, Phase::Stopping, Phase::Error};
            for (Phase phase : phases)
            {
                if (to_string(phase) == value)
                    return phase;
            }
            return std::nullopt;
        }

        OperatingMode operating_mode_from_iw(const std::string &value)
        {
            if (value == "managed")
                return OperatingMode::Managed;
            if (value == "AP" || value == "AP/VLAN")
                return OperatingMode::AccessPoint;
            if (value == "monitor")
                return OperatingMode::Monitor;
            if (value.empty())
                return OperatingMode::Unknown;
            return OperatingMode::Other;
        }

        bool is_wireless(InterfaceType type)
        {
            return type == InterfaceType::BuiltinWifi || type == InterfaceType::UsbWifi;
        }

        nlohmann::json NetworkInterface::to_json() const
        {
            auto optional_flag = [](const std::optional<bool> &value) -> nlohmann::json
            {
                if (!value)
                    return nullptr;
                return *value;
            };

            return nlohmann::json{
                {"name", name},
                {"type", to_string(type)},
                {"driver", driver},
                {"capabilities", {{"ap", optional_flag(capabilities.ap_mode)}, {"5ghz", optional_flag(capabilities.band_5ghz)}}},
                {"up", live.admin_up},
                {"mode", to_string(live.mode)},
                {"rfkillBlocked", live.rfkill_blocked},
                {"connection", live.connected_network},
                {"hasAddress", live.has_address},
                {"defaultRoute", live.has_default_route()}};
        }

        const NetworkInterface *find_interface(const Inventory &inventory, const std::string &name)
        {
            auto it = std::find_if(inventory.begin(), inventory.end(),
                                   [&name](const NetworkInterface &iface)
                                   { return iface.name == name; });
            return it == inventory.end() ? nullptr : &(*it);
        }

    } // namespace core
} // namespace apguard
