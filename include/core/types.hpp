#ifndef APGUARD_CORE_TYPES_HPP
#define APGUARD_CORE_TYPES_HPP

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace apguard
{
    namespace core
    {

        /**
         * Closed set of interface classes. Declaration order is the sort
         * priority used by the inventory.
         */
        enum class InterfaceType
        {
            BuiltinWifi,
            UsbWifi,
            Ethernet,
            MobileBroadband,
            PhoneTether,
            VpnTunnel,
            Bridge,
            Unknown
        };

        enum class OperatingMode
        {
            Unknown,
            Managed,
            AccessPoint,
            Monitor,
            Other
        };

        enum class Band
        {
            Band2_4GHz, // nmcli "bg"
            Band5GHz    // nmcli "a"
        };

        enum class MacFilterMode
        {
            None,
            AllowList,
            BlockList
        };

        enum class Phase
        {
            Idle,
            Validating,
            Starting,
            Active,
            Stopping,
            Error
        };

        std::string to_string(InterfaceType type);
        std::string to_string(OperatingMode mode);
        std::string to_string(Band band);
        std::string to_string(MacFilterMode mode);
        std::string to_string(Phase phase);

        std::optional<Band> band_from_string(const std::string &value);
        std::optional<MacFilterMode> mac_filter_mode_from_string(const std::string &value);
        std::optional<Phase> phase_from_string(const std::string &value);
        OperatingMode operating_mode_from_iw(const std::string &value);

        bool is_wireless(InterfaceType type);

        /**
         * Capabilities reported by the driver. nullopt means "could not be
         * determined", which is not the same as "unsupported".
         */
        struct InterfaceCapabilities
        {
            std::optional<bool> ap_mode;
            std::optional<bool> band_5ghz;

            bool known() const { return ap_mode.has_value() && band_5ghz.has_value(); }
        };

        struct LiveAttributes
        {
            bool admin_up = false;
            OperatingMode mode = OperatingMode::Unknown;
            bool rfkill_blocked = false;
            std::string connected_network; // NetworkManager connection name, empty if none
            bool has_address = false;      // IPv4 address assigned
            int default_route_rank = -1;   // position in the kernel's route preference, -1 if none

            bool has_default_route() const { return default_route_rank >= 0; }
        };

        /**
         * One network interface as seen by a single inventory pass
         */
        struct NetworkInterface
        {
            std::string name;
            InterfaceType type = InterfaceType::Unknown;
            std::string driver;
            InterfaceCapabilities capabilities;
            LiveAttributes live;

            bool usable_uplink() const { return live.admin_up && live.has_address; }

            nlohmann::json to_json() const;
        };

        using Inventory = std::vector<NetworkInterface>;

        const NetworkInterface *find_interface(const Inventory &inventory, const std::string &name);

    } // namespace core
} // namespace apguard

#endif // APGUARD_CORE_TYPES_HPP
