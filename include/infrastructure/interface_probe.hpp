#ifndef APGUARD_INFRASTRUCTURE_INTERFACE_PROBE_HPP
#define APGUARD_INFRASTRUCTURE_INTERFACE_PROBE_HPP

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <chrono>

#include "core/types.hpp"

namespace apguard
{
    namespace core
    {
        class Logger;
    }

    namespace infrastructure
    {
        class CommandRunner;

        /**
         * Raw, unclassified facts about one interface
         */
        struct InterfaceAttributes
        {
            std::string name;

            // Identity (classification inputs)
            std::string driver;  // kernel driver module, empty for virtual devices
            std::string devtype; // DEVTYPE from uevent ("wlan", "bridge", "wwan", "wireguard", ...)
            std::string bus;     // "usb", "pci", "sdio", "platform", empty if virtual
            std::string nm_type; // NetworkManager device type, empty if unmanaged/unknown
            int arp_type = 0;    // ARPHRD_* from /sys/class/net/<if>/type
            bool wireless = false;
            bool tun = false;
            bool bridge = false;
            std::string phy;

            core::InterfaceCapabilities capabilities;
            core::LiveAttributes live;
        };

        /**
         * Read-only access to the host's network interfaces
         */
        class InterfaceProbe
        {
        public:
            virtual ~InterfaceProbe() = default;

            // Starts a new pass; anything cached by a previous pass is dropped
            virtual std::vector<std::string> interface_names() = 0;

            // Throws if the interface cannot be queried
            virtual InterfaceAttributes query(const std::string &name) = 0;

            // Interfaces carrying a default route, most preferred first
            virtual std::vector<std::string> default_route_interfaces() = 0;
        };

        /**
         * Linux implementation: sysfs, iw, nmcli, ip and getifaddrs
         */
        class LinuxInterfaceProbe : public InterfaceProbe
        {
        public:
            LinuxInterfaceProbe(std::string sysfs_root, CommandRunner &runner,
                                std::chrono::milliseconds command_timeout);

            std::vector<std::string> interface_names() override;
            InterfaceAttributes query(const std::string &name) override;
            std::vector<std::string> default_route_interfaces() override;

        private:
            struct NmDevice
            {
                std::string type;
                std::string state;
                std::string connection;
            };

            void refresh_network_manager_devices();
            void refresh_ipv4_addresses();
            bool read_rfkill_blocked(const std::string &iface_dir) const;
            core::InterfaceCapabilities query_capabilities(const std::string &phy);
            core::OperatingMode query_operating_mode(const std::string &name);

            std::string net_dir() const;

            std::string sysfs_root_;
            CommandRunner &runner_;
            std::chrono::milliseconds command_timeout_;
            std::shared_ptr<core::Logger> logger_;

            // Per-pass snapshots
            std::map<std::string, NmDevice> nm_devices_;
            std::set<std::string> ipv4_interfaces_;
        };

        namespace parsers
        {
            // `iw phy <phy> info`
            core::InterfaceCapabilities parse_iw_phy_info(const std::string &output);

            // `iw dev <if> info` -> value of the "type" line
            std::string parse_iw_dev_type(const std::string &output);

            // `nmcli -t` line split honouring "\:" and "\\" escapes
            std::vector<std::string> split_nmcli_terse(const std::string &line);

            // `ip route get` / `ip route show` -> "dev" values in order, de-duplicated
            std::vector<std::string> parse_route_devices(const std::string &output);
        } // namespace parsers

    } // namespace infrastructure
} // namespace apguard

#endif // APGUARD_INFRASTRUCTURE_INTERFACE_PROBE_HPP
