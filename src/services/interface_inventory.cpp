#include "services/interface_inventory.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <initializer_list>

namespace apguard
{
    namespace services
    {

        namespace
        {
            constexpr int ARPHRD_ETHER = 1;

            // ARPHRD_* values that only virtual tunnel devices use. ARPHRD_NONE
            // is not one of them: raw-IP modems (qmi_wwan, mhi_net) report it too.
            constexpr int ARPHRD_PPP = 512;
            constexpr int ARPHRD_TUNNEL = 768;
            constexpr int ARPHRD_TUNNEL6 = 769;
            constexpr int ARPHRD_IPGRE = 778;

            bool has_prefix(const std::string &name, std::initializer_list<const char *> prefixes)
            {
                for (const char *prefix : prefixes)
                {
                    if (name.rfind(prefix, 0) == 0)
                        return true;
                }
                return false;
            }

            bool is_one_of(const std::string &value, std::initializer_list<const char *> options)
            {
                for (const char *option : options)
                {
                    if (value == option)
                        return true;
                }
                return false;
            }

            int type_priority(core::InterfaceType type)
            {
                return static_cast<int>(type);
            }
        } // namespace

        core::InterfaceType classify(const infrastructure::InterfaceAttributes &attrs)
        {
            using core::InterfaceType;
            const std::string &name = attrs.name;

            // Tunnels and bridges
            if (attrs.tun ||
                is_one_of(attrs.devtype, {"wireguard", "ppp"}) ||
                is_one_of(attrs.nm_type, {"tun", "wireguard", "vpn", "ip-tunnel", "ppp"}) ||
                attrs.arp_type == ARPHRD_PPP ||
                attrs.arp_type == ARPHRD_TUNNEL || attrs.arp_type == ARPHRD_TUNNEL6 ||
                attrs.arp_type == ARPHRD_IPGRE ||
                has_prefix(name, {"tun", "tap", "wg", "ppp", "vpn"}))
            {
                return InterfaceType::VpnTunnel;
            }
            if (attrs.bridge || attrs.devtype == "bridge" || attrs.nm_type == "bridge" ||
                has_prefix(name, {"br", "virbr", "docker"}))
            {
                return InterfaceType::Bridge;
            }

            // Cellular modems and tethered phones
            if (attrs.devtype == "wwan" || is_one_of(attrs.nm_type, {"gsm", "cdma"}) ||
                is_one_of(attrs.driver, {"qmi_wwan", "cdc_mbim", "huawei_cdc_ncm", "mhi_net", "ipa"}) ||
                has_prefix(name, {"wwan", "ww"}))
            {
                return InterfaceType::MobileBroadband;
            }
            if (is_one_of(attrs.driver, {"rndis_host", "ipheth"}) ||
                (is_one_of(attrs.driver, {"cdc_ether", "cdc_ncm"}) && has_prefix(name, {"usb"})))
            {
                return InterfaceType::PhoneTether;
            }

            // Wi-Fi P2P devices are not usable as an AP or an uplink
            if (attrs.nm_type == "wifi-p2p")
            {
                return InterfaceType::Unknown;
            }

            if (attrs.wireless || attrs.devtype == "wlan" || attrs.nm_type == "wifi")
            {
                if (attrs.bus == "usb" || has_prefix(name, {"wlx"}))
                    return InterfaceType::UsbWifi;
                return InterfaceType::BuiltinWifi;
            }

            if (attrs.nm_type == "ethernet" ||
                (attrs.arp_type == ARPHRD_ETHER && !attrs.bus.empty()) ||
                has_prefix(name, {"eth", "en"}))
            {
                return InterfaceType::Ethernet;
            }

            return InterfaceType::Unknown;
        }

        InterfaceInventory::InterfaceInventory(infrastructure::InterfaceProbe &probe)
            : probe_(probe), logger_(core::get_logger("InterfaceInventory"))
        {
        }

        core::Inventory InterfaceInventory::list_interfaces()
        {
            core::Inventory inventory;

            for (const auto &name : probe_.interface_names())
            {
                core::NetworkInterface iface;
                iface.name = name;

                try
                {
                    auto attrs = probe_.query(name);
                    iface.type = classify(attrs);
                    iface.driver = attrs.driver;
                    iface.capabilities = attrs.capabilities;
                    iface.live = attrs.live;
                }
                catch (const std::exception &e)
                {
                    logger_->warning("Interface could not be queried",
                                     core::LogContext().add("interface", name).add("error", e.what()));
                    iface.type = core::InterfaceType::Unknown;
                    iface.capabilities = core::InterfaceCapabilities{};
                }

                inventory.push_back(iface);
            }

            auto routes = probe_.default_route_interfaces();
            for (size_t rank = 0; rank < routes.size(); ++rank)
            {
                for (auto &iface : inventory)
                {
                    if (iface.name == routes[rank])
                        iface.live.default_route_rank = static_cast<int>(rank);
                }
            }

            std::stable_sort(inventory.begin(), inventory.end(),
                             [](const core::NetworkInterface &a, const core::NetworkInterface &b)
                             {
                                 if (a.type != b.type)
                                     return type_priority(a.type) < type_priority(b.type);
                                 return a.name < b.name;
                             });

            logger_->debug("Inventory refreshed", core::LogContext().add("interfaces", inventory.size()));
            return inventory;
        }

    } // namespace services
} // namespace apguard
