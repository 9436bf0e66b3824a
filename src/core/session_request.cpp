#include "core/session_request.hpp"
#include "core/errors.hpp"
#include "core/net_utils.hpp"

#include <algorithm>
#include <set>

namespace apguard
{
    namespace core
    {

        namespace
        {
            // IEEE 802.11i: a WPA passphrase is 8..63 characters in the range 32..126
            bool is_printable_ascii(const std::string &value)
            {
                return std::all_of(value.begin(), value.end(), [](char c)
                                   { return c >= 0x20 && c <= 0x7e; });
            }
        } // namespace

        void SessionRequest::validate()
        {
            if (ssid.empty() || ssid.size() > MAX_SSID_BYTES)
            {
                throw InvalidArgumentError("SSID must be between 1 and 32 bytes");
            }

            if (open_network)
            {
                if (passphrase)
                {
                    throw InvalidArgumentError("An open network cannot have a password");
                }
            }
            else
            {
                if (!passphrase)
                {
                    throw InvalidArgumentError("A password is required (use --open for an unsecured network)");
                }
                if (!is_printable_ascii(*passphrase))
                {
                    throw InvalidArgumentError("Password may only contain printable ASCII characters");
                }
                if (passphrase->size() < MIN_PASSPHRASE)
                {
                    throw InvalidArgumentError("Password must be at least 8 characters for WPA2 security");
                }
                if (passphrase->size() > MAX_PASSPHRASE)
                {
                    throw InvalidArgumentError("Password must not exceed 63 characters");
                }
            }

            if (route_via_vpn && exclude_vpn)
            {
                throw InvalidArgumentError("VPN routing and VPN exclusion cannot both be requested");
            }

            if (!hotspot_interface.empty() && hotspot_interface == internet_interface)
            {
                throw InvalidArgumentError("Hotspot and internet source must be different interfaces");
            }

            if (dns_override && !net::is_valid_ipv4(*dns_override))
            {
                throw InvalidArgumentError("DNS override must be an IPv4 address: " + *dns_override);
            }

            if (auto_off_minutes &&
                (*auto_off_minutes < MIN_TIMER_MINUTES || *auto_off_minutes > MAX_TIMER_MINUTES))
            {
                throw InvalidArgumentError("Timer must be between 1 and 120 minutes");
            }

            if (mac_filter_mode == MacFilterMode::None && !mac_addresses.empty())
            {
                throw InvalidArgumentError("MAC addresses given without a filter mode");
            }
            if (mac_filter_mode == MacFilterMode::AllowList && mac_addresses.empty())
            {
                throw InvalidArgumentError("An allow-list needs at least one MAC address");
            }

            std::set<std::string> seen;
            std::vector<std::string> normalized;
            for (const auto &mac : mac_addresses)
            {
                if (!net::is_valid_mac(mac))
                {
                    throw InvalidArgumentError("Invalid MAC address: " + mac);
                }
                auto lower = net::normalize_mac(mac);
                if (seen.insert(lower).second)
                {
                    normalized.push_back(lower);
                }
            }
            mac_addresses = std::move(normalized);
        }

        nlohmann::json SessionRequest::to_json(bool include_passphrase) const
        {
            nlohmann::json j{
                {"ssid", ssid},
                {"open", open_network},
                {"interface", hotspot_interface},
                {"internetInterface", internet_interface},
                {"band", to_string(band)},
                {"hidden", hidden},
                {"routeVpn", route_via_vpn},
                {"excludeVpn", exclude_vpn},
                {"macMode", to_string(mac_filter_mode)},
                {"macAddresses", mac_addresses},
                {"forceSingleInterface", force_single_interface}};

            j["dns"] = dns_override ? nlohmann::json(*dns_override) : nlohmann::json(nullptr);
            j["timerMinutes"] = auto_off_minutes ? nlohmann::json(*auto_off_minutes) : nlohmann::json(nullptr);
            if (include_passphrase && passphrase)
            {
                j["password"] = *passphrase;
            }
            return j;
        }

        SessionRequest SessionRequest::from_json(const nlohmann::json &j)
        {
            SessionRequest request;

            try
            {
                if (j.contains("ssid"))
                    request.ssid = j["ssid"];
                if (j.contains("password") && j["password"].is_string())
                    request.passphrase = j["password"].get<std::string>();
                if (j.contains("open"))
                    request.open_network = j["open"];
                if (j.contains("interface"))
                    request.hotspot_interface = j["interface"];
                if (j.contains("internetInterface"))
                    request.internet_interface = j["internetInterface"];
                if (j.contains("band"))
                {
                    auto band = band_from_string(j["band"].get<std::string>());
                    if (!band)
                        throw InvalidArgumentError("Unknown band: " + j["band"].get<std::string>());
                    request.band = *band;
                }
                if (j.contains("hidden"))
                    request.hidden = j["hidden"];
                if (j.contains("dns") && j["dns"].is_string() && !j["dns"].get<std::string>().empty())
                    request.dns_override = j["dns"].get<std::string>();
                if (j.contains("routeVpn"))
                    request.route_via_vpn = j["routeVpn"];
                if (j.contains("excludeVpn"))
                    request.exclude_vpn = j["excludeVpn"];
                if (j.contains("macMode"))
                {
                    auto mode = mac_filter_mode_from_string(j["macMode"].get<std::string>());
                    if (!mode)
                        throw InvalidArgumentError("Unknown MAC filter mode: " + j["macMode"].get<std::string>());
                    request.mac_filter_mode = *mode;
                }
                if (j.contains("macAddresses"))
                    request.mac_addresses = j["macAddresses"].get<std::vector<std::string>>();
                if (j.contains("timerMinutes") && j["timerMinutes"].is_number_integer())
                    request.auto_off_minutes = j["timerMinutes"].get<int>();
                if (j.contains("forceSingleInterface"))
                    request.force_single_interface = j["forceSingleInterface"];
            }
            catch (const nlohmann::json::exception &e)
            {
                throw InvalidArgumentError(std::string("Malformed session request: ") + e.what());
            }

            return request;
        }

    } // namespace core
} // namespace apguard
