#ifndef APGUARD_CORE_SESSION_REQUEST_HPP
#define APGUARD_CORE_SESSION_REQUEST_HPP

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

#include "core/types.hpp"

namespace apguard
{
    namespace core
    {

        /**
         * Everything the operator asked for when starting a hotspot.
         * Interface names are references only; they are resolved against a
         * fresh inventory at validation time.
         */
        struct SessionRequest
        {
            static constexpr size_t MAX_SSID_BYTES = 32;
            static constexpr size_t MIN_PASSPHRASE = 8;
            static constexpr size_t MAX_PASSPHRASE = 63;
            static constexpr int MIN_TIMER_MINUTES = 1;
            static constexpr int MAX_TIMER_MINUTES = 120;

            std::string ssid;
            std::optional<std::string> passphrase; // absent only with open_network
            bool open_network = false;
            std::string hotspot_interface;  // empty: choose automatically
            std::string internet_interface; // empty: follow the routing table
            Band band = Band::Band2_4GHz;
            bool hidden = false;
            std::optional<std::string> dns_override;
            bool route_via_vpn = false;
            bool exclude_vpn = false;
            MacFilterMode mac_filter_mode = MacFilterMode::None;
            std::vector<std::string> mac_addresses;
            std::optional<int> auto_off_minutes;
            bool force_single_interface = false;

            // Throws InvalidArgumentError; normalizes MAC addresses in place
            void validate();

            nlohmann::json to_json(bool include_passphrase) const;
            static SessionRequest from_json(const nlohmann::json &j);
        };

    } // namespace core
} // namespace apguard

#endif // APGUARD_CORE_SESSION_REQUEST_HPP
