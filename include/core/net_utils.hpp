#ifndef APGUARD_CORE_NET_UTILS_HPP
#define APGUARD_CORE_NET_UTILS_HPP

#include <string>
#include <cstdint>
#include <optional>

namespace apguard
{
    namespace core
    {
        namespace net
        {

            // Dotted-quad IPv4 only
            bool is_valid_ipv4(const std::string &ip);
            std::optional<uint32_t> ipv4_to_int(const std::string &ip);
            std::string int_to_ipv4(uint32_t ip);

            // "10.42.0.1", 24 -> "10.42.0.0/24"
            std::string network_cidr(const std::string &address, int prefix_length);

            // xx:xx:xx:xx:xx:xx, hex, either case
            bool is_valid_mac(const std::string &mac);
            std::string normalize_mac(const std::string &mac);

        } // namespace net
    } // namespace core
} // namespace apguard

#endif // APGUARD_CORE_NET_UTILS_HPP
