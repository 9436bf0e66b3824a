#include "core/net_utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <algorithm>
#include <cctype>

namespace apguard
{
    namespace core
    {
        namespace net
        {

            bool is_valid_ipv4(const std::string &ip)
            {
                return ipv4_to_int(ip).has_value();
            }

            std::optional<uint32_t> ipv4_to_int(const std::string &ip)
            {
                struct in_addr addr;
                if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
                {
                    return std::nullopt;
                }
                return ntohl(addr.s_addr);
            }

            std::string int_to_ipv4(uint32_t ip)
            {
                struct in_addr addr;
                addr.s_addr = htonl(ip);
                char buffer[INET_ADDRSTRLEN] = {0};
                if (!inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)))
                {
                    return "";
                }
                return buffer;
            }

            std::string network_cidr(const std::string &address, int prefix_length)
            {
                auto ip = ipv4_to_int(address);
                if (!ip || prefix_length < 0 || prefix_length > 32)
                {
                    return "";
                }
                uint32_t mask = prefix_length == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix_length));
                return int_to_ipv4(*ip & mask) + "/" + std::to_string(prefix_length);
            }

            bool is_valid_mac(const std::string &mac)
            {
                if (mac.size() != 17)
                {
                    return false;
                }
                for (size_t i = 0; i < mac.size(); ++i)
                {
                    if (i % 3 == 2)
                    {
                        if (mac[i] != ':')
                            return false;
                    }
                    else if (!std::isxdigit(static_cast<unsigned char>(mac[i])))
                    {
                        return false;
                    }
                }
                return true;
            }

            std::string normalize_mac(const std::string &mac)
            {
                std::string normalized = mac;
                std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return normalized;
            }

        } // namespace net
    } // namespace core
} // namespace apguard
