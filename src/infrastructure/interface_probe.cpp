#include "infrastructure/interface_probe.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/file_utils.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <sstream>
#include <regex>
#include <stdexcept>
#include <algorithm>
#include <ifaddrs.h>
#include <net/if.h>
#include <sys/socket.h>

namespace fs = std::filesystem;

namespace apguard
{
    namespace infrastructure
    {

        namespace
        {
            constexpr int ARPHRD_LOOPBACK_TYPE = 772;

            std::string trim(const std::string &value)
            {
                const auto begin = value.find_first_not_of(" \t\r\n");
                if (begin == std::string::npos)
                    return "";
                const auto end = value.find_last_not_of(" \t\r\n");
                return value.substr(begin, end - begin + 1);
            }

            bool starts_with(const std::string &value, const std::string &prefix)
            {
                return value.compare(0, prefix.size(), prefix) == 0;
            }

            std::string link_basename(const fs::path &link)
            {
                std::error_code ec;
                auto target = fs::read_symlink(link, ec);
                if (ec)
                    return "";
                return target.filename().string();
            }

            std::string uevent_value(const std::string &uevent, const std::string &key)
            {
                std::istringstream stream(uevent);
                std::string line;
                const std::string prefix = key + "=";
                while (std::getline(stream, line))
                {
                    if (starts_with(line, prefix))
                        return trim(line.substr(prefix.size()));
                }
                return "";
            }
        } // namespace

        LinuxInterfaceProbe::LinuxInterfaceProbe(std::string sysfs_root, CommandRunner &runner,
                                                 std::chrono::milliseconds command_timeout)
            : sysfs_root_(std::move(sysfs_root)),
              runner_(runner),
              command_timeout_(command_timeout),
              logger_(core::get_logger("InterfaceProbe"))
        {
        }

        std::string LinuxInterfaceProbe::net_dir() const
        {
            return sysfs_root_ + "/class/net";
        }

        std::vector<std::string> LinuxInterfaceProbe::interface_names()
        {
            refresh_network_manager_devices();
            refresh_ipv4_addresses();

            std::vector<std::string> names;
            std::error_code ec;
            fs::directory_iterator it(net_dir(), ec);
            if (ec)
            {
                logger_->error("Cannot enumerate network interfaces",
                               core::LogContext().add("path", net_dir()).add("error", ec.message()));
                return names;
            }

            for (const auto &entry : it)
            {
                const std::string name = entry.path().filename().string();
                auto type = core::files::read_first_line(entry.path().string() + "/type");
                if (name == "lo" || (type && *type == std::to_string(ARPHRD_LOOPBACK_TYPE)))
                    continue;
                names.push_back(name);
            }

            std::sort(names.begin(), names.end());
            return names;
        }

        InterfaceAttributes LinuxInterfaceProbe::query(const std::string &name)
        {
            const std::string dir = net_dir() + "/" + name;
            if (!fs::exists(dir))
            {
                throw std::runtime_error("Interface disappeared: " + name);
            }

            InterfaceAttributes attrs;
            attrs.name = name;

            auto type = core::files::read_first_line(dir + "/type");
            if (!type)
            {
                throw std::runtime_error("Cannot read link type of " + name);
            }
            try
            {
                attrs.arp_type = std::stoi(*type);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error("Malformed link type for " + name + ": " + *type);
            }

            auto uevent = core::files::read_file(dir + "/uevent");
            if (uevent)
            {
                attrs.devtype = uevent_value(*uevent, "DEVTYPE");
            }

            attrs.driver = link_basename(dir + "/device/driver");
            if (fs::exists(dir + "/device"))
            {
                std::error_code ec;
                auto device_path = fs::canonical(dir + "/device", ec).string();
                if (!ec && device_path.find("/usb") != std::string::npos)
                    attrs.bus = "usb";
                else
                    attrs.bus = link_basename(dir + "/device/subsystem");
            }

            attrs.wireless = fs::exists(dir + "/phy80211") || fs::exists(dir + "/wireless");
            attrs.tun = fs::exists(dir + "/tun_flags");
            attrs.bridge = fs::exists(dir + "/bridge");
            if (fs::exists(dir + "/phy80211"))
            {
                attrs.phy = core::files::read_first_line(dir + "/phy80211/name").value_or("");
            }

            auto nm = nm_devices_.find(name);
            if (nm != nm_devices_.end())
            {
                attrs.nm_type = nm->second.type;
                if (starts_with(nm->second.state, "connected") && nm->second.connection != "--")
                {
                    attrs.live.connected_network = nm->second.connection;
                }
            }

            // Live state
            auto flags = core::files::read_first_line(dir + "/flags");
            if (flags)
            {
                try
                {
                    attrs.live.admin_up = (std::stoul(*flags, nullptr, 16) & IFF_UP) != 0;
                }
                catch (const std::exception &)
                {
                    logger_->warning("Malformed interface flags",
                                     core::LogContext().add("interface", name).add("flags", *flags));
                }
            }
            attrs.live.has_address = ipv4_interfaces_.count(name) > 0;

            if (attrs.wireless)
            {
                attrs.live.rfkill_blocked = read_rfkill_blocked(dir);
                attrs.live.mode = query_operating_mode(name);
                if (!attrs.phy.empty())
                {
                    attrs.capabilities = query_capabilities(attrs.phy);
                }
            }
            else
            {
                attrs.capabilities.ap_mode = false;
                attrs.capabilities.band_5ghz = false;
            }

            logger_->debug("Queried interface",
                           core::LogContext()
                               .add("interface", name)
                               .add("driver", attrs.driver)
                               .add("devtype", attrs.devtype)
                               .add("bus", attrs.bus)
                               .add("nm_type", attrs.nm_type));
            return attrs;
        }

        std::vector<std::string> LinuxInterfaceProbe::default_route_interfaces()
        {
            std::vector<std::string> devices;

            // The kernel's actual choice first
            auto chosen = runner_.run({"ip", "-4", "route", "get", "1.1.1.1"}, command_timeout_);
            if (chosen.ok())
            {
                devices = parsers::parse_route_devices(chosen.output);
            }

            auto table = runner_.run({"ip", "-4", "route", "show", "default"}, command_timeout_);
            if (!table.ok())
            {
                logger_->warning("Cannot read default routes", core::LogContext().add("output", table.output));
                return devices;
            }

            for (const auto &dev : parsers::parse_route_devices(table.output))
            {
                if (std::find(devices.begin(), devices.end(), dev) == devices.end())
                    devices.push_back(dev);
            }
            return devices;
        }

        void LinuxInterfaceProbe::refresh_network_manager_devices()
        {
            nm_devices_.clear();

            auto result = runner_.run({"nmcli", "-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device"},
                                      command_timeout_);
            if (!result.ok())
            {
                logger_->info("NetworkManager device table unavailable",
                              core::LogContext().add("exit_code", result.exit_code));
                return;
            }

            std::istringstream stream(result.output);
            std::string line;
            while (std::getline(stream, line))
            {
                auto fields = parsers::split_nmcli_terse(line);
                if (fields.size() < 4 || fields[0].empty())
                    continue;
                nm_devices_[fields[0]] = NmDevice{fields[1], fields[2], fields[3]};
            }
        }

        void LinuxInterfaceProbe::refresh_ipv4_addresses()
        {
            ipv4_interfaces_.clear();

            struct ifaddrs *addrs = nullptr;
            if (getifaddrs(&addrs) != 0)
            {
                logger_->warning("getifaddrs failed");
                return;
            }
            for (auto *ifa = addrs; ifa; ifa = ifa->ifa_next)
            {
                if (ifa->ifa_addr && ifa->ifa_addr->sa_family == AF_INET)
                    ipv4_interfaces_.insert(ifa->ifa_name);
            }
            freeifaddrs(addrs);
        }

        bool LinuxInterfaceProbe::read_rfkill_blocked(const std::string &iface_dir) const
        {
            std::error_code ec;
            fs::directory_iterator it(iface_dir + "/phy80211", ec);
            if (ec)
                return false;

            for (const auto &entry : it)
            {
                if (!starts_with(entry.path().filename().string(), "rfkill"))
                    continue;
                auto soft = core::files::read_first_line(entry.path().string() + "/soft");
                auto hard = core::files::read_first_line(entry.path().string() + "/hard");
                if ((soft && *soft == "1") || (hard && *hard == "1"))
                    return true;
            }
            return false;
        }

        core::InterfaceCapabilities LinuxInterfaceProbe::query_capabilities(const std::string &phy)
        {
            auto result = runner_.run({"iw", "phy", phy, "info"}, command_timeout_);
            if (!result.ok())
            {
                logger_->warning("Cannot determine wireless capabilities",
                                 core::LogContext().add("phy", phy).add("exit_code", result.exit_code));
                return core::InterfaceCapabilities{};
            }
            return parsers::parse_iw_phy_info(result.output);
        }

        core::OperatingMode LinuxInterfaceProbe::query_operating_mode(const std::string &name)
        {
            auto result = runner_.run({"iw", "dev", name, "info"}, command_timeout_);
            if (!result.ok())
                return core::OperatingMode::Unknown;
            return core::operating_mode_from_iw(parsers::parse_iw_dev_type(result.output));
        }

        // Parsers

        namespace parsers
        {
            core::InterfaceCapabilities parse_iw_phy_info(const std::string &output)
            {
                core::InterfaceCapabilities caps;
                bool saw_modes = false;
                bool saw_frequencies = false;
                bool ap = false;
                bool five = false;

                std::regex freq_regex(R"(\*\s+(\d+)(?:\.\d+)?\s+MHz)");
                std::istringstream stream(output);
                std::string line;
                bool in_modes = false;
                while (std::getline(stream, line))
                {
                    const std::string trimmed = trim(line);
                    if (trimmed == "Supported interface modes:")
                    {
                        saw_modes = true;
                        in_modes = true;
                        continue;
                    }
                    if (in_modes)
                    {
                        if (starts_with(trimmed, "* "))
                        {
                            if (trim(trimmed.substr(2)) == "AP")
                                ap = true;
                            continue;
                        }
                        in_modes = false;
                    }

                    std::smatch match;
                    if (std::regex_search(line, match, freq_regex))
                    {
                        saw_frequencies = true;
                        int mhz = std::stoi(match[1].str());
                        if (mhz >= 4900 && mhz < 5925 && line.find("disabled") == std::string::npos)
                            five = true;
                    }
                }

                if (saw_modes)
                    caps.ap_mode = ap;
                if (saw_frequencies)
                    caps.band_5ghz = five;
                return caps;
            }

            std::string parse_iw_dev_type(const std::string &output)
            {
                std::istringstream stream(output);
                std::string line;
                while (std::getline(stream, line))
                {
                    const std::string trimmed = trim(line);
                    if (starts_with(trimmed, "type "))
                        return trim(trimmed.substr(5));
                }
                return "";
            }

            std::vector<std::string> split_nmcli_terse(const std::string &line)
            {
                std::vector<std::string> fields;
                std::string current;
                for (size_t i = 0; i < line.size(); ++i)
                {
                    char c = line[i];
                    if (c == '\\' && i + 1 < line.size())
                    {
                        current += line[++i];
                    }
                    else if (c == ':')
                    {
                        fields.push_back(current);
                        current.clear();
                    }
                    else if (c != '\r')
                    {
                        current += c;
                    }
                }
                fields.push_back(current);
                return fields;
            }

            std::vector<std::string> parse_route_devices(const std::string &output)
            {
                std::vector<std::string> devices;
                std::istringstream stream(output);
                std::string line;
                while (std::getline(stream, line))
                {
                    std::istringstream words(line);
                    std::string word;
                    while (words >> word)
                    {
                        if (word == "dev" && words >> word)
                        {
                            if (std::find(devices.begin(), devices.end(), word) == devices.end())
                                devices.push_back(word);
                            break;
                        }
                    }
                }
                return devices;
            }
        } // namespace parsers

    } // namespace infrastructure
} // namespace apguard
