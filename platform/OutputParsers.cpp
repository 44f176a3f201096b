#include "OutputParsers.hpp"
#include "../common/Address.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <set>
#include <sstream>

namespace lanwatch::platform::parsers
{
    namespace
    {
        std::vector<std::string> SplitLines(const std::string &text)
        {
            std::vector<std::string> lines;
            std::istringstream in(text);
            std::string line;
            while (std::getline(in, line))
            {
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                lines.push_back(line);
            }
            return lines;
        }

        std::vector<std::string> Tokenize(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::istringstream in(line);
            std::string token;
            while (in >> token)
                tokens.push_back(token);
            return tokens;
        }

        std::string Trim(const std::string &s)
        {
            size_t first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";
            size_t last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        std::string ToLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool StartsWith(const std::string &s, const std::string &prefix)
        {
            return s.compare(0, prefix.size(), prefix) == 0;
        }

        bool IsIpv4(const std::string &s)
        {
            return common::ParseIpv4(s).has_value();
        }

        std::optional<std::uint64_t> ParseU64(const std::string &s)
        {
            if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0])))
                return std::nullopt;
            char *end = nullptr;
            unsigned long long v = std::strtoull(s.c_str(), &end, 10);
            if (end == s.c_str() || *end != '\0')
                return std::nullopt;
            return static_cast<std::uint64_t>(v);
        }

        // "Key . . . . : value" (ipconfig) or "Key : value" (netsh).
        bool SplitKeyValue(const std::string &line, std::string &key, std::string &value)
        {
            size_t sep = line.find(" : ");
            size_t width = 3;
            if (sep == std::string::npos)
            {
                sep = line.find(':');
                width = 1;
                if (sep == std::string::npos)
                    return false;
            }

            key = Trim(line.substr(0, sep));
            while (!key.empty() && (key.back() == '.' || key.back() == ' '))
                key.pop_back();
            value = Trim(line.substr(sep + width));
            return !key.empty();
        }

        std::string StripInterfaceSuffix(std::string name)
        {
            if (!name.empty() && name.back() == ':')
                name.pop_back();
            size_t at = name.find('@');
            if (at != std::string::npos)
                name = name.substr(0, at);
            return name;
        }
    }

    // ---------------------------------------------------------------- Linux

    std::vector<NeighborEntry> ParseProcNetArp(const std::string &content)
    {
        std::vector<NeighborEntry> entries;
        auto lines = SplitLines(content);

        for (size_t i = 1; i < lines.size(); ++i)
        {
            auto tokens = Tokenize(lines[i]);
            if (tokens.size() < 6)
                continue;

            const std::string &ip = tokens[0];
            const std::string &flags = tokens[2];
            std::string mac = common::CanonicalMac(tokens[3]);

            // ATF_COM (0x2) unset means the kernel never completed resolution.
            unsigned long flagBits = std::strtoul(flags.c_str(), nullptr, 16);
            if ((flagBits & 0x2) == 0 || mac.empty() || !IsIpv4(ip))
                continue;

            entries.push_back({ip, mac, tokens[5]});
        }
        return entries;
    }

    std::vector<NeighborEntry> ParseIpNeigh(const std::string &output)
    {
        std::vector<NeighborEntry> entries;
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokenize(line);
            if (tokens.empty() || !IsIpv4(tokens[0]))
                continue;

            NeighborEntry entry;
            entry.ip = tokens[0];
            for (size_t i = 1; i + 1 < tokens.size(); ++i)
            {
                if (tokens[i] == "dev")
                    entry.interfaceName = tokens[i + 1];
                else if (tokens[i] == "lladdr")
                    entry.mac = common::CanonicalMac(tokens[i + 1]);
            }

            const std::string &state = tokens.back();
            if (entry.mac.empty() || state == "FAILED" || state == "INCOMPLETE")
                continue;
            entries.push_back(entry);
        }
        return entries;
    }

    std::map<std::string, LinkState> ParseIpLink(const std::string &output)
    {
        std::map<std::string, LinkState> links;
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokenize(line);
            if (tokens.size() < 3 || tokens[0].empty() || !std::isdigit(static_cast<unsigned char>(tokens[0][0])))
                continue;

            std::string name = StripInterfaceSuffix(tokens[1]);
            LinkState state;

            const std::string &flags = tokens[2];
            if (flags.size() > 2 && flags.front() == '<' && flags.back() == '>')
            {
                std::stringstream ss(flags.substr(1, flags.size() - 2));
                std::string flag;
                while (std::getline(ss, flag, ','))
                {
                    if (flag == "UP")
                        state.isUp = true;
                    else if (flag == "LOOPBACK")
                        state.isLoopback = true;
                }
            }

            for (size_t i = 3; i + 1 < tokens.size(); ++i)
            {
                if (tokens[i] == "link/ether")
                {
                    state.mac = common::CanonicalMac(tokens[i + 1]);
                    break;
                }
            }

            links[name] = state;
        }
        return links;
    }

    std::map<std::string, std::pair<std::string, std::string>> ParseIpAddr(const std::string &output)
    {
        std::map<std::string, std::pair<std::string, std::string>> addrs;
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokenize(line);
            if (tokens.size() < 4 || tokens[2] != "inet")
                continue;

            std::string name = StripInterfaceSuffix(tokens[1]);
            if (addrs.count(name))
                continue;

            const std::string &cidr = tokens[3];
            size_t slash = cidr.find('/');
            std::string ip = cidr.substr(0, slash);
            int prefix = 32;
            if (slash != std::string::npos)
                prefix = std::atoi(cidr.c_str() + slash + 1);

            if (!IsIpv4(ip))
                continue;
            addrs[name] = {ip, common::FormatIpv4(common::PrefixToMask(prefix))};
        }
        return addrs;
    }

    std::optional<DefaultRoute> ParseProcNetRoute(const std::string &content)
    {
        std::optional<DefaultRoute> best;
        unsigned long bestMetric = std::numeric_limits<unsigned long>::max();

        auto lines = SplitLines(content);
        for (size_t i = 1; i < lines.size(); ++i)
        {
            auto tokens = Tokenize(lines[i]);
            if (tokens.size() < 7)
                continue;

            if (tokens[1] != "00000000")
                continue;

            unsigned long flags = std::strtoul(tokens[3].c_str(), nullptr, 16);
            if ((flags & 0x1) == 0 || (flags & 0x2) == 0)
                continue;

            // The kernel prints the raw network-order word in host representation.
            in_addr gw{};
            gw.s_addr = static_cast<in_addr_t>(std::strtoul(tokens[2].c_str(), nullptr, 16));
            char buf[INET_ADDRSTRLEN];
            if (!inet_ntop(AF_INET, &gw, buf, sizeof(buf)))
                continue;

            unsigned long metric = std::strtoul(tokens[6].c_str(), nullptr, 10);
            if (!best || metric < bestMetric)
            {
                best = DefaultRoute{buf, tokens[0]};
                bestMetric = metric;
            }
        }
        return best;
    }

    std::optional<DefaultRoute> ParseIpRouteDefault(const std::string &output)
    {
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokenize(line);
            if (tokens.empty() || tokens[0] != "default")
                continue;

            DefaultRoute route;
            for (size_t i = 1; i + 1 < tokens.size(); ++i)
            {
                if (tokens[i] == "via")
                    route.gateway = tokens[i + 1];
                else if (tokens[i] == "dev")
                    route.interfaceName = tokens[i + 1];
            }
            if (IsIpv4(route.gateway))
                return route;
        }
        return std::nullopt;
    }

    std::vector<InterfaceCounters> ParseProcNetDev(const std::string &content)
    {
        std::vector<InterfaceCounters> counters;
        auto lines = SplitLines(content);
        for (size_t i = 2; i < lines.size(); ++i)
        {
            size_t colon = lines[i].find(':');
            if (colon == std::string::npos)
                continue;

            std::string name = Trim(lines[i].substr(0, colon));
            auto fields = Tokenize(lines[i].substr(colon + 1));
            if (name.empty() || fields.size() < 9)
                continue;

            auto rx = ParseU64(fields[0]);
            auto tx = ParseU64(fields[8]);
            if (!rx || !tx)
                continue;
            counters.push_back({name, *rx, *tx});
        }
        return counters;
    }

    std::vector<std::string> ParseIwDevInterfaces(const std::string &output)
    {
        std::vector<std::string> names;
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokenize(line);
            if (tokens.size() >= 2 && tokens[0] == "Interface")
                names.push_back(tokens[1]);
        }
        return names;
    }

    std::optional<int> ParseIwStationSignal(const std::string &output)
    {
        for (const auto &line : SplitLines(output))
        {
            std::string trimmed = Trim(line);
            if (!StartsWith(trimmed, "signal:"))
                continue;

            auto tokens = Tokenize(trimmed.substr(7));
            if (tokens.empty())
                return std::nullopt;
            try
            {
                return std::stoi(tokens[0]);
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    // ---------------------------------------------------------------- macOS

    std::vector<NeighborEntry> ParseArpAn(const std::string &output)
    {
        std::vector<NeighborEntry> entries;
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokenize(line);
            if (tokens.size() < 4 || tokens[2] != "at")
                continue;

            std::string ip = tokens[1];
            if (ip.size() < 3 || ip.front() != '(' || ip.back() != ')')
                continue;
            ip = ip.substr(1, ip.size() - 2);

            std::string mac = common::CanonicalMac(tokens[3]);
            if (!IsIpv4(ip) || mac.empty())
                continue;

            NeighborEntry entry{ip, mac, ""};
            if (tokens.size() >= 6 && tokens[4] == "on")
                entry.interfaceName = tokens[5];
            entries.push_back(entry);
        }
        return entries;
    }

    std::vector<InterfaceInfo> ParseIfconfig(const std::string &output)
    {
        std::vector<InterfaceInfo> interfaces;
        InterfaceInfo *current = nullptr;

        for (const auto &line : SplitLines(output))
        {
            if (line.empty())
                continue;

            if (!std::isspace(static_cast<unsigned char>(line[0])))
            {
                size_t colon = line.find(": flags=");
                if (colon == std::string::npos)
                {
                    current = nullptr;
                    continue;
                }

                InterfaceInfo info;
                info.name = line.substr(0, colon);
                size_t open = line.find('<', colon);
                size_t close = line.find('>', colon);
                if (open != std::string::npos && close != std::string::npos && close > open)
                {
                    std::stringstream ss(line.substr(open + 1, close - open - 1));
                    std::string flag;
                    while (std::getline(ss, flag, ','))
                    {
                        if (flag == "UP")
                            info.isUp = true;
                        else if (flag == "LOOPBACK")
                            info.isLoopback = true;
                    }
                }
                interfaces.push_back(info);
                current = &interfaces.back();
                continue;
            }

            if (!current)
                continue;

            auto tokens = Tokenize(line);
            if (tokens.size() >= 2 && tokens[0] == "ether")
            {
                current->mac = common::CanonicalMac(tokens[1]);
            }
            else if (tokens.size() >= 2 && tokens[0] == "inet" && current->ip.empty())
            {
                current->ip = tokens[1];
                for (size_t i = 2; i + 1 < tokens.size(); ++i)
                {
                    if (tokens[i] == "netmask")
                    {
                        unsigned long mask = std::strtoul(tokens[i + 1].c_str(), nullptr, 16);
                        current->netmask = common::FormatIpv4(static_cast<std::uint32_t>(mask));
                    }
                }
            }
        }
        return interfaces;
    }

    std::vector<std::string> ParseNetworkSetupWifi(const std::string &output)
    {
        std::vector<std::string> devices;
        bool wifiPort = false;

        for (const auto &line : SplitLines(output))
        {
            std::string trimmed = Trim(line);
            if (StartsWith(trimmed, "Hardware Port:"))
            {
                std::string port = ToLower(trimmed.substr(14));
                wifiPort = port.find("wi-fi") != std::string::npos ||
                           port.find("airport") != std::string::npos ||
                           port.find("wireless") != std::string::npos;
            }
            else if (StartsWith(trimmed, "Device:") && wifiPort)
            {
                std::string device = Trim(trimmed.substr(7));
                if (!device.empty())
                    devices.push_back(device);
                wifiPort = false;
            }
        }
        return devices;
    }

    std::optional<DefaultRoute> ParseRouteGetDefault(const std::string &output)
    {
        DefaultRoute route;
        for (const auto &line : SplitLines(output))
        {
            std::string trimmed = Trim(line);
            if (StartsWith(trimmed, "gateway:"))
                route.gateway = Trim(trimmed.substr(8));
            else if (StartsWith(trimmed, "interface:"))
                route.interfaceName = Trim(trimmed.substr(10));
        }
        if (!IsIpv4(route.gateway))
            return std::nullopt;
        return route;
    }

    std::vector<InterfaceCounters> ParseNetstatIbn(const std::string &output)
    {
        std::vector<InterfaceCounters> counters;
        auto lines = SplitLines(output);
        if (lines.empty())
            return counters;

        auto header = Tokenize(lines[0]);
        auto column = [&header](const std::string &name) -> long
        {
            auto it = std::find(header.begin(), header.end(), name);
            return it == header.end() ? -1 : static_cast<long>(it - header.begin());
        };

        long ibytes = column("Ibytes");
        long obytes = column("Obytes");
        long address = column("Address");
        if (ibytes < 0 || obytes < 0)
            return counters;

        for (size_t i = 1; i < lines.size(); ++i)
        {
            auto tokens = Tokenize(lines[i]);
            if (tokens.size() < 3 || !StartsWith(tokens[2], "<Link#"))
                continue;

            // Link rows without a hardware address have one column fewer.
            long shift = 0;
            if (tokens.size() + 1 == header.size() && address >= 0)
                shift = -1;
            else if (tokens.size() != header.size())
                continue;

            auto rx = ParseU64(tokens[ibytes + shift]);
            auto tx = ParseU64(tokens[obytes + shift]);
            if (!rx || !tx)
                continue;
            counters.push_back({tokens[0], *rx, *tx});
        }
        return counters;
    }

    std::optional<std::pair<std::string, int>> ParseAirportInfo(const std::string &output)
    {
        std::optional<int> rssi;
        std::string bssid;

        for (const auto &line : SplitLines(output))
        {
            size_t colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            std::string key = Trim(line.substr(0, colon));
            std::string value = Trim(line.substr(colon + 1));

            if (key == "agrCtlRSSI")
            {
                try
                {
                    rssi = std::stoi(value);
                }
                catch (const std::exception &)
                {
                }
            }
            else if (key == "BSSID")
            {
                bssid = common::CanonicalMac(value);
            }
        }

        if (!rssi || bssid.empty())
            return std::nullopt;
        return std::make_pair(bssid, *rssi);
    }

    std::set<std::string> ParsePfTableShow(const std::string &output)
    {
        std::set<std::string> addresses;
        for (const auto &line : SplitLines(output))
        {
            std::string entry = Trim(line);
            if (common::ParseIpv4(entry))
                addresses.insert(entry);
        }
        return addresses;
    }

    std::map<std::string, unsigned> ParsePfDummynetRules(const std::string &output)
    {
        std::map<std::string, unsigned> pipes;
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokenize(line);
            if (tokens.empty() || tokens[0] != "dummynet")
                continue;

            std::string host;
            std::optional<unsigned> pipe;
            for (size_t i = 0; i + 1 < tokens.size(); ++i)
            {
                const std::string &next = tokens[i + 1];
                if ((tokens[i] == "from" || tokens[i] == "to") && host.empty() && common::ParseIpv4(next))
                {
                    host = next;
                }
                else if (tokens[i] == "pipe")
                {
                    char *end = nullptr;
                    unsigned long value = std::strtoul(next.c_str(), &end, 10);
                    if (end && *end == '\0' && value > 0 && value <= 0xFFFF)
                        pipe = static_cast<unsigned>(value);
                }
            }
            if (!host.empty() && pipe)
                pipes[host] = *pipe;
        }
        return pipes;
    }

    // ---------------------------------------------------------------- Windows

    std::vector<NeighborEntry> ParseWindowsArp(const std::string &output)
    {
        std::vector<NeighborEntry> entries;
        std::string currentInterface;

        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokenize(line);
            if (tokens.size() >= 2 && tokens[0] == "Interface:")
            {
                currentInterface = tokens[1];
                continue;
            }
            if (tokens.size() < 3 || !IsIpv4(tokens[0]))
                continue;

            std::string mac = common::CanonicalMac(tokens[1]);
            if (tokens[0] == "0.0.0.0" || mac.empty() || mac == "00:00:00:00:00:00")
                continue;

            entries.push_back({tokens[0], mac, currentInterface});
        }
        return entries;
    }

    std::vector<InterfaceInfo> ParseIpconfigAll(const std::string &output)
    {
        std::vector<InterfaceInfo> interfaces;
        InterfaceInfo *current = nullptr;

        for (const auto &line : SplitLines(output))
        {
            if (line.empty())
                continue;

            if (!std::isspace(static_cast<unsigned char>(line[0])))
            {
                current = nullptr;
                size_t adapter = line.find(" adapter ");
                if (adapter == std::string::npos || line.back() != ':')
                    continue;

                InterfaceInfo info;
                info.name = Trim(line.substr(adapter + 9, line.size() - adapter - 10));
                info.isWireless = StartsWith(line, "Wireless LAN adapter");
                info.isUp = true;
                interfaces.push_back(info);
                current = &interfaces.back();
                continue;
            }

            if (!current)
                continue;

            std::string key, value;
            if (!SplitKeyValue(line, key, value))
                continue;

            if (key == "Media State" && value == "Media disconnected")
            {
                current->isUp = false;
            }
            else if (key == "Physical Address")
            {
                current->mac = common::CanonicalMac(value);
            }
            else if (key == "IPv4 Address" || key == "IP Address")
            {
                size_t paren = value.find('(');
                std::string ip = Trim(value.substr(0, paren));
                if (IsIpv4(ip))
                    current->ip = ip;
            }
            else if (key == "Subnet Mask")
            {
                if (IsIpv4(value))
                    current->netmask = value;
            }
        }

        for (auto &info : interfaces)
        {
            if (StartsWith(info.ip, "127."))
                info.isLoopback = true;
        }
        return interfaces;
    }

    std::optional<std::string> ParseIpconfigGateway(const std::string &output)
    {
        bool inGateway = false;
        for (const auto &line : SplitLines(output))
        {
            std::string key, value;
            bool isKeyLine = line.find(" : ") != std::string::npos && SplitKeyValue(line, key, value);

            if (isKeyLine)
            {
                inGateway = key == "Default Gateway";
                if (inGateway && IsIpv4(value) && value != "0.0.0.0")
                    return value;
                continue;
            }

            if (inGateway)
            {
                std::string trimmed = Trim(line);
                if (IsIpv4(trimmed) && trimmed != "0.0.0.0")
                    return trimmed;
                if (trimmed.empty())
                    inGateway = false;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> ParseNetshWlanNames(const std::string &output)
    {
        std::vector<std::string> names;
        for (const auto &line : SplitLines(output))
        {
            std::string key, value;
            if (SplitKeyValue(line, key, value) && key == "Name" && !value.empty())
                names.push_back(value);
        }
        return names;
    }

    std::optional<std::pair<std::string, int>> ParseNetshWlanSignal(const std::string &output)
    {
        std::string bssid;
        std::optional<int> percent;

        for (const auto &line : SplitLines(output))
        {
            size_t colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            std::string key = Trim(line.substr(0, colon));
            std::string value = Trim(line.substr(colon + 1));

            if (key == "BSSID" || key == "AP BSSID")
            {
                bssid = common::CanonicalMac(value);
            }
            else if (key == "Signal")
            {
                if (!value.empty() && value.back() == '%')
                    value.pop_back();
                try
                {
                    percent = std::stoi(value);
                }
                catch (const std::exception &)
                {
                }
            }
        }

        if (bssid.empty() || !percent)
            return std::nullopt;
        return std::make_pair(bssid, *percent);
    }

    std::vector<InterfaceCounters> ParseNetstatE(const std::string &output)
    {
        std::vector<InterfaceCounters> counters;
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokenize(line);
            if (tokens.size() == 3 && tokens[0] == "Bytes")
            {
                auto rx = ParseU64(tokens[1]);
                auto tx = ParseU64(tokens[2]);
                if (rx && tx)
                    counters.push_back({"total", *rx, *tx});
                break;
            }
        }
        return counters;
    }

    int PercentToDbm(int percent)
    {
        percent = std::max(0, std::min(100, percent));
        return percent / 2 - 100;
    }
}
