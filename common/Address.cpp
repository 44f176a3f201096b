#include "Address.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <cstdio>

namespace lanwatch::common
{
    std::optional<std::uint32_t> ParseIpv4(const std::string &ip)
    {
        in_addr addr{};
        if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatIpv4(std::uint32_t hostOrder)
    {
        in_addr addr{};
        addr.s_addr = htonl(hostOrder);
        char buf[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf)))
            return "";
        return buf;
    }

    std::uint32_t PrefixToMask(int prefixLength)
    {
        if (prefixLength <= 0)
            return 0;
        if (prefixLength >= 32)
            return 0xFFFFFFFFu;
        return 0xFFFFFFFFu << (32 - prefixLength);
    }

    int MaskToPrefix(std::uint32_t mask)
    {
        int bits = 0;
        while (mask & 0x80000000u)
        {
            ++bits;
            mask <<= 1;
        }
        return bits;
    }

    std::vector<std::string> SubnetHosts(const std::string &ip, const std::string &netmask)
    {
        std::vector<std::string> hosts;

        auto ipVal = ParseIpv4(ip);
        auto maskVal = ParseIpv4(netmask);
        if (!ipVal || !maskVal)
            return hosts;

        std::uint32_t mask = *maskVal;
        std::uint32_t network = *ipVal & mask;
        std::uint32_t broadcast = network | ~mask;

        if (broadcast - network < 2)
            return hosts;

        if (broadcast - network - 1 > MAX_SCAN_HOSTS)
        {
            mask = PrefixToMask(24);
            network = *ipVal & mask;
            broadcast = network | ~mask;
        }

        hosts.reserve(broadcast - network - 1);
        for (std::uint32_t t = network + 1; t < broadcast; ++t)
        {
            if (t == *ipVal)
                continue;
            hosts.push_back(FormatIpv4(t));
        }
        return hosts;
    }

    std::string CanonicalMac(const std::string &mac)
    {
        std::vector<std::string> octets;
        std::string current;

        bool separated = mac.find(':') != std::string::npos || mac.find('-') != std::string::npos;

        if (!separated)
        {
            if (mac.size() != 12)
                return "";
            for (std::size_t i = 0; i < 12; i += 2)
                octets.push_back(mac.substr(i, 2));
        }
        else
        {
            for (char c : mac)
            {
                if (c == ':' || c == '-')
                {
                    octets.push_back(current);
                    current.clear();
                }
                else
                {
                    current += c;
                }
            }
            octets.push_back(current);
        }

        if (octets.size() != 6)
            return "";

        std::string out;
        out.reserve(17);
        for (std::size_t i = 0; i < octets.size(); ++i)
        {
            const std::string &o = octets[i];
            if (o.empty() || o.size() > 2)
                return "";
            for (char c : o)
            {
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                    return "";
            }

            std::string padded = o.size() == 1 ? "0" + o : o;
            for (char &c : padded)
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

            if (i > 0)
                out += ':';
            out += padded;
        }
        return out;
    }

    bool IsUsableMac(const std::string &canonicalMac)
    {
        if (canonicalMac.size() != 17)
            return false;
        if (canonicalMac == "00:00:00:00:00:00" || canonicalMac == "FF:FF:FF:FF:FF:FF")
            return false;

        unsigned int firstOctet = 0;
        if (std::sscanf(canonicalMac.c_str(), "%2x", &firstOctet) != 1)
            return false;
        return (firstOctet & 0x01u) == 0;
    }

    std::string OuiPrefix(const std::string &canonicalMac)
    {
        if (canonicalMac.size() < 8)
            return "";
        return canonicalMac.substr(0, 2) + canonicalMac.substr(3, 2) + canonicalMac.substr(6, 2);
    }

    std::optional<std::uint16_t> HostSlot(const std::string &ip)
    {
        auto addr = ParseIpv4(ip);
        if (!addr)
            return std::nullopt;
        auto slot = static_cast<std::uint16_t>(*addr & 0xFFFFu);
        if (slot == 0)
            return std::nullopt;
        return slot;
    }
}
