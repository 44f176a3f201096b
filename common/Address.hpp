#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::common
{
    // Largest host range probed as-is; anything wider is clamped to the local /24.
    inline constexpr std::uint32_t MAX_SCAN_HOSTS = 510;

    // Host byte order.
    std::optional<std::uint32_t> ParseIpv4(const std::string &ip);
    std::string FormatIpv4(std::uint32_t hostOrder);

    // Low 16 bits of the address. Shaping backends number their per-host class or
    // pipe with it, so a later process finds the same object again. Empty when the
    // address is invalid or the slot would be 0.
    std::optional<std::uint16_t> HostSlot(const std::string &ip);

    std::uint32_t PrefixToMask(int prefixLength);
    int MaskToPrefix(std::uint32_t mask);

    // Every host address in the subnet of ip/mask, excluding the network, broadcast
    // and the local address itself.
    std::vector<std::string> SubnetHosts(const std::string &ip, const std::string &netmask);

    // Canonical "AA:BB:CC:DD:EE:FF". Accepts ':' or '-' separators, unpadded octets
    // ("0:1b:..."), and bare 12-digit hex. Returns empty on malformed input.
    std::string CanonicalMac(const std::string &mac);

    // False for all-zero (incomplete), broadcast and multicast addresses.
    bool IsUsableMac(const std::string &canonicalMac);

    // First three octets without separators, e.g. "AABBCC".
    std::string OuiPrefix(const std::string &canonicalMac);
}
