#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::platform
{
    struct InterfaceInfo
    {
        std::string name;
        std::string ip;
        std::string netmask;
        std::string mac;
        bool isUp = false;
        bool isLoopback = false;
        bool isWireless = false;
    };

    struct NeighborEntry
    {
        std::string ip;
        std::string mac;
        // Interface name, or the interface address on platforms that only report that.
        std::string interfaceName;
    };

    struct InterfaceCounters
    {
        std::string name;
        std::uint64_t rxBytes = 0;
        std::uint64_t txBytes = 0;
    };

    // Per-OS capability interface. Exactly one implementation is selected at
    // startup; nothing outside platform/ branches on the operating system.
    class PlatformAdapter
    {
    public:
        virtual ~PlatformAdapter() = default;

        virtual std::string Name() const = 0;
        virtual bool HasElevatedPrivilege() = 0;

        virtual std::vector<InterfaceInfo> ListInterfaces() = 0;
        virtual std::vector<std::string> ListWifiInterfaces() = 0;
        virtual std::vector<NeighborEntry> ReadNeighborTable() = 0;

        virtual bool BlockHost(const std::string &ip) = 0;
        virtual bool UnblockHost(const std::string &ip) = 0;
        virtual bool LimitHost(const std::string &ip, std::uint64_t kbps) = 0;
        virtual bool UnlimitHost(const std::string &ip) = 0;

        // RSSI in dBm, when the platform can report one for this link-layer address.
        virtual std::optional<int> WifiSignal(const std::string &mac) = 0;

        virtual std::optional<std::string> DefaultGateway() = 0;
        virtual std::vector<InterfaceCounters> ReadInterfaceCounters() = 0;
    };
}
