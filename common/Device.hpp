#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace lanwatch::common
{
    enum class ConnectionType
    {
        Wifi,
        Wired,
        Unknown
    };

    enum class DeviceStatus
    {
        Active,
        Inactive,
        Blocked
    };

    enum class AttackStatus
    {
        None,
        Cutting
    };

    using Clock = std::chrono::system_clock;

    struct Device
    {
        std::string ip;
        std::string mac;

        std::optional<std::string> hostname;
        std::optional<std::string> vendor;
        std::optional<std::string> deviceType;
        std::optional<int> signalStrength;
        std::string interfaceName;

        ConnectionType connectionType = ConnectionType::Unknown;
        DeviceStatus status = DeviceStatus::Active;

        std::optional<double> speedLimitMbps;
        double currentSpeedMbps = 0.0;

        Clock::time_point lastSeen{};

        bool isProtected = false;
        AttackStatus attackStatus = AttackStatus::None;

        // Operator-set hostname/type; discovery no longer overwrites them.
        bool hostnamePinned = false;
        bool deviceTypePinned = false;
    };

    // One sighting of a host produced by a discovery pass.
    struct DeviceObservation
    {
        std::string ip;
        std::string mac;
        std::optional<std::string> hostname;
        std::optional<std::string> vendor;
        std::optional<std::string> deviceType;
        std::optional<int> signalStrength;
        std::string interfaceName;
        ConnectionType connectionType = ConnectionType::Unknown;
        Clock::time_point observedAt{};
    };

    struct GatewayInfo
    {
        std::string ip;
        std::string mac;
    };

    struct NetworkSummary
    {
        std::size_t totalDevices = 0;
        std::size_t activeDevices = 0;
        std::map<std::string, std::size_t> byType;
        double totalBandwidthMbps = 0.0;
    };

    struct BandwidthEntry
    {
        double currentSpeedMbps = 0.0;
        std::optional<double> speedLimitMbps;
        DeviceStatus status = DeviceStatus::Active;
    };

    const char *ToString(ConnectionType type);
    const char *ToString(DeviceStatus status);
    const char *ToString(AttackStatus status);
}
