#include "Device.hpp"

namespace lanwatch::common
{
    const char *ToString(ConnectionType type)
    {
        switch (type)
        {
        case ConnectionType::Wifi:
            return "wifi";
        case ConnectionType::Wired:
            return "wired";
        default:
            return "unknown";
        }
    }

    const char *ToString(DeviceStatus status)
    {
        switch (status)
        {
        case DeviceStatus::Active:
            return "active";
        case DeviceStatus::Inactive:
            return "inactive";
        case DeviceStatus::Blocked:
            return "blocked";
        }
        return "unknown";
    }

    const char *ToString(AttackStatus status)
    {
        return status == AttackStatus::Cutting ? "cutting" : "none";
    }
}
