#include "DeviceRegistry.hpp"
#include "../common/Address.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <set>

namespace lanwatch::engine
{
    using common::Device;
    using common::DeviceStatus;

    DeviceRegistry::DeviceRegistry(std::chrono::milliseconds stalenessWindow)
        : m_stalenessWindow(stalenessWindow)
    {
    }

    void DeviceRegistry::Apply(const std::vector<common::DeviceObservation> &observations, common::Clock::time_point now)
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        std::set<std::string> seen;

        for (const auto &obs : observations)
        {
            if (obs.ip.empty())
                continue;
            seen.insert(obs.ip);

            auto it = m_devices.find(obs.ip);
            if (it == m_devices.end())
            {
                Device device;
                device.ip = obs.ip;
                device.mac = obs.mac;
                device.hostname = obs.hostname;
                device.vendor = obs.vendor;
                device.deviceType = obs.deviceType;
                device.signalStrength = obs.signalStrength;
                device.interfaceName = obs.interfaceName;
                device.connectionType = obs.connectionType;
                device.status = DeviceStatus::Active;
                device.lastSeen = now;
                m_devices.emplace(obs.ip, device);
                std::cout << "[Registry] New device " << obs.ip << " (" << obs.mac << ")\n";
                continue;
            }

            Device &device = it->second;
            if (!obs.mac.empty() && !device.mac.empty() && obs.mac != device.mac)
            {
                // Address reassigned to different hardware; the old identity no longer applies.
                std::cout << "[Registry] " << obs.ip << " moved from " << device.mac << " to " << obs.mac << "\n";
                device.hostname.reset();
                device.vendor.reset();
                device.deviceType.reset();
                device.signalStrength.reset();
                device.hostnamePinned = false;
                device.deviceTypePinned = false;
            }
            if (!obs.mac.empty())
                device.mac = obs.mac;

            if (obs.hostname && !device.hostnamePinned)
                device.hostname = obs.hostname;
            if (obs.vendor)
                device.vendor = obs.vendor;
            if (obs.deviceType && !device.deviceTypePinned)
                device.deviceType = obs.deviceType;
            if (obs.signalStrength)
                device.signalStrength = obs.signalStrength;
            if (!obs.interfaceName.empty())
                device.interfaceName = obs.interfaceName;
            if (obs.connectionType != common::ConnectionType::Unknown)
                device.connectionType = obs.connectionType;

            device.lastSeen = now;
            if (device.status != DeviceStatus::Blocked)
                device.status = DeviceStatus::Active;
        }

        for (auto &[ip, device] : m_devices)
        {
            if (seen.count(ip) || device.status != DeviceStatus::Active)
                continue;
            if (now - device.lastSeen > m_stalenessWindow)
            {
                device.status = DeviceStatus::Inactive;
                std::cout << "[Registry] " << ip << " is now inactive\n";
            }
        }
    }

    std::optional<Device> DeviceRegistry::Get(const std::string &ip) const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_devices.find(ip);
        if (it == m_devices.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<Device> DeviceRegistry::List(const DeviceFilter &filter) const
    {
        std::vector<Device> devices;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            for (const auto &[ip, device] : m_devices)
            {
                if (filter.interfaceName && device.interfaceName != *filter.interfaceName)
                    continue;
                if (filter.status && device.status != *filter.status)
                    continue;
                devices.push_back(device);
            }
        }

        std::sort(devices.begin(), devices.end(), [](const Device &a, const Device &b)
                  { return common::ParseIpv4(a.ip).value_or(0) < common::ParseIpv4(b.ip).value_or(0); });
        return devices;
    }

    bool DeviceRegistry::Update(const std::string &ip, const Mutator &mutator)
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_devices.find(ip);
        if (it == m_devices.end())
            return false;
        mutator(it->second);
        return true;
    }

    void DeviceRegistry::UpdateAll(const Mutator &mutator)
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        for (auto &[ip, device] : m_devices)
            mutator(device);
    }

    std::size_t DeviceRegistry::Size() const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_devices.size();
    }
}
