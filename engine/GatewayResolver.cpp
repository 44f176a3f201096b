#include "GatewayResolver.hpp"
#include "../common/Address.hpp"

#include <iostream>
#include <utility>

namespace lanwatch::engine
{
    GatewayResolver::GatewayResolver(platform::PlatformAdapter &platform, ArpTransport &transport, std::string interfaceName)
        : m_platform(platform), m_transport(transport), m_interface(std::move(interfaceName))
    {
    }

    std::optional<common::GatewayInfo> GatewayResolver::Resolve()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cached)
            return m_cached;

        auto ip = m_platform.DefaultGateway();
        if (!ip)
        {
            std::cerr << "[Gateway] No default route\n";
            return std::nullopt;
        }

        std::string mac;
        for (const auto &entry : m_platform.ReadNeighborTable())
        {
            if (entry.ip == *ip && common::IsUsableMac(entry.mac))
            {
                mac = entry.mac;
                break;
            }
        }

        if (mac.empty())
        {
            auto resolved = m_transport.Resolve(m_interface, *ip);
            if (resolved && common::IsUsableMac(*resolved))
                mac = *resolved;
        }

        if (mac.empty())
        {
            std::cerr << "[Gateway] Could not resolve link-layer address of " << *ip << "\n";
            return std::nullopt;
        }

        m_cached = common::GatewayInfo{*ip, mac};
        std::cout << "[Gateway] " << *ip << " is at " << mac << "\n";
        return m_cached;
    }

    std::optional<common::GatewayInfo> GatewayResolver::Cached() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_cached;
    }

    void GatewayResolver::Invalidate()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cached.reset();
    }
}
