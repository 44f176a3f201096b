#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "ArpTransport.hpp"
#include "../common/Device.hpp"
#include "../platform/PlatformAdapter.hpp"

namespace lanwatch::engine
{
    class GatewayResolver
    {
    public:
        GatewayResolver(platform::PlatformAdapter &platform, ArpTransport &transport, std::string interfaceName);

        // Default route next hop plus its link-layer address. Cached after the
        // first success.
        std::optional<common::GatewayInfo> Resolve();

        std::optional<common::GatewayInfo> Cached() const;

        void Invalidate();

    private:
        platform::PlatformAdapter &m_platform;
        ArpTransport &m_transport;
        std::string m_interface;

        mutable std::mutex m_mutex;
        std::optional<common::GatewayInfo> m_cached;
    };
}
