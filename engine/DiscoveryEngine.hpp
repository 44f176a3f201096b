#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ArpTransport.hpp"
#include "HostnameResolver.hpp"
#include "VendorResolver.hpp"
#include "../common/Device.hpp"
#include "../common/EngineConfig.hpp"
#include "../platform/PlatformAdapter.hpp"

namespace lanwatch::engine
{
    class DiscoveryEngine
    {
    public:
        DiscoveryEngine(platform::PlatformAdapter &platform,
                        ArpTransport &transport,
                        VendorResolver &vendors,
                        HostnameResolver &hostnames,
                        const common::EngineConfig &config);

        // One pass: active probe (when permitted) merged with the OS neighbor table,
        // then enriched. Never throws; every failed step degrades to partial results.
        std::vector<common::DeviceObservation> Discover(const std::string &interfaceName);

        // `preferred` by name when given, else the first up, non-loopback interface
        // with an IPv4 address.
        static std::optional<platform::InterfaceInfo> SelectInterface(const std::vector<platform::InterfaceInfo> &interfaces,
                                                                      const std::string &preferred);

        bool PrivilegeWarningIssued() const { return m_privilegeWarned; }

    private:
        struct Identity
        {
            std::string ip;
            std::optional<std::string> hostname;
            std::optional<std::string> vendor;
        };

        std::vector<ArpReply> ActiveProbe(const platform::InterfaceInfo &iface);
        std::vector<std::optional<std::string>> LookupHostnames(const std::vector<std::string> &ips);

        platform::PlatformAdapter &m_platform;
        ArpTransport &m_transport;
        VendorResolver &m_vendors;
        HostnameResolver &m_hostnames;
        const common::EngineConfig &m_config;

        std::atomic<bool> m_privilegeWarned{false};

        // Keyed by MAC; reused while the device keeps the same address.
        std::mutex m_identityMutex;
        std::map<std::string, Identity> m_identities;
    };
}
