#include "DiscoveryEngine.hpp"
#include "DeviceClassifier.hpp"
#include "../common/Address.hpp"
#include "../common/Errors.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace lanwatch::engine
{
    namespace
    {
        const std::size_t kHostnameBatch = 32;

        struct Sighting
        {
            std::string mac;
            common::Clock::time_point seenAt;
        };
    }

    DiscoveryEngine::DiscoveryEngine(platform::PlatformAdapter &platform,
                                     ArpTransport &transport,
                                     VendorResolver &vendors,
                                     HostnameResolver &hostnames,
                                     const common::EngineConfig &config)
        : m_platform(platform),
          m_transport(transport),
          m_vendors(vendors),
          m_hostnames(hostnames),
          m_config(config)
    {
    }

    std::optional<platform::InterfaceInfo> DiscoveryEngine::SelectInterface(const std::vector<platform::InterfaceInfo> &interfaces,
                                                                            const std::string &preferred)
    {
        for (const auto &info : interfaces)
        {
            if (!preferred.empty())
            {
                if (info.name == preferred)
                    return info;
                continue;
            }
            if (info.isUp && !info.isLoopback && common::ParseIpv4(info.ip))
                return info;
        }
        return std::nullopt;
    }

    std::vector<ArpReply> DiscoveryEngine::ActiveProbe(const platform::InterfaceInfo &iface)
    {
        std::vector<std::string> targets = common::SubnetHosts(iface.ip, iface.netmask);
        if (targets.empty())
            return {};

        try
        {
            return m_transport.Probe(iface.name, targets, m_config.probeTimeout);
        }
        catch (const common::PrivilegeError &e)
        {
            if (!m_privilegeWarned.exchange(true))
                std::cerr << "[Discovery] Active probing disabled, using neighbor table only: " << e.what() << "\n";
        }
        catch (const common::TimeoutError &)
        {
            // No answer within the bound; the neighbor table still runs.
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Discovery] Active probe failed: " << e.what() << "\n";
        }
        return {};
    }

    std::vector<std::optional<std::string>> DiscoveryEngine::LookupHostnames(const std::vector<std::string> &ips)
    {
        std::vector<std::optional<std::string>> names(ips.size());

        for (std::size_t start = 0; start < ips.size(); start += kHostnameBatch)
        {
            std::size_t end = std::min(ips.size(), start + kHostnameBatch);
            std::vector<std::thread> workers;
            workers.reserve(end - start);

            for (std::size_t i = start; i < end; ++i)
            {
                workers.emplace_back([this, &names, &ips, i]()
                                     { names[i] = m_hostnames.Lookup(ips[i], m_config.hostnameTimeout); });
            }
            for (auto &w : workers)
                w.join();
        }
        return names;
    }

    std::vector<common::DeviceObservation> DiscoveryEngine::Discover(const std::string &interfaceName)
    {
        std::vector<common::DeviceObservation> observations;
        const auto passStart = common::Clock::now();

        try
        {
            std::optional<platform::InterfaceInfo> iface;
            for (const auto &info : m_platform.ListInterfaces())
            {
                if (info.name == interfaceName)
                    iface = info;
            }
            if (!iface)
                std::cerr << "[Discovery] Interface " << interfaceName << " not found, passive only\n";

            std::map<std::string, Sighting> merged;

            if (iface && common::ParseIpv4(iface->ip))
            {
                for (const auto &reply : ActiveProbe(*iface))
                {
                    std::string mac = common::CanonicalMac(reply.mac);
                    if (!common::IsUsableMac(mac))
                        continue;
                    merged[reply.ip] = Sighting{mac, reply.seenAt};
                }
            }

            for (const auto &entry : m_platform.ReadNeighborTable())
            {
                std::string mac = common::CanonicalMac(entry.mac);
                if (!common::IsUsableMac(mac) || !common::ParseIpv4(entry.ip))
                    continue;

                // Some platforms tag entries with the interface address instead of its name.
                if (!interfaceName.empty() && !entry.interfaceName.empty() && entry.interfaceName != interfaceName &&
                    !(iface && entry.interfaceName == iface->ip))
                    continue;

                if (iface && entry.ip == iface->ip)
                    continue;

                auto it = merged.find(entry.ip);
                if (it == merged.end() || it->second.seenAt < passStart)
                    merged[entry.ip] = Sighting{mac, passStart};
            }

            if (merged.empty())
                return observations;

            std::vector<std::string> wifi = m_platform.ListWifiInterfaces();
            common::ConnectionType linkType = common::ConnectionType::Unknown;
            if (!interfaceName.empty())
            {
                bool isWifi = std::find(wifi.begin(), wifi.end(), interfaceName) != wifi.end();
                linkType = isWifi ? common::ConnectionType::Wifi : common::ConnectionType::Wired;
            }

            std::vector<std::string> pendingIps;
            {
                std::lock_guard<std::mutex> lock(m_identityMutex);
                for (const auto &[ip, sighting] : merged)
                {
                    // Unanswered reverse lookups are retried on the next pass.
                    auto known = m_identities.find(sighting.mac);
                    if (known == m_identities.end() || known->second.ip != ip || !known->second.hostname)
                        pendingIps.push_back(ip);
                }
            }

            std::vector<std::optional<std::string>> names = LookupHostnames(pendingIps);

            std::lock_guard<std::mutex> lock(m_identityMutex);
            for (std::size_t i = 0; i < pendingIps.size(); ++i)
            {
                const std::string &ip = pendingIps[i];
                Identity &identity = m_identities[merged[ip].mac];
                identity.ip = ip;
                identity.hostname = names[i];
            }

            for (const auto &[ip, sighting] : merged)
            {
                Identity &identity = m_identities[sighting.mac];
                // The resolver caches definitive answers, so asking again is cheap.
                if (!identity.vendor)
                    identity.vendor = m_vendors.Resolve(sighting.mac);

                common::DeviceObservation obs;
                obs.ip = ip;
                obs.mac = sighting.mac;
                obs.hostname = identity.hostname;
                obs.vendor = identity.vendor;
                obs.deviceType = DeviceClassifier::Classify(identity.hostname, identity.vendor);
                obs.interfaceName = interfaceName;
                obs.connectionType = linkType;
                obs.observedAt = sighting.seenAt;
                if (linkType == common::ConnectionType::Wifi)
                    obs.signalStrength = m_platform.WifiSignal(sighting.mac);
                observations.push_back(obs);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Discovery] Pass failed: " << e.what() << "\n";
        }

        return observations;
    }
}
