#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "AccessControlEngine.hpp"
#include "DeviceRegistry.hpp"
#include "GatewayResolver.hpp"
#include "MonitorScheduler.hpp"
#include "../common/Result.hpp"
#include "../platform/PlatformAdapter.hpp"

namespace lanwatch::engine
{
    // Operation boundary for front ends. Every call is synchronous and reports
    // failure through the returned Result; nothing throws out of here.
    class NetworkService
    {
    public:
        NetworkService(DeviceRegistry &registry,
                       platform::PlatformAdapter &platform,
                       GatewayResolver &gateway,
                       AccessControlEngine &access,
                       MonitorScheduler &scheduler);

        common::Result<std::vector<common::Device>> ListDevices(const std::optional<std::string> &interfaceFilter = std::nullopt);
        common::Result<common::Device> GetDevice(const std::string &ip);

        common::Status SetSpeedLimit(const std::string &ip, double mbps);
        common::Status ClearSpeedLimit(const std::string &ip);

        common::Status BlockDevice(const std::string &ip);
        common::Status UnblockDevice(const std::string &ip);

        common::Status ProtectDevice(const std::string &ip);
        common::Status UnprotectDevice(const std::string &ip);
        common::Status CutDevice(const std::string &ip);
        common::Status RestoreDevice(const std::string &ip);

        common::Result<common::NetworkSummary> NetworkSummary();
        common::Result<common::GatewayInfo> GatewayInfo();

        common::Status StartMonitoring();
        common::Status StopMonitoring();

        common::Status SetHostname(const std::string &ip, const std::string &name);
        common::Status SetDeviceType(const std::string &ip, const std::string &type);

        // Active devices only.
        common::Result<std::map<std::string, common::BandwidthEntry>> BandwidthStats();
        common::Result<std::map<std::string, ControlState>> ProtectionStatus(const std::optional<std::string> &ip = std::nullopt);

        common::Result<std::vector<std::string>> WifiInterfaces();
        common::Result<std::vector<platform::InterfaceInfo>> Interfaces();

        // Restores every cut and stops monitoring.
        void Shutdown();

    private:
        common::Status CheckKnown(const std::string &ip);

        DeviceRegistry &m_registry;
        platform::PlatformAdapter &m_platform;
        GatewayResolver &m_gateway;
        AccessControlEngine &m_access;
        MonitorScheduler &m_scheduler;
    };
}
