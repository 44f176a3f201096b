#include "NetworkService.hpp"
#include "DeviceClassifier.hpp"
#include "../common/Address.hpp"

#include <cmath>
#include <iostream>

namespace lanwatch::engine
{
    using common::ErrorCode;
    using common::Result;
    using common::Status;

    namespace
    {
        template <typename T>
        Result<T> Unexpected(const char *operation, const std::exception &e)
        {
            std::cerr << "[Service] " << operation << " failed: " << e.what() << "\n";
            return Result<T>::Fail(ErrorCode::InvalidState, e.what());
        }
    }

    NetworkService::NetworkService(DeviceRegistry &registry,
                                   platform::PlatformAdapter &platform,
                                   GatewayResolver &gateway,
                                   AccessControlEngine &access,
                                   MonitorScheduler &scheduler)
        : m_registry(registry),
          m_platform(platform),
          m_gateway(gateway),
          m_access(access),
          m_scheduler(scheduler)
    {
    }

    Status NetworkService::CheckKnown(const std::string &ip)
    {
        if (!common::ParseIpv4(ip))
            return Status::Fail(ErrorCode::InvalidArgument, "invalid IPv4 address: " + ip);
        if (!m_registry.Get(ip))
            return Status::Fail(ErrorCode::NotFound, "unknown device " + ip);
        return Status::Ok();
    }

    Result<std::vector<common::Device>> NetworkService::ListDevices(const std::optional<std::string> &interfaceFilter)
    {
        try
        {
            DeviceFilter filter;
            filter.interfaceName = interfaceFilter;
            return Result<std::vector<common::Device>>::Ok(m_registry.List(filter));
        }
        catch (const std::exception &e)
        {
            return Unexpected<std::vector<common::Device>>("ListDevices", e);
        }
    }

    Result<common::Device> NetworkService::GetDevice(const std::string &ip)
    {
        if (!common::ParseIpv4(ip))
            return Result<common::Device>::Fail(ErrorCode::InvalidArgument, "invalid IPv4 address: " + ip);

        auto device = m_registry.Get(ip);
        if (!device)
            return Result<common::Device>::Fail(ErrorCode::NotFound, "unknown device " + ip);
        return Result<common::Device>::Ok(*device);
    }

    Status NetworkService::SetSpeedLimit(const std::string &ip, double mbps)
    {
        Status known = CheckKnown(ip);
        if (!known)
            return known;
        if (!std::isfinite(mbps) || mbps <= 0.0)
            return Status::Fail(ErrorCode::InvalidArgument, "speed limit must be positive");

        try
        {
            auto kbps = static_cast<std::uint64_t>(std::llround(mbps * 1000.0));
            if (kbps == 0)
                return Status::Fail(ErrorCode::InvalidArgument, "speed limit below 1 kbit/s");

            if (!m_platform.LimitHost(ip, kbps))
                return Status::Fail(ErrorCode::Command, "could not apply limit to " + ip);

            m_registry.Update(ip, [mbps](common::Device &d)
                              { d.speedLimitMbps = mbps; });
            std::cout << "[Service] Limited " << ip << " to " << mbps << " Mbps\n";
            return Status::Ok();
        }
        catch (const std::exception &e)
        {
            return Unexpected<common::Empty>("SetSpeedLimit", e);
        }
    }

    Status NetworkService::ClearSpeedLimit(const std::string &ip)
    {
        Status known = CheckKnown(ip);
        if (!known)
            return known;

        try
        {
            if (!m_platform.UnlimitHost(ip))
                return Status::Fail(ErrorCode::Command, "could not remove limit from " + ip);

            m_registry.Update(ip, [](common::Device &d)
                              { d.speedLimitMbps.reset(); });
            return Status::Ok();
        }
        catch (const std::exception &e)
        {
            return Unexpected<common::Empty>("ClearSpeedLimit", e);
        }
    }

    Status NetworkService::BlockDevice(const std::string &ip)
    {
        Status known = CheckKnown(ip);
        if (!known)
            return known;

        try
        {
            if (m_registry.Get(ip)->status == common::DeviceStatus::Blocked)
                return Status::Ok();

            if (!m_platform.BlockHost(ip))
                return Status::Fail(ErrorCode::Command, "could not block " + ip);

            m_registry.Update(ip, [](common::Device &d)
                              { d.status = common::DeviceStatus::Blocked; });
            std::cout << "[Service] Blocked " << ip << "\n";
            return Status::Ok();
        }
        catch (const std::exception &e)
        {
            return Unexpected<common::Empty>("BlockDevice", e);
        }
    }

    Status NetworkService::UnblockDevice(const std::string &ip)
    {
        Status known = CheckKnown(ip);
        if (!known)
            return known;

        bool removed = false;
        try
        {
            removed = m_platform.UnblockHost(ip);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Service] UnblockDevice failed: " << e.what() << "\n";
        }

        // The registry always leaves Blocked; a failed rule removal is still reported.
        m_registry.Update(ip, [](common::Device &d)
                          {
                              if (d.status == common::DeviceStatus::Blocked)
                                  d.status = common::DeviceStatus::Active;
                          });

        if (!removed)
            return Status::Fail(ErrorCode::Command, "firewall rule for " + ip + " could not be removed");
        std::cout << "[Service] Unblocked " << ip << "\n";
        return Status::Ok();
    }

    Status NetworkService::ProtectDevice(const std::string &ip)
    {
        Status known = CheckKnown(ip);
        if (!known)
            return known;
        return m_access.Protect(ip);
    }

    Status NetworkService::UnprotectDevice(const std::string &ip)
    {
        Status known = CheckKnown(ip);
        if (!known)
            return known;
        return m_access.Unprotect(ip);
    }

    Status NetworkService::CutDevice(const std::string &ip)
    {
        Status known = CheckKnown(ip);
        if (!known)
            return known;
        return m_access.Cut(ip);
    }

    Status NetworkService::RestoreDevice(const std::string &ip)
    {
        Status known = CheckKnown(ip);
        if (!known)
            return known;
        return m_access.StopCut(ip);
    }

    Result<common::NetworkSummary> NetworkService::NetworkSummary()
    {
        try
        {
            common::NetworkSummary summary;
            for (const auto &device : m_registry.List())
            {
                ++summary.totalDevices;
                if (device.status != common::DeviceStatus::Active)
                    continue;
                ++summary.activeDevices;
                ++summary.byType[device.deviceType.value_or(DeviceClassifier::UNKNOWN)];
                summary.totalBandwidthMbps += device.currentSpeedMbps;
            }
            return Result<common::NetworkSummary>::Ok(summary);
        }
        catch (const std::exception &e)
        {
            return Unexpected<common::NetworkSummary>("NetworkSummary", e);
        }
    }

    Result<common::GatewayInfo> NetworkService::GatewayInfo()
    {
        try
        {
            auto gateway = m_gateway.Resolve();
            if (!gateway)
                return Result<common::GatewayInfo>::Fail(ErrorCode::Resolution, "gateway could not be resolved");
            return Result<common::GatewayInfo>::Ok(*gateway);
        }
        catch (const std::exception &e)
        {
            return Unexpected<common::GatewayInfo>("GatewayInfo", e);
        }
    }

    Status NetworkService::StartMonitoring()
    {
        try
        {
            m_scheduler.Start();
            return Status::Ok();
        }
        catch (const std::exception &e)
        {
            return Unexpected<common::Empty>("StartMonitoring", e);
        }
    }

    Status NetworkService::StopMonitoring()
    {
        try
        {
            m_scheduler.Stop();
            return Status::Ok();
        }
        catch (const std::exception &e)
        {
            return Unexpected<common::Empty>("StopMonitoring", e);
        }
    }

    Status NetworkService::SetHostname(const std::string &ip, const std::string &name)
    {
        Status known = CheckKnown(ip);
        if (!known)
            return known;
        if (name.empty())
            return Status::Fail(ErrorCode::InvalidArgument, "hostname must not be empty");

        m_registry.Update(ip, [&name](common::Device &d)
                          {
                              d.hostname = name;
                              d.hostnamePinned = true;
                          });
        return Status::Ok();
    }

    Status NetworkService::SetDeviceType(const std::string &ip, const std::string &type)
    {
        Status known = CheckKnown(ip);
        if (!known)
            return known;
        if (type.empty())
            return Status::Fail(ErrorCode::InvalidArgument, "device type must not be empty");

        m_registry.Update(ip, [&type](common::Device &d)
                          {
                              d.deviceType = type;
                              d.deviceTypePinned = true;
                          });
        return Status::Ok();
    }

    Result<std::map<std::string, common::BandwidthEntry>> NetworkService::BandwidthStats()
    {
        using R = Result<std::map<std::string, common::BandwidthEntry>>;
        try
        {
            std::map<std::string, common::BandwidthEntry> stats;
            DeviceFilter filter;
            filter.status = common::DeviceStatus::Active;
            for (const auto &device : m_registry.List(filter))
                stats[device.ip] = common::BandwidthEntry{device.currentSpeedMbps, device.speedLimitMbps, device.status};
            return R::Ok(stats);
        }
        catch (const std::exception &e)
        {
            return Unexpected<std::map<std::string, common::BandwidthEntry>>("BandwidthStats", e);
        }
    }

    Result<std::map<std::string, ControlState>> NetworkService::ProtectionStatus(const std::optional<std::string> &ip)
    {
        using R = Result<std::map<std::string, ControlState>>;

        if (ip)
        {
            Status known = CheckKnown(*ip);
            if (!known)
                return R::Fail(known.code, known.error);
            std::map<std::string, ControlState> single;
            single[*ip] = m_access.State(*ip);
            return R::Ok(single);
        }
        return R::Ok(m_access.States());
    }

    Result<std::vector<std::string>> NetworkService::WifiInterfaces()
    {
        try
        {
            return Result<std::vector<std::string>>::Ok(m_platform.ListWifiInterfaces());
        }
        catch (const std::exception &e)
        {
            return Unexpected<std::vector<std::string>>("WifiInterfaces", e);
        }
    }

    Result<std::vector<platform::InterfaceInfo>> NetworkService::Interfaces()
    {
        try
        {
            return Result<std::vector<platform::InterfaceInfo>>::Ok(m_platform.ListInterfaces());
        }
        catch (const std::exception &e)
        {
            return Unexpected<std::vector<platform::InterfaceInfo>>("Interfaces", e);
        }
    }

    void NetworkService::Shutdown()
    {
        m_access.StopAll();
        m_scheduler.Stop();
        std::cout << "[Service] Shut down\n";
    }
}
