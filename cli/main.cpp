#include "../common/EngineConfig.hpp"
#include "../engine/AccessControlEngine.hpp"
#include "../engine/BandwidthEstimator.hpp"
#include "../engine/DeviceRegistry.hpp"
#include "../engine/DiscoveryEngine.hpp"
#include "../engine/GatewayResolver.hpp"
#include "../engine/HostnameResolver.hpp"
#include "../engine/MacVendorsClient.hpp"
#include "../engine/MonitorScheduler.hpp"
#include "../engine/NetworkService.hpp"
#include "../engine/TinsArpTransport.hpp"
#include "../engine/VendorResolver.hpp"
#include "../platform/CommandRunner.hpp"
#include "../platform/PlatformFactory.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#ifndef LANWATCH_VERSION
#define LANWATCH_VERSION "0.0.0"
#endif

using namespace lanwatch;

namespace
{
    std::atomic<bool> g_stop{false};

    void HandleSignal(int)
    {
        g_stop = true;
    }

    void PrintUsage()
    {
        std::cout << "Usage: lanwatch [options] <command> [args]\n"
                     "\n"
                     "Commands:\n"
                     "  scan                 run one discovery pass and list devices\n"
                     "  monitor              discover continuously until interrupted\n"
                     "  interfaces           list network interfaces\n"
                     "  gateway              resolve the default gateway\n"
                     "  block <ip>           drop all traffic to and from a device\n"
                     "  unblock <ip>         remove a block\n"
                     "  limit <ip> <mbps>    cap a device's bandwidth (0 removes the cap)\n"
                     "  protect <ip>         keep a device's ARP mapping correct until interrupted\n"
                     "  cut <ip>             disconnect a device until interrupted\n"
                     "  check                report privilege, backend and gateway\n"
                     "  version              print the version\n"
                     "\n"
                     "Options:\n"
                     "  -i, --interface IF   interface to use (default: first active)\n"
                     "  -c, --config PATH    config file (default: " << common::EngineConfig::DefaultPath() << ")\n"
                     "  -o KEY=VALUE         override a config key\n"
                     "      --no-vendor      skip remote vendor lookups\n"
                     "  -h, --help           show this help\n";
    }

    void PrintDevices(const std::vector<common::Device> &devices)
    {
        std::cout << std::left
                  << std::setw(16) << "IP"
                  << std::setw(19) << "MAC"
                  << std::setw(10) << "STATUS"
                  << std::setw(10) << "TYPE"
                  << std::setw(7) << "LINK"
                  << std::setw(10) << "MBPS"
                  << std::setw(24) << "VENDOR"
                  << "HOSTNAME\n";

        for (const auto &d : devices)
        {
            std::ostringstream speed;
            speed << std::fixed << std::setprecision(2) << d.currentSpeedMbps;

            std::cout << std::left
                      << std::setw(16) << d.ip
                      << std::setw(19) << d.mac
                      << std::setw(10) << common::ToString(d.status)
                      << std::setw(10) << d.deviceType.value_or("unknown")
                      << std::setw(7) << common::ToString(d.connectionType)
                      << std::setw(10) << speed.str()
                      << std::setw(24) << d.vendor.value_or("-").substr(0, 23)
                      << d.hostname.value_or("-");
            if (d.isProtected)
                std::cout << " [protected]";
            if (d.attackStatus == common::AttackStatus::Cutting)
                std::cout << " [cut]";
            if (d.speedLimitMbps)
                std::cout << " [limit " << *d.speedLimitMbps << " Mbps]";
            std::cout << "\n";
        }
    }

    int Report(const common::Status &status, const std::string &what)
    {
        if (status)
        {
            std::cout << "[lanwatch] " << what << ": ok\n";
            return 0;
        }
        std::cerr << "[lanwatch] " << what << ": " << status.error << " (" << common::ToString(status.code) << ")\n";
        return 1;
    }

    void WaitForSignal()
    {
        while (!g_stop)
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

int main(int argc, char *argv[])
{
    common::EngineConfig config;
    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto next = [&](const std::string &flag) -> std::string
        {
            if (i + 1 >= argc)
            {
                std::cerr << "[lanwatch] " << flag << " needs a value\n";
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help")
        {
            PrintUsage();
            return 0;
        }
        else if (arg == "-i" || arg == "--interface")
        {
            overrides.emplace_back("interface", next(arg));
        }
        else if (arg == "-c" || arg == "--config")
        {
            configPath = next(arg);
        }
        else if (arg == "-o")
        {
            std::string kv = next(arg);
            size_t eq = kv.find('=');
            if (eq == std::string::npos)
            {
                std::cerr << "[lanwatch] -o expects KEY=VALUE, got '" << kv << "'\n";
                return 2;
            }
            overrides.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        }
        else if (arg == "--no-vendor")
        {
            overrides.emplace_back("vendor_lookup", "false");
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "[lanwatch] Unknown option " << arg << "\n";
            PrintUsage();
            return 2;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.empty())
    {
        PrintUsage();
        return 2;
    }
    const std::string command = positional[0];

    if (command == "version")
    {
        std::cout << "lanwatch " << LANWATCH_VERSION << "\n";
        return 0;
    }

    if (!configPath.empty())
    {
        if (!config.LoadFile(configPath))
        {
            std::cerr << "[lanwatch] Cannot read config " << configPath << "\n";
            return 2;
        }
    }
    else
    {
        // The default location is optional.
        config.LoadFile(common::EngineConfig::DefaultPath());
    }

    for (const auto &[key, value] : overrides)
    {
        if (!config.Set(key, value))
        {
            std::cerr << "[lanwatch] Invalid option " << key << "=" << value << "\n";
            return 2;
        }
    }

    platform::OsType os = platform::PlatformFactory::DetectOs();
    platform::ProcessCommandRunner runner;
    std::unique_ptr<platform::PlatformAdapter> adapter = platform::PlatformFactory::Create(os, runner);
    if (!adapter)
    {
        std::cerr << "[lanwatch] Unsupported platform " << platform::ToString(os) << "\n";
        return 1;
    }

    if (command == "interfaces")
    {
        auto wifi = adapter->ListWifiInterfaces();
        for (const auto &info : adapter->ListInterfaces())
        {
            std::cout << std::left << std::setw(12) << info.name
                      << std::setw(16) << (info.ip.empty() ? "-" : info.ip)
                      << std::setw(16) << (info.netmask.empty() ? "-" : info.netmask)
                      << std::setw(19) << (info.mac.empty() ? "-" : info.mac)
                      << (info.isUp ? "up" : "down")
                      << (info.isLoopback ? " loopback" : "")
                      << (info.isWireless ? " wifi" : "") << "\n";
        }
        return 0;
    }

    auto selected = engine::DiscoveryEngine::SelectInterface(adapter->ListInterfaces(), config.interface);
    if (!selected)
    {
        std::cerr << "[lanwatch] No usable interface"
                  << (config.interface.empty() ? "" : " named " + config.interface) << "\n";
        return 1;
    }
    const std::string iface = selected->name;

    engine::TinsArpTransport transport;
    std::unique_ptr<engine::MacVendorsClient> vendorClient;
    if (config.vendorLookup)
        vendorClient = std::make_unique<engine::MacVendorsClient>(config.vendorHost, config.vendorTimeout);
    engine::VendorResolver vendors(vendorClient.get());
    engine::SystemHostnameResolver hostnames;

    engine::DeviceRegistry registry(config.stalenessWindow);
    engine::DiscoveryEngine discovery(*adapter, transport, vendors, hostnames, config);
    engine::GatewayResolver gateway(*adapter, transport, iface);
    engine::AccessControlEngine access(registry, gateway, transport, iface, config.protectInterval, config.cutInterval);
    engine::BandwidthEstimator bandwidth(*adapter);
    engine::MonitorScheduler scheduler(discovery, registry, bandwidth, iface, config.scanInterval);
    engine::NetworkService service(registry, *adapter, gateway, access, scheduler);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::cout << "[lanwatch] Using " << iface << " (" << selected->ip << ") on " << adapter->Name() << "\n";

    if (command == "check")
    {
        bool privileged = adapter->HasElevatedPrivilege();
        std::cout << "backend:    " << adapter->Name() << "\n"
                  << "interface:  " << iface << " " << selected->ip << "/" << selected->netmask << "\n"
                  << "privileged: " << (privileged ? "yes" : "no (passive discovery only, no control)") << "\n";
        auto gw = service.GatewayInfo();
        if (gw)
            std::cout << "gateway:    " << gw.data->ip << " at " << gw.data->mac << "\n";
        else
            std::cout << "gateway:    unresolved (" << gw.error << ")\n";
        return privileged && gw ? 0 : 1;
    }

    if (command == "gateway")
    {
        auto gw = service.GatewayInfo();
        if (!gw)
        {
            std::cerr << "[lanwatch] " << gw.error << "\n";
            return 1;
        }
        std::cout << gw.data->ip << " " << gw.data->mac << "\n";
        return 0;
    }

    if (command == "scan")
    {
        if (!scheduler.RunOnce())
            return 1;
        auto devices = service.ListDevices();
        PrintDevices(*devices.data);
        return 0;
    }

    if (command == "monitor")
    {
        Report(service.StartMonitoring(), "monitoring");
        std::size_t shown = 0;
        while (!g_stop)
        {
            if (scheduler.CompletedCycles() != shown)
            {
                shown = scheduler.CompletedCycles();
                auto summary = service.NetworkSummary();
                std::cout << "\n[lanwatch] " << summary.data->activeDevices << "/" << summary.data->totalDevices
                          << " active, ~" << std::fixed << std::setprecision(2) << summary.data->totalBandwidthMbps
                          << " Mbps\n";
                PrintDevices(*service.ListDevices().data);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        service.Shutdown();
        return 0;
    }

    if (positional.size() < 2)
    {
        std::cerr << "[lanwatch] " << command << " needs an IP address\n";
        return 2;
    }
    const std::string ip = positional[1];

    // Control commands act on known devices, so populate the registry first.
    scheduler.RunOnce();

    int rc = 0;
    if (command == "block")
    {
        rc = Report(service.BlockDevice(ip), "block " + ip);
    }
    else if (command == "unblock")
    {
        rc = Report(service.UnblockDevice(ip), "unblock " + ip);
    }
    else if (command == "limit")
    {
        if (positional.size() < 3)
        {
            std::cerr << "[lanwatch] limit needs <ip> <mbps>\n";
            return 2;
        }
        double mbps = 0.0;
        try
        {
            mbps = std::stod(positional[2]);
        }
        catch (const std::exception &)
        {
            std::cerr << "[lanwatch] Invalid rate " << positional[2] << "\n";
            return 2;
        }
        if (mbps == 0.0)
            rc = Report(service.ClearSpeedLimit(ip), "unlimit " + ip);
        else
            rc = Report(service.SetSpeedLimit(ip, mbps), "limit " + ip);
    }
    else if (command == "protect" || command == "cut")
    {
        common::Status started = command == "protect" ? service.ProtectDevice(ip) : service.CutDevice(ip);
        rc = Report(started, command + " " + ip);
        if (rc == 0)
        {
            std::cout << "[lanwatch] Press Ctrl-C to stop\n";
            WaitForSignal();
        }
        service.Shutdown();
    }
    else
    {
        std::cerr << "[lanwatch] Unknown command " << command << "\n";
        PrintUsage();
        return 2;
    }

    return rc;
}
