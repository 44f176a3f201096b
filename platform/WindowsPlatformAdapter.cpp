#include "WindowsPlatformAdapter.hpp"
#include "OutputParsers.hpp"
#include "../common/Address.hpp"
#include "../common/Errors.hpp"

#include <iostream>

namespace lanwatch::platform
{
    WindowsPlatformAdapter::WindowsPlatformAdapter(CommandRunner &runner)
        : m_runner(runner)
    {
    }

    std::string WindowsPlatformAdapter::Name() const
    {
        return "windows";
    }

    std::string WindowsPlatformAdapter::BlockRuleName(const std::string &ip)
    {
        return "lanwatch_block_" + ip;
    }

    std::string WindowsPlatformAdapter::QosPolicyName(const std::string &ip)
    {
        return "lanwatch_limit_" + ip;
    }

    bool WindowsPlatformAdapter::HasElevatedPrivilege()
    {
        // `net session` is refused for non-administrators.
        try
        {
            return m_runner.Run({"net", "session"}).Ok();
        }
        catch (const common::CommandError &)
        {
            return false;
        }
    }

    bool WindowsPlatformAdapter::RunChecked(const std::vector<std::string> &argv)
    {
        try
        {
            CommandOutput out = m_runner.Run(argv);
            if (!out.Ok())
            {
                std::cerr << "[Platform] '" << JoinCommand(argv) << "' exited " << out.exitCode
                          << ": " << out.output << "\n";
                return false;
            }
            return true;
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] " << e.what() << "\n";
            return false;
        }
    }

    bool WindowsPlatformAdapter::PowerShell(const std::string &script)
    {
        return RunChecked({"powershell", "-NoProfile", "-NonInteractive", "-Command", script});
    }

    std::vector<InterfaceInfo> WindowsPlatformAdapter::ListInterfaces()
    {
        try
        {
            CommandOutput out = m_runner.Run({"ipconfig", "/all"});
            if (out.Ok())
                return parsers::ParseIpconfigAll(out.output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] Interface listing failed: " << e.what() << "\n";
        }
        return {};
    }

    std::vector<std::string> WindowsPlatformAdapter::ListWifiInterfaces()
    {
        try
        {
            CommandOutput out = m_runner.Run({"netsh", "wlan", "show", "interfaces"});
            if (out.Ok())
                return parsers::ParseNetshWlanNames(out.output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] " << e.what() << "\n";
        }
        return {};
    }

    std::vector<NeighborEntry> WindowsPlatformAdapter::ReadNeighborTable()
    {
        try
        {
            CommandOutput out = m_runner.Run({"arp", "-a"});
            if (out.Ok())
                return parsers::ParseWindowsArp(out.output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] Neighbor table unavailable: " << e.what() << "\n";
        }
        return {};
    }

    bool WindowsPlatformAdapter::RuleExists(const std::string &name)
    {
        try
        {
            return m_runner.Run({"netsh", "advfirewall", "firewall", "show", "rule", "name=" + name}).Ok();
        }
        catch (const common::CommandError &)
        {
            return false;
        }
    }

    bool WindowsPlatformAdapter::BlockHost(const std::string &ip)
    {
        if (!common::ParseIpv4(ip))
            return false;

        std::string name = BlockRuleName(ip);
        if (RuleExists(name))
            return true;

        bool ok = RunChecked({"netsh", "advfirewall", "firewall", "add", "rule", "name=" + name,
                              "dir=in", "action=block", "remoteip=" + ip});
        ok = ok && RunChecked({"netsh", "advfirewall", "firewall", "add", "rule", "name=" + name,
                               "dir=out", "action=block", "remoteip=" + ip});
        return ok;
    }

    bool WindowsPlatformAdapter::UnblockHost(const std::string &ip)
    {
        std::string name = BlockRuleName(ip);
        if (!RuleExists(name))
            return true;
        // Deleting by name removes both directions.
        return RunChecked({"netsh", "advfirewall", "firewall", "delete", "rule", "name=" + name});
    }

    bool WindowsPlatformAdapter::LimitHost(const std::string &ip, std::uint64_t kbps)
    {
        if (!common::ParseIpv4(ip) || kbps == 0)
            return false;

        std::string name = QosPolicyName(ip);
        std::string bitsPerSecond = std::to_string(kbps * 1000);

        // New-NetQosPolicy refuses duplicate names, so an existing policy is replaced.
        PowerShell("Remove-NetQosPolicy -Name '" + name + "' -PolicyStore ActiveStore -Confirm:$false -ErrorAction SilentlyContinue");
        return PowerShell("New-NetQosPolicy -Name '" + name + "' -IPDstPrefixMatchCondition " + ip +
                          "/32 -ThrottleRateActionBitsPerSecond " + bitsPerSecond + " -PolicyStore ActiveStore");
    }

    bool WindowsPlatformAdapter::UnlimitHost(const std::string &ip)
    {
        return PowerShell("Remove-NetQosPolicy -Name '" + QosPolicyName(ip) +
                          "' -PolicyStore ActiveStore -Confirm:$false -ErrorAction SilentlyContinue");
    }

    std::optional<int> WindowsPlatformAdapter::WifiSignal(const std::string &mac)
    {
        std::string canonical = common::CanonicalMac(mac);
        if (canonical.empty())
            return std::nullopt;

        try
        {
            CommandOutput out = m_runner.Run({"netsh", "wlan", "show", "interfaces"});
            if (!out.Ok())
                return std::nullopt;
            auto signal = parsers::ParseNetshWlanSignal(out.output);
            if (signal && signal->first == canonical)
                return parsers::PercentToDbm(signal->second);
        }
        catch (const common::CommandError &)
        {
            // netsh wlan is absent without the WLAN service.
        }
        return std::nullopt;
    }

    std::optional<std::string> WindowsPlatformAdapter::DefaultGateway()
    {
        try
        {
            CommandOutput out = m_runner.Run({"ipconfig"});
            if (out.Ok())
                return parsers::ParseIpconfigGateway(out.output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] " << e.what() << "\n";
        }
        return std::nullopt;
    }

    std::vector<InterfaceCounters> WindowsPlatformAdapter::ReadInterfaceCounters()
    {
        try
        {
            CommandOutput out = m_runner.Run({"netstat", "-e"});
            if (out.Ok())
                return parsers::ParseNetstatE(out.output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] " << e.what() << "\n";
        }
        return {};
    }
}
