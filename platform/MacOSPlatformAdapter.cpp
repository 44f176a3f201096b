#include "MacOSPlatformAdapter.hpp"
#include "OutputParsers.hpp"
#include "../common/Address.hpp"
#include "../common/Errors.hpp"

#include <iostream>
#include <sstream>
#include <unistd.h>
#include <utility>

namespace lanwatch::platform
{
    MacOSPlatformAdapter::MacOSPlatformAdapter(CommandRunner &runner, PrivilegeCheck privilegeCheck)
        : m_runner(runner), m_privilegeCheck(std::move(privilegeCheck))
    {
    }

    std::string MacOSPlatformAdapter::Name() const
    {
        return "macos";
    }

    bool MacOSPlatformAdapter::HasElevatedPrivilege()
    {
        if (m_privilegeCheck)
            return m_privilegeCheck();
        return geteuid() == 0;
    }

    bool MacOSPlatformAdapter::RunChecked(const std::vector<std::string> &argv, const std::string &input)
    {
        try
        {
            CommandOutput out = m_runner.Run(argv, input);
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

    std::vector<InterfaceInfo> MacOSPlatformAdapter::ListInterfaces()
    {
        std::vector<InterfaceInfo> interfaces;
        try
        {
            interfaces = parsers::ParseIfconfig(m_runner.Run({"ifconfig"}).output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] Interface listing failed: " << e.what() << "\n";
            return interfaces;
        }

        auto wifi = ListWifiInterfaces();
        for (auto &info : interfaces)
        {
            for (const auto &w : wifi)
            {
                if (w == info.name)
                    info.isWireless = true;
            }
        }
        return interfaces;
    }

    std::vector<std::string> MacOSPlatformAdapter::ListWifiInterfaces()
    {
        try
        {
            CommandOutput out = m_runner.Run({"networksetup", "-listallhardwareports"});
            if (out.Ok())
                return parsers::ParseNetworkSetupWifi(out.output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] " << e.what() << "\n";
        }
        return {};
    }

    std::vector<NeighborEntry> MacOSPlatformAdapter::ReadNeighborTable()
    {
        try
        {
            CommandOutput out = m_runner.Run({"arp", "-an"});
            if (out.Ok())
                return parsers::ParseArpAn(out.output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] Neighbor table unavailable: " << e.what() << "\n";
        }
        return {};
    }

    std::string MacOSPlatformAdapter::BuildAnchorRules(const AnchorState &state)
    {
        std::ostringstream rules;

        rules << "table <lanwatch_blocked> persist";
        if (!state.blocked.empty())
        {
            rules << " {";
            for (const auto &ip : state.blocked)
                rules << " " << ip;
            rules << " }";
        }
        rules << "\n";

        rules << "block drop quick from <lanwatch_blocked> to any\n";
        rules << "block drop quick from any to <lanwatch_blocked>\n";

        for (const auto &[ip, pipe] : state.pipes)
        {
            rules << "dummynet in quick from " << ip << " to any pipe " << pipe << "\n";
            rules << "dummynet out quick from any to " << ip << " pipe " << pipe << "\n";
        }
        return rules.str();
    }

    std::optional<MacOSPlatformAdapter::AnchorState> MacOSPlatformAdapter::ReadAnchorState()
    {
        AnchorState state;
        try
        {
            CommandOutput rules = m_runner.Run({"pfctl", "-a", ANCHOR, "-s", "rules"});
            state.loaded = rules.Ok() && rules.output.find("<lanwatch_blocked>") != std::string::npos;

            if (state.loaded)
            {
                CommandOutput table = m_runner.Run({"pfctl", "-a", ANCHOR, "-t", "lanwatch_blocked", "-T", "show"});
                if (table.Ok())
                    state.blocked = parsers::ParsePfTableShow(table.output);
            }

            CommandOutput dummynet = m_runner.Run({"pfctl", "-a", ANCHOR, "-s", "dummynet"});
            if (dummynet.Ok())
                state.pipes = parsers::ParsePfDummynetRules(dummynet.output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] " << e.what() << "\n";
            return std::nullopt;
        }
        return state;
    }

    bool MacOSPlatformAdapter::LoadAnchor(const AnchorState &state)
    {
        if (!m_pfEnabled)
        {
            // pfctl -E exits nonzero when pf is already enabled; either way pf is on.
            try
            {
                m_runner.Run({"pfctl", "-E"});
                m_pfEnabled = true;
            }
            catch (const common::CommandError &e)
            {
                std::cerr << "[Platform] " << e.what() << "\n";
                return false;
            }
        }

        // Loading replaces the table, so the current members go into the ruleset.
        return RunChecked({"pfctl", "-a", ANCHOR, "-f", "-"}, BuildAnchorRules(state));
    }

    bool MacOSPlatformAdapter::BlockHost(const std::string &ip)
    {
        if (!common::ParseIpv4(ip))
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        auto state = ReadAnchorState();
        if (!state)
            return false;
        if (state->blocked.count(ip))
            return true;

        if (state->loaded)
            return RunChecked({"pfctl", "-a", ANCHOR, "-t", "lanwatch_blocked", "-T", "add", ip});

        state->blocked.insert(ip);
        return LoadAnchor(*state);
    }

    bool MacOSPlatformAdapter::UnblockHost(const std::string &ip)
    {
        if (!common::ParseIpv4(ip))
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        auto state = ReadAnchorState();
        if (!state)
            return false;
        if (!state->blocked.count(ip))
            return true;

        return RunChecked({"pfctl", "-a", ANCHOR, "-t", "lanwatch_blocked", "-T", "delete", ip});
    }

    bool MacOSPlatformAdapter::LimitHost(const std::string &ip, std::uint64_t kbps)
    {
        auto slot = common::HostSlot(ip);
        if (!slot || kbps == 0)
            return false;
        unsigned pipe = *slot;

        std::lock_guard<std::mutex> lock(m_mutex);
        auto state = ReadAnchorState();
        if (!state)
            return false;

        std::string bw = std::to_string(kbps) + "Kbit/s";
        if (!RunChecked({"dnctl", "pipe", std::to_string(pipe), "config", "bw", bw}))
            return false;

        auto existing = state->pipes.find(ip);
        if (existing != state->pipes.end() && existing->second == pipe)
            return true;

        state->pipes[ip] = pipe;
        if (LoadAnchor(*state))
            return true;

        RunChecked({"dnctl", "pipe", "delete", std::to_string(pipe)});
        return false;
    }

    bool MacOSPlatformAdapter::UnlimitHost(const std::string &ip)
    {
        if (!common::ParseIpv4(ip))
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        auto state = ReadAnchorState();
        if (!state)
            return false;

        auto existing = state->pipes.find(ip);
        if (existing == state->pipes.end())
            return true;

        unsigned pipe = existing->second;
        state->pipes.erase(existing);

        bool ok = LoadAnchor(*state);
        ok = RunChecked({"dnctl", "pipe", "delete", std::to_string(pipe)}) && ok;
        return ok;
    }

    std::optional<int> MacOSPlatformAdapter::WifiSignal(const std::string &mac)
    {
        std::string canonical = common::CanonicalMac(mac);
        if (canonical.empty())
            return std::nullopt;

        try
        {
            CommandOutput out = m_runner.Run({AIRPORT, "-I"});
            if (!out.Ok())
                return std::nullopt;
            // Only the associated access point has a reading on this side of the link.
            auto info = parsers::ParseAirportInfo(out.output);
            if (info && info->first == canonical)
                return info->second;
        }
        catch (const common::CommandError &)
        {
            // No airport tool on this release; no reading.
        }
        return std::nullopt;
    }

    std::optional<std::string> MacOSPlatformAdapter::DefaultGateway()
    {
        try
        {
            CommandOutput out = m_runner.Run({"route", "-n", "get", "default"});
            if (out.Ok())
            {
                auto route = parsers::ParseRouteGetDefault(out.output);
                if (route)
                    return route->gateway;
            }
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] " << e.what() << "\n";
        }
        return std::nullopt;
    }

    std::vector<InterfaceCounters> MacOSPlatformAdapter::ReadInterfaceCounters()
    {
        try
        {
            CommandOutput out = m_runner.Run({"netstat", "-ibn"});
            if (out.Ok())
                return parsers::ParseNetstatIbn(out.output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] " << e.what() << "\n";
        }
        return {};
    }
}
