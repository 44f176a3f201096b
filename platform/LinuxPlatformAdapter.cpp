#include "LinuxPlatformAdapter.hpp"
#include "OutputParsers.hpp"
#include "../common/Address.hpp"
#include "../common/Errors.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace lanwatch::platform
{
    namespace
    {
        const int kMaxDuplicateRules = 8;

        // Traffic of the host itself (INPUT/OUTPUT) and traffic routed through it (FORWARD).
        std::vector<std::vector<std::string>> DropRules(const std::string &ip)
        {
            return {
                {"INPUT", "-s", ip, "-j", "DROP"},
                {"OUTPUT", "-d", ip, "-j", "DROP"},
                {"FORWARD", "-s", ip, "-j", "DROP"},
                {"FORWARD", "-d", ip, "-j", "DROP"},
            };
        }

        std::string ClassIdFor(std::uint16_t slot)
        {
            std::ostringstream ss;
            ss << "1:" << std::hex << slot;
            return ss.str();
        }
    }

    LinuxPlatformAdapter::LinuxPlatformAdapter(CommandRunner &runner,
                                               std::string procRoot,
                                               std::string sysRoot,
                                               PrivilegeCheck privilegeCheck)
        : m_runner(runner),
          m_procRoot(std::move(procRoot)),
          m_sysRoot(std::move(sysRoot)),
          m_privilegeCheck(std::move(privilegeCheck))
    {
    }

    std::string LinuxPlatformAdapter::Name() const
    {
        return "linux";
    }

    bool LinuxPlatformAdapter::HasElevatedPrivilege()
    {
        if (m_privilegeCheck)
            return m_privilegeCheck();
        return geteuid() == 0;
    }

    std::string LinuxPlatformAdapter::ReadFile(const std::string &path, bool *opened) const
    {
        std::ifstream file(path);
        if (opened)
            *opened = file.is_open();
        if (!file.is_open())
            return "";
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    bool LinuxPlatformAdapter::RunChecked(const std::vector<std::string> &argv)
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

    std::vector<InterfaceInfo> LinuxPlatformAdapter::ListInterfaces()
    {
        std::vector<InterfaceInfo> interfaces;
        try
        {
            auto links = parsers::ParseIpLink(m_runner.Run({"ip", "-o", "link", "show"}).output);
            auto addrs = parsers::ParseIpAddr(m_runner.Run({"ip", "-o", "-4", "addr", "show"}).output);
            auto wifi = ListWifiInterfaces();

            for (const auto &[name, link] : links)
            {
                InterfaceInfo info;
                info.name = name;
                info.mac = link.mac;
                info.isUp = link.isUp;
                info.isLoopback = link.isLoopback;
                auto addr = addrs.find(name);
                if (addr != addrs.end())
                {
                    info.ip = addr->second.first;
                    info.netmask = addr->second.second;
                }
                for (const auto &w : wifi)
                {
                    if (w == name)
                        info.isWireless = true;
                }
                interfaces.push_back(info);
            }
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] Interface listing failed: " << e.what() << "\n";
        }
        return interfaces;
    }

    std::vector<std::string> LinuxPlatformAdapter::ListWifiInterfaces()
    {
        std::vector<std::string> names;

        // /sys/class/net/<if>/wireless exists only for cfg80211/wext devices.
        std::string netDir = m_sysRoot + "/class/net";
        std::string content = ReadFile(m_procRoot + "/net/dev");
        for (const auto &counter : parsers::ParseProcNetDev(content))
        {
            struct stat st{};
            std::string path = netDir + "/" + counter.name + "/wireless";
            if (stat(path.c_str(), &st) == 0)
                names.push_back(counter.name);
        }

        try
        {
            CommandOutput out = m_runner.Run({"iw", "dev"});
            if (out.Ok())
            {
                for (const auto &name : parsers::ParseIwDevInterfaces(out.output))
                {
                    bool known = false;
                    for (const auto &n : names)
                        known = known || n == name;
                    if (!known)
                        names.push_back(name);
                }
            }
        }
        catch (const common::CommandError &)
        {
            // iw is optional; the sysfs probe already ran.
        }
        return names;
    }

    std::vector<NeighborEntry> LinuxPlatformAdapter::ReadNeighborTable()
    {
        bool opened = false;
        std::string content = ReadFile(m_procRoot + "/net/arp", &opened);
        if (opened)
            return parsers::ParseProcNetArp(content);

        try
        {
            CommandOutput out = m_runner.Run({"ip", "neigh", "show"});
            if (out.Ok())
                return parsers::ParseIpNeigh(out.output);
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] Neighbor table unavailable: " << e.what() << "\n";
        }
        return {};
    }

    bool LinuxPlatformAdapter::RuleExists(const std::vector<std::string> &rule)
    {
        std::vector<std::string> argv = {"iptables", "-C"};
        argv.insert(argv.end(), rule.begin(), rule.end());
        try
        {
            return m_runner.Run(argv).Ok();
        }
        catch (const common::CommandError &)
        {
            return false;
        }
    }

    bool LinuxPlatformAdapter::BlockHost(const std::string &ip)
    {
        if (!common::ParseIpv4(ip))
            return false;

        const auto rules = DropRules(ip);

        bool ok = true;
        for (const auto &rule : rules)
        {
            if (RuleExists(rule))
                continue;
            std::vector<std::string> argv = {"iptables", "-A"};
            argv.insert(argv.end(), rule.begin(), rule.end());
            ok = RunChecked(argv) && ok;
        }
        return ok;
    }

    bool LinuxPlatformAdapter::UnblockHost(const std::string &ip)
    {
        if (!common::ParseIpv4(ip))
            return false;

        const auto rules = DropRules(ip);

        bool ok = true;
        for (const auto &rule : rules)
        {
            // A rule may have been added more than once by another tool.
            for (int attempt = 0; attempt < kMaxDuplicateRules && RuleExists(rule); ++attempt)
            {
                std::vector<std::string> argv = {"iptables", "-D"};
                argv.insert(argv.end(), rule.begin(), rule.end());
                if (!RunChecked(argv))
                {
                    ok = false;
                    break;
                }
            }
        }
        return ok;
    }

    std::string LinuxPlatformAdapter::InterfaceFor(const std::string &ip)
    {
        auto target = common::ParseIpv4(ip);
        if (!target)
            return "";

        for (const auto &info : ListInterfaces())
        {
            auto local = common::ParseIpv4(info.ip);
            auto mask = common::ParseIpv4(info.netmask);
            if (!local || !mask || info.isLoopback)
                continue;
            if ((*local & *mask) == (*target & *mask))
                return info.name;
        }

        // Off-link hosts are shaped on the default route's interface.
        auto route = parsers::ParseProcNetRoute(ReadFile(m_procRoot + "/net/route"));
        if (route)
            return route->interfaceName;
        return "";
    }

    bool LinuxPlatformAdapter::EnsureRootQdisc(const std::string &iface)
    {
        try
        {
            CommandOutput out = m_runner.Run({"tc", "qdisc", "show", "dev", iface});
            if (out.Ok() && out.output.find("qdisc htb 1:") != std::string::npos)
                return true;
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] " << e.what() << "\n";
            return false;
        }

        // default 0: unclassified traffic bypasses shaping.
        return RunChecked({"tc", "qdisc", "replace", "dev", iface, "root", "handle", "1:", "htb", "default", "0"});
    }

    bool LinuxPlatformAdapter::ClassExists(const std::string &iface, const std::string &classId)
    {
        try
        {
            CommandOutput out = m_runner.Run({"tc", "class", "show", "dev", iface, "classid", classId});
            return out.Ok() && out.output.find("class htb " + classId + " ") != std::string::npos;
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Platform] " << e.what() << "\n";
            return false;
        }
    }

    bool LinuxPlatformAdapter::LimitHost(const std::string &ip, std::uint64_t kbps)
    {
        auto slot = common::HostSlot(ip);
        if (!slot || kbps == 0)
            return false;

        std::string iface = InterfaceFor(ip);
        if (iface.empty())
        {
            std::cerr << "[Platform] No interface reaches " << ip << "\n";
            return false;
        }

        // The class id and filter priority come from the address, so a limit set by
        // another lanwatch process is found and changed in place.
        std::string classId = ClassIdFor(*slot);
        std::string prio = std::to_string(*slot);
        std::string rate = std::to_string(kbps) + "kbit";

        std::lock_guard<std::mutex> lock(m_shapingMutex);
        if (!EnsureRootQdisc(iface))
            return false;

        if (ClassExists(iface, classId))
        {
            return RunChecked({"tc", "class", "change", "dev", iface, "parent", "1:",
                               "classid", classId, "htb", "rate", rate, "ceil", rate});
        }

        if (!RunChecked({"tc", "class", "add", "dev", iface, "parent", "1:", "classid", classId,
                         "htb", "rate", rate, "ceil", rate}))
            return false;

        bool ok = RunChecked({"tc", "filter", "add", "dev", iface, "parent", "1:", "protocol", "ip",
                              "prio", prio, "u32", "match", "ip", "dst", ip + "/32", "flowid", classId});
        ok = ok && RunChecked({"tc", "filter", "add", "dev", iface, "parent", "1:", "protocol", "ip",
                               "prio", prio, "u32", "match", "ip", "src", ip + "/32", "flowid", classId});
        if (!ok)
        {
            RunChecked({"tc", "filter", "del", "dev", iface, "parent", "1:", "prio", prio});
            RunChecked({"tc", "class", "del", "dev", iface, "classid", classId});
            return false;
        }
        return true;
    }

    bool LinuxPlatformAdapter::UnlimitHost(const std::string &ip)
    {
        auto slot = common::HostSlot(ip);
        if (!slot)
            return false;

        // No interface reaches the host, so nothing can shape it.
        std::string iface = InterfaceFor(ip);
        if (iface.empty())
            return true;

        std::string classId = ClassIdFor(*slot);
        std::string prio = std::to_string(*slot);

        std::lock_guard<std::mutex> lock(m_shapingMutex);
        if (!ClassExists(iface, classId))
            return true;

        bool ok = RunChecked({"tc", "filter", "del", "dev", iface, "parent", "1:", "prio", prio});
        ok = RunChecked({"tc", "class", "del", "dev", iface, "classid", classId}) && ok;
        return ok;
    }

    std::optional<int> LinuxPlatformAdapter::WifiSignal(const std::string &mac)
    {
        std::string canonical = common::CanonicalMac(mac);
        if (canonical.empty())
            return std::nullopt;

        std::string lower = canonical;
        for (auto &c : lower)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        for (const auto &iface : ListWifiInterfaces())
        {
            try
            {
                CommandOutput out = m_runner.Run({"iw", "dev", iface, "station", "get", lower});
                if (!out.Ok())
                    continue;
                auto signal = parsers::ParseIwStationSignal(out.output);
                if (signal)
                    return signal;
            }
            catch (const common::CommandError &)
            {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> LinuxPlatformAdapter::DefaultGateway()
    {
        bool opened = false;
        std::string content = ReadFile(m_procRoot + "/net/route", &opened);
        if (opened)
        {
            auto route = parsers::ParseProcNetRoute(content);
            if (route)
                return route->gateway;
        }

        try
        {
            CommandOutput out = m_runner.Run({"ip", "route", "show", "default"});
            if (out.Ok())
            {
                auto route = parsers::ParseIpRouteDefault(out.output);
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

    std::vector<InterfaceCounters> LinuxPlatformAdapter::ReadInterfaceCounters()
    {
        return parsers::ParseProcNetDev(ReadFile(m_procRoot + "/net/dev"));
    }
}
