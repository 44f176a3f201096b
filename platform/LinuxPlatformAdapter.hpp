#pragma once

#include <functional>
#include <mutex>
#include <string>

#include "CommandRunner.hpp"
#include "PlatformAdapter.hpp"

namespace lanwatch::platform
{
    // iproute2, iptables, tc and iw, plus /proc and /sys reads.
    class LinuxPlatformAdapter : public PlatformAdapter
    {
    public:
        using PrivilegeCheck = std::function<bool()>;

        LinuxPlatformAdapter(CommandRunner &runner,
                             std::string procRoot = "/proc",
                             std::string sysRoot = "/sys",
                             PrivilegeCheck privilegeCheck = nullptr);

        std::string Name() const override;
        bool HasElevatedPrivilege() override;

        std::vector<InterfaceInfo> ListInterfaces() override;
        std::vector<std::string> ListWifiInterfaces() override;
        std::vector<NeighborEntry> ReadNeighborTable() override;

        bool BlockHost(const std::string &ip) override;
        bool UnblockHost(const std::string &ip) override;
        bool LimitHost(const std::string &ip, std::uint64_t kbps) override;
        bool UnlimitHost(const std::string &ip) override;

        std::optional<int> WifiSignal(const std::string &mac) override;

        std::optional<std::string> DefaultGateway() override;
        std::vector<InterfaceCounters> ReadInterfaceCounters() override;

    private:
        bool RunChecked(const std::vector<std::string> &argv);
        bool RuleExists(const std::vector<std::string> &rule);
        bool EnsureRootQdisc(const std::string &iface);
        bool ClassExists(const std::string &iface, const std::string &classId);
        std::string InterfaceFor(const std::string &ip);
        std::string ReadFile(const std::string &path, bool *opened = nullptr) const;

        CommandRunner &m_runner;
        std::string m_procRoot;
        std::string m_sysRoot;
        PrivilegeCheck m_privilegeCheck;

        std::mutex m_shapingMutex;
    };
}
