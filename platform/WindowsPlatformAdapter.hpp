#pragma once

#include <string>

#include "CommandRunner.hpp"
#include "PlatformAdapter.hpp"

namespace lanwatch::platform
{
    // ipconfig/arp/netsh for inventory, advfirewall rules and QoS policies for control.
    class WindowsPlatformAdapter : public PlatformAdapter
    {
    public:
        explicit WindowsPlatformAdapter(CommandRunner &runner);

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

        static std::string BlockRuleName(const std::string &ip);
        static std::string QosPolicyName(const std::string &ip);

    private:
        bool RunChecked(const std::vector<std::string> &argv);
        bool RuleExists(const std::string &name);
        bool PowerShell(const std::string &script);

        CommandRunner &m_runner;
    };
}
