#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>

#include "CommandRunner.hpp"
#include "PlatformAdapter.hpp"

namespace lanwatch::platform
{
    // ifconfig/networksetup/arp for inventory, a pf anchor with dummynet pipes for control.
    class MacOSPlatformAdapter : public PlatformAdapter
    {
    public:
        using PrivilegeCheck = std::function<bool()>;

        static constexpr const char *ANCHOR = "com.apple/lanwatch";
        static constexpr const char *AIRPORT =
            "/System/Library/PrivateFrameworks/Apple80211.framework/Versions/Current/Resources/airport";

        explicit MacOSPlatformAdapter(CommandRunner &runner, PrivilegeCheck privilegeCheck = nullptr);

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

        // Blocked and limited hosts as pf currently holds them in the anchor.
        struct AnchorState
        {
            bool loaded = false;
            std::set<std::string> blocked;
            // Host -> dummynet pipe number.
            std::map<std::string, unsigned> pipes;
        };

        static std::string BuildAnchorRules(const AnchorState &state);

    private:
        std::optional<AnchorState> ReadAnchorState();
        bool LoadAnchor(const AnchorState &state);
        bool RunChecked(const std::vector<std::string> &argv, const std::string &input = "");

        CommandRunner &m_runner;
        PrivilegeCheck m_privilegeCheck;

        std::mutex m_mutex;
        bool m_pfEnabled = false;
    };
}
